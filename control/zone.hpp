/**
 * Copyright © 2024 IBM Corporation
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */
#pragma once

#include "endpoint_resolver.hpp"
#include "fan_interface.hpp"
#include "level_curve.hpp"
#include "pre_sample_hook.hpp"
#include "temperature_source.hpp"
#include "types.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>

namespace smfc::control
{

/**
 * @brief Runtime state of a zone, only changed by the zone's tick
 */
struct ZoneState
{
    /* Time of the last temperature poll, empty when a poll is due now */
    std::optional<TimePoint> lastTime;

    /* Last temperature that changed by at least the sensitivity (C) */
    double lastTemp = 0.0;

    /* Last fan level written (%) */
    int lastLevel = 0;
};

/**
 * @class Zone - Represents a configured fan control zone
 *
 * A zone reads its temperature sensors once every polling interval and
 * sets the fan level of its IPMI zone from the temperature through a
 * level curve.  A temperature that moved less than the sensitivity from
 * the last accepted temperature is ignored, and a fan level is only
 * written when it differs from the last one written.
 *
 * An optional pre-sample hook (the standby guard of the disk zone) runs
 * on every poll before the temperature is read.
 */
class Zone
{
  public:
    Zone() = delete;
    Zone(const Zone&) = delete;
    Zone(Zone&&) = delete;
    Zone& operator=(const Zone&) = delete;
    Zone& operator=(Zone&&) = delete;
    ~Zone() = default;

    /**
     * Constructor
     *
     * Validates the configuration, resolves the sensor endpoints and reads
     * the temperature once to make sure the sensors work.
     *
     * Throws ConfigurationError on an invalid configuration and IOError
     * when the sensors cannot be read.
     *
     * @param[in] config - Zone configuration
     * @param[in] resolver - Finds the zone's sensor endpoints
     * @param[in] sensors - Sensor read interface
     * @param[in] fans - Fan level interface
     * @param[in] hook - Work to do before each temperature read (OPTIONAL)
     */
    Zone(const ZoneConfig& config, const EndpointResolver& resolver,
         std::shared_ptr<SensorInterface> sensors,
         std::shared_ptr<FanInterface> fans,
         std::unique_ptr<PreSampleHook> hook = nullptr);

    /**
     * @brief Run the zone's control step
     *
     * Does nothing until the polling interval elapsed since the last poll.
     * Throws IOError when reading the sensors, running the hook or setting
     * the fan level fails; the poll time has been advanced by then.
     *
     * @param[in] now - Time of the tick
     */
    void tick(TimePoint now);

    inline const std::string& getName() const
    {
        return _config.name;
    }

    inline const ZoneConfig& getConfig() const
    {
        return _config;
    }

    inline const ZoneState& getState() const
    {
        return _state;
    }

    inline const LevelCurve& getCurve() const
    {
        return _curve;
    }

    inline const TemperatureSource& getSource() const
    {
        return _source;
    }

    /**
     * @brief The pre-sample hook, nullptr when the zone has none
     */
    inline const PreSampleHook* getHook() const
    {
        return _hook.get();
    }

    /**
     * @brief Get the zone's configuration and state for the debug dump
     */
    nlohmann::json dump() const;

  private:
    /**
     * @brief Log the configuration and the temperature:level mapping
     */
    void logConfig() const;

    /* Zone configuration */
    const ZoneConfig _config;

    /* Temperature to fan level mapping */
    const LevelCurve _curve;

    /* The zone's temperature */
    TemperatureSource _source;

    /* Fan level interface */
    std::shared_ptr<FanInterface> _fans;

    /* Work to do before each temperature read */
    std::unique_ptr<PreSampleHook> _hook;

    /* Runtime state */
    ZoneState _state;
};

} // namespace smfc::control
