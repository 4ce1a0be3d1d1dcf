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

#include "fan_interface.hpp"
#include "zone.hpp"

#include <nlohmann/json.hpp>
#include <sdeventplus/clock.hpp>
#include <sdeventplus/event.hpp>
#include <sdeventplus/source/signal.hpp>
#include <sdeventplus/utility/timer.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace smfc::control
{

/* Control loop timer */
using Timer = sdeventplus::utility::Timer<sdeventplus::ClockId::Monotonic>;

/**
 * @class Manager - Drives the fan control zones
 *
 * Puts the BMC into full fan mode once, then ticks every zone in order
 * (CPU zone before disk zone) on a repeating timer.  The timer period is
 * half of the shortest zone polling interval, so each zone's own polling
 * check runs often enough not to drift.
 *
 * An IOError of a zone only ends that zone's tick; it is logged and the
 * remaining zones and the next ticks run normally.
 */
class Manager
{
  public:
    Manager() = delete;
    Manager(const Manager&) = delete;
    Manager(Manager&&) = delete;
    Manager& operator=(const Manager&) = delete;
    Manager& operator=(Manager&&) = delete;
    ~Manager() = default;

    /* The shortest timer period */
    static constexpr std::chrono::milliseconds minInterval{100};

    /* File the debug data is dumped to */
    static const std::string dumpFile;

    /**
     * Constructor
     *
     * Throws ConfigurationError when there is no zone.
     *
     * @param[in] event - sdeventplus event loop
     * @param[in] fans - Fan mode interface
     * @param[in] zones - Enabled zones, in tick order
     */
    Manager(const sdeventplus::Event& event,
            std::shared_ptr<FanInterface> fans,
            std::vector<std::unique_ptr<Zone>> zones);

    /**
     * @brief Get the timer period for a set of zones
     *
     * Half of the shortest polling interval, not less than minInterval.
     * Throws ConfigurationError when there is no zone.
     *
     * @param[in] zones - The zones
     */
    static std::chrono::microseconds
        getInterval(const std::vector<std::unique_ptr<Zone>>& zones);

    /**
     * @brief Set the fan mode, run the first tick and start the timer
     */
    void start();

    /**
     * @brief Put the BMC into full fan mode, unless it already is
     */
    void initFanMode();

    /**
     * @brief Tick every zone once
     */
    void tick();

    /**
     * @brief Callback function to handle receiving a USR1 signal to dump
     * debug data to a file.
     */
    void dumpDebugData(sdeventplus::source::Signal&,
                       const struct signalfd_siginfo*);

    /**
     * @brief Get the recent log entries and the configuration and state of
     *        every zone
     */
    nlohmann::json getDebugData() const;

    /**
     * @brief Whether the tick timer is armed
     */
    inline bool isRunning() const
    {
        return _timer.isEnabled();
    }

    inline std::chrono::microseconds getInterval() const
    {
        return _interval;
    }

    inline const std::vector<std::unique_ptr<Zone>>& getZones() const
    {
        return _zones;
    }

  private:
    /* Fan mode interface */
    std::shared_ptr<FanInterface> _fans;

    /* Zones in tick order */
    std::vector<std::unique_ptr<Zone>> _zones;

    /* Timer period */
    const std::chrono::microseconds _interval;

    /* Tick timer */
    Timer _timer;
};

} // namespace smfc::control
