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

#include "types.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace smfc::control
{

/**
 * @class SensorInterface
 *
 * Reads the raw value of a temperature sensor endpoint.  Raw values are
 * in millidegrees Celsius.
 */
class SensorInterface
{
  public:
    SensorInterface() = default;
    virtual ~SensorInterface() = default;
    SensorInterface(const SensorInterface&) = delete;
    SensorInterface& operator=(const SensorInterface&) = delete;
    SensorInterface(SensorInterface&&) = delete;
    SensorInterface& operator=(SensorInterface&&) = delete;

    /**
     * @brief Read a sensor endpoint
     *
     * Throws IOError when the endpoint cannot be read.
     *
     * @param[in] path - The endpoint
     *
     * @return The raw value in millidegrees Celsius
     */
    virtual int64_t read(const std::string& path) = 0;
};

/**
 * @class SysfsSensor
 *
 * Reads hwmon temperature files, e.g. .../hwmon/hwmon2/temp1_input
 */
class SysfsSensor : public SensorInterface
{
  public:
    SysfsSensor() = default;
    ~SysfsSensor() override = default;

    /**
     * @copydoc SensorInterface::read
     */
    int64_t read(const std::string& path) override;
};

/**
 * @brief Reduce temperature readings to one value
 *
 * @param[in] values - The readings (C), at least one
 * @param[in] calc - The reduction, single uses the first reading
 *
 * @return The reduced temperature (C)
 */
double aggregate(const std::vector<double>& values, Aggregation calc);

/**
 * @class TemperatureSource
 *
 * Produces one temperature for a zone from its ordered list of sensor
 * endpoints.  Every endpoint is read on each call and the readings are
 * reduced with the configured aggregation; a zone with a single endpoint
 * always uses that endpoint's value directly.
 */
class TemperatureSource
{
  public:
    TemperatureSource() = delete;
    TemperatureSource(const TemperatureSource&) = delete;
    TemperatureSource& operator=(const TemperatureSource&) = delete;
    TemperatureSource(TemperatureSource&&) = default;
    TemperatureSource& operator=(TemperatureSource&&) = delete;
    ~TemperatureSource() = default;

    /* Raw sensor values are in thousandths of a degree */
    static constexpr double rawScale = 1000.0;

    /**
     * @brief Constructor
     *
     * Throws ConfigurationError when no endpoint is given.
     *
     * @param[in] paths - Resolved sensor endpoints
     * @param[in] calc - Aggregation of multiple readings
     * @param[in] sensors - Sensor read interface
     */
    TemperatureSource(std::vector<std::string> paths, Aggregation calc,
                      std::shared_ptr<SensorInterface> sensors);

    /**
     * @brief Read and aggregate the temperature
     *
     * Any endpoint failing fails the whole read with IOError.
     *
     * @return Temperature (C)
     */
    double read() const;

    /**
     * @brief The aggregation actually in use
     */
    inline Aggregation getAggregation() const
    {
        return _calc;
    }

    inline const std::vector<std::string>& getPaths() const
    {
        return _paths;
    }

  private:
    /* Sensor endpoints */
    const std::vector<std::string> _paths;

    /* Aggregation, single when there is one endpoint */
    const Aggregation _calc;

    /* Sensor read interface */
    std::shared_ptr<SensorInterface> _sensors;
};

} // namespace smfc::control
