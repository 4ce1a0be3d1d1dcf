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

#include <chrono>
#include <cstdint>
#include <string>

namespace smfc::control
{

/* Control loop time base */
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

/* Seconds with a fractional part, used for polling intervals */
using Seconds = std::chrono::duration<double>;

/**
 * IPMI fan zone identifiers
 */
enum class IpmiZone : uint8_t
{
    cpu = 0,
    hd = 1
};

/**
 * How the readings of a multi-sensor zone are reduced to one temperature.
 *
 * 'single' is chosen automatically for a zone with exactly one sensor,
 * the others are configured as "min", "avg" and "max".
 */
enum class Aggregation
{
    single,
    min,
    avg,
    max
};

/**
 * @brief Get the configuration name of an aggregation
 *
 * @param[in] calc - The aggregation
 *
 * @return "single", "min", "avg" or "max"
 */
std::string getAggregationName(Aggregation calc);

/**
 * @brief Configuration of one cooling zone
 *
 * Immutable once a zone has been constructed from it.
 */
struct ZoneConfig
{
    /* Name used as the log prefix of the zone */
    std::string name;

    /* IPMI zone whose fan level is controlled */
    IpmiZone ipmiZone;

    /* Number of temperature sensors */
    size_t count;

    /* Reduction of multiple sensor readings */
    Aggregation tempCalc;

    /* Number of steps between the minimum and maximum fan level */
    size_t steps;

    /* Temperature change required to recalculate the level (C) */
    double sensitivity;

    /* Interval between temperature reads */
    Seconds polling;

    /* Temperature range (C) */
    double minTemp;
    double maxTemp;

    /* Fan level range (0-100%) */
    int minLevel;
    int maxLevel;
};

} // namespace smfc::control
