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
#include "json_parser.hpp"

#include "errors.hpp"
#include "logging.hpp"

#include <fmt/format.h>

#include <chrono>
#include <cstdint>
#include <limits>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace smfc::control
{

namespace
{

/**
 * @brief Get a configuration section, an empty object when it is absent
 */
json getSection(const json& conf, const std::string& name)
{
    if (!conf.is_object())
    {
        throw ConfigurationError(
            "The configuration document must be a JSON object");
    }
    if (!conf.contains(name))
    {
        return json::object();
    }

    const auto& section = conf.at(name);
    if (!section.is_object())
    {
        throw ConfigurationError(
            fmt::format("Section '{}' must be a JSON object", name));
    }
    return section;
}

/**
 * @brief Whether an integer JSON number fits into the integer type T
 */
template <typename T>
bool fitsInteger(const json& value)
{
    if (value.is_number_unsigned())
    {
        return value.get<uint64_t>() <=
               static_cast<uint64_t>(std::numeric_limits<T>::max());
    }

    auto number = value.get<int64_t>();
    return std::in_range<T>(number);
}

/**
 * @brief Get a value of a section, or its default when the key is absent
 */
template <typename T>
T getValue(const json& obj, const std::string& key, const T& defaultValue)
{
    if (!obj.contains(key))
    {
        return defaultValue;
    }

    const auto& value = obj.at(key);
    if constexpr (std::is_integral_v<T> && !std::is_same_v<T, bool>)
    {
        // No silent truncation of fractional or out of range numbers
        if (!value.is_number_integer() || !fitsInteger<T>(value))
        {
            throw ConfigurationError(fmt::format(
                "Invalid value of '{}': {} is not an integer in range [{}, {}]",
                key, value.dump(), std::numeric_limits<T>::min(),
                std::numeric_limits<T>::max()));
        }
    }

    try
    {
        return value.get<T>();
    }
    catch (const json::exception& e)
    {
        throw ConfigurationError(
            fmt::format("Invalid value of '{}': {}", key, e.what()));
    }
}

/**
 * @brief Get a non-negative integer value of a section
 */
size_t getCount(const json& obj, const std::string& key, size_t defaultValue)
{
    auto value = getValue<int64_t>(obj, key,
                                   static_cast<int64_t>(defaultValue));
    if (value < 0)
    {
        throw ConfigurationError(
            fmt::format("Invalid value of '{}': {} < 0", key, value));
    }
    return static_cast<size_t>(value);
}

std::chrono::seconds getDelay(const json& obj, const std::string& key,
                              int64_t defaultValue)
{
    return std::chrono::seconds{getValue<int64_t>(obj, key, defaultValue)};
}

/**
 * @brief The settings shared by both zones, on top of per zone defaults
 */
ZoneConfig getZoneConfig(const json& obj, ZoneConfig config)
{
    config.name = getValue<std::string>(obj, "name", config.name);
    config.count = getCount(obj, "count", config.count);

    auto tempCalc = getValue<std::string>(obj, "temp_calc",
                                          getAggregationName(config.tempCalc));
    config.tempCalc = getAggregation(tempCalc);

    config.steps = getCount(obj, "steps", config.steps);
    config.sensitivity =
        getValue<double>(obj, "sensitivity", config.sensitivity);
    config.polling =
        Seconds{getValue<double>(obj, "polling", config.polling.count())};
    config.minTemp = getValue<double>(obj, "min_temp", config.minTemp);
    config.maxTemp = getValue<double>(obj, "max_temp", config.maxTemp);
    config.minLevel = getValue<int>(obj, "min_level", config.minLevel);
    config.maxLevel = getValue<int>(obj, "max_level", config.maxLevel);

    return config;
}

} // namespace

Aggregation getAggregation(const std::string& name)
{
    if (name == "min")
    {
        return Aggregation::min;
    }
    if (name == "avg")
    {
        return Aggregation::avg;
    }
    if (name == "max")
    {
        return Aggregation::max;
    }

    throw ConfigurationError(
        fmt::format("Invalid value of 'temp_calc': {}", name));
}

std::shared_ptr<IpmiTool> getIpmiTool(const json& conf)
{
    auto obj = getSection(conf, ipmiSection);

    return std::make_shared<IpmiTool>(
        getValue<std::string>(obj, "command", "/usr/bin/ipmitool"),
        getDelay(obj, "fan_mode_delay", 10),
        getDelay(obj, "fan_level_delay", 2), getDelay(obj, "timeout", 10));
}

std::shared_ptr<Smartctl> getSmartctl(const json& conf)
{
    auto obj = getSection(conf, smartctlSection);

    return std::make_shared<Smartctl>(
        getValue<std::string>(obj, "command", "/usr/sbin/smartctl"),
        getDelay(obj, "timeout", 10));
}

bool usesStandbyGuard(const json& conf)
{
    auto obj = getSection(conf, hdZoneSection);
    if (!getValue<bool>(obj, "enabled", false))
    {
        return false;
    }

    auto guard = getSection(obj, standbyGuardSection);
    return getValue<bool>(guard, "enabled", false) &&
           (getCount(obj, "count", 1) > 1);
}

ZoneConfig getCpuZoneConfig(const json& obj)
{
    return getZoneConfig(obj, ZoneConfig{"CPU zone", IpmiZone::cpu, 1,
                                         Aggregation::avg, 6, 3.0, Seconds{2},
                                         30.0, 60.0, 35, 100});
}

ZoneConfig getHdZoneConfig(const json& obj)
{
    return getZoneConfig(obj, ZoneConfig{"HD zone", IpmiZone::hd, 1,
                                         Aggregation::avg, 4, 2.0, Seconds{10},
                                         32.0, 46.0, 35, 100});
}

std::vector<std::string> getDiskNames(const json& obj, size_t count)
{
    auto names = getValue<std::vector<std::string>>(obj, "hd_names", {});
    if (names.empty())
    {
        throw ConfigurationError("Parameter 'hd_names' cannot be empty");
    }
    if (names.size() != count)
    {
        throw ConfigurationError(fmt::format(
            "Inconsistent count ({}) and size of hd_names ({})", count,
            names.size()));
    }
    return names;
}

std::unique_ptr<EndpointResolver>
    getResolver(const json& obj, IpmiZone zone,
                const std::vector<std::string>& diskNames)
{
    if (obj.contains("hwmon_path"))
    {
        return std::make_unique<PathResolver>(
            getValue<std::vector<std::string>>(obj, "hwmon_path", {}));
    }

    if (zone == IpmiZone::cpu)
    {
        return std::make_unique<CoretempResolver>();
    }
    return std::make_unique<DiskResolver>(diskNames);
}

std::unique_ptr<StandbyGuard>
    getStandbyGuard(const json& obj, const std::vector<std::string>& diskNames,
                    std::shared_ptr<DiskPowerInterface> power, TimePoint now)
{
    auto guard = getSection(obj, standbyGuardSection);
    if (!getValue<bool>(guard, "enabled", false))
    {
        return nullptr;
    }

    // A single disk cannot get out of sync with the others
    if (diskNames.size() == 1)
    {
        getLogger().log("Standby guard is disabled << [HD zone] count=1",
                        Logger::info);
        return nullptr;
    }

    if (!power)
    {
        throw ConfigurationError(
            "Standby guard is enabled without a disk power interface");
    }

    return std::make_unique<StandbyGuard>(
        diskNames, getCount(guard, "hd_limit", 1), std::move(power), now);
}

std::unique_ptr<Zone> getCpuZone(const json& conf,
                                 std::shared_ptr<SensorInterface> sensors,
                                 std::shared_ptr<FanInterface> fans)
{
    auto obj = getSection(conf, cpuZoneSection);
    if (!getValue<bool>(obj, "enabled", false))
    {
        return nullptr;
    }

    auto config = getCpuZoneConfig(obj);
    auto resolver = getResolver(obj, IpmiZone::cpu);

    return std::make_unique<Zone>(config, *resolver, std::move(sensors),
                                  std::move(fans));
}

std::unique_ptr<Zone> getHdZone(const json& conf,
                                std::shared_ptr<SensorInterface> sensors,
                                std::shared_ptr<FanInterface> fans,
                                std::shared_ptr<DiskPowerInterface> power,
                                TimePoint now)
{
    auto obj = getSection(conf, hdZoneSection);
    if (!getValue<bool>(obj, "enabled", false))
    {
        return nullptr;
    }

    auto config = getHdZoneConfig(obj);
    auto diskNames = getDiskNames(obj, config.count);
    auto resolver = getResolver(obj, IpmiZone::hd, diskNames);
    auto guard = getStandbyGuard(obj, diskNames, std::move(power), now);

    return std::make_unique<Zone>(config, *resolver, std::move(sensors),
                                  std::move(fans), std::move(guard));
}

std::vector<std::unique_ptr<Zone>>
    getZones(const json& conf, std::shared_ptr<SensorInterface> sensors,
             std::shared_ptr<FanInterface> fans,
             std::shared_ptr<DiskPowerInterface> power, TimePoint now)
{
    std::vector<std::unique_ptr<Zone>> zones;

    auto cpuZone = getCpuZone(conf, sensors, fans);
    if (cpuZone)
    {
        zones.push_back(std::move(cpuZone));
    }

    auto hdZone = getHdZone(conf, sensors, fans, std::move(power), now);
    if (hdZone)
    {
        zones.push_back(std::move(hdZone));
    }

    return zones;
}

} // namespace smfc::control
