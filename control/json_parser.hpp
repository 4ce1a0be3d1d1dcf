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

#include "config.h"

#include "disk_power_interface.hpp"
#include "endpoint_resolver.hpp"
#include "fan_interface.hpp"
#include "ipmi_tool.hpp"
#include "smartctl.hpp"
#include "standby_guard.hpp"
#include "temperature_source.hpp"
#include "types.hpp"
#include "zone.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <vector>

namespace smfc::control
{

using json = nlohmann::json;

/* Name of the configuration file */
constexpr auto confFileName = SMFC_CONF_FILE_NAME;

/* Configuration sections */
constexpr auto ipmiSection = "ipmi";
constexpr auto smartctlSection = "smartctl";
constexpr auto cpuZoneSection = "cpu_zone";
constexpr auto hdZoneSection = "hd_zone";
constexpr auto standbyGuardSection = "standby_guard";

/**
 * @brief Get the aggregation of a "temp_calc" value
 *
 * Throws ConfigurationError for anything but "min", "avg" or "max".
 *
 * @param[in] name - The configured value
 */
Aggregation getAggregation(const std::string& name);

/**
 * @brief Create the ipmitool based fan interface from the "ipmi" section
 *
 * @param[in] conf - Whole configuration document
 */
std::shared_ptr<IpmiTool> getIpmiTool(const json& conf);

/**
 * @brief Create the smartctl based disk power interface from the
 *        "smartctl" section
 *
 * @param[in] conf - Whole configuration document
 */
std::shared_ptr<Smartctl> getSmartctl(const json& conf);

/**
 * @brief Whether the configuration runs a standby guard, which needs a
 *        disk power interface
 *
 * @param[in] conf - Whole configuration document
 */
bool usesStandbyGuard(const json& conf);

/**
 * @brief Get the zone configuration of the "cpu_zone" section, defaults
 *        applied
 *
 * @param[in] obj - The "cpu_zone" object
 */
ZoneConfig getCpuZoneConfig(const json& obj);

/**
 * @brief Get the zone configuration of the "hd_zone" section, defaults
 *        applied
 *
 * @param[in] obj - The "hd_zone" object
 */
ZoneConfig getHdZoneConfig(const json& obj);

/**
 * @brief Get the disk names of the "hd_zone" section
 *
 * Throws ConfigurationError when there are none or their number is not
 * the zone's count.
 *
 * @param[in] obj - The "hd_zone" object
 * @param[in] count - The zone's count
 */
std::vector<std::string> getDiskNames(const json& obj, size_t count);

/**
 * @brief Get the endpoint resolver of a zone section
 *
 * An explicit "hwmon_path" list wins, otherwise the CPU zone uses the
 * coretemp devices and the disk zone the hwmon devices of its disks.
 *
 * @param[in] obj - The zone object
 * @param[in] zone - Which zone the object configures
 * @param[in] diskNames - The disk names (disk zone only)
 */
std::unique_ptr<EndpointResolver>
    getResolver(const json& obj, IpmiZone zone,
                const std::vector<std::string>& diskNames = {});

/**
 * @brief Create the standby guard of the disk zone
 *
 * Returns nullptr when the guard is not enabled, or when the zone has a
 * single disk.
 *
 * @param[in] obj - The "hd_zone" object
 * @param[in] diskNames - The disk names
 * @param[in] power - Disk power interface
 * @param[in] now - Current time
 */
std::unique_ptr<StandbyGuard>
    getStandbyGuard(const json& obj, const std::vector<std::string>& diskNames,
                    std::shared_ptr<DiskPowerInterface> power, TimePoint now);

/**
 * @brief Create the CPU zone, nullptr when it is not enabled
 *
 * @param[in] conf - Whole configuration document
 * @param[in] sensors - Sensor read interface
 * @param[in] fans - Fan level interface
 */
std::unique_ptr<Zone> getCpuZone(const json& conf,
                                 std::shared_ptr<SensorInterface> sensors,
                                 std::shared_ptr<FanInterface> fans);

/**
 * @brief Create the disk zone, nullptr when it is not enabled
 *
 * @param[in] conf - Whole configuration document
 * @param[in] sensors - Sensor read interface
 * @param[in] fans - Fan level interface
 * @param[in] power - Disk power interface, required by a standby guard
 * @param[in] now - Current time
 */
std::unique_ptr<Zone> getHdZone(const json& conf,
                                std::shared_ptr<SensorInterface> sensors,
                                std::shared_ptr<FanInterface> fans,
                                std::shared_ptr<DiskPowerInterface> power,
                                TimePoint now);

/**
 * @brief Create every enabled zone, the CPU zone first
 *
 * @param[in] conf - Whole configuration document
 * @param[in] sensors - Sensor read interface
 * @param[in] fans - Fan level interface
 * @param[in] power - Disk power interface, required by a standby guard
 * @param[in] now - Current time
 */
std::vector<std::unique_ptr<Zone>>
    getZones(const json& conf, std::shared_ptr<SensorInterface> sensors,
             std::shared_ptr<FanInterface> fans,
             std::shared_ptr<DiskPowerInterface> power, TimePoint now);

} // namespace smfc::control
