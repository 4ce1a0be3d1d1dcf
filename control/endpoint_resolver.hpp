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

#include <cstddef>
#include <string>
#include <vector>

namespace smfc::control
{

/**
 * @class EndpointResolver
 *
 * Finds the ordered list of temperature sensor files of a zone.  Each
 * logical sensor resolves to exactly one existing file, otherwise the
 * zone cannot be created.
 */
class EndpointResolver
{
  public:
    EndpointResolver() = default;
    virtual ~EndpointResolver() = default;
    EndpointResolver(const EndpointResolver&) = delete;
    EndpointResolver& operator=(const EndpointResolver&) = delete;
    EndpointResolver(EndpointResolver&&) = delete;
    EndpointResolver& operator=(EndpointResolver&&) = delete;

    /**
     * @brief Resolve the sensor files
     *
     * Throws ConfigurationError when the number of sensors does not match
     * count, a wildcard matches nothing, or a file does not exist.
     *
     * @param[in] count - Number of sensors configured for the zone
     *
     * @return One path per sensor
     */
    virtual std::vector<std::string> resolve(size_t count) const = 0;

  protected:
    /**
     * @brief Resolve a single path that may contain wildcards to the first
     *        sorted match and check it is an existing file.
     *
     * @param[in] path - Path or path pattern
     */
    static std::string resolvePath(const std::string& path);
};

/**
 * @class PathResolver
 *
 * Uses an explicitly configured list of sensor files, which may contain
 * '*' and '?' wildcards.
 */
class PathResolver : public EndpointResolver
{
  public:
    /**
     * @brief Constructor
     *
     * @param[in] paths - Configured sensor files, one per sensor
     */
    explicit PathResolver(std::vector<std::string> paths) :
        _paths(std::move(paths))
    {}

    std::vector<std::string> resolve(size_t count) const override;

  private:
    std::vector<std::string> _paths;
};

/**
 * @class CoretempResolver
 *
 * Finds the package temperature of each CPU through the coretemp driver:
 * <platform>/coretemp.<n>/hwmon/hwmon* /temp1_input
 */
class CoretempResolver : public EndpointResolver
{
  public:
    /**
     * @brief Constructor
     *
     * @param[in] platformDir - sysfs platform devices directory
     */
    explicit CoretempResolver(
        const std::string& platformDir = "/sys/devices/platform") :
        _platformDir(platformDir)
    {}

    std::vector<std::string> resolve(size_t count) const override;

  private:
    std::string _platformDir;
};

/**
 * @class DiskResolver
 *
 * Finds the hwmon temperature file of each disk (drivetemp driver) from
 * its /dev/disk/by-id/ name.  The by-id link gives the block device name
 * (e.g. sda), which is looked up under the scsi_disk class to reach the
 * disk's hwmon directory.
 */
class DiskResolver : public EndpointResolver
{
  public:
    /**
     * @brief Constructor
     *
     * @param[in] diskNames - Disks in /dev/disk/by-id/ form
     * @param[in] scsiDiskDir - sysfs scsi_disk class directory
     */
    DiskResolver(std::vector<std::string> diskNames,
                 const std::string& scsiDiskDir = "/sys/class/scsi_disk") :
        _diskNames(std::move(diskNames)), _scsiDiskDir(scsiDiskDir)
    {}

    std::vector<std::string> resolve(size_t count) const override;

  private:
    std::vector<std::string> _diskNames;
    std::string _scsiDiskDir;
};

} // namespace smfc::control
