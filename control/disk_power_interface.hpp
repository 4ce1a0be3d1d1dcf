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

#include <string>

namespace smfc::control
{

/**
 * @class DiskPowerInterface
 *
 * Interface to query and change the power state of a disk.
 */
class DiskPowerInterface
{
  public:
    DiskPowerInterface() = default;
    virtual ~DiskPowerInterface() = default;
    DiskPowerInterface(const DiskPowerInterface&) = delete;
    DiskPowerInterface& operator=(const DiskPowerInterface&) = delete;
    DiskPowerInterface(DiskPowerInterface&&) = delete;
    DiskPowerInterface& operator=(DiskPowerInterface&&) = delete;

    /**
     * @brief Whether the disk is in STANDBY state
     *
     * Querying must not wake the disk up.
     *
     * @param[in] disk - Disk device name
     *
     * @return true when in STANDBY, false when ACTIVE
     */
    virtual bool isStandby(const std::string& disk) = 0;

    /**
     * @brief Put the disk into STANDBY state immediately
     *
     * @param[in] disk - Disk device name
     */
    virtual void setStandby(const std::string& disk) = 0;
};

} // namespace smfc::control
