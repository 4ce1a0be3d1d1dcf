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

#include "disk_power_interface.hpp"

#include <chrono>
#include <string>

namespace smfc::control
{

/**
 * @class Smartctl
 *
 * Queries and sets the power state of disks with smartctl.
 */
class Smartctl : public DiskPowerInterface
{
  public:
    Smartctl() = delete;
    ~Smartctl() override = default;

    /**
     * @brief Constructor
     *
     * Throws ConfigurationError when the command cannot be executed or the
     * timeout is negative.
     *
     * @param[in] command - Path of smartctl
     * @param[in] timeout - Time allowed for each smartctl call
     */
    Smartctl(const std::string& command, std::chrono::seconds timeout);

    /**
     * @copydoc DiskPowerInterface::isStandby
     *
     * smartctl exits with 2 when '-n standby' skipped a disk in STANDBY,
     * which is a valid result just like 0.
     */
    bool isStandby(const std::string& disk) override;

    void setStandby(const std::string& disk) override;

    inline const std::string& getCommand() const
    {
        return _command;
    }

  private:
    std::string _command;
    std::chrono::seconds _timeout;
};

} // namespace smfc::control
