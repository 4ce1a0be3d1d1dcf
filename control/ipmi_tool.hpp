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

#include <chrono>
#include <string>
#include <vector>

namespace smfc::control
{

/**
 * @class IpmiTool
 *
 * Sets the fan mode and the fan levels of a Super Micro BMC with ipmitool
 * raw commands.  Every change is followed by a delay so the BMC and the
 * fans can settle.
 */
class IpmiTool : public FanInterface
{
  public:
    IpmiTool() = delete;
    ~IpmiTool() override = default;

    /**
     * @brief Constructor
     *
     * Throws ConfigurationError when the command cannot be executed or a
     * delay or the timeout is negative.
     *
     * @param[in] command - Path of ipmitool
     * @param[in] fanModeDelay - Delay after a fan mode change
     * @param[in] fanLevelDelay - Delay after a fan level change
     * @param[in] timeout - Time allowed for each ipmitool call
     */
    IpmiTool(const std::string& command, std::chrono::seconds fanModeDelay,
             std::chrono::seconds fanLevelDelay, std::chrono::seconds timeout);

    int getFanMode() override;

    void setFanMode(FanMode mode) override;

    void setFanLevel(IpmiZone zone, int level) override;

    inline const std::string& getCommand() const
    {
        return _command;
    }

    inline std::chrono::seconds getFanModeDelay() const
    {
        return _fanModeDelay;
    }

    inline std::chrono::seconds getFanLevelDelay() const
    {
        return _fanLevelDelay;
    }

  private:
    /**
     * @brief Run an ipmitool raw command
     *
     * @param[in] args - Raw command bytes
     *
     * @return Output lines of ipmitool
     */
    std::vector<std::string> raw(const std::vector<std::string>& args) const;

    std::string _command;
    std::chrono::seconds _fanModeDelay;
    std::chrono::seconds _fanLevelDelay;
    std::chrono::seconds _timeout;
};

} // namespace smfc::control
