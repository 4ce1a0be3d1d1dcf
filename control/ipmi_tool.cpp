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
#include "ipmi_tool.hpp"

#include "errors.hpp"
#include "logging.hpp"
#include "utility.hpp"

#include <fmt/format.h>
#include <unistd.h>

#include <stdexcept>
#include <thread>

namespace smfc::control
{

std::string getFanModeName(int mode)
{
    switch (mode)
    {
        case static_cast<int>(FanMode::standard):
            return "STANDARD_MODE";
        case static_cast<int>(FanMode::full):
            return "FULL_MODE";
        case static_cast<int>(FanMode::optimal):
            return "OPTIMAL_MODE";
        case static_cast<int>(FanMode::heavyIO):
            return "HEAVY_IO_MODE";
        default:
            return "UNKNOWN";
    }
}

IpmiTool::IpmiTool(const std::string& command,
                   std::chrono::seconds fanModeDelay,
                   std::chrono::seconds fanLevelDelay,
                   std::chrono::seconds timeout) :
    _command(command), _fanModeDelay(fanModeDelay),
    _fanLevelDelay(fanLevelDelay), _timeout(timeout)
{
    if (access(_command.c_str(), X_OK) != 0)
    {
        throw ConfigurationError(
            fmt::format("Cannot execute ipmitool ({})", _command));
    }
    if (_fanModeDelay.count() < 0)
    {
        throw ConfigurationError(fmt::format("Negative fan_mode_delay ({})",
                                             _fanModeDelay.count()));
    }
    if (_fanLevelDelay.count() < 0)
    {
        throw ConfigurationError(fmt::format("Negative fan_level_delay ({})",
                                             _fanLevelDelay.count()));
    }
    if (_timeout.count() < 0)
    {
        throw ConfigurationError(
            fmt::format("Negative ipmi timeout ({})", _timeout.count()));
    }

    auto& logger = getLogger();
    if (logger.enabled(Logger::debug))
    {
        logger.log("Ipmi module was initialized with:", Logger::debug);
        logger.log(fmt::format("   command = {}", _command), Logger::debug);
        logger.log(
            fmt::format("   fan_mode_delay = {}", _fanModeDelay.count()),
            Logger::debug);
        logger.log(
            fmt::format("   fan_level_delay = {}", _fanLevelDelay.count()),
            Logger::debug);
    }
}

std::vector<std::string> IpmiTool::raw(const std::vector<std::string>& args) const
{
    std::vector<std::string> command{_command, "raw"};
    command.insert(command.end(), args.begin(), args.end());

    auto result = util::executeCommand(command, _timeout);
    if (result.status != 0)
    {
        throw ExternalToolError(_command, result.status);
    }
    return result.output;
}

int IpmiTool::getFanMode()
{
    auto output = raw({"0x30", "0x45", "0x00"});
    if (output.empty())
    {
        throw ExternalToolError(_command, "no fan mode returned");
    }

    try
    {
        size_t pos = 0;
        auto mode = std::stoi(output.front(), &pos);
        if (output.front().find_first_not_of(" \t", pos) != std::string::npos)
        {
            throw std::invalid_argument(output.front());
        }
        return mode;
    }
    catch (const std::logic_error&)
    {
        throw ExternalToolError(
            _command, fmt::format("invalid fan mode '{}'", output.front()));
    }
}

void IpmiTool::setFanMode(FanMode mode)
{
    raw({"0x30", "0x45", "0x01", std::to_string(static_cast<int>(mode))});

    // Give time for the BMC and the fans to apply the new fan mode
    std::this_thread::sleep_for(_fanModeDelay);
}

void IpmiTool::setFanLevel(IpmiZone zone, int level)
{
    if ((zone != IpmiZone::cpu) && (zone != IpmiZone::hd))
    {
        throw std::invalid_argument(fmt::format(
            "Invalid value: zone ({})", static_cast<int>(zone)));
    }
    if ((level < 0) || (level > 100))
    {
        throw std::invalid_argument(
            fmt::format("Invalid value: level ({})", level));
    }

    raw({"0x30", "0x70", "0x66", "0x01",
         std::to_string(static_cast<int>(zone)), std::to_string(level)});

    // Give time for the fans to spin up/down
    std::this_thread::sleep_for(_fanLevelDelay);
}

} // namespace smfc::control
