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
#include "smartctl.hpp"

#include "errors.hpp"
#include "utility.hpp"

#include <fmt/format.h>
#include <unistd.h>

#include <algorithm>

namespace smfc::control
{

Smartctl::Smartctl(const std::string& command, std::chrono::seconds timeout) :
    _command(command), _timeout(timeout)
{
    if (access(_command.c_str(), X_OK) != 0)
    {
        throw ConfigurationError(
            fmt::format("Cannot execute smartctl ({})", _command));
    }
    if (_timeout.count() < 0)
    {
        throw ConfigurationError(
            fmt::format("Negative smartctl timeout ({})", _timeout.count()));
    }
}

bool Smartctl::isStandby(const std::string& disk)
{
    auto result = util::executeCommand(
        {_command, "-i", "-n", "standby", disk}, _timeout);
    if ((result.status != 0) && (result.status != 2))
    {
        throw ExternalToolError(_command, result.status);
    }

    return std::any_of(result.output.begin(), result.output.end(),
                       [](const auto& line) {
                           return line.find("STANDBY") != std::string::npos;
                       });
}

void Smartctl::setStandby(const std::string& disk)
{
    auto result =
        util::executeCommand({_command, "-s", "standby,now", disk}, _timeout);
    if (result.status != 0)
    {
        throw ExternalToolError(_command, result.status);
    }
}

} // namespace smfc::control
