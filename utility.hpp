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
#include <string>
#include <vector>

namespace smfc::util
{

/**
 * @brief The result of running an external command
 */
struct CommandResult
{
    /* Exit status of the command */
    int status;

    /* Lines written to stdout, without the trailing newline */
    std::vector<std::string> output;
};

/**
 * @brief Quote an argument so the shell passes it through unchanged
 *
 * @param[in] arg - The argument
 *
 * @return The argument in single quotes
 */
std::string quote(const std::string& arg);

/**
 * @brief Run an external command and capture its output
 *
 * The first element of args is the program, the rest are its arguments.
 * stderr of the command is discarded.  A timeout of zero waits for the
 * command indefinitely, otherwise the command is killed once the timeout
 * expires.
 *
 * Throws IOError when the command cannot be started, is not found,
 * terminates abnormally or times out.
 *
 * @param[in] args - Program and arguments
 * @param[in] timeout - Time allowed for the command to complete
 *
 * @return The exit status and output of the command
 */
CommandResult executeCommand(const std::vector<std::string>& args,
                             std::chrono::seconds timeout);

/**
 * @brief Whether a path contains shell wildcard characters ('*' or '?')
 *
 * @param[in] path - The path
 */
bool hasWildcard(const std::string& path);

/**
 * @brief Expand a wildcard path pattern
 *
 * @param[in] pattern - Path pattern with '*' or '?' wildcards
 *
 * @return The matching paths in sorted order, empty when nothing matches
 */
std::vector<std::string> globPaths(const std::string& pattern);

} // namespace smfc::util
