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
#include "utility.hpp"

#include "errors.hpp"

#include <fmt/format.h>
#include <glob.h>
#include <sys/wait.h>

#include <array>
#include <cstdio>
#include <memory>
#include <stdexcept>

namespace smfc::util
{

// Exit status of coreutils timeout when the command timed out
constexpr auto timeoutStatus = 124;
// Exit status of the shell when the command was not found
constexpr auto notFoundStatus = 127;

std::string quote(const std::string& arg)
{
    std::string quoted{"'"};
    for (const auto& c : arg)
    {
        if (c == '\'')
        {
            quoted += "'\\''";
        }
        else
        {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

CommandResult executeCommand(const std::vector<std::string>& args,
                             std::chrono::seconds timeout)
{
    if (args.empty())
    {
        throw std::invalid_argument("No command to execute");
    }

    std::string command;
    if (timeout.count() > 0)
    {
        command = fmt::format("timeout -k 1 {} ", timeout.count());
    }
    for (const auto& arg : args)
    {
        command += quote(arg) + " ";
    }
    command += "2>/dev/null";

    std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(command.c_str(), "r"),
                                                  pclose);
    if (!pipe)
    {
        throw IOError(
            fmt::format("popen() failed when running command: {}", command));
    }

    CommandResult result{0, {}};
    std::array<char, 128> buffer;
    std::string line;
    while (fgets(buffer.data(), buffer.size(), pipe.get()) != nullptr)
    {
        line += buffer.data();
        if (line.back() == '\n')
        {
            line.pop_back();
            result.output.push_back(std::move(line));
            line.clear();
        }
    }
    if (!line.empty())
    {
        result.output.push_back(std::move(line));
    }

    auto rc = pclose(pipe.release());
    if (rc == -1)
    {
        throw IOError(fmt::format("pclose() failed for command: {}", args[0]));
    }
    if (!WIFEXITED(rc))
    {
        throw IOError(
            fmt::format("Command {} terminated abnormally", args[0]));
    }

    result.status = WEXITSTATUS(rc);
    if ((timeout.count() > 0) && (result.status == timeoutStatus))
    {
        throw IOError(fmt::format("Command {} timed out after {}s", args[0],
                                  timeout.count()));
    }
    if (result.status == notFoundStatus)
    {
        throw IOError(fmt::format("Command {} not found", args[0]));
    }

    return result;
}

bool hasWildcard(const std::string& path)
{
    return path.find_first_of("*?") != std::string::npos;
}

std::vector<std::string> globPaths(const std::string& pattern)
{
    std::vector<std::string> paths;
    glob_t matches{};

    auto rc = glob(pattern.c_str(), 0, nullptr, &matches);
    if (rc == 0)
    {
        for (size_t i = 0; i < matches.gl_pathc; i++)
        {
            paths.emplace_back(matches.gl_pathv[i]);
        }
    }
    globfree(&matches);

    if ((rc != 0) && (rc != GLOB_NOMATCH))
    {
        throw IOError(fmt::format("Failed to expand path {}", pattern));
    }

    return paths;
}

} // namespace smfc::util
