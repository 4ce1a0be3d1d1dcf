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
#include "endpoint_resolver.hpp"

#include "errors.hpp"
#include "utility.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <filesystem>
#include <iterator>

namespace smfc::control
{

namespace fs = std::filesystem;

std::string EndpointResolver::resolvePath(const std::string& path)
{
    auto resolved = path;
    if (util::hasWildcard(path))
    {
        auto matches = util::globPaths(path);
        if (matches.empty())
        {
            throw ConfigurationError(
                fmt::format("Cannot read file ({}).", path));
        }
        resolved = matches.front();
    }

    std::error_code ec;
    if (!fs::is_regular_file(resolved, ec))
    {
        throw ConfigurationError(
            fmt::format("Cannot read file ({}).", resolved));
    }

    return resolved;
}

std::vector<std::string> PathResolver::resolve(size_t count) const
{
    if (_paths.size() != count)
    {
        throw ConfigurationError(
            fmt::format("Inconsistent count ({}) and size of hwmon_path ({})",
                        count, _paths.size()));
    }

    std::vector<std::string> resolved;
    std::transform(_paths.begin(), _paths.end(), std::back_inserter(resolved),
                   resolvePath);
    return resolved;
}

std::vector<std::string> CoretempResolver::resolve(size_t count) const
{
    std::vector<std::string> resolved;
    for (size_t i = 0; i < count; i++)
    {
        resolved.push_back(resolvePath(fmt::format(
            "{}/coretemp.{}/hwmon/hwmon*/temp1_input", _platformDir, i)));
    }
    return resolved;
}

std::vector<std::string> DiskResolver::resolve(size_t count) const
{
    if (_diskNames.size() != count)
    {
        throw ConfigurationError(
            fmt::format("Inconsistent count ({}) and size of hd_names ({})",
                        count, _diskNames.size()));
    }

    // Block device name of each disk, e.g. sda
    std::vector<std::string> blockNames;
    for (const auto& name : _diskNames)
    {
        if (name.find("by-id") == std::string::npos)
        {
            throw ConfigurationError(fmt::format(
                "Invalid hd_names={}, name is not in '/dev/disk/by-id' form.",
                name));
        }

        std::error_code ec;
        if (!fs::is_symlink(name, ec))
        {
            throw ConfigurationError(fmt::format(
                "Invalid hd_names={}, the reference is not link.", name));
        }
        auto target = fs::read_symlink(name, ec);
        if (ec)
        {
            throw ConfigurationError(fmt::format(
                "Invalid hd_names={}, cannot read link: {}", name,
                ec.message()));
        }
        blockNames.push_back(target.filename().string());
    }

    std::vector<std::string> resolved(count);
    try
    {
        std::vector<fs::path> scsiDisks;
        for (const auto& entry : fs::directory_iterator(_scsiDiskDir))
        {
            scsiDisks.push_back(entry.path());
        }
        std::sort(scsiDisks.begin(), scsiDisks.end());

        for (const auto& disk : scsiDisks)
        {
            auto pattern = (disk / "device/block/sd*").string();
            auto blocks = util::globPaths(pattern);
            if (blocks.empty())
            {
                throw ConfigurationError(
                    fmt::format("Cannot read file ({}).", pattern));
            }

            auto block = fs::path{blocks.front()}.filename().string();
            auto it = std::find(blockNames.begin(), blockNames.end(), block);
            if (it == blockNames.end())
            {
                // Not one of the configured disks
                continue;
            }

            resolved[std::distance(blockNames.begin(), it)] = resolvePath(
                (disk / "device/hwmon/hwmon*/temp1_input").string());
        }
    }
    catch (const fs::filesystem_error& e)
    {
        throw ConfigurationError(fmt::format("Cannot list {}: {}",
                                             _scsiDiskDir, e.what()));
    }

    if (std::any_of(resolved.begin(), resolved.end(),
                    [](const auto& path) { return path.empty(); }))
    {
        throw ConfigurationError(fmt::format(
            "Invalid hd_names= parameter, not all hwmon files were found ({})",
            fmt::join(resolved, ", ")));
    }

    return resolved;
}

} // namespace smfc::control
