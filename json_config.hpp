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

#include "errors.hpp"

#include <fmt/format.h>

#include <nlohmann/json.hpp>
#include <phosphor-logging/lg2.hpp>

#include <filesystem>
#include <fstream>
#include <string>

namespace smfc
{

namespace fs = std::filesystem;
using json = nlohmann::json;

class JsonConfig
{
  public:
    JsonConfig() = delete;

    /**
     * Get the json configuration file. The first location found to contain
     * the json config file is used from the following locations in order.
     * 1.) The path given on the command line, when one was given
     * 2.) From the confOverridePath location
     * 3.) From the default confBasePath location
     *
     * @param[in] fileName - Configuration file's name
     * @param[in] cmdLinePath - Path given on the command line, may be empty
     *
     * @return filesystem path
     *     The filesystem path to the configuration file to use
     */
    static const fs::path getConfFile(const std::string& fileName,
                                      const std::string& cmdLinePath = "")
    {
        // A path given explicitly must exist, no fallback to the defaults
        if (!cmdLinePath.empty())
        {
            fs::path confFile{cmdLinePath};
            if (!fs::exists(confFile))
            {
                throw NoConfigFound(SMFC_APP_NAME, cmdLinePath);
            }
            return confFile;
        }

        // Check override location
        fs::path confFile = fs::path{SMFC_CONF_OVERRIDE_PATH} / fileName;
        if (fs::exists(confFile))
        {
            return confFile;
        }

        // If the default file is there, use it
        confFile = fs::path{SMFC_CONF_BASE_PATH} / fileName;
        if (fs::exists(confFile))
        {
            return confFile;
        }

        throw NoConfigFound(SMFC_APP_NAME, fileName);
    }

    /**
     * @brief Load the JSON config file
     *
     * @param[in] confFile - File system path of the configuration file to load
     *
     * @return Parsed JSON object
     *     The parsed JSON configuration file object
     */
    static const json load(const fs::path& confFile)
    {
        std::ifstream file;
        json jsonConf;

        if (!confFile.empty() && fs::exists(confFile))
        {
            lg2::info("Loading configuration from {PATH}", "PATH",
                      confFile.string());
            file.open(confFile);
            try
            {
                // Enable ignoring `//` or `/* */` comments
                jsonConf = json::parse(file, nullptr, true, true);
            }
            catch (const std::exception& e)
            {
                lg2::error(
                    "Failed to parse JSON config file: {PATH}, error: {ERROR}",
                    "PATH", confFile.string(), "ERROR", e.what());
                throw ConfigurationError(
                    fmt::format("Failed to parse JSON config file: {}, "
                                "error: {}",
                                confFile.string(), e.what()));
            }
        }
        else
        {
            lg2::error("Unable to open JSON config file: {PATH}", "PATH",
                       confFile.string());
            throw ConfigurationError(fmt::format(
                "Unable to open JSON config file: {}", confFile.string()));
        }

        return jsonConf;
    }
};

} // namespace smfc
