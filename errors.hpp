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

#include <fmt/format.h>

#include <stdexcept>
#include <string>

namespace smfc
{

/**
 * @class ConfigurationError - An invalid configuration exception
 *
 * Thrown while constructing any part of the fan controller from its
 * configuration: invalid ranges, count mismatches, sensor endpoints that
 * cannot be resolved or values of the wrong type. A configuration error
 * always prevents the object from being created.
 */
class ConfigurationError : public std::runtime_error
{
  public:
    ConfigurationError() = delete;
    ~ConfigurationError() = default;

    /**
     * @brief Configuration error object
     *
     * @param[in] details - What is wrong with the configuration
     */
    explicit ConfigurationError(const std::string& details) :
        std::runtime_error(details)
    {}
};

/**
 * @class NoConfigFound - A no configuration found exception
 *
 * None of the configuration file locations contained a file.
 */
class NoConfigFound : public ConfigurationError
{
  public:
    NoConfigFound() = delete;
    ~NoConfigFound() = default;

    /**
     * @brief No configuration found exception object
     *
     * @param[in] appName - Application name
     * @param[in] fileName - Configuration file that was looked for
     */
    NoConfigFound(const std::string& appName, const std::string& fileName) :
        ConfigurationError(fmt::format("Configuration not found [Could not "
                                       "find {} conf file {}]",
                                       appName, fileName))
    {}
};

/**
 * @class IOError - A sensor or device I/O exception
 *
 * Thrown when a sensor file cannot be read, holds malformed content, or an
 * external tool cannot be run or does not complete in time. At runtime it
 * only aborts the current control loop tick.
 */
class IOError : public std::runtime_error
{
  public:
    IOError() = delete;
    ~IOError() = default;

    /**
     * @brief I/O error object
     *
     * @param[in] details - Description of the failed operation
     */
    explicit IOError(const std::string& details) : std::runtime_error(details)
    {}
};

/**
 * @class ExternalToolError - An unexpected external tool result
 *
 * An external tool ran but returned a status or output that is not
 * understood. Handled the same way as any other IOError.
 */
class ExternalToolError : public IOError
{
  public:
    ExternalToolError() = delete;
    ~ExternalToolError() = default;

    /**
     * @brief External tool error object
     *
     * @param[in] tool - Path of the tool that was run
     * @param[in] status - Exit status returned by the tool
     */
    ExternalToolError(const std::string& tool, int status) :
        IOError(fmt::format("Unexpected {} return value {}", tool, status)),
        _status(status)
    {}

    /**
     * @brief External tool error object
     *
     * @param[in] tool - Path of the tool that was run
     * @param[in] details - Description of the unexpected result
     */
    ExternalToolError(const std::string& tool, const std::string& details) :
        IOError(fmt::format("Unexpected {} result [{}]", tool, details))
    {}

    /**
     * @brief Exit status of the tool, -1 when the status was not the cause
     */
    inline int getStatus() const
    {
        return _status;
    }

  private:
    int _status = -1;
};

} // namespace smfc
