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

#include <nlohmann/json.hpp>
#include <phosphor-logging/lg2.hpp>

#include <cstddef>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>

namespace smfc
{

/**
 * @class Logger
 *
 * A logging class that delivers messages to the journal only when their
 * level is enabled, and keeps the delivered messages in a vector along
 * with their timestamp so they can be dumped on request.
 *
 * The levels are ordered none < error < info < debug.  A message is
 * delivered when its level is not none and is not above the configured
 * level.  A logger configured with Level::none stays silent.
 *
 * The maximum number of entries to keep is specified in the
 * constructor, and after that is hit the oldest entry will be
 * removed when a new one is added.
 */
class Logger
{
  public:
    // timestamp, message
    using LogEntry = std::tuple<std::string, std::string>;

    enum Level
    {
        none = 0,
        error = 1,
        info = 2,
        debug = 3
    };

    Logger() = delete;
    ~Logger() = default;
    Logger(const Logger&) = default;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = default;
    Logger& operator=(Logger&&) = delete;

    /**
     * @brief Constructor
     *
     * @param[in] maxEntries - The maximum number of log entries
     *                         to keep.
     * @param[in] level - The highest level delivered
     */
    explicit Logger(size_t maxEntries, Level level = Logger::error) :
        _maxEntries(maxEntries), _level(level)
    {
        if (maxEntries == 0)
        {
            throw std::invalid_argument("Logger requires at least 1 entry");
        }
    }

    /**
     * @brief Set the highest level delivered
     *
     * @param[in] level - New level
     */
    inline void setLevel(Level level)
    {
        _level = level;
    }

    /**
     * @brief Get the highest level delivered
     */
    inline Level getLevel() const
    {
        return _level;
    }

    /**
     * @brief Whether a message at this level would be delivered
     *
     * Used to skip building messages that would be dropped.
     *
     * @param[in] level - Level of the message
     */
    inline bool enabled(Level level) const
    {
        return (level != Logger::none) && (level <= _level);
    }

    /**
     * @brief Places an entry in the log and writes it to the journal,
     *        if the level of the message is enabled.
     *
     * @param[in] message - The log message
     *
     * @param[in] level - The level of the message
     */
    void log(const std::string& message, Level level = Logger::info)
    {
        if (!enabled(level))
        {
            return;
        }

        if (level == Logger::error)
        {
            lg2::error("{MSG}", "MSG", message);
        }
        else if (level == Logger::info)
        {
            lg2::info("{MSG}", "MSG", message);
        }
        else
        {
            lg2::debug("{MSG}", "MSG", message);
        }

        if (_entries.size() == _maxEntries)
        {
            _entries.erase(_entries.begin());
        }

        // Generate a timestamp
        auto t = std::time(nullptr);
        auto tm = *std::localtime(&t);

        // e.g. Sep 22 19:56:32
        auto timestamp = std::put_time(&tm, "%b %d %H:%M:%S");

        std::ostringstream stream;
        stream << timestamp;
        _entries.emplace_back(stream.str(), message);
    }

    /**
     * @brief Returns the entries in a JSON array
     *
     * @return JSON
     */
    const nlohmann::json getLogs() const
    {
        return _entries;
    }

    /**
     * @brief Deletes all log entries
     */
    void clear()
    {
        _entries.clear();
    }

  private:
    /**
     * @brief The maximum number of entries to hold
     */
    const size_t _maxEntries;

    /**
     * @brief The highest level delivered
     */
    Level _level;

    /**
     * @brief The vector of <timestamp, message> entries
     */
    std::vector<LogEntry> _entries;
};

} // namespace smfc
