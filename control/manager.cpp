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
#include "config.h"

#include "manager.hpp"

#include "errors.hpp"
#include "logging.hpp"

#include <fmt/format.h>

#include <nlohmann/json.hpp>
#include <phosphor-logging/lg2.hpp>

#include <algorithm>
#include <fstream>
#include <functional>
#include <iomanip>

namespace smfc::control
{

using json = nlohmann::json;

const std::string Manager::dumpFile = SMFC_DUMP_FILE;

Manager::Manager(const sdeventplus::Event& event,
                 std::shared_ptr<FanInterface> fans,
                 std::vector<std::unique_ptr<Zone>> zones) :
    _fans(std::move(fans)), _zones(std::move(zones)),
    _interval(getInterval(_zones)),
    _timer(event, std::bind(&Manager::tick, this))
{
    getLogger().log(fmt::format("Main loop wait time = {} sec",
                                Seconds(_interval).count()),
                    Logger::debug);
}

std::chrono::microseconds
    Manager::getInterval(const std::vector<std::unique_ptr<Zone>>& zones)
{
    if (zones.empty())
    {
        throw ConfigurationError(
            "None of the fan controllers are enabled, service terminated.");
    }

    auto zone = std::min_element(zones.begin(), zones.end(),
                                 [](const auto& a, const auto& b) {
                                     return a->getConfig().polling <
                                            b->getConfig().polling;
                                 });
    auto interval = std::chrono::duration_cast<std::chrono::microseconds>(
        (*zone)->getConfig().polling / 2);

    return std::max<std::chrono::microseconds>(interval, minInterval);
}

void Manager::start()
{
    initFanMode();

    tick();
    _timer.restart(_interval);
}

void Manager::initFanMode()
{
    auto& logger = getLogger();

    auto mode = _fans->getFanMode();
    logger.log(fmt::format("Old IPMI fan mode = {}", getFanModeName(mode)),
               Logger::debug);

    if (mode != static_cast<int>(FanMode::full))
    {
        _fans->setFanMode(FanMode::full);
        logger.log(fmt::format("New IPMI fan mode = {}",
                               getFanModeName(
                                   static_cast<int>(FanMode::full))),
                   Logger::debug);
    }
}

void Manager::tick()
{
    for (auto& zone : _zones)
    {
        try
        {
            zone->tick(Clock::now());
        }
        catch (const IOError& e)
        {
            // The zone keeps its last fan level, the next tick retries
            getLogger().log(fmt::format("{}: {}", zone->getName(), e.what()),
                            Logger::error);
        }
    }
}

nlohmann::json Manager::getDebugData() const
{
    json data;
    data["logs"] = getLogger().getLogs();
    data["interval"] = Seconds(_interval).count();

    std::for_each(_zones.begin(), _zones.end(), [&data](const auto& zone) {
        data["zones"][zone->getName()] = zone->dump();
    });

    return data;
}

void Manager::dumpDebugData(sdeventplus::source::Signal&,
                            const struct signalfd_siginfo*)
{
    auto data = getDebugData();

    std::ofstream file{Manager::dumpFile};
    if (!file)
    {
        lg2::error("Could not open file {FILE} for fan control dump", "FILE",
                   Manager::dumpFile);
        return;
    }

    file << std::setw(4) << data;
}

} // namespace smfc::control
