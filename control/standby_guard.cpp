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
#include "standby_guard.hpp"

#include "errors.hpp"
#include "logging.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <chrono>

namespace smfc::control
{

using Hours = std::chrono::duration<double, std::ratio<3600>>;

StandbyGuard::StandbyGuard(std::vector<std::string> disks, size_t hdLimit,
                           std::shared_ptr<DiskPowerInterface> power,
                           TimePoint now) :
    _disks(std::move(disks)), _hdLimit(hdLimit), _power(std::move(power)),
    _states(_disks.size(), false), _arrayStandby(false), _changeTime(now)
{
    if (_disks.empty())
    {
        throw ConfigurationError("Standby guard requires disks");
    }
    if (_hdLimit < 1)
    {
        throw ConfigurationError("standby hd_limit < 1");
    }
    if (_hdLimit > _disks.size())
    {
        throw ConfigurationError(
            fmt::format("standby hd_limit ({}) > count ({})", _hdLimit,
                        _disks.size()));
    }

    _arrayStandby = (checkStandbyState() == _disks.size());
}

size_t StandbyGuard::checkStandbyState()
{
    std::vector<bool> states;
    states.reserve(_disks.size());
    for (const auto& disk : _disks)
    {
        states.push_back(_power->isStandby(disk));
    }
    _states = std::move(states);

    return std::count(_states.begin(), _states.end(), true);
}

void StandbyGuard::goStandbyState()
{
    for (size_t i = 0; i < _disks.size(); i++)
    {
        if (!_states[i])
        {
            _power->setStandby(_disks[i]);
            _states[i] = true;
        }
    }
}

std::string StandbyGuard::getStateString() const
{
    std::string result;
    for (const auto& standby : _states)
    {
        result += standby ? 'S' : 'A';
    }
    return result;
}

void StandbyGuard::logChange(const std::string& change,
                             const std::string& states, TimePoint now) const
{
    getLogger().log(
        fmt::format("Standby guard: Change {} after {:.1f} hour(s) [{}]",
                    change, Hours(now - _changeTime).count(), states),
        Logger::info);
}

void StandbyGuard::run(TimePoint now)
{
    auto standbyCount = checkStandbyState();

    if (!_arrayStandby && (standbyCount >= _hdLimit))
    {
        // Enough disks went to STANDBY, move the rest of the array as well
        auto states = getStateString();
        goStandbyState();
        logChange("ACTIVE to STANDBY", states, now);
        _arrayStandby = true;
        _changeTime = now;
    }
    else if (_arrayStandby && (standbyCount < _disks.size()))
    {
        // Woken up by disk I/O
        logChange("STANDBY to ACTIVE", getStateString(), now);
        _arrayStandby = false;
        _changeTime = now;
    }
}

nlohmann::json StandbyGuard::dump() const
{
    nlohmann::json data;
    data["hd_limit"] = _hdLimit;
    data["array_standby"] = _arrayStandby;
    data["states"] = getStateString();
    data["hours_since_change"] =
        Hours(Clock::now() - _changeTime).count();
    return data;
}

} // namespace smfc::control
