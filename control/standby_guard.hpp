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

#include "disk_power_interface.hpp"
#include "pre_sample_hook.hpp"
#include "types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace smfc::control
{

/**
 * @class StandbyGuard
 *
 * Keeps the disks of an array in the same power state.  When at least
 * hdLimit disks have gone to STANDBY on their own, the remaining ACTIVE
 * disks are put into STANDBY too and the array is considered to be in
 * STANDBY.  When any disk of an array in STANDBY becomes ACTIVE again the
 * array is considered woken up; nothing is written in that case.
 *
 * Runs as the pre-sample hook of the disk zone.
 */
class StandbyGuard : public PreSampleHook
{
  public:
    StandbyGuard() = delete;
    ~StandbyGuard() override = default;

    /**
     * @brief Constructor
     *
     * Queries the disks once: the array starts in STANDBY only when every
     * disk is in STANDBY.
     *
     * Throws ConfigurationError when there are no disks or hdLimit is not
     * between 1 and the number of disks.
     *
     * @param[in] disks - Disk device names, in array order
     * @param[in] hdLimit - Disks in STANDBY that put the array in STANDBY
     * @param[in] power - Disk power state interface
     * @param[in] now - Current time
     */
    StandbyGuard(std::vector<std::string> disks, size_t hdLimit,
                 std::shared_ptr<DiskPowerInterface> power, TimePoint now);

    /**
     * @brief Query the disks and move the array between ACTIVE and STANDBY
     *
     * @param[in] now - Time of the tick
     */
    void run(TimePoint now) override;

    nlohmann::json dump() const override;

    /**
     * @brief The power state of the disks as a string, one character per
     *        disk in array order: 'A' ACTIVE, 'S' STANDBY
     */
    std::string getStateString() const;

    /**
     * @brief Whether the whole array is considered to be in STANDBY
     */
    inline bool isArrayStandby() const
    {
        return _arrayStandby;
    }

    /**
     * @brief STANDBY state of each disk, as of the last query
     */
    inline const std::vector<bool>& getStates() const
    {
        return _states;
    }

    /**
     * @brief Time of the last change of the array state
     */
    inline TimePoint getChangeTime() const
    {
        return _changeTime;
    }

    inline size_t getHdLimit() const
    {
        return _hdLimit;
    }

  private:
    /**
     * @brief Query the power state of every disk
     *
     * The stored states are only replaced when every query succeeded.
     *
     * @return Number of disks in STANDBY
     */
    size_t checkStandbyState();

    /**
     * @brief Put every disk that is still ACTIVE into STANDBY
     */
    void goStandbyState();

    /**
     * @brief Log a change of the array state
     *
     * @param[in] change - Description of the change
     * @param[in] states - Disk states that caused the change
     * @param[in] now - Time of the change
     */
    void logChange(const std::string& change, const std::string& states,
                   TimePoint now) const;

    /* Disk device names */
    const std::vector<std::string> _disks;

    /* Disks in STANDBY that put the whole array into STANDBY */
    const size_t _hdLimit;

    /* Disk power state interface */
    std::shared_ptr<DiskPowerInterface> _power;

    /* STANDBY state of each disk */
    std::vector<bool> _states;

    /* The whole array is in STANDBY */
    bool _arrayStandby;

    /* Time of the last change of _arrayStandby */
    TimePoint _changeTime;
};

} // namespace smfc::control
