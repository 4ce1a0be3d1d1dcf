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

#include "types.hpp"

#include <string>

namespace smfc::control
{

/**
 * IPMI fan modes of the baseboard management controller
 */
enum class FanMode : int
{
    standard = 0,
    full = 1,
    optimal = 2,
    heavyIO = 4
};

/**
 * @brief Get the display name of a fan mode value
 *
 * @param[in] mode - Raw fan mode value
 *
 * @return The name, or "UNKNOWN" for values that are not a fan mode
 */
std::string getFanModeName(int mode);

/**
 * @class FanInterface
 *
 * Interface to the fan mode and fan level settings of the BMC.
 */
class FanInterface
{
  public:
    FanInterface() = default;
    virtual ~FanInterface() = default;
    FanInterface(const FanInterface&) = delete;
    FanInterface& operator=(const FanInterface&) = delete;
    FanInterface(FanInterface&&) = delete;
    FanInterface& operator=(FanInterface&&) = delete;

    /**
     * @brief Read the current fan mode
     *
     * @return The raw fan mode value
     */
    virtual int getFanMode() = 0;

    /**
     * @brief Set the fan mode
     *
     * Fan levels only take effect in the full mode.
     *
     * @param[in] mode - The new fan mode
     */
    virtual void setFanMode(FanMode mode) = 0;

    /**
     * @brief Set the fan level of a zone
     *
     * @param[in] zone - The IPMI zone
     * @param[in] level - The fan level, 0-100%
     */
    virtual void setFanLevel(IpmiZone zone, int level) = 0;
};

} // namespace smfc::control
