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

#include <nlohmann/json.hpp>

namespace smfc::control
{

/**
 * @class PreSampleHook
 *
 * Work a zone runs each time its polling interval has elapsed, right
 * before it reads its temperature.
 */
class PreSampleHook
{
  public:
    PreSampleHook() = default;
    virtual ~PreSampleHook() = default;
    PreSampleHook(const PreSampleHook&) = delete;
    PreSampleHook& operator=(const PreSampleHook&) = delete;
    PreSampleHook(PreSampleHook&&) = delete;
    PreSampleHook& operator=(PreSampleHook&&) = delete;

    /**
     * @brief Run the hook
     *
     * An IOError thrown here aborts the zone's current tick.
     *
     * @param[in] now - Time of the tick
     */
    virtual void run(TimePoint now) = 0;

    /**
     * @brief Get the hook's state for the debug dump
     */
    virtual nlohmann::json dump() const = 0;
};

} // namespace smfc::control
