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

#include <cstddef>
#include <tuple>

namespace smfc::control
{

/**
 * @class LevelCurve
 *
 * Maps a temperature to a fan level on a linear staircase of steps between
 * (minTemp, minLevel) and (maxTemp, maxLevel).  The width of a temperature
 * step and the height of a level step are always derived from the range
 * and the number of steps.
 *
 * Both the step index and the level are rounded half to even, so a
 * temperature exactly half way between two step boundaries selects the
 * even step.
 */
class LevelCurve
{
  public:
    LevelCurve() = delete;
    LevelCurve(const LevelCurve&) = default;
    LevelCurve& operator=(const LevelCurve&) = default;
    LevelCurve(LevelCurve&&) = default;
    LevelCurve& operator=(LevelCurve&&) = default;
    ~LevelCurve() = default;

    /**
     * @brief Constructor
     *
     * Throws ConfigurationError when steps is 0, maxTemp < minTemp,
     * maxLevel < minLevel or a level is outside 0-100.
     *
     * @param[in] minTemp - Temperature at and below which minLevel is used
     * @param[in] maxTemp - Temperature at and above which maxLevel is used
     * @param[in] steps - Number of steps between the two
     * @param[in] minLevel - Lowest fan level (%)
     * @param[in] maxLevel - Highest fan level (%)
     */
    LevelCurve(double minTemp, double maxTemp, size_t steps, int minLevel,
               int maxLevel);

    /**
     * @brief Get the fan level for a temperature
     *
     * @param[in] temp - Temperature (C)
     *
     * @return The fan level and the step it belongs to
     */
    std::tuple<int, size_t> getLevel(double temp) const;

    /**
     * @brief Get the fan level of a step
     *
     * @param[in] step - Step index, 0 to steps
     */
    int getStepLevel(size_t step) const;

    /**
     * @brief Get the temperature at the boundary of a step
     *
     * @param[in] step - Step index, 0 to steps
     */
    double getStepTemp(size_t step) const;

    /**
     * @brief Width of one temperature step (C)
     */
    inline double getTempStep() const
    {
        return (_maxTemp - _minTemp) / _steps;
    }

    /**
     * @brief Height of one level step (%)
     */
    inline double getLevelStep() const
    {
        return static_cast<double>(_maxLevel - _minLevel) / _steps;
    }

    inline size_t getSteps() const
    {
        return _steps;
    }

    /**
     * @brief The rounding used for step and level calculations
     *
     * Rounds half to even.
     *
     * @param[in] value - Value to round
     */
    static double round(double value);

  private:
    double _minTemp;
    double _maxTemp;
    size_t _steps;
    int _minLevel;
    int _maxLevel;
};

} // namespace smfc::control
