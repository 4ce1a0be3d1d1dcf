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
#include "level_curve.hpp"

#include "errors.hpp"

#include <fmt/format.h>

#include <cfenv>
#include <cmath>

namespace smfc::control
{

LevelCurve::LevelCurve(double minTemp, double maxTemp, size_t steps,
                       int minLevel, int maxLevel) :
    _minTemp(minTemp), _maxTemp(maxTemp), _steps(steps), _minLevel(minLevel),
    _maxLevel(maxLevel)
{
    if (_steps == 0)
    {
        throw ConfigurationError("steps <= 0");
    }
    if (!std::isfinite(_minTemp) || !std::isfinite(_maxTemp))
    {
        throw ConfigurationError("min_temp and max_temp must be finite");
    }
    if (_maxTemp < _minTemp)
    {
        throw ConfigurationError(fmt::format(
            "max_temp ({}) < min_temp ({})", _maxTemp, _minTemp));
    }
    if ((_minLevel < 0) || (_maxLevel > 100))
    {
        throw ConfigurationError(
            fmt::format("Fan levels must be between 0 and 100 (min_level={}, "
                        "max_level={})",
                        _minLevel, _maxLevel));
    }
    if (_maxLevel < _minLevel)
    {
        throw ConfigurationError(fmt::format(
            "max_level ({}) < min_level ({})", _maxLevel, _minLevel));
    }
}

double LevelCurve::round(double value)
{
    // nearbyint() honors the current rounding mode, pin it
    auto mode = std::fegetround();
    std::fesetround(FE_TONEAREST);
    auto rounded = std::nearbyint(value);
    std::fesetround(mode);
    return rounded;
}

std::tuple<int, size_t> LevelCurve::getLevel(double temp) const
{
    if (temp <= _minTemp)
    {
        return {_minLevel, 0};
    }
    if (temp >= _maxTemp)
    {
        return {_maxLevel, _steps};
    }

    auto step = static_cast<size_t>(round((temp - _minTemp) / getTempStep()));
    return {getStepLevel(step), step};
}

int LevelCurve::getStepLevel(size_t step) const
{
    if (step >= _steps)
    {
        return _maxLevel;
    }
    return static_cast<int>(round(step * getLevelStep())) + _minLevel;
}

double LevelCurve::getStepTemp(size_t step) const
{
    return _minTemp + (step * getTempStep());
}

} // namespace smfc::control
