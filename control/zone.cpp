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
#include "zone.hpp"

#include "errors.hpp"
#include "logging.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <cmath>

namespace smfc::control
{

namespace
{

/**
 * @brief Check the zone configuration values not covered by the level
 *        curve and the endpoint resolver
 *
 * @param[in] config - Zone configuration
 *
 * @return The configuration
 */
const ZoneConfig& validate(const ZoneConfig& config)
{
    if (config.count == 0)
    {
        throw ConfigurationError(
            fmt::format("{}: count <= 0", config.name));
    }
    if (!(config.sensitivity > 0.0))
    {
        throw ConfigurationError(
            fmt::format("{}: sensitivity <= 0", config.name));
    }
    if (!(config.polling.count() >= 0.0))
    {
        throw ConfigurationError(fmt::format("{}: polling < 0", config.name));
    }
    return config;
}

} // namespace

Zone::Zone(const ZoneConfig& config, const EndpointResolver& resolver,
           std::shared_ptr<SensorInterface> sensors,
           std::shared_ptr<FanInterface> fans,
           std::unique_ptr<PreSampleHook> hook) :
    _config(validate(config)),
    _curve(config.minTemp, config.maxTemp, config.steps, config.minLevel,
           config.maxLevel),
    _source(resolver.resolve(config.count), config.tempCalc,
            std::move(sensors)),
    _fans(std::move(fans)), _hook(std::move(hook))
{
    // Make sure the sensors can be read before the zone is used
    _source.read();

    logConfig();
}

void Zone::tick(TimePoint now)
{
    auto& logger = getLogger();

    // Wait for the polling interval to elapse
    if (_state.lastTime && (Seconds(now - *_state.lastTime) < _config.polling))
    {
        return;
    }
    _state.lastTime = now;

    if (_hook)
    {
        _hook->run(now);
    }

    auto temp = _source.read();
    if (logger.enabled(Logger::debug))
    {
        logger.log(fmt::format("{}: new temperature > {:.1f}C", getName(),
                               temp),
                   Logger::debug);
    }

    // Ignore changes within the sensitivity
    if (std::abs(temp - _state.lastTemp) < _config.sensitivity)
    {
        return;
    }

    auto [level, step] = _curve.getLevel(temp);
    if (level != _state.lastLevel)
    {
        _fans->setFanLevel(_config.ipmiZone, level);
        logger.log(fmt::format("{}: new level > {:.1f}C > [T:{}C/L:{}%]",
                               getName(), temp, _curve.getStepTemp(step),
                               level),
                   Logger::info);
    }

    // Only accepted once the fan level was written
    _state.lastTemp = temp;
    _state.lastLevel = level;
}

void Zone::logConfig() const
{
    auto& logger = getLogger();
    if (!logger.enabled(Logger::debug))
    {
        return;
    }

    logger.log(fmt::format("{} fan controller was initialized with:",
                           getName()),
               Logger::debug);
    logger.log(fmt::format("   IPMI zone = {}",
                           static_cast<int>(_config.ipmiZone)),
               Logger::debug);
    logger.log(fmt::format("   count = {}", _config.count), Logger::debug);
    logger.log(fmt::format("   temp_calc = {}",
                           getAggregationName(_source.getAggregation())),
               Logger::debug);
    logger.log(fmt::format("   steps = {}", _config.steps), Logger::debug);
    logger.log(fmt::format("   sensitivity = {}", _config.sensitivity),
               Logger::debug);
    logger.log(fmt::format("   polling = {}", _config.polling.count()),
               Logger::debug);
    logger.log(fmt::format("   min_temp = {}", _config.minTemp),
               Logger::debug);
    logger.log(fmt::format("   max_temp = {}", _config.maxTemp),
               Logger::debug);
    logger.log(fmt::format("   min_level = {}", _config.minLevel),
               Logger::debug);
    logger.log(fmt::format("   max_level = {}", _config.maxLevel),
               Logger::debug);
    logger.log(fmt::format("   hwmon_path = [{}]",
                           fmt::join(_source.getPaths(), ", ")),
               Logger::debug);

    logger.log("   Temperature:level mapping:", Logger::debug);
    for (size_t i = 0; i <= _curve.getSteps(); i++)
    {
        logger.log(fmt::format("   {}. [T:{:.1f}C - L:{}%]", i,
                               _curve.getStepTemp(i), _curve.getStepLevel(i)),
                   Logger::debug);
    }
}

nlohmann::json Zone::dump() const
{
    nlohmann::json data;
    data["name"] = getName();
    data["ipmi_zone"] = static_cast<int>(_config.ipmiZone);
    data["temp_calc"] = getAggregationName(_source.getAggregation());
    data["hwmon_path"] = _source.getPaths();
    data["steps"] = _config.steps;
    data["sensitivity"] = _config.sensitivity;
    data["polling"] = _config.polling.count();
    data["min_temp"] = _config.minTemp;
    data["max_temp"] = _config.maxTemp;
    data["min_level"] = _config.minLevel;
    data["max_level"] = _config.maxLevel;
    data["last_temp"] = _state.lastTemp;
    data["last_level"] = _state.lastLevel;
    if (_hook)
    {
        data["standby_guard"] = _hook->dump();
    }
    return data;
}

} // namespace smfc::control
