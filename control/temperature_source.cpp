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
#include "temperature_source.hpp"

#include "errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <charconv>
#include <fstream>
#include <numeric>
#include <stdexcept>

namespace smfc::control
{

std::string getAggregationName(Aggregation calc)
{
    switch (calc)
    {
        case Aggregation::single:
            return "single";
        case Aggregation::min:
            return "min";
        case Aggregation::avg:
            return "avg";
        case Aggregation::max:
            return "max";
    }
    return "unknown";
}

int64_t SysfsSensor::read(const std::string& path)
{
    std::ifstream file{path};
    if (!file)
    {
        throw IOError(fmt::format("Cannot read file ({}).", path));
    }

    std::string content;
    file >> content;
    if (file.bad() || content.empty())
    {
        throw IOError(fmt::format("Cannot read file ({}).", path));
    }

    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(content.data(),
                                     content.data() + content.size(), value);
    if ((ec != std::errc{}) || (ptr != content.data() + content.size()))
    {
        throw IOError(
            fmt::format("Invalid temperature value ({}) in {}", content, path));
    }

    return value;
}

double aggregate(const std::vector<double>& values, Aggregation calc)
{
    if (values.empty())
    {
        throw std::invalid_argument("No temperature values to aggregate");
    }

    switch (calc)
    {
        case Aggregation::min:
            return *std::min_element(values.begin(), values.end());
        case Aggregation::max:
            return *std::max_element(values.begin(), values.end());
        case Aggregation::avg:
            return std::accumulate(values.begin(), values.end(), 0.0) /
                   values.size();
        case Aggregation::single:
            break;
    }
    return values.front();
}

TemperatureSource::TemperatureSource(std::vector<std::string> paths,
                                     Aggregation calc,
                                     std::shared_ptr<SensorInterface> sensors) :
    _paths(std::move(paths)),
    _calc((_paths.size() == 1) ? Aggregation::single : calc),
    _sensors(std::move(sensors))
{
    if (_paths.empty())
    {
        throw ConfigurationError("No temperature sensor configured");
    }
}

double TemperatureSource::read() const
{
    if (_calc == Aggregation::single)
    {
        return _sensors->read(_paths.front()) / rawScale;
    }

    std::vector<double> values;
    values.reserve(_paths.size());
    for (const auto& path : _paths)
    {
        values.push_back(_sensors->read(path) / rawScale);
    }

    return aggregate(values, _calc);
}

} // namespace smfc::control
