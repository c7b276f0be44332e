// SPDX-License-Identifier: LGPL-2.1-or-later

/**
 * @file
 * @brief Humidity and apparent temperature indices
 */

#include <metgear_config.h>

#include "comfort.hxx"

#include <cmath>

namespace metgear
{

int relativeHumidity(int temperature_C, int dewpoint_C)
{
    const double t = temperature_C;
    const double d = dewpoint_C;
    return static_cast<int>(std::lround(100 * std::pow((112 - 0.1 * t + d) / (112 + 0.9 * t), 8)));
}

std::optional<int> heatIndex_F(int temperature_F, int humidity)
{
    if (temperature_F <= 79 || humidity <= 39)
        return std::nullopt;

    const double t = temperature_F;
    const double rh = humidity;
    double hi = -42.379 + 2.04901523 * t + 10.14333127 * rh - 0.22475541 * t * rh;
    hi += -0.00683783 * t * t - 0.05481717 * rh * rh;
    hi += 0.00122874 * t * t * rh + 0.00085282 * t * rh * rh;
    hi += -0.00000199 * t * t * rh * rh;
    return static_cast<int>(std::lround(hi));
}

std::optional<int> windChill_F(int temperature_F, int windSpeed_mph)
{
    if (temperature_F >= 51 || windSpeed_mph <= 3)
        return std::nullopt;

    const double t = temperature_F;
    const double v = std::pow(static_cast<double>(windSpeed_mph), 0.16);
    return static_cast<int>(std::lround(35.74 + 0.6215 * t - 35.75 * v + 0.4275 * t * v));
}

} // namespace metgear
