// SPDX-License-Identifier: LGPL-2.1-or-later

/**
 * @file
 * @brief Humidity and apparent temperature indices
 */

#pragma once

#include <optional>

namespace metgear
{

/**
 * Relative humidity in whole percent from air temperature and dew point
 * (both degree Celsius).
 */
int relativeHumidity(int temperature_C, int dewpoint_C);

/**
 * Heat index (Rothfusz regression) in whole degree Fahrenheit.
 *
 * Only defined above 79 F and 39 % relative humidity; empty otherwise.
 */
std::optional<int> heatIndex_F(int temperature_F, int humidity);

/**
 * Wind chill temperature in whole degree Fahrenheit.
 *
 * Only defined below 51 F with more than 3 mph of wind; empty otherwise.
 * Gusts are not considered.
 */
std::optional<int> windChill_F(int temperature_F, int windSpeed_mph);

} // namespace metgear
