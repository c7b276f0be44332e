// SPDX-License-Identifier: LGPL-2.1-or-later

/**
 * @file
 * @brief Unit conversions for decoded report values
 */

#pragma once

namespace metgear
{

/**
 * Speed units a wind group may be reported in.
 */
enum class SpeedUnit {
    KNOTS,
    METERS_PER_SECOND,
    KILOMETERS_PER_HOUR
};

/**
 * Round half away from zero to @a decimals decimal places.
 */
double roundTo(double value, int decimals = 0);

/**
 * Wind speed in whole statute miles per hour.
 */
int speedToMph(double value, SpeedUnit unit);

/**
 * Four digit metric visibility in statute miles; one decimal up to
 * five miles, whole miles above.
 */
double metersToVisibilityMiles(double meters);

int celsiusToFahrenheit(int celsius);

int fahrenheitToCelsius(int fahrenheit);

/// whole hectopascals
int inHgToHPa(double inHg);

/// inches of mercury, two decimals
double hPaToInHg(int hPa);

} // namespace metgear
