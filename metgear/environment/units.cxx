// SPDX-License-Identifier: LGPL-2.1-or-later

/**
 * @file
 * @brief Unit conversions for decoded report values
 */

#include <metgear_config.h>

#include "units.hxx"

#include <cmath>

#include <metgear/constants.h>

namespace metgear
{

double roundTo(double value, int decimals)
{
    const double f = std::pow(10.0, decimals);
    return std::round(value * f) / f;
}

int speedToMph(double value, SpeedUnit unit)
{
    double factor;
    switch (unit) {
    case SpeedUnit::KNOTS:
        factor = MG_KT_TO_MPH;
        break;
    case SpeedUnit::METERS_PER_SECOND:
        factor = MG_MPS_TO_MPH;
        break;
    default:
        factor = MG_KMH_TO_MPH;
        break;
    }
    return static_cast<int>(std::lround(value * factor));
}

double metersToVisibilityMiles(double meters)
{
    double miles = roundTo(meters / MG_VIS_METER_DIVISOR, 1);
    if (miles > 5)
        miles = roundTo(miles);
    return miles;
}

int celsiusToFahrenheit(int celsius)
{
    return static_cast<int>(std::lround(1.8 * celsius + 32));
}

int fahrenheitToCelsius(int fahrenheit)
{
    return static_cast<int>(std::lround((fahrenheit - 32) / 1.8));
}

int inHgToHPa(double inHg)
{
    return static_cast<int>(std::lround(inHg / MG_HPA_TO_INHG));
}

double hPaToInHg(int hPa)
{
    return roundTo(MG_HPA_TO_INHG * hPa, 2);
}

} // namespace metgear
