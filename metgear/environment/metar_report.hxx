// SPDX-License-Identifier: GPL-2.0-or-later

/**
 * @file
 * @brief Plain text rendering of a decoded observation.
 */

#pragma once

#include <ctime>
#include <optional>
#include <string>

#include <metgear/environment/metar.hxx>

/**
 * Renders an MGWeatherObservation for monospaced output, one
 * "label......value" line per reported property.
 */
class MGMetarReport
{
public:
    enum Property {
        AGE = 0,
        TEMPERATURE,
        WIND_CHILL,
        HEAT_INDEX,
        DEW_POINT,
        HUMIDITY,
        PRESSURE,
        WIND,
        VISIBILITY,
        CLOUDS,
        CONDITIONS,
        PROPERTY_COUNT
    };

    /**
     * @param obs the observation to render; must outlive the report
     * @param now reference time for the observation age, the current
     *            time if unset
     */
    explicit MGMetarReport(const MGWeatherObservation& obs,
                           std::optional<time_t> now = std::nullopt);

    static const char* getLabel(Property p);

    /// rendered value, empty if the property was not reported
    std::string getValue(Property p) const;

    /**
     * Every reported property in display order, each line padded with
     * dots to @a width columns.
     */
    std::string getDescription(int width = 30) const;

    /// "name => value" for every property, including empty ones
    std::string listProperties() const;

    /**
     * Pad @a label and @a value with dots to @a width columns. At least
     * two dots are always inserted.
     */
    static std::string formatLine(const std::string& label, const std::string& value, int width);

    /**
     * "N min" below 91 minutes, "h:mm hr" above.
     */
    static std::string formatAge(time_t observed, time_t now);

    static std::string formatTemperature(int fahrenheit);
    static std::string formatVisibility(const MGMetarVisibility& v);
    static std::string formatWind(const MGMetarWind& w);
    static std::string formatCloud(const MGMetarCloud& c);

private:
    const MGWeatherObservation& _obs;
    time_t _now;
};
