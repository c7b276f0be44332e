// SPDX-License-Identifier: GPL-2.0-or-later

/**
 * @file
 * @brief Plain text rendering of a decoded observation.
 */

#include <metgear_config.h>

#include "metar_report.hxx"

#include <cmath>
#include <iomanip>
#include <sstream>

#include <boost/algorithm/string/trim.hpp>

#include <metgear/environment/units.hxx>

using std::string;

static const char* labels[MGMetarReport::PROPERTY_COUNT] = {
    "Age",
    "Temperature",
    "Wind Chill",
    "Heat Index",
    "Dew Point",
    "Humidity",
    "Pressure",
    "Wind",
    "Visibility",
    "Sky",
    "Wx"
};

// the names used by listProperties()
static const char* names[MGMetarReport::PROPERTY_COUNT] = {
    "age",
    "temperature",
    "windchill",
    "heatindex",
    "dewpoint",
    "humidity",
    "pressure",
    "wind",
    "visibility",
    "clouds",
    "conditions"
};


// number of columns taken by an UTF-8 string
static int displayWidth(const string& s)
{
    int n = 0;
    for (unsigned char c : s)
        if ((c & 0xc0) != 0x80)
            n++;
    return n;
}


MGMetarReport::MGMetarReport(const MGWeatherObservation& obs, std::optional<time_t> now) :
    _obs(obs),
    _now(now ? *now : time(nullptr))
{
}

const char* MGMetarReport::getLabel(Property p)
{
    return (p >= 0 && p < PROPERTY_COUNT) ? labels[p] : "";
}

string MGMetarReport::getValue(Property p) const
{
    std::ostringstream out;

    switch (p) {
    case AGE:
        if (_obs.observed)
            out << formatAge(*_obs.observed, _now);
        break;
    case TEMPERATURE:
        if (_obs.temperature_F)
            out << formatTemperature(*_obs.temperature_F);
        break;
    case WIND_CHILL:
        if (_obs.windChill_F)
            out << formatTemperature(*_obs.windChill_F);
        break;
    case HEAT_INDEX:
        if (_obs.heatIndex_F)
            out << formatTemperature(*_obs.heatIndex_F);
        break;
    case DEW_POINT:
        if (_obs.dewpoint_F)
            out << formatTemperature(*_obs.dewpoint_F);
        break;
    case HUMIDITY:
        if (_obs.humidity)
            out << *_obs.humidity << '%';
        break;
    case PRESSURE:
        if (_obs.pressure_inHg)
            out << std::fixed << std::setprecision(2) << *_obs.pressure_inHg << " in";
        break;
    case WIND:
        if (_obs.wind)
            out << formatWind(*_obs.wind);
        break;
    case VISIBILITY:
        if (_obs.visibility)
            out << formatVisibility(*_obs.visibility);
        break;
    case CLOUDS:
        if (_obs.cloud)
            out << formatCloud(*_obs.cloud);
        break;
    case CONDITIONS:
        if (_obs.conditions)
            out << *_obs.conditions;
        break;
    default:
        break;
    }
    return out.str();
}

string MGMetarReport::getDescription(int width) const
{
    string out;
    for (int i = 0; i < PROPERTY_COUNT; i++) {
        string value = boost::trim_copy(getValue(static_cast<Property>(i)));
        if (value.empty())
            continue;
        out += formatLine(labels[i], value, width);
        out += '\n';
    }
    return out;
}

string MGMetarReport::listProperties() const
{
    std::ostringstream out;
    if (_obs.observed) {
        char buf[64];
        struct tm t;
        const time_t observed = *_obs.observed;
#ifdef _WIN32
        t = *localtime(&observed);
#else
        localtime_r(&observed, &t);
#endif
        strftime(buf, sizeof(buf), "%a %b %e, %H:%M %Z", &t);
        out << "observed => " << buf << "\n";
    } else {
        out << "observed => \n";
    }

    for (int i = 0; i < PROPERTY_COUNT; i++)
        out << names[i] << " => " << getValue(static_cast<Property>(i)) << "\n";
    return out.str();
}

string MGMetarReport::formatLine(const string& label, const string& value, int width)
{
    int pad = width - displayWidth(label) - displayWidth(value);
    if (pad <= 0)
        pad = 2;
    return label + string(pad, '.') + value;
}

string MGMetarReport::formatAge(time_t observed, time_t now)
{
    const long minutes = static_cast<long>(std::floor(std::difftime(now, observed) / 60.0));
    std::ostringstream out;
    if (minutes < 91) {
        out << minutes << " min";
    } else {
        out << minutes / 60 << ':' << std::setw(2) << std::setfill('0') << minutes % 60 << " hr";
    }
    return out.str();
}

string MGMetarReport::formatTemperature(int fahrenheit)
{
    return std::to_string(fahrenheit) + "°F";
}

string MGMetarReport::formatVisibility(const MGMetarVisibility& v)
{
    std::ostringstream out;
    if (v.getModifier() == MGMetarVisibility::AT_LEAST)
        out << '>';
    else if (v.getModifier() == MGMetarVisibility::AT_MOST)
        out << '<';
    out << metgear::roundTo(v.getVisibility_sm(), 2) << " mi";
    return out.str();
}

string MGMetarReport::formatWind(const MGMetarWind& w)
{
    if (w.getKind() == MGMetarWind::CALM || !w.getSpeed_mph())
        return w.getCompass();

    std::ostringstream out;
    out << w.getCompass() << ' ' << *w.getSpeed_mph();
    if (w.getGust_mph())
        out << '/' << *w.getGust_mph();
    out << " mph";
    return out.str();
}

string MGMetarReport::formatCloud(const MGMetarCloud& c)
{
    if (c.getCoverage() == MGMetarCloud::COVERAGE_VERTICAL_VISIBILITY && c.getAltitude_ft())
        return "VV " + std::to_string(*c.getAltitude_ft()) + " ft";
    return c.getDescription();
}
