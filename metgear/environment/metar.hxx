// SPDX-License-Identifier: GPL-2.0-or-later
// SPDX-FileCopyrightText: 2003 Melchior Franz <mfranz@aon.at>

/**
 * @file
 * @brief Decoder for encoded Meteorological Aerodrome Reports (METAR).
 */

#pragma once

#include <ctime>
#include <optional>
#include <string>
#include <vector>

class MGMetar;

/**
 * Surface wind as reported by the wind group (dddssGggKT).
 */
class MGMetarWind
{
public:
    enum Kind {
        CALM,
        VARIABLE,
        DIRECTIONAL
    };

    Kind getKind() const { return _kind; }

    /// direction the wind blows from in degrees, -1 unless DIRECTIONAL
    int getDirection() const { return _direction; }

    /// 16-point compass name, "varies" or "calm"
    const std::string& getCompass() const { return _compass; }

    /// empty for calm wind
    std::optional<int> getSpeed_mph() const { return _speed_mph; }
    std::optional<int> getGust_mph() const { return _gust_mph; }

    /// direction range from a variable wind group (fffVttt), degrees
    std::optional<int> getRangeFrom() const { return _range_from; }
    std::optional<int> getRangeTo() const { return _range_to; }

    bool operator==(const MGMetarWind& w) const;
    bool operator!=(const MGMetarWind& w) const { return !(*this == w); }

protected:
    Kind _kind = CALM;
    int _direction = -1;
    std::string _compass;
    std::optional<int> _speed_mph;
    std::optional<int> _gust_mph;
    std::optional<int> _range_from;
    std::optional<int> _range_to;

    friend class MGMetar;
};


/**
 * Prevailing visibility. The value is always in statute miles; how the
 * modifier is shown is up to the presentation.
 */
class MGMetarVisibility
{
public:
    enum Modifier {
        EQUALS,
        AT_LEAST,
        AT_MOST
    };

    Modifier getModifier() const { return _modifier; }
    double getVisibility_sm() const { return _distance; }

    bool operator==(const MGMetarVisibility& v) const;
    bool operator!=(const MGMetarVisibility& v) const { return !(*this == v); }

protected:
    Modifier _modifier = EQUALS;
    double _distance = 0.0;

    friend class MGMetar;
};


/**
 * One present weather group, e.g. "-SHRA".
 */
class MGMetarWeather
{
public:
    enum Intensity {
        LIGHT,
        MODERATE,
        HEAVY
    };

    Intensity getIntensity() const { return _intensity; }
    bool getVicinity() const { return _vicinity; }

    /// two letter codes in report order, without intensity or "VC"
    const std::vector<std::string>& getPhenomena() const { return _phenomena; }

    /// plain language, e.g. "light rain showers"
    const std::string& getDescription() const { return _description; }

    bool operator==(const MGMetarWeather& w) const;
    bool operator!=(const MGMetarWeather& w) const { return !(*this == w); }

protected:
    Intensity _intensity = MODERATE;
    bool _vicinity = false;
    std::vector<std::string> _phenomena;
    std::string _description;

    friend class MGMetar;
};


/**
 * A cloud layer or vertical visibility group.
 */
class MGMetarCloud
{
public:
    enum Coverage {
        COVERAGE_CLEAR = 0,
        COVERAGE_FEW = 1,
        COVERAGE_SCATTERED = 2,
        COVERAGE_BROKEN = 3,
        COVERAGE_OVERCAST = 4,
        COVERAGE_VERTICAL_VISIBILITY = 5
    };

    Coverage getCoverage() const { return _coverage; }
    const std::string& getDescription() const { return _description; }

    /// only set for vertical visibility (VVnnn)
    std::optional<int> getAltitude_ft() const { return _altitude_ft; }

    bool operator==(const MGMetarCloud& c) const;
    bool operator!=(const MGMetarCloud& c) const { return !(*this == c); }

protected:
    Coverage _coverage = COVERAGE_CLEAR;
    std::string _description;
    std::optional<int> _altitude_ft;

    friend class MGMetar;
};


/**
 * The decoded observation. Every field is optional; an empty field means
 * the group was not reported.
 */
struct MGWeatherObservation
{
    /// observation instant supplied alongside the report (UNIX time)
    std::optional<time_t> observed;

    std::optional<MGMetarWind> wind;
    std::optional<MGMetarVisibility> visibility;

    /// all present weather groups joined by " & "; empty after CAVOK
    std::optional<std::string> conditions;
    std::vector<MGMetarWeather> weather;

    /// last reported layer only
    std::optional<MGMetarCloud> cloud;

    std::optional<int> temperature_C;
    std::optional<int> temperature_F;
    std::optional<int> dewpoint_C;
    std::optional<int> dewpoint_F;
    std::optional<int> humidity;
    std::optional<int> heatIndex_F;
    std::optional<int> heatIndex_C;
    std::optional<int> windChill_F;
    std::optional<int> windChill_C;

    std::optional<double> pressure_inHg;
    std::optional<int> pressure_hPa;

    bool operator==(const MGWeatherObservation& o) const;
    bool operator!=(const MGWeatherObservation& o) const { return !(*this == o); }
};


/**
 * Decodes a report such as
 * "KTIK 121755Z AUTO 04009KT 10SM OVC037 01/M04 A3010 RMK AO2".
 *
 * The groups are tried in their fixed order (time, station type, wind,
 * variable wind, visibility, runway, present weather, sky condition,
 * temperature, altimeter). A group that does not match is skipped, a
 * group that never matches is simply not reported. Decoding stops at the
 * end of that sequence; anything after it (remarks) is kept as unparsed
 * data.
 *
 * The constructor throws mg_no_data_exception for an empty report; no
 * other condition raises.
 */
class MGMetar
{
public:
    /**
     * @param m        report text, station id first
     * @param observed observation instant from the source that delivered
     *                 the report, if it supplied one
     */
    explicit MGMetar(const std::string& m, std::optional<time_t> observed = std::nullopt);

    const MGWeatherObservation& getObservation() const { return _obs; }

    /// the station identifier (first group)
    const std::string& getId() const { return _id; }

    /// the report with whitespace normalized to single spaces
    const std::string& getData() const { return _data; }

    /// groups following the decoded sequence, space separated
    std::string getUnparsedData() const;

    const std::optional<MGMetarWind>& getWind() const { return _obs.wind; }
    const std::optional<MGMetarVisibility>& getVisibility() const { return _obs.visibility; }
    const std::optional<std::string>& getConditions() const { return _obs.conditions; }
    const std::vector<MGMetarWeather>& getWeather() const { return _obs.weather; }
    const std::optional<MGMetarCloud>& getCloud() const { return _obs.cloud; }

    std::optional<int> getTemperature_C() const { return _obs.temperature_C; }
    std::optional<int> getTemperature_F() const { return _obs.temperature_F; }
    std::optional<int> getDewpoint_C() const { return _obs.dewpoint_C; }
    std::optional<int> getDewpoint_F() const { return _obs.dewpoint_F; }
    std::optional<int> getRelHumidity() const { return _obs.humidity; }
    std::optional<int> getHeatIndex_F() const { return _obs.heatIndex_F; }
    std::optional<int> getHeatIndex_C() const { return _obs.heatIndex_C; }
    std::optional<int> getWindChill_F() const { return _obs.windChill_F; }
    std::optional<int> getWindChill_C() const { return _obs.windChill_C; }
    std::optional<double> getPressure_inHg() const { return _obs.pressure_inHg; }
    std::optional<int> getPressure_hPa() const { return _obs.pressure_hPa; }

private:
    struct Session;

    enum ScanResult {
        SCAN_ABSENT,    ///< no match, try the next group kind on the same token
        SCAN_DONE,      ///< token consumed, continue with the next group kind
        SCAN_REPEAT,    ///< token consumed, try the same group kind again
        SCAN_CAVOK      ///< token consumed, skip runway, weather and sky
    };

    typedef ScanResult (MGMetar::*Scanner)(const std::string& grp, Session& s);

    struct Group {
        const char* name;
        Scanner scan;
    };

    static const Group _groups[];
    static const unsigned int _groupCount;

    ScanResult scanTime(const std::string& grp, Session& s);
    ScanResult scanStationType(const std::string& grp, Session& s);
    ScanResult scanWind(const std::string& grp, Session& s);
    ScanResult scanVariability(const std::string& grp, Session& s);
    ScanResult scanVisibility(const std::string& grp, Session& s);
    ScanResult scanRwyVisRange(const std::string& grp, Session& s);
    ScanResult scanWeather(const std::string& grp, Session& s);
    ScanResult scanSkyCondition(const std::string& grp, Session& s);
    ScanResult scanTemperature(const std::string& grp, Session& s);
    ScanResult scanPressure(const std::string& grp, Session& s);

    std::string _id;
    std::string _data;
    std::vector<std::string> _unparsed;
    MGWeatherObservation _obs;
};
