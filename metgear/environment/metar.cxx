// SPDX-License-Identifier: GPL-2.0-or-later
// SPDX-FileCopyrightText: 2003 Melchior Franz <mfranz@aon.at>

/**
 * @file
 * @brief Decoder for encoded Meteorological Aerodrome Reports (METAR).
 *
 * @see Federal Meteorological Handbook No. 1, chapter 12
 * (Coding of surface observations), for the group formats.
 */

#include <metgear_config.h>

#include "metar.hxx"

#include <cctype>
#include <algorithm>

#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/tokenizer.hpp>

#include <metgear/constants.h>
#include <metgear/debug/logstream.hxx>
#include <metgear/environment/comfort.hxx>
#include <metgear/environment/units.hxx>
#include <metgear/structure/exception.hxx>

using std::string;
using std::vector;

/**
 * Mutable state of one decoding run. Lives on the constructor's stack and
 * is never shared between reports.
 */
struct MGMetar::Session
{
    unsigned int tokenCursor = 1;   // the station id is consumed up front
    unsigned int groupCursor = 0;

    // whole mile of a mixed visibility ("1 1/4SM"), waiting for its fraction
    string pendingWholeMile;

    // present weather of all weather groups seen so far
    string conditions;
};


const MGMetar::Group MGMetar::_groups[] = {
    { "time",         &MGMetar::scanTime },
    { "station type", &MGMetar::scanStationType },
    { "wind",         &MGMetar::scanWind },
    { "variability",  &MGMetar::scanVariability },
    { "visibility",   &MGMetar::scanVisibility },
    { "runway",       &MGMetar::scanRwyVisRange },
    { "weather",      &MGMetar::scanWeather },
    { "sky",          &MGMetar::scanSkyCondition },
    { "temperature",  &MGMetar::scanTemperature },
    { "pressure",     &MGMetar::scanPressure },
};

const unsigned int MGMetar::_groupCount = sizeof(_groups) / sizeof(_groups[0]);


/**
 * The constructor takes a report string and decodes it completely.
 *
 * @param m        report text, e.g. "KTIK 121755Z 04009KT 10SM OVC037 01/M04 A3010"
 * @param observed observation time reported alongside the text, if any
 *
 * @par Examples:
 * @code
 * MGMetar m("KOKC 121752Z 18012G20KT 10SM SCT250 30/22 A2992");
 * std::optional<int> hi = m.getHeatIndex_F();
 * @endcode
 */
MGMetar::MGMetar(const string& m, std::optional<time_t> observed)
{
    typedef boost::tokenizer<boost::char_separator<char> > tokenizer;
    const boost::char_separator<char> del(" \t\r\n");

    tokenizer tok(m.begin(), m.end(), del);
    const vector<string> tokens(tok.begin(), tok.end());

    if (tokens.empty()) {
        MG_LOG(MG_ENVIRONMENT, MG_WARN, "metar: report is empty");
        throw mg_no_data_exception(MG_ORIGIN);
    }

    _id = tokens.front();
    _data = boost::algorithm::join(tokens, " ");
    _obs.observed = observed;

    Session s;
    while (s.groupCursor < _groupCount && s.tokenCursor < tokens.size()) {
        const Group& group = _groups[s.groupCursor];
        const string& grp = tokens[s.tokenCursor];

        MG_LOG(MG_ENVIRONMENT, MG_BULK, "metar " << group.name << ": " << grp);

        switch ((this->*group.scan)(grp, s)) {
        case SCAN_ABSENT:
            MG_LOG(MG_ENVIRONMENT, MG_DEBUG, "metar " << _id << ": no " << group.name << " group");
            s.groupCursor++;
            break;
        case SCAN_DONE:
            s.tokenCursor++;
            s.groupCursor++;
            break;
        case SCAN_REPEAT:
            s.tokenCursor++;
            break;
        case SCAN_CAVOK:
            s.tokenCursor++;
            s.groupCursor += 4;
            break;
        }
    }

    _unparsed.assign(tokens.begin() + s.tokenCursor, tokens.end());
    if (!_unparsed.empty()) {
        MG_LOG(MG_ENVIRONMENT, MG_INFO, "metar " << _id << ": not decoded: " << getUnparsedData());
    }
}


string MGMetar::getUnparsedData() const
{
    return boost::algorithm::join(_unparsed, " ");
}


static const char *azimuthName(double d)
{
    const char *dir[] = {
        "N", "NNE", "NE", "ENE",
        "E", "ESE", "SE", "SSE",
        "S", "SSW", "SW", "WSW",
        "W", "WNW", "NW", "NNW"
    };
    d += 11.25;
    while (d < 0)
        d += 360;
    while (d >= 360)
        d -= 360;
    return dir[int(d / 22.5)];
}


// read between min and max digits starting at pos; max == 0 means exactly min
static bool scanNumber(const string& s, string::size_type& pos, int& num, int min, int max = 0)
{
    if (max < min)
        max = min;

    string::size_type p = pos;
    int i, n = 0;
    for (i = 0; i < min; i++, p++) {
        if (p >= s.size() || !isdigit(static_cast<unsigned char>(s[p])))
            return false;
        n = n * 10 + s[p] - '0';
    }
    for (; i < max && p < s.size() && isdigit(static_cast<unsigned char>(s[p])); i++, p++)
        n = n * 10 + s[p] - '0';

    num = n;
    pos = p;
    return true;
}


static bool isDigits(const string& s)
{
    if (s.empty())
        return false;
    for (char c : s)
        if (!isdigit(static_cast<unsigned char>(c)))
            return false;
    return true;
}


struct Token {
    const char *id;
    const char *text;
};


static const Token *findToken(const string& id, const Token *list)
{
    for (int i = 0; list[i].id; i++)
        if (id == list[i].id)
            return &list[i];
    return nullptr;
}


// ddhhmmZ, the observation time itself is supplied with the report
MGMetar::ScanResult MGMetar::scanTime(const string& grp, Session&)
{
    if (!boost::ends_with(grp, "Z"))
        return SCAN_ABSENT;
    return SCAN_DONE;
}


// (AUTO|COR)
MGMetar::ScanResult MGMetar::scanStationType(const string& grp, Session&)
{
    if (grp != "AUTO" && grp != "COR")
        return SCAN_ABSENT;
    return SCAN_DONE;
}


// (\d{3}|VRB)\d{2,3}(G\d{2,3})?(KT|MPS|KMH)
MGMetar::ScanResult MGMetar::scanWind(const string& grp, Session&)
{
    string::size_type m = 0;
    int dir = -1;

    if (boost::starts_with(grp, "VRB"))
        m += 3;
    else if (!scanNumber(grp, m, dir, 3))
        return SCAN_ABSENT;

    int speed;
    if (!scanNumber(grp, m, speed, 2, 3))
        return SCAN_ABSENT;

    int gust = -1;
    if (m < grp.size() && grp[m] == 'G') {
        m++;
        if (!scanNumber(grp, m, gust, 2, 3))
            return SCAN_ABSENT;
    }

    const string unitName = grp.substr(m);
    metgear::SpeedUnit unit;
    if (unitName == "KT")
        unit = metgear::SpeedUnit::KNOTS;
    else if (unitName == "MPS")
        unit = metgear::SpeedUnit::METERS_PER_SECOND;
    else if (unitName == "KMH")
        unit = metgear::SpeedUnit::KILOMETERS_PER_HOUR;
    else
        return SCAN_ABSENT;

    MGMetarWind w;
    if (boost::starts_with(grp, "00000") && m == 5) {
        w._kind = MGMetarWind::CALM;
        w._compass = "calm";
        _obs.wind = w;
        return SCAN_DONE;
    }

    if (dir == -1) {
        w._kind = MGMetarWind::VARIABLE;
        w._compass = "varies";
    } else {
        w._kind = MGMetarWind::DIRECTIONAL;
        w._direction = dir;
        w._compass = azimuthName(dir);
    }
    w._speed_mph = metgear::speedToMph(speed, unit);
    if (gust != -1)
        w._gust_mph = metgear::speedToMph(gust, unit);

    _obs.wind = w;
    return SCAN_DONE;
}


// \d{3}V\d{3}
MGMetar::ScanResult MGMetar::scanVariability(const string& grp, Session&)
{
    string::size_type m = 0;
    int from, to;

    if (!scanNumber(grp, m, from, 3))
        return SCAN_ABSENT;
    if (m >= grp.size() || grp[m++] != 'V')
        return SCAN_ABSENT;
    if (!scanNumber(grp, m, to, 3) || m != grp.size())
        return SCAN_ABSENT;

    if (_obs.wind) {
        _obs.wind->_range_from = from;
        _obs.wind->_range_to = to;
    } else {
        MG_LOG(MG_ENVIRONMENT, MG_INFO, "metar " << _id << ": variable wind " << grp << " without wind group");
    }
    return SCAN_DONE;
}


// (\d{1,3}|\d{1,2}/\d{1,2}) as the numeric part of a statute mile group
static bool scanMiles(const string& s, double& miles)
{
    string::size_type m = 0;
    int n;
    if (!scanNumber(s, m, n, 1, 3))
        return false;
    miles = n;

    if (m < s.size() && s[m] == '/') {
        m++;
        int denom;
        if (!scanNumber(s, m, denom, 1, 2) || denom == 0)
            return false;
        miles /= denom;
    }
    return m == s.size();
}


// CAVOK
// \d                           whole mile, the fraction follows
// [MP]?(\d{1,3}|\d{1,2}/\d{1,2})SM
// .*KM                         not supported, dropped
// \d{4}                        meters
MGMetar::ScanResult MGMetar::scanVisibility(const string& grp, Session& s)
{
    MGMetarVisibility v;

    if (grp == "CAVOK") {
        v._modifier = MGMetarVisibility::AT_LEAST;
        v._distance = MG_CAVOK_VISIBILITY_SM;
        _obs.visibility = v;

        s.conditions.clear();
        _obs.conditions = string();
        _obs.weather.clear();

        MGMetarCloud cl;
        cl._coverage = MGMetarCloud::COVERAGE_CLEAR;
        cl._description = "clear skies";
        _obs.cloud = cl;
        return SCAN_CAVOK;
    }

    if (grp.size() == 1 && isdigit(static_cast<unsigned char>(grp[0]))) {
        s.pendingWholeMile = grp;
        return SCAN_REPEAT;
    }

    if (boost::ends_with(grp, "SM")) {
        string num = grp.substr(0, grp.size() - 2);
        if (boost::starts_with(num, "M")) {
            v._modifier = MGMetarVisibility::AT_MOST;
            num.erase(0, 1);
        } else if (boost::starts_with(num, "P")) {
            v._modifier = MGMetarVisibility::AT_LEAST;
            num.erase(0, 1);
        }

        double miles;
        if (!scanMiles(num, miles))
            return SCAN_ABSENT;

        if (!s.pendingWholeMile.empty()) {
            miles += s.pendingWholeMile[0] - '0';
            s.pendingWholeMile.clear();
        }

        v._distance = miles;
        _obs.visibility = v;
        return SCAN_DONE;
    }

    if (boost::ends_with(grp, "KM")) {
        MG_LOG(MG_ENVIRONMENT, MG_INFO, "metar " << _id << ": kilometer visibility " << grp << " ignored");
        return SCAN_DONE;
    }

    if (grp.size() == 4 && isDigits(grp)) {
        v._distance = metgear::metersToVisibilityMiles(std::stoi(grp));
        _obs.visibility = v;
        return SCAN_DONE;
    }

    return SCAN_ABSENT;
}


// R\d{1,3}.*
MGMetar::ScanResult MGMetar::scanRwyVisRange(const string& grp, Session&)
{
    string::size_type m = 1;
    int rwy;
    if (grp.empty() || grp[0] != 'R' || !scanNumber(grp, m, rwy, 1, 3))
        return SCAN_ABSENT;

    MG_LOG(MG_ENVIRONMENT, MG_DEBUG, "metar " << _id << ": runway group " << grp << " skipped");
    return SCAN_REPEAT;
}


static const Token description[] = {
    { "MI", "shallow" },
    { "PR", "partial" },
    { "BC", "patches of" },
    { "DR", "low drifting" },
    { "BL", "blowing" },
    { "SH", "showers" },
    { "TS", "thunderstorm" },
    { "FZ", "freezing" },
    { 0, 0 }
};


static const Token phenomenon[] = {
    { "DZ", "drizzle" },
    { "RA", "rain" },
    { "SN", "snow" },
    { "SG", "snow grains" },
    { "IC", "ice crystals" },
    { "PE", "ice pellets" },
    { "PL", "ice pellets" },
    { "GR", "hail" },
    { "GS", "small hail" },
    { "UP", "unknown" },
    { "BR", "mist" },
    { "FG", "fog" },
    { "FU", "smoke" },
    { "VA", "volcanic ash" },
    { "DU", "widespread dust" },
    { "SA", "sand" },
    { "HZ", "haze" },
    { "PY", "spray" },
    { "PO", "dust whirls" },
    { "SQ", "squalls" },
    { "FC", "tornado" },
    { "SS", "duststorm" },
    { "DS", "duststorm" },
    { 0, 0 }
};


static const Token *weatherToken(const string& code)
{
    const Token *a = findToken(code, description);
    return a ? a : findToken(code, phenomenon);
}


// (-|+|VC)?(MI|PR|BC|DR|BL|SH|TS|FZ|DZ|RA|SN|SG|IC|PE|PL|GR|GS|UP|BR|FG|FU|VA|DU|SA|HZ|PY|PO|SQ|FC|SS|DS)+
MGMetar::ScanResult MGMetar::scanWeather(const string& grp, Session& s)
{
    MGMetarWeather w;
    string::size_type m = 0;
    string pre;

    if (boost::starts_with(grp, "-"))
        m++, pre = "light ", w._intensity = MGMetarWeather::LIGHT;
    else if (boost::starts_with(grp, "+"))
        m++, pre = "heavy ", w._intensity = MGMetarWeather::HEAVY;
    else if (boost::starts_with(grp, "VC"))
        m += 2, pre = "nearby ", w._vicinity = true;

    if (m >= grp.size() || (grp.size() - m) % 2)
        return SCAN_ABSENT;

    for (; m < grp.size(); m += 2) {
        const string code = grp.substr(m, 2);
        if (!weatherToken(code))
            return SCAN_ABSENT;
        w._phenomena.push_back(code);
    }

    // "SHRA" reads "rain showers"
    vector<string> order = w._phenomena;
    if (order.size() > 1 && order[0] == "SH")
        std::swap(order[0], order[1]);

    string weather;
    for (const auto& code : order) {
        if (!weather.empty())
            weather += ' ';
        weather += weatherToken(code)->text;
    }
    w._description = pre + weather;

    if (!s.conditions.empty())
        s.conditions += " & ";
    s.conditions += w._description;

    _obs.conditions = s.conditions;
    _obs.weather.push_back(w);
    return SCAN_REPEAT;
}


struct CloudToken {
    const char *id;
    const char *text;
    MGMetarCloud::Coverage coverage;
};

static const CloudToken cloud_cover[] = {
    { "SKC", "clear",               MGMetarCloud::COVERAGE_CLEAR },
    { "CLR", "clear",               MGMetarCloud::COVERAGE_CLEAR },
    { "FEW", "partly cloudy",       MGMetarCloud::COVERAGE_FEW },
    { "SCT", "scattered clouds",    MGMetarCloud::COVERAGE_SCATTERED },
    { "BKN", "mostly cloudy",       MGMetarCloud::COVERAGE_BROKEN },
    { "OVC", "overcast",            MGMetarCloud::COVERAGE_OVERCAST },
    { "VV",  "vertical visibility", MGMetarCloud::COVERAGE_VERTICAL_VISIBILITY },
    { 0, 0, MGMetarCloud::COVERAGE_CLEAR }
};


static const CloudToken *findCloudToken(const string& id)
{
    for (int i = 0; cloud_cover[i].id; i++)
        if (id == cloud_cover[i].id)
            return &cloud_cover[i];
    return nullptr;
}


// (SKC|CLR)
// (FEW|SCT|BKN|OVC|VV)\d{3}.*      cloud type suffixes (CB, TCU) are ignored
MGMetar::ScanResult MGMetar::scanSkyCondition(const string& grp, Session&)
{
    MGMetarCloud cl;
    const CloudToken *a;

    if (grp == "SKC" || grp == "CLR") {
        a = findCloudToken(grp);
        cl._coverage = a->coverage;
        cl._description = a->text;
        _obs.cloud = cl;
        return SCAN_DONE;
    }

    string::size_type i = 0;
    while (i < grp.size() && i < 3 && isupper(static_cast<unsigned char>(grp[i])))
        i++;
    if (i < 2)
        return SCAN_ABSENT;

    string::size_type m = i;
    int altitude;
    if (!scanNumber(grp, m, altitude, 3))
        return SCAN_ABSENT;
    if (!(a = findCloudToken(grp.substr(0, i))) || a->coverage == MGMetarCloud::COVERAGE_CLEAR)
        return SCAN_ABSENT;

    cl._coverage = a->coverage;
    cl._description = a->text;
    if (cl._coverage == MGMetarCloud::COVERAGE_VERTICAL_VISIBILITY)
        cl._altitude_ft = altitude * 100;

    // only the last layer is kept
    _obs.cloud = cl;
    return SCAN_REPEAT;
}


// M?\d{2}
static bool scanCelsius(const string& s, string::size_type& m, int& temp)
{
    int sign = 1;
    if (m < s.size() && s[m] == 'M')
        m++, sign = -1;
    if (!scanNumber(s, m, temp, 2))
        return false;
    temp *= sign;
    return true;
}


// M?\d{2}/(M?\d{2}|XX)?
MGMetar::ScanResult MGMetar::scanTemperature(const string& grp, Session&)
{
    string::size_type m = 0;
    int temp, dew;
    bool haveDew = false;

    if (!scanCelsius(grp, m, temp))
        return SCAN_ABSENT;
    if (m >= grp.size() || grp[m++] != '/')
        return SCAN_ABSENT;

    if (grp.compare(m, string::npos, "XX") == 0)
        m += 2;
    else if (m < grp.size()) {
        if (!scanCelsius(grp, m, dew))
            return SCAN_ABSENT;
        haveDew = true;
    }
    if (m != grp.size())
        return SCAN_ABSENT;

    const int tempF = metgear::celsiusToFahrenheit(temp);
    _obs.temperature_C = temp;
    _obs.temperature_F = tempF;

    if (_obs.wind && _obs.wind->getKind() != MGMetarWind::CALM && _obs.wind->getSpeed_mph()) {
        _obs.windChill_F = metgear::windChill_F(tempF, *_obs.wind->getSpeed_mph());
        if (_obs.windChill_F)
            _obs.windChill_C = metgear::fahrenheitToCelsius(*_obs.windChill_F);
    }

    if (haveDew) {
        const int rh = metgear::relativeHumidity(temp, dew);
        _obs.dewpoint_C = dew;
        _obs.dewpoint_F = metgear::celsiusToFahrenheit(dew);
        _obs.humidity = rh;
        _obs.heatIndex_F = metgear::heatIndex_F(tempF, rh);
        if (_obs.heatIndex_F)
            _obs.heatIndex_C = metgear::fahrenheitToCelsius(*_obs.heatIndex_F);
    }
    return SCAN_DONE;
}


// [AQ]\d{4}
MGMetar::ScanResult MGMetar::scanPressure(const string& grp, Session&)
{
    string::size_type m = 1;
    int press;

    if (grp.empty() || (grp[0] != 'A' && grp[0] != 'Q'))
        return SCAN_ABSENT;
    if (!scanNumber(grp, m, press, 4))
        return SCAN_ABSENT;

    if (grp[0] == 'A') {
        _obs.pressure_inHg = press / 100.0;
        _obs.pressure_hPa = metgear::inHgToHPa(press / 100.0);
    } else {
        _obs.pressure_hPa = press;
        _obs.pressure_inHg = metgear::hPaToInHg(press);
    }
    return SCAN_DONE;
}


bool MGMetarWind::operator==(const MGMetarWind& w) const
{
    return _kind == w._kind
        && _direction == w._direction
        && _compass == w._compass
        && _speed_mph == w._speed_mph
        && _gust_mph == w._gust_mph
        && _range_from == w._range_from
        && _range_to == w._range_to;
}

bool MGMetarVisibility::operator==(const MGMetarVisibility& v) const
{
    return _modifier == v._modifier && _distance == v._distance;
}

bool MGMetarWeather::operator==(const MGMetarWeather& w) const
{
    return _intensity == w._intensity
        && _vicinity == w._vicinity
        && _phenomena == w._phenomena
        && _description == w._description;
}

bool MGMetarCloud::operator==(const MGMetarCloud& c) const
{
    return _coverage == c._coverage
        && _description == c._description
        && _altitude_ft == c._altitude_ft;
}

bool MGWeatherObservation::operator==(const MGWeatherObservation& o) const
{
    return observed == o.observed
        && wind == o.wind
        && visibility == o.visibility
        && conditions == o.conditions
        && weather == o.weather
        && cloud == o.cloud
        && temperature_C == o.temperature_C
        && temperature_F == o.temperature_F
        && dewpoint_C == o.dewpoint_C
        && dewpoint_F == o.dewpoint_F
        && humidity == o.humidity
        && heatIndex_F == o.heatIndex_F
        && heatIndex_C == o.heatIndex_C
        && windChill_F == o.windChill_F
        && windChill_C == o.windChill_C
        && pressure_inHg == o.pressure_inHg
        && pressure_hPa == o.pressure_hPa;
}
