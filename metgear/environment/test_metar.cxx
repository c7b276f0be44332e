// SPDX-License-Identifier: LGPL-2.1-or-later

#include <metgear_config.h>

#include <metgear/misc/test_macros.hxx>

#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include <boost/algorithm/string/predicate.hpp>

#include <metgear/debug/BufferedLogCallback.hxx>
#include <metgear/debug/logstream.hxx>
#include <metgear/structure/exception.hxx>

#include "metar.hxx"


const double TEST_EPSILON = 1e-9;

void test_basic()
{
    MGMetar m1("KTIK 121755Z AUTO 04009KT 10SM OVC037 01/M04 A3010 RMK AO2");
    MG_CHECK_EQUAL(m1.getId(), "KTIK");

    MG_VERIFY(m1.getWind());
    MG_CHECK_EQUAL(m1.getWind()->getKind(), MGMetarWind::DIRECTIONAL);
    MG_CHECK_EQUAL(m1.getWind()->getDirection(), 40);
    MG_CHECK_EQUAL(m1.getWind()->getCompass(), "NE");
    MG_CHECK_EQUAL(*m1.getWind()->getSpeed_mph(), 10);
    MG_VERIFY(!m1.getWind()->getGust_mph());

    MG_VERIFY(m1.getVisibility());
    MG_CHECK_EQUAL(m1.getVisibility()->getModifier(), MGMetarVisibility::EQUALS);
    MG_CHECK_EQUAL_EP2(m1.getVisibility()->getVisibility_sm(), 10.0, TEST_EPSILON);

    MG_VERIFY(!m1.getConditions());
    MG_VERIFY(m1.getWeather().empty());

    MG_VERIFY(m1.getCloud());
    MG_CHECK_EQUAL(m1.getCloud()->getCoverage(), MGMetarCloud::COVERAGE_OVERCAST);
    MG_CHECK_EQUAL(m1.getCloud()->getDescription(), "overcast");
    MG_VERIFY(!m1.getCloud()->getAltitude_ft());

    MG_CHECK_EQUAL(*m1.getTemperature_C(), 1);
    MG_CHECK_EQUAL(*m1.getTemperature_F(), 34);
    MG_CHECK_EQUAL(*m1.getDewpoint_C(), -4);
    MG_CHECK_EQUAL(*m1.getDewpoint_F(), 25);
    MG_CHECK_EQUAL(*m1.getRelHumidity(), 70);
    MG_VERIFY(!m1.getHeatIndex_F());
    MG_VERIFY(!m1.getHeatIndex_C());
    MG_CHECK_EQUAL(*m1.getWindChill_F(), 26);
    MG_CHECK_EQUAL(*m1.getWindChill_C(), -3);

    MG_CHECK_EQUAL_EP2(*m1.getPressure_inHg(), 30.10, TEST_EPSILON);
    MG_CHECK_EQUAL(*m1.getPressure_hPa(), 1019);

    MG_CHECK_EQUAL(m1.getUnparsedData(), "RMK AO2");
    MG_VERIFY(!m1.getObservation().observed);

    // metric visibility, vertical visibility and QNH
    MGMetar m2("EGLL 121750Z 24010KT 0400 FG VV002 05/04 Q1013");
    MG_CHECK_EQUAL(m2.getWind()->getCompass(), "WSW");
    MG_CHECK_EQUAL(*m2.getWind()->getSpeed_mph(), 12);
    MG_CHECK_EQUAL_EP2(m2.getVisibility()->getVisibility_sm(), 0.6, TEST_EPSILON);
    MG_CHECK_EQUAL(*m2.getConditions(), "fog");
    MG_CHECK_EQUAL(m2.getCloud()->getCoverage(), MGMetarCloud::COVERAGE_VERTICAL_VISIBILITY);
    MG_CHECK_EQUAL(m2.getCloud()->getDescription(), "vertical visibility");
    MG_CHECK_EQUAL(*m2.getCloud()->getAltitude_ft(), 200);
    MG_CHECK_EQUAL(*m2.getTemperature_F(), 41);
    MG_CHECK_EQUAL(*m2.getDewpoint_F(), 39);
    MG_CHECK_EQUAL(*m2.getRelHumidity(), 93);
    MG_CHECK_EQUAL(*m2.getWindChill_F(), 34);
    MG_CHECK_EQUAL(*m2.getPressure_hPa(), 1013);
    MG_CHECK_EQUAL_EP2(*m2.getPressure_inHg(), 29.91, TEST_EPSILON);
    MG_CHECK_EQUAL(m2.getUnparsedData(), "");
}

void test_observed_time()
{
    MGMetar m1("KTIK 121755Z 04009KT 10SM OVC037 01/M04 A3010", 1700000000);
    MG_VERIFY(m1.getObservation().observed);
    MG_CHECK_EQUAL(*m1.getObservation().observed, 1700000000);

    // the epoch is a valid instant
    MGMetar m2("KTIK 121755Z 04009KT 10SM OVC037 01/M04 A3010", 0);
    MG_VERIFY(m2.getObservation().observed);
    MG_CHECK_EQUAL(*m2.getObservation().observed, 0);

    MGMetar m3("KTIK 121755Z 04009KT 10SM OVC037 01/M04 A3010");
    MG_VERIFY(!m3.getObservation().observed);
}

void test_calm_wind()
{
    MGMetar m1("KOKC 121752Z 00000KT 10SM CLR M10/M15 A3020");
    MG_VERIFY(m1.getWind());
    MG_CHECK_EQUAL(m1.getWind()->getKind(), MGMetarWind::CALM);
    MG_CHECK_EQUAL(m1.getWind()->getCompass(), "calm");
    MG_CHECK_EQUAL(m1.getWind()->getDirection(), -1);
    MG_VERIFY(!m1.getWind()->getSpeed_mph());
    MG_VERIFY(!m1.getWind()->getGust_mph());

    // cold enough, but no wind
    MG_CHECK_EQUAL(*m1.getTemperature_F(), 14);
    MG_VERIFY(!m1.getWindChill_F());
    MG_VERIFY(!m1.getWindChill_C());

    MG_CHECK_EQUAL(*m1.getDewpoint_F(), 5);
    MG_CHECK_EQUAL(*m1.getRelHumidity(), 67);

    MG_CHECK_EQUAL(m1.getCloud()->getCoverage(), MGMetarCloud::COVERAGE_CLEAR);
    MG_CHECK_EQUAL(m1.getCloud()->getDescription(), "clear");

    // calm in any unit
    MGMetar m2("EDDF 121750Z 00000MPS 9999 SKC 02/M01 Q1020");
    MG_CHECK_EQUAL(m2.getWind()->getKind(), MGMetarWind::CALM);
    MG_VERIFY(!m2.getWindChill_F());
}

void test_heat_index()
{
    MGMetar m1("KOKC 121752Z 18012G20KT 10SM SCT250 30/22 A2992");
    MG_CHECK_EQUAL(m1.getWind()->getCompass(), "S");
    MG_CHECK_EQUAL(*m1.getWind()->getSpeed_mph(), 14);
    MG_CHECK_EQUAL(*m1.getWind()->getGust_mph(), 23);
    MG_CHECK_EQUAL(m1.getCloud()->getDescription(), "scattered clouds");

    MG_CHECK_EQUAL(*m1.getTemperature_F(), 86);
    MG_CHECK_EQUAL(*m1.getDewpoint_F(), 72);
    MG_CHECK_EQUAL(*m1.getRelHumidity(), 62);
    MG_CHECK_EQUAL(*m1.getHeatIndex_F(), 92);
    MG_CHECK_EQUAL(*m1.getHeatIndex_C(), 33);
    MG_VERIFY(!m1.getWindChill_F());

    MG_CHECK_EQUAL_EP2(*m1.getPressure_inHg(), 29.92, TEST_EPSILON);
    MG_CHECK_EQUAL(*m1.getPressure_hPa(), 1013);
}

void test_missing_dewpoint()
{
    MGMetar m1("KXYZ 121752Z 36010KT 10SM CLR 05/XX A3000");
    MG_CHECK_EQUAL(*m1.getTemperature_F(), 41);
    MG_VERIFY(!m1.getDewpoint_C());
    MG_VERIFY(!m1.getDewpoint_F());
    MG_VERIFY(!m1.getRelHumidity());
    MG_VERIFY(!m1.getHeatIndex_F());
    MG_CHECK_EQUAL(*m1.getWindChill_F(), 34);
    MG_CHECK_EQUAL(*m1.getWindChill_C(), 1);
    MG_VERIFY(m1.getPressure_inHg());

    MGMetar m2("KXYZ 121752Z 36010KT 10SM CLR 05/ A3000");
    MG_CHECK_EQUAL(*m2.getTemperature_F(), 41);
    MG_VERIFY(!m2.getDewpoint_F());
    MG_VERIFY(!m2.getRelHumidity());
    MG_CHECK_EQUAL(*m2.getWindChill_F(), 34);

    MG_VERIFY(m1.getObservation() == m2.getObservation());
}

void test_cavok()
{
    MGMetar m1("LFPG 121800Z 27015KT CAVOK R06/1000 RA OVC010 18/12 Q1018");
    MG_VERIFY(m1.getVisibility());
    MG_CHECK_EQUAL(m1.getVisibility()->getModifier(), MGMetarVisibility::AT_LEAST);
    MG_CHECK_EQUAL_EP2(m1.getVisibility()->getVisibility_sm(), 7.0, TEST_EPSILON);
    MG_VERIFY(m1.getConditions());
    MG_CHECK_EQUAL(*m1.getConditions(), "");
    MG_VERIFY(m1.getWeather().empty());
    MG_CHECK_EQUAL(m1.getCloud()->getCoverage(), MGMetarCloud::COVERAGE_CLEAR);
    MG_CHECK_EQUAL(m1.getCloud()->getDescription(), "clear skies");

    // the skipped groups are never revisited
    MG_VERIFY(!m1.getTemperature_C());
    MG_VERIFY(!m1.getPressure_hPa());
    MG_CHECK_EQUAL(m1.getUnparsedData(), "R06/1000 RA OVC010 18/12 Q1018");

    MGMetar m2("EDDF 121750Z 24008KT CAVOK 18/12 Q1018");
    MG_CHECK_EQUAL(m2.getCloud()->getDescription(), "clear skies");
    MG_CHECK_EQUAL(*m2.getTemperature_F(), 64);
    MG_CHECK_EQUAL(*m2.getDewpoint_F(), 54);
    MG_CHECK_EQUAL(*m2.getRelHumidity(), 68);
    MG_CHECK_EQUAL(*m2.getPressure_hPa(), 1018);
    MG_CHECK_EQUAL_EP2(*m2.getPressure_inHg(), 30.06, TEST_EPSILON);
}

void test_visibility()
{
    MGMetar m1("KMWC 230045Z 06015G23KT 1 1/4SM -SN OVC005 M01/M03 A2970");
    MG_CHECK_EQUAL(m1.getVisibility()->getModifier(), MGMetarVisibility::EQUALS);
    MG_CHECK_EQUAL_EP2(m1.getVisibility()->getVisibility_sm(), 1.25, TEST_EPSILON);
    MG_CHECK_EQUAL(m1.getWind()->getCompass(), "ENE");
    MG_CHECK_EQUAL(*m1.getWind()->getSpeed_mph(), 17);
    MG_CHECK_EQUAL(*m1.getWind()->getGust_mph(), 26);
    MG_CHECK_EQUAL(*m1.getConditions(), "light snow");
    MG_CHECK_EQUAL(*m1.getTemperature_F(), 30);
    MG_CHECK_EQUAL(*m1.getDewpoint_F(), 27);
    MG_CHECK_EQUAL(*m1.getRelHumidity(), 86);
    MG_CHECK_EQUAL(*m1.getWindChill_F(), 18);
    MG_CHECK_EQUAL(*m1.getWindChill_C(), -8);
    MG_CHECK_EQUAL(*m1.getPressure_hPa(), 1006);

    MGMetar m2("KABC 121755Z 27005KT M1/4SM FG VV001 10/10 A3000");
    MG_CHECK_EQUAL(m2.getVisibility()->getModifier(), MGMetarVisibility::AT_MOST);
    MG_CHECK_EQUAL_EP2(m2.getVisibility()->getVisibility_sm(), 0.25, TEST_EPSILON);

    MGMetar m3("KABC 121755Z 27005KT P6SM SKC 10/05 A3000");
    MG_CHECK_EQUAL(m3.getVisibility()->getModifier(), MGMetarVisibility::AT_LEAST);
    MG_CHECK_EQUAL_EP2(m3.getVisibility()->getVisibility_sm(), 6.0, TEST_EPSILON);

    MGMetar m4("LOWW 121750Z 30010KT 1600 BR BKN004 03/02 Q1008");
    MG_CHECK_EQUAL_EP2(m4.getVisibility()->getVisibility_sm(), 2.6, TEST_EPSILON);

    MGMetar m5("LOWW 121750Z 30010KT 9999 FEW040 13/02 Q1008");
    MG_CHECK_EQUAL_EP2(m5.getVisibility()->getVisibility_sm(), 16.0, TEST_EPSILON);

    // kilometers are consumed but not reported
    MGMetar m6("NFFN 121800Z 12010KT 10KM FEW020 28/22 Q1012");
    MG_VERIFY(!m6.getVisibility());
    MG_CHECK_EQUAL(m6.getCloud()->getDescription(), "partly cloudy");
    MG_CHECK_EQUAL(*m6.getTemperature_C(), 28);
    MG_CHECK_EQUAL(m6.getUnparsedData(), "");
}

void test_conditions()
{
    MGMetar m1("KABC 121755Z 27005KT 3SM -SHRA BR OVC008 12/11 A2990");
    MG_CHECK_EQUAL(*m1.getConditions(), "light rain showers & mist");
    MG_CHECK_EQUAL(m1.getWeather().size(), 2u);

    const MGMetarWeather& w = m1.getWeather()[0];
    MG_CHECK_EQUAL(w.getIntensity(), MGMetarWeather::LIGHT);
    MG_VERIFY(!w.getVicinity());
    MG_CHECK_EQUAL(w.getPhenomena().size(), 2u);
    MG_CHECK_EQUAL(w.getPhenomena()[0], "SH");
    MG_CHECK_EQUAL(w.getPhenomena()[1], "RA");
    MG_CHECK_EQUAL(w.getDescription(), "light rain showers");
    MG_CHECK_EQUAL(m1.getWeather()[1].getIntensity(), MGMetarWeather::MODERATE);

    MGMetar m2("KABC 121755Z 27005KT 10SM VCTS SCT030 25/20 A2990");
    MG_CHECK_EQUAL(*m2.getConditions(), "nearby thunderstorm");
    MG_VERIFY(m2.getWeather()[0].getVicinity());

    MGMetar m3("KABC 121755Z 27005KT 2SM +TSRA BKN010CB 22/21 A2985");
    MG_CHECK_EQUAL(*m3.getConditions(), "heavy thunderstorm rain");
    MG_CHECK_EQUAL(m3.getWeather()[0].getIntensity(), MGMetarWeather::HEAVY);
    MG_CHECK_EQUAL(m3.getCloud()->getDescription(), "mostly cloudy");

    MGMetar m4("KABC 121755Z 27005KT 5SM VCSH FZFG SCT030 25/20 A2990");
    MG_CHECK_EQUAL(*m4.getConditions(), "nearby showers & freezing fog");

    // an unknown code ends the weather groups
    MGMetar m5("KABC 121755Z 27005KT 5SM RA XX SCT030 25/20 A2990");
    MG_CHECK_EQUAL(*m5.getConditions(), "rain");
    MG_VERIFY(!m5.getCloud());
    MG_CHECK_EQUAL(m5.getUnparsedData(), "XX SCT030 25/20 A2990");
}

void test_runway()
{
    MGMetar m1("KXYZ 121755Z 04009KT 1 1/2SM R06/2000FT R24/P6000FT -SHRA BR FEW010 OVC020 M02/M05 A2992");
    MG_CHECK_EQUAL_EP2(m1.getVisibility()->getVisibility_sm(), 1.5, TEST_EPSILON);
    MG_CHECK_EQUAL(*m1.getConditions(), "light rain showers & mist");
    MG_CHECK_EQUAL(m1.getWeather().size(), 2u);
    MG_CHECK_EQUAL(m1.getCloud()->getDescription(), "overcast");
    MG_CHECK_EQUAL(*m1.getTemperature_F(), 28);
    MG_CHECK_EQUAL(*m1.getDewpoint_F(), 23);
    MG_CHECK_EQUAL(*m1.getRelHumidity(), 80);
    MG_CHECK_EQUAL(*m1.getWindChill_F(), 19);
    MG_CHECK_EQUAL(*m1.getWindChill_C(), -7);
    MG_CHECK_EQUAL(*m1.getPressure_hPa(), 1013);
    MG_CHECK_EQUAL(m1.getUnparsedData(), "");

    // runway groups straight before the sky condition
    MGMetar m2("EHAM 201125Z 27012KT 0800 R18C/1100N R27/0900U BKN002 10/09 Q1025");
    MG_CHECK_EQUAL_EP2(m2.getVisibility()->getVisibility_sm(), 1.3, TEST_EPSILON);
    MG_VERIFY(!m2.getConditions());
    MG_CHECK_EQUAL(m2.getCloud()->getCoverage(), MGMetarCloud::COVERAGE_BROKEN);
    MG_CHECK_EQUAL(*m2.getTemperature_C(), 10);
    MG_CHECK_EQUAL(*m2.getPressure_hPa(), 1025);
    MG_CHECK_EQUAL(m2.getUnparsedData(), "");

    // not a runway group, decoding ends there
    MGMetar m3("EHAM 201125Z 27012KT 0800 RWY18 BKN002 10/09 Q1025");
    MG_VERIFY(!m3.getCloud());
    MG_CHECK_EQUAL(m3.getUnparsedData(), "RWY18 BKN002 10/09 Q1025");
}

void test_clouds()
{
    // only the last layer is kept
    MGMetar m1("KABC 121755Z 27005KT 10SM FEW020 SCT040 BKN100 20/10 A3000");
    MG_CHECK_EQUAL(m1.getCloud()->getCoverage(), MGMetarCloud::COVERAGE_BROKEN);
    MG_CHECK_EQUAL(m1.getCloud()->getDescription(), "mostly cloudy");
    MG_VERIFY(!m1.getCloud()->getAltitude_ft());
    MG_CHECK_EQUAL(*m1.getTemperature_C(), 20);

    MGMetar m2("KABC 121755Z 27005KT 1/4SM FG VV003 10/10 A3000");
    MG_CHECK_EQUAL(*m2.getCloud()->getAltitude_ft(), 300);

    MGMetar m3("KABC 121755Z 27005KT 10SM OVC250 VV010 10/10 A3000");
    MG_CHECK_EQUAL(m3.getCloud()->getCoverage(), MGMetarCloud::COVERAGE_VERTICAL_VISIBILITY);
    MG_CHECK_EQUAL(*m3.getCloud()->getAltitude_ft(), 1000);
}

void test_wind_units()
{
    MGMetar m1("UUEE 121800Z 05010MPS 9999 OVC020 M05/M08 Q1025");
    MG_CHECK_EQUAL(*m1.getWind()->getSpeed_mph(), 22);

    MGMetar m2("UUEE 121800Z 05030KMH 9999 OVC020 M05/M08 Q1025");
    MG_CHECK_EQUAL(*m2.getWind()->getSpeed_mph(), 19);

    MGMetar m3("KABC 121755Z VRB03KT 10SM CLR 00/M02 A3000");
    MG_CHECK_EQUAL(m3.getWind()->getKind(), MGMetarWind::VARIABLE);
    MG_CHECK_EQUAL(m3.getWind()->getCompass(), "varies");
    MG_CHECK_EQUAL(m3.getWind()->getDirection(), -1);
    MG_CHECK_EQUAL(*m3.getWind()->getSpeed_mph(), 3);
    // 3 mph is not enough for wind chill
    MG_VERIFY(!m3.getWindChill_F());

    // no unit, not a wind group
    MGMetar m4("KABC 121755Z 27010 10SM CLR 00/M02 A3000");
    MG_VERIFY(!m4.getWind());
    MG_VERIFY(!m4.getVisibility());

    MGMetar m5("EHAM 201125Z 27012KT 240V300 9999 FEW025 10/05 Q1025");
    MG_CHECK_EQUAL(m5.getWind()->getCompass(), "W");
    MG_CHECK_EQUAL(*m5.getWind()->getRangeFrom(), 240);
    MG_CHECK_EQUAL(*m5.getWind()->getRangeTo(), 300);
    MG_CHECK_EQUAL_EP2(m5.getVisibility()->getVisibility_sm(), 16.0, TEST_EPSILON);
}

void test_group_order()
{
    // a variable wind group after the visibility is not consumed
    MGMetar m1("KABC 121755Z 10SM 240V300 OVC010 10/05 A3000");
    MG_VERIFY(!m1.getWind());
    MG_CHECK_EQUAL_EP2(m1.getVisibility()->getVisibility_sm(), 10.0, TEST_EPSILON);
    MG_VERIFY(!m1.getCloud());
    MG_VERIFY(!m1.getTemperature_C());
    MG_CHECK_EQUAL(m1.getUnparsedData(), "240V300 OVC010 10/05 A3000");

    // visibility after the sky condition
    MGMetar m2("KABC 121755Z 27005KT OVC010 10SM 10/05 A3000");
    MG_CHECK_EQUAL(m2.getCloud()->getDescription(), "overcast");
    MG_VERIFY(!m2.getVisibility());
    MG_CHECK_EQUAL(m2.getUnparsedData(), "10SM 10/05 A3000");

    // groups may be left out
    MGMetar m3("KABC 121755Z 10/05 A3000");
    MG_VERIFY(!m3.getWind());
    MG_VERIFY(!m3.getVisibility());
    MG_CHECK_EQUAL(*m3.getTemperature_C(), 10);
    MG_CHECK_EQUAL(*m3.getPressure_hPa(), 1016);
}

void test_idempotence()
{
    const std::string report("KMWC 230045Z 06015G23KT 1 1/4SM -SN BR OVC005 M01/M03 A2970");
    MGMetar m1(report);
    MGMetar m2(report);
    MG_VERIFY(m1.getObservation() == m2.getObservation());

    // nothing carries over to the next report
    MGMetar m3("KABC 121755Z 27005KT 3SM BR OVC008 12/11 A2990");
    MG_CHECK_EQUAL(*m3.getConditions(), "mist");
    MG_CHECK_EQUAL(m3.getWeather().size(), 1u);

    MGMetar m4("KAAA 121755Z 27010KT 1");
    MG_VERIFY(!m4.getVisibility());
    MGMetar m5("KBBB 121755Z 27010KT 1/2SM");
    MG_CHECK_EQUAL_EP2(m5.getVisibility()->getVisibility_sm(), 0.5, TEST_EPSILON);

    // whitespace is normalized
    MGMetar m6("  KMWC\t230045Z 06015G23KT  1 1/4SM -SN BR OVC005 M01/M03 A2970\r\n");
    MG_CHECK_EQUAL(m6.getData(), report);
    MG_VERIFY(m1.getObservation() == m6.getObservation());
}

void test_concurrent_decoding()
{
    const std::string report("KOKC 121752Z 18012G20KT 10SM -SHRA SCT250 30/22 A2992");
    const MGMetar reference(report);

    std::vector<std::thread> threads;
    std::vector<int> matches(4, 0);
    for (unsigned int i = 0; i < matches.size(); i++) {
        threads.emplace_back([&report, &reference, &matches, i]() {
            for (int n = 0; n < 100; n++) {
                MGMetar m(report);
                if (m.getObservation() == reference.getObservation())
                    matches[i]++;
            }
        });
    }
    for (auto& t : threads)
        t.join();

    for (int n : matches)
        MG_CHECK_EQUAL(n, 100);
}

void test_no_data()
{
    for (const char* text : { "", "   ", "\t\r\n" }) {
        try {
            MGMetar m(text);
            MG_TEST_FAIL("blank report decoded: '" << text << "'");
        } catch (const mg_no_data_exception& e) {
            MG_CHECK_EQUAL(e.getMessage(), "Data not available");
        }
    }

    // a station alone is not an error
    MGMetar m1("KTIK");
    MG_CHECK_EQUAL(m1.getId(), "KTIK");
    MG_VERIFY(!m1.getWind());
    MG_VERIFY(!m1.getTemperature_C());
    MG_CHECK_EQUAL(m1.getUnparsedData(), "");

    // nor is garbage
    MGMetar m2("KTIK NIL");
    MG_VERIFY(!m2.getVisibility());
    MG_CHECK_EQUAL(m2.getUnparsedData(), "NIL");
}

void test_logging()
{
    metgear::logstream& log = metgear::mglog();
    const mgDebugClass oldClasses = log.get_log_classes();
    const mgDebugPriority oldPriority = log.get_log_priority();
    log.setStderrEnabled(false);
    log.setLogLevels(MG_ALL, MG_INFO);

    metgear::BufferedLogCallback buffer(MG_ENVIRONMENT, MG_INFO);
    log.addCallback(&buffer);

    MGMetar m1("NFFN 121800Z 12010KT 10KM FEW020 28/22 Q1012 NOSIG");

    metgear::BufferedLogCallback::string_list messages;
    buffer.threadsafeCopy(messages);
    log.removeCallback(&buffer);
    log.setLogLevels(oldClasses, oldPriority);
    log.setStderrEnabled(true);

    bool km = false, remark = false;
    for (const auto& msg : messages) {
        km = km || boost::contains(msg, "10KM");
        remark = remark || boost::contains(msg, "NOSIG");
    }
    MG_VERIFY(km);
    MG_VERIFY(remark);
}

int main(int argc, char* argv[])
{
    try {
        test_basic();
        test_observed_time();
        test_calm_wind();
        test_heat_index();
        test_missing_dewpoint();
        test_cavok();
        test_visibility();
        test_conditions();
        test_runway();
        test_clouds();
        test_wind_units();
        test_group_order();
        test_idempotence();
        test_concurrent_decoding();
        test_no_data();
        test_logging();
    } catch (mg_exception& e) {
        std::cerr << "Exception: " << e.getMessage() << std::endl;
        return EXIT_FAILURE;
    }

    std::cout << "all tests passed" << std::endl;
    return EXIT_SUCCESS;
}
