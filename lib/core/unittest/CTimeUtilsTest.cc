/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <core/CTimeUtils.h>

#include <boost/test/unit_test.hpp>

BOOST_AUTO_TEST_SUITE(CTimeUtilsTest)

using namespace tsa;
using namespace core;

BOOST_AUTO_TEST_CASE(testToIso8601) {
    BOOST_REQUIRE_EQUAL(std::string{"1970-01-01T00:00:00Z"}, CTimeUtils::toIso8601(0));
    BOOST_REQUIRE_EQUAL(std::string{"2024-03-01T12:30:15Z"},
                        CTimeUtils::toIso8601(1709296215));
}

BOOST_AUTO_TEST_CASE(testFromIso8601) {
    core_t::TTime t{0};
    BOOST_TEST_REQUIRE(CTimeUtils::fromIso8601("2024-03-01T12:30:15Z", t));
    BOOST_REQUIRE_EQUAL(1709296215, t);
    BOOST_TEST_REQUIRE(CTimeUtils::fromIso8601("2024-03-01 12:30:15", t));
    BOOST_REQUIRE_EQUAL(1709296215, t);
    BOOST_TEST_REQUIRE(CTimeUtils::fromIso8601("2024-03-01T12:30:15.250+00:00", t));
    BOOST_REQUIRE_EQUAL(1709296215, t);
    BOOST_TEST_REQUIRE(CTimeUtils::fromIso8601("2024-03-01", t));
    BOOST_REQUIRE_EQUAL(1709251200, t);

    BOOST_TEST_REQUIRE(CTimeUtils::fromIso8601("2024-13-01", t) == false);
    BOOST_TEST_REQUIRE(CTimeUtils::fromIso8601("2024-03-01T25:00:00Z", t) == false);
    BOOST_TEST_REQUIRE(CTimeUtils::fromIso8601("2024-03-01T12:30:15+02:00", t) == false);
    BOOST_TEST_REQUIRE(CTimeUtils::fromIso8601("yesterday", t) == false);

    // Round trip.
    for (core_t::TTime time : {0L, 86399L, 951782400L, 1709296215L}) {
        BOOST_TEST_REQUIRE(CTimeUtils::fromIso8601(CTimeUtils::toIso8601(time), t));
        BOOST_REQUIRE_EQUAL(time, t);
    }
}

BOOST_AUTO_TEST_CASE(testParseTime) {
    core_t::TTime t{0};
    BOOST_TEST_REQUIRE(CTimeUtils::parseTime("1709296215", t));
    BOOST_REQUIRE_EQUAL(1709296215, t);
    BOOST_TEST_REQUIRE(CTimeUtils::parseTime("2024-03-01T12:30:15Z", t));
    BOOST_REQUIRE_EQUAL(1709296215, t);
    BOOST_TEST_REQUIRE(CTimeUtils::parseTime("", t) == false);
    BOOST_TEST_REQUIRE(CTimeUtils::parseTime("time", t) == false);
}

BOOST_AUTO_TEST_CASE(testFloor) {
    BOOST_REQUIRE_EQUAL(3600, CTimeUtils::floor(7199, 3600));
    BOOST_REQUIRE_EQUAL(7200, CTimeUtils::floor(7200, 3600));
    BOOST_REQUIRE_EQUAL(-3600, CTimeUtils::floor(-1, 3600));
    BOOST_REQUIRE_EQUAL(17, CTimeUtils::floor(17, 0));
}

BOOST_AUTO_TEST_CASE(testNow) {
    // Any time after the code was written will do.
    BOOST_TEST_REQUIRE(CTimeUtils::now() > 1700000000);
}

BOOST_AUTO_TEST_SUITE_END()
