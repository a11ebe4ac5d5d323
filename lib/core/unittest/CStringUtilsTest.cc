/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <core/CLogger.h>
#include <core/CStringUtils.h>

#include <boost/test/unit_test.hpp>

#include <cmath>
#include <limits>
#include <vector>

BOOST_AUTO_TEST_SUITE(CStringUtilsTest)

using namespace tsa;
using namespace core;

BOOST_AUTO_TEST_CASE(testTypeToString) {
    BOOST_REQUIRE_EQUAL(std::string{"17"}, CStringUtils::typeToString(17));
    BOOST_REQUIRE_EQUAL(std::string{"-3"}, CStringUtils::typeToString(-3L));
    BOOST_REQUIRE_EQUAL(std::string{"true"}, CStringUtils::typeToString(true));
    BOOST_REQUIRE_EQUAL(std::string{"0"}, CStringUtils::typeToString(0.0));
    BOOST_REQUIRE_EQUAL(std::string{"0.5"}, CStringUtils::typeToString(0.5));

    // Doubles must round trip exactly.
    double values[]{0.1, 1.0 / 3.0, -2.5e-12, 123456789.123456789};
    for (auto value : values) {
        double parsed{0.0};
        BOOST_REQUIRE(CStringUtils::stringToType(CStringUtils::typeToString(value), parsed));
        BOOST_REQUIRE_EQUAL(value, parsed);
    }
}

BOOST_AUTO_TEST_CASE(testStringToType) {
    {
        int i{0};
        BOOST_TEST_REQUIRE(CStringUtils::stringToType("42", i));
        BOOST_REQUIRE_EQUAL(42, i);
        BOOST_TEST_REQUIRE(CStringUtils::stringToTypeSilent("42x", i) == false);
        BOOST_TEST_REQUIRE(CStringUtils::stringToTypeSilent("", i) == false);
    }
    {
        std::size_t i{0};
        BOOST_TEST_REQUIRE(CStringUtils::stringToType("12", i));
        BOOST_REQUIRE_EQUAL(12, i);
        BOOST_TEST_REQUIRE(CStringUtils::stringToTypeSilent("-1", i) == false);
    }
    {
        bool b{false};
        BOOST_TEST_REQUIRE(CStringUtils::stringToType("yes", b));
        BOOST_TEST_REQUIRE(b);
        BOOST_TEST_REQUIRE(CStringUtils::stringToType("False", b));
        BOOST_TEST_REQUIRE(b == false);
        BOOST_TEST_REQUIRE(CStringUtils::stringToTypeSilent("maybe", b) == false);
    }
    {
        double d{0.0};
        BOOST_TEST_REQUIRE(CStringUtils::stringToType("1e3", d));
        BOOST_REQUIRE_EQUAL(1000.0, d);
        BOOST_TEST_REQUIRE(CStringUtils::stringToTypeSilent("1.5.2", d) == false);
        BOOST_TEST_REQUIRE(CStringUtils::stringToTypeSilent("1e999", d) == false);
    }
}

BOOST_AUTO_TEST_CASE(testTrimWhitespace) {
    std::string str{"  \t value \r\n"};
    CStringUtils::trimWhitespace(str);
    BOOST_REQUIRE_EQUAL(std::string{"value"}, str);

    str = " \t ";
    CStringUtils::trimWhitespace(str);
    BOOST_TEST_REQUIRE(str.empty());

    str = "a b";
    CStringUtils::trimWhitespace(str);
    BOOST_REQUIRE_EQUAL(std::string{"a b"}, str);
}

BOOST_AUTO_TEST_CASE(testSplitListAndJoin) {
    auto tokens = CStringUtils::splitList(" btc_usd, ,eth_usd ,cpi,");
    BOOST_REQUIRE_EQUAL(3, tokens.size());
    BOOST_REQUIRE_EQUAL(std::string{"btc_usd"}, tokens[0]);
    BOOST_REQUIRE_EQUAL(std::string{"eth_usd"}, tokens[1]);
    BOOST_REQUIRE_EQUAL(std::string{"cpi"}, tokens[2]);
    BOOST_REQUIRE_EQUAL(std::string{"btc_usd,eth_usd,cpi"},
                        CStringUtils::join(tokens, ","));

    BOOST_TEST_REQUIRE(CStringUtils::splitList("").empty());
    BOOST_REQUIRE_EQUAL(std::string{""}, CStringUtils::join(std::vector<std::string>{}, ","));
}

BOOST_AUTO_TEST_CASE(testTokenise) {
    CStringUtils::TStrVec tokens;
    std::string remainder;
    CStringUtils::tokenise("::", "a::b::::c", tokens, remainder);
    BOOST_REQUIRE_EQUAL(3, tokens.size());
    BOOST_REQUIRE_EQUAL(std::string{"a"}, tokens[0]);
    BOOST_REQUIRE_EQUAL(std::string{"b"}, tokens[1]);
    BOOST_REQUIRE_EQUAL(std::string{""}, tokens[2]);
    BOOST_REQUIRE_EQUAL(std::string{"c"}, remainder);
}

BOOST_AUTO_TEST_CASE(testToLower) {
    BOOST_REQUIRE_EQUAL(std::string{"aicc"}, CStringUtils::toLower("AICc"));
}

BOOST_AUTO_TEST_SUITE_END()
