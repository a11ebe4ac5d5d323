/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <core/CStreamUtils.h>

#include <test/CTestTmpDir.h>

#include <boost/test/unit_test.hpp>

#include <fstream>
#include <sstream>

BOOST_AUTO_TEST_SUITE(CStreamUtilsTest)

using namespace tsa;
using namespace core;

BOOST_AUTO_TEST_CASE(testGetLine) {
    std::istringstream strm{"time,value\r\n1,2\n\r\n3,4"};

    std::string line;
    BOOST_TEST_REQUIRE(CStreamUtils::getLine(strm, line));
    BOOST_REQUIRE_EQUAL(std::string{"time,value"}, line);
    BOOST_TEST_REQUIRE(CStreamUtils::getLine(strm, line));
    BOOST_REQUIRE_EQUAL(std::string{"1,2"}, line);
    BOOST_TEST_REQUIRE(CStreamUtils::getLine(strm, line));
    BOOST_REQUIRE_EQUAL(std::string{""}, line);
    BOOST_TEST_REQUIRE(CStreamUtils::getLine(strm, line));
    BOOST_REQUIRE_EQUAL(std::string{"3,4"}, line);
    BOOST_TEST_REQUIRE(CStreamUtils::getLine(strm, line) == false);
}

BOOST_AUTO_TEST_CASE(testSkipUtf8Bom) {
    test::CTestTmpDir tmpDir;

    std::string withBom{tmpDir.path("bom.csv")};
    std::string withoutBom{tmpDir.path("nobom.csv")};
    {
        std::ofstream strm{withBom, std::ios::binary};
        strm << "\xEF\xBB\xBF" << "1,2\n";
    }
    {
        std::ofstream strm{withoutBom, std::ios::binary};
        strm << "1,2\n";
    }

    for (const auto& file : {withBom, withoutBom}) {
        std::ifstream strm{file};
        BOOST_TEST_REQUIRE(strm.is_open());
        CStreamUtils::skipUtf8Bom(strm);
        std::string line;
        BOOST_TEST_REQUIRE(CStreamUtils::getLine(strm, line));
        BOOST_REQUIRE_EQUAL(std::string{"1,2"}, line);
    }
}

BOOST_AUTO_TEST_SUITE_END()
