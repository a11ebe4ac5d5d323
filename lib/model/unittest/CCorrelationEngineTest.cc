/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <model/CAlignedFrame.h>
#include <model/CCorrelationEngine.h>

#include <test/BoostTestCloseAbsolute.h>

#include <boost/test/unit_test.hpp>

#include <optional>
#include <stdexcept>

BOOST_AUTO_TEST_SUITE(CCorrelationEngineTest)

using namespace tsa;
using namespace model;

namespace {
CAlignedFrame testFrame() {
    CAlignedFrame frame{0, 4 * 3600, 3600};
    frame.addColumn("a", {1.0, 2.0, 3.0, 4.0, 5.0});
    frame.addColumn("b", {2.0, 4.0, 6.0, 8.0, 10.0});
    frame.addColumn("c", {5.0, 4.0, 3.0, 2.0, 1.0});
    frame.addColumn("constant", {1.0, 1.0, 1.0, 1.0, 1.0});
    frame.addColumn("sparse", {1.0, std::nullopt, std::nullopt, std::nullopt, 2.0});
    frame.addColumn("gappy", {1.0, 3.0, std::nullopt, 7.0, 9.0});
    return frame;
}
}

BOOST_AUTO_TEST_CASE(testMatrix) {
    CCorrelationEngine engine{3};
    CCorrelationMatrix matrix{engine.compute(testFrame())};

    BOOST_REQUIRE_EQUAL(6, matrix.size());

    BOOST_TEST_REQUIRE(matrix.at("a", "b").ok());
    BOOST_REQUIRE_CLOSE_ABSOLUTE(1.0, matrix.at("a", "b").s_Coefficient, 1e-12);
    BOOST_REQUIRE_EQUAL(5, matrix.at("a", "b").s_Samples);
    BOOST_TEST_REQUIRE(matrix.at("a", "c").ok());
    BOOST_REQUIRE_CLOSE_ABSOLUTE(-1.0, matrix.at("a", "c").s_Coefficient, 1e-12);

    // Pairs only use the rows where both columns have a value.
    BOOST_TEST_REQUIRE(matrix.at("a", "gappy").ok());
    BOOST_REQUIRE_EQUAL(4, matrix.at("a", "gappy").s_Samples);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(1.0, matrix.at("a", "gappy").s_Coefficient, 1e-12);

    BOOST_REQUIRE_EQUAL(static_cast<int>(SCorrelationCell::E_Undefined),
                        static_cast<int>(matrix.at("a", "constant").s_Status));
    BOOST_REQUIRE_EQUAL(static_cast<int>(SCorrelationCell::E_InsufficientData),
                        static_cast<int>(matrix.at("a", "sparse").s_Status));
    BOOST_REQUIRE_EQUAL(2, matrix.at("a", "sparse").s_Samples);

    BOOST_REQUIRE_THROW(matrix.at("a", "unknown"), std::out_of_range);
}

BOOST_AUTO_TEST_CASE(testSymmetryAndDiagonal) {
    CCorrelationEngine engine{3};
    CCorrelationMatrix matrix{engine.compute(testFrame())};

    for (std::size_t i = 0; i < matrix.size(); ++i) {
        for (std::size_t j = 0; j < matrix.size(); ++j) {
            const auto& ij = matrix.at(i, j);
            const auto& ji = matrix.at(j, i);
            BOOST_REQUIRE_EQUAL(static_cast<int>(ij.s_Status), static_cast<int>(ji.s_Status));
            BOOST_REQUIRE_EQUAL(ij.s_Coefficient, ji.s_Coefficient);
            BOOST_REQUIRE_EQUAL(ij.s_Samples, ji.s_Samples);
            if (ij.ok()) {
                BOOST_TEST_REQUIRE(ij.s_Coefficient >= -1.0);
                BOOST_TEST_REQUIRE(ij.s_Coefficient <= 1.0);
            }
        }
    }

    // The diagonal is exact, even for a constant column.
    for (const auto& name : {"a", "b", "c", "constant", "gappy"}) {
        BOOST_TEST_REQUIRE(matrix.at(name, name).ok());
        BOOST_REQUIRE_EQUAL(1.0, matrix.at(name, name).s_Coefficient);
    }
    BOOST_REQUIRE_EQUAL(static_cast<int>(SCorrelationCell::E_InsufficientData),
                        static_cast<int>(matrix.at("sparse", "sparse").s_Status));
}

BOOST_AUTO_TEST_CASE(testMinimumSamples) {
    // At least two samples are always needed.
    BOOST_REQUIRE_EQUAL(2, CCorrelationEngine{0}.minimumSamples());

    CCorrelationMatrix matrix{CCorrelationEngine{6}.compute(testFrame())};
    for (std::size_t i = 0; i < matrix.size(); ++i) {
        for (std::size_t j = 0; j < matrix.size(); ++j) {
            BOOST_REQUIRE_EQUAL(static_cast<int>(SCorrelationCell::E_InsufficientData),
                                static_cast<int>(matrix.at(i, j).s_Status));
        }
    }
}

BOOST_AUTO_TEST_CASE(testStatusNames) {
    for (auto status : {SCorrelationCell::E_Ok, SCorrelationCell::E_InsufficientData,
                        SCorrelationCell::E_Undefined}) {
        SCorrelationCell::EStatus parsed{SCorrelationCell::E_Ok};
        BOOST_TEST_REQUIRE(SCorrelationCell::parse(SCorrelationCell::print(status), parsed));
        BOOST_REQUIRE_EQUAL(static_cast<int>(status), static_cast<int>(parsed));
    }
    SCorrelationCell::EStatus parsed{SCorrelationCell::E_Ok};
    BOOST_TEST_REQUIRE(SCorrelationCell::parse("nan", parsed) == false);
}

BOOST_AUTO_TEST_SUITE_END()
