/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#define BOOST_TEST_MODULE lib.maths
// Defining BOOST_TEST_MODULE usually auto-generates main(), but we don't want
// this as the logger must be at a fixed level before any test runs
#define BOOST_TEST_NO_MAIN

#include <core/CLogger.h>

#include <boost/test/unit_test.hpp>

namespace {
bool initUnitTest() {
    tsa::core::CLogger::instance().setLoggingLevel(tsa::core::CLogger::E_Info);
    return true;
}
}

int main(int argc, char** argv) {
    return boost::unit_test::unit_test_main(&initUnitTest, argc, argv);
}
