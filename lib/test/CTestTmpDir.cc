/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <test/CTestTmpDir.h>

#include <core/CLogger.h>

#include <boost/filesystem.hpp>

#include <stdexcept>

namespace tsa {
namespace test {

CTestTmpDir::CTestTmpDir() {
    boost::filesystem::path tmpPath{boost::filesystem::temp_directory_path()};
    tmpPath /= boost::filesystem::unique_path("tsa-test-%%%%-%%%%-%%%%");
    try {
        boost::filesystem::create_directories(tmpPath);
    } catch (std::exception& e) {
        LOG_ERROR(<< "Failed to create directory " << tmpPath << " - " << e.what());
        throw std::runtime_error{"failed to create test directory"};
    }
    m_Name = tmpPath.string();
}

CTestTmpDir::~CTestTmpDir() {
    boost::system::error_code errorCode;
    boost::filesystem::remove_all(m_Name, errorCode);
    if (errorCode) {
        LOG_WARN(<< "Failed to remove " << m_Name << " - " << errorCode.message());
    }
}

const std::string& CTestTmpDir::name() const {
    return m_Name;
}

std::string CTestTmpDir::path(const std::string& leaf) const {
    return (boost::filesystem::path{m_Name} / leaf).string();
}
}
}
