/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
//! \brief
//! Correlate, test for causality and forecast a set of time series.
//!
//! DESCRIPTION:\n
//! Reads each configured series from a CSV file in the data directory,
//! runs one analysis over the lookback window ending at --end and writes
//! the resulting artifact to the artifact directory. A run whose inputs
//! are unchanged since the latest artifact publishes nothing unless
//! --force is given.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Standalone program.
//!
#include <core/CLogger.h>
#include <core/CTimeUtils.h>
#include <core/Concurrency.h>
#include <core/CoreTypes.h>

#include <model/CAnalysisErrors.h>

#include <api/CAnalysisConfig.h>
#include <api/CAnalysisRunner.h>
#include <api/CFileSeriesStore.h>

#include "CCmdLineParser.h"

#include <cstdlib>
#include <string>

int main(int argc, char** argv) {
    // Read command line options
    std::string configFile;
    std::string dataDirectory{"."};
    std::string artifactDirectory{"artifacts"};
    std::string endTime;
    bool force{false};
    std::string logProperties;
    std::size_t numberThreads{0};
    if (tsa::analyze::CCmdLineParser::parse(argc, argv, configFile, dataDirectory,
                                            artifactDirectory, endTime, force,
                                            logProperties, numberThreads) == false) {
        return EXIT_FAILURE;
    }

    if (tsa::core::CLogger::instance().reconfigure(logProperties) == false) {
        LOG_FATAL(<< "Could not reconfigure logging");
        return EXIT_FAILURE;
    }

    tsa::api::CAnalysisConfig config;
    if (configFile.empty() == false && config.init(configFile) == false) {
        LOG_FATAL(<< "Analysis config file '" << configFile << "' could not be loaded");
        return EXIT_FAILURE;
    }
    if (config.series().empty()) {
        LOG_FATAL(<< "No series configured");
        return EXIT_FAILURE;
    }

    tsa::core_t::TTime end{tsa::core::CTimeUtils::now()};
    if (endTime.empty() == false &&
        tsa::core::CTimeUtils::parseTime(endTime, end) == false) {
        LOG_FATAL(<< "Invalid end time '" << endTime << "'");
        return EXIT_FAILURE;
    }

    tsa::api::CFileSeriesStore::TStrKindMap kinds;
    for (const auto& series : config.series()) {
        kinds[series.first] = series.second;
    }
    tsa::api::CFileSeriesStore store{dataDirectory, artifactDirectory, kinds};

    tsa::core::startDefaultAsyncExecutor(numberThreads);

    int result{EXIT_SUCCESS};
    try {
        tsa::api::CAnalysisRunner runner{config, store};
        runner.initialize();
        auto outcome = runner.run(end, force);
        LOG_INFO(<< "Analysis " << tsa::api::CAnalysisRunner::print(outcome));
    } catch (const tsa::model::CInsufficientWindowError& e) {
        LOG_FATAL(<< "Insufficient data: " << e.what());
        result = EXIT_FAILURE;
    } catch (const tsa::model::CStorageError& e) {
        LOG_FATAL(<< "Storage failure: " << e.what());
        result = EXIT_FAILURE;
    }

    tsa::core::stopDefaultAsyncExecutor();

    return result;
}
