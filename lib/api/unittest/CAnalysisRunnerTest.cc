/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <api/CAnalysisConfig.h>
#include <api/CAnalysisRunner.h>

#include <core/Concurrency.h>

#include <model/CAnalysisArtifact.h>
#include <model/CAnalysisErrors.h>
#include <model/CArtifactVersioner.h>

#include <test/CMockSeriesStore.h>
#include <test/CRandomNumbers.h>

#include <boost/test/unit_test.hpp>

#include <string>
#include <vector>

BOOST_AUTO_TEST_SUITE(CAnalysisRunnerTest)

using namespace tsa;
using namespace api;

namespace {
using TDoubleVec = std::vector<double>;
using TTimeDoublePrVec = model::CSeries::TTimeDoublePrVec;

const core_t::TTime HOUR{3600};
const core_t::TTime END{100 * HOUR};

const std::string CONFIG{"[series]\n"
                         "names = btc_usd:price, eth_usd:price, cpi:macroeconomic\n"
                         "[window]\n"
                         "lookback = 360000\n"
                         "interval = 3600\n"
                         "[correlation]\n"
                         "min_samples = 20\n"
                         "[causality]\n"
                         "max_lag = 2\n"
                         "[forecast]\n"
                         "entities = btc_usd, eth_usd, cpi\n"
                         "horizon = 5\n"
                         "seasonal_period = 0\n"
                         "order_selection = fixed\n"
                         "order = 1,0,0\n"
                         "[history]\n"
                         "retention = 2\n"};

//! Start the default executor and stop it at the end of the test.
class CDefaultExecutorFixture {
public:
    explicit CDefaultExecutorFixture(std::size_t threads) {
        core::startDefaultAsyncExecutor(threads);
    }
    ~CDefaultExecutorFixture() { core::stopDefaultAsyncExecutor(); }
};

CAnalysisConfig config() {
    CAnalysisConfig result;
    BOOST_TEST_REQUIRE(result.initFromString(CONFIG));
    return result;
}

TTimeDoublePrVec ar1(test::CRandomNumbers& rng, double mean, std::size_t n) {
    TDoubleVec noise;
    rng.generateNormalSamples(0.0, 1.0, n, noise);
    TTimeDoublePrVec result;
    double x{mean};
    for (std::size_t i = 0; i < n; ++i) {
        x = mean + 0.7 * (x - mean) + noise[i];
        result.emplace_back(static_cast<core_t::TTime>(i) * HOUR, x);
    }
    return result;
}

void addPrices(test::CMockSeriesStore& store) {
    test::CRandomNumbers rng;
    store.addSeries("btc_usd", model::CSeries::E_Price, ar1(rng, 100.0, 101));
    store.addSeries("eth_usd", model::CSeries::E_Price, ar1(rng, 50.0, 101));
}
}

BOOST_AUTO_TEST_CASE(testPublish) {
    CDefaultExecutorFixture executor{2};

    test::CMockSeriesStore store;
    addPrices(store);

    CAnalysisRunner runner{config(), store};
    runner.initialize();
    BOOST_REQUIRE_EQUAL(static_cast<int>(CAnalysisRunner::E_Published),
                        static_cast<int>(runner.run(END)));

    auto artifact = runner.versioner().latest();
    BOOST_TEST_REQUIRE(artifact != nullptr);
    BOOST_REQUIRE_EQUAL(1, artifact->runId());
    BOOST_REQUIRE_EQUAL(0, artifact->windowStart());
    BOOST_REQUIRE_EQUAL(END, artifact->windowEnd());
    BOOST_REQUIRE_EQUAL(HOUR, artifact->interval());
    BOOST_REQUIRE_EQUAL(16, artifact->fingerprint().size());
    BOOST_REQUIRE_EQUAL(std::string{"5"}, artifact->parameters().at("forecast.horizon"));
    BOOST_REQUIRE_EQUAL(1, store.artifacts().size());

    const auto& correlations = artifact->correlations();
    BOOST_REQUIRE_EQUAL(3, correlations.size());
    BOOST_TEST_REQUIRE(correlations.at("btc_usd", "eth_usd").ok());
    BOOST_REQUIRE_EQUAL(101, correlations.at("btc_usd", "eth_usd").s_Samples);
    BOOST_REQUIRE_EQUAL(static_cast<int>(model::SCorrelationCell::E_InsufficientData),
                        static_cast<int>(correlations.at("btc_usd", "cpi").s_Status));

    const auto& causality = artifact->causality();
    BOOST_REQUIRE_EQUAL(6, causality.size());
    for (const auto& verdict : causality) {
        if (verdict.s_Cause == "cpi" || verdict.s_Effect == "cpi") {
            BOOST_REQUIRE_EQUAL(static_cast<int>(model::SCausalityVerdict::E_InsufficientData),
                                static_cast<int>(verdict.s_Status));
        } else {
            BOOST_REQUIRE_EQUAL(static_cast<int>(model::SCausalityVerdict::E_Tested),
                                static_cast<int>(verdict.s_Status));
        }
    }

    // A failed entity doesn't stop the others being forecast.
    const auto& forecasts = artifact->forecasts();
    BOOST_REQUIRE_EQUAL(3, forecasts.size());
    BOOST_REQUIRE_EQUAL(std::string{"btc_usd"}, forecasts[0].s_Entity);
    BOOST_TEST_REQUIRE(forecasts[0].ok(), forecasts[0].s_Error);
    BOOST_REQUIRE_EQUAL(5, forecasts[0].s_Mean.size());
    BOOST_REQUIRE_EQUAL(END + HOUR, forecasts[0].s_Times[0]);
    BOOST_REQUIRE_EQUAL(std::string{"eth_usd"}, forecasts[1].s_Entity);
    BOOST_TEST_REQUIRE(forecasts[1].ok(), forecasts[1].s_Error);
    BOOST_REQUIRE_EQUAL(std::string{"cpi"}, forecasts[2].s_Entity);
    BOOST_TEST_REQUIRE(forecasts[2].ok() == false);
    BOOST_TEST_REQUIRE(forecasts[2].s_Error.empty() == false);
}

BOOST_AUTO_TEST_CASE(testUnchangedInputsAreSkipped) {
    core::stopDefaultAsyncExecutor();

    test::CMockSeriesStore store;
    addPrices(store);

    CAnalysisRunner runner{config(), store};
    runner.initialize();
    BOOST_REQUIRE_EQUAL(static_cast<int>(CAnalysisRunner::E_Published),
                        static_cast<int>(runner.run(END)));
    BOOST_REQUIRE_EQUAL(static_cast<int>(CAnalysisRunner::E_Skipped),
                        static_cast<int>(runner.run(END)));
    BOOST_REQUIRE_EQUAL(1, store.artifacts().size());

    // Unless forced.
    BOOST_REQUIRE_EQUAL(static_cast<int>(CAnalysisRunner::E_Published),
                        static_cast<int>(runner.run(END, true)));
    BOOST_REQUIRE_EQUAL(2, runner.versioner().latest()->runId());

    // New data changes the inputs.
    test::CRandomNumbers rng;
    rng.discard(1000);
    store.addSeries("cpi", model::CSeries::E_Macroeconomic, ar1(rng, 300.0, 101));
    BOOST_REQUIRE_EQUAL(static_cast<int>(CAnalysisRunner::E_Published),
                        static_cast<int>(runner.run(END)));
    BOOST_REQUIRE_EQUAL(3, runner.versioner().latest()->runId());
    BOOST_TEST_REQUIRE(runner.versioner().latest()->forecasts()[2].ok());

    // Only the configured number of runs is retained.
    auto history = runner.versioner().history();
    BOOST_REQUIRE_EQUAL(2, history.size());
    BOOST_REQUIRE_EQUAL(2, history[0]->runId());

    // A new runner picks up where the last one left off.
    CAnalysisRunner restarted{config(), store};
    restarted.initialize();
    BOOST_REQUIRE_EQUAL(static_cast<int>(CAnalysisRunner::E_Skipped),
                        static_cast<int>(restarted.run(END)));
    BOOST_REQUIRE_EQUAL(3, store.artifacts().size());
}

BOOST_AUTO_TEST_CASE(testNonConvergingEntity) {
    CDefaultExecutorFixture executor{2};

    // The autoregression needs many iterations but the alternating series
    // starts at its minimum, so one iteration only suffices for it.
    std::string config_{CONFIG};
    config_.replace(config_.find("entities = btc_usd, eth_usd, cpi"),
                    std::string{"entities = btc_usd, eth_usd, cpi"}.size(),
                    "entities = btc_usd, eth_usd\nmax_iterations = 1");
    CAnalysisConfig config;
    BOOST_TEST_REQUIRE(config.initFromString(config_));

    test::CMockSeriesStore store;
    test::CRandomNumbers rng;
    store.addSeries("btc_usd", model::CSeries::E_Price, ar1(rng, 100.0, 101));
    const double PATTERN[]{0.0, 1.0, 0.0, -1.0};
    TTimeDoublePrVec alternating;
    for (std::size_t i = 0; i < 100; ++i) {
        alternating.emplace_back(static_cast<core_t::TTime>(i + 1) * HOUR, 50.0 + PATTERN[i % 4]);
    }
    store.addSeries("eth_usd", model::CSeries::E_Price, alternating);

    CAnalysisRunner runner{config, store};
    runner.initialize();
    BOOST_REQUIRE_EQUAL(static_cast<int>(CAnalysisRunner::E_Published),
                        static_cast<int>(runner.run(END)));

    const auto& forecasts = runner.versioner().latest()->forecasts();
    BOOST_REQUIRE_EQUAL(2, forecasts.size());
    BOOST_REQUIRE_EQUAL(std::string{"btc_usd"}, forecasts[0].s_Entity);
    BOOST_REQUIRE_EQUAL(static_cast<int>(model::SForecastResult::E_ModelFitError),
                        static_cast<int>(forecasts[0].s_Status));
    BOOST_TEST_REQUIRE(forecasts[0].s_Error.find("did not converge") != std::string::npos,
                       forecasts[0].s_Error);
    BOOST_REQUIRE_EQUAL(std::string{"eth_usd"}, forecasts[1].s_Entity);
    BOOST_TEST_REQUIRE(forecasts[1].ok(), forecasts[1].s_Error);
    BOOST_REQUIRE_EQUAL(5, forecasts[1].s_Mean.size());
    BOOST_REQUIRE_EQUAL(HOUR, forecasts[1].s_FitStart);
    BOOST_REQUIRE_EQUAL(100, forecasts[1].s_FitObservations);
}

BOOST_AUTO_TEST_CASE(testCancel) {
    CDefaultExecutorFixture executor{2};

    test::CMockSeriesStore store;
    addPrices(store);

    CAnalysisRunner runner{config(), store};
    runner.initialize();

    store.onRead([&runner](const std::string&) { runner.cancel(); });
    BOOST_REQUIRE_EQUAL(static_cast<int>(CAnalysisRunner::E_Cancelled),
                        static_cast<int>(runner.run(END)));
    BOOST_TEST_REQUIRE(runner.cancelled());
    BOOST_TEST_REQUIRE(store.artifacts().empty());
    BOOST_TEST_REQUIRE(runner.versioner().latest() == nullptr);

    // Each run starts uncancelled.
    store.onRead(nullptr);
    BOOST_REQUIRE_EQUAL(static_cast<int>(CAnalysisRunner::E_Published),
                        static_cast<int>(runner.run(END)));
    BOOST_TEST_REQUIRE(runner.cancelled() == false);
    BOOST_REQUIRE_EQUAL(1, runner.versioner().latest()->runId());
}

BOOST_AUTO_TEST_CASE(testFailures) {
    core::stopDefaultAsyncExecutor();

    test::CMockSeriesStore store;
    CAnalysisRunner runner{config(), store};
    runner.initialize();

    // No data in the window.
    BOOST_REQUIRE_THROW(runner.run(END), model::CInsufficientWindowError);
    addPrices(store);
    BOOST_REQUIRE_THROW(runner.run(END + 200 * HOUR), model::CInsufficientWindowError);
    BOOST_TEST_REQUIRE(store.artifacts().empty());

    store.failReads(true);
    BOOST_REQUIRE_THROW(runner.run(END), model::CStorageError);
    BOOST_REQUIRE_THROW(runner.initialize(), model::CStorageError);
    store.failReads(false);

    store.failWrites(true);
    BOOST_REQUIRE_THROW(runner.run(END), model::CStorageError);
    BOOST_TEST_REQUIRE(runner.versioner().latest() == nullptr);
    store.failWrites(false);

    BOOST_REQUIRE_EQUAL(static_cast<int>(CAnalysisRunner::E_Published),
                        static_cast<int>(runner.run(END)));
    BOOST_REQUIRE_EQUAL(1, runner.versioner().latest()->runId());
}

BOOST_AUTO_TEST_CASE(testOutcomeNames) {
    BOOST_REQUIRE_EQUAL(std::string{"published"}, CAnalysisRunner::print(CAnalysisRunner::E_Published));
    BOOST_REQUIRE_EQUAL(std::string{"skipped"}, CAnalysisRunner::print(CAnalysisRunner::E_Skipped));
    BOOST_REQUIRE_EQUAL(std::string{"cancelled"}, CAnalysisRunner::print(CAnalysisRunner::E_Cancelled));
}

BOOST_AUTO_TEST_SUITE_END()
