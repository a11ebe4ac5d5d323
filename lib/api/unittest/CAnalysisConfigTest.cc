/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <api/CAnalysisConfig.h>

#include <test/CTestTmpDir.h>

#include <boost/test/unit_test.hpp>

#include <fstream>
#include <string>

BOOST_AUTO_TEST_SUITE(CAnalysisConfigTest)

using namespace tsa;
using namespace api;

namespace {
const std::string FULL_CONFIG{"# Crypto and macro indicators\n"
                              "[series]\n"
                              "names = btc_usd:price, eth_usd : price, bitcoin:search_trend, cpi:macroeconomic, fx\n"
                              "returns = btc_usd\n"
                              "\n"
                              "[window]\n"
                              "lookback = 604800\n"
                              "interval = 900\n"
                              "max_staleness = 7200\n"
                              "search_trend_staleness = 86400\n"
                              "macroeconomic_staleness = 2678400\n"
                              "\n"
                              "[correlation]\n"
                              "min_samples = 50\n"
                              "\n"
                              "[causality]\n"
                              "max_lag = 3\n"
                              "alpha = 0.01\n"
                              "stationarity_alpha = 0.1\n"
                              "adf_lags = 2\n"
                              "max_differences = 1\n"
                              "targets = btc_usd\n"
                              "max_pairs = 20\n"
                              "\n"
                              "[forecast]\n"
                              "entities = btc_usd\n"
                              "regressors = bitcoin, cpi\n"
                              "horizon = 48\n"
                              "seasonal_period = 96\n"
                              "coverage = 0.8\n"
                              "criterion = BIC\n"
                              "order_selection = fixed\n"
                              "order = 2,0,1\n"
                              "seasonal_order = 1, 0, 0\n"
                              "max_iterations = 200\n"
                              "timeout_ms = 5000\n"
                              "\n"
                              "[history]\n"
                              "retention = 4\n"};

bool initWith(const std::string& extra) {
    CAnalysisConfig config;
    return config.initFromString("[series]\nnames = a:price, b\n" + extra);
}
}

BOOST_AUTO_TEST_CASE(testDefaults) {
    CAnalysisConfig config;
    BOOST_TEST_REQUIRE(config.initFromString("[series]\nnames = btc_usd:price, ai:search_trend, oil\n"));

    BOOST_REQUIRE_EQUAL(3, config.series().size());
    BOOST_REQUIRE_EQUAL(CAnalysisConfig::DEFAULT_LOOKBACK, config.lookback());
    BOOST_REQUIRE_EQUAL(30 * 86400, config.lookback());
    BOOST_REQUIRE_EQUAL(3600, config.interval());
    BOOST_REQUIRE_EQUAL(3 * 86400, config.maxStaleness());
    BOOST_REQUIRE_EQUAL(30, config.minimumSamples());
    BOOST_REQUIRE_EQUAL(10, config.retention());
    BOOST_TEST_REQUIRE(config.returnColumns().empty());

    // Every price series is forecast by default.
    BOOST_REQUIRE_EQUAL(1, config.entities().size());
    BOOST_REQUIRE_EQUAL(std::string{"btc_usd"}, config.entities()[0]);

    auto causality = config.causalityParams();
    BOOST_REQUIRE_EQUAL(5, causality.s_MaxLag);
    BOOST_REQUIRE_EQUAL(0.05, causality.s_Alpha);
    BOOST_REQUIRE_EQUAL(0.05, causality.s_StationarityAlpha);
    BOOST_REQUIRE_EQUAL(1, causality.s_AdfLags);
    BOOST_REQUIRE_EQUAL(2, causality.s_MaxDifferences);
    BOOST_REQUIRE_EQUAL(30, causality.s_MinimumSamples);
    BOOST_REQUIRE_EQUAL(0, causality.s_MaxPairs);
    BOOST_TEST_REQUIRE(causality.s_Targets.empty());

    auto forecast = config.forecastParams();
    BOOST_REQUIRE_EQUAL(168, forecast.s_Horizon);
    BOOST_REQUIRE_EQUAL(24, forecast.s_SeasonalPeriod);
    BOOST_REQUIRE_EQUAL(0.95, forecast.s_Coverage);
    BOOST_REQUIRE_EQUAL(static_cast<int>(maths_t::E_AICc), static_cast<int>(forecast.s_Criterion));
    BOOST_TEST_REQUIRE(forecast.s_SelectOrder);
    BOOST_REQUIRE_EQUAL(std::string{"(1,1,1)(0,0,0)24"}, forecast.s_Order.print());
    BOOST_REQUIRE_EQUAL(2, forecast.s_MaxP);
    BOOST_REQUIRE_EQUAL(2, forecast.s_MaxQ);
    BOOST_REQUIRE_EQUAL(1, forecast.s_MaxSeasonalP);
    BOOST_REQUIRE_EQUAL(1, forecast.s_MaxSeasonalQ);
    BOOST_REQUIRE_EQUAL(500, forecast.s_MaxIterations);
    BOOST_REQUIRE_EQUAL(60000, forecast.s_TimeoutMs);

    auto aligner = config.aligner();
    BOOST_REQUIRE_EQUAL(3600, aligner.interval());
    BOOST_REQUIRE_EQUAL(3 * 86400, aligner.maxStaleness(model::CSeries::E_Price));
    BOOST_REQUIRE_EQUAL(8 * 86400, aligner.maxStaleness(model::CSeries::E_SearchTrend));
    BOOST_REQUIRE_EQUAL(37 * 86400, aligner.maxStaleness(model::CSeries::E_Macroeconomic));
    BOOST_REQUIRE_EQUAL(3 * 86400, aligner.maxStaleness(model::CSeries::E_Other));
}

BOOST_AUTO_TEST_CASE(testFullConfig) {
    CAnalysisConfig config;
    BOOST_TEST_REQUIRE(config.initFromString(FULL_CONFIG));

    const auto& series = config.series();
    BOOST_REQUIRE_EQUAL(5, series.size());
    BOOST_REQUIRE_EQUAL(std::string{"eth_usd"}, series[1].first);
    BOOST_REQUIRE_EQUAL(static_cast<int>(model::CSeries::E_Price), static_cast<int>(series[1].second));
    BOOST_REQUIRE_EQUAL(static_cast<int>(model::CSeries::E_SearchTrend),
                        static_cast<int>(series[2].second));
    BOOST_REQUIRE_EQUAL(static_cast<int>(model::CSeries::E_Macroeconomic),
                        static_cast<int>(series[3].second));
    BOOST_REQUIRE_EQUAL(static_cast<int>(model::CSeries::E_Other), static_cast<int>(series[4].second));
    BOOST_REQUIRE_EQUAL(std::string{"fx"}, config.seriesNames()[4]);
    BOOST_REQUIRE_EQUAL(1, config.returnColumns().size());

    BOOST_REQUIRE_EQUAL(604800, config.lookback());
    BOOST_REQUIRE_EQUAL(900, config.interval());
    BOOST_REQUIRE_EQUAL(4, config.retention());

    auto aligner = config.aligner();
    BOOST_REQUIRE_EQUAL(7200, aligner.maxStaleness(model::CSeries::E_Price));
    BOOST_REQUIRE_EQUAL(86400, aligner.maxStaleness(model::CSeries::E_SearchTrend));
    BOOST_REQUIRE_EQUAL(2678400, aligner.maxStaleness(model::CSeries::E_Macroeconomic));

    auto causality = config.causalityParams();
    BOOST_REQUIRE_EQUAL(3, causality.s_MaxLag);
    BOOST_REQUIRE_EQUAL(0.01, causality.s_Alpha);
    BOOST_REQUIRE_EQUAL(0.1, causality.s_StationarityAlpha);
    BOOST_REQUIRE_EQUAL(2, causality.s_AdfLags);
    BOOST_REQUIRE_EQUAL(1, causality.s_MaxDifferences);
    BOOST_REQUIRE_EQUAL(50, causality.s_MinimumSamples);
    BOOST_REQUIRE_EQUAL(20, causality.s_MaxPairs);
    BOOST_REQUIRE_EQUAL(1, causality.s_Targets.size());

    auto forecast = config.forecastParams();
    BOOST_REQUIRE_EQUAL(1, config.entities().size());
    BOOST_REQUIRE_EQUAL(2, forecast.s_Regressors.size());
    BOOST_REQUIRE_EQUAL(std::string{"cpi"}, forecast.s_Regressors[1]);
    BOOST_REQUIRE_EQUAL(48, forecast.s_Horizon);
    BOOST_REQUIRE_EQUAL(96, forecast.s_SeasonalPeriod);
    BOOST_REQUIRE_EQUAL(0.8, forecast.s_Coverage);
    BOOST_REQUIRE_EQUAL(static_cast<int>(maths_t::E_BIC), static_cast<int>(forecast.s_Criterion));
    BOOST_TEST_REQUIRE(forecast.s_SelectOrder == false);
    BOOST_REQUIRE_EQUAL(std::string{"(2,0,1)(1,0,0)96"}, forecast.s_Order.print());
    BOOST_REQUIRE_EQUAL(200, forecast.s_MaxIterations);
    BOOST_REQUIRE_EQUAL(5000, forecast.s_TimeoutMs);
}

BOOST_AUTO_TEST_CASE(testParameters) {
    CAnalysisConfig config;
    BOOST_TEST_REQUIRE(config.initFromString(FULL_CONFIG));

    auto parameters = config.parameters();
    BOOST_REQUIRE_EQUAL(std::string{"btc_usd:price,eth_usd:price,bitcoin:search_trend,cpi:macroeconomic,fx:other"},
                        parameters["series.names"]);
    BOOST_REQUIRE_EQUAL(std::string{"900"}, parameters["window.interval"]);
    BOOST_REQUIRE_EQUAL(std::string{"3"}, parameters["causality.max_lag"]);
    BOOST_REQUIRE_EQUAL(std::string{"bitcoin,cpi"}, parameters["forecast.regressors"]);
    BOOST_REQUIRE_EQUAL(std::string{"bic"}, parameters["forecast.criterion"]);
    BOOST_REQUIRE_EQUAL(std::string{"fixed"}, parameters["forecast.order_selection"]);
    BOOST_REQUIRE_EQUAL(std::string{"(2,0,1)(1,0,0)96"}, parameters["forecast.order"]);
    BOOST_REQUIRE_EQUAL(std::string{"4"}, parameters["history.retention"]);
}

BOOST_AUTO_TEST_CASE(testEntities) {
    // An explicitly empty list forecasts nothing.
    CAnalysisConfig config;
    BOOST_TEST_REQUIRE(config.initFromString("[series]\nnames = a:price\n[forecast]\nentities =\n"));
    BOOST_TEST_REQUIRE(config.entities().empty());

    BOOST_TEST_REQUIRE(config.initFromString("[series]\nnames = a:price, b\n[forecast]\nentities = b\n"));
    BOOST_REQUIRE_EQUAL(1, config.entities().size());
    BOOST_REQUIRE_EQUAL(std::string{"b"}, config.entities()[0]);

    BOOST_TEST_REQUIRE(initWith("[forecast]\nentities = c\n") == false);
}

BOOST_AUTO_TEST_CASE(testInvalid) {
    CAnalysisConfig config;
    BOOST_TEST_REQUIRE(config.initFromString("") == false);
    BOOST_TEST_REQUIRE(config.initFromString("[series]\nnames = a:equity\n") == false);
    BOOST_TEST_REQUIRE(config.initFromString("[series]\nnames = a, a\n") == false);
    BOOST_TEST_REQUIRE(config.initFromString("[series\nnames = a\n") == false);

    BOOST_TEST_REQUIRE(initWith(""));
    BOOST_TEST_REQUIRE(initWith("[window]\ninterval = 0\n") == false);
    BOOST_TEST_REQUIRE(initWith("[window]\ninterval = hourly\n") == false);
    BOOST_TEST_REQUIRE(initWith("[window]\nlookback = 60\n") == false);
    BOOST_TEST_REQUIRE(initWith("[window]\nmax_staleness = -1\n") == false);
    BOOST_TEST_REQUIRE(initWith("[correlation]\nmin_samples = 1\n") == false);
    BOOST_TEST_REQUIRE(initWith("[causality]\nmax_lag = 0\n") == false);
    BOOST_TEST_REQUIRE(initWith("[causality]\nalpha = 1.5\n") == false);
    BOOST_TEST_REQUIRE(initWith("[causality]\nstationarity_alpha = 0\n") == false);
    BOOST_TEST_REQUIRE(initWith("[causality]\nmax_differences = 3\n") == false);
    BOOST_TEST_REQUIRE(initWith("[forecast]\nhorizon = 0\n") == false);
    BOOST_TEST_REQUIRE(initWith("[forecast]\ncoverage = 1\n") == false);
    BOOST_TEST_REQUIRE(initWith("[forecast]\ncriterion = hqic\n") == false);
    BOOST_TEST_REQUIRE(initWith("[forecast]\norder_selection = random\n") == false);
    BOOST_TEST_REQUIRE(initWith("[forecast]\norder = 1,1\n") == false);
    BOOST_TEST_REQUIRE(initWith("[forecast]\nseasonal_order = 1,x,0\n") == false);
    BOOST_TEST_REQUIRE(initWith("[forecast]\nseasonal_period = 1\nseasonal_order = 1,0,0\n") == false);
    BOOST_TEST_REQUIRE(initWith("[forecast]\nseasonal_period = 1\n"));
    BOOST_TEST_REQUIRE(initWith("[history]\nretention = 0\n") == false);
}

BOOST_AUTO_TEST_CASE(testParseOrder) {
    CAnalysisConfig::TOrder order;
    BOOST_TEST_REQUIRE(CAnalysisConfig::parseOrder("3, 1, 2", false, order));
    BOOST_TEST_REQUIRE(CAnalysisConfig::parseOrder("1,1,0", true, order));
    order.s_Period = 7;
    BOOST_REQUIRE_EQUAL(std::string{"(3,1,2)(1,1,0)7"}, order.print());

    BOOST_TEST_REQUIRE(CAnalysisConfig::parseOrder("", false, order) == false);
    BOOST_TEST_REQUIRE(CAnalysisConfig::parseOrder("1,2,3,4", false, order) == false);
    BOOST_TEST_REQUIRE(CAnalysisConfig::parseOrder("1,-1,0", false, order) == false);
}

BOOST_AUTO_TEST_CASE(testInitFromFile) {
    test::CTestTmpDir tmpDir;
    std::string fileName{tmpDir.path("tsa.conf")};
    {
        std::ofstream strm{fileName};
        // With a byte order mark.
        strm << "\xEF\xBB\xBF" << FULL_CONFIG;
    }

    CAnalysisConfig config;
    BOOST_TEST_REQUIRE(config.init(fileName));
    BOOST_REQUIRE_EQUAL(5, config.series().size());
    BOOST_REQUIRE_EQUAL(std::string{"btc_usd"}, config.series()[0].first);

    BOOST_TEST_REQUIRE(config.init(tmpDir.path("missing.conf")) == false);
}

BOOST_AUTO_TEST_SUITE_END()
