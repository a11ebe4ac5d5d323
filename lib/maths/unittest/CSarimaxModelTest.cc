/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <core/CLogger.h>

#include <maths/CSarimaxModel.h>

#include <test/BoostTestCloseAbsolute.h>
#include <test/CRandomNumbers.h>

#include <boost/math/constants/constants.hpp>
#include <boost/test/unit_test.hpp>

#include <cmath>
#include <limits>
#include <string>
#include <vector>

BOOST_AUTO_TEST_SUITE(CSarimaxModelTest)

using namespace tsa;
using namespace maths;

namespace {
using TDoubleVec = std::vector<double>;
using TOrder = CSarimaxModel::SOrder;

TOrder order(std::size_t p, std::size_t d, std::size_t q,
             std::size_t sp = 0, std::size_t sd = 0, std::size_t sq = 0,
             std::size_t period = 0) {
    TOrder result;
    result.s_P = p;
    result.s_D = d;
    result.s_Q = q;
    result.s_SeasonalP = sp;
    result.s_SeasonalD = sd;
    result.s_SeasonalQ = sq;
    result.s_Period = period;
    return result;
}

TDoubleVec ar1(test::CRandomNumbers& rng, double phi, double mean, std::size_t n) {
    TDoubleVec noise;
    rng.generateNormalSamples(0.0, 1.0, n, noise);
    TDoubleVec result(n);
    double x{0.0};
    for (std::size_t t = 0; t < n; ++t) {
        x = phi * x + noise[t];
        result[t] = mean + x;
    }
    return result;
}

const TDenseMatrix NO_REGRESSORS;
const CSarimaxModel::TCarryOnFunc ALWAYS{[] { return true; }};
}

BOOST_AUTO_TEST_CASE(testOrder) {
    TOrder seasonal{order(1, 1, 1, 1, 0, 1, 24)};
    BOOST_REQUIRE_EQUAL(4, seasonal.armaTerms());
    BOOST_REQUIRE_EQUAL(25, seasonal.arSpan());
    BOOST_REQUIRE_EQUAL(std::string{"(1,1,1)(1,0,1)24"}, seasonal.print());
    BOOST_REQUIRE_EQUAL(std::string{"(2,0,0)(0,0,0)0"}, order(2, 0, 0).print());
}

BOOST_AUTO_TEST_CASE(testPartialAutocorrelations) {
    TDoubleVec coeffs{CSarimaxModel::partialAutocorrelationsToCoefficients({0.5, 0.2})};
    BOOST_REQUIRE_EQUAL(2, coeffs.size());
    BOOST_REQUIRE_CLOSE_ABSOLUTE(0.4, coeffs[0], 1e-12);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(0.2, coeffs[1], 1e-12);

    // Check the sample partial autocorrelations of an AR(1).
    test::CRandomNumbers rng;
    TDoubleVec x{ar1(rng, 0.6, 0.0, 2000)};
    TDoubleVec pacf{CSarimaxModel::samplePartialAutocorrelations(x, 3)};
    BOOST_REQUIRE_EQUAL(3, pacf.size());
    BOOST_REQUIRE_CLOSE_ABSOLUTE(0.6, pacf[0], 0.05);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(0.0, pacf[1], 0.07);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(0.0, pacf[2], 0.07);
}

BOOST_AUTO_TEST_CASE(testFitAr1) {
    test::CRandomNumbers rng;
    TDoubleVec y{ar1(rng, 0.7, 50.0, 1000)};

    CSarimaxModel model{order(1, 0, 0)};
    std::string error;
    BOOST_TEST_REQUIRE(model.fit(y, NO_REGRESSORS, 0, 500, ALWAYS, error), error);
    BOOST_TEST_REQUIRE(model.fitted());

    const TDoubleVec& ar{model.arPolynomial()};
    BOOST_REQUIRE_EQUAL(2, ar.size());
    LOG_DEBUG(<< "phi = " << -ar[1]);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(0.7, -ar[1], 0.08);

    // Intercept is the mean.
    TDoubleVec regression{model.regressionCoefficients()};
    BOOST_REQUIRE_EQUAL(1, regression.size());
    BOOST_REQUIRE_CLOSE_ABSOLUTE(50.0, regression[0], 1.0);

    BOOST_REQUIRE_EQUAL(3, model.numberParameters());
    BOOST_REQUIRE_EQUAL(999, model.observations());
    BOOST_REQUIRE_CLOSE_ABSOLUTE(1.0, model.residualRmse(), 0.1);
    BOOST_TEST_REQUIRE(model.informationCriterion(maths_t::E_AICc) >
                       model.informationCriterion(maths_t::E_AIC));
    BOOST_TEST_REQUIRE(model.informationCriterion(maths_t::E_BIC) >
                       model.informationCriterion(maths_t::E_AIC));
}

BOOST_AUTO_TEST_CASE(testForecastAr1) {
    test::CRandomNumbers rng;
    TDoubleVec y{ar1(rng, 0.7, 50.0, 1000)};

    CSarimaxModel model{order(1, 0, 0)};
    std::string error;
    BOOST_TEST_REQUIRE(model.fit(y, NO_REGRESSORS, 0, 500, ALWAYS, error), error);

    CSarimaxModel::SForecast forecast;
    BOOST_TEST_REQUIRE(model.forecast(50, 0.95, forecast));
    BOOST_REQUIRE_EQUAL(50, forecast.s_Mean.size());
    BOOST_REQUIRE_EQUAL(50, forecast.s_Lower.size());
    BOOST_REQUIRE_EQUAL(50, forecast.s_Upper.size());

    double lastWidth{0.0};
    for (std::size_t h = 0; h < 50; ++h) {
        BOOST_TEST_REQUIRE(forecast.s_Lower[h] < forecast.s_Mean[h]);
        BOOST_TEST_REQUIRE(forecast.s_Mean[h] < forecast.s_Upper[h]);
        double width{forecast.s_Upper[h] - forecast.s_Lower[h]};
        BOOST_TEST_REQUIRE(width >= lastWidth);
        lastWidth = width;
    }
    // One step ahead variance is the innovation variance.
    BOOST_REQUIRE_CLOSE_ABSOLUTE(model.sigma2(), forecast.s_Variance[0], 1e-10);
    // The forecast reverts to the mean and the interval to the marginal one.
    BOOST_REQUIRE_CLOSE_ABSOLUTE(50.0, forecast.s_Mean[49], 1.0);
    double marginal{2.0 * 1.959964 * std::sqrt(1.0 / (1.0 - 0.49))};
    BOOST_REQUIRE_CLOSE_ABSOLUTE(marginal, lastWidth, 0.2 * marginal);
}

BOOST_AUTO_TEST_CASE(testRandomWalk) {
    // ARIMA(0,1,0) forecasts the last value with linearly growing variance.

    test::CRandomNumbers rng;
    TDoubleVec y;
    rng.generateRandomWalk(20.0, 1.0, 200, y);

    CSarimaxModel model{order(0, 1, 0)};
    std::string error;
    BOOST_TEST_REQUIRE(model.fit(y, NO_REGRESSORS, 0, 500, ALWAYS, error), error);

    CSarimaxModel::SForecast forecast;
    BOOST_TEST_REQUIRE(model.forecast(5, 0.9, forecast));
    for (std::size_t h = 0; h < 5; ++h) {
        BOOST_REQUIRE_CLOSE_ABSOLUTE(y.back(), forecast.s_Mean[h], 1e-10);
        BOOST_REQUIRE_CLOSE_ABSOLUTE(static_cast<double>(h + 1) * model.sigma2(),
                                     forecast.s_Variance[h], 1e-10);
    }
}

BOOST_AUTO_TEST_CASE(testSeasonal) {
    // Seasonal differencing repeats the last season.

    test::CRandomNumbers rng;
    TDoubleVec noise;
    rng.generateNormalSamples(0.0, 0.25, 24 * 20, noise);
    TDoubleVec y(24 * 20);
    for (std::size_t t = 0; t < y.size(); ++t) {
        y[t] = 10.0 + 5.0 * std::sin(boost::math::double_constants::two_pi *
                                     static_cast<double>(t) / 24.0) +
               noise[t];
    }

    CSarimaxModel naive{order(0, 0, 0, 0, 1, 0, 24)};
    std::string error;
    BOOST_TEST_REQUIRE(naive.fit(y, NO_REGRESSORS, 0, 500, ALWAYS, error), error);
    CSarimaxModel::SForecast forecast;
    BOOST_TEST_REQUIRE(naive.forecast(24, 0.95, forecast));
    for (std::size_t h = 0; h < 24; ++h) {
        BOOST_REQUIRE_CLOSE_ABSOLUTE(y[y.size() - 24 + h], forecast.s_Mean[h], 1e-10);
    }

    CSarimaxModel model{order(1, 0, 0, 0, 1, 1, 24)};
    BOOST_TEST_REQUIRE(model.fit(y, NO_REGRESSORS, 0, 500, ALWAYS, error), error);
    BOOST_TEST_REQUIRE(model.forecast(5, 0.95, forecast));
    BOOST_REQUIRE_EQUAL(5, forecast.s_Mean.size());
    double lastWidth{0.0};
    for (std::size_t h = 0; h < 5; ++h) {
        double expected{10.0 + 5.0 * std::sin(boost::math::double_constants::two_pi *
                                              static_cast<double>(y.size() + h) / 24.0)};
        BOOST_REQUIRE_CLOSE_ABSOLUTE(expected, forecast.s_Mean[h], 1.0);
        double width{forecast.s_Upper[h] - forecast.s_Lower[h]};
        BOOST_TEST_REQUIRE(width >= lastWidth);
        lastWidth = width;
    }
}

BOOST_AUTO_TEST_CASE(testRegressors) {
    // y(t) = 3 + 2 x(t) + AR(1) noise.

    test::CRandomNumbers rng;
    TDoubleVec x;
    rng.generateUniformSamples(-5.0, 5.0, 500, x);
    TDoubleVec noise{ar1(rng, 0.5, 0.0, 500)};

    TDoubleVec y(500);
    TDenseMatrix exog(500, 1);
    for (std::size_t t = 0; t < 500; ++t) {
        y[t] = 3.0 + 2.0 * x[t] + noise[t];
        exog(t, 0) = x[t];
    }

    CSarimaxModel model{order(1, 0, 0)};
    std::string error;
    BOOST_TEST_REQUIRE(model.fit(y, exog, 0, 500, ALWAYS, error), error);

    TDoubleVec regression{model.regressionCoefficients()};
    BOOST_REQUIRE_EQUAL(2, regression.size());
    BOOST_REQUIRE_CLOSE_ABSOLUTE(3.0, regression[0], 0.5);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(2.0, regression[1], 0.05);
    BOOST_REQUIRE_EQUAL(4, model.numberParameters());

    // The regressor is held at its last value.
    CSarimaxModel::SForecast forecast;
    BOOST_TEST_REQUIRE(model.forecast(200, 0.95, forecast));
    BOOST_REQUIRE_CLOSE_ABSOLUTE(3.0 + 2.0 * x.back(), forecast.s_Mean.back(), 0.6);
}

BOOST_AUTO_TEST_CASE(testBurnIn) {
    test::CRandomNumbers rng;
    TDoubleVec y{ar1(rng, 0.5, 0.0, 300)};

    CSarimaxModel model{order(1, 0, 0)};
    std::string error;
    BOOST_TEST_REQUIRE(model.fit(y, NO_REGRESSORS, 25, 500, ALWAYS, error), error);
    BOOST_REQUIRE_EQUAL(275, model.observations());
}

BOOST_AUTO_TEST_CASE(testFailures) {
    test::CRandomNumbers rng;
    TDoubleVec y{ar1(rng, 0.5, 0.0, 100)};
    std::string error;

    {
        CSarimaxModel model{order(0, 0, 0, 1, 0, 0, 1)};
        BOOST_TEST_REQUIRE(model.fit(y, NO_REGRESSORS, 0, 500, ALWAYS, error) == false);
        LOG_DEBUG(<< error);
        BOOST_TEST_REQUIRE(error.find("period") != std::string::npos);
    }
    {
        CSarimaxModel model{order(1, 0, 0)};
        TDenseMatrix exog{TDenseMatrix::Zero(99, 1)};
        BOOST_TEST_REQUIRE(model.fit(y, exog, 0, 500, ALWAYS, error) == false);
        LOG_DEBUG(<< error);
    }
    {
        CSarimaxModel model{order(1, 0, 0)};
        TDoubleVec bad{y};
        bad[10] = std::numeric_limits<double>::quiet_NaN();
        BOOST_TEST_REQUIRE(model.fit(bad, NO_REGRESSORS, 0, 500, ALWAYS, error) == false);
        LOG_DEBUG(<< error);
    }
    {
        CSarimaxModel model{order(2, 1, 2)};
        TDoubleVec shortSeries(y.begin(), y.begin() + 6);
        BOOST_TEST_REQUIRE(model.fit(shortSeries, NO_REGRESSORS, 0, 500, ALWAYS, error) == false);
        LOG_DEBUG(<< error);
        BOOST_TEST_REQUIRE(error.find("too few") != std::string::npos);
    }
    {
        // Stopping the fit.
        CSarimaxModel model{order(1, 0, 1)};
        BOOST_TEST_REQUIRE(model.fit(y, NO_REGRESSORS, 0, 500, [] { return false; },
                                     error) == false);
        LOG_DEBUG(<< error);
        BOOST_TEST_REQUIRE(error.find("time budget") != std::string::npos);
        BOOST_TEST_REQUIRE(model.fitted() == false);

        CSarimaxModel::SForecast forecast;
        BOOST_TEST_REQUIRE(model.forecast(5, 0.95, forecast) == false);
    }
    {
        CSarimaxModel model{order(1, 0, 0)};
        BOOST_TEST_REQUIRE(model.fit(y, NO_REGRESSORS, 0, 500, ALWAYS, error), error);
        CSarimaxModel::SForecast forecast;
        BOOST_TEST_REQUIRE(model.forecast(5, 1.0, forecast) == false);
    }
}

BOOST_AUTO_TEST_SUITE_END()
