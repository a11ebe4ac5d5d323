/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <maths/CTools.h>

#include <core/CLogger.h>

#include <boost/math/distributions/normal.hpp>

#include <cmath>
#include <limits>

namespace tsa {
namespace maths {

double CTools::normalQuantile(double p) {
    if (!(p > 0.0 && p < 1.0)) {
        LOG_ERROR(<< "Bad probability " << p << " for normal quantile");
        return p <= 0.0 ? -std::numeric_limits<double>::infinity()
                        : std::numeric_limits<double>::infinity();
    }
    try {
        boost::math::normal_distribution<> normal(0.0, 1.0);
        return boost::math::quantile(normal, p);
    } catch (const std::exception& e) {
        LOG_ERROR(<< "Failed to compute normal quantile: " << e.what() << ", p = " << p);
    }
    return 0.0;
}

double CTools::normalCdf(double x) {
    if (std::isnan(x)) {
        LOG_ERROR(<< "Bad argument for normal c.d.f.");
        return 0.5;
    }
    if (std::isinf(x)) {
        return x > 0.0 ? 1.0 : 0.0;
    }
    try {
        boost::math::normal_distribution<> normal(0.0, 1.0);
        return boost::math::cdf(normal, x);
    } catch (const std::exception& e) {
        LOG_ERROR(<< "Failed to compute normal c.d.f.: " << e.what() << ", x = " << x);
    }
    return 0.5;
}

CTools::TOptionalDoubleVec CTools::difference(const TOptionalDoubleVec& x) {
    TOptionalDoubleVec result(x.size());
    for (std::size_t i = 1; i < x.size(); ++i) {
        if (x[i] && x[i - 1]) {
            result[i] = *x[i] - *x[i - 1];
        }
    }
    return result;
}

CTools::TDoubleVec CTools::multiplyPolynomials(const TDoubleVec& a, const TDoubleVec& b) {
    if (a.empty() || b.empty()) {
        return {};
    }
    TDoubleVec result(a.size() + b.size() - 1, 0.0);
    for (std::size_t i = 0; i < a.size(); ++i) {
        for (std::size_t j = 0; j < b.size(); ++j) {
            result[i + j] += a[i] * b[j];
        }
    }
    return result;
}

CTools::TDoubleVec CTools::differencingPolynomial(std::size_t d, std::size_t D, std::size_t s) {
    TDoubleVec result{1.0};
    for (std::size_t i = 0; i < d; ++i) {
        result = multiplyPolynomials(result, {1.0, -1.0});
    }
    if (s > 0) {
        TDoubleVec seasonal(s + 1, 0.0);
        seasonal[0] = 1.0;
        seasonal[s] = -1.0;
        for (std::size_t i = 0; i < D; ++i) {
            result = multiplyPolynomials(result, seasonal);
        }
    }
    return result;
}
}
}
