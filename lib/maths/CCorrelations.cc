/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <maths/CCorrelations.h>

#include <core/CLogger.h>

#include <maths/CTools.h>

#include <algorithm>
#include <cmath>

namespace tsa {
namespace maths {

CCorrelations::TOptionalDouble CCorrelations::pearson(const TOptionalDoubleVec& x,
                                                      const TOptionalDoubleVec& y,
                                                      std::size_t& samples) {
    samples = 0;
    std::size_t n{std::min(x.size(), y.size())};
    if (x.size() != y.size()) {
        LOG_ERROR(<< "Length mismatch " << x.size() << " vs " << y.size());
    }

    // Two passes for numerical stability: means then centred moments.
    double mx{0.0};
    double my{0.0};
    for (std::size_t i = 0; i < n; ++i) {
        if (x[i] && y[i]) {
            ++samples;
            mx += *x[i];
            my += *y[i];
        }
    }
    if (samples < 2) {
        return {};
    }
    mx /= static_cast<double>(samples);
    my /= static_cast<double>(samples);

    double sxx{0.0};
    double syy{0.0};
    double sxy{0.0};
    for (std::size_t i = 0; i < n; ++i) {
        if (x[i] && y[i]) {
            double dx{*x[i] - mx};
            double dy{*y[i] - my};
            sxx += dx * dx;
            syy += dy * dy;
            sxy += dx * dy;
        }
    }
    if (sxx <= 0.0 || syy <= 0.0) {
        return {};
    }

    double result{sxy / std::sqrt(sxx * syy)};
    if (std::isfinite(result) == false) {
        return {};
    }
    return CTools::truncate(result, -1.0, 1.0);
}
}
}
