/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <maths/CLeastSquares.h>

#include <core/CLogger.h>

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>
#include <limits>

namespace tsa {
namespace maths {

bool CLeastSquares::fit(const TDenseMatrix& x, const TDenseVector& y, SResult& result) {
    if (x.rows() != y.size()) {
        LOG_ERROR(<< "Dimension mismatch: " << x.rows() << " rows vs " << y.size() << " targets");
        return false;
    }
    auto n = static_cast<std::size_t>(x.rows());
    auto k = static_cast<std::size_t>(x.cols());
    if (k == 0 || n <= k) {
        LOG_TRACE(<< "No residual degrees of freedom: n = " << n << ", k = " << k);
        return false;
    }

    Eigen::ColPivHouseholderQR<TDenseMatrix> qr(x);
    if (static_cast<std::size_t>(qr.rank()) < k) {
        LOG_TRACE(<< "Design matrix is rank deficient: rank = " << qr.rank() << ", k = " << k);
        return false;
    }

    result.s_Coefficients = qr.solve(y);
    TDenseVector residuals{y - x * result.s_Coefficients};
    result.s_ResidualSumSquares = residuals.squaredNorm();
    result.s_Observations = n;
    result.s_DegreesFreedom = n - k;

    double sigma2{result.s_ResidualSumSquares / static_cast<double>(n - k)};
    TDenseMatrix xtx{x.transpose() * x};
    TDenseMatrix covariance{xtx.ldlt().solve(TDenseMatrix::Identity(k, k))};
    result.s_StandardErrors.resize(k);
    for (std::size_t i = 0; i < k; ++i) {
        result.s_StandardErrors(i) = std::sqrt(std::max(sigma2 * covariance(i, i), 0.0));
    }

    if (result.s_Coefficients.allFinite() == false) {
        LOG_ERROR(<< "Non-finite least squares solution");
        return false;
    }

    return true;
}

double CLeastSquares::tStatistic(const SResult& result, std::size_t i) {
    double se{result.s_StandardErrors(i)};
    if (se <= 0.0) {
        double beta{result.s_Coefficients(i)};
        return beta == 0.0 ? 0.0
                           : std::copysign(std::numeric_limits<double>::infinity(), beta);
    }
    return result.s_Coefficients(i) / se;
}
}
}
