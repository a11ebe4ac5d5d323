/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_tsa_maths_CLeastSquares_h
#define INCLUDED_tsa_maths_CLeastSquares_h

#include <core/CNonInstantiatable.h>

#include <maths/CLinearAlgebraEigen.h>
#include <maths/ImportExport.h>

#include <cstddef>

namespace tsa {
namespace maths {

//! \brief Ordinary least squares regression.
//!
//! DESCRIPTION:\n
//! Solves \f$\min_{\beta}\|y - X\beta\|^2\f$ using a column pivoting QR
//! decomposition of the design matrix, which is stable for the small, and
//! sometimes nearly collinear, lagged designs used by the unit root and
//! Granger tests.
class MATHS_EXPORT CLeastSquares : private core::CNonInstantiatable {
public:
    //! \brief The result of a fit.
    struct MATHS_EXPORT SResult {
        //! The fitted coefficients.
        TDenseVector s_Coefficients;
        //! The coefficients' standard errors.
        TDenseVector s_StandardErrors;
        //! The residual sum of squares.
        double s_ResidualSumSquares = 0.0;
        //! The number of observations.
        std::size_t s_Observations = 0;
        //! The residual degrees of freedom.
        std::size_t s_DegreesFreedom = 0;
    };

public:
    //! Fit \p y on the columns of \p x.
    //!
    //! \return False if there are no residual degrees of freedom or the
    //! design is rank deficient.
    static bool fit(const TDenseMatrix& x, const TDenseVector& y, SResult& result);

    //! The t statistic of the \p i'th coefficient of \p result.
    static double tStatistic(const SResult& result, std::size_t i);
};
}
}

#endif // INCLUDED_tsa_maths_CLeastSquares_h
