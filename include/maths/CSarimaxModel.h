/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#ifndef INCLUDED_tsa_maths_CSarimaxModel_h
#define INCLUDED_tsa_maths_CSarimaxModel_h

#include <maths/CLinearAlgebraEigen.h>
#include <maths/ImportExport.h>
#include <maths/MathsTypes.h>

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace tsa {
namespace maths {

//! \brief A seasonal ARIMA model with exogenous regressors.
//!
//! DESCRIPTION:\n
//! Models \f$y_t = c + \beta^t x_t + \eta_t\f$ where the errors satisfy
//! <pre class="fragment">
//!   \f$\phi(B)\Phi(B^s)(1-B)^d(1-B^s)^D\eta_t = \theta(B)\Theta(B^s)e_t\f$
//! </pre>
//! The intercept is only estimated when the model is not differenced.
//!
//! The parameters are estimated by minimising the conditional sum of squares
//! of the one step ahead errors, which are computed by running the ARMA
//! recursion over the differenced series with the errors before the
//! conditioning start set to zero. The AR and MA polynomials are parameterised
//! by their partial autocorrelations, mapped to (-1, 1) with tanh, and then
//! converted to coefficients by the Durbin-Levinson recursion. This means
//! every point the optimiser visits is stationary and invertible, so the
//! problem is unconstrained and is minimised with L-BFGS.
//!
//! IMPLEMENTATION DECISIONS:\n
//! The differenced target and regressors are standardised before fitting so
//! the optimiser sees a well conditioned problem. All reported quantities,
//! i.e. the likelihood, variance and forecasts, are in the original units.
//!
//! Forecasts hold the regressors at their last observed value. The prediction
//! variance comes from the psi weights of the full model, including the
//! differencing, so interval widths never decrease with the horizon.
class MATHS_EXPORT CSarimaxModel {
public:
    using TDoubleVec = maths_t::TDoubleVec;
    using TCarryOnFunc = std::function<bool()>;

    //! \brief The model order (p,d,q)(P,D,Q)s.
    struct MATHS_EXPORT SOrder {
        std::size_t s_P = 0;
        std::size_t s_D = 0;
        std::size_t s_Q = 0;
        std::size_t s_SeasonalP = 0;
        std::size_t s_SeasonalD = 0;
        std::size_t s_SeasonalQ = 0;
        std::size_t s_Period = 0;

        //! The number of ARMA coefficients.
        std::size_t armaTerms() const;
        //! The number of lags the AR polynomial spans.
        std::size_t arSpan() const;
        //! Get a string such as "(1,1,1)(1,0,0)24".
        std::string print() const;
    };

    //! \brief A point and interval forecast.
    struct MATHS_EXPORT SForecast {
        TDoubleVec s_Mean;
        TDoubleVec s_Lower;
        TDoubleVec s_Upper;
        TDoubleVec s_Variance;
    };

    //! The finite difference step used for the objective gradient.
    static const double GRADIENT_STEP;
    //! The relative decrease at which the optimiser has converged.
    static const double CONVERGENCE_TOLERANCE;
    //! The rank of the Hessian approximation.
    static const std::size_t LBFGS_RANK;

public:
    explicit CSarimaxModel(const SOrder& order);

    //! Fit the model.
    //!
    //! \param[in] y The target, which must not have missing values.
    //! \param[in] exog The regressors, one column per regressor and one row
    //! per value of \p y. May have no columns.
    //! \param[in] burnIn The minimum index of the differenced series at which
    //! to start accumulating the sum of squares. Use the same value for every
    //! model being compared so their likelihoods are over the same sample.
    //! \param[in] maxIterations The maximum number of optimiser iterations.
    //! \param[in] carryOn Checked every iteration; the fit fails if this
    //! returns false before the optimiser converges.
    //! \param[out] error Why the fit failed.
    //! \return True if the model was fitted.
    bool fit(const TDoubleVec& y,
             const TDenseMatrix& exog,
             std::size_t burnIn,
             std::size_t maxIterations,
             const TCarryOnFunc& carryOn,
             std::string& error);

    //! Forecast \p horizon steps ahead with intervals at \p coverage.
    bool forecast(std::size_t horizon, double coverage, SForecast& result) const;

    //! Get the model order.
    const SOrder& order() const;

    //! Has the model been fitted?
    bool fitted() const;

    //! The conditional log likelihood of the fitted model.
    double logLikelihood() const;

    //! The number of free parameters including the error variance.
    std::size_t numberParameters() const;

    //! The number of observations in the sum of squares.
    std::size_t observations() const;

    //! The information criterion \p type of the fitted model.
    double informationCriterion(maths_t::EInformationCriterion type) const;

    //! The error variance.
    double sigma2() const;

    //! The root mean square one step ahead error.
    double residualRmse() const;

    //! The full AR polynomial \f$\phi(B)\Phi(B^s)\f$ coefficients in
    //! increasing powers of B, including the leading one.
    const TDoubleVec& arPolynomial() const;

    //! The full MA polynomial \f$\theta(B)\Theta(B^s)\f$ coefficients.
    const TDoubleVec& maPolynomial() const;

    //! The regression coefficients in original units, intercept first if
    //! there is one.
    TDoubleVec regressionCoefficients() const;

    //! Convert partial autocorrelations to the coefficients of the AR
    //! polynomial \f$1 - \sum_i \phi_i B^i\f$ (returns the \f$\phi_i\f$).
    static TDoubleVec partialAutocorrelationsToCoefficients(const TDoubleVec& pacf);

    //! The sample partial autocorrelations of \p x at lags 1 to \p lags.
    static TDoubleVec samplePartialAutocorrelations(const TDoubleVec& x, std::size_t lags);

private:
    //! \brief The unpacked model parameters.
    struct SParameters {
        TDoubleVec s_ArPolynomial;
        TDoubleVec s_MaPolynomial;
        double s_Intercept = 0.0;
        TDenseVector s_Beta;
    };

private:
    bool hasIntercept() const;
    std::size_t numberRegressionParameters() const;
    SParameters unpack(const TDenseVector& x) const;
    double sumSquares(const SParameters& parameters, TDoubleVec* residuals) const;
    void computeErrors(const SParameters& parameters, TDoubleVec& u) const;
    TDenseVector initialParameters() const;
    double objective(const TDenseVector& x) const;
    TDenseVector gradient(const TDenseVector& x) const;

private:
    SOrder m_Order;
    bool m_Fitted = false;

    //! The coefficients of the differencing polynomial.
    TDoubleVec m_Differencing;

    //! \name Data
    //@{
    TDoubleVec m_Y;
    TDenseMatrix m_Exog;
    //! The standardised differenced target.
    TDenseVector m_W;
    //! The standardised differenced regressors.
    TDenseMatrix m_Z;
    double m_ScaleY = 1.0;
    TDenseVector m_ScaleX;
    std::size_t m_Start = 0;
    //@}

    //! \name Fitted state
    //@{
    SParameters m_Parameters;
    TDoubleVec m_U;
    TDoubleVec m_Residuals;
    double m_SumSquares = 0.0;
    double m_LogLikelihood = 0.0;
    //@}
};
}
}

#endif // INCLUDED_tsa_maths_CSarimaxModel_h
