/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <maths/CSarimaxModel.h>

#include <core/CLogger.h>

#include <maths/CInformationCriteria.h>
#include <maths/CLbfgs.h>
#include <maths/CLeastSquares.h>
#include <maths/CTools.h>

#include <boost/math/constants/constants.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <tuple>
#include <utility>

namespace tsa {
namespace maths {
namespace {
using TDoubleVec = std::vector<double>;

//! Keep partial autocorrelations strictly inside (-1, 1).
const double MAXIMUM_PARTIAL_AUTOCORRELATION{0.9999};
//! The largest initial partial autocorrelation.
const double MAXIMUM_INITIAL_PARTIAL_AUTOCORRELATION{0.9};

double standardDeviation(const TDenseVector& x) {
    if (x.size() < 2) {
        return 0.0;
    }
    double mean{x.mean()};
    double variance{(x.array() - mean).square().sum() / static_cast<double>(x.size() - 1)};
    return std::sqrt(variance);
}

//! Get the nonzero coefficients of \p polynomial, excluding the constant term.
std::vector<std::pair<std::size_t, double>> sparse(const TDoubleVec& polynomial) {
    std::vector<std::pair<std::size_t, double>> result;
    for (std::size_t i = 1; i < polynomial.size(); ++i) {
        if (polynomial[i] != 0.0) {
            result.emplace_back(i, polynomial[i]);
        }
    }
    return result;
}
}

const double CSarimaxModel::GRADIENT_STEP{1e-6};
const double CSarimaxModel::CONVERGENCE_TOLERANCE{1e-8};
const std::size_t CSarimaxModel::LBFGS_RANK{5};

std::size_t CSarimaxModel::SOrder::armaTerms() const {
    return s_P + s_Q + s_SeasonalP + s_SeasonalQ;
}

std::size_t CSarimaxModel::SOrder::arSpan() const {
    return s_P + s_Period * s_SeasonalP;
}

std::string CSarimaxModel::SOrder::print() const {
    std::ostringstream result;
    result << '(' << s_P << ',' << s_D << ',' << s_Q << ")(" << s_SeasonalP << ','
           << s_SeasonalD << ',' << s_SeasonalQ << ')' << s_Period;
    return result.str();
}

CSarimaxModel::CSarimaxModel(const SOrder& order) : m_Order{order} {
}

bool CSarimaxModel::fit(const TDoubleVec& y,
                        const TDenseMatrix& exog,
                        std::size_t burnIn,
                        std::size_t maxIterations,
                        const TCarryOnFunc& carryOn,
                        std::string& error) {
    m_Fitted = false;

    std::size_t seasonalTerms{m_Order.s_SeasonalP + m_Order.s_SeasonalD + m_Order.s_SeasonalQ};
    if (seasonalTerms > 0 && m_Order.s_Period < 2) {
        error = "seasonal terms need a period of at least 2, got " +
                std::to_string(m_Order.s_Period);
        return false;
    }
    if (exog.cols() > 0 && static_cast<std::size_t>(exog.rows()) != y.size()) {
        error = "regressors have " + std::to_string(exog.rows()) +
                " rows but the target has " + std::to_string(y.size());
        return false;
    }
    if (std::all_of(y.begin(), y.end(), [](double yi) { return std::isfinite(yi); }) == false ||
        exog.allFinite() == false) {
        error = "input contains non-finite values";
        return false;
    }

    m_Differencing = CTools::differencingPolynomial(
        m_Order.s_D, m_Order.s_SeasonalD, seasonalTerms > 0 ? m_Order.s_Period : 0);
    std::size_t nd{m_Differencing.size() - 1};
    std::size_t n{y.size()};
    if (n <= nd) {
        error = "series of length " + std::to_string(n) + " is too short to difference";
        return false;
    }

    std::size_t m{n - nd};
    auto kx = static_cast<std::size_t>(exog.cols());

    m_Y = y;
    m_Exog = exog.cols() > 0 ? exog : TDenseMatrix(n, 0);

    m_W = TDenseVector::Zero(m);
    m_Z = TDenseMatrix::Zero(m, kx);
    for (std::size_t t = 0; t < m; ++t) {
        for (std::size_t i = 0; i <= nd; ++i) {
            m_W(t) += m_Differencing[i] * y[t + nd - i];
            if (kx > 0) {
                m_Z.row(t) += m_Differencing[i] * m_Exog.row(t + nd - i);
            }
        }
    }

    m_ScaleY = standardDeviation(m_W);
    if (!(m_ScaleY > 0.0 && std::isfinite(m_ScaleY))) {
        m_ScaleY = 1.0;
    }
    m_W /= m_ScaleY;
    m_ScaleX = TDenseVector::Ones(kx);
    for (std::size_t j = 0; j < kx; ++j) {
        double scale{standardDeviation(m_Z.col(j))};
        if (scale > 0.0 && std::isfinite(scale)) {
            m_ScaleX(j) = scale;
            m_Z.col(j) /= scale;
        }
    }

    m_Start = std::max(m_Order.arSpan(), burnIn);
    std::size_t k{m_Order.armaTerms() + this->numberRegressionParameters()};
    if (m_Start >= m || m - m_Start < k + 3) {
        error = "too few observations: " + std::to_string(m > m_Start ? m - m_Start : 0) +
                " for " + std::to_string(k) + " parameters";
        return false;
    }

    CLbfgs<TDenseVector> lbfgs{LBFGS_RANK};
    bool timedOut{false};
    TDenseVector x;
    double fx;
    std::tie(x, fx) = lbfgs.minimize(
        [this](const TDenseVector& x_) { return this->objective(x_); },
        [this](const TDenseVector& x_) { return this->gradient(x_); },
        this->initialParameters(), CONVERGENCE_TOLERANCE, maxIterations, [&] {
            if (carryOn != nullptr && carryOn() == false) {
                timedOut = true;
                return false;
            }
            return true;
        });

    if (std::isfinite(fx) == false) {
        error = "non-finite sum of squares";
        return false;
    }
    if (lbfgs.converged() == false) {
        error = (timedOut ? "exceeded time budget after " : "did not converge within ") +
                std::to_string(lbfgs.iterations()) + " iterations";
        return false;
    }

    m_Parameters = this->unpack(x);
    m_SumSquares = this->sumSquares(m_Parameters, &m_Residuals);
    this->computeErrors(m_Parameters, m_U);

    double neff{static_cast<double>(m - m_Start)};
    double mse{std::max(m_SumSquares / neff, std::numeric_limits<double>::min())};
    m_LogLikelihood = -0.5 * neff *
                          (std::log(boost::math::double_constants::two_pi) +
                           std::log(mse) + 1.0) -
                      neff * std::log(m_ScaleY);
    m_Fitted = true;

    LOG_TRACE(<< "Fitted " << m_Order.print() << " in " << lbfgs.iterations()
              << " iterations, log-likelihood = " << m_LogLikelihood);

    return true;
}

bool CSarimaxModel::forecast(std::size_t horizon, double coverage, SForecast& result) const {
    if (m_Fitted == false) {
        LOG_ERROR(<< "Can't forecast with an unfitted model");
        return false;
    }
    if (!(coverage > 0.0 && coverage < 1.0)) {
        LOG_ERROR(<< "Bad interval coverage " << coverage);
        return false;
    }

    std::size_t nd{m_Differencing.size() - 1};
    std::size_t n{m_Y.size()};
    std::size_t m{static_cast<std::size_t>(m_W.size())};
    auto kx = static_cast<std::size_t>(m_Exog.cols());
    const SParameters& parameters{m_Parameters};

    auto ar = sparse(parameters.s_ArPolynomial);
    auto ma = sparse(parameters.s_MaPolynomial);

    // Extend the ARMA errors: future shocks are zero.
    TDoubleVec u{m_U};
    TDoubleVec e{m_Residuals};
    u.resize(m + horizon, 0.0);
    e.resize(m + horizon, 0.0);
    for (std::size_t t = m; t < m + horizon; ++t) {
        double ut{0.0};
        for (const auto& term : ar) {
            ut -= term.second * u[t - term.first];
        }
        for (const auto& term : ma) {
            if (t >= term.first) {
                ut += term.second * e[t - term.first];
            }
        }
        u[t] = ut;
    }

    // The regressors are held at their last observed value.
    auto rawExog = [&](std::size_t i) {
        return m_Exog.row(std::min(i, n - 1));
    };

    TDoubleVec y{m_Y};
    y.resize(n + horizon, 0.0);
    for (std::size_t h = 0; h < horizon; ++h) {
        std::size_t t{m + h};
        double w{u[t]};
        if (this->hasIntercept()) {
            w += parameters.s_Intercept;
        }
        for (std::size_t j = 0; j < kx; ++j) {
            double z{0.0};
            for (std::size_t i = 0; i <= nd; ++i) {
                z += m_Differencing[i] * rawExog(t + nd - i)(j);
            }
            w += parameters.s_Beta(j) * z / m_ScaleX(j);
        }
        double yt{w * m_ScaleY};
        for (std::size_t i = 1; i <= nd; ++i) {
            yt -= m_Differencing[i] * y[n + h - i];
        }
        y[n + h] = yt;
    }

    // Psi weights of the integrated model.
    TDoubleVec integratedAr{CTools::multiplyPolynomials(parameters.s_ArPolynomial, m_Differencing)};
    TDoubleVec psi(horizon, 0.0);
    for (std::size_t j = 0; j < horizon; ++j) {
        double psij{j == 0 ? 1.0
                           : (j < parameters.s_MaPolynomial.size() ? parameters.s_MaPolynomial[j]
                                                                   : 0.0)};
        for (std::size_t i = 1; i <= std::min(j, integratedAr.size() - 1); ++i) {
            psij -= integratedAr[i] * psi[j - i];
        }
        psi[j] = psij;
    }

    double sigma2{this->sigma2()};
    double z{CTools::normalQuantile(0.5 * (1.0 + coverage))};

    result.s_Mean.assign(y.begin() + n, y.end());
    result.s_Variance.resize(horizon);
    result.s_Lower.resize(horizon);
    result.s_Upper.resize(horizon);
    double cumulative{0.0};
    for (std::size_t h = 0; h < horizon; ++h) {
        cumulative += psi[h] * psi[h];
        result.s_Variance[h] = sigma2 * cumulative;
        double width{z * std::sqrt(result.s_Variance[h])};
        result.s_Lower[h] = result.s_Mean[h] - width;
        result.s_Upper[h] = result.s_Mean[h] + width;
    }

    return true;
}

const CSarimaxModel::SOrder& CSarimaxModel::order() const {
    return m_Order;
}

bool CSarimaxModel::fitted() const {
    return m_Fitted;
}

double CSarimaxModel::logLikelihood() const {
    return m_LogLikelihood;
}

std::size_t CSarimaxModel::numberParameters() const {
    return m_Order.armaTerms() + this->numberRegressionParameters() + 1;
}

std::size_t CSarimaxModel::observations() const {
    return static_cast<std::size_t>(m_W.size()) - m_Start;
}

double CSarimaxModel::informationCriterion(maths_t::EInformationCriterion type) const {
    return CInformationCriteria::compute(type, m_LogLikelihood,
                                         this->numberParameters(), this->observations());
}

double CSarimaxModel::sigma2() const {
    // The error variance excludes itself from the parameter count.
    double dof{static_cast<double>(this->observations()) -
               static_cast<double>(this->numberParameters() - 1)};
    return m_SumSquares / dof * m_ScaleY * m_ScaleY;
}

double CSarimaxModel::residualRmse() const {
    return std::sqrt(m_SumSquares / static_cast<double>(this->observations())) * m_ScaleY;
}

const CSarimaxModel::TDoubleVec& CSarimaxModel::arPolynomial() const {
    return m_Parameters.s_ArPolynomial;
}

const CSarimaxModel::TDoubleVec& CSarimaxModel::maPolynomial() const {
    return m_Parameters.s_MaPolynomial;
}

CSarimaxModel::TDoubleVec CSarimaxModel::regressionCoefficients() const {
    TDoubleVec result;
    if (this->hasIntercept()) {
        result.push_back(m_Parameters.s_Intercept * m_ScaleY);
    }
    for (std::ptrdiff_t j = 0; j < m_Parameters.s_Beta.size(); ++j) {
        result.push_back(m_Parameters.s_Beta(j) * m_ScaleY / m_ScaleX(j));
    }
    return result;
}

CSarimaxModel::TDoubleVec
CSarimaxModel::partialAutocorrelationsToCoefficients(const TDoubleVec& pacf) {
    // Durbin-Levinson: phi(k,k) = r(k), phi(k,j) = phi(k-1,j) - r(k) phi(k-1,k-j).
    TDoubleVec result;
    result.reserve(pacf.size());
    for (std::size_t k = 0; k < pacf.size(); ++k) {
        TDoubleVec next(k + 1);
        for (std::size_t j = 0; j < k; ++j) {
            next[j] = result[j] - pacf[k] * result[k - 1 - j];
        }
        next[k] = pacf[k];
        result.swap(next);
    }
    return result;
}

CSarimaxModel::TDoubleVec CSarimaxModel::samplePartialAutocorrelations(const TDoubleVec& x,
                                                                        std::size_t lags) {
    TDoubleVec result(lags, 0.0);
    std::size_t n{x.size()};
    if (n < 2 || lags == 0) {
        return result;
    }

    double mean{0.0};
    for (auto xi : x) {
        mean += xi;
    }
    mean /= static_cast<double>(n);

    TDoubleVec rho(lags + 1, 0.0);
    for (std::size_t k = 0; k <= lags && k < n; ++k) {
        for (std::size_t t = k; t < n; ++t) {
            rho[k] += (x[t] - mean) * (x[t - k] - mean);
        }
    }
    if (rho[0] <= 0.0) {
        return result;
    }
    for (std::size_t k = lags; k > 0; --k) {
        rho[k] /= rho[0];
    }
    rho[0] = 1.0;

    TDoubleVec phi;
    for (std::size_t k = 1; k <= lags; ++k) {
        double numerator{rho[k]};
        double denominator{1.0};
        for (std::size_t j = 1; j < k; ++j) {
            numerator -= phi[j - 1] * rho[k - j];
            denominator -= phi[j - 1] * rho[j];
        }
        double phikk{denominator > 0.0 ? numerator / denominator : 0.0};
        phikk = CTools::truncate(phikk, -1.0, 1.0);
        TDoubleVec next(k);
        for (std::size_t j = 1; j < k; ++j) {
            next[j - 1] = phi[j - 1] - phikk * phi[k - j - 1];
        }
        next[k - 1] = phikk;
        phi.swap(next);
        result[k - 1] = phikk;
    }
    return result;
}

bool CSarimaxModel::hasIntercept() const {
    return m_Order.s_D + m_Order.s_SeasonalD == 0;
}

std::size_t CSarimaxModel::numberRegressionParameters() const {
    return (this->hasIntercept() ? 1 : 0) + static_cast<std::size_t>(m_Z.cols());
}

CSarimaxModel::SParameters CSarimaxModel::unpack(const TDenseVector& x) const {

    // Layout: [AR | seasonal AR | MA | seasonal MA | intercept | beta].

    std::size_t offset{0};
    auto polynomial = [&](std::size_t terms, std::size_t spacing) {
        TDoubleVec pacf(terms);
        for (std::size_t i = 0; i < terms; ++i, ++offset) {
            pacf[i] = CTools::truncate(std::tanh(x(offset)), -MAXIMUM_PARTIAL_AUTOCORRELATION,
                                       MAXIMUM_PARTIAL_AUTOCORRELATION);
        }
        TDoubleVec coeffs{partialAutocorrelationsToCoefficients(pacf)};
        TDoubleVec result(terms * spacing + 1, 0.0);
        result[0] = 1.0;
        for (std::size_t i = 0; i < terms; ++i) {
            result[(i + 1) * spacing] = -coeffs[i];
        }
        return result;
    };

    std::size_t period{std::max(m_Order.s_Period, std::size_t{1})};

    SParameters result;
    TDoubleVec ar{polynomial(m_Order.s_P, 1)};
    TDoubleVec seasonalAr{polynomial(m_Order.s_SeasonalP, period)};
    TDoubleVec ma{polynomial(m_Order.s_Q, 1)};
    TDoubleVec seasonalMa{polynomial(m_Order.s_SeasonalQ, period)};
    result.s_ArPolynomial = CTools::multiplyPolynomials(ar, seasonalAr);
    result.s_MaPolynomial = CTools::multiplyPolynomials(ma, seasonalMa);
    if (this->hasIntercept()) {
        result.s_Intercept = x(offset++);
    }
    result.s_Beta = x.segment(offset, m_Z.cols());
    return result;
}

void CSarimaxModel::computeErrors(const SParameters& parameters, TDoubleVec& u) const {
    std::size_t m{static_cast<std::size_t>(m_W.size())};
    u.resize(m);
    for (std::size_t t = 0; t < m; ++t) {
        double ut{m_W(t) - parameters.s_Intercept};
        if (m_Z.cols() > 0) {
            ut -= m_Z.row(t).dot(parameters.s_Beta);
        }
        u[t] = ut;
    }
}

double CSarimaxModel::sumSquares(const SParameters& parameters, TDoubleVec* residuals) const {
    TDoubleVec u;
    this->computeErrors(parameters, u);

    auto ar = sparse(parameters.s_ArPolynomial);
    auto ma = sparse(parameters.s_MaPolynomial);

    std::size_t m{u.size()};
    TDoubleVec e(m, 0.0);
    double result{0.0};
    for (std::size_t t = m_Start; t < m; ++t) {
        double et{u[t]};
        for (const auto& term : ar) {
            et += term.second * u[t - term.first];
        }
        for (const auto& term : ma) {
            if (t >= term.first) {
                et -= term.second * e[t - term.first];
            }
        }
        e[t] = et;
        result += et * et;
    }

    if (residuals != nullptr) {
        residuals->swap(e);
    }
    return result;
}

TDenseVector CSarimaxModel::initialParameters() const {
    std::size_t arma{m_Order.armaTerms()};
    std::size_t regression{this->numberRegressionParameters()};
    TDenseVector result{TDenseVector::Zero(arma + regression)};

    SParameters parameters;
    parameters.s_Beta = TDenseVector::Zero(m_Z.cols());

    if (regression > 0) {
        TDenseMatrix design(m_W.size(), regression);
        std::ptrdiff_t column{0};
        if (this->hasIntercept()) {
            design.col(column++).setOnes();
        }
        design.rightCols(m_Z.cols()) = m_Z;
        CLeastSquares::SResult fit;
        if (CLeastSquares::fit(design, m_W, fit)) {
            result.tail(regression) = fit.s_Coefficients;
            column = 0;
            if (this->hasIntercept()) {
                parameters.s_Intercept = fit.s_Coefficients(column++);
            }
            parameters.s_Beta = fit.s_Coefficients.tail(m_Z.cols());
        } else {
            LOG_DEBUG(<< "Regressors are collinear, starting from zero coefficients");
        }
    }

    if (m_Order.s_P > 0) {
        TDoubleVec u;
        this->computeErrors(parameters, u);
        TDoubleVec pacf{samplePartialAutocorrelations(u, m_Order.s_P)};
        for (std::size_t i = 0; i < m_Order.s_P; ++i) {
            result(i) = std::atanh(CTools::truncate(pacf[i], -MAXIMUM_INITIAL_PARTIAL_AUTOCORRELATION,
                                                    MAXIMUM_INITIAL_PARTIAL_AUTOCORRELATION));
        }
    }

    return result;
}

double CSarimaxModel::objective(const TDenseVector& x) const {
    double neff{static_cast<double>(static_cast<std::size_t>(m_W.size()) - m_Start)};
    double sse{this->sumSquares(this->unpack(x), nullptr)};
    double result{std::log(std::max(sse / neff, std::numeric_limits<double>::min()))};
    return std::isfinite(result) ? result : std::numeric_limits<double>::infinity();
}

TDenseVector CSarimaxModel::gradient(const TDenseVector& x) const {
    TDenseVector result(x.size());
    TDenseVector xh{x};
    for (std::ptrdiff_t i = 0; i < x.size(); ++i) {
        double h{GRADIENT_STEP * std::max(1.0, std::fabs(x(i)))};
        xh(i) = x(i) + h;
        double fplus{this->objective(xh)};
        xh(i) = x(i) - h;
        double fminus{this->objective(xh)};
        xh(i) = x(i);
        result(i) = (fplus - fminus) / (2.0 * h);
        if (std::isfinite(result(i)) == false) {
            result(i) = 0.0;
        }
    }
    return result;
}
}
}
