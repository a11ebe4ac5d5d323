/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#ifndef INCLUDED_tsa_maths_CLbfgs_h
#define INCLUDED_tsa_maths_CLbfgs_h

#include <boost/circular_buffer.hpp>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <utility>
#include <vector>

namespace tsa {
namespace maths {

//! \brief The limited memory BFGS algorithm.
//!
//! DESCRIPTION:\n
//! The basic implementation uses a low rank approximation to the Hessian to compute
//! the search direction and line search with back tracking.
//!
//! For more information \see https://en.wikipedia.org/wiki/Limited-memory_BFGS
//!
//! The search stops when either the relative decrease in the objective or the
//! gradient norm falls below tolerance, when the line search can make no further
//! progress, or when the caller's continue predicate returns false. Only the first
//! three count as converged.
//!
//! \tparam VECTOR An Eigen dense vector type.
template<typename VECTOR>
class CLbfgs {
public:
    //! The scale to apply to the expected decrease from the gradient to decrease
    //! in the test to continue backtracking.
    static const double BACKTRACKING_MIN_DECREASE;

    //! The scale which is applied to the step size in backtracking.
    static const double STEP_SCALE;

    //! The maximum number of iterations to use backtracking.
    static const std::size_t MAXIMUM_BACK_TRACKING_ITERATIONS;

public:
    explicit CLbfgs(std::size_t rank,
                    double decrease = BACKTRACKING_MIN_DECREASE,
                    double scale = STEP_SCALE)
        : m_Rank{rank}, m_StepScale{scale}, m_BacktrackingMinDecrease{decrease} {}

    //! Minimise \p f using the starting point \p x0.
    //!
    //! \param f The function to minimise.
    //! \param g The gradient of the function to minimise.
    //! \param x0 The point in the domain of f from which to start the search.
    //! \param eps The convergence tolerance applied to the ratio between the function
    //! decrease in the last step and the function decrease since the start. The main
    //! loop will exit when \f$|f(x_k) - f(x_{k-1})| < \epsilon |f(x_k) - f(x_0)|\f$.
    //! \param iterations The maximum number of iterations of the main loop to perform.
    //! \param carryOn Called before each iteration; the search stops unconverged if
    //! it returns false.
    //!
    //! \tparam F must be a Callable with single argument type VECTOR and returning
    //! a scalar.
    //! \tparam G must be a Callable with single argument type VECTOR and returning
    //! a VECTOR.
    //! \tparam C must be a Callable with no arguments returning bool.
    template<typename F, typename G, typename C>
    std::pair<VECTOR, double> minimize(const F& f,
                                       const G& g,
                                       VECTOR x0,
                                       double eps,
                                       std::size_t iterations,
                                       const C& carryOn) {

        this->reinitialize(f, x0);

        VECTOR x{std::move(x0)};

        m_Converged = false;
        m_Iterations = 0;
        if (std::isfinite(m_Fx) == false) {
            return {std::move(x), m_Fx};
        }

        for (std::size_t i = 0; i < iterations && carryOn(); ++i) {
            ++m_Iterations;
            this->updateDescentDirection(g, x);
            if (this->gradientConverged(eps)) {
                m_Converged = true;
                break;
            }
            bool progress{false};
            x = this->lineSearch(f, progress);
            if (progress == false || this->converged(eps)) {
                m_Converged = true;
                break;
            }
        }

        return {std::move(x), m_Fx};
    }

    //! Overload which never stops early.
    template<typename F, typename G>
    std::pair<VECTOR, double>
    minimize(const F& f, const G& g, VECTOR x0, double eps = 1e-8, std::size_t iterations = 50) {
        return this->minimize(f, g, std::move(x0), eps, iterations, [] { return true; });
    }

    //! Did the last call to minimize converge?
    bool converged() const { return m_Converged; }

    //! The number of iterations used by the last call to minimize.
    std::size_t iterations() const { return m_Iterations; }

private:
    using TDoubleVec = std::vector<double>;
    using TVectorBuf = boost::circular_buffer<VECTOR>;

private:
    template<typename F>
    void reinitialize(const F& f, const VECTOR& x0) {
        m_Initial = true;
        m_F0 = m_Fl = m_Fx = f(x0);
        m_X = x0;
        m_Dx.clear();
        m_Dg.clear();
        m_Dx.set_capacity(std::max(std::min(m_Rank, static_cast<std::size_t>(x0.size())),
                                   std::size_t{1}));
        m_Dg.set_capacity(m_Dx.capacity());
    }

    bool converged(double eps) const {
        return std::fabs(m_Fx - m_Fl) < eps * std::fabs(m_Fx - m_F0);
    }

    bool gradientConverged(double eps) const {
        return m_Gx.norm() < std::sqrt(eps) * std::max(1.0, std::fabs(m_Fx));
    }

    template<typename F>
    VECTOR lineSearch(const F& f, bool& progress) {

        // This uses the Armijo condition that the decrease is bounded below by
        // some multiple of the decrease promised by the gradient for the step
        // size. Non-finite values never satisfy it.

        double s{1.0};
        double fs{f(m_X - s * m_P)};

        for (std::size_t i = 0; i < MAXIMUM_BACK_TRACKING_ITERATIONS &&
                                !(fs - m_Fx <= -this->minimumDecrease(s));
             ++i) {
            s *= m_StepScale;
            fs = f(m_X - s * m_P);
        }

        if (!(fs < m_Fx)) {
            progress = false;
            return m_X;
        }

        progress = true;
        m_Fl = m_Fx;
        m_Fx = fs;

        return m_X - s * m_P;
    }

    template<typename G>
    void updateDescentDirection(const G& g, const VECTOR& x) {

        // This uses the L-BFGS Hessian approximation scheme.

        m_P = g(x);

        if (m_Initial == false) {
            m_Dx.push_back(x - m_X);
            m_Dg.push_back(m_P - m_Gx);
        }

        m_X = x;
        m_Gx = m_P;

        if (m_Initial == false && m_Gx.norm() > 0.0) {
            double eps{std::numeric_limits<double>::epsilon() * m_Gx.norm()};

            std::size_t k{m_Dx.size()};
            TDoubleVec rho(k);
            TDoubleVec alpha(k);
            for (std::size_t i = k; i > 0; --i) {
                rho[i - 1] = 1.0 / (m_Dg[i - 1].dot(m_Dx[i - 1]) + eps);
                alpha[i - 1] = rho[i - 1] * m_Dx[i - 1].dot(m_P);
                m_P.noalias() -= alpha[i - 1] * m_Dg[i - 1];
            }

            // The initialisation choice is free, this is an estimate for the
            // size of the true Hessian along the most recent search direction
            // and tends to mean that the initial step size is chosen in the
            // line search.

            double hmax{m_Gx.norm() / this->minimumStepSize()};

            double lambda{(m_Dg[k - 1].dot(m_Dx[k - 1]) + eps) /
                          (m_Dg[k - 1].dot(m_Dg[k - 1]) + eps * eps)};
            double h0{std::copysign(std::min(std::fabs(lambda), hmax), lambda)};

            m_P *= h0;

            for (std::size_t i = 0; i < k; ++i) {
                double beta{rho[i] * (m_Dg[i].dot(m_P) + eps)};
                double gk{alpha[i] - beta};
                double gmax{hmax / (m_Dx[i].norm() + eps)};
                m_P.noalias() += std::copysign(std::min(std::fabs(gk), gmax), gk) * m_Dx[i];
            }

            // Fall back to steepest descent if this isn't a descent direction.
            if (m_Gx.dot(m_P) <= 0.0 || std::isfinite(m_P.norm()) == false) {
                m_P = m_Gx;
            }
        } else {
            m_Initial = false;
        }
    }

    double minimumDecrease(double s) const {
        return m_BacktrackingMinDecrease * s * m_Gx.dot(m_P);
    }

    double minimumStepSize() const {
        return std::pow(m_StepScale, static_cast<double>(MAXIMUM_BACK_TRACKING_ITERATIONS));
    }

private:
    std::size_t m_Rank;
    double m_StepScale;
    double m_BacktrackingMinDecrease;
    bool m_Initial = true;
    bool m_Converged = false;
    std::size_t m_Iterations = 0;
    double m_F0 = 0.0;
    double m_Fl = 0.0;
    double m_Fx = 0.0;
    VECTOR m_X;
    VECTOR m_Gx;
    VECTOR m_P;
    TVectorBuf m_Dx;
    TVectorBuf m_Dg;
};

template<typename VECTOR>
const double CLbfgs<VECTOR>::BACKTRACKING_MIN_DECREASE{1e-4};
template<typename VECTOR>
const double CLbfgs<VECTOR>::STEP_SCALE{0.3};
template<typename VECTOR>
const std::size_t CLbfgs<VECTOR>::MAXIMUM_BACK_TRACKING_ITERATIONS{20};
}
}

#endif // INCLUDED_tsa_maths_CLbfgs_h
