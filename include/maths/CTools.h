/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_tsa_maths_CTools_h
#define INCLUDED_tsa_maths_CTools_h

#include <core/CNonInstantiatable.h>

#include <maths/ImportExport.h>
#include <maths/MathsTypes.h>

#include <cstddef>

namespace tsa {
namespace maths {

//! \brief A collection of utility functionality.
//!
//! DESCRIPTION:\n
//! A collection of utility functions primarily intended for use within the
//! maths library.
//!
//! IMPLEMENTATION DECISIONS:\n
//! This class is really just a proxy for a namespace, but a object has
//! been intentionally used to force a single point for the declaration
//! and definition of utility functions within the maths library. As such
//! all member functions should be static and it should be state-less.
class MATHS_EXPORT CTools : private core::CNonInstantiatable {
public:
    using TDoubleVec = maths_t::TDoubleVec;
    using TOptionalDoubleVec = maths_t::TOptionalDoubleVec;

public:
    //! Truncate \p x to the range [\p a, \p b].
    static double truncate(double x, double a, double b) {
        return x < a ? a : (x > b ? b : x);
    }

    //! The quantile of the standard normal at \p p in (0, 1).
    static double normalQuantile(double p);

    //! The standard normal c.d.f. at \p x.
    static double normalCdf(double x);

    //! First difference \p x keeping its length: entry i is x[i] - x[i-1]
    //! when both are present and empty otherwise (so entry 0 is always empty).
    static TOptionalDoubleVec difference(const TOptionalDoubleVec& x);

    //! Multiply two polynomials given by their coefficients in increasing
    //! powers.
    static TDoubleVec multiplyPolynomials(const TDoubleVec& a, const TDoubleVec& b);

    //! The coefficients of \f$(1-B)^d(1-B^s)^D\f$ in increasing powers of B.
    static TDoubleVec differencingPolynomial(std::size_t d, std::size_t D, std::size_t s);
};
}
}

#endif // INCLUDED_tsa_maths_CTools_h
