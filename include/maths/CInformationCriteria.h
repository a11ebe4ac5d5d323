/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#ifndef INCLUDED_tsa_maths_CInformationCriteria_h
#define INCLUDED_tsa_maths_CInformationCriteria_h

#include <core/CNonInstantiatable.h>

#include <maths/ImportExport.h>
#include <maths/MathsTypes.h>

#include <cstddef>
#include <string>

namespace tsa {
namespace maths {

//! \brief Computes information criteria from a maximised log likelihood.
//!
//! DESCRIPTION:\n
//! This can calculate three types of information criterion values: Akaike,
//! corrected Akaike and Bayes. The difference is in the treatment of the
//! penalty on the maximum log likelihood due to the number of parameters.
//! In particular, with \f$L\f$ the maximum likelihood of the data, \f$k\f$
//! the number of free parameters and \f$n\f$ the number of data points:
//! <pre class="fragment">
//!   \f$AIC = -2 log(L) + 2 k\f$
//!   \f$AIC_c = AIC + \frac{2k(k+1)}{n - k - 1}\f$
//!   \f$BIC = -2 log(L) + k log(n)\f$
//! </pre>
//!
//! Lower values are better. AICc is infinite when \f$n \leq k + 1\f$.
//!
//! See also http://en.wikipedia.org/wiki/Bayesian_information_criterion
//! and http://en.wikipedia.org/wiki/Akaike_information_criterion.
class MATHS_EXPORT CInformationCriteria : private core::CNonInstantiatable {
public:
    static double aic(double logLikelihood, std::size_t parameters);
    static double aicc(double logLikelihood, std::size_t parameters, std::size_t n);
    static double bic(double logLikelihood, std::size_t parameters, std::size_t n);

    //! Compute the criterion \p type.
    static double compute(maths_t::EInformationCriterion type,
                          double logLikelihood,
                          std::size_t parameters,
                          std::size_t n);

    //! Get the name of \p type, e.g. "aicc".
    static std::string print(maths_t::EInformationCriterion type);

    //! Parse a name written by print (case insensitive).
    static bool parse(const std::string& name, maths_t::EInformationCriterion& type);
};
}
}

#endif // INCLUDED_tsa_maths_CInformationCriteria_h
