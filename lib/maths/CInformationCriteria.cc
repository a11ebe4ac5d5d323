/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <maths/CInformationCriteria.h>

#include <core/CStringUtils.h>

#include <cmath>
#include <limits>

namespace tsa {
namespace maths {

double CInformationCriteria::aic(double logLikelihood, std::size_t parameters) {
    return -2.0 * logLikelihood + 2.0 * static_cast<double>(parameters);
}

double CInformationCriteria::aicc(double logLikelihood, std::size_t parameters, std::size_t n) {
    if (n <= parameters + 1) {
        return std::numeric_limits<double>::infinity();
    }
    double k{static_cast<double>(parameters)};
    return aic(logLikelihood, parameters) +
           2.0 * k * (k + 1.0) / (static_cast<double>(n) - k - 1.0);
}

double CInformationCriteria::bic(double logLikelihood, std::size_t parameters, std::size_t n) {
    return -2.0 * logLikelihood +
           static_cast<double>(parameters) * std::log(static_cast<double>(n));
}

double CInformationCriteria::compute(maths_t::EInformationCriterion type,
                                     double logLikelihood,
                                     std::size_t parameters,
                                     std::size_t n) {
    switch (type) {
    case maths_t::E_AIC:
        return aic(logLikelihood, parameters);
    case maths_t::E_AICc:
        return aicc(logLikelihood, parameters, n);
    case maths_t::E_BIC:
        return bic(logLikelihood, parameters, n);
    }
    return std::numeric_limits<double>::infinity();
}

std::string CInformationCriteria::print(maths_t::EInformationCriterion type) {
    switch (type) {
    case maths_t::E_AIC:
        return "aic";
    case maths_t::E_AICc:
        return "aicc";
    case maths_t::E_BIC:
        return "bic";
    }
    return "unknown";
}

bool CInformationCriteria::parse(const std::string& name, maths_t::EInformationCriterion& type) {
    std::string lower{core::CStringUtils::toLower(name)};
    for (auto candidate : {maths_t::E_AIC, maths_t::E_AICc, maths_t::E_BIC}) {
        if (lower == print(candidate)) {
            type = candidate;
            return true;
        }
    }
    return false;
}
}
}
