/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_tsa_maths_t_MathsTypes_h
#define INCLUDED_tsa_maths_t_MathsTypes_h

#include <optional>
#include <vector>

namespace tsa {
namespace maths_t {

using TDoubleVec = std::vector<double>;
using TOptionalDouble = std::optional<double>;

//! A column of an aligned frame: one entry per tick, empty where there
//! is no value.
using TOptionalDoubleVec = std::vector<TOptionalDouble>;

//! The information criteria which can be used to select models.
enum EInformationCriterion { E_AIC, E_AICc, E_BIC };
}
}

#endif // INCLUDED_tsa_maths_t_MathsTypes_h
