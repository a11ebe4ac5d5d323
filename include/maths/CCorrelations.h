/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_tsa_maths_CCorrelations_h
#define INCLUDED_tsa_maths_CCorrelations_h

#include <core/CNonInstantiatable.h>

#include <maths/ImportExport.h>
#include <maths/MathsTypes.h>

#include <cstddef>
#include <optional>

namespace tsa {
namespace maths {

//! \brief Sample correlation coefficients.
class MATHS_EXPORT CCorrelations : private core::CNonInstantiatable {
public:
    using TOptionalDoubleVec = maths_t::TOptionalDoubleVec;
    using TOptionalDouble = maths_t::TOptionalDouble;

public:
    //! Compute the Pearson correlation of \p x and \p y over the entries
    //! where both are present.
    //!
    //! \param[out] samples Set to the number of paired entries used.
    //! \return The coefficient truncated to [-1, 1], or empty if there are
    //! fewer than two pairs or either series is constant over them.
    static TOptionalDouble
    pearson(const TOptionalDoubleVec& x, const TOptionalDoubleVec& y, std::size_t& samples);
};
}
}

#endif // INCLUDED_tsa_maths_CCorrelations_h
