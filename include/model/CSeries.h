/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_tsa_model_CSeries_h
#define INCLUDED_tsa_model_CSeries_h

#include <core/CoreTypes.h>

#include <model/ImportExport.h>

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace tsa {
namespace model {

//! \brief A named time series of numeric observations.
//!
//! DESCRIPTION:\n
//! The observation times are strictly increasing and every value is finite.
//! Construction fails with std::invalid_argument otherwise, so any CSeries
//! which exists satisfies these conditions.
//!
//! The kind records where the series came from. It only affects how long
//! an observation stays current when the series is aligned.
class MODEL_EXPORT CSeries {
public:
    //! The source of the series.
    enum EKind { E_Price = 0, E_SearchTrend, E_Macroeconomic, E_Other };

    using TTimeDoublePr = std::pair<core_t::TTime, double>;
    using TTimeDoublePrVec = std::vector<TTimeDoublePr>;

public:
    //! \throws std::invalid_argument if \p values has out of order or
    //! duplicate times or non-finite values.
    CSeries(std::string name, EKind kind, TTimeDoublePrVec values);
    CSeries(std::string name, TTimeDoublePrVec values);

    const std::string& name() const;
    EKind kind() const;

    //! The observations in time order.
    const TTimeDoublePrVec& values() const;

    std::size_t size() const;
    bool empty() const;

    //! Get the observations in [\p start, \p end].
    TTimeDoublePrVec::const_iterator beginWindow(core_t::TTime start) const;
    TTimeDoublePrVec::const_iterator endWindow(core_t::TTime end) const;

    //! Get the kind's name, e.g. "price".
    static std::string print(EKind kind);

    //! Parse a kind's name, as written by print.
    static bool parse(const std::string& name, EKind& kind);

private:
    std::string m_Name;
    EKind m_Kind;
    TTimeDoublePrVec m_Values;
};
}
}

#endif // INCLUDED_tsa_model_CSeries_h
