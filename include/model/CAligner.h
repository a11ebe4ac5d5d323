/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_tsa_model_CAligner_h
#define INCLUDED_tsa_model_CAligner_h

#include <core/CoreTypes.h>

#include <maths/MathsTypes.h>

#include <model/CAlignedFrame.h>
#include <model/CSeries.h>
#include <model/ImportExport.h>

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace tsa {
namespace model {

//! \brief Resamples series onto a common calendar.
//!
//! DESCRIPTION:\n
//! Each tick takes the value of the most recent observation at or before
//! it, provided that observation is no older than the maximum staleness.
//! Otherwise the cell is empty: values are carried forward but never
//! extrapolated. Only observations inside the window are used, so the
//! first tick of a series which started before the window is empty unless
//! an observation falls exactly on it.
//!
//! Slowly published series, such as monthly macroeconomic indicators, need
//! a longer staleness than prices and the staleness can be overridden per
//! series kind.
//!
//! The aligner can also add a one tick percentage change column, named
//! "<series>.return", for a configured set of series.
class MODEL_EXPORT CAligner {
public:
    using TDoubleVec = maths_t::TDoubleVec;
    using TOptionalDoubleVec = maths_t::TOptionalDoubleVec;
    using TSeriesVec = std::vector<CSeries>;
    using TStrVec = std::vector<std::string>;
    using TKindTimeMap = std::map<CSeries::EKind, core_t::TTime>;

    //! \brief A column with its gaps filled, ready for model fitting.
    struct MODEL_EXPORT SGapFilled {
        //! The row of the first value.
        std::size_t s_FirstRow = 0;
        //! The values from s_FirstRow to the last row.
        TDoubleVec s_Values;
        //! The number of cells which were filled in.
        std::size_t s_Filled = 0;
    };

    //! The suffix of derived return column names.
    static const std::string RETURN_SUFFIX;

public:
    CAligner(core_t::TTime interval,
             core_t::TTime maxStaleness,
             TKindTimeMap kindStaleness = TKindTimeMap{},
             TStrVec returnColumns = TStrVec{});

    //! Align \p series on the ticks of [\p start, \p end].
    //!
    //! Series with no observations in the window get a column with no
    //! values. If several series have the same name only the first is used.
    //!
    //! \throws CInsufficientWindowError if the window is invalid or none of
    //! the series has an observation in it.
    CAlignedFrame align(const TSeriesVec& series, core_t::TTime start, core_t::TTime end) const;

    //! The staleness bound for series of \p kind.
    core_t::TTime maxStaleness(CSeries::EKind kind) const;

    core_t::TTime interval() const;

    //! Fill the gaps in \p column.
    //!
    //! Leading empty cells are dropped, interior gaps are interpolated
    //! linearly and trailing gaps take the last value.
    //!
    //! \return False if \p column has no values.
    static bool gapFill(const TOptionalDoubleVec& column, SGapFilled& result);

    //! Get the one tick percentage changes of \p column.
    static TOptionalDoubleVec returns(const TOptionalDoubleVec& column);

private:
    TOptionalDoubleVec resample(const CSeries& series, const CAlignedFrame& frame) const;

private:
    core_t::TTime m_Interval;
    core_t::TTime m_MaxStaleness;
    TKindTimeMap m_KindStaleness;
    TStrVec m_ReturnColumns;
};
}
}

#endif // INCLUDED_tsa_model_CAligner_h
