/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_tsa_model_CAlignedFrame_h
#define INCLUDED_tsa_model_CAlignedFrame_h

#include <core/CoreTypes.h>

#include <maths/MathsTypes.h>

#include <model/ImportExport.h>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tsa {
namespace model {

//! \brief A set of series sampled on a common calendar.
//!
//! DESCRIPTION:\n
//! There is one row per tick start, start + interval, ... <= end, and
//! one column per series. Every column has a cell for every row; a cell
//! without a value is empty, never a numeric default.
//!
//! The frame is filled in by the aligner and is read only afterwards, so
//! it can be shared between threads without synchronisation.
class MODEL_EXPORT CAlignedFrame {
public:
    using TTimeVec = std::vector<core_t::TTime>;
    using TStrVec = std::vector<std::string>;
    using TOptionalDouble = maths_t::TOptionalDouble;
    using TOptionalDoubleVec = maths_t::TOptionalDoubleVec;
    using TOptionalDoubleVecVec = std::vector<TOptionalDoubleVec>;
    using TOptionalSize = std::optional<std::size_t>;
    using TStrOptionalDoubleMap = std::map<std::string, TOptionalDouble>;

public:
    //! \throws std::invalid_argument if \p interval isn't positive or
    //! \p end is before \p start.
    CAlignedFrame(core_t::TTime start, core_t::TTime end, core_t::TTime interval);

    //! Add a column.
    //!
    //! \throws std::invalid_argument if \p name is already a column or
    //! \p values doesn't have a value per row.
    void addColumn(const std::string& name, TOptionalDoubleVec values);

    core_t::TTime start() const;
    //! The requested window end, which need not be a tick.
    core_t::TTime end() const;
    core_t::TTime interval() const;

    //! The time of the last row.
    core_t::TTime lastTime() const;

    std::size_t numberRows() const;
    std::size_t numberColumns() const;

    //! The tick times.
    const TTimeVec& times() const;
    //! The column names in the order they were added.
    const TStrVec& names() const;

    //! Get the index of column \p name if it exists.
    TOptionalSize columnIndex(const std::string& name) const;
    bool hasColumn(const std::string& name) const;

    const TOptionalDoubleVec& column(std::size_t i) const;
    //! \throws std::out_of_range if there is no column \p name.
    const TOptionalDoubleVec& column(const std::string& name) const;

    //! Get row \p i as a map from column name to value.
    TStrOptionalDoubleMap row(std::size_t i) const;

    //! The number of cells with a value in column \p i.
    std::size_t valuesPresent(std::size_t i) const;

    //! Does any cell have a value?
    bool hasAnyValues() const;

private:
    core_t::TTime m_Start;
    core_t::TTime m_End;
    core_t::TTime m_Interval;
    TTimeVec m_Times;
    TStrVec m_Names;
    TOptionalDoubleVecVec m_Columns;
};
}
}

#endif // INCLUDED_tsa_model_CAlignedFrame_h
