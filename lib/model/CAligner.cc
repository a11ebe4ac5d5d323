/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <model/CAligner.h>

#include <core/CLogger.h>
#include <core/CStringUtils.h>

#include <model/CAnalysisErrors.h>

#include <algorithm>

namespace tsa {
namespace model {

const std::string CAligner::RETURN_SUFFIX{".return"};

CAligner::CAligner(core_t::TTime interval,
                   core_t::TTime maxStaleness,
                   TKindTimeMap kindStaleness,
                   TStrVec returnColumns)
    : m_Interval{interval}, m_MaxStaleness{std::max(maxStaleness, core_t::TTime{0})},
      m_KindStaleness{std::move(kindStaleness)}, m_ReturnColumns{std::move(returnColumns)} {
}

CAlignedFrame CAligner::align(const TSeriesVec& series, core_t::TTime start, core_t::TTime end) const {
    if (m_Interval <= 0 || end < start) {
        throw CInsufficientWindowError{
            "invalid window [" + core::CStringUtils::typeToString(start) + ", " +
            core::CStringUtils::typeToString(end) + "] with interval " +
            core::CStringUtils::typeToString(m_Interval)};
    }

    CAlignedFrame frame{start, end, m_Interval};

    std::size_t seriesWithData{0};
    for (const auto& series_ : series) {
        if (frame.hasColumn(series_.name())) {
            LOG_ERROR(<< "Ignoring duplicate series '" << series_.name() << "'");
            continue;
        }
        if (series_.beginWindow(start) == series_.endWindow(end)) {
            LOG_WARN(<< "Series '" << series_.name() << "' has no observations in window");
        } else {
            ++seriesWithData;
        }
        frame.addColumn(series_.name(), this->resample(series_, frame));
    }

    if (seriesWithData == 0) {
        throw CInsufficientWindowError{"none of " + core::CStringUtils::typeToString(series.size()) +
                                       " series has data in [" +
                                       core::CStringUtils::typeToString(start) + ", " +
                                       core::CStringUtils::typeToString(end) + "]"};
    }

    for (const auto& name : m_ReturnColumns) {
        if (frame.hasColumn(name) == false) {
            LOG_WARN(<< "Can't compute returns of unknown series '" << name << "'");
            continue;
        }
        std::string returnName{name + RETURN_SUFFIX};
        if (frame.hasColumn(returnName)) {
            continue;
        }
        frame.addColumn(returnName, returns(frame.column(name)));
    }

    LOG_DEBUG(<< "Aligned " << frame.numberColumns() << " columns on "
              << frame.numberRows() << " ticks");

    return frame;
}

core_t::TTime CAligner::maxStaleness(CSeries::EKind kind) const {
    auto i = m_KindStaleness.find(kind);
    return i != m_KindStaleness.end() ? i->second : m_MaxStaleness;
}

core_t::TTime CAligner::interval() const {
    return m_Interval;
}

CAligner::TOptionalDoubleVec CAligner::resample(const CSeries& series,
                                                const CAlignedFrame& frame) const {
    TOptionalDoubleVec result(frame.numberRows());

    core_t::TTime staleness{this->maxStaleness(series.kind())};
    auto i = series.beginWindow(frame.start());
    auto end = series.endWindow(frame.end());
    auto last = end;

    const auto& times = frame.times();
    for (std::size_t row = 0; row < times.size(); ++row) {
        for (/**/; i != end && i->first <= times[row]; ++i) {
            last = i;
        }
        if (last != end && times[row] - last->first <= staleness) {
            result[row] = last->second;
        }
    }

    return result;
}

bool CAligner::gapFill(const TOptionalDoubleVec& column, SGapFilled& result) {
    result = SGapFilled{};

    auto first = std::find_if(column.begin(), column.end(),
                              [](const maths_t::TOptionalDouble& value) {
                                  return value != std::nullopt;
                              });
    if (first == column.end()) {
        return false;
    }

    result.s_FirstRow = static_cast<std::size_t>(first - column.begin());
    result.s_Values.reserve(column.size() - result.s_FirstRow);

    std::size_t previous{result.s_FirstRow};
    for (std::size_t i = result.s_FirstRow; i < column.size(); ++i) {
        if (column[i] == std::nullopt) {
            continue;
        }
        // Interpolate the gap (previous, i).
        double a{*column[previous]};
        double b{*column[i]};
        for (std::size_t j = previous + 1; j < i; ++j) {
            double alpha{static_cast<double>(j - previous) / static_cast<double>(i - previous)};
            result.s_Values.push_back(a + alpha * (b - a));
            ++result.s_Filled;
        }
        result.s_Values.push_back(b);
        previous = i;
    }
    for (std::size_t i = previous + 1; i < column.size(); ++i) {
        result.s_Values.push_back(*column[previous]);
        ++result.s_Filled;
    }

    return true;
}

CAligner::TOptionalDoubleVec CAligner::returns(const TOptionalDoubleVec& column) {
    TOptionalDoubleVec result(column.size());
    for (std::size_t i = 1; i < column.size(); ++i) {
        if (column[i] != std::nullopt && column[i - 1] != std::nullopt && *column[i - 1] != 0.0) {
            result[i] = (*column[i] - *column[i - 1]) / *column[i - 1];
        }
    }
    return result;
}
}
}
