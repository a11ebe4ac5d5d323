/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <model/CAlignedFrame.h>

#include <core/CStringUtils.h>

#include <algorithm>
#include <stdexcept>

namespace tsa {
namespace model {

CAlignedFrame::CAlignedFrame(core_t::TTime start, core_t::TTime end, core_t::TTime interval)
    : m_Start{start}, m_End{end}, m_Interval{interval} {
    if (interval <= 0) {
        throw std::invalid_argument{"interval must be positive, got " +
                                    core::CStringUtils::typeToString(interval)};
    }
    if (end < start) {
        throw std::invalid_argument{"window end " + core::CStringUtils::typeToString(end) +
                                    " is before start " +
                                    core::CStringUtils::typeToString(start)};
    }
    m_Times.reserve(static_cast<std::size_t>((end - start) / interval) + 1);
    for (core_t::TTime time = start; time <= end; time += interval) {
        m_Times.push_back(time);
    }
}

void CAlignedFrame::addColumn(const std::string& name, TOptionalDoubleVec values) {
    if (this->hasColumn(name)) {
        throw std::invalid_argument{"duplicate column '" + name + "'"};
    }
    if (values.size() != m_Times.size()) {
        throw std::invalid_argument{
            "column '" + name + "' has " + core::CStringUtils::typeToString(values.size()) +
            " values for " + core::CStringUtils::typeToString(m_Times.size()) + " rows"};
    }
    m_Names.push_back(name);
    m_Columns.push_back(std::move(values));
}

core_t::TTime CAlignedFrame::start() const {
    return m_Start;
}

core_t::TTime CAlignedFrame::end() const {
    return m_End;
}

core_t::TTime CAlignedFrame::interval() const {
    return m_Interval;
}

core_t::TTime CAlignedFrame::lastTime() const {
    return m_Times.back();
}

std::size_t CAlignedFrame::numberRows() const {
    return m_Times.size();
}

std::size_t CAlignedFrame::numberColumns() const {
    return m_Columns.size();
}

const CAlignedFrame::TTimeVec& CAlignedFrame::times() const {
    return m_Times;
}

const CAlignedFrame::TStrVec& CAlignedFrame::names() const {
    return m_Names;
}

CAlignedFrame::TOptionalSize CAlignedFrame::columnIndex(const std::string& name) const {
    auto i = std::find(m_Names.begin(), m_Names.end(), name);
    if (i == m_Names.end()) {
        return {};
    }
    return static_cast<std::size_t>(i - m_Names.begin());
}

bool CAlignedFrame::hasColumn(const std::string& name) const {
    return this->columnIndex(name) != std::nullopt;
}

const CAlignedFrame::TOptionalDoubleVec& CAlignedFrame::column(std::size_t i) const {
    return m_Columns[i];
}

const CAlignedFrame::TOptionalDoubleVec& CAlignedFrame::column(const std::string& name) const {
    TOptionalSize i{this->columnIndex(name)};
    if (i == std::nullopt) {
        throw std::out_of_range{"no column '" + name + "'"};
    }
    return m_Columns[*i];
}

CAlignedFrame::TStrOptionalDoubleMap CAlignedFrame::row(std::size_t i) const {
    TStrOptionalDoubleMap result;
    for (std::size_t j = 0; j < m_Columns.size(); ++j) {
        result.emplace(m_Names[j], m_Columns[j][i]);
    }
    return result;
}

std::size_t CAlignedFrame::valuesPresent(std::size_t i) const {
    return static_cast<std::size_t>(
        std::count_if(m_Columns[i].begin(), m_Columns[i].end(),
                      [](const TOptionalDouble& value) { return value != std::nullopt; }));
}

bool CAlignedFrame::hasAnyValues() const {
    for (std::size_t i = 0; i < m_Columns.size(); ++i) {
        if (this->valuesPresent(i) > 0) {
            return true;
        }
    }
    return false;
}
}
}
