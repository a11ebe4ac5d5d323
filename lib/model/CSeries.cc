/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <model/CSeries.h>

#include <core/CStringUtils.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace tsa {
namespace model {
namespace {
const std::string KIND_NAMES[]{"price", "search_trend", "macroeconomic", "other"};
}

CSeries::CSeries(std::string name, EKind kind, TTimeDoublePrVec values)
    : m_Name{std::move(name)}, m_Kind{kind}, m_Values{std::move(values)} {
    for (std::size_t i = 0; i < m_Values.size(); ++i) {
        if (std::isfinite(m_Values[i].second) == false) {
            throw std::invalid_argument{"series '" + m_Name + "' has a non-finite value at " +
                                        core::CStringUtils::typeToString(m_Values[i].first)};
        }
        if (i > 0 && m_Values[i].first <= m_Values[i - 1].first) {
            throw std::invalid_argument{
                "series '" + m_Name + "' times are not strictly increasing at " +
                core::CStringUtils::typeToString(m_Values[i].first)};
        }
    }
}

CSeries::CSeries(std::string name, TTimeDoublePrVec values)
    : CSeries{std::move(name), E_Other, std::move(values)} {
}

const std::string& CSeries::name() const {
    return m_Name;
}

CSeries::EKind CSeries::kind() const {
    return m_Kind;
}

const CSeries::TTimeDoublePrVec& CSeries::values() const {
    return m_Values;
}

std::size_t CSeries::size() const {
    return m_Values.size();
}

bool CSeries::empty() const {
    return m_Values.empty();
}

CSeries::TTimeDoublePrVec::const_iterator CSeries::beginWindow(core_t::TTime start) const {
    return std::lower_bound(m_Values.begin(), m_Values.end(), start,
                            [](const TTimeDoublePr& value, core_t::TTime time) {
                                return value.first < time;
                            });
}

CSeries::TTimeDoublePrVec::const_iterator CSeries::endWindow(core_t::TTime end) const {
    return std::upper_bound(m_Values.begin(), m_Values.end(), end,
                            [](core_t::TTime time, const TTimeDoublePr& value) {
                                return time < value.first;
                            });
}

std::string CSeries::print(EKind kind) {
    return KIND_NAMES[kind];
}

bool CSeries::parse(const std::string& name, EKind& kind) {
    std::string lower{core::CStringUtils::toLower(name)};
    for (int i = E_Price; i <= E_Other; ++i) {
        if (lower == KIND_NAMES[i]) {
            kind = static_cast<EKind>(i);
            return true;
        }
    }
    return false;
}
}
}
