/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <model/CCorrelationEngine.h>

#include <core/CLogger.h>
#include <core/CStringUtils.h>

#include <maths/CCorrelations.h>

#include <model/CAlignedFrame.h>

#include <algorithm>
#include <stdexcept>

namespace tsa {
namespace model {
namespace {
const std::string STATUS_NAMES[]{"ok", "insufficient_data", "undefined"};
}

std::string SCorrelationCell::print(EStatus status) {
    return STATUS_NAMES[status];
}

bool SCorrelationCell::parse(const std::string& name, EStatus& status) {
    for (int i = E_Ok; i <= E_Undefined; ++i) {
        if (name == STATUS_NAMES[i]) {
            status = static_cast<EStatus>(i);
            return true;
        }
    }
    return false;
}

CCorrelationMatrix::CCorrelationMatrix(TStrVec names)
    : m_Names{std::move(names)}, m_Cells(m_Names.size() * m_Names.size()) {
}

const CCorrelationMatrix::TStrVec& CCorrelationMatrix::names() const {
    return m_Names;
}

std::size_t CCorrelationMatrix::size() const {
    return m_Names.size();
}

const SCorrelationCell& CCorrelationMatrix::at(std::size_t i, std::size_t j) const {
    return m_Cells[i * m_Names.size() + j];
}

const SCorrelationCell& CCorrelationMatrix::at(const std::string& a, const std::string& b) const {
    return this->at(this->index(a), this->index(b));
}

void CCorrelationMatrix::set(std::size_t i, std::size_t j, const SCorrelationCell& cell) {
    m_Cells[i * m_Names.size() + j] = cell;
    m_Cells[j * m_Names.size() + i] = cell;
}

std::size_t CCorrelationMatrix::index(const std::string& name) const {
    auto i = std::find(m_Names.begin(), m_Names.end(), name);
    if (i == m_Names.end()) {
        throw std::out_of_range{"no correlations for '" + name + "'"};
    }
    return static_cast<std::size_t>(i - m_Names.begin());
}

CCorrelationEngine::CCorrelationEngine(std::size_t minimumSamples)
    : m_MinimumSamples{std::max(minimumSamples, std::size_t{2})} {
}

CCorrelationMatrix CCorrelationEngine::compute(const CAlignedFrame& frame) const {
    CCorrelationMatrix result{frame.names()};

    std::size_t n{frame.numberColumns()};
    for (std::size_t i = 0; i < n; ++i) {
        SCorrelationCell diagonal;
        diagonal.s_Samples = frame.valuesPresent(i);
        if (diagonal.s_Samples >= m_MinimumSamples) {
            diagonal.s_Status = SCorrelationCell::E_Ok;
            diagonal.s_Coefficient = 1.0;
        }
        result.set(i, i, diagonal);

        for (std::size_t j = i + 1; j < n; ++j) {
            SCorrelationCell cell;
            auto coefficient = maths::CCorrelations::pearson(
                frame.column(i), frame.column(j), cell.s_Samples);
            if (cell.s_Samples < m_MinimumSamples) {
                cell.s_Status = SCorrelationCell::E_InsufficientData;
            } else if (coefficient == std::nullopt) {
                LOG_DEBUG(<< "Correlation of '" << frame.names()[i] << "' and '"
                          << frame.names()[j] << "' undefined over "
                          << cell.s_Samples << " samples");
                cell.s_Status = SCorrelationCell::E_Undefined;
            } else {
                cell.s_Status = SCorrelationCell::E_Ok;
                cell.s_Coefficient = *coefficient;
            }
            result.set(i, j, cell);
        }
    }

    return result;
}

std::size_t CCorrelationEngine::minimumSamples() const {
    return m_MinimumSamples;
}
}
}
