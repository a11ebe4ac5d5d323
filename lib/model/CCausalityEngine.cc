/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <model/CCausalityEngine.h>

#include <core/CLogger.h>

#include <maths/CStatisticalTests.h>
#include <maths/CTools.h>

#include <model/CAlignedFrame.h>

#include <algorithm>

namespace tsa {
namespace model {
namespace {
const std::string STATUS_NAMES[]{"tested", "insufficient_data", "not_testable"};
const std::string ADJUSTMENT_NAMES[]{"none", "differenced", "differenced_twice"};

template<typename ENUM, std::size_t N>
bool parseName(const std::string (&names)[N], const std::string& name, ENUM& result) {
    for (std::size_t i = 0; i < N; ++i) {
        if (name == names[i]) {
            result = static_cast<ENUM>(i);
            return true;
        }
    }
    return false;
}
}

std::string SCausalityVerdict::print(EStatus status) {
    return STATUS_NAMES[status];
}

bool SCausalityVerdict::parse(const std::string& name, EStatus& status) {
    return parseName(STATUS_NAMES, name, status);
}

std::string SCausalityVerdict::print(EAdjustment adjustment) {
    return ADJUSTMENT_NAMES[adjustment];
}

bool SCausalityVerdict::parse(const std::string& name, EAdjustment& adjustment) {
    return parseName(ADJUSTMENT_NAMES, name, adjustment);
}

const std::size_t CCausalityEngine::MAXIMUM_DIFFERENCES{2};

CCausalityEngine::CCausalityEngine(const SParams& params) : m_Params{params} {
    if (m_Params.s_MaxDifferences > MAXIMUM_DIFFERENCES) {
        LOG_WARN(<< "Maximum differences " << m_Params.s_MaxDifferences
                 << " is too large, using " << MAXIMUM_DIFFERENCES);
        m_Params.s_MaxDifferences = MAXIMUM_DIFFERENCES;
    }
    m_Params.s_MaxLag = std::max(m_Params.s_MaxLag, std::size_t{1});
}

CCausalityEngine::TVerdictVec CCausalityEngine::compute(const CAlignedFrame& frame) const {
    std::size_t n{frame.numberColumns()};
    const auto& names = frame.names();

    std::vector<SStationarity> stationarity;
    stationarity.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        stationarity.push_back(this->stationarity(frame.column(i)));
        LOG_DEBUG(<< "'" << names[i] << "' stationarity status = "
                  << stationarity.back().s_Status << ", order = "
                  << stationarity.back().s_Order);
    }

    TVerdictVec result;
    for (std::size_t i = 0; i < n; ++i) {
        for (std::size_t j = 0; j < n; ++j) {
            if (i == j || this->isTarget(names[j]) == false) {
                continue;
            }
            if (m_Params.s_MaxPairs > 0 && result.size() == m_Params.s_MaxPairs) {
                LOG_INFO(<< "Stopped after " << m_Params.s_MaxPairs << " causality pairs");
                return result;
            }

            const SStationarity& cause{stationarity[i]};
            const SStationarity& effect{stationarity[j]};

            if (cause.s_Status == SStationarity::E_InsufficientData ||
                effect.s_Status == SStationarity::E_InsufficientData) {
                SCausalityVerdict verdict;
                verdict.s_Cause = names[i];
                verdict.s_Effect = names[j];
                verdict.s_Status = SCausalityVerdict::E_InsufficientData;
                verdict.s_MaxLag = m_Params.s_MaxLag;
                result.push_back(std::move(verdict));
            } else if (cause.s_Status != SStationarity::E_Stationary ||
                       effect.s_Status != SStationarity::E_Stationary) {
                SCausalityVerdict verdict;
                verdict.s_Cause = names[i];
                verdict.s_Effect = names[j];
                verdict.s_Status = SCausalityVerdict::E_NotTestable;
                verdict.s_MaxLag = m_Params.s_MaxLag;
                result.push_back(std::move(verdict));
            } else {
                result.push_back(this->test(names[i], frame.column(i), names[j],
                                            frame.column(j),
                                            std::max(cause.s_Order, effect.s_Order)));
            }
        }
    }

    return result;
}

CCausalityEngine::SStationarity
CCausalityEngine::stationarity(const TOptionalDoubleVec& column) const {
    SStationarity result;

    std::size_t present(std::count_if(column.begin(), column.end(),
                                      [](const maths_t::TOptionalDouble& value) {
                                          return value != std::nullopt;
                                      }));
    if (present < m_Params.s_MinimumSamples) {
        result.s_Status = SStationarity::E_InsufficientData;
        return result;
    }

    TOptionalDoubleVec x{column};
    for (std::size_t order = 0; order <= m_Params.s_MaxDifferences; ++order) {
        if (order > 0) {
            x = maths::CTools::difference(x);
        }
        auto adf = maths::CStatisticalTests::augmentedDickeyFuller(x, m_Params.s_AdfLags);
        if (adf == std::nullopt) {
            result.s_Status = SStationarity::E_InsufficientData;
            return result;
        }
        if (adf->s_Degenerate) {
            result.s_Status = SStationarity::E_Degenerate;
            result.s_Order = order;
            return result;
        }
        result.s_PValue = adf->s_PValue;
        result.s_Order = order;
        if (adf->s_PValue < m_Params.s_StationarityAlpha) {
            result.s_Status = SStationarity::E_Stationary;
            return result;
        }
    }

    result.s_Status = SStationarity::E_NonStationary;
    return result;
}

SCausalityVerdict CCausalityEngine::test(const std::string& causeName,
                                         const TOptionalDoubleVec& cause,
                                         const std::string& effectName,
                                         const TOptionalDoubleVec& effect,
                                         std::size_t order) const {
    SCausalityVerdict result;
    result.s_Cause = causeName;
    result.s_Effect = effectName;
    result.s_MaxLag = m_Params.s_MaxLag;
    result.s_Adjustment = static_cast<SCausalityVerdict::EAdjustment>(
        std::min(order, MAXIMUM_DIFFERENCES));
    result.s_LagPValues.resize(m_Params.s_MaxLag);

    TOptionalDoubleVec x{cause};
    TOptionalDoubleVec y{effect};
    for (std::size_t i = 0; i < order; ++i) {
        x = maths::CTools::difference(x);
        y = maths::CTools::difference(y);
    }

    std::size_t tested{0};
    for (std::size_t lag = 1; lag <= m_Params.s_MaxLag; ++lag) {
        auto granger = maths::CStatisticalTests::grangerFTest(x, y, lag);
        if (granger == std::nullopt || granger->s_Observations < m_Params.s_MinimumSamples) {
            continue;
        }
        result.s_LagPValues[lag - 1] = granger->s_PValue;
        if (tested == 0 || granger->s_PValue < result.s_PValue) {
            result.s_Lag = lag;
            result.s_Statistic = granger->s_Statistic;
            result.s_PValue = granger->s_PValue;
            result.s_Observations = granger->s_Observations;
        }
        ++tested;
    }

    if (tested == 0) {
        LOG_DEBUG(<< "Too few complete rows to test '" << causeName << "' -> '"
                  << effectName << "'");
        result.s_Status = SCausalityVerdict::E_InsufficientData;
        result.s_PValue = 1.0;
        return result;
    }

    // Bonferroni correction for choosing the best lag.
    result.s_PValue = std::min(static_cast<double>(tested) * result.s_PValue, 1.0);
    result.s_Status = SCausalityVerdict::E_Tested;
    result.s_Significant = result.s_PValue < m_Params.s_Alpha;
    LOG_TRACE(<< "'" << causeName << "' -> '" << effectName << "' lag = " << result.s_Lag
              << ", F = " << result.s_Statistic << ", p = " << result.s_PValue);

    return result;
}

const CCausalityEngine::SParams& CCausalityEngine::params() const {
    return m_Params;
}

bool CCausalityEngine::isTarget(const std::string& name) const {
    return m_Params.s_Targets.empty() ||
           std::find(m_Params.s_Targets.begin(), m_Params.s_Targets.end(), name) !=
               m_Params.s_Targets.end();
}
}
}
