/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <model/CForecastEngine.h>

#include <core/CLogger.h>
#include <core/CStopWatch.h>
#include <core/CStringUtils.h>

#include <maths/CInformationCriteria.h>
#include <maths/CLinearAlgebraEigen.h>

#include <model/CAlignedFrame.h>
#include <model/CAligner.h>
#include <model/CAnalysisErrors.h>

#include <algorithm>
#include <cmath>
#include <memory>

namespace tsa {
namespace model {
namespace {
const std::string STATUS_NAMES[]{"ok", "model_fit_error"};

//! Criteria closer than this are equal.
const double CRITERION_TOLERANCE{1e-9};
}

SForecastResult SForecastResult::failed(const std::string& entity, const std::string& error) {
    SForecastResult result;
    result.s_Entity = entity;
    result.s_Status = E_ModelFitError;
    result.s_Error = error;
    return result;
}

std::string SForecastResult::print(EStatus status) {
    return STATUS_NAMES[status];
}

bool SForecastResult::parse(const std::string& name, EStatus& status) {
    for (int i = E_Ok; i <= E_ModelFitError; ++i) {
        if (name == STATUS_NAMES[i]) {
            status = static_cast<EStatus>(i);
            return true;
        }
    }
    return false;
}

CForecastEngine::CForecastEngine(const SParams& params) : m_Params{params} {
    m_Params.s_Order.s_Period = m_Params.s_SeasonalPeriod;
    if (m_Params.s_SeasonalPeriod < 2) {
        // There is no season so the model is non-seasonal whatever else
        // has been configured.
        m_Params.s_Order.s_SeasonalP = 0;
        m_Params.s_Order.s_SeasonalD = 0;
        m_Params.s_Order.s_SeasonalQ = 0;
        m_Params.s_MaxSeasonalP = 0;
        m_Params.s_MaxSeasonalQ = 0;
    }
}

SForecastResult CForecastEngine::forecast(const CAlignedFrame& frame,
                                          const std::string& entity) const {
    if (frame.hasColumn(entity) == false) {
        throw CModelFitError{"no series named '" + entity + "'"};
    }

    CAligner::SGapFilled target;
    if (CAligner::gapFill(frame.column(entity), target) == false) {
        throw CModelFitError{"no values in window"};
    }
    std::size_t n{target.s_Values.size()};
    if (target.s_Filled > 0) {
        LOG_DEBUG(<< "Filled " << target.s_Filled << " of " << n << " values of '"
                  << entity << "'");
    }

    TStrVec regressors;
    std::vector<TDoubleVec> exogColumns;
    for (const auto& name : m_Params.s_Regressors) {
        if (name == entity || this->isDerivedFrom(name, entity)) {
            continue;
        }
        if (frame.hasColumn(name) == false) {
            LOG_WARN(<< "Ignoring unknown regressor '" << name << "' for '" << entity << "'");
            continue;
        }
        CAligner::SGapFilled regressor;
        if (CAligner::gapFill(frame.column(name), regressor) == false) {
            LOG_WARN(<< "Ignoring regressor '" << name << "' for '" << entity
                     << "' which has no values");
            continue;
        }
        TDoubleVec column;
        column.reserve(n);
        for (std::size_t row = target.s_FirstRow; row < frame.numberRows(); ++row) {
            column.push_back(row < regressor.s_FirstRow
                                 ? regressor.s_Values.front()
                                 : regressor.s_Values[row - regressor.s_FirstRow]);
        }
        regressors.push_back(name);
        exogColumns.push_back(std::move(column));
    }

    maths::TDenseMatrix exog(n, exogColumns.size());
    for (std::size_t j = 0; j < exogColumns.size(); ++j) {
        for (std::size_t i = 0; i < n; ++i) {
            exog(i, j) = exogColumns[j][i];
        }
    }

    TOrderVec candidates{this->candidateOrders()};
    std::size_t burnIn{0};
    for (const auto& order : candidates) {
        burnIn = std::max(burnIn, order.arSpan());
    }

    core::CStopWatch watch{true};
    auto carryOn = [&watch, this]() {
        return m_Params.s_TimeoutMs == 0 || watch.lap() < m_Params.s_TimeoutMs;
    };

    std::unique_ptr<maths::CSarimaxModel> best;
    double bestCriterion{0.0};
    std::string lastError;

    for (const auto& order : candidates) {
        if (carryOn() == false) {
            throw CModelFitError{"exceeded time budget of " +
                                 core::CStringUtils::typeToString(m_Params.s_TimeoutMs) +
                                 "ms during order selection"};
        }

        auto model = std::make_unique<maths::CSarimaxModel>(order);
        std::string error;
        if (model->fit(target.s_Values, exog, burnIn, m_Params.s_MaxIterations, carryOn, error) == false) {
            LOG_DEBUG(<< "Failed to fit " << order.print() << " for '" << entity
                      << "': " << error);
            if (carryOn() == false) {
                throw CModelFitError{error};
            }
            lastError = error;
            continue;
        }

        double criterion{model->informationCriterion(m_Params.s_Criterion)};
        LOG_TRACE(<< entity << " " << order.print() << " "
                  << maths::CInformationCriteria::print(m_Params.s_Criterion)
                  << " = " << criterion);
        if (std::isfinite(criterion) == false) {
            lastError = "non-finite information criterion for " + order.print();
            continue;
        }
        if (best == nullptr ||
            criterion < bestCriterion - CRITERION_TOLERANCE * std::max(1.0, std::fabs(bestCriterion))) {
            best = std::move(model);
            bestCriterion = criterion;
        }
    }

    if (best == nullptr) {
        throw CModelFitError{candidates.size() == 1
                                 ? lastError
                                 : "none of " + core::CStringUtils::typeToString(candidates.size()) +
                                       " candidate models could be fitted, last error: " + lastError};
    }

    maths::CSarimaxModel::SForecast forecast;
    if (best->forecast(m_Params.s_Horizon, m_Params.s_Coverage, forecast) == false) {
        throw CModelFitError{"failed to forecast " + best->order().print()};
    }

    SForecastResult result;
    result.s_Entity = entity;
    result.s_Status = SForecastResult::E_Ok;
    result.s_Order = best->order();
    result.s_Regressors = std::move(regressors);
    result.s_Criterion = m_Params.s_Criterion;
    result.s_CriterionValue = bestCriterion;
    result.s_ResidualRmse = best->residualRmse();
    result.s_FitStart = frame.times()[target.s_FirstRow];
    result.s_FitEnd = frame.lastTime();
    result.s_FitObservations = n;
    result.s_Coverage = m_Params.s_Coverage;
    result.s_Mean = std::move(forecast.s_Mean);
    result.s_Lower = std::move(forecast.s_Lower);
    result.s_Upper = std::move(forecast.s_Upper);
    result.s_Times.reserve(m_Params.s_Horizon);
    for (std::size_t h = 1; h <= m_Params.s_Horizon; ++h) {
        result.s_Times.push_back(frame.lastTime() +
                                 static_cast<core_t::TTime>(h) * frame.interval());
    }

    LOG_DEBUG(<< "Forecast '" << entity << "' with " << result.s_Order.print() << " in "
              << watch.lap() << "ms");

    return result;
}

SForecastResult CForecastEngine::forecastOrFail(const CAlignedFrame& frame,
                                                const std::string& entity) const {
    try {
        return this->forecast(frame, entity);
    } catch (const CModelFitError& e) {
        LOG_WARN(<< "Unable to forecast '" << entity << "': " << e.what());
        return SForecastResult::failed(entity, e.what());
    }
}

CForecastEngine::TOrderVec CForecastEngine::candidateOrders() const {
    if (m_Params.s_SelectOrder == false) {
        return {m_Params.s_Order};
    }

    TOrderVec result;
    for (std::size_t p = 0; p <= m_Params.s_MaxP; ++p) {
        for (std::size_t q = 0; q <= m_Params.s_MaxQ; ++q) {
            for (std::size_t P = 0; P <= m_Params.s_MaxSeasonalP; ++P) {
                for (std::size_t Q = 0; Q <= m_Params.s_MaxSeasonalQ; ++Q) {
                    TOrder order{m_Params.s_Order};
                    order.s_P = p;
                    order.s_Q = q;
                    order.s_SeasonalP = P;
                    order.s_SeasonalQ = Q;
                    result.push_back(order);
                }
            }
        }
    }
    std::stable_sort(result.begin(), result.end(), [](const TOrder& lhs, const TOrder& rhs) {
        return lhs.armaTerms() < rhs.armaTerms();
    });

    return result;
}

const CForecastEngine::SParams& CForecastEngine::params() const {
    return m_Params;
}

bool CForecastEngine::isDerivedFrom(const std::string& regressor, const std::string& entity) const {
    return regressor == entity + CAligner::RETURN_SUFFIX;
}
}
}
