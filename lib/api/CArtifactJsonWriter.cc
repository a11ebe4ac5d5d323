/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <api/CArtifactJsonWriter.h>

#include <core/CTimeUtils.h>

#include <maths/CInformationCriteria.h>

#include <api/CArtifactJsonTags.h>

#include <cmath>
#include <ostream>
#include <sstream>

namespace tsa {
namespace api {

CArtifactJsonWriter::CArtifactJsonWriter(std::ostream& strm)
    : m_WriteStream{strm}, m_Writer{m_WriteStream} {
}

void CArtifactJsonWriter::write(const model::CAnalysisArtifact& artifact) {
    this->start();
    m_Writer.StartObject();

    this->writeKey(CArtifactJsonTags::JSON_RUN_ID_TAG);
    m_Writer.Uint64(artifact.runId());
    this->writeKey(CArtifactJsonTags::JSON_RUN_TIME_TAG);
    m_Writer.Int64(artifact.runTime());
    this->writeKey(CArtifactJsonTags::JSON_RUN_TIME_ISO_TAG);
    this->writeString(core::CTimeUtils::toIso8601(artifact.runTime()));

    this->writeKey(CArtifactJsonTags::JSON_WINDOW_TAG);
    m_Writer.StartObject();
    this->writeKey(CArtifactJsonTags::JSON_START_TAG);
    m_Writer.Int64(artifact.windowStart());
    this->writeKey(CArtifactJsonTags::JSON_END_TAG);
    m_Writer.Int64(artifact.windowEnd());
    this->writeKey(CArtifactJsonTags::JSON_INTERVAL_TAG);
    m_Writer.Int64(artifact.interval());
    m_Writer.EndObject();

    this->writeKey(CArtifactJsonTags::JSON_FINGERPRINT_TAG);
    this->writeString(artifact.fingerprint());

    this->writeKey(CArtifactJsonTags::JSON_PARAMETERS_TAG);
    m_Writer.StartObject();
    for (const auto& parameter : artifact.parameters()) {
        this->writeKey(parameter.first);
        this->writeString(parameter.second);
    }
    m_Writer.EndObject();

    this->writeKey(CArtifactJsonTags::JSON_CORRELATION_TAG);
    this->writeCorrelationObject(artifact.correlations());

    this->writeKey(CArtifactJsonTags::JSON_CAUSALITY_TAG);
    m_Writer.StartArray();
    for (const auto& verdict : artifact.causality()) {
        this->writeVerdict(verdict);
    }
    m_Writer.EndArray();

    this->writeKey(CArtifactJsonTags::JSON_FORECASTS_TAG);
    m_Writer.StartArray();
    for (const auto& forecast : artifact.forecasts()) {
        this->writeForecast(forecast);
    }
    m_Writer.EndArray();

    m_Writer.EndObject();
    this->finish();
}

void CArtifactJsonWriter::writeCorrelation(const model::CCorrelationMatrix& correlations) {
    this->start();
    this->writeCorrelationObject(correlations);
    this->finish();
}

void CArtifactJsonWriter::writeCausality(const TVerdictVec& verdicts) {
    this->start();
    m_Writer.StartArray();
    for (const auto& verdict : verdicts) {
        this->writeVerdict(verdict);
    }
    m_Writer.EndArray();
    this->finish();
}

void CArtifactJsonWriter::writeForecasts(const TForecastResultVec& forecasts) {
    this->start();
    m_Writer.StartArray();
    for (const auto& forecast : forecasts) {
        this->writeForecast(forecast);
    }
    m_Writer.EndArray();
    this->finish();
}

std::string CArtifactJsonWriter::toString(const model::CAnalysisArtifact& artifact) {
    std::ostringstream strm;
    {
        CArtifactJsonWriter writer{strm};
        writer.write(artifact);
    }
    return strm.str();
}

void CArtifactJsonWriter::start() {
    // The writer only accepts one root value until it's reset.
    m_Writer.Reset(m_WriteStream);
}

void CArtifactJsonWriter::finish() {
    m_WriteStream.Put('\n');
    m_Writer.Flush();
}

void CArtifactJsonWriter::writeCorrelationObject(const model::CCorrelationMatrix& correlations) {
    std::size_t n{correlations.size()};

    m_Writer.StartObject();
    this->writeKey(CArtifactJsonTags::JSON_NAMES_TAG);
    m_Writer.StartArray();
    for (const auto& name : correlations.names()) {
        this->writeString(name);
    }
    m_Writer.EndArray();

    this->writeKey(CArtifactJsonTags::JSON_COEFFICIENTS_TAG);
    m_Writer.StartArray();
    for (std::size_t i = 0; i < n; ++i) {
        m_Writer.StartArray();
        for (std::size_t j = 0; j < n; ++j) {
            const auto& cell = correlations.at(i, j);
            if (cell.ok()) {
                this->writeDouble(cell.s_Coefficient);
            } else {
                m_Writer.Null();
            }
        }
        m_Writer.EndArray();
    }
    m_Writer.EndArray();

    this->writeKey(CArtifactJsonTags::JSON_STATUS_TAG);
    m_Writer.StartArray();
    for (std::size_t i = 0; i < n; ++i) {
        m_Writer.StartArray();
        for (std::size_t j = 0; j < n; ++j) {
            this->writeString(model::SCorrelationCell::print(correlations.at(i, j).s_Status));
        }
        m_Writer.EndArray();
    }
    m_Writer.EndArray();

    this->writeKey(CArtifactJsonTags::JSON_SAMPLES_TAG);
    m_Writer.StartArray();
    for (std::size_t i = 0; i < n; ++i) {
        m_Writer.StartArray();
        for (std::size_t j = 0; j < n; ++j) {
            m_Writer.Uint64(correlations.at(i, j).s_Samples);
        }
        m_Writer.EndArray();
    }
    m_Writer.EndArray();
    m_Writer.EndObject();
}

void CArtifactJsonWriter::writeVerdict(const model::SCausalityVerdict& verdict) {
    m_Writer.StartObject();
    this->writeKey(CArtifactJsonTags::JSON_CAUSE_TAG);
    this->writeString(verdict.s_Cause);
    this->writeKey(CArtifactJsonTags::JSON_EFFECT_TAG);
    this->writeString(verdict.s_Effect);
    this->writeKey(CArtifactJsonTags::JSON_STATUS_TAG);
    this->writeString(model::SCausalityVerdict::print(verdict.s_Status));
    this->writeKey(CArtifactJsonTags::JSON_ADJUSTMENT_TAG);
    this->writeString(model::SCausalityVerdict::print(verdict.s_Adjustment));
    this->writeKey(CArtifactJsonTags::JSON_MAX_LAG_TAG);
    m_Writer.Uint64(verdict.s_MaxLag);
    this->writeKey(CArtifactJsonTags::JSON_LAG_TAG);
    m_Writer.Uint64(verdict.s_Lag);
    this->writeKey(CArtifactJsonTags::JSON_STATISTIC_TAG);
    this->writeDouble(verdict.s_Statistic);
    this->writeKey(CArtifactJsonTags::JSON_P_VALUE_TAG);
    this->writeDouble(verdict.s_PValue);
    this->writeKey(CArtifactJsonTags::JSON_SIGNIFICANT_TAG);
    m_Writer.Bool(verdict.s_Significant);
    this->writeKey(CArtifactJsonTags::JSON_OBSERVATIONS_TAG);
    m_Writer.Uint64(verdict.s_Observations);
    this->writeKey(CArtifactJsonTags::JSON_LAG_P_VALUES_TAG);
    m_Writer.StartArray();
    for (const auto& pValue : verdict.s_LagPValues) {
        if (pValue == std::nullopt) {
            m_Writer.Null();
        } else {
            this->writeDouble(*pValue);
        }
    }
    m_Writer.EndArray();
    m_Writer.EndObject();
}

void CArtifactJsonWriter::writeForecast(const model::SForecastResult& forecast) {
    m_Writer.StartObject();
    this->writeKey(CArtifactJsonTags::JSON_ENTITY_TAG);
    this->writeString(forecast.s_Entity);
    this->writeKey(CArtifactJsonTags::JSON_STATUS_TAG);
    this->writeString(model::SForecastResult::print(forecast.s_Status));
    if (forecast.ok() == false) {
        this->writeKey(CArtifactJsonTags::JSON_ERROR_TAG);
        this->writeString(forecast.s_Error);
        m_Writer.EndObject();
        return;
    }

    const auto& order = forecast.s_Order;
    this->writeKey(CArtifactJsonTags::JSON_ORDER_TAG);
    m_Writer.StartObject();
    this->writeKey(CArtifactJsonTags::JSON_P_TAG);
    m_Writer.Uint64(order.s_P);
    this->writeKey(CArtifactJsonTags::JSON_D_TAG);
    m_Writer.Uint64(order.s_D);
    this->writeKey(CArtifactJsonTags::JSON_Q_TAG);
    m_Writer.Uint64(order.s_Q);
    this->writeKey(CArtifactJsonTags::JSON_SEASONAL_P_TAG);
    m_Writer.Uint64(order.s_SeasonalP);
    this->writeKey(CArtifactJsonTags::JSON_SEASONAL_D_TAG);
    m_Writer.Uint64(order.s_SeasonalD);
    this->writeKey(CArtifactJsonTags::JSON_SEASONAL_Q_TAG);
    m_Writer.Uint64(order.s_SeasonalQ);
    this->writeKey(CArtifactJsonTags::JSON_PERIOD_TAG);
    m_Writer.Uint64(order.s_Period);
    m_Writer.EndObject();

    this->writeKey(CArtifactJsonTags::JSON_REGRESSORS_TAG);
    m_Writer.StartArray();
    for (const auto& regressor : forecast.s_Regressors) {
        this->writeString(regressor);
    }
    m_Writer.EndArray();

    this->writeKey(CArtifactJsonTags::JSON_CRITERION_TAG);
    this->writeString(maths::CInformationCriteria::print(forecast.s_Criterion));
    this->writeKey(CArtifactJsonTags::JSON_CRITERION_VALUE_TAG);
    this->writeDouble(forecast.s_CriterionValue);
    this->writeKey(CArtifactJsonTags::JSON_RESIDUAL_RMSE_TAG);
    this->writeDouble(forecast.s_ResidualRmse);

    this->writeKey(CArtifactJsonTags::JSON_FIT_WINDOW_TAG);
    m_Writer.StartObject();
    this->writeKey(CArtifactJsonTags::JSON_START_TAG);
    m_Writer.Int64(forecast.s_FitStart);
    this->writeKey(CArtifactJsonTags::JSON_END_TAG);
    m_Writer.Int64(forecast.s_FitEnd);
    this->writeKey(CArtifactJsonTags::JSON_OBSERVATIONS_TAG);
    m_Writer.Uint64(forecast.s_FitObservations);
    m_Writer.EndObject();

    this->writeKey(CArtifactJsonTags::JSON_COVERAGE_TAG);
    this->writeDouble(forecast.s_Coverage);

    this->writeKey(CArtifactJsonTags::JSON_STEPS_TAG);
    m_Writer.StartArray();
    for (std::size_t i = 0; i < forecast.s_Mean.size(); ++i) {
        m_Writer.StartObject();
        this->writeKey(CArtifactJsonTags::JSON_TIME_TAG);
        m_Writer.Int64(forecast.s_Times[i]);
        this->writeKey(CArtifactJsonTags::JSON_MEAN_TAG);
        this->writeDouble(forecast.s_Mean[i]);
        this->writeKey(CArtifactJsonTags::JSON_LOWER_TAG);
        this->writeDouble(forecast.s_Lower[i]);
        this->writeKey(CArtifactJsonTags::JSON_UPPER_TAG);
        this->writeDouble(forecast.s_Upper[i]);
        m_Writer.EndObject();
    }
    m_Writer.EndArray();
    m_Writer.EndObject();
}

void CArtifactJsonWriter::writeKey(const std::string& key) {
    m_Writer.Key(key.c_str(), static_cast<rapidjson::SizeType>(key.size()));
}

void CArtifactJsonWriter::writeString(const std::string& value) {
    m_Writer.String(value.c_str(), static_cast<rapidjson::SizeType>(value.size()));
}

void CArtifactJsonWriter::writeDouble(double value) {
    // JSON has no representation for NaN or infinity.
    if (std::isfinite(value)) {
        m_Writer.Double(value);
    } else {
        m_Writer.Null();
    }
}
}
}
