/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <api/CArtifactJsonParser.h>

#include <core/CLogger.h>

#include <maths/CInformationCriteria.h>

#include <api/CArtifactJsonTags.h>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/istreamwrapper.h>

#include <istream>
#include <limits>
#include <sstream>

namespace tsa {
namespace api {
namespace {
using TVerdictVec = model::CAnalysisArtifact::TVerdictVec;
using TForecastResultVec = model::CAnalysisArtifact::TForecastResultVec;

const rapidjson::Value* member(const rapidjson::Value& object, const std::string& tag) {
    if (object.IsObject() == false) {
        return nullptr;
    }
    auto i = object.FindMember(tag.c_str());
    if (i == object.MemberEnd()) {
        LOG_ERROR(<< "Missing '" << tag << "' in artifact");
        return nullptr;
    }
    return &i->value;
}

bool readString(const rapidjson::Value& object, const std::string& tag, std::string& result) {
    const rapidjson::Value* value{member(object, tag)};
    if (value == nullptr || value->IsString() == false) {
        LOG_ERROR(<< "Expected '" << tag << "' to be a string");
        return false;
    }
    result.assign(value->GetString(), value->GetStringLength());
    return true;
}

bool readTime(const rapidjson::Value& object, const std::string& tag, core_t::TTime& result) {
    const rapidjson::Value* value{member(object, tag)};
    if (value == nullptr || value->IsInt64() == false) {
        LOG_ERROR(<< "Expected '" << tag << "' to be an integer");
        return false;
    }
    result = static_cast<core_t::TTime>(value->GetInt64());
    return true;
}

bool readSize(const rapidjson::Value& object, const std::string& tag, std::size_t& result) {
    const rapidjson::Value* value{member(object, tag)};
    if (value == nullptr || value->IsUint64() == false) {
        LOG_ERROR(<< "Expected '" << tag << "' to be an unsigned integer");
        return false;
    }
    result = static_cast<std::size_t>(value->GetUint64());
    return true;
}

bool readBool(const rapidjson::Value& object, const std::string& tag, bool& result) {
    const rapidjson::Value* value{member(object, tag)};
    if (value == nullptr || value->IsBool() == false) {
        LOG_ERROR(<< "Expected '" << tag << "' to be a boolean");
        return false;
    }
    result = value->GetBool();
    return true;
}

//! Non-finite values are written as null.
bool readDouble(const rapidjson::Value& value, double& result) {
    if (value.IsNull()) {
        result = std::numeric_limits<double>::quiet_NaN();
        return true;
    }
    if (value.IsNumber() == false) {
        return false;
    }
    result = value.GetDouble();
    return true;
}

bool readDouble(const rapidjson::Value& object, const std::string& tag, double& result) {
    const rapidjson::Value* value{member(object, tag)};
    if (value == nullptr || readDouble(*value, result) == false) {
        LOG_ERROR(<< "Expected '" << tag << "' to be a number");
        return false;
    }
    return true;
}

const rapidjson::Value* readArray(const rapidjson::Value& object, const std::string& tag) {
    const rapidjson::Value* value{member(object, tag)};
    if (value == nullptr || value->IsArray() == false) {
        LOG_ERROR(<< "Expected '" << tag << "' to be an array");
        return nullptr;
    }
    return value;
}

bool readStrings(const rapidjson::Value& object, const std::string& tag, std::vector<std::string>& result) {
    const rapidjson::Value* array{readArray(object, tag)};
    if (array == nullptr) {
        return false;
    }
    result.clear();
    for (const auto& element : array->GetArray()) {
        if (element.IsString() == false) {
            LOG_ERROR(<< "Expected '" << tag << "' to contain strings");
            return false;
        }
        result.emplace_back(element.GetString(), element.GetStringLength());
    }
    return true;
}

//! Check \p value is an n x n array of arrays.
bool isSquare(const rapidjson::Value* value, std::size_t n) {
    if (value == nullptr || value->Size() != n) {
        return false;
    }
    for (const auto& row : value->GetArray()) {
        if (row.IsArray() == false || row.Size() != n) {
            return false;
        }
    }
    return true;
}

bool parseCorrelations(const rapidjson::Value& object, model::CCorrelationMatrix& result) {
    std::vector<std::string> names;
    if (readStrings(object, CArtifactJsonTags::JSON_NAMES_TAG, names) == false) {
        return false;
    }
    std::size_t n{names.size()};
    const rapidjson::Value* coefficients{readArray(object, CArtifactJsonTags::JSON_COEFFICIENTS_TAG)};
    const rapidjson::Value* status{readArray(object, CArtifactJsonTags::JSON_STATUS_TAG)};
    const rapidjson::Value* samples{readArray(object, CArtifactJsonTags::JSON_SAMPLES_TAG)};
    if (isSquare(coefficients, n) == false || isSquare(status, n) == false ||
        isSquare(samples, n) == false) {
        LOG_ERROR(<< "Correlation matrices must be " << n << " x " << n);
        return false;
    }

    result = model::CCorrelationMatrix{names};
    for (rapidjson::SizeType i = 0; i < n; ++i) {
        for (rapidjson::SizeType j = i; j < n; ++j) {
            model::SCorrelationCell cell;
            const auto& statusName = (*status)[i][j];
            const auto& coefficient = (*coefficients)[i][j];
            const auto& count = (*samples)[i][j];
            if (statusName.IsString() == false ||
                model::SCorrelationCell::parse(statusName.GetString(), cell.s_Status) == false ||
                count.IsUint64() == false) {
                LOG_ERROR(<< "Invalid correlation cell (" << i << ", " << j << ")");
                return false;
            }
            cell.s_Samples = static_cast<std::size_t>(count.GetUint64());
            if (cell.ok()) {
                if (coefficient.IsNumber() == false) {
                    LOG_ERROR(<< "Missing coefficient for cell (" << i << ", " << j << ")");
                    return false;
                }
                cell.s_Coefficient = coefficient.GetDouble();
            }
            result.set(i, j, cell);
        }
    }
    return true;
}

bool parseVerdict(const rapidjson::Value& object, model::SCausalityVerdict& result) {
    std::string status;
    std::string adjustment;
    if (readString(object, CArtifactJsonTags::JSON_CAUSE_TAG, result.s_Cause) == false ||
        readString(object, CArtifactJsonTags::JSON_EFFECT_TAG, result.s_Effect) == false ||
        readString(object, CArtifactJsonTags::JSON_STATUS_TAG, status) == false ||
        readString(object, CArtifactJsonTags::JSON_ADJUSTMENT_TAG, adjustment) == false ||
        readSize(object, CArtifactJsonTags::JSON_MAX_LAG_TAG, result.s_MaxLag) == false ||
        readSize(object, CArtifactJsonTags::JSON_LAG_TAG, result.s_Lag) == false ||
        readDouble(object, CArtifactJsonTags::JSON_STATISTIC_TAG, result.s_Statistic) == false ||
        readDouble(object, CArtifactJsonTags::JSON_P_VALUE_TAG, result.s_PValue) == false ||
        readBool(object, CArtifactJsonTags::JSON_SIGNIFICANT_TAG, result.s_Significant) == false ||
        readSize(object, CArtifactJsonTags::JSON_OBSERVATIONS_TAG, result.s_Observations) == false) {
        return false;
    }
    if (model::SCausalityVerdict::parse(status, result.s_Status) == false ||
        model::SCausalityVerdict::parse(adjustment, result.s_Adjustment) == false) {
        LOG_ERROR(<< "Invalid causality status '" << status << "' or adjustment '"
                  << adjustment << "'");
        return false;
    }
    const rapidjson::Value* pValues{readArray(object, CArtifactJsonTags::JSON_LAG_P_VALUES_TAG)};
    if (pValues == nullptr) {
        return false;
    }
    for (const auto& pValue : pValues->GetArray()) {
        if (pValue.IsNull()) {
            result.s_LagPValues.emplace_back();
        } else if (pValue.IsNumber()) {
            result.s_LagPValues.emplace_back(pValue.GetDouble());
        } else {
            LOG_ERROR(<< "Invalid lag p-value");
            return false;
        }
    }
    return true;
}

bool parseForecast(const rapidjson::Value& object, model::SForecastResult& result) {
    std::string status;
    if (readString(object, CArtifactJsonTags::JSON_ENTITY_TAG, result.s_Entity) == false ||
        readString(object, CArtifactJsonTags::JSON_STATUS_TAG, status) == false) {
        return false;
    }
    if (model::SForecastResult::parse(status, result.s_Status) == false) {
        LOG_ERROR(<< "Invalid forecast status '" << status << "'");
        return false;
    }
    if (result.ok() == false) {
        return readString(object, CArtifactJsonTags::JSON_ERROR_TAG, result.s_Error);
    }

    const rapidjson::Value* order{member(object, CArtifactJsonTags::JSON_ORDER_TAG)};
    const rapidjson::Value* fitWindow{member(object, CArtifactJsonTags::JSON_FIT_WINDOW_TAG)};
    std::string criterion;
    if (order == nullptr || fitWindow == nullptr ||
        readSize(*order, CArtifactJsonTags::JSON_P_TAG, result.s_Order.s_P) == false ||
        readSize(*order, CArtifactJsonTags::JSON_D_TAG, result.s_Order.s_D) == false ||
        readSize(*order, CArtifactJsonTags::JSON_Q_TAG, result.s_Order.s_Q) == false ||
        readSize(*order, CArtifactJsonTags::JSON_SEASONAL_P_TAG, result.s_Order.s_SeasonalP) == false ||
        readSize(*order, CArtifactJsonTags::JSON_SEASONAL_D_TAG, result.s_Order.s_SeasonalD) == false ||
        readSize(*order, CArtifactJsonTags::JSON_SEASONAL_Q_TAG, result.s_Order.s_SeasonalQ) == false ||
        readSize(*order, CArtifactJsonTags::JSON_PERIOD_TAG, result.s_Order.s_Period) == false ||
        readStrings(object, CArtifactJsonTags::JSON_REGRESSORS_TAG, result.s_Regressors) == false ||
        readString(object, CArtifactJsonTags::JSON_CRITERION_TAG, criterion) == false ||
        readDouble(object, CArtifactJsonTags::JSON_CRITERION_VALUE_TAG, result.s_CriterionValue) == false ||
        readDouble(object, CArtifactJsonTags::JSON_RESIDUAL_RMSE_TAG, result.s_ResidualRmse) == false ||
        readTime(*fitWindow, CArtifactJsonTags::JSON_START_TAG, result.s_FitStart) == false ||
        readTime(*fitWindow, CArtifactJsonTags::JSON_END_TAG, result.s_FitEnd) == false ||
        readSize(*fitWindow, CArtifactJsonTags::JSON_OBSERVATIONS_TAG, result.s_FitObservations) == false ||
        readDouble(object, CArtifactJsonTags::JSON_COVERAGE_TAG, result.s_Coverage) == false) {
        return false;
    }
    if (maths::CInformationCriteria::parse(criterion, result.s_Criterion) == false) {
        LOG_ERROR(<< "Invalid criterion '" << criterion << "'");
        return false;
    }

    const rapidjson::Value* steps{readArray(object, CArtifactJsonTags::JSON_STEPS_TAG)};
    if (steps == nullptr) {
        return false;
    }
    for (const auto& step : steps->GetArray()) {
        core_t::TTime time;
        double mean;
        double lower;
        double upper;
        if (readTime(step, CArtifactJsonTags::JSON_TIME_TAG, time) == false ||
            readDouble(step, CArtifactJsonTags::JSON_MEAN_TAG, mean) == false ||
            readDouble(step, CArtifactJsonTags::JSON_LOWER_TAG, lower) == false ||
            readDouble(step, CArtifactJsonTags::JSON_UPPER_TAG, upper) == false) {
            return false;
        }
        result.s_Times.push_back(time);
        result.s_Mean.push_back(mean);
        result.s_Lower.push_back(lower);
        result.s_Upper.push_back(upper);
    }
    return true;
}
}

CArtifactJsonParser::TArtifactCPtr CArtifactJsonParser::parse(std::istream& strm) {
    rapidjson::IStreamWrapper readStream{strm};
    rapidjson::Document document;
    // Full precision so that values read back exactly as they were written.
    if (document.ParseStream<rapidjson::kParseFullPrecisionFlag>(readStream).HasParseError()) {
        LOG_ERROR(<< "Error parsing artifact at offset " << document.GetErrorOffset()
                  << ": " << rapidjson::GetParseError_En(document.GetParseError()));
        return nullptr;
    }
    if (document.IsObject() == false) {
        LOG_ERROR(<< "Artifact must be a JSON object");
        return nullptr;
    }

    const rapidjson::Value* runId{member(document, CArtifactJsonTags::JSON_RUN_ID_TAG)};
    if (runId == nullptr || runId->IsUint64() == false) {
        LOG_ERROR(<< "Artifact has no valid run identifier");
        return nullptr;
    }

    model::CAnalysisArtifact::SContents contents;
    const rapidjson::Value* window{member(document, CArtifactJsonTags::JSON_WINDOW_TAG)};
    if (readTime(document, CArtifactJsonTags::JSON_RUN_TIME_TAG, contents.s_RunTime) == false ||
        window == nullptr ||
        readTime(*window, CArtifactJsonTags::JSON_START_TAG, contents.s_WindowStart) == false ||
        readTime(*window, CArtifactJsonTags::JSON_END_TAG, contents.s_WindowEnd) == false ||
        readTime(*window, CArtifactJsonTags::JSON_INTERVAL_TAG, contents.s_Interval) == false ||
        readString(document, CArtifactJsonTags::JSON_FINGERPRINT_TAG, contents.s_Fingerprint) == false) {
        return nullptr;
    }

    const rapidjson::Value* parameters{member(document, CArtifactJsonTags::JSON_PARAMETERS_TAG)};
    if (parameters == nullptr || parameters->IsObject() == false) {
        LOG_ERROR(<< "Artifact has no valid parameters");
        return nullptr;
    }
    for (const auto& parameter : parameters->GetObject()) {
        if (parameter.value.IsString() == false) {
            LOG_ERROR(<< "Parameter '" << parameter.name.GetString() << "' isn't a string");
            return nullptr;
        }
        contents.s_Parameters.emplace(parameter.name.GetString(),
                                      parameter.value.GetString());
    }

    const rapidjson::Value* correlation{member(document, CArtifactJsonTags::JSON_CORRELATION_TAG)};
    auto correlations = std::make_shared<model::CCorrelationMatrix>();
    if (correlation == nullptr || parseCorrelations(*correlation, *correlations) == false) {
        return nullptr;
    }
    contents.s_Correlations = std::move(correlations);

    const rapidjson::Value* causality{readArray(document, CArtifactJsonTags::JSON_CAUSALITY_TAG)};
    if (causality == nullptr) {
        return nullptr;
    }
    auto verdicts = std::make_shared<TVerdictVec>();
    for (const auto& element : causality->GetArray()) {
        model::SCausalityVerdict verdict;
        if (parseVerdict(element, verdict) == false) {
            return nullptr;
        }
        verdicts->push_back(std::move(verdict));
    }
    contents.s_Causality = std::move(verdicts);

    const rapidjson::Value* forecasts{readArray(document, CArtifactJsonTags::JSON_FORECASTS_TAG)};
    if (forecasts == nullptr) {
        return nullptr;
    }
    auto results = std::make_shared<TForecastResultVec>();
    for (const auto& element : forecasts->GetArray()) {
        model::SForecastResult result;
        if (parseForecast(element, result) == false) {
            return nullptr;
        }
        results->push_back(std::move(result));
    }
    contents.s_Forecasts = std::move(results);

    return std::make_shared<const model::CAnalysisArtifact>(runId->GetUint64(),
                                                            std::move(contents));
}

CArtifactJsonParser::TArtifactCPtr CArtifactJsonParser::parse(const std::string& json) {
    std::istringstream strm{json};
    return parse(strm);
}
}
}
