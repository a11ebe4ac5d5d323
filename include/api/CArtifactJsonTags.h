/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_tsa_api_CArtifactJsonTags_h
#define INCLUDED_tsa_api_CArtifactJsonTags_h

#include <api/ImportExport.h>

#include <string>

namespace tsa {
namespace api {

//! \brief Shared tags used by the JSON analysis artifact.
struct API_EXPORT CArtifactJsonTags {
    static const std::string JSON_RUN_ID_TAG;
    static const std::string JSON_RUN_TIME_TAG;
    static const std::string JSON_RUN_TIME_ISO_TAG;
    static const std::string JSON_WINDOW_TAG;
    static const std::string JSON_START_TAG;
    static const std::string JSON_END_TAG;
    static const std::string JSON_INTERVAL_TAG;
    static const std::string JSON_FINGERPRINT_TAG;
    static const std::string JSON_PARAMETERS_TAG;
    static const std::string JSON_CORRELATION_TAG;
    static const std::string JSON_NAMES_TAG;
    static const std::string JSON_COEFFICIENTS_TAG;
    static const std::string JSON_STATUS_TAG;
    static const std::string JSON_SAMPLES_TAG;
    static const std::string JSON_CAUSALITY_TAG;
    static const std::string JSON_CAUSE_TAG;
    static const std::string JSON_EFFECT_TAG;
    static const std::string JSON_ADJUSTMENT_TAG;
    static const std::string JSON_MAX_LAG_TAG;
    static const std::string JSON_LAG_TAG;
    static const std::string JSON_STATISTIC_TAG;
    static const std::string JSON_P_VALUE_TAG;
    static const std::string JSON_SIGNIFICANT_TAG;
    static const std::string JSON_OBSERVATIONS_TAG;
    static const std::string JSON_LAG_P_VALUES_TAG;
    static const std::string JSON_FORECASTS_TAG;
    static const std::string JSON_ENTITY_TAG;
    static const std::string JSON_ERROR_TAG;
    static const std::string JSON_ORDER_TAG;
    static const std::string JSON_P_TAG;
    static const std::string JSON_D_TAG;
    static const std::string JSON_Q_TAG;
    static const std::string JSON_SEASONAL_P_TAG;
    static const std::string JSON_SEASONAL_D_TAG;
    static const std::string JSON_SEASONAL_Q_TAG;
    static const std::string JSON_PERIOD_TAG;
    static const std::string JSON_REGRESSORS_TAG;
    static const std::string JSON_CRITERION_TAG;
    static const std::string JSON_CRITERION_VALUE_TAG;
    static const std::string JSON_RESIDUAL_RMSE_TAG;
    static const std::string JSON_FIT_WINDOW_TAG;
    static const std::string JSON_COVERAGE_TAG;
    static const std::string JSON_STEPS_TAG;
    static const std::string JSON_TIME_TAG;
    static const std::string JSON_MEAN_TAG;
    static const std::string JSON_LOWER_TAG;
    static const std::string JSON_UPPER_TAG;
};
}
}

#endif // INCLUDED_tsa_api_CArtifactJsonTags_h
