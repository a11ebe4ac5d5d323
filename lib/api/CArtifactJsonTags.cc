/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <api/CArtifactJsonTags.h>

namespace tsa {
namespace api {

const std::string CArtifactJsonTags::JSON_RUN_ID_TAG{"run_id"};
const std::string CArtifactJsonTags::JSON_RUN_TIME_TAG{"run_time"};
const std::string CArtifactJsonTags::JSON_RUN_TIME_ISO_TAG{"run_time_iso"};
const std::string CArtifactJsonTags::JSON_WINDOW_TAG{"window"};
const std::string CArtifactJsonTags::JSON_START_TAG{"start"};
const std::string CArtifactJsonTags::JSON_END_TAG{"end"};
const std::string CArtifactJsonTags::JSON_INTERVAL_TAG{"interval"};
const std::string CArtifactJsonTags::JSON_FINGERPRINT_TAG{"fingerprint"};
const std::string CArtifactJsonTags::JSON_PARAMETERS_TAG{"parameters"};
const std::string CArtifactJsonTags::JSON_CORRELATION_TAG{"correlation"};
const std::string CArtifactJsonTags::JSON_NAMES_TAG{"names"};
const std::string CArtifactJsonTags::JSON_COEFFICIENTS_TAG{"coefficients"};
const std::string CArtifactJsonTags::JSON_STATUS_TAG{"status"};
const std::string CArtifactJsonTags::JSON_SAMPLES_TAG{"samples"};
const std::string CArtifactJsonTags::JSON_CAUSALITY_TAG{"causality"};
const std::string CArtifactJsonTags::JSON_CAUSE_TAG{"cause"};
const std::string CArtifactJsonTags::JSON_EFFECT_TAG{"effect"};
const std::string CArtifactJsonTags::JSON_ADJUSTMENT_TAG{"adjustment"};
const std::string CArtifactJsonTags::JSON_MAX_LAG_TAG{"max_lag"};
const std::string CArtifactJsonTags::JSON_LAG_TAG{"lag"};
const std::string CArtifactJsonTags::JSON_STATISTIC_TAG{"statistic"};
const std::string CArtifactJsonTags::JSON_P_VALUE_TAG{"p_value"};
const std::string CArtifactJsonTags::JSON_SIGNIFICANT_TAG{"significant"};
const std::string CArtifactJsonTags::JSON_OBSERVATIONS_TAG{"observations"};
const std::string CArtifactJsonTags::JSON_LAG_P_VALUES_TAG{"lag_p_values"};
const std::string CArtifactJsonTags::JSON_FORECASTS_TAG{"forecasts"};
const std::string CArtifactJsonTags::JSON_ENTITY_TAG{"entity"};
const std::string CArtifactJsonTags::JSON_ERROR_TAG{"error"};
const std::string CArtifactJsonTags::JSON_ORDER_TAG{"order"};
const std::string CArtifactJsonTags::JSON_P_TAG{"p"};
const std::string CArtifactJsonTags::JSON_D_TAG{"d"};
const std::string CArtifactJsonTags::JSON_Q_TAG{"q"};
const std::string CArtifactJsonTags::JSON_SEASONAL_P_TAG{"seasonal_p"};
const std::string CArtifactJsonTags::JSON_SEASONAL_D_TAG{"seasonal_d"};
const std::string CArtifactJsonTags::JSON_SEASONAL_Q_TAG{"seasonal_q"};
const std::string CArtifactJsonTags::JSON_PERIOD_TAG{"period"};
const std::string CArtifactJsonTags::JSON_REGRESSORS_TAG{"regressors"};
const std::string CArtifactJsonTags::JSON_CRITERION_TAG{"criterion"};
const std::string CArtifactJsonTags::JSON_CRITERION_VALUE_TAG{"criterion_value"};
const std::string CArtifactJsonTags::JSON_RESIDUAL_RMSE_TAG{"residual_rmse"};
const std::string CArtifactJsonTags::JSON_FIT_WINDOW_TAG{"fit_window"};
const std::string CArtifactJsonTags::JSON_COVERAGE_TAG{"coverage"};
const std::string CArtifactJsonTags::JSON_STEPS_TAG{"steps"};
const std::string CArtifactJsonTags::JSON_TIME_TAG{"time"};
const std::string CArtifactJsonTags::JSON_MEAN_TAG{"mean"};
const std::string CArtifactJsonTags::JSON_LOWER_TAG{"lower"};
const std::string CArtifactJsonTags::JSON_UPPER_TAG{"upper"};
}
}
