/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <api/CAnalysisConfig.h>

#include <core/CStreamUtils.h>

#include <maths/CInformationCriteria.h>

#include <boost/property_tree/ini_parser.hpp>

#include <algorithm>
#include <fstream>
#include <set>
#include <sstream>

namespace tsa {
namespace api {

// Initialise statics
const core_t::TTime CAnalysisConfig::DEFAULT_LOOKBACK{30 * 86400};
const core_t::TTime CAnalysisConfig::DEFAULT_INTERVAL{3600};
// Long enough to carry prices over a weekend.
const core_t::TTime CAnalysisConfig::DEFAULT_MAX_STALENESS{3 * 86400};
const core_t::TTime CAnalysisConfig::DEFAULT_SEARCH_TREND_STALENESS{8 * 86400};
const core_t::TTime CAnalysisConfig::DEFAULT_MACROECONOMIC_STALENESS{37 * 86400};
const std::size_t CAnalysisConfig::DEFAULT_MIN_SAMPLES{30};
const std::size_t CAnalysisConfig::DEFAULT_MAX_LAG{model::CCausalityEngine::DEFAULT_MAX_LAG};
const double CAnalysisConfig::DEFAULT_ALPHA{0.05};
const double CAnalysisConfig::DEFAULT_STATIONARITY_ALPHA{0.05};
const std::size_t CAnalysisConfig::DEFAULT_ADF_LAGS{1};
const std::size_t CAnalysisConfig::DEFAULT_MAX_DIFFERENCES{2};
const std::size_t CAnalysisConfig::DEFAULT_MAX_PAIRS{0};
const std::size_t CAnalysisConfig::DEFAULT_HORIZON{168};
const std::size_t CAnalysisConfig::DEFAULT_SEASONAL_PERIOD{24};
const double CAnalysisConfig::DEFAULT_COVERAGE{0.95};
const std::string CAnalysisConfig::DEFAULT_CRITERION{"aicc"};
const std::string CAnalysisConfig::GRID_ORDER_SELECTION{"grid"};
const std::string CAnalysisConfig::FIXED_ORDER_SELECTION{"fixed"};
const std::string CAnalysisConfig::DEFAULT_ORDER_SELECTION{GRID_ORDER_SELECTION};
const std::string CAnalysisConfig::DEFAULT_ORDER{"1,1,1"};
const std::string CAnalysisConfig::DEFAULT_SEASONAL_ORDER{"0,0,0"};
const std::size_t CAnalysisConfig::DEFAULT_MAX_P{2};
const std::size_t CAnalysisConfig::DEFAULT_MAX_Q{2};
const std::size_t CAnalysisConfig::DEFAULT_MAX_SEASONAL_P{1};
const std::size_t CAnalysisConfig::DEFAULT_MAX_SEASONAL_Q{1};
const std::size_t CAnalysisConfig::DEFAULT_MAX_ITERATIONS{500};
const std::uint64_t CAnalysisConfig::DEFAULT_TIMEOUT_MS{60000};
const std::size_t CAnalysisConfig::DEFAULT_RETENTION{10};

CAnalysisConfig::CAnalysisConfig()
    : m_Lookback{DEFAULT_LOOKBACK}, m_Interval{DEFAULT_INTERVAL},
      m_MaxStaleness{DEFAULT_MAX_STALENESS},
      m_SearchTrendStaleness{DEFAULT_SEARCH_TREND_STALENESS},
      m_MacroeconomicStaleness{DEFAULT_MACROECONOMIC_STALENESS},
      m_MinimumSamples{DEFAULT_MIN_SAMPLES}, m_MaxLag{DEFAULT_MAX_LAG},
      m_Alpha{DEFAULT_ALPHA}, m_StationarityAlpha{DEFAULT_STATIONARITY_ALPHA},
      m_AdfLags{DEFAULT_ADF_LAGS}, m_MaxDifferences{DEFAULT_MAX_DIFFERENCES},
      m_MaxPairs{DEFAULT_MAX_PAIRS}, m_Horizon{DEFAULT_HORIZON},
      m_SeasonalPeriod{DEFAULT_SEASONAL_PERIOD}, m_Coverage{DEFAULT_COVERAGE},
      m_Criterion{maths_t::E_AICc}, m_SelectOrder{true}, m_Order{1, 1, 1, 0, 0, 0, 24},
      m_MaxP{DEFAULT_MAX_P}, m_MaxQ{DEFAULT_MAX_Q}, m_MaxSeasonalP{DEFAULT_MAX_SEASONAL_P},
      m_MaxSeasonalQ{DEFAULT_MAX_SEASONAL_Q}, m_MaxIterations{DEFAULT_MAX_ITERATIONS},
      m_TimeoutMs{DEFAULT_TIMEOUT_MS}, m_Retention{DEFAULT_RETENTION} {
}

bool CAnalysisConfig::init(const std::string& configFile) {
    std::ifstream strm{configFile.c_str()};
    if (!strm.is_open()) {
        LOG_ERROR(<< "Error opening config file " << configFile);
        return false;
    }
    core::CStreamUtils::skipUtf8Bom(strm);
    return this->init(strm, configFile);
}

bool CAnalysisConfig::initFromString(const std::string& config) {
    std::istringstream strm{config};
    return this->init(strm, "string");
}

bool CAnalysisConfig::init(std::istream& strm, const std::string& source) {
    boost::property_tree::ptree propTree;
    try {
        boost::property_tree::ini_parser::read_ini(strm, propTree);
    } catch (boost::property_tree::ptree_error& e) {
        LOG_ERROR(<< "Error reading config " << source << " : " << e.what());
        return false;
    }

    TStrVec series;
    processList(propTree, "series.names", series);
    m_Series.clear();
    for (const auto& entry : series) {
        std::size_t colon{entry.find(':')};
        std::string name{entry.substr(0, colon)};
        core::CStringUtils::trimWhitespace(name);
        model::CSeries::EKind kind{model::CSeries::E_Other};
        if (colon != std::string::npos) {
            std::string kindName{entry.substr(colon + 1)};
            core::CStringUtils::trimWhitespace(kindName);
            if (model::CSeries::parse(kindName, kind) == false) {
                LOG_ERROR(<< "Unknown kind '" << kindName << "' for series '" << name << "'");
                return false;
            }
        }
        m_Series.emplace_back(name, kind);
    }
    processList(propTree, "series.returns", m_ReturnColumns);

    std::string criterion;
    std::string orderSelection;
    std::string order;
    std::string seasonalOrder;

    if (processSetting(propTree, "window.lookback", DEFAULT_LOOKBACK, m_Lookback) == false ||
        processSetting(propTree, "window.interval", DEFAULT_INTERVAL, m_Interval) == false ||
        processSetting(propTree, "window.max_staleness", DEFAULT_MAX_STALENESS,
                       m_MaxStaleness) == false ||
        processSetting(propTree, "window.search_trend_staleness", DEFAULT_SEARCH_TREND_STALENESS,
                       m_SearchTrendStaleness) == false ||
        processSetting(propTree, "window.macroeconomic_staleness", DEFAULT_MACROECONOMIC_STALENESS,
                       m_MacroeconomicStaleness) == false ||
        processSetting(propTree, "correlation.min_samples", DEFAULT_MIN_SAMPLES,
                       m_MinimumSamples) == false ||
        processSetting(propTree, "causality.max_lag", DEFAULT_MAX_LAG, m_MaxLag) == false ||
        processSetting(propTree, "causality.alpha", DEFAULT_ALPHA, m_Alpha) == false ||
        processSetting(propTree, "causality.stationarity_alpha",
                       DEFAULT_STATIONARITY_ALPHA, m_StationarityAlpha) == false ||
        processSetting(propTree, "causality.adf_lags", DEFAULT_ADF_LAGS, m_AdfLags) == false ||
        processSetting(propTree, "causality.max_differences", DEFAULT_MAX_DIFFERENCES,
                       m_MaxDifferences) == false ||
        processSetting(propTree, "causality.max_pairs", DEFAULT_MAX_PAIRS, m_MaxPairs) == false ||
        processSetting(propTree, "forecast.horizon", DEFAULT_HORIZON, m_Horizon) == false ||
        processSetting(propTree, "forecast.seasonal_period", DEFAULT_SEASONAL_PERIOD,
                       m_SeasonalPeriod) == false ||
        processSetting(propTree, "forecast.coverage", DEFAULT_COVERAGE, m_Coverage) == false ||
        processSetting(propTree, "forecast.criterion", DEFAULT_CRITERION, criterion) == false ||
        processSetting(propTree, "forecast.order_selection", DEFAULT_ORDER_SELECTION,
                       orderSelection) == false ||
        processSetting(propTree, "forecast.order", DEFAULT_ORDER, order) == false ||
        processSetting(propTree, "forecast.seasonal_order", DEFAULT_SEASONAL_ORDER,
                       seasonalOrder) == false ||
        processSetting(propTree, "forecast.max_p", DEFAULT_MAX_P, m_MaxP) == false ||
        processSetting(propTree, "forecast.max_q", DEFAULT_MAX_Q, m_MaxQ) == false ||
        processSetting(propTree, "forecast.max_seasonal_p", DEFAULT_MAX_SEASONAL_P,
                       m_MaxSeasonalP) == false ||
        processSetting(propTree, "forecast.max_seasonal_q", DEFAULT_MAX_SEASONAL_Q,
                       m_MaxSeasonalQ) == false ||
        processSetting(propTree, "forecast.max_iterations", DEFAULT_MAX_ITERATIONS,
                       m_MaxIterations) == false ||
        processSetting(propTree, "forecast.timeout_ms", DEFAULT_TIMEOUT_MS, m_TimeoutMs) == false ||
        processSetting(propTree, "history.retention", DEFAULT_RETENTION, m_Retention) == false) {
        LOG_ERROR(<< "Error processing config " << source);
        return false;
    }

    processList(propTree, "causality.targets", m_Targets);
    processList(propTree, "forecast.regressors", m_Regressors);
    processList(propTree, "forecast.entities", m_Entities);
    if (m_Entities.empty() && propTree.get_optional<std::string>("forecast.entities") == boost::none) {
        // By default forecast every price series.
        for (const auto& series_ : m_Series) {
            if (series_.second == model::CSeries::E_Price) {
                m_Entities.push_back(series_.first);
            }
        }
    }

    if (maths::CInformationCriteria::parse(criterion, m_Criterion) == false) {
        LOG_ERROR(<< "Unknown information criterion '" << criterion << "'");
        return false;
    }
    std::string policy{core::CStringUtils::toLower(orderSelection)};
    if (policy == GRID_ORDER_SELECTION) {
        m_SelectOrder = true;
    } else if (policy == FIXED_ORDER_SELECTION) {
        m_SelectOrder = false;
    } else {
        LOG_ERROR(<< "Unknown order selection '" << orderSelection << "', expected '"
                  << GRID_ORDER_SELECTION << "' or '" << FIXED_ORDER_SELECTION << "'");
        return false;
    }
    m_Order = TOrder{};
    if (parseOrder(order, false, m_Order) == false ||
        parseOrder(seasonalOrder, true, m_Order) == false) {
        return false;
    }
    m_Order.s_Period = m_SeasonalPeriod;

    return this->validate();
}

bool CAnalysisConfig::validate() const {
    bool valid{true};
    auto check = [&valid](bool condition, const std::string& message) {
        if (condition == false) {
            LOG_ERROR(<< message);
            valid = false;
        }
    };

    std::set<std::string> names;
    for (const auto& series_ : m_Series) {
        check(series_.first.empty() == false, "Series names must not be empty");
        check(names.insert(series_.first).second, "Duplicate series '" + series_.first + "'");
    }
    check(m_Series.empty() == false, "No series configured");
    for (const auto& entity : m_Entities) {
        check(names.count(entity) > 0, "Forecast entity '" + entity + "' is not a configured series");
    }

    check(m_Interval > 0, "Interval must be positive");
    check(m_Lookback >= m_Interval, "Lookback must be at least one interval");
    check(m_MaxStaleness >= 0 && m_SearchTrendStaleness >= 0 && m_MacroeconomicStaleness >= 0,
          "Staleness must not be negative");
    check(m_MinimumSamples >= 2, "Minimum samples must be at least 2");
    check(m_MaxLag >= 1, "Maximum lag must be at least 1");
    check(m_Alpha > 0.0 && m_Alpha < 1.0, "Significance must be in (0, 1)");
    check(m_StationarityAlpha > 0.0 && m_StationarityAlpha < 1.0,
          "Stationarity significance must be in (0, 1)");
    check(m_MaxDifferences <= model::CCausalityEngine::MAXIMUM_DIFFERENCES,
          "Maximum differences must be at most " +
              core::CStringUtils::typeToString(model::CCausalityEngine::MAXIMUM_DIFFERENCES));
    check(m_Horizon >= 1, "Horizon must be at least 1");
    check(m_Coverage > 0.0 && m_Coverage < 1.0, "Coverage must be in (0, 1)");
    check(m_MaxIterations >= 1, "Maximum iterations must be at least 1");
    check(m_Retention >= 1, "History retention must be at least 1");
    bool seasonal{m_Order.s_SeasonalP + m_Order.s_SeasonalD + m_Order.s_SeasonalQ > 0};
    check(seasonal == false || m_SeasonalPeriod >= 2,
          "Seasonal order needs a seasonal period of at least 2");

    return valid;
}

const CAnalysisConfig::TStrKindPrVec& CAnalysisConfig::series() const {
    return m_Series;
}

CAnalysisConfig::TStrVec CAnalysisConfig::seriesNames() const {
    TStrVec result;
    result.reserve(m_Series.size());
    for (const auto& series_ : m_Series) {
        result.push_back(series_.first);
    }
    return result;
}

const CAnalysisConfig::TStrVec& CAnalysisConfig::returnColumns() const {
    return m_ReturnColumns;
}

core_t::TTime CAnalysisConfig::lookback() const {
    return m_Lookback;
}

core_t::TTime CAnalysisConfig::interval() const {
    return m_Interval;
}

core_t::TTime CAnalysisConfig::maxStaleness() const {
    return m_MaxStaleness;
}

std::size_t CAnalysisConfig::minimumSamples() const {
    return m_MinimumSamples;
}

std::size_t CAnalysisConfig::retention() const {
    return m_Retention;
}

model::CAligner CAnalysisConfig::aligner() const {
    model::CAligner::TKindTimeMap kindStaleness{
        {model::CSeries::E_SearchTrend, m_SearchTrendStaleness},
        {model::CSeries::E_Macroeconomic, m_MacroeconomicStaleness}};
    return model::CAligner{m_Interval, m_MaxStaleness, kindStaleness, m_ReturnColumns};
}

model::CCausalityEngine::SParams CAnalysisConfig::causalityParams() const {
    model::CCausalityEngine::SParams params;
    params.s_MaxLag = m_MaxLag;
    params.s_Alpha = m_Alpha;
    params.s_StationarityAlpha = m_StationarityAlpha;
    params.s_AdfLags = m_AdfLags;
    params.s_MaxDifferences = m_MaxDifferences;
    params.s_MinimumSamples = m_MinimumSamples;
    params.s_Targets = m_Targets;
    params.s_MaxPairs = m_MaxPairs;
    return params;
}

model::CForecastEngine::SParams CAnalysisConfig::forecastParams() const {
    model::CForecastEngine::SParams params;
    params.s_Horizon = m_Horizon;
    params.s_SeasonalPeriod = m_SeasonalPeriod;
    params.s_Coverage = m_Coverage;
    params.s_Criterion = m_Criterion;
    params.s_SelectOrder = m_SelectOrder;
    params.s_Order = m_Order;
    params.s_MaxP = m_MaxP;
    params.s_MaxQ = m_MaxQ;
    params.s_MaxSeasonalP = m_MaxSeasonalP;
    params.s_MaxSeasonalQ = m_MaxSeasonalQ;
    params.s_MaxIterations = m_MaxIterations;
    params.s_TimeoutMs = m_TimeoutMs;
    params.s_Regressors = m_Regressors;
    return params;
}

const CAnalysisConfig::TStrVec& CAnalysisConfig::entities() const {
    return m_Entities;
}

CAnalysisConfig::TStrStrMap CAnalysisConfig::parameters() const {
    using core::CStringUtils;

    TStrVec series;
    for (const auto& series_ : m_Series) {
        series.push_back(series_.first + ':' + model::CSeries::print(series_.second));
    }

    TStrStrMap result;
    result["series.names"] = CStringUtils::join(series, ",");
    result["series.returns"] = CStringUtils::join(m_ReturnColumns, ",");
    result["window.lookback"] = CStringUtils::typeToString(m_Lookback);
    result["window.interval"] = CStringUtils::typeToString(m_Interval);
    result["window.max_staleness"] = CStringUtils::typeToString(m_MaxStaleness);
    result["window.search_trend_staleness"] = CStringUtils::typeToString(m_SearchTrendStaleness);
    result["window.macroeconomic_staleness"] = CStringUtils::typeToString(m_MacroeconomicStaleness);
    result["correlation.min_samples"] = CStringUtils::typeToString(m_MinimumSamples);
    result["causality.max_lag"] = CStringUtils::typeToString(m_MaxLag);
    result["causality.alpha"] = CStringUtils::typeToString(m_Alpha);
    result["causality.stationarity_alpha"] = CStringUtils::typeToString(m_StationarityAlpha);
    result["causality.adf_lags"] = CStringUtils::typeToString(m_AdfLags);
    result["causality.max_differences"] = CStringUtils::typeToString(m_MaxDifferences);
    result["causality.targets"] = CStringUtils::join(m_Targets, ",");
    result["causality.max_pairs"] = CStringUtils::typeToString(m_MaxPairs);
    result["forecast.entities"] = CStringUtils::join(m_Entities, ",");
    result["forecast.regressors"] = CStringUtils::join(m_Regressors, ",");
    result["forecast.horizon"] = CStringUtils::typeToString(m_Horizon);
    result["forecast.seasonal_period"] = CStringUtils::typeToString(m_SeasonalPeriod);
    result["forecast.coverage"] = CStringUtils::typeToString(m_Coverage);
    result["forecast.criterion"] = maths::CInformationCriteria::print(m_Criterion);
    result["forecast.order_selection"] = m_SelectOrder ? GRID_ORDER_SELECTION
                                                       : FIXED_ORDER_SELECTION;
    result["forecast.order"] = m_Order.print();
    result["forecast.max_p"] = CStringUtils::typeToString(m_MaxP);
    result["forecast.max_q"] = CStringUtils::typeToString(m_MaxQ);
    result["forecast.max_seasonal_p"] = CStringUtils::typeToString(m_MaxSeasonalP);
    result["forecast.max_seasonal_q"] = CStringUtils::typeToString(m_MaxSeasonalQ);
    result["forecast.max_iterations"] = CStringUtils::typeToString(m_MaxIterations);
    result["forecast.timeout_ms"] = CStringUtils::typeToString(m_TimeoutMs);
    result["history.retention"] = CStringUtils::typeToString(m_Retention);
    return result;
}

bool CAnalysisConfig::parseOrder(const std::string& value, bool seasonal, TOrder& order) {
    TStrVec terms{core::CStringUtils::splitList(value)};
    std::size_t p{0};
    std::size_t d{0};
    std::size_t q{0};
    if (terms.size() != 3 || core::CStringUtils::stringToType(terms[0], p) == false ||
        core::CStringUtils::stringToType(terms[1], d) == false ||
        core::CStringUtils::stringToType(terms[2], q) == false) {
        LOG_ERROR(<< "Invalid " << (seasonal ? "seasonal order" : "order") << " '"
                  << value << "', expected 'p,d,q'");
        return false;
    }
    if (seasonal) {
        order.s_SeasonalP = p;
        order.s_SeasonalD = d;
        order.s_SeasonalQ = q;
    } else {
        order.s_P = p;
        order.s_D = d;
        order.s_Q = q;
    }
    return true;
}

void CAnalysisConfig::processList(const boost::property_tree::ptree& propTree,
                                  const std::string& iniPath,
                                  TStrVec& value) {
    value = core::CStringUtils::splitList(propTree.get<std::string>(iniPath, ""));
}
}
}
