/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_tsa_api_CAnalysisConfig_h
#define INCLUDED_tsa_api_CAnalysisConfig_h

#include <core/CLogger.h>
#include <core/CStringUtils.h>
#include <core/CoreTypes.h>

#include <maths/CSarimaxModel.h>
#include <maths/MathsTypes.h>

#include <model/CAligner.h>
#include <model/CCausalityEngine.h>
#include <model/CForecastEngine.h>
#include <model/CSeries.h>

#include <api/ImportExport.h>

#include <boost/property_tree/ptree.hpp>

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace tsa {
namespace api {

//! \brief The settings of an analysis run.
//!
//! DESCRIPTION:\n
//! Holds the series to analyse, the window and calendar to align them on,
//! and the settings of each engine.
//!
//! IMPLEMENTATION DECISIONS:\n
//! The settings are stored in files which are similar in format to
//! Windows .ini files, for example
//! <pre class="fragment">
//! [series]
//! names = AAPL:price, ai:search_trend, CPIAUCSL:macroeconomic
//! returns = AAPL
//!
//! [window]
//! lookback = 2592000
//! interval = 3600
//!
//! [forecast]
//! entities = AAPL
//! regressors = ai
//! </pre>
//! Boost's property_tree package parses such files and accepts either hash
//! or semi-colon as comment characters. Settings which are missing take
//! their default values. Values are converted with CStringUtils because
//! the conversions built into property_tree are too lax.
//!
//! To decouple the public interface from the config file format the
//! property tree is copied into separate member variables.
class API_EXPORT CAnalysisConfig {
public:
    using TStrVec = std::vector<std::string>;
    using TStrKindPr = std::pair<std::string, model::CSeries::EKind>;
    using TStrKindPrVec = std::vector<TStrKindPr>;
    using TStrStrMap = std::map<std::string, std::string>;
    using TOrder = maths::CSarimaxModel::SOrder;

    //! \name Defaults
    //@{
    static const core_t::TTime DEFAULT_LOOKBACK;
    static const core_t::TTime DEFAULT_INTERVAL;
    static const core_t::TTime DEFAULT_MAX_STALENESS;
    static const core_t::TTime DEFAULT_SEARCH_TREND_STALENESS;
    static const core_t::TTime DEFAULT_MACROECONOMIC_STALENESS;
    static const std::size_t DEFAULT_MIN_SAMPLES;
    static const std::size_t DEFAULT_MAX_LAG;
    static const double DEFAULT_ALPHA;
    static const double DEFAULT_STATIONARITY_ALPHA;
    static const std::size_t DEFAULT_ADF_LAGS;
    static const std::size_t DEFAULT_MAX_DIFFERENCES;
    static const std::size_t DEFAULT_MAX_PAIRS;
    static const std::size_t DEFAULT_HORIZON;
    static const std::size_t DEFAULT_SEASONAL_PERIOD;
    static const double DEFAULT_COVERAGE;
    static const std::string DEFAULT_CRITERION;
    static const std::string DEFAULT_ORDER_SELECTION;
    static const std::string DEFAULT_ORDER;
    static const std::string DEFAULT_SEASONAL_ORDER;
    static const std::size_t DEFAULT_MAX_P;
    static const std::size_t DEFAULT_MAX_Q;
    static const std::size_t DEFAULT_MAX_SEASONAL_P;
    static const std::size_t DEFAULT_MAX_SEASONAL_Q;
    static const std::size_t DEFAULT_MAX_ITERATIONS;
    static const std::uint64_t DEFAULT_TIMEOUT_MS;
    static const std::size_t DEFAULT_RETENTION;
    //@}

    //! The order selection policies.
    static const std::string GRID_ORDER_SELECTION;
    static const std::string FIXED_ORDER_SELECTION;

public:
    CAnalysisConfig();

    //! Initialise from a config file. Settings which are not present in
    //! the file are reset to their default values.
    bool init(const std::string& configFile);

    //! Initialise from ini format text.
    bool initFromString(const std::string& config);

    //! \name Series
    //@{
    //! The series with their kinds.
    const TStrKindPrVec& series() const;
    TStrVec seriesNames() const;
    //! The series which get a return column.
    const TStrVec& returnColumns() const;
    //@}

    //! \name Window
    //@{
    core_t::TTime lookback() const;
    core_t::TTime interval() const;
    core_t::TTime maxStaleness() const;
    //@}

    std::size_t minimumSamples() const;
    std::size_t retention() const;

    //! \name Engine Settings
    //@{
    model::CAligner aligner() const;
    model::CCausalityEngine::SParams causalityParams() const;
    model::CForecastEngine::SParams forecastParams() const;
    //! The entities to forecast.
    const TStrVec& entities() const;
    //@}

    //! Get every setting as a string, keyed by "section.name".
    TStrStrMap parameters() const;

    //! Parse "p,d,q" into the non-seasonal or seasonal part of \p order.
    static bool parseOrder(const std::string& value, bool seasonal, TOrder& order);

private:
    bool init(std::istream& strm, const std::string& source);
    bool validate() const;

    //! Helper method for init().
    template<typename FIELDTYPE>
    static bool processSetting(const boost::property_tree::ptree& propTree,
                               const std::string& iniPath,
                               const FIELDTYPE& defaultValue,
                               FIELDTYPE& value) {
        // This returns an empty optional if the path isn't found
        auto valueStr = propTree.get_optional<std::string>(iniPath);
        if (!valueStr) {
            LOG_TRACE(<< "Using default value (" << defaultValue
                      << ") for unspecified setting " << iniPath);
            value = defaultValue;
            return true;
        }
        std::string trimmed{*valueStr};
        core::CStringUtils::trimWhitespace(trimmed);
        if (core::CStringUtils::stringToType(trimmed, value) == false) {
            LOG_ERROR(<< "Invalid value for setting " << iniPath << " : " << *valueStr);
            return false;
        }
        return true;
    }

    //! Read a comma separated list.
    static void processList(const boost::property_tree::ptree& propTree,
                            const std::string& iniPath,
                            TStrVec& value);

private:
    TStrKindPrVec m_Series;
    TStrVec m_ReturnColumns;

    core_t::TTime m_Lookback;
    core_t::TTime m_Interval;
    core_t::TTime m_MaxStaleness;
    core_t::TTime m_SearchTrendStaleness;
    core_t::TTime m_MacroeconomicStaleness;

    std::size_t m_MinimumSamples;

    std::size_t m_MaxLag;
    double m_Alpha;
    double m_StationarityAlpha;
    std::size_t m_AdfLags;
    std::size_t m_MaxDifferences;
    TStrVec m_Targets;
    std::size_t m_MaxPairs;

    TStrVec m_Entities;
    TStrVec m_Regressors;
    std::size_t m_Horizon;
    std::size_t m_SeasonalPeriod;
    double m_Coverage;
    maths_t::EInformationCriterion m_Criterion;
    bool m_SelectOrder;
    TOrder m_Order;
    std::size_t m_MaxP;
    std::size_t m_MaxQ;
    std::size_t m_MaxSeasonalP;
    std::size_t m_MaxSeasonalQ;
    std::size_t m_MaxIterations;
    std::uint64_t m_TimeoutMs;

    std::size_t m_Retention;
};
}
}

#endif // INCLUDED_tsa_api_CAnalysisConfig_h
