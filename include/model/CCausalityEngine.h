/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_tsa_model_CCausalityEngine_h
#define INCLUDED_tsa_model_CCausalityEngine_h

#include <maths/MathsTypes.h>

#include <model/ImportExport.h>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace tsa {
namespace model {
class CAlignedFrame;

//! \brief The outcome of testing whether one series Granger causes another.
struct MODEL_EXPORT SCausalityVerdict {
    enum EStatus { E_Tested = 0, E_InsufficientData, E_NotTestable };
    //! The differencing applied to both series before testing.
    enum EAdjustment { E_None = 0, E_Differenced, E_DifferencedTwice };

    std::string s_Cause;
    std::string s_Effect;
    EStatus s_Status = E_InsufficientData;
    EAdjustment s_Adjustment = E_None;
    //! The number of lags tested, i.e. 1 to s_MaxLag.
    std::size_t s_MaxLag = 0;
    //! The lag with the smallest p-value.
    std::size_t s_Lag = 0;
    double s_Statistic = 0.0;
    //! The smallest p-value over the lags tested times the number of lags
    //! tested, capped at one.
    double s_PValue = 1.0;
    //! True if s_PValue is less than the significance level.
    bool s_Significant = false;
    //! The number of rows in the regression at s_Lag.
    std::size_t s_Observations = 0;
    //! The unadjusted p-value at each lag 1 to s_MaxLag; empty where the
    //! lag couldn't be tested.
    maths_t::TOptionalDoubleVec s_LagPValues;

    static std::string print(EStatus status);
    static bool parse(const std::string& name, EStatus& status);
    static std::string print(EAdjustment adjustment);
    static bool parse(const std::string& name, EAdjustment& adjustment);
};

//! \brief Runs Granger causality tests between ordered pairs of columns.
//!
//! DESCRIPTION:\n
//! The F test assumes stationary series. Each column is first checked with
//! the augmented Dickey-Fuller test and differenced until it is stationary,
//! up to the maximum number of differences. Columns which never become
//! stationary make every pair they are in not testable, as do columns whose
//! unit root regression fits exactly, such as a constant or a linear trend.
//! Columns with too few values make every pair they are in insufficient data.
//!
//! Both columns of a pair are differenced the same number of times, the
//! larger of their two orders, so that their rows stay aligned.
//!
//! For every lag 1 to L the engine compares the autoregression of the effect
//! on its own past with one which adds the past of the cause. The verdict
//! reports the lag with the smallest p-value. Picking the best of k lags
//! makes a small p-value k times as likely under the null, so the reported
//! p-value is Bonferroni adjusted. (A, B) and (B, A) are separate pairs and
//! are tested independently.
class MODEL_EXPORT CCausalityEngine {
public:
    using TStrVec = std::vector<std::string>;
    using TOptionalDoubleVec = maths_t::TOptionalDoubleVec;
    using TVerdictVec = std::vector<SCausalityVerdict>;
    using TOptionalSize = std::optional<std::size_t>;

    //! The maximum number of differences which can be requested.
    static const std::size_t MAXIMUM_DIFFERENCES;
    //! The default number of lags tested.
    static constexpr std::size_t DEFAULT_MAX_LAG{5};

    //! \brief The test settings.
    struct MODEL_EXPORT SParams {
        std::size_t s_MaxLag = DEFAULT_MAX_LAG;
        double s_Alpha = 0.05;
        double s_StationarityAlpha = 0.05;
        std::size_t s_AdfLags = 1;
        std::size_t s_MaxDifferences = 2;
        //! Pairs need this many complete rows.
        std::size_t s_MinimumSamples = 30;
        //! If not empty only pairs whose effect is in this set are tested.
        TStrVec s_Targets;
        //! If positive at most this many pairs are tested.
        std::size_t s_MaxPairs = 0;
    };

    //! \brief The stationarity check for one column.
    struct MODEL_EXPORT SStationarity {
        enum EStatus {
            E_Stationary = 0,
            E_InsufficientData,
            E_NonStationary,
            E_Degenerate
        };

        EStatus s_Status = E_InsufficientData;
        //! The number of differences needed.
        std::size_t s_Order = 0;
        //! The ADF p-value of the last test run.
        double s_PValue = 1.0;
    };

public:
    explicit CCausalityEngine(const SParams& params);

    //! Test every ordered pair of distinct columns of \p frame, subject to
    //! the target set and pair cap.
    TVerdictVec compute(const CAlignedFrame& frame) const;

    //! Check how many differences \p column needs to be stationary.
    SStationarity stationarity(const TOptionalDoubleVec& column) const;

    //! Test whether \p cause Granger causes \p effect after differencing
    //! both \p order times.
    SCausalityVerdict test(const std::string& causeName,
                           const TOptionalDoubleVec& cause,
                           const std::string& effectName,
                           const TOptionalDoubleVec& effect,
                           std::size_t order) const;

    const SParams& params() const;

private:
    bool isTarget(const std::string& name) const;

private:
    SParams m_Params;
};
}
}

#endif // INCLUDED_tsa_model_CCausalityEngine_h
