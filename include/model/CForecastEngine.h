/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_tsa_model_CForecastEngine_h
#define INCLUDED_tsa_model_CForecastEngine_h

#include <core/CoreTypes.h>

#include <maths/CSarimaxModel.h>
#include <maths/MathsTypes.h>

#include <model/ImportExport.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace tsa {
namespace model {
class CAlignedFrame;

//! \brief The forecast for one entity.
struct MODEL_EXPORT SForecastResult {
    enum EStatus { E_Ok = 0, E_ModelFitError };

    using TTimeVec = std::vector<core_t::TTime>;
    using TDoubleVec = maths_t::TDoubleVec;
    using TStrVec = std::vector<std::string>;

    std::string s_Entity;
    EStatus s_Status = E_ModelFitError;
    //! Why the model couldn't be fitted.
    std::string s_Error;

    maths::CSarimaxModel::SOrder s_Order;
    //! The regressors the model used.
    TStrVec s_Regressors;
    maths_t::EInformationCriterion s_Criterion = maths_t::E_AICc;
    double s_CriterionValue = 0.0;
    double s_ResidualRmse = 0.0;

    //! \name Fit Window
    //@{
    core_t::TTime s_FitStart = 0;
    core_t::TTime s_FitEnd = 0;
    std::size_t s_FitObservations = 0;
    //@}

    //! \name Forecast
    //! One entry per step of the horizon.
    //@{
    double s_Coverage = 0.0;
    TTimeVec s_Times;
    TDoubleVec s_Mean;
    TDoubleVec s_Lower;
    TDoubleVec s_Upper;
    //@}

    bool ok() const { return s_Status == E_Ok; }

    //! Create the result for an entity whose model couldn't be fitted.
    static SForecastResult failed(const std::string& entity, const std::string& error);

    static std::string print(EStatus status);
    static bool parse(const std::string& name, EStatus& status);
};

//! \brief Fits a seasonal ARIMA model with regressors to each entity's
//! aligned column and forecasts a fixed horizon.
//!
//! DESCRIPTION:\n
//! The entity column is gap filled before fitting so the fit window starts
//! at its first value and runs to the end of the frame. Regressors are other
//! columns of the frame, filled the same way. Regressor cells before the
//! regressor's first value take that first value. Regressors derived from
//! the entity itself are never used.
//!
//! The order is either fixed or chosen from a grid of small orders by an
//! information criterion. Every candidate is fitted over the same sample, so
//! their likelihoods are comparable. If two candidates are equally good the
//! one with fewer ARMA terms wins.
//!
//! Each entity's fit is bounded by an iteration count and a wall clock
//! budget. Models are refitted from scratch on every call.
class MODEL_EXPORT CForecastEngine {
public:
    using TDoubleVec = maths_t::TDoubleVec;
    using TStrVec = std::vector<std::string>;
    using TOrder = maths::CSarimaxModel::SOrder;
    using TOrderVec = std::vector<TOrder>;

    //! \brief The forecast settings.
    struct MODEL_EXPORT SParams {
        std::size_t s_Horizon = 168;
        std::size_t s_SeasonalPeriod = 24;
        double s_Coverage = 0.95;
        maths_t::EInformationCriterion s_Criterion = maths_t::E_AICc;
        //! If false s_Order is used as is.
        bool s_SelectOrder = true;
        //! The fixed order. The differencing orders are used by the grid.
        TOrder s_Order{1, 1, 1, 0, 0, 0, 24};
        //! \name Grid Bounds
        //@{
        std::size_t s_MaxP = 2;
        std::size_t s_MaxQ = 2;
        std::size_t s_MaxSeasonalP = 1;
        std::size_t s_MaxSeasonalQ = 1;
        //@}
        std::size_t s_MaxIterations = 500;
        //! Zero means no limit.
        std::uint64_t s_TimeoutMs = 60000;
        TStrVec s_Regressors;
    };

public:
    explicit CForecastEngine(const SParams& params);

    //! Forecast \p entity.
    //!
    //! \throws CModelFitError if no model could be fitted.
    SForecastResult forecast(const CAlignedFrame& frame, const std::string& entity) const;

    //! Forecast \p entity recording any fit error in the result.
    SForecastResult forecastOrFail(const CAlignedFrame& frame, const std::string& entity) const;

    //! The orders which are tried, with fewer ARMA terms first.
    TOrderVec candidateOrders() const;

    const SParams& params() const;

private:
    bool isDerivedFrom(const std::string& regressor, const std::string& entity) const;

private:
    SParams m_Params;
};
}
}

#endif // INCLUDED_tsa_model_CForecastEngine_h
