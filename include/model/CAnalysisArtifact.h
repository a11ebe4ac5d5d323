/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_tsa_model_CAnalysisArtifact_h
#define INCLUDED_tsa_model_CAnalysisArtifact_h

#include <core/CoreTypes.h>

#include <model/CCausalityEngine.h>
#include <model/CCorrelationEngine.h>
#include <model/CForecastEngine.h>
#include <model/ImportExport.h>

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace tsa {
namespace model {

//! \brief The published result of one analysis run.
//!
//! DESCRIPTION:\n
//! Wraps the correlation matrix, causality verdicts and forecasts computed
//! from one aligned frame with the run identifier, the run time, the
//! fingerprint of the frame and the parameters used.
//!
//! IMPLEMENTATION DECISIONS:\n
//! An artifact is immutable. The engine outputs are held by shared pointers
//! to const so readers can keep the sections they need after the artifact
//! has been superseded.
class MODEL_EXPORT CAnalysisArtifact {
public:
    using TStrStrMap = std::map<std::string, std::string>;
    using TCorrelationMatrixCPtr = std::shared_ptr<const CCorrelationMatrix>;
    using TVerdictVec = std::vector<SCausalityVerdict>;
    using TVerdictVecCPtr = std::shared_ptr<const TVerdictVec>;
    using TForecastResultVec = std::vector<SForecastResult>;
    using TForecastResultVecCPtr = std::shared_ptr<const TForecastResultVec>;

    //! \brief Everything in an artifact except its identifier.
    struct MODEL_EXPORT SContents {
        core_t::TTime s_RunTime = 0;
        core_t::TTime s_WindowStart = 0;
        core_t::TTime s_WindowEnd = 0;
        core_t::TTime s_Interval = 0;
        std::string s_Fingerprint;
        TStrStrMap s_Parameters;
        TCorrelationMatrixCPtr s_Correlations;
        TVerdictVecCPtr s_Causality;
        TForecastResultVecCPtr s_Forecasts;
    };

public:
    CAnalysisArtifact(std::uint64_t runId, SContents contents);

    std::uint64_t runId() const;
    core_t::TTime runTime() const;
    core_t::TTime windowStart() const;
    core_t::TTime windowEnd() const;
    core_t::TTime interval() const;
    const std::string& fingerprint() const;
    const TStrStrMap& parameters() const;

    const CCorrelationMatrix& correlations() const;
    const TVerdictVec& causality() const;
    const TForecastResultVec& forecasts() const;

    //! Get the shared sections.
    const SContents& contents() const;

private:
    std::uint64_t m_RunId;
    SContents m_Contents;
};
}
}

#endif // INCLUDED_tsa_model_CAnalysisArtifact_h
