/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <model/CAnalysisArtifact.h>

namespace tsa {
namespace model {

CAnalysisArtifact::CAnalysisArtifact(std::uint64_t runId, SContents contents)
    : m_RunId{runId}, m_Contents{std::move(contents)} {
    if (m_Contents.s_Correlations == nullptr) {
        m_Contents.s_Correlations = std::make_shared<const CCorrelationMatrix>();
    }
    if (m_Contents.s_Causality == nullptr) {
        m_Contents.s_Causality = std::make_shared<const TVerdictVec>();
    }
    if (m_Contents.s_Forecasts == nullptr) {
        m_Contents.s_Forecasts = std::make_shared<const TForecastResultVec>();
    }
}

std::uint64_t CAnalysisArtifact::runId() const {
    return m_RunId;
}

core_t::TTime CAnalysisArtifact::runTime() const {
    return m_Contents.s_RunTime;
}

core_t::TTime CAnalysisArtifact::windowStart() const {
    return m_Contents.s_WindowStart;
}

core_t::TTime CAnalysisArtifact::windowEnd() const {
    return m_Contents.s_WindowEnd;
}

core_t::TTime CAnalysisArtifact::interval() const {
    return m_Contents.s_Interval;
}

const std::string& CAnalysisArtifact::fingerprint() const {
    return m_Contents.s_Fingerprint;
}

const CAnalysisArtifact::TStrStrMap& CAnalysisArtifact::parameters() const {
    return m_Contents.s_Parameters;
}

const CCorrelationMatrix& CAnalysisArtifact::correlations() const {
    return *m_Contents.s_Correlations;
}

const CAnalysisArtifact::TVerdictVec& CAnalysisArtifact::causality() const {
    return *m_Contents.s_Causality;
}

const CAnalysisArtifact::TForecastResultVec& CAnalysisArtifact::forecasts() const {
    return *m_Contents.s_Forecasts;
}

const CAnalysisArtifact::SContents& CAnalysisArtifact::contents() const {
    return m_Contents;
}
}
}
