/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_tsa_api_CArtifactJsonWriter_h
#define INCLUDED_tsa_api_CArtifactJsonWriter_h

#include <core/CNonCopyable.h>

#include <model/CAnalysisArtifact.h>

#include <api/ImportExport.h>

#include <rapidjson/ostreamwrapper.h>
#include <rapidjson/prettywriter.h>

#include <iosfwd>
#include <string>

namespace tsa {
namespace api {

//! \brief Writes analysis artifacts as JSON.
//!
//! DESCRIPTION:\n
//! Each write call writes one complete JSON document to the stream. The
//! correlation, causality and forecast sections can be written on their
//! own for consumers which only need one of them; they have the same
//! format as the corresponding members of a whole artifact.
//!
//! Values which aren't available, for example the coefficient of a pair
//! with insufficient data, are written as null.
class API_EXPORT CArtifactJsonWriter : private core::CNonCopyable {
public:
    using TVerdictVec = model::CAnalysisArtifact::TVerdictVec;
    using TForecastResultVec = model::CAnalysisArtifact::TForecastResultVec;

public:
    explicit CArtifactJsonWriter(std::ostream& strm);

    void write(const model::CAnalysisArtifact& artifact);
    void writeCorrelation(const model::CCorrelationMatrix& correlations);
    void writeCausality(const TVerdictVec& verdicts);
    void writeForecasts(const TForecastResultVec& forecasts);

    //! Get \p artifact as a JSON string.
    static std::string toString(const model::CAnalysisArtifact& artifact);

private:
    using TWriter = rapidjson::PrettyWriter<rapidjson::OStreamWrapper>;

private:
    void start();
    void finish();
    void writeCorrelationObject(const model::CCorrelationMatrix& correlations);
    void writeVerdict(const model::SCausalityVerdict& verdict);
    void writeForecast(const model::SForecastResult& forecast);
    void writeKey(const std::string& key);
    void writeString(const std::string& value);
    void writeDouble(double value);

private:
    rapidjson::OStreamWrapper m_WriteStream;
    TWriter m_Writer;
};
}
}

#endif // INCLUDED_tsa_api_CArtifactJsonWriter_h
