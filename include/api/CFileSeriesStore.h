/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_tsa_api_CFileSeriesStore_h
#define INCLUDED_tsa_api_CFileSeriesStore_h

#include <model/CSeries.h>
#include <model/CSeriesStore.h>

#include <api/ImportExport.h>

#include <cstdint>
#include <iosfwd>
#include <map>
#include <string>

namespace tsa {
namespace api {

//! \brief A series store backed by files.
//!
//! DESCRIPTION:\n
//! Series are read from "<data directory>/<name>.csv". Each line is
//! "time,value" where the time is seconds since the epoch or an ISO 8601
//! UTC date-time. A header line and lines starting with '#' are skipped.
//!
//! The files are written by independent ingestion jobs so they aren't
//! trusted to satisfy the CSeries contract: rows are sorted, the last of
//! several values for one time is kept and unparsable rows are skipped.
//! Each of these is logged.
//!
//! Artifacts are written as JSON to "<artifact directory>/artifact_<run>.json"
//! and the "latest" file in the same directory holds the latest run. Both
//! files are written to a temporary file which is then renamed, so readers
//! never see a partially written artifact.
class API_EXPORT CFileSeriesStore : public model::CSeriesStore {
public:
    using TStrKindMap = std::map<std::string, model::CSeries::EKind>;
    using TTimeDoublePrVec = model::CSeries::TTimeDoublePrVec;

    static const std::string SERIES_FILE_EXTENSION;
    static const std::string ARTIFACT_FILE_PREFIX;
    static const std::string ARTIFACT_FILE_EXTENSION;
    static const std::string LATEST_FILE_NAME;

public:
    CFileSeriesStore(std::string dataDirectory,
                     std::string artifactDirectory,
                     TStrKindMap kinds = TStrKindMap{});

    model::CSeries readSeries(const std::string& name,
                              core_t::TTime start,
                              core_t::TTime end) override;
    void writeArtifact(const model::CAnalysisArtifact& artifact) override;
    TArtifactCPtr readLatestArtifact() override;

    //! Get the file name of run \p runId's artifact.
    std::string artifactFileName(std::uint64_t runId) const;

    //! Read the rows of \p strm in [\p start, \p end].
    //!
    //! \return The number of rows which were skipped or replaced.
    static std::size_t parseSeries(std::istream& strm,
                                   const std::string& name,
                                   core_t::TTime start,
                                   core_t::TTime end,
                                   TTimeDoublePrVec& values);

private:
    //! Write \p contents to \p fileName via a temporary file.
    void writeAtomically(const std::string& fileName, const std::string& contents) const;

private:
    std::string m_DataDirectory;
    std::string m_ArtifactDirectory;
    TStrKindMap m_Kinds;
};
}
}

#endif // INCLUDED_tsa_api_CFileSeriesStore_h
