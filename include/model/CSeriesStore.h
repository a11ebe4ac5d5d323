/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_tsa_model_CSeriesStore_h
#define INCLUDED_tsa_model_CSeriesStore_h

#include <core/CoreTypes.h>

#include <model/ImportExport.h>

#include <memory>
#include <string>

namespace tsa {
namespace model {
class CAnalysisArtifact;
class CSeries;

//! \brief Interface to the storage of input series and published artifacts.
//!
//! DESCRIPTION:\n
//! This is the only way the analysis reads or writes persistent data.
//! Implementations report I/O failures by throwing CStorageError.
//!
//! Implementations must allow readSeries to be called concurrently with
//! itself. Writes are serialised by the caller.
class MODEL_EXPORT CSeriesStore {
public:
    using TArtifactCPtr = std::shared_ptr<const CAnalysisArtifact>;

public:
    virtual ~CSeriesStore() = default;

    //! Read the observations of \p name in [\p start, \p end]. A series
    //! which doesn't exist has no observations.
    virtual CSeries readSeries(const std::string& name, core_t::TTime start, core_t::TTime end) = 0;

    //! Persist \p artifact. Either all of it is written or none of it is.
    virtual void writeArtifact(const CAnalysisArtifact& artifact) = 0;

    //! Read the most recently written artifact. Null if there is none.
    virtual TArtifactCPtr readLatestArtifact() = 0;
};
}
}

#endif // INCLUDED_tsa_model_CSeriesStore_h
