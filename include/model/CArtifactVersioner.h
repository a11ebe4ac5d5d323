/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_tsa_model_CArtifactVersioner_h
#define INCLUDED_tsa_model_CArtifactVersioner_h

#include <core/CNonCopyable.h>

#include <model/CAnalysisArtifact.h>
#include <model/ImportExport.h>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tsa {
namespace model {
class CAlignedFrame;
class CSeriesStore;

//! \brief Publishes analysis artifacts and keeps a bounded history.
//!
//! DESCRIPTION:\n
//! Runs are identified by a sequence number which increases by one with
//! each published artifact. Publishing writes the artifact to the store
//! before it becomes the latest, so if the write fails the previous
//! artifact remains the latest and the run identifier isn't used.
//!
//! The versioner also decides whether a run is needed: if the fingerprint
//! of the new aligned frame equals that of the latest artifact the inputs
//! haven't changed and nor would the results.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Publication and the latest/history accessors are serialised by a mutex.
//! The history holds shared pointers so readers never see an artifact change
//! or disappear while they hold it.
class MODEL_EXPORT CArtifactVersioner : private core::CNonCopyable {
public:
    using TArtifactCPtr = std::shared_ptr<const CAnalysisArtifact>;
    using TArtifactCPtrVec = std::vector<TArtifactCPtr>;

public:
    CArtifactVersioner(CSeriesStore& store, std::size_t retention);

    //! Seed the latest artifact from the store.
    //!
    //! \throws CStorageError if the store can't be read.
    void initialize();

    //! Compute the fingerprint of \p frame's contents and window.
    static std::string fingerprint(const CAlignedFrame& frame);

    //! Is \p fingerprint the latest artifact's fingerprint?
    bool isUnchanged(const std::string& fingerprint) const;

    //! Assign the next run identifier to \p contents, write the artifact to
    //! the store and make it the latest.
    //!
    //! \throws CStorageError if the store write fails, in which case nothing
    //! changes.
    TArtifactCPtr publish(CAnalysisArtifact::SContents contents);

    //! The latest artifact or null if nothing has been published.
    TArtifactCPtr latest() const;

    //! The retained artifacts, oldest first.
    TArtifactCPtrVec history() const;

    std::size_t retention() const;

private:
    using TArtifactCPtrDeque = std::deque<TArtifactCPtr>;

private:
    void push(TArtifactCPtr artifact);

private:
    CSeriesStore& m_Store;
    std::size_t m_Retention;
    mutable std::mutex m_Mutex;
    TArtifactCPtr m_Latest;
    TArtifactCPtrDeque m_History;
};
}
}

#endif // INCLUDED_tsa_model_CArtifactVersioner_h
