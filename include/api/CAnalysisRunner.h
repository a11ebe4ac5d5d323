/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_tsa_api_CAnalysisRunner_h
#define INCLUDED_tsa_api_CAnalysisRunner_h

#include <core/CNonCopyable.h>
#include <core/CoreTypes.h>

#include <model/CArtifactVersioner.h>

#include <api/CAnalysisConfig.h>
#include <api/ImportExport.h>

#include <atomic>
#include <string>

namespace tsa {
namespace model {
class CSeriesStore;
}
namespace api {

//! \brief Runs one analysis end to end.
//!
//! DESCRIPTION:\n
//! A run reads the configured series for the lookback window ending at
//! the requested time, aligns them, and skips the rest if the aligned
//! frame's fingerprint matches the latest artifact. Otherwise it computes
//! the correlations, causality verdicts and per entity forecasts as
//! independent tasks on the default async executor, waits for all of them
//! and publishes the artifact.
//!
//! A run can be cancelled from another thread. Cancellation is checked
//! before the engines start and again before publication; a cancelled run
//! publishes nothing.
//!
//! IMPLEMENTATION DECISIONS:\n
//! All tasks are launched from the calling thread and none of them waits on
//! another, which is what core::async requires to avoid deadlock. Forecasts
//! are collected in a vector indexed by entity.
class API_EXPORT CAnalysisRunner : private core::CNonCopyable {
public:
    enum EOutcome { E_Published, E_Skipped, E_Cancelled };

public:
    CAnalysisRunner(const CAnalysisConfig& config, model::CSeriesStore& store);

    //! Load the latest artifact from the store.
    //!
    //! \throws model::CStorageError if the store can't be read.
    void initialize();

    //! Run the analysis for the window ending at \p end.
    //!
    //! \param[in] force Publish even if the inputs haven't changed.
    //! \throws model::CInsufficientWindowError if there is no data in the
    //! window and model::CStorageError if the store fails. Nothing is
    //! published in either case.
    EOutcome run(core_t::TTime end, bool force = false);

    //! Cancel the run in progress. Thread safe.
    void cancel();

    //! Has the run in progress been cancelled?
    bool cancelled() const;

    const model::CArtifactVersioner& versioner() const;

    static std::string print(EOutcome outcome);

private:
    CAnalysisConfig m_Config;
    model::CSeriesStore& m_Store;
    model::CArtifactVersioner m_Versioner;
    std::atomic<bool> m_Cancelled;
};
}
}

#endif // INCLUDED_tsa_api_CAnalysisRunner_h
