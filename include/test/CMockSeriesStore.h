/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_tsa_test_CMockSeriesStore_h
#define INCLUDED_tsa_test_CMockSeriesStore_h

#include <model/CSeries.h>
#include <model/CSeriesStore.h>

#include <test/ImportExport.h>

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace tsa {
namespace test {

//! \brief
//! Mock object for unit tests
//!
//! DESCRIPTION:\n
//! An in memory series store. Series are added with addSeries and every
//! artifact written is kept. Reads and writes can be made to fail and a
//! callback can be run on each read.
//!
class TEST_EXPORT CMockSeriesStore : public model::CSeriesStore {
public:
    using TTimeDoublePrVec = model::CSeries::TTimeDoublePrVec;
    using TArtifactCPtrVec = std::vector<TArtifactCPtr>;
    using TReadCallback = std::function<void(const std::string&)>;

public:
    CMockSeriesStore() = default;

    //! Add or replace the series \p name.
    void addSeries(const std::string& name,
                   model::CSeries::EKind kind,
                   const TTimeDoublePrVec& values);

    model::CSeries readSeries(const std::string& name,
                              core_t::TTime start,
                              core_t::TTime end) override;
    void writeArtifact(const model::CAnalysisArtifact& artifact) override;
    TArtifactCPtr readLatestArtifact() override;

    //! Make subsequent reads of series throw.
    void failReads(bool fail);
    //! Make subsequent writes of artifacts throw.
    void failWrites(bool fail);
    //! Call \p callback with the series name on each read.
    void onRead(TReadCallback callback);

    //! All the artifacts written, oldest first.
    TArtifactCPtrVec artifacts() const;
    std::size_t numberReads() const;

private:
    using TStrSeriesMap = std::map<std::string, model::CSeries>;

private:
    mutable std::mutex m_Mutex;
    TStrSeriesMap m_Series;
    TArtifactCPtrVec m_Artifacts;
    bool m_FailReads = false;
    bool m_FailWrites = false;
    TReadCallback m_OnRead;
    std::size_t m_NumberReads = 0;
};
}
}

#endif // INCLUDED_tsa_test_CMockSeriesStore_h
