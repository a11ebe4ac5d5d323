/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <test/CMockSeriesStore.h>

#include <model/CAnalysisArtifact.h>
#include <model/CAnalysisErrors.h>

#include <memory>

namespace tsa {
namespace test {

void CMockSeriesStore::addSeries(const std::string& name,
                                 model::CSeries::EKind kind,
                                 const TTimeDoublePrVec& values) {
    std::lock_guard<std::mutex> lock{m_Mutex};
    m_Series.erase(name);
    m_Series.emplace(name, model::CSeries{name, kind, values});
}

model::CSeries CMockSeriesStore::readSeries(const std::string& name,
                                            core_t::TTime start,
                                            core_t::TTime end) {
    TReadCallback callback;
    {
        std::lock_guard<std::mutex> lock{m_Mutex};
        ++m_NumberReads;
        callback = m_OnRead;
    }
    if (callback) {
        callback(name);
    }

    std::lock_guard<std::mutex> lock{m_Mutex};
    if (m_FailReads) {
        throw model::CStorageError{"failed to read " + name};
    }
    auto i = m_Series.find(name);
    if (i == m_Series.end()) {
        return model::CSeries{name, {}};
    }
    const model::CSeries& series{i->second};
    return model::CSeries{name, series.kind(),
                          TTimeDoublePrVec(series.beginWindow(start), series.endWindow(end))};
}

void CMockSeriesStore::writeArtifact(const model::CAnalysisArtifact& artifact) {
    std::lock_guard<std::mutex> lock{m_Mutex};
    if (m_FailWrites) {
        throw model::CStorageError{"failed to write artifact"};
    }
    m_Artifacts.push_back(std::make_shared<const model::CAnalysisArtifact>(artifact));
}

CMockSeriesStore::TArtifactCPtr CMockSeriesStore::readLatestArtifact() {
    std::lock_guard<std::mutex> lock{m_Mutex};
    if (m_FailReads) {
        throw model::CStorageError{"failed to read latest artifact"};
    }
    return m_Artifacts.empty() ? nullptr : m_Artifacts.back();
}

void CMockSeriesStore::failReads(bool fail) {
    std::lock_guard<std::mutex> lock{m_Mutex};
    m_FailReads = fail;
}

void CMockSeriesStore::failWrites(bool fail) {
    std::lock_guard<std::mutex> lock{m_Mutex};
    m_FailWrites = fail;
}

void CMockSeriesStore::onRead(TReadCallback callback) {
    std::lock_guard<std::mutex> lock{m_Mutex};
    m_OnRead = std::move(callback);
}

CMockSeriesStore::TArtifactCPtrVec CMockSeriesStore::artifacts() const {
    std::lock_guard<std::mutex> lock{m_Mutex};
    return m_Artifacts;
}

std::size_t CMockSeriesStore::numberReads() const {
    std::lock_guard<std::mutex> lock{m_Mutex};
    return m_NumberReads;
}
}
}
