/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <model/CArtifactVersioner.h>

#include <core/CHashing.h>
#include <core/CLogger.h>

#include <model/CAlignedFrame.h>
#include <model/CSeriesStore.h>

#include <algorithm>

namespace tsa {
namespace model {
namespace {
const std::uint64_t FINGERPRINT_SEED{0x5d1c2e3f47a9b6e1};
const std::int64_t MISSING{0};
const std::int64_t PRESENT{1};
}

CArtifactVersioner::CArtifactVersioner(CSeriesStore& store, std::size_t retention)
    : m_Store{store}, m_Retention{std::max(retention, std::size_t{1})} {
}

void CArtifactVersioner::initialize() {
    TArtifactCPtr latest{m_Store.readLatestArtifact()};

    std::lock_guard<std::mutex> lock{m_Mutex};
    m_Latest = nullptr;
    m_History.clear();
    if (latest != nullptr) {
        LOG_INFO(<< "Latest artifact is run " << latest->runId());
        this->push(std::move(latest));
    }
}

std::string CArtifactVersioner::fingerprint(const CAlignedFrame& frame) {
    core::CMurmurHash64Builder hash{FINGERPRINT_SEED};
    hash.add(static_cast<std::int64_t>(frame.start()))
        .add(static_cast<std::int64_t>(frame.end()))
        .add(static_cast<std::int64_t>(frame.interval()))
        .add(static_cast<std::int64_t>(frame.numberColumns()));
    for (std::size_t i = 0; i < frame.numberColumns(); ++i) {
        hash.add(frame.names()[i]);
        for (const auto& value : frame.column(i)) {
            if (value == std::nullopt) {
                hash.add(MISSING);
            } else {
                hash.add(PRESENT).add(*value);
            }
        }
    }
    return core::CHashing::toHex(hash.value());
}

bool CArtifactVersioner::isUnchanged(const std::string& fingerprint) const {
    std::lock_guard<std::mutex> lock{m_Mutex};
    return m_Latest != nullptr && m_Latest->fingerprint() == fingerprint;
}

CArtifactVersioner::TArtifactCPtr CArtifactVersioner::publish(CAnalysisArtifact::SContents contents) {
    std::lock_guard<std::mutex> lock{m_Mutex};

    std::uint64_t runId{m_Latest == nullptr ? 1 : m_Latest->runId() + 1};
    auto artifact = std::make_shared<const CAnalysisArtifact>(runId, std::move(contents));

    // This throws on failure before we've changed any state.
    m_Store.writeArtifact(*artifact);

    this->push(artifact);
    LOG_INFO(<< "Published run " << runId << " with fingerprint " << artifact->fingerprint());

    return artifact;
}

CArtifactVersioner::TArtifactCPtr CArtifactVersioner::latest() const {
    std::lock_guard<std::mutex> lock{m_Mutex};
    return m_Latest;
}

CArtifactVersioner::TArtifactCPtrVec CArtifactVersioner::history() const {
    std::lock_guard<std::mutex> lock{m_Mutex};
    return TArtifactCPtrVec(m_History.begin(), m_History.end());
}

std::size_t CArtifactVersioner::retention() const {
    return m_Retention;
}

void CArtifactVersioner::push(TArtifactCPtr artifact) {
    m_Latest = artifact;
    m_History.push_back(std::move(artifact));
    while (m_History.size() > m_Retention) {
        LOG_DEBUG(<< "Evicting run " << m_History.front()->runId() << " from history");
        m_History.pop_front();
    }
}
}
}
