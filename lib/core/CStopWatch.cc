/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <core/CStopWatch.h>

#include <core/CLogger.h>

namespace tsa {
namespace core {

CStopWatch::CStopWatch(bool startRunning)
    : m_IsRunning{false}, m_Start{}, m_AccumulatedTime{0} {
    if (startRunning) {
        this->start();
    }
}

void CStopWatch::start() {
    if (m_IsRunning) {
        LOG_ERROR(<< "Stop watch already running");
        return;
    }

    m_IsRunning = true;
    m_Start = TClock::now();
}

std::uint64_t CStopWatch::stop() {
    if (!m_IsRunning) {
        LOG_ERROR(<< "Stop watch not running");
        return m_AccumulatedTime;
    }

    m_AccumulatedTime += this->sinceStart();

    m_IsRunning = false;

    return m_AccumulatedTime;
}

std::uint64_t CStopWatch::lap() const {
    if (!m_IsRunning) {
        return m_AccumulatedTime;
    }

    return m_AccumulatedTime + this->sinceStart();
}

bool CStopWatch::isRunning() const {
    return m_IsRunning;
}

void CStopWatch::reset(bool startRunning) {
    m_AccumulatedTime = 0;
    m_IsRunning = false;

    if (startRunning) {
        this->start();
    }
}

std::uint64_t CStopWatch::sinceStart() const {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        TClock::now() - m_Start);
    return static_cast<std::uint64_t>(elapsed.count());
}
}
}
