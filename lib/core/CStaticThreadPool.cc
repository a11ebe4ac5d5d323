/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <core/CStaticThreadPool.h>

#include <core/CLogger.h>

#include <algorithm>

namespace tsa {
namespace core {
namespace {
std::size_t computeSize(std::size_t hint) {
    std::size_t bound{std::thread::hardware_concurrency()};
    std::size_t size{bound > 0 ? std::min(hint, bound) : hint};
    return std::max(size, std::size_t{1});
}
}

CStaticThreadPool::CStaticThreadPool(std::size_t size)
    : m_Done{false} {
    size = computeSize(size);
    m_Pool.reserve(size);
    for (std::size_t id = 0; id < size; ++id) {
        try {
            m_Pool.emplace_back([this] { this->worker(); });
        } catch (const std::exception& e) {
            LOG_ERROR(<< "Failed to start worker thread " << id << ": " << e.what());
            this->shutdown();
            throw;
        }
    }
    LOG_DEBUG(<< "Started thread pool with " << size << " threads");
}

CStaticThreadPool::~CStaticThreadPool() {
    this->shutdown();
}

void CStaticThreadPool::schedule(TTask&& task) {
    m_TaskQueue.push(CWrappedTask{std::forward<TTask>(task)});
}

void CStaticThreadPool::shutdown() {

    // Signal to each thread that it is finished. These are queued behind any
    // outstanding work so everything scheduled is executed before exit.
    for (std::size_t id = 0; id < m_Pool.size(); ++id) {
        m_TaskQueue.push(CWrappedTask{TTask{[this] {
            m_Done.store(true);
            return boost::any{};
        }}});
    }

    for (auto& thread : m_Pool) {
        if (thread.joinable()) {
            thread.join();
        }
    }

    m_Pool.clear();
}

void CStaticThreadPool::worker() {
    while (m_Done.load() == false) {
        CWrappedTask task{m_TaskQueue.pop()};
        task();
    }
}

CStaticThreadPool::CWrappedTask::CWrappedTask(TTask&& task)
    : m_Task{std::forward<TTask>(task)} {
}

void CStaticThreadPool::CWrappedTask::operator()() {
    // Any exception thrown by the task is captured in its future.
    if (m_Task.valid()) {
        m_Task();
    }
}
}
}
