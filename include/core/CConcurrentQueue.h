/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_tsa_core_CConcurrentQueue_h
#define INCLUDED_tsa_core_CConcurrentQueue_h

#include <core/CNonCopyable.h>

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

namespace tsa {
namespace core {

//! \brief A thread safe multi-producer multi-consumer bounded queue.
//!
//! DESCRIPTION:\n
//! This blocks when pushing to a full queue and popping from an empty queue.
//! Blocking on push exerts back pressure on the thread scheduling work when
//! the consumers can't keep up.
//!
//! It's the caller's responsibility to ensure that number of items pushed is
//! equal to number of items popped or this will deadlock.
//!
//! \tparam T the type of the objects of the queue. Only needs to be movable.
//! \tparam CAPACITY the queue capacity.
template<typename T, std::size_t CAPACITY>
class CConcurrentQueue final : private CNonCopyable {
public:
    static_assert(CAPACITY > 0, "Queue capacity must be positive");

public:
    CConcurrentQueue() = default;

    //! Get the fraction of the capacity in use.
    double load() const {
        std::unique_lock<std::mutex> lock{m_Mutex};
        return static_cast<double>(m_Queue.size()) / static_cast<double>(CAPACITY);
    }

    void push(T value) {
        std::unique_lock<std::mutex> lock{m_Mutex};
        m_ProducerCondition.wait(lock, [this] { return m_Queue.size() < CAPACITY; });
        m_Queue.push_back(std::move(value));
        lock.unlock();
        m_ConsumerCondition.notify_one();
    }

    T pop() {
        std::unique_lock<std::mutex> lock{m_Mutex};
        m_ConsumerCondition.wait(lock, [this] { return m_Queue.empty() == false; });
        T result{std::move(m_Queue.front())};
        m_Queue.pop_front();
        lock.unlock();
        m_ProducerCondition.notify_one();
        return result;
    }

    std::size_t size() const {
        std::unique_lock<std::mutex> lock{m_Mutex};
        return m_Queue.size();
    }

private:
    mutable std::mutex m_Mutex;
    std::condition_variable m_ConsumerCondition;
    std::condition_variable m_ProducerCondition;
    std::deque<T> m_Queue;
};
}
}

#endif // INCLUDED_tsa_core_CConcurrentQueue_h
