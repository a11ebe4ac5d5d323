/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_tsa_core_CStaticThreadPool_h
#define INCLUDED_tsa_core_CStaticThreadPool_h

#include <core/CConcurrentQueue.h>
#include <core/ImportExport.h>

#include <boost/any.hpp>

#include <atomic>
#include <cstddef>
#include <future>
#include <thread>
#include <vector>

namespace tsa {
namespace core {

//! \brief A minimal fixed size thread pool for implementing CThreadPoolExecutor.
//!
//! IMPLEMENTATION:\n
//! This purposely has very limited interface and is intended to mainly support
//! CThreadPoolExecutor which provides the mechanism by which we expose the thread
//! pool to the rest of the code via calls core::async.
class CORE_EXPORT CStaticThreadPool {
public:
    using TTask = std::packaged_task<boost::any()>;

public:
    explicit CStaticThreadPool(std::size_t size);

    ~CStaticThreadPool();

    CStaticThreadPool(const CStaticThreadPool&) = delete;
    CStaticThreadPool(CStaticThreadPool&&) = delete;
    CStaticThreadPool& operator=(const CStaticThreadPool&) = delete;
    CStaticThreadPool& operator=(CStaticThreadPool&&) = delete;

    //! Schedule a Callable type to be executed by a thread in the pool.
    //!
    //! \note This can block (if the task queue is full). This is intentional
    //! and exerts back pressure on the thread scheduling tasks if the pool
    //! can't keep up.
    void schedule(TTask&& task);

private:
    class CWrappedTask {
    public:
        CWrappedTask() = default;
        explicit CWrappedTask(TTask&& task);

        void operator()();

    private:
        TTask m_Task;
    };
    using TWrappedTaskQueue = CConcurrentQueue<CWrappedTask, 256>;
    using TThreadVec = std::vector<std::thread>;

private:
    void shutdown();
    void worker();

private:
    std::atomic_bool m_Done;
    TWrappedTaskQueue m_TaskQueue;
    TThreadVec m_Pool;
};
}
}

#endif // INCLUDED_tsa_core_CStaticThreadPool_h
