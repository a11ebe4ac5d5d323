/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#ifndef INCLUDED_tsa_core_Concurrency_h
#define INCLUDED_tsa_core_Concurrency_h

#include <core/ImportExport.h>

#include <boost/any.hpp>

#include <algorithm>
#include <functional>
#include <future>
#include <type_traits>
#include <vector>

namespace tsa {
namespace core {

//! \brief The base executor hierarchy.
class CExecutor {
public:
    virtual ~CExecutor() = default;
    virtual void schedule(std::packaged_task<boost::any()>&& f) = 0;
};

//! Setup the global default executor for async.
//!
//! \note This is not thread safe as the intention is that it is invoked once,
//! usually at the beginning of main or in single threaded test code.
//! \note If this is called with threads equal to zero it defaults to calling
//! std::thread::hardware_concurrency to size the thread pool.
CORE_EXPORT
void startDefaultAsyncExecutor(std::size_t threadPoolSize = 0);

//! Shutdown the thread pool and reset the executor to sequential in the same thread.
//!
//! \note This is not thread safe as the intention is that it is invoked in single
//! threaded test code
CORE_EXPORT
void stopDefaultAsyncExecutor();

//! The default async executor.
//!
//! This gets the default parallel executor created by startDefaultAsyncExecutor.
//! If this hasn't been started execution happens serially in the same thread.
CORE_EXPORT
CExecutor& defaultAsyncExecutor();

namespace concurrency_detail {
template<typename F>
boost::any resultToAny(F& f, const std::false_type&) {
    return boost::any{f()};
}
template<typename F>
boost::any resultToAny(F& f, const std::true_type&) {
    f();
    return boost::any{};
}

template<typename R>
class CTypedFutureAnyWrapper {
public:
    CTypedFutureAnyWrapper() = default;
    CTypedFutureAnyWrapper(std::future<boost::any>&& future)
        : m_Future{std::forward<std::future<boost::any>>(future)} {}

    bool valid() const { return m_Future.valid(); }
    void wait() const { m_Future.wait(); }
    R get() { return boost::any_cast<R>(m_Future.get()); }

private:
    std::future<boost::any> m_Future;
};

template<>
class CTypedFutureAnyWrapper<void> {
public:
    CTypedFutureAnyWrapper() = default;
    CTypedFutureAnyWrapper(std::future<boost::any>&& future)
        : m_Future{std::forward<std::future<boost::any>>(future)} {}

    bool valid() const { return m_Future.valid(); }
    void wait() const { m_Future.wait(); }
    void get() { m_Future.get(); }

private:
    std::future<boost::any> m_Future;
};
}

template<typename R>
using future = concurrency_detail::CTypedFutureAnyWrapper<R>;

//! An version of std::async which uses a specified executor.
//!
//! \note f must be copy constructible.
//! \note f must be thread safe.
//! \note If f throws the exception is rethrown by future::get.
//! \warning This behaves differently from std::async which can lead to deadlocks
//! in situations where launching a new thread would not. In particular, tasks
//! must not wait on other tasks enqueued after them, so don't call async from
//! inside a task and then wait on the result.
template<typename FUNCTION, typename... ARGS>
future<std::result_of_t<std::decay_t<FUNCTION>(std::decay_t<ARGS>...)>>
async(CExecutor& executor, FUNCTION&& f, ARGS&&... args) {
    using R = std::result_of_t<std::decay_t<FUNCTION>(std::decay_t<ARGS>...)>;

    // Note g stores copies of the arguments in the pack, which are moved into place
    // if possible, so this is safe to invoke later in the context of a packaged task.
    auto g = std::bind<R>(std::forward<FUNCTION>(f), std::forward<ARGS>(args)...);

    std::packaged_task<boost::any()> task([g_ = std::move(g)]() mutable {
        return concurrency_detail::resultToAny(g_, std::is_same<R, void>{});
    });
    auto result = task.get_future();

    // Schedule the task to compute the result.
    executor.schedule(std::move(task));

    return std::move(result);
}

//! Wait for all \p futures to be available.
template<typename T>
void wait_for_all(const std::vector<future<T>>& futures) {
    std::for_each(futures.begin(), futures.end(),
                  [](const future<T>& future) { future.wait(); });
}
}
}

#endif // INCLUDED_tsa_core_Concurrency_h
