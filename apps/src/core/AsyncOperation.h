#pragma once

#include "CancellationToken.h"
#include "TaskExecutor.h"
#include <chrono>
#include <future>
#include <memory>
#include <type_traits>

namespace ArcticLink {

/**
 * @brief Handle to work running on a TaskExecutor.
 *
 * cancel() only signals the token; the work observes it and finishes early,
 * so get() still returns (typically a Cancelled error).
 */
template <typename T>
class AsyncOperation {
public:
    AsyncOperation(std::future<T> future, CancellationToken token)
        : future_(std::move(future)), token_(std::move(token))
    {}

    void cancel() { token_.cancel(); }

    bool isReady() const
    {
        return future_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }

    void wait() const { future_.wait(); }

    T get() { return future_.get(); }

private:
    std::future<T> future_;
    CancellationToken token_;
};

// fn is invoked as fn(const CancellationToken&) on the executor.
template <typename Fn>
auto runAsync(TaskExecutor& executor, CancellationToken token, Fn fn)
    -> AsyncOperation<std::invoke_result_t<Fn&, const CancellationToken&>>
{
    using T = std::invoke_result_t<Fn&, const CancellationToken&>;

    auto task = std::make_shared<std::packaged_task<T()>>(
        [fn = std::move(fn), token]() mutable { return fn(token); });
    auto future = task->get_future();
    executor.post([task] { (*task)(); });
    return AsyncOperation<T>(std::move(future), std::move(token));
}

template <typename Fn>
auto runAsync(TaskExecutor& executor, Fn fn)
{
    return runAsync(executor, CancellationToken{}, std::move(fn));
}

} // namespace ArcticLink
