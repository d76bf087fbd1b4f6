#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

namespace ArcticLink {

class TaskExecutor {
public:
    using Task = std::function<void()>;

    virtual ~TaskExecutor() = default;
    virtual void post(Task task) = 0;
};

/**
 * @brief Runs posted tasks in order on one background worker thread.
 *
 * The destructor runs whatever is still queued, then joins the worker.
 */
class ThreadTaskExecutor : public TaskExecutor {
public:
    ThreadTaskExecutor();
    ~ThreadTaskExecutor() override;

    ThreadTaskExecutor(const ThreadTaskExecutor&) = delete;
    ThreadTaskExecutor& operator=(const ThreadTaskExecutor&) = delete;

    void post(Task task) override;

private:
    void workerLoop();

    std::mutex mutex_;
    std::condition_variable wake_;
    std::deque<Task> tasks_;
    bool stopping_ = false;
    std::thread worker_;
};

// Runs each task on the calling thread before post() returns.
class InlineTaskExecutor : public TaskExecutor {
public:
    void post(Task task) override { task(); }
};

} // namespace ArcticLink
