/**
 * @file task_executor.h
 * @brief Background task execution for challenge validation and issuance
 */

#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace common {

/**
 * @brief Executes work off the request thread
 */
class ITaskExecutor {
public:
    virtual ~ITaskExecutor() = default;

    /**
     * @brief Queue a task
     * @return false if the executor is full or stopped; the task was not queued
     */
    virtual bool submit(std::function<void()> task) = 0;
};

/**
 * @brief Fixed-size worker pool with a bounded queue
 *
 * Tasks must not throw; an escaping exception is logged and dropped so the
 * worker survives.
 */
class WorkerPool : public ITaskExecutor {
public:
    /**
     * @param threads Number of worker threads (at least 1)
     * @param maxQueued Queue bound; submit() fails beyond it
     */
    WorkerPool(size_t threads, size_t maxQueued);
    ~WorkerPool() override;

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    bool submit(std::function<void()> task) override;

    /// @brief Stop accepting work, finish queued tasks, join workers
    void shutdown();

    size_t queued() const;

private:
    void workerLoop();

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    size_t maxQueued_;
    bool stopping_ = false;
};

} // namespace common
