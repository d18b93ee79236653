/**
 * @file job_scheduler.cpp
 * @brief JobScheduler implementation
 */

#include "job_scheduler.h"
#include <spdlog/spdlog.h>
#include <chrono>
#include <stdexcept>

namespace infrastructure {

JobScheduler::~JobScheduler() {
    stop();
}

void JobScheduler::addJob(const std::string& name, int intervalSeconds, JobFn fn) {
    if (running_) {
        throw std::logic_error("JobScheduler: cannot add jobs while running");
    }
    if (intervalSeconds <= 0) {
        throw std::invalid_argument("JobScheduler: interval must be positive for " + name);
    }
    Job job;
    job.name = name;
    job.intervalSeconds = intervalSeconds;
    job.fn = std::move(fn);
    jobs_[name] = std::move(job);
}

void JobScheduler::start(int initialDelaySeconds) {
    if (running_.exchange(true)) {
        return;
    }
    for (auto& entry : jobs_) {
        Job& job = entry.second;
        threads_.emplace_back([this, &job, initialDelaySeconds]() { runLoop(job, initialDelaySeconds); });
    }
    spdlog::info("[JobScheduler] Started {} jobs", jobs_.size());
}

void JobScheduler::runLoop(Job& job, int initialDelaySeconds) {
    spdlog::info("[JobScheduler] {} scheduled every {} seconds", job.name, job.intervalSeconds);

    int waitSeconds = initialDelaySeconds;
    while (running_) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, std::chrono::seconds(waitSeconds),
                [this, &job]() { return !running_ || job.forced; });
            job.forced = false;
        }
        if (!running_) break;

        spdlog::info("[JobScheduler] Running {}", job.name);
        try {
            job.fn();
        } catch (const std::exception& e) {
            spdlog::error("[JobScheduler] {} failed: {}", job.name, e.what());
        }
        waitSeconds = job.intervalSeconds;
    }

    spdlog::info("[JobScheduler] {} stopped", job.name);
}

void JobScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    cv_.notify_all();

    for (auto& t : threads_) {
        if (t.joinable()) {
            t.join();
        }
    }
    threads_.clear();
}

bool JobScheduler::trigger(const std::string& name) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = jobs_.find(name);
        if (it == jobs_.end()) {
            return false;
        }
        it->second.forced = true;
    }
    cv_.notify_all();
    return true;
}

} // namespace infrastructure
