#pragma once

/**
 * @file job_scheduler.h
 * @brief In-process interval scheduler for the housekeeping jobs
 *
 * Optional (JOB_SCHEDULER_ENABLED). Deployments with an external scheduler
 * call POST /jobs/{name} instead.
 */

#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace infrastructure {

/**
 * @brief Runs named jobs at fixed intervals, each on its own thread
 *
 * Every job runs once shortly after start(), then every interval.
 * trigger() wakes a job early. A job that throws is logged and scheduled
 * again at its next interval.
 */
class JobScheduler {
public:
    using JobFn = std::function<void()>;

    JobScheduler() = default;
    ~JobScheduler();

    JobScheduler(const JobScheduler&) = delete;
    JobScheduler& operator=(const JobScheduler&) = delete;

    /**
     * @brief Register a job; must be called before start()
     * @param intervalSeconds Time between runs
     */
    void addJob(const std::string& name, int intervalSeconds, JobFn fn);

    /**
     * @param initialDelaySeconds Wait before the first run of every job
     */
    void start(int initialDelaySeconds = 10);

    /** @brief Stop the scheduler and join threads */
    void stop();

    /**
     * @brief Run a job at the next opportunity
     * @return false if no job has that name
     */
    bool trigger(const std::string& name);

    bool isRunning() const { return running_; }

private:
    struct Job {
        std::string name;
        int intervalSeconds = 0;
        JobFn fn;
        bool forced = false;
    };

    void runLoop(Job& job, int initialDelaySeconds);

    std::atomic<bool> running_{false};
    std::map<std::string, Job> jobs_;
    std::vector<std::thread> threads_;
    std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace infrastructure
