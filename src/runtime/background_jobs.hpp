#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "core/errors/gateway_errors.hpp"

namespace toolgate::runtime {

struct BackgroundJobsOptions {
    std::size_t workers = 2;
    std::size_t max_pending = 64;
};

// Bounded pool for fire-and-forget side effects. Policy: a job that fails
// (error result or exception) is logged at debug level and discarded; a job
// that does not fit in the queue, or arrives after shutdown, is rejected and
// discarded. Nothing here ever reaches the protocol stream.
class BackgroundJobs {
public:
    using Job = std::function<core::errors::Status()>;

    explicit BackgroundJobs(BackgroundJobsOptions options = {});
    ~BackgroundJobs();

    BackgroundJobs(const BackgroundJobs&) = delete;
    BackgroundJobs& operator=(const BackgroundJobs&) = delete;

    bool submit(std::string label, Job job);

    // Waits until no job is queued or running. False on timeout.
    bool wait_idle(std::chrono::milliseconds timeout);

    // Discards queued jobs, lets running ones finish, joins the workers.
    void shutdown();

    std::size_t completed() const;
    std::size_t failed() const;
    std::size_t rejected() const;

private:
    struct PendingJob {
        std::string label;
        Job job;
    };

    void worker_loop();
    void finish_job(const std::string& label, bool success, const std::string& reason);

    BackgroundJobsOptions options_;
    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;
    std::deque<PendingJob> pending_;
    std::vector<std::thread> workers_;
    std::size_t active_ = 0;
    std::size_t completed_ = 0;
    std::size_t failed_ = 0;
    std::size_t rejected_ = 0;
    bool stopping_ = false;
};

}  // namespace toolgate::runtime
