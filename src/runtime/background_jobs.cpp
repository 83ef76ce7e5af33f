#include "runtime/background_jobs.hpp"

#include <exception>
#include <utility>
#include "core/logging/logger.hpp"

namespace toolgate::runtime {

BackgroundJobs::BackgroundJobs(BackgroundJobsOptions options) : options_(options) {
    if (options_.workers == 0) {
        options_.workers = 1;
    }
    workers_.reserve(options_.workers);
    for (std::size_t i = 0; i < options_.workers; ++i) {
        workers_.emplace_back(&BackgroundJobs::worker_loop, this);
    }
}

BackgroundJobs::~BackgroundJobs() {
    shutdown();
}

bool BackgroundJobs::submit(std::string label, Job job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ || pending_.size() >= options_.max_pending) {
            ++rejected_;
            LOG_WARN("BackgroundJobs: discarding job '" + label + "' (" +
                     (stopping_ ? "shutting down" : "queue full") + ")");
            return false;
        }
        pending_.push_back(PendingJob{std::move(label), std::move(job)});
    }
    work_cv_.notify_one();
    return true;
}

bool BackgroundJobs::wait_idle(const std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout,
                             [this]() { return pending_.empty() && active_ == 0; });
}

void BackgroundJobs::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && workers_.empty()) {
            return;
        }
        stopping_ = true;
        if (!pending_.empty()) {
            LOG_DEBUG("BackgroundJobs: discarding " + std::to_string(pending_.size()) +
                      " queued job(s) at shutdown");
            rejected_ += pending_.size();
            pending_.clear();
        }
    }
    work_cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        workers_.clear();
    }
    idle_cv_.notify_all();
}

std::size_t BackgroundJobs::completed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return completed_;
}

std::size_t BackgroundJobs::failed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failed_;
}

std::size_t BackgroundJobs::rejected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rejected_;
}

void BackgroundJobs::worker_loop() {
    while (true) {
        PendingJob pending;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_cv_.wait(lock, [this]() { return stopping_ || !pending_.empty(); });
            if (pending_.empty()) {
                // stopping_ with nothing left to run
                break;
            }
            pending = std::move(pending_.front());
            pending_.pop_front();
            ++active_;
        }

        try {
            const auto status = pending.job();
            if (core::errors::is_error(status)) {
                finish_job(pending.label, false, core::errors::get_error(status).message);
            } else {
                finish_job(pending.label, true, "");
            }
        } catch (const std::exception& e) {
            finish_job(pending.label, false, e.what());
        } catch (...) {
            finish_job(pending.label, false, "unknown exception");
        }
    }
}

void BackgroundJobs::finish_job(const std::string& label, const bool success,
                                const std::string& reason) {
    if (!success) {
        LOG_DEBUG("BackgroundJobs: job '" + label + "' failed, discarded: " + reason);
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --active_;
        if (success) {
            ++completed_;
        } else {
            ++failed_;
        }
    }
    idle_cv_.notify_all();
}

}  // namespace toolgate::runtime
