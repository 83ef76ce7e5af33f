#include "resilience/worker_tracker.hpp"

namespace toolgate::resilience {

WorkerTracker& WorkerTracker::get() {
    static WorkerTracker instance;
    return instance;
}

void WorkerTracker::started() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++running_;
}

void WorkerTracker::finished() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_ > 0) {
        --running_;
    }
    if (running_ == 0) {
        idle_cv_.notify_all();
    }
}

std::size_t WorkerTracker::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

bool WorkerTracker::wait_idle(const std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this]() { return running_ == 0; });
}

}  // namespace toolgate::resilience
