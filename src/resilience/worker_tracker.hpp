#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace toolgate::resilience {

// Counts bounded-call workers that are still running, including the ones a
// caller abandoned on timeout. Shutdown waits on it before static teardown.
class WorkerTracker {
public:
    static WorkerTracker& get();

    WorkerTracker(const WorkerTracker&) = delete;
    WorkerTracker& operator=(const WorkerTracker&) = delete;

    void started();
    void finished();
    std::size_t running() const;

    // False if workers are still running when `timeout` expires.
    bool wait_idle(std::chrono::milliseconds timeout);

private:
    WorkerTracker() = default;

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    std::size_t running_ = 0;
};

}  // namespace toolgate::resilience
