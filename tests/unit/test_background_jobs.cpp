#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <gtest/gtest.h>
#include "runtime/background_jobs.hpp"

namespace {

using namespace std::chrono_literals;
using toolgate::core::errors::ErrorCategory;
using toolgate::core::errors::GatewayError;
using toolgate::core::errors::Status;
using toolgate::core::errors::ok_status;
using toolgate::runtime::BackgroundJobs;
using toolgate::runtime::BackgroundJobsOptions;

// Holds workers inside a job until released.
class Gate {
public:
    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = true;
        }
        cv_.notify_all();
    }

    void wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]() { return open_; });
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool open_ = false;
};

TEST(BackgroundJobsTest, RunsSubmittedJobs) {
    BackgroundJobs jobs;
    std::atomic<int> runs{0};
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(jobs.submit("count", [&runs]() -> Status {
            ++runs;
            return ok_status();
        }));
    }
    ASSERT_TRUE(jobs.wait_idle(2s));
    EXPECT_EQ(runs.load(), 5);
    EXPECT_EQ(jobs.completed(), 5u);
    EXPECT_EQ(jobs.failed(), 0u);
}

TEST(BackgroundJobsTest, FailedAndThrowingJobsAreCountedAndDiscarded) {
    BackgroundJobs jobs;
    ASSERT_TRUE(jobs.submit("error", []() -> Status {
        return GatewayError{ErrorCategory::Collaborator, "store offline", "memory_unavailable"};
    }));
    ASSERT_TRUE(jobs.submit("throw", []() -> Status { throw std::runtime_error("boom"); }));
    ASSERT_TRUE(jobs.submit("throw int", []() -> Status { throw 3; }));
    ASSERT_TRUE(jobs.submit("ok", []() -> Status { return ok_status(); }));

    ASSERT_TRUE(jobs.wait_idle(2s));
    EXPECT_EQ(jobs.failed(), 3u);
    EXPECT_EQ(jobs.completed(), 1u);
}

TEST(BackgroundJobsTest, RejectsJobsWhenQueueIsFull) {
    BackgroundJobsOptions options;
    options.workers = 1;
    options.max_pending = 1;
    BackgroundJobs jobs(options);

    Gate gate;
    std::atomic<bool> started{false};
    ASSERT_TRUE(jobs.submit("blocker", [&gate, &started]() -> Status {
        started = true;
        gate.wait();
        return ok_status();
    }));
    while (!started.load()) {
        std::this_thread::sleep_for(1ms);
    }

    EXPECT_TRUE(jobs.submit("queued", []() -> Status { return ok_status(); }));
    EXPECT_FALSE(jobs.submit("overflow", []() -> Status { return ok_status(); }));
    EXPECT_EQ(jobs.rejected(), 1u);

    gate.release();
    ASSERT_TRUE(jobs.wait_idle(2s));
    EXPECT_EQ(jobs.completed(), 2u);
}

TEST(BackgroundJobsTest, ShutdownDiscardsQueuedJobsAndRejectsNewOnes) {
    BackgroundJobsOptions options;
    options.workers = 1;
    BackgroundJobs jobs(options);

    Gate gate;
    std::atomic<bool> started{false};
    std::atomic<int> late_runs{0};
    ASSERT_TRUE(jobs.submit("blocker", [&gate, &started]() -> Status {
        started = true;
        gate.wait();
        return ok_status();
    }));
    while (!started.load()) {
        std::this_thread::sleep_for(1ms);
    }
    ASSERT_TRUE(jobs.submit("queued", [&late_runs]() -> Status {
        ++late_runs;
        return ok_status();
    }));

    std::thread releaser([&gate]() {
        std::this_thread::sleep_for(50ms);
        gate.release();
    });
    jobs.shutdown();
    releaser.join();

    EXPECT_EQ(late_runs.load(), 0);
    EXPECT_EQ(jobs.completed(), 1u);
    EXPECT_EQ(jobs.rejected(), 1u);
    EXPECT_FALSE(jobs.submit("after", []() -> Status { return ok_status(); }));
    EXPECT_EQ(jobs.rejected(), 2u);
}

}  // namespace
