#include <gtest/gtest.h>

#include "access_guard/monitor/periodic_worker.hpp"
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace access_guard;
using monitor::PeriodicWorker;

class PeriodicWorkerTest : public ::testing::Test {
protected:
    std::unique_ptr<PeriodicWorker> makeWorker(PeriodicWorker::Iteration iteration, int threshold = 3) {
        return std::make_unique<PeriodicWorker>(
            "test_worker", std::chrono::milliseconds(10), std::move(iteration), threshold,
            [this](const std::string& name, int failures) {
                degraded_names_.push_back(name);
                degraded_failures_.push_back(failures);
            });
    }

    std::vector<std::string> degraded_names_;
    std::vector<int> degraded_failures_;
};

TEST_F(PeriodicWorkerTest, RunOnce_SuccessResetsFailures) {
    bool succeed = false;
    auto worker = makeWorker([&] { return succeed; });

    worker->runOnce();
    worker->runOnce();
    EXPECT_EQ(worker->consecutiveFailures(), 2);

    succeed = true;
    EXPECT_TRUE(worker->runOnce());
    EXPECT_EQ(worker->consecutiveFailures(), 0);
    EXPECT_EQ(worker->iterations(), 3u);
}

TEST_F(PeriodicWorkerTest, RunOnce_DegradedFiresOnceAtThreshold) {
    auto worker = makeWorker([] { return false; });

    for (int i = 0; i < 6; ++i) {
        worker->runOnce();
    }

    ASSERT_EQ(degraded_names_.size(), 1u);
    EXPECT_EQ(degraded_names_[0], "test_worker");
    EXPECT_EQ(degraded_failures_[0], 3);
}

TEST_F(PeriodicWorkerTest, RunOnce_RecoveryRearmsDegraded) {
    bool succeed = false;
    auto worker = makeWorker([&] { return succeed; }, 2);

    worker->runOnce();
    worker->runOnce();
    succeed = true;
    worker->runOnce();
    succeed = false;
    worker->runOnce();
    worker->runOnce();

    EXPECT_EQ(degraded_names_.size(), 2u);
}

TEST_F(PeriodicWorkerTest, RunOnce_ExceptionCountsAsFailure) {
    auto worker = makeWorker([]() -> bool { throw std::runtime_error("boom"); }, 1);

    EXPECT_FALSE(worker->runOnce());
    EXPECT_EQ(worker->consecutiveFailures(), 1);
    EXPECT_EQ(degraded_names_.size(), 1u);
}

TEST_F(PeriodicWorkerTest, StartStop_RunsInBackground) {
    std::atomic<int> calls{0};
    auto worker = makeWorker([&] { ++calls; return true; });

    worker->start();
    EXPECT_TRUE(worker->isRunning());

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (calls.load() < 3 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    worker->stop();
    EXPECT_FALSE(worker->isRunning());
    EXPECT_GE(calls.load(), 3);

    int after_stop = calls.load();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(calls.load(), after_stop);
}

TEST_F(PeriodicWorkerTest, Stop_WithoutStart_IsHarmless) {
    auto worker = makeWorker([] { return true; });
    EXPECT_NO_THROW(worker->stop());
    EXPECT_FALSE(worker->isRunning());
}
