#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace access_guard {
namespace monitor {

// Runs one iteration per interval on its own thread until stopped.
// An iteration fails when it returns false or throws; after
// degraded_threshold consecutive failures the degraded callback fires
// once, and any success re-arms it.
class PeriodicWorker {
public:
    using Iteration = std::function<bool()>;
    using DegradedCallback = std::function<void(const std::string& name, int consecutive_failures)>;

    PeriodicWorker(std::string name,
                   std::chrono::milliseconds interval,
                   Iteration iteration,
                   int degraded_threshold,
                   DegradedCallback on_degraded);
    ~PeriodicWorker();

    PeriodicWorker(const PeriodicWorker&) = delete;
    PeriodicWorker& operator=(const PeriodicWorker&) = delete;

    void start();
    void stop();

    // Runs a single iteration on the calling thread with the same
    // failure accounting as the background loop.
    bool runOnce();

    bool isRunning() const { return running_.load(); }
    int consecutiveFailures() const { return consecutive_failures_.load(); }
    uint64_t iterations() const { return iterations_.load(); }
    const std::string& name() const { return name_; }

private:
    std::string name_;
    std::chrono::milliseconds interval_;
    Iteration iteration_;
    int degraded_threshold_;
    DegradedCallback on_degraded_;

    std::atomic<bool> running_{false};
    std::atomic<int> consecutive_failures_{0};
    std::atomic<uint64_t> iterations_{0};

    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_ = false;
    std::thread thread_;

    void threadMain();
};

}}
