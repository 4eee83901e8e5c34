#include "access_guard/monitor/periodic_worker.hpp"
#include "access_guard/common/logger.hpp"

namespace access_guard {
namespace monitor {

PeriodicWorker::PeriodicWorker(std::string name,
                               std::chrono::milliseconds interval,
                               Iteration iteration,
                               int degraded_threshold,
                               DegradedCallback on_degraded)
    : name_(std::move(name)),
      interval_(interval),
      iteration_(std::move(iteration)),
      degraded_threshold_(degraded_threshold),
      on_degraded_(std::move(on_degraded)) {}

PeriodicWorker::~PeriodicWorker() {
    stop();
}

void PeriodicWorker::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
    }

    thread_ = std::thread(&PeriodicWorker::threadMain, this);
    common::Logger::instance().debug("[Worker] Started | name={} | interval_ms={}", name_, interval_.count());
}

void PeriodicWorker::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }

    bool expected = true;
    if (running_.compare_exchange_strong(expected, false)) {
        common::Logger::instance().debug("[Worker] Stopped | name={} | iterations={}", name_, iterations_.load());
    }
}

bool PeriodicWorker::runOnce() {
    bool ok = false;
    try {
        ok = iteration_();
    } catch (const std::exception& e) {
        common::Logger::instance().error("[Worker] Iteration threw | name={} | error={}", name_, e.what());
        ok = false;
    }
    ++iterations_;

    if (ok) {
        consecutive_failures_ = 0;
        return true;
    }

    int failures = ++consecutive_failures_;
    common::Logger::instance().warn("[Worker] Iteration failed | name={} | consecutive={}", name_, failures);

    if (failures == degraded_threshold_ && on_degraded_) {
        try {
            on_degraded_(name_, failures);
        } catch (const std::exception& e) {
            common::Logger::instance().error("[Worker] Degraded handler failed | name={} | error={}", name_, e.what());
        }
    }
    return false;
}

void PeriodicWorker::threadMain() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (!stop_requested_) {
        if (cv_.wait_for(lock, interval_, [this] { return stop_requested_; })) {
            break;
        }

        lock.unlock();
        runOnce();
        lock.lock();
    }
}

}}
