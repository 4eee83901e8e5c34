#pragma once

#include "../common/types.hpp"
#include <atomic>
#include <deque>
#include <mutex>
#include <optional>

namespace access_guard {
namespace activity {

// Bounded FIFO between the recorder and the monitor. When full, the oldest
// entry is discarded and counted.
class ActivityQueue {
public:
    explicit ActivityQueue(size_t capacity);

    void push(const common::Activity& activity);
    std::optional<common::Activity> pop();

    size_t size() const;
    size_t capacity() const { return capacity_; }
    uint64_t dropped() const { return dropped_.load(); }

private:
    size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<common::Activity> items_;
    std::atomic<uint64_t> dropped_{0};
};

}}
