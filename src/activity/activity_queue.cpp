#include "access_guard/activity/activity_queue.hpp"
#include "access_guard/common/logger.hpp"

namespace access_guard {
namespace activity {

ActivityQueue::ActivityQueue(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

void ActivityQueue::push(const common::Activity& activity) {
    bool overflow = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (items_.size() >= capacity_) {
            items_.pop_front();
            overflow = true;
        }
        items_.push_back(activity);
    }

    if (overflow) {
        uint64_t total = ++dropped_;
        if (total == 1 || total % 100 == 0) {
            common::Logger::instance().warn("[ActivityQueue] Queue full, dropping oldest | capacity={} | dropped={}",
                                            capacity_, total);
        }
    }
}

std::optional<common::Activity> ActivityQueue::pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (items_.empty()) {
        return std::nullopt;
    }
    common::Activity front = std::move(items_.front());
    items_.pop_front();
    return front;
}

size_t ActivityQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}

}}
