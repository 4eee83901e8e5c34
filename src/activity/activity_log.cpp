#include "access_guard/activity/activity_log.hpp"
#include <algorithm>
#include <mutex>

namespace access_guard {
namespace activity {

void ActivityLog::append(const common::Activity& activity) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_.push_back(activity);
}

std::vector<common::Activity> ActivityLog::window(common::Timestamp since) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<common::Activity> result;
    for (const auto& entry : entries_) {
        if (entry.timestamp >= since) {
            result.push_back(entry);
        }
    }
    return result;
}

size_t ActivityLog::countForUser(const std::string& user_id,
                                 common::Timestamp since,
                                 common::Timestamp until) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
        [&](const common::Activity& entry) {
            return entry.user_id == user_id && entry.timestamp >= since && entry.timestamp <= until;
        }));
}

std::vector<common::Activity> ActivityLog::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return std::vector<common::Activity>(entries_.begin(), entries_.end());
}

void ActivityLog::restore(std::vector<common::Activity> activities) {
    std::sort(activities.begin(), activities.end(),
              [](const common::Activity& a, const common::Activity& b) {
                  return a.sequence < b.sequence;
              });

    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_.assign(std::make_move_iterator(activities.begin()),
                    std::make_move_iterator(activities.end()));
}

size_t ActivityLog::prune(common::Timestamp cutoff) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    size_t before = entries_.size();
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                  [&](const common::Activity& entry) {
                                      return entry.timestamp < cutoff;
                                  }),
                   entries_.end());
    return before - entries_.size();
}

size_t ActivityLog::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

uint64_t ActivityLog::lastSequence() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    uint64_t last = 0;
    for (const auto& entry : entries_) {
        last = std::max(last, entry.sequence);
    }
    return last;
}

}}
