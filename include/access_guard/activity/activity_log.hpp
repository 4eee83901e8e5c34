#pragma once

#include "../common/types.hpp"
#include <deque>
#include <shared_mutex>
#include <string>
#include <vector>

namespace access_guard {
namespace activity {

// Append-only activity history kept in timestamp order of arrival.
// Readers get copies; nothing hands out references into the log.
class ActivityLog {
public:
    void append(const common::Activity& activity);

    // Activities with timestamp >= since.
    std::vector<common::Activity> window(common::Timestamp since) const;

    // Activities of one user with since <= timestamp <= until.
    size_t countForUser(const std::string& user_id,
                        common::Timestamp since,
                        common::Timestamp until) const;

    std::vector<common::Activity> snapshot() const;
    void restore(std::vector<common::Activity> activities);

    // Drops entries older than cutoff, returns how many were removed.
    size_t prune(common::Timestamp cutoff);

    size_t size() const;
    uint64_t lastSequence() const;

private:
    mutable std::shared_mutex mutex_;
    std::deque<common::Activity> entries_;
};

}}
