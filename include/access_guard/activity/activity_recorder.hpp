#pragma once

#include "activity_log.hpp"
#include "activity_queue.hpp"
#include "ip_reputation.hpp"
#include "../audit/audit_sink.hpp"
#include "../common/clock.hpp"
#include "../common/config.hpp"
#include "../common/types.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <optional>
#include <string>

namespace access_guard {
namespace activity {

// Scores, stamps and fans out every activity: to the log, to the monitor
// queue and to the audit trail.
class ActivityRecorder {
public:
    ActivityRecorder(const common::MonitorConfig& config,
                     const common::Clock& clock,
                     const IpReputation& ip_reputation,
                     ActivityLog& log,
                     ActivityQueue& queue,
                     audit::AuditDispatcher& audit);

    common::Activity logActivity(const std::string& user_id,
                                 common::ActivityType type,
                                 const std::string& resource_type,
                                 const std::optional<std::string>& resource_id = std::nullopt,
                                 const nlohmann::json& metadata = nlohmann::json::object());

    int riskScore(common::ActivityType type,
                  const nlohmann::json& metadata,
                  const std::string& ip_address,
                  common::Timestamp timestamp) const;

    bool isOutsideBusinessHours(common::Timestamp timestamp) const;
    bool isSuspiciousIp(const std::string& ip_address) const;

    // Continue numbering after activities restored from disk.
    void resumeSequence(uint64_t last_sequence);

    static int baseRisk(common::ActivityType type);

private:
    common::MonitorConfig config_;
    const common::Clock& clock_;
    const IpReputation& ip_reputation_;
    ActivityLog& log_;
    ActivityQueue& queue_;
    audit::AuditDispatcher& audit_;
    std::atomic<uint64_t> sequence_{0};

    audit::AuditEvent toAuditEvent(const common::Activity& activity) const;
};

}}
