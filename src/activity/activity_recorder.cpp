#include "access_guard/activity/activity_recorder.hpp"
#include "access_guard/common/constants.hpp"
#include "access_guard/common/logger.hpp"
#include <algorithm>
#include <cstdint>
#include <ctime>

namespace access_guard {
namespace activity {

namespace keys = constants::metadata_keys;
using common::ActivityType;

static std::string metadataString(const nlohmann::json& metadata, const char* key) {
    if (metadata.is_object()) {
        auto it = metadata.find(key);
        if (it != metadata.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return keys::UNKNOWN_VALUE;
}

// Non-negative integer count, saturated at the score ceiling so that the
// weighting below cannot overflow. Anything else reads as zero.
static int metadataCount(const nlohmann::json& metadata, const char* key) {
    constexpr int ceiling = constants::limits::MAX_RISK_SCORE;

    if (!metadata.is_object()) {
        return 0;
    }
    auto it = metadata.find(key);
    if (it == metadata.end()) {
        return 0;
    }
    if (it->is_number_unsigned()) {
        return static_cast<int>(std::min<uint64_t>(it->get<uint64_t>(), ceiling));
    }
    if (it->is_number_integer()) {
        return static_cast<int>(std::clamp<int64_t>(it->get<int64_t>(), 0, ceiling));
    }
    return 0;
}

ActivityRecorder::ActivityRecorder(const common::MonitorConfig& config,
                                   const common::Clock& clock,
                                   const IpReputation& ip_reputation,
                                   ActivityLog& log,
                                   ActivityQueue& queue,
                                   audit::AuditDispatcher& audit)
    : config_(config), clock_(clock), ip_reputation_(ip_reputation),
      log_(log), queue_(queue), audit_(audit) {}

int ActivityRecorder::baseRisk(ActivityType type) {
    switch (type) {
        case ActivityType::LOGIN: return 1;
        case ActivityType::LOGOUT: return 1;
        case ActivityType::DATA_ACCESS: return 2;
        case ActivityType::DATA_MODIFICATION: return 5;
        case ActivityType::ACCOUNT_CREATION: return 3;
        case ActivityType::ACCOUNT_DELETION: return 8;
        case ActivityType::PERMISSION_CHANGE: return 7;
        case ActivityType::ROLE_CHANGE: return 8;
        case ActivityType::SUSPICIOUS_ACTIVITY: return 10;
        case ActivityType::SECURITY_VIOLATION: return 10;
    }
    return 0;
}

bool ActivityRecorder::isOutsideBusinessHours(common::Timestamp timestamp) const {
    std::time_t t = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);
    return tm_utc.tm_hour < config_.business_hours_start || tm_utc.tm_hour > config_.business_hours_end;
}

bool ActivityRecorder::isSuspiciousIp(const std::string& ip_address) const {
    return ip_reputation_.isSuspicious(ip_address);
}

int ActivityRecorder::riskScore(ActivityType type,
                                const nlohmann::json& metadata,
                                const std::string& ip_address,
                                common::Timestamp timestamp) const {
    int score = baseRisk(type);
    score += metadataCount(metadata, keys::FAILED_ATTEMPTS) * 2;

    if (isSuspiciousIp(ip_address)) {
        score += 5;
    }
    if (isOutsideBusinessHours(timestamp)) {
        score += 3;
    }

    return std::clamp(score, 0, constants::limits::MAX_RISK_SCORE);
}

common::Activity ActivityRecorder::logActivity(const std::string& user_id,
                                               ActivityType type,
                                               const std::string& resource_type,
                                               const std::optional<std::string>& resource_id,
                                               const nlohmann::json& metadata) {
    common::Activity activity;
    activity.timestamp = clock_.now();
    activity.sequence = ++sequence_;
    activity.activity_id = common::generateId("act", activity.timestamp);
    activity.user_id = user_id;
    activity.activity_type = type;
    activity.resource_type = resource_type;
    activity.resource_id = resource_id;
    activity.metadata = metadata.is_object() ? metadata : nlohmann::json::object();
    activity.ip_address = metadataString(activity.metadata, keys::IP_ADDRESS);
    activity.user_agent = metadataString(activity.metadata, keys::USER_AGENT);
    activity.risk_score = riskScore(type, activity.metadata, activity.ip_address, activity.timestamp);

    log_.append(activity);
    queue_.push(activity);
    audit_.dispatch(toAuditEvent(activity));

    common::Logger::instance().debug("[Activity] Recorded | id={} | user={} | type={} | risk={}",
                                     activity.activity_id, user_id, common::to_string(type),
                                     activity.risk_score);
    return activity;
}

void ActivityRecorder::resumeSequence(uint64_t last_sequence) {
    uint64_t current = sequence_.load();
    while (current < last_sequence && !sequence_.compare_exchange_weak(current, last_sequence)) {
    }
}

audit::AuditEvent ActivityRecorder::toAuditEvent(const common::Activity& activity) const {
    audit::AuditEvent event;

    switch (activity.activity_type) {
        case ActivityType::LOGIN:
        case ActivityType::LOGOUT:
            event.event_type = audit::AuditEventType::AUTHENTICATION;
            event.category = audit::AuditCategory::AUTHENTICATION;
            break;
        case ActivityType::SUSPICIOUS_ACTIVITY:
        case ActivityType::SECURITY_VIOLATION:
            event.event_type = audit::AuditEventType::SECURITY_INCIDENT;
            event.category = audit::AuditCategory::SECURITY;
            break;
        default:
            event.event_type = audit::AuditEventType::DATA_ACCESS;
            event.category = audit::AuditCategory::DATA_ACCESS;
            break;
    }

    if (activity.activity_type == ActivityType::SECURITY_VIOLATION) {
        event.severity = audit::AuditSeverity::ERROR;
    } else if (activity.risk_score >= constants::limits::HIGH_RISK_SCORE) {
        event.severity = audit::AuditSeverity::WARNING;
    } else {
        event.severity = audit::AuditSeverity::INFO;
    }

    event.description = "User activity: " + common::to_string(activity.activity_type);
    event.resource_type = activity.resource_type;
    event.resource_id = activity.resource_id;
    event.user_id = activity.user_id;
    event.ip_address = activity.ip_address;
    event.user_agent = activity.user_agent;
    event.timestamp = activity.timestamp;
    event.metadata = activity.metadata;
    event.metadata["activity_id"] = activity.activity_id;
    event.metadata["risk_score"] = activity.risk_score;
    return event;
}

}}
