#include "access_guard/monitor/activity_monitor.hpp"
#include "access_guard/common/logger.hpp"

namespace access_guard {
namespace monitor {

ActivityMonitor::ActivityMonitor(const common::MonitorConfig& config,
                                 const common::Clock& clock,
                                 activity::ActivityQueue& queue,
                                 activity::ActivityLog& log,
                                 const activity::ActivityRecorder& recorder,
                                 alert::SecurityAlertManager& alerts)
    : config_(config), clock_(clock), queue_(queue), log_(log), recorder_(recorder), alerts_(alerts) {}

std::vector<std::string> ActivityMonitor::unusualReasons(const common::Activity& activity) const {
    std::vector<std::string> reasons;
    if (recorder_.isOutsideBusinessHours(activity.timestamp)) {
        reasons.push_back("outside_business_hours");
    }
    if (recorder_.isSuspiciousIp(activity.ip_address)) {
        reasons.push_back("suspicious_ip");
    }
    if (activity.risk_score >= config_.unusual_risk_threshold) {
        reasons.push_back("high_risk_score");
    }
    return reasons;
}

bool ActivityMonitor::isRapid(const common::Activity& activity) const {
    auto since = activity.timestamp - std::chrono::seconds(config_.rapid_window_seconds);
    size_t count = log_.countForUser(activity.user_id, since, activity.timestamp);
    return count > static_cast<size_t>(config_.rapid_threshold);
}

void ActivityMonitor::analyze(const common::Activity& activity) {
    auto reasons = unusualReasons(activity);
    if (!reasons.empty()) {
        alerts_.createAlert(common::AlertType::UNUSUAL_ACTIVITY,
                            common::Severity::MEDIUM,
                            "Unusual activity detected for user " + activity.user_id,
                            "Activity " + common::to_string(activity.activity_type) + " matched unusual activity rules",
                            activity.user_id,
                            activity.ip_address,
                            {{"activity_id", activity.activity_id},
                             {"risk_score", activity.risk_score},
                             {"reasons", reasons}});
    }

    if (isRapid(activity)) {
        alerts_.createAlert(common::AlertType::RAPID_ACTIVITY,
                            common::Severity::HIGH,
                            "Rapid activity detected for user " + activity.user_id,
                            "More than " + std::to_string(config_.rapid_threshold) + " activities within " +
                                std::to_string(config_.rapid_window_seconds) + " seconds",
                            activity.user_id,
                            activity.ip_address,
                            {{"activity_id", activity.activity_id},
                             {"window_seconds", config_.rapid_window_seconds}});
    }
}

bool ActivityMonitor::processPending() {
    bool ok = true;
    size_t processed = 0;

    while (auto activity = queue_.pop()) {
        try {
            analyze(*activity);
        } catch (const std::exception& e) {
            ok = false;
            common::Logger::instance().error("[Monitor] Activity analysis failed | id={} | user={} | error={}",
                                             activity->activity_id, activity->user_id, e.what());
        }
        ++processed;
    }

    auto cutoff = clock_.now() - std::chrono::hours(config_.activity_retention_hours);
    size_t pruned = log_.prune(cutoff);

    if (processed > 0 || pruned > 0) {
        common::Logger::instance().debug("[Monitor] Iteration complete | processed={} | pruned={}", processed, pruned);
    }
    return ok;
}

}}
