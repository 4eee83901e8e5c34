#include "access_guard/alert/alert_manager.hpp"
#include "access_guard/common/constants.hpp"
#include "access_guard/common/logger.hpp"
#include "access_guard/core/error_codes.hpp"
#include <algorithm>
#include <iterator>
#include <map>
#include <mutex>

namespace access_guard {
namespace alert {

using common::AlertStatus;
using common::AlertType;
using common::Severity;

static int statusRank(AlertStatus status) {
    switch (status) {
        case AlertStatus::OPEN: return 0;
        case AlertStatus::INVESTIGATING: return 1;
        case AlertStatus::RESOLVED: return 2;
        case AlertStatus::FALSE_POSITIVE: return 2;
    }
    return 0;
}

static bool isTerminal(AlertStatus status) {
    return status == AlertStatus::RESOLVED || status == AlertStatus::FALSE_POSITIVE;
}

SecurityAlertManager::SecurityAlertManager(const common::Clock& clock, audit::AuditDispatcher& audit)
    : clock_(clock), audit_(audit) {}

bool SecurityAlertManager::isValidTransition(AlertStatus from, AlertStatus to) {
    if (isTerminal(from)) {
        return false;
    }
    return statusRank(to) > statusRank(from);
}

const std::vector<std::string>& SecurityAlertManager::remediationSteps(AlertType type) {
    static const std::map<AlertType, std::vector<std::string>> table = {
        {AlertType::ACCOUNT_LOCKED, {
            "Verify user identity",
            "Reset password if necessary",
            "Review login attempts",
            "Consider additional authentication factors"
        }},
        {AlertType::SECURITY_VIOLATION, {
            "Investigate the violation",
            "Review user permissions",
            "Consider account suspension",
            "Update security policies if needed"
        }},
        {AlertType::SUSPICIOUS_ACTIVITY, {
            "Monitor user activity",
            "Review access patterns",
            "Consider additional monitoring",
            "Investigate potential threats"
        }},
        {AlertType::DATA_BREACH, {
            "Contain the breach",
            "Assess affected data",
            "Notify affected users",
            "Report to authorities if required",
            "Implement additional security measures"
        }}
    };
    static const std::vector<std::string> fallback = {"Investigate and remediate"};

    auto it = table.find(type);
    return it != table.end() ? it->second : fallback;
}

audit::AuditSeverity SecurityAlertManager::toAuditSeverity(Severity severity) {
    switch (severity) {
        case Severity::LOW: return audit::AuditSeverity::INFO;
        case Severity::MEDIUM: return audit::AuditSeverity::WARNING;
        case Severity::HIGH: return audit::AuditSeverity::ERROR;
        case Severity::CRITICAL: return audit::AuditSeverity::CRITICAL;
    }
    return audit::AuditSeverity::WARNING;
}

common::SecurityAlert SecurityAlertManager::createAlert(AlertType type,
                                                        Severity severity,
                                                        const std::string& title,
                                                        const std::string& description,
                                                        const std::string& user_id,
                                                        const std::string& ip_address,
                                                        const nlohmann::json& evidence) {
    common::SecurityAlert alert;
    alert.timestamp = clock_.now();
    alert.alert_id = common::generateId("alert", alert.timestamp);
    alert.alert_type = type;
    alert.severity = severity;
    alert.title = title;
    alert.description = description;
    alert.user_id = user_id;
    alert.ip_address = ip_address;
    alert.status = AlertStatus::OPEN;
    alert.remediation_steps = remediationSteps(type);

    alert.evidence = {
        {"alert_type", common::to_string(type)},
        {"severity", common::to_string(severity)}
    };
    if (evidence.is_object()) {
        alert.evidence.update(evidence);
    }

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        index_[alert.alert_id] = alerts_.size();
        alerts_.push_back(alert);
    }

    audit::AuditEvent event;
    event.event_type = audit::AuditEventType::SECURITY_INCIDENT;
    event.category = audit::AuditCategory::SECURITY;
    event.severity = toAuditSeverity(severity);
    event.description = "Security alert: " + title;
    event.resource_type = constants::resources::SECURITY;
    event.resource_id = alert.alert_id;
    event.user_id = user_id;
    event.ip_address = ip_address;
    event.user_agent = constants::metadata_keys::UNKNOWN_VALUE;
    event.timestamp = alert.timestamp;
    event.metadata = alert.evidence;
    audit_.dispatch(event);

    common::Logger::instance().warn("[Alert] Created | id={} | type={} | severity={} | user={}",
                                    alert.alert_id, common::to_string(type),
                                    common::to_string(severity), user_id);
    return alert;
}

common::SecurityAlert SecurityAlertManager::updateStatus(const std::string& alert_id, AlertStatus status) {
    common::SecurityAlert updated;
    AlertStatus previous;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = index_.find(alert_id);
        if (it == index_.end()) {
            throw core::GuardError(core::GuardErrorCode::ALERT_NOT_FOUND, alert_id);
        }

        auto& alert = alerts_[it->second];
        previous = alert.status;
        if (!isValidTransition(previous, status)) {
            throw core::GuardError(core::GuardErrorCode::ALERT_INVALID_TRANSITION,
                                   common::to_string(previous) + " -> " + common::to_string(status));
        }
        alert.status = status;
        updated = alert;
    }

    common::Logger::instance().info("[Alert] Status changed | id={} | from={} | to={}",
                                    alert_id, common::to_string(previous), common::to_string(status));
    return updated;
}

std::optional<common::SecurityAlert> SecurityAlertManager::find(const std::string& alert_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = index_.find(alert_id);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return alerts_[it->second];
}

std::vector<common::SecurityAlert> SecurityAlertManager::alerts() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return alerts_;
}

std::vector<common::SecurityAlert> SecurityAlertManager::alertsByStatus(AlertStatus status) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<common::SecurityAlert> result;
    for (const auto& alert : alerts_) {
        if (alert.status == status) {
            result.push_back(alert);
        }
    }
    return result;
}

size_t SecurityAlertManager::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return alerts_.size();
}

size_t SecurityAlertManager::pruneClosed(common::Timestamp cutoff) {
    size_t removed = 0;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto expired = [cutoff](const common::SecurityAlert& alert) {
            return isTerminal(alert.status) && alert.timestamp < cutoff;
        };

        auto first = std::remove_if(alerts_.begin(), alerts_.end(), expired);
        removed = static_cast<size_t>(std::distance(first, alerts_.end()));
        if (removed == 0) {
            return 0;
        }
        alerts_.erase(first, alerts_.end());

        index_.clear();
        for (size_t i = 0; i < alerts_.size(); ++i) {
            index_[alerts_[i].alert_id] = i;
        }
    }

    common::Logger::instance().debug("[Alert] Pruned closed alerts | removed={}", removed);
    return removed;
}

void SecurityAlertManager::restore(std::vector<common::SecurityAlert> alerts) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    alerts_ = std::move(alerts);
    index_.clear();
    for (size_t i = 0; i < alerts_.size(); ++i) {
        index_[alerts_[i].alert_id] = i;
    }
}

}}
