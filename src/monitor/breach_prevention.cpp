#include "access_guard/monitor/breach_prevention.hpp"
#include "access_guard/common/constants.hpp"
#include "access_guard/common/logger.hpp"
#include "access_guard/core/error_codes.hpp"
#include <algorithm>

namespace access_guard {
namespace monitor {

namespace keys = constants::metadata_keys;
using common::IncidentStatus;

static int statusRank(IncidentStatus status) {
    switch (status) {
        case IncidentStatus::DETECTED: return 0;
        case IncidentStatus::INVESTIGATING: return 1;
        case IncidentStatus::CONTAINED: return 2;
        case IncidentStatus::RESOLVED: return 3;
    }
    return 0;
}

static void addUnique(std::vector<std::string>& values, const std::string& value) {
    if (std::find(values.begin(), values.end(), value) == values.end()) {
        values.push_back(value);
    }
}

BreachPreventionSystem::BreachPreventionSystem(const common::MonitorConfig& config,
                                               const common::Clock& clock,
                                               const activity::ActivityLog& log,
                                               const rbac::UserAccessStore& store,
                                               alert::SecurityAlertManager& alerts,
                                               audit::AuditDispatcher& audit)
    : config_(config), clock_(clock), log_(log), store_(store), alerts_(alerts), audit_(audit) {}

bool BreachPreventionSystem::isValidTransition(IncidentStatus from, IncidentStatus to) {
    return statusRank(to) > statusRank(from);
}

size_t BreachPreventionSystem::scan() {
    auto& logger = common::Logger::instance();
    common::Timestamp now = clock_.now();
    auto since = now - std::chrono::minutes(config_.breach_window_minutes);
    std::vector<common::Activity> window = log_.window(since);

    std::lock_guard<std::mutex> scan_lock(scan_mutex_);
    std::map<std::string, Suspect> suspects;

    for (const auto& activity : window) {
        if (activity.activity_type != common::ActivityType::DATA_ACCESS) {
            continue;
        }

        auto granted = activity.metadata.find(keys::GRANTED);
        auto permission_name = activity.metadata.find(keys::PERMISSION);
        if (granted == activity.metadata.end() || !granted->is_boolean() || !granted->get<bool>() ||
            permission_name == activity.metadata.end() || !permission_name->is_string()) {
            continue;
        }

        common::Permission permission = common::Permission::READ_BANK_DATA;
        try {
            permission = common::parsePermission(permission_name->get<std::string>());
        } catch (const core::GuardError& e) {
            logger.debug("[Breach] Skipping activity | id={} | error={}", activity.activity_id, e.what());
            continue;
        }

        if (permission == common::Permission::EXPORT_BANK_DATA) {
            auto& suspect = suspects[activity.user_id];
            ++suspect.export_count;
            suspect.newest_export_sequence = std::max(suspect.newest_export_sequence, activity.sequence);
            addUnique(suspect.affected_data, activity.resource_type);
            suspect.ip_address = activity.ip_address;
        }

        if (flagged_activities_.count(activity.activity_id) > 0) {
            continue;
        }

        std::optional<std::string> resource_type;
        if (activity.resource_type != constants::resources::PERMISSION) {
            resource_type = activity.resource_type;
        }

        rbac::AccessDecision decision = store_.validateAccess(activity.user_id, permission,
                                                              resource_type, activity.resource_id);
        if (!decision.granted) {
            auto& suspect = suspects[activity.user_id];
            suspect.failed_activity_ids.push_back(activity.activity_id);
            addUnique(suspect.failure_reasons, rbac::to_string(decision.reason));
            addUnique(suspect.affected_data, activity.resource_type);
            suspect.ip_address = activity.ip_address;
        }
    }

    size_t opened = 0;
    for (auto& [user_id, suspect] : suspects) {
        bool export_breach = suspect.export_count > static_cast<size_t>(config_.export_threshold) &&
                             suspect.newest_export_sequence > last_export_evidence_[user_id];
        if (suspect.failed_activity_ids.empty() && !export_breach) {
            continue;
        }

        if (!export_breach) {
            suspect.export_count = 0;
        }

        openIncident(user_id, suspect);
        ++opened;

        for (const auto& id : suspect.failed_activity_ids) {
            flagged_activities_[id] = now;
        }
        if (export_breach) {
            last_export_evidence_[user_id] = suspect.newest_export_sequence;
        }
    }

    auto forget_before = now - std::chrono::minutes(config_.breach_window_minutes * 2);
    for (auto it = flagged_activities_.begin(); it != flagged_activities_.end();) {
        it = it->second < forget_before ? flagged_activities_.erase(it) : std::next(it);
    }

    logger.debug("[Breach] Scan complete | activities={} | incidents={}", window.size(), opened);
    return opened;
}

common::BreachIncident BreachPreventionSystem::openIncident(const std::string& user_id, const Suspect& suspect) {
    common::BreachIncident incident;
    incident.detected_at = clock_.now();
    incident.incident_id = common::generateId("breach", incident.detected_at);
    incident.incident_type = "unauthorized_access";
    incident.severity = common::Severity::CRITICAL;
    incident.description = "Potential data breach detected for user " + user_id;
    incident.affected_users = {user_id};
    incident.affected_data = suspect.affected_data;
    incident.status = IncidentStatus::DETECTED;
    incident.containment_actions = {
        "Immediate account suspension",
        "Review access logs",
        "Assess data exposure",
        "Implement additional monitoring"
    };

    {
        std::unique_lock<std::shared_mutex> lock(incidents_mutex_);
        incidents_.push_back(incident);
    }

    nlohmann::json evidence = {
        {"incident_id", incident.incident_id},
        {"revoked_access_activities", suspect.failed_activity_ids},
        {"failure_reasons", suspect.failure_reasons},
        {"export_count", suspect.export_count}
    };

    std::string ip = suspect.ip_address.empty() ? keys::UNKNOWN_VALUE : suspect.ip_address;
    alerts_.createAlert(common::AlertType::DATA_BREACH,
                        common::Severity::CRITICAL,
                        "Potential data breach detected",
                        incident.description,
                        user_id,
                        ip,
                        evidence);

    audit::AuditEvent event;
    event.event_type = audit::AuditEventType::SECURITY_INCIDENT;
    event.category = audit::AuditCategory::SECURITY;
    event.severity = audit::AuditSeverity::CRITICAL;
    event.description = "Data breach incident detected: " + incident.incident_id;
    event.resource_type = "data_breach";
    event.resource_id = incident.incident_id;
    event.user_id = user_id;
    event.ip_address = ip;
    event.user_agent = keys::UNKNOWN_VALUE;
    event.timestamp = incident.detected_at;
    event.metadata = {
        {"incident_type", incident.incident_type},
        {"severity", common::to_string(incident.severity)}
    };
    audit_.dispatch(event);

    common::Logger::instance().critical("[Breach] Incident opened | id={} | user={} | revoked={} | exports={}",
                                     incident.incident_id, user_id,
                                     suspect.failed_activity_ids.size(), suspect.export_count);
    return incident;
}

common::BreachIncident BreachPreventionSystem::updateIncidentStatus(const std::string& incident_id,
                                                                    IncidentStatus status) {
    common::BreachIncident updated;
    IncidentStatus previous;
    {
        std::unique_lock<std::shared_mutex> lock(incidents_mutex_);
        auto it = std::find_if(incidents_.begin(), incidents_.end(),
                               [&](const common::BreachIncident& i) { return i.incident_id == incident_id; });
        if (it == incidents_.end()) {
            throw core::GuardError(core::GuardErrorCode::INCIDENT_NOT_FOUND, incident_id);
        }

        previous = it->status;
        if (!isValidTransition(previous, status)) {
            throw core::GuardError(core::GuardErrorCode::INCIDENT_INVALID_TRANSITION,
                                   common::to_string(previous) + " -> " + common::to_string(status));
        }
        it->status = status;
        updated = *it;
    }

    common::Logger::instance().info("[Breach] Incident status changed | id={} | from={} | to={}",
                                    incident_id, common::to_string(previous), common::to_string(status));
    return updated;
}

std::optional<common::BreachIncident> BreachPreventionSystem::find(const std::string& incident_id) const {
    std::shared_lock<std::shared_mutex> lock(incidents_mutex_);
    for (const auto& incident : incidents_) {
        if (incident.incident_id == incident_id) {
            return incident;
        }
    }
    return std::nullopt;
}

std::vector<common::BreachIncident> BreachPreventionSystem::incidents() const {
    std::shared_lock<std::shared_mutex> lock(incidents_mutex_);
    return incidents_;
}

size_t BreachPreventionSystem::openCount() const {
    std::shared_lock<std::shared_mutex> lock(incidents_mutex_);
    return static_cast<size_t>(std::count_if(incidents_.begin(), incidents_.end(),
        [](const common::BreachIncident& i) { return i.status != IncidentStatus::RESOLVED; }));
}

void BreachPreventionSystem::restore(std::vector<common::BreachIncident> incidents) {
    std::unique_lock<std::shared_mutex> lock(incidents_mutex_);
    incidents_ = std::move(incidents);
}

}}
