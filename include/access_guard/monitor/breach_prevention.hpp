#pragma once

#include "../activity/activity_log.hpp"
#include "../alert/alert_manager.hpp"
#include "../audit/audit_sink.hpp"
#include "../common/clock.hpp"
#include "../common/config.hpp"
#include "../rbac/user_access_store.hpp"
#include <map>
#include <optional>
#include <shared_mutex>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace access_guard {
namespace monitor {

// Re-checks recently granted accesses against current authorization state
// and watches export volume. Each suspect user yields at most one incident
// per scan.
class BreachPreventionSystem {
public:
    BreachPreventionSystem(const common::MonitorConfig& config,
                           const common::Clock& clock,
                           const activity::ActivityLog& log,
                           const rbac::UserAccessStore& store,
                           alert::SecurityAlertManager& alerts,
                           audit::AuditDispatcher& audit);

    // One worker iteration. Returns the number of incidents opened.
    size_t scan();

    // Throws core::GuardError (INCIDENT_NOT_FOUND, INCIDENT_INVALID_TRANSITION).
    common::BreachIncident updateIncidentStatus(const std::string& incident_id, common::IncidentStatus status);

    std::optional<common::BreachIncident> find(const std::string& incident_id) const;
    std::vector<common::BreachIncident> incidents() const;
    size_t openCount() const;

    void restore(std::vector<common::BreachIncident> incidents);

    static bool isValidTransition(common::IncidentStatus from, common::IncidentStatus to);

private:
    struct Suspect {
        std::vector<std::string> failed_activity_ids;
        std::vector<std::string> failure_reasons;
        std::vector<std::string> affected_data;
        size_t export_count = 0;
        uint64_t newest_export_sequence = 0;
        std::string ip_address;
    };

    common::MonitorConfig config_;
    const common::Clock& clock_;
    const activity::ActivityLog& log_;
    const rbac::UserAccessStore& store_;
    alert::SecurityAlertManager& alerts_;
    audit::AuditDispatcher& audit_;

    mutable std::shared_mutex incidents_mutex_;
    std::vector<common::BreachIncident> incidents_;

    std::mutex scan_mutex_;
    std::unordered_map<std::string, common::Timestamp> flagged_activities_;
    std::map<std::string, uint64_t> last_export_evidence_;

    common::BreachIncident openIncident(const std::string& user_id, const Suspect& suspect);
};

}}
