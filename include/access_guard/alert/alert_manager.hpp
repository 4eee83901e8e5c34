#pragma once

#include "../audit/audit_sink.hpp"
#include "../common/clock.hpp"
#include "../common/types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace access_guard {
namespace alert {

class SecurityAlertManager {
public:
    SecurityAlertManager(const common::Clock& clock, audit::AuditDispatcher& audit);

    common::SecurityAlert createAlert(common::AlertType type,
                                      common::Severity severity,
                                      const std::string& title,
                                      const std::string& description,
                                      const std::string& user_id,
                                      const std::string& ip_address,
                                      const nlohmann::json& evidence = nlohmann::json::object());

    // Throws core::GuardError (ALERT_NOT_FOUND, ALERT_INVALID_TRANSITION).
    common::SecurityAlert updateStatus(const std::string& alert_id, common::AlertStatus status);

    std::optional<common::SecurityAlert> find(const std::string& alert_id) const;
    std::vector<common::SecurityAlert> alerts() const;
    std::vector<common::SecurityAlert> alertsByStatus(common::AlertStatus status) const;
    size_t size() const;

    void restore(std::vector<common::SecurityAlert> alerts);

    // Drops RESOLVED and FALSE_POSITIVE alerts raised before the cutoff.
    // Open and investigating alerts are kept regardless of age.
    size_t pruneClosed(common::Timestamp cutoff);

    // Status only moves forward; RESOLVED and FALSE_POSITIVE are terminal.
    static bool isValidTransition(common::AlertStatus from, common::AlertStatus to);
    static const std::vector<std::string>& remediationSteps(common::AlertType type);

private:
    const common::Clock& clock_;
    audit::AuditDispatcher& audit_;

    mutable std::shared_mutex mutex_;
    std::vector<common::SecurityAlert> alerts_;
    std::unordered_map<std::string, size_t> index_;

    static audit::AuditSeverity toAuditSeverity(common::Severity severity);
};

}}
