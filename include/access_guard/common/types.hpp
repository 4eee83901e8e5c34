#pragma once

#include "error_framework.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <set>
#include <map>
#include <chrono>
#include <optional>
#include <cstdint>

namespace access_guard {
namespace common {

using Timestamp = std::chrono::system_clock::time_point;

enum class Role {
    ADMIN,
    MANAGER,
    ANALYST,
    SUPPORT,
    USER,
    READ_ONLY
};

enum class Permission {
    CREATE_USER,
    READ_USER,
    UPDATE_USER,
    DELETE_USER,
    READ_BANK_DATA,
    WRITE_BANK_DATA,
    DELETE_BANK_DATA,
    EXPORT_BANK_DATA,
    VIEW_BALANCES,
    VIEW_TRANSACTIONS,
    VIEW_ANALYTICS,
    MANAGE_ACCOUNTS,
    SYSTEM_ADMIN,
    SECURITY_ADMIN,
    COMPLIANCE_ADMIN,
    VIEW_AUDIT_LOGS,
    VIEW_SECURITY_ALERTS,
    MANAGE_MONITORING
};

enum class SecurityLevel {
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

enum class ActivityType {
    LOGIN,
    LOGOUT,
    DATA_ACCESS,
    DATA_MODIFICATION,
    ACCOUNT_CREATION,
    ACCOUNT_DELETION,
    PERMISSION_CHANGE,
    ROLE_CHANGE,
    SUSPICIOUS_ACTIVITY,
    SECURITY_VIOLATION
};

enum class Severity {
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

enum class AlertType {
    ACCOUNT_LOCKED,
    SECURITY_VIOLATION,
    SUSPICIOUS_ACTIVITY,
    SUSPICIOUS_PATTERN,
    UNUSUAL_ACTIVITY,
    RAPID_ACTIVITY,
    DATA_BREACH,
    MONITOR_DEGRADED
};

enum class AlertStatus {
    OPEN,
    INVESTIGATING,
    RESOLVED,
    FALSE_POSITIVE
};

enum class IncidentStatus {
    DETECTED,
    INVESTIGATING,
    CONTAINED,
    RESOLVED
};

enum class ConsentType {
    DATA_COLLECTION,
    DATA_PROCESSING,
    DATA_SHARING,
    MARKETING,
    THIRD_PARTY,
    AUTOMATED_DECISIONS
};

using PermissionSet = std::set<Permission>;

struct RoleDefinition {
    Role role;
    std::string description;
    PermissionSet permissions;
    SecurityLevel security_level;
};

struct UserAccess {
    std::string user_id;
    Role role = Role::USER;
    PermissionSet permissions;
    SecurityLevel security_level = SecurityLevel::LOW;
    std::optional<Timestamp> last_login;
    int login_count = 0;
    int failed_attempts = 0;
    bool is_locked = false;
    bool mfa_enabled = false;
    std::vector<std::string> ip_whitelist;
    int session_timeout_minutes = 30;
};

struct Activity {
    std::string activity_id;
    uint64_t sequence = 0;
    std::string user_id;
    ActivityType activity_type = ActivityType::DATA_ACCESS;
    std::string resource_type;
    std::optional<std::string> resource_id;
    std::string ip_address;
    std::string user_agent;
    Timestamp timestamp;
    nlohmann::json metadata = nlohmann::json::object();
    int risk_score = 0;
};

struct SecurityAlert {
    std::string alert_id;
    AlertType alert_type = AlertType::SUSPICIOUS_ACTIVITY;
    Severity severity = Severity::LOW;
    std::string title;
    std::string description;
    std::string user_id;
    std::string ip_address;
    Timestamp timestamp;
    AlertStatus status = AlertStatus::OPEN;
    nlohmann::json evidence = nlohmann::json::object();
    std::vector<std::string> remediation_steps;
};

struct BreachIncident {
    std::string incident_id;
    std::string incident_type;
    Severity severity = Severity::CRITICAL;
    std::string description;
    std::vector<std::string> affected_users;
    std::vector<std::string> affected_data;
    Timestamp detected_at;
    IncidentStatus status = IncidentStatus::DETECTED;
    std::vector<std::string> containment_actions;
    bool notification_sent = false;
    bool regulatory_reporting = false;
};

struct ConsentRecord {
    std::string consent_id;
    std::string user_id;
    ConsentType consent_type = ConsentType::DATA_COLLECTION;
    bool granted = false;
    Timestamp granted_at;
    std::optional<Timestamp> expires_at;
    std::string version;
    std::string ip_address;
    std::string user_agent;
};

std::string to_string(Role role);
std::string to_string(Permission permission);
std::string to_string(SecurityLevel level);
std::string to_string(ActivityType type);
std::string to_string(Severity severity);
std::string to_string(AlertType type);
std::string to_string(AlertStatus status);
std::string to_string(IncidentStatus status);
std::string to_string(ConsentType type);

// Parsers throw core::GuardError for text outside the enumeration.
Role parseRole(const std::string& value);
Permission parsePermission(const std::string& value);
SecurityLevel parseSecurityLevel(const std::string& value);
ActivityType parseActivityType(const std::string& value);
Severity parseSeverity(const std::string& value);
AlertType parseAlertType(const std::string& value);
AlertStatus parseAlertStatus(const std::string& value);
IncidentStatus parseIncidentStatus(const std::string& value);
ConsentType parseConsentType(const std::string& value);

const std::vector<Permission>& allPermissions();
const std::vector<Role>& allRoles();
const std::vector<ActivityType>& allActivityTypes();

std::string formatTimestamp(Timestamp ts);
Timestamp parseTimestamp(const std::string& value);
int64_t toEpochSeconds(Timestamp ts);

std::string generateId(const std::string& prefix, Timestamp ts);

}}
