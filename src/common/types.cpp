#include "access_guard/common/types.hpp"
#include "access_guard/core/error_codes.hpp"
#include <sstream>
#include <iomanip>
#include <random>
#include <ctime>
#include <cctype>

namespace access_guard {
namespace common {

namespace {

template<typename EnumType>
EnumType parseEnum(const std::string& value,
                   const std::vector<EnumType>& candidates,
                   core::GuardErrorCode error_code,
                   const char* label) {
    for (auto candidate : candidates) {
        if (to_string(candidate) == value) {
            return candidate;
        }
    }
    throw core::GuardError(error_code, std::string(label) + " '" + value + "'");
}

}

std::string to_string(Role role) {
    switch (role) {
        case Role::ADMIN: return "admin";
        case Role::MANAGER: return "manager";
        case Role::ANALYST: return "analyst";
        case Role::SUPPORT: return "support";
        case Role::USER: return "user";
        case Role::READ_ONLY: return "read_only";
    }
    return "unknown";
}

std::string to_string(Permission permission) {
    switch (permission) {
        case Permission::CREATE_USER: return "create_user";
        case Permission::READ_USER: return "read_user";
        case Permission::UPDATE_USER: return "update_user";
        case Permission::DELETE_USER: return "delete_user";
        case Permission::READ_BANK_DATA: return "read_bank_data";
        case Permission::WRITE_BANK_DATA: return "write_bank_data";
        case Permission::DELETE_BANK_DATA: return "delete_bank_data";
        case Permission::EXPORT_BANK_DATA: return "export_bank_data";
        case Permission::VIEW_BALANCES: return "view_balances";
        case Permission::VIEW_TRANSACTIONS: return "view_transactions";
        case Permission::VIEW_ANALYTICS: return "view_analytics";
        case Permission::MANAGE_ACCOUNTS: return "manage_accounts";
        case Permission::SYSTEM_ADMIN: return "system_admin";
        case Permission::SECURITY_ADMIN: return "security_admin";
        case Permission::COMPLIANCE_ADMIN: return "compliance_admin";
        case Permission::VIEW_AUDIT_LOGS: return "view_audit_logs";
        case Permission::VIEW_SECURITY_ALERTS: return "view_security_alerts";
        case Permission::MANAGE_MONITORING: return "manage_monitoring";
    }
    return "unknown";
}

std::string to_string(SecurityLevel level) {
    switch (level) {
        case SecurityLevel::LOW: return "low";
        case SecurityLevel::MEDIUM: return "medium";
        case SecurityLevel::HIGH: return "high";
        case SecurityLevel::CRITICAL: return "critical";
    }
    return "unknown";
}

std::string to_string(ActivityType type) {
    switch (type) {
        case ActivityType::LOGIN: return "login";
        case ActivityType::LOGOUT: return "logout";
        case ActivityType::DATA_ACCESS: return "data_access";
        case ActivityType::DATA_MODIFICATION: return "data_modification";
        case ActivityType::ACCOUNT_CREATION: return "account_creation";
        case ActivityType::ACCOUNT_DELETION: return "account_deletion";
        case ActivityType::PERMISSION_CHANGE: return "permission_change";
        case ActivityType::ROLE_CHANGE: return "role_change";
        case ActivityType::SUSPICIOUS_ACTIVITY: return "suspicious_activity";
        case ActivityType::SECURITY_VIOLATION: return "security_violation";
    }
    return "unknown";
}

std::string to_string(Severity severity) {
    switch (severity) {
        case Severity::LOW: return "low";
        case Severity::MEDIUM: return "medium";
        case Severity::HIGH: return "high";
        case Severity::CRITICAL: return "critical";
    }
    return "unknown";
}

std::string to_string(AlertType type) {
    switch (type) {
        case AlertType::ACCOUNT_LOCKED: return "account_locked";
        case AlertType::SECURITY_VIOLATION: return "security_violation";
        case AlertType::SUSPICIOUS_ACTIVITY: return "suspicious_activity";
        case AlertType::SUSPICIOUS_PATTERN: return "suspicious_pattern";
        case AlertType::UNUSUAL_ACTIVITY: return "unusual_activity";
        case AlertType::RAPID_ACTIVITY: return "rapid_activity";
        case AlertType::DATA_BREACH: return "data_breach";
        case AlertType::MONITOR_DEGRADED: return "monitor_degraded";
    }
    return "unknown";
}

std::string to_string(AlertStatus status) {
    switch (status) {
        case AlertStatus::OPEN: return "open";
        case AlertStatus::INVESTIGATING: return "investigating";
        case AlertStatus::RESOLVED: return "resolved";
        case AlertStatus::FALSE_POSITIVE: return "false_positive";
    }
    return "unknown";
}

std::string to_string(IncidentStatus status) {
    switch (status) {
        case IncidentStatus::DETECTED: return "detected";
        case IncidentStatus::INVESTIGATING: return "investigating";
        case IncidentStatus::CONTAINED: return "contained";
        case IncidentStatus::RESOLVED: return "resolved";
    }
    return "unknown";
}

std::string to_string(ConsentType type) {
    switch (type) {
        case ConsentType::DATA_COLLECTION: return "data_collection";
        case ConsentType::DATA_PROCESSING: return "data_processing";
        case ConsentType::DATA_SHARING: return "data_sharing";
        case ConsentType::MARKETING: return "marketing";
        case ConsentType::THIRD_PARTY: return "third_party";
        case ConsentType::AUTOMATED_DECISIONS: return "automated_decisions";
    }
    return "unknown";
}

const std::vector<Permission>& allPermissions() {
    static const std::vector<Permission> permissions = {
        Permission::CREATE_USER, Permission::READ_USER, Permission::UPDATE_USER,
        Permission::DELETE_USER, Permission::READ_BANK_DATA, Permission::WRITE_BANK_DATA,
        Permission::DELETE_BANK_DATA, Permission::EXPORT_BANK_DATA, Permission::VIEW_BALANCES,
        Permission::VIEW_TRANSACTIONS, Permission::VIEW_ANALYTICS, Permission::MANAGE_ACCOUNTS,
        Permission::SYSTEM_ADMIN, Permission::SECURITY_ADMIN, Permission::COMPLIANCE_ADMIN,
        Permission::VIEW_AUDIT_LOGS, Permission::VIEW_SECURITY_ALERTS, Permission::MANAGE_MONITORING
    };
    return permissions;
}

const std::vector<Role>& allRoles() {
    static const std::vector<Role> roles = {
        Role::ADMIN, Role::MANAGER, Role::ANALYST, Role::SUPPORT, Role::USER, Role::READ_ONLY
    };
    return roles;
}

const std::vector<ActivityType>& allActivityTypes() {
    static const std::vector<ActivityType> types = {
        ActivityType::LOGIN, ActivityType::LOGOUT, ActivityType::DATA_ACCESS,
        ActivityType::DATA_MODIFICATION, ActivityType::ACCOUNT_CREATION,
        ActivityType::ACCOUNT_DELETION, ActivityType::PERMISSION_CHANGE,
        ActivityType::ROLE_CHANGE, ActivityType::SUSPICIOUS_ACTIVITY,
        ActivityType::SECURITY_VIOLATION
    };
    return types;
}

Role parseRole(const std::string& value) {
    return parseEnum(value, allRoles(), core::GuardErrorCode::UNKNOWN_ROLE, "role");
}

Permission parsePermission(const std::string& value) {
    return parseEnum(value, allPermissions(), core::GuardErrorCode::UNKNOWN_PERMISSION, "permission");
}

SecurityLevel parseSecurityLevel(const std::string& value) {
    static const std::vector<SecurityLevel> levels = {
        SecurityLevel::LOW, SecurityLevel::MEDIUM, SecurityLevel::HIGH, SecurityLevel::CRITICAL
    };
    return parseEnum(value, levels, core::GuardErrorCode::UNKNOWN_ENUM_VALUE, "security level");
}

ActivityType parseActivityType(const std::string& value) {
    return parseEnum(value, allActivityTypes(), core::GuardErrorCode::UNKNOWN_ENUM_VALUE, "activity type");
}

Severity parseSeverity(const std::string& value) {
    static const std::vector<Severity> severities = {
        Severity::LOW, Severity::MEDIUM, Severity::HIGH, Severity::CRITICAL
    };
    return parseEnum(value, severities, core::GuardErrorCode::UNKNOWN_ENUM_VALUE, "severity");
}

AlertType parseAlertType(const std::string& value) {
    static const std::vector<AlertType> types = {
        AlertType::ACCOUNT_LOCKED, AlertType::SECURITY_VIOLATION, AlertType::SUSPICIOUS_ACTIVITY,
        AlertType::SUSPICIOUS_PATTERN, AlertType::UNUSUAL_ACTIVITY, AlertType::RAPID_ACTIVITY,
        AlertType::DATA_BREACH, AlertType::MONITOR_DEGRADED
    };
    return parseEnum(value, types, core::GuardErrorCode::UNKNOWN_ENUM_VALUE, "alert type");
}

AlertStatus parseAlertStatus(const std::string& value) {
    static const std::vector<AlertStatus> statuses = {
        AlertStatus::OPEN, AlertStatus::INVESTIGATING, AlertStatus::RESOLVED, AlertStatus::FALSE_POSITIVE
    };
    return parseEnum(value, statuses, core::GuardErrorCode::UNKNOWN_ENUM_VALUE, "alert status");
}

IncidentStatus parseIncidentStatus(const std::string& value) {
    static const std::vector<IncidentStatus> statuses = {
        IncidentStatus::DETECTED, IncidentStatus::INVESTIGATING,
        IncidentStatus::CONTAINED, IncidentStatus::RESOLVED
    };
    return parseEnum(value, statuses, core::GuardErrorCode::UNKNOWN_ENUM_VALUE, "incident status");
}

ConsentType parseConsentType(const std::string& value) {
    static const std::vector<ConsentType> types = {
        ConsentType::DATA_COLLECTION, ConsentType::DATA_PROCESSING, ConsentType::DATA_SHARING,
        ConsentType::MARKETING, ConsentType::THIRD_PARTY, ConsentType::AUTOMATED_DECISIONS
    };
    return parseEnum(value, types, core::GuardErrorCode::UNKNOWN_ENUM_VALUE, "consent type");
}

std::string formatTimestamp(Timestamp ts) {
    auto time_t_val = std::chrono::system_clock::to_time_t(ts);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        ts.time_since_epoch()).count() % 1000;
    if (millis < 0) {
        millis += 1000;
    }

    std::tm tm{};
    gmtime_r(&time_t_val, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

Timestamp parseTimestamp(const std::string& value) {
    std::tm tm{};
    std::istringstream iss(value);
    iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        throw core::GuardError(core::GuardErrorCode::INVALID_ARGUMENT, "timestamp '" + value + "'");
    }

    int millis = 0;
    if (iss.peek() == '.') {
        iss.get();
        std::string digits;
        while (std::isdigit(iss.peek()) && digits.size() < 3) {
            digits += static_cast<char>(iss.get());
        }
        while (digits.size() < 3) {
            digits += '0';
        }
        millis = std::stoi(digits);
    }

    auto seconds = timegm(&tm);
    return std::chrono::system_clock::from_time_t(seconds) + std::chrono::milliseconds(millis);
}

int64_t toEpochSeconds(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
}

std::string generateId(const std::string& prefix, Timestamp ts) {
    thread_local std::mt19937 gen{std::random_device{}()};
    std::uniform_int_distribution<> dis(0, 15);

    const char* hex_chars = "0123456789abcdef";
    std::string suffix;
    suffix.reserve(8);
    for (int i = 0; i < 8; ++i) {
        suffix += hex_chars[dis(gen)];
    }

    return prefix + "_" + std::to_string(toEpochSeconds(ts)) + "_" + suffix;
}

}}
