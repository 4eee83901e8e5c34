#include "access_guard/storage/json_codec.hpp"

namespace access_guard {
namespace common {

namespace {

nlohmann::json optionalTimestamp(const std::optional<Timestamp>& ts) {
    return ts ? nlohmann::json(formatTimestamp(*ts)) : nlohmann::json();
}

std::optional<Timestamp> readOptionalTimestamp(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return parseTimestamp(it->get<std::string>());
}

std::optional<std::string> readOptionalString(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

}

void to_json(nlohmann::json& j, const UserAccess& user) {
    std::vector<std::string> permissions;
    for (auto p : user.permissions) {
        permissions.push_back(to_string(p));
    }

    j = {
        {"user_id", user.user_id},
        {"role", to_string(user.role)},
        {"permissions", permissions},
        {"security_level", to_string(user.security_level)},
        {"last_login", optionalTimestamp(user.last_login)},
        {"login_count", user.login_count},
        {"failed_attempts", user.failed_attempts},
        {"is_locked", user.is_locked},
        {"mfa_enabled", user.mfa_enabled},
        {"ip_whitelist", user.ip_whitelist},
        {"session_timeout_minutes", user.session_timeout_minutes}
    };
}

void from_json(const nlohmann::json& j, UserAccess& user) {
    user.user_id = j.at("user_id").get<std::string>();
    user.role = parseRole(j.at("role").get<std::string>());
    user.permissions.clear();
    for (const auto& p : j.at("permissions")) {
        user.permissions.insert(parsePermission(p.get<std::string>()));
    }
    user.security_level = parseSecurityLevel(j.at("security_level").get<std::string>());
    user.last_login = readOptionalTimestamp(j, "last_login");
    user.login_count = j.value("login_count", 0);
    user.failed_attempts = j.value("failed_attempts", 0);
    user.is_locked = j.value("is_locked", false);
    user.mfa_enabled = j.value("mfa_enabled", false);
    user.ip_whitelist = j.value("ip_whitelist", std::vector<std::string>{});
    user.session_timeout_minutes = j.value("session_timeout_minutes", 30);
}

void to_json(nlohmann::json& j, const Activity& activity) {
    j = {
        {"activity_id", activity.activity_id},
        {"sequence", activity.sequence},
        {"user_id", activity.user_id},
        {"activity_type", to_string(activity.activity_type)},
        {"resource_type", activity.resource_type},
        {"resource_id", activity.resource_id ? nlohmann::json(*activity.resource_id) : nlohmann::json()},
        {"ip_address", activity.ip_address},
        {"user_agent", activity.user_agent},
        {"timestamp", formatTimestamp(activity.timestamp)},
        {"metadata", activity.metadata},
        {"risk_score", activity.risk_score}
    };
}

void from_json(const nlohmann::json& j, Activity& activity) {
    activity.activity_id = j.at("activity_id").get<std::string>();
    activity.sequence = j.at("sequence").get<uint64_t>();
    activity.user_id = j.at("user_id").get<std::string>();
    activity.activity_type = parseActivityType(j.at("activity_type").get<std::string>());
    activity.resource_type = j.at("resource_type").get<std::string>();
    activity.resource_id = readOptionalString(j, "resource_id");
    activity.ip_address = j.value("ip_address", std::string("unknown"));
    activity.user_agent = j.value("user_agent", std::string("unknown"));
    activity.timestamp = parseTimestamp(j.at("timestamp").get<std::string>());
    activity.metadata = j.value("metadata", nlohmann::json::object());
    activity.risk_score = j.value("risk_score", 0);
}

void to_json(nlohmann::json& j, const SecurityAlert& alert) {
    j = {
        {"alert_id", alert.alert_id},
        {"alert_type", to_string(alert.alert_type)},
        {"severity", to_string(alert.severity)},
        {"title", alert.title},
        {"description", alert.description},
        {"user_id", alert.user_id},
        {"ip_address", alert.ip_address},
        {"timestamp", formatTimestamp(alert.timestamp)},
        {"status", to_string(alert.status)},
        {"evidence", alert.evidence},
        {"remediation_steps", alert.remediation_steps}
    };
}

void from_json(const nlohmann::json& j, SecurityAlert& alert) {
    alert.alert_id = j.at("alert_id").get<std::string>();
    alert.alert_type = parseAlertType(j.at("alert_type").get<std::string>());
    alert.severity = parseSeverity(j.at("severity").get<std::string>());
    alert.title = j.at("title").get<std::string>();
    alert.description = j.value("description", std::string());
    alert.user_id = j.at("user_id").get<std::string>();
    alert.ip_address = j.value("ip_address", std::string("unknown"));
    alert.timestamp = parseTimestamp(j.at("timestamp").get<std::string>());
    alert.status = parseAlertStatus(j.at("status").get<std::string>());
    alert.evidence = j.value("evidence", nlohmann::json::object());
    alert.remediation_steps = j.value("remediation_steps", std::vector<std::string>{});
}

void to_json(nlohmann::json& j, const BreachIncident& incident) {
    j = {
        {"incident_id", incident.incident_id},
        {"incident_type", incident.incident_type},
        {"severity", to_string(incident.severity)},
        {"description", incident.description},
        {"affected_users", incident.affected_users},
        {"affected_data", incident.affected_data},
        {"detected_at", formatTimestamp(incident.detected_at)},
        {"status", to_string(incident.status)},
        {"containment_actions", incident.containment_actions},
        {"notification_sent", incident.notification_sent},
        {"regulatory_reporting", incident.regulatory_reporting}
    };
}

void from_json(const nlohmann::json& j, BreachIncident& incident) {
    incident.incident_id = j.at("incident_id").get<std::string>();
    incident.incident_type = j.at("incident_type").get<std::string>();
    incident.severity = parseSeverity(j.at("severity").get<std::string>());
    incident.description = j.value("description", std::string());
    incident.affected_users = j.at("affected_users").get<std::vector<std::string>>();
    incident.affected_data = j.value("affected_data", std::vector<std::string>{});
    incident.detected_at = parseTimestamp(j.at("detected_at").get<std::string>());
    incident.status = parseIncidentStatus(j.at("status").get<std::string>());
    incident.containment_actions = j.value("containment_actions", std::vector<std::string>{});
    incident.notification_sent = j.value("notification_sent", false);
    incident.regulatory_reporting = j.value("regulatory_reporting", false);
}

void to_json(nlohmann::json& j, const ConsentRecord& record) {
    j = {
        {"consent_id", record.consent_id},
        {"user_id", record.user_id},
        {"consent_type", to_string(record.consent_type)},
        {"granted", record.granted},
        {"granted_at", formatTimestamp(record.granted_at)},
        {"expires_at", optionalTimestamp(record.expires_at)},
        {"version", record.version},
        {"ip_address", record.ip_address},
        {"user_agent", record.user_agent}
    };
}

void from_json(const nlohmann::json& j, ConsentRecord& record) {
    record.consent_id = j.at("consent_id").get<std::string>();
    record.user_id = j.at("user_id").get<std::string>();
    record.consent_type = parseConsentType(j.at("consent_type").get<std::string>());
    record.granted = j.at("granted").get<bool>();
    record.granted_at = parseTimestamp(j.at("granted_at").get<std::string>());
    record.expires_at = readOptionalTimestamp(j, "expires_at");
    record.version = j.value("version", std::string("1.0"));
    record.ip_address = j.value("ip_address", std::string("unknown"));
    record.user_agent = j.value("user_agent", std::string("unknown"));
}

}}
