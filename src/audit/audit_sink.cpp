#include "access_guard/audit/audit_sink.hpp"
#include "access_guard/core/error_codes.hpp"
#include "access_guard/common/logger.hpp"
#include <filesystem>

namespace access_guard {
namespace audit {

std::string to_string(AuditEventType type) {
    switch (type) {
        case AuditEventType::AUTHENTICATION: return "authentication";
        case AuditEventType::DATA_ACCESS: return "data_access";
        case AuditEventType::SECURITY_INCIDENT: return "security_incident";
    }
    return "unknown";
}

std::string to_string(AuditCategory category) {
    switch (category) {
        case AuditCategory::AUTHENTICATION: return "authentication";
        case AuditCategory::DATA_ACCESS: return "data_access";
        case AuditCategory::SECURITY: return "security";
    }
    return "unknown";
}

std::string to_string(AuditSeverity severity) {
    switch (severity) {
        case AuditSeverity::INFO: return "info";
        case AuditSeverity::WARNING: return "warning";
        case AuditSeverity::ERROR: return "error";
        case AuditSeverity::CRITICAL: return "critical";
    }
    return "unknown";
}

nlohmann::json toJson(const AuditEvent& event) {
    nlohmann::json j;
    j["event_type"] = to_string(event.event_type);
    j["category"] = to_string(event.category);
    j["severity"] = to_string(event.severity);
    j["description"] = event.description;
    j["resource_type"] = event.resource_type;
    j["resource_id"] = event.resource_id ? nlohmann::json(*event.resource_id) : nlohmann::json();
    j["user_id"] = event.user_id;
    j["ip_address"] = event.ip_address;
    j["user_agent"] = event.user_agent;
    j["timestamp"] = common::formatTimestamp(event.timestamp);
    j["metadata"] = event.metadata;
    return j;
}

JsonlAuditSink::JsonlAuditSink(const std::string& path) : path_(path) {
    std::filesystem::path parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw core::GuardError(core::GuardErrorCode::AUDIT_SINK_FAILED,
                                   "cannot create " + parent.string() + ": " + ec.message());
        }
    }

    stream_.open(path_, std::ios::out | std::ios::app);
    if (!stream_) {
        throw core::GuardError(core::GuardErrorCode::AUDIT_SINK_FAILED, "cannot open " + path_);
    }

    common::Logger::instance().debug("[Audit] Sink opened | path={}", path_);
}

void JsonlAuditSink::logEvent(const AuditEvent& event) {
    std::string line = toJson(event).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

    std::lock_guard<std::mutex> lock(mutex_);
    stream_ << line << '\n';
    stream_.flush();

    if (!stream_) {
        stream_.clear();
        throw core::GuardError(core::GuardErrorCode::AUDIT_SINK_FAILED, "write to " + path_);
    }
}

void LoggerAuditSink::logEvent(const AuditEvent& event) {
    auto& logger = common::Logger::instance();
    std::string resource = event.resource_id
        ? event.resource_type + "/" + *event.resource_id
        : event.resource_type;

    switch (event.severity) {
        case AuditSeverity::INFO:
            logger.debug("[Audit] {} | user={} | resource={}", event.description, event.user_id, resource);
            break;
        case AuditSeverity::WARNING:
            logger.warn("[Audit] {} | user={} | resource={}", event.description, event.user_id, resource);
            break;
        case AuditSeverity::ERROR:
        case AuditSeverity::CRITICAL:
            logger.error("[Audit] {} | user={} | resource={} | severity={}",
                         event.description, event.user_id, resource, to_string(event.severity));
            break;
    }
}

void AuditDispatcher::dispatch(const AuditEvent& event) {
    if (!sink_) {
        return;
    }

    try {
        sink_->logEvent(event);
    } catch (const std::exception& e) {
        uint64_t total = ++failures_;
        common::Logger::instance().error("[Audit] Event delivery failed | type={} | user={} | failures={} | error={}",
                                         to_string(event.event_type), event.user_id, total, e.what());
    }
}

}}
