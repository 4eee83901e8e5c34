#pragma once

#include "../common/types.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>

namespace access_guard {
namespace audit {

enum class AuditEventType {
    AUTHENTICATION,
    DATA_ACCESS,
    SECURITY_INCIDENT
};

enum class AuditCategory {
    AUTHENTICATION,
    DATA_ACCESS,
    SECURITY
};

enum class AuditSeverity {
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

struct AuditEvent {
    AuditEventType event_type = AuditEventType::DATA_ACCESS;
    AuditCategory category = AuditCategory::DATA_ACCESS;
    AuditSeverity severity = AuditSeverity::INFO;
    std::string description;
    std::string resource_type;
    std::optional<std::string> resource_id;
    std::string user_id;
    std::string ip_address;
    std::string user_agent;
    common::Timestamp timestamp;
    nlohmann::json metadata = nlohmann::json::object();
};

std::string to_string(AuditEventType type);
std::string to_string(AuditCategory category);
std::string to_string(AuditSeverity severity);

nlohmann::json toJson(const AuditEvent& event);

// Durable destination for audit events. Implementations may throw on
// write failure; callers treat delivery as fire-and-forget.
class AuditSink {
public:
    virtual ~AuditSink() = default;
    virtual void logEvent(const AuditEvent& event) = 0;
};

// Appends one JSON document per line.
class JsonlAuditSink : public AuditSink {
public:
    explicit JsonlAuditSink(const std::string& path);

    void logEvent(const AuditEvent& event) override;
    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::mutex mutex_;
    std::ofstream stream_;
};

// Mirrors audit events into the application log.
class LoggerAuditSink : public AuditSink {
public:
    void logEvent(const AuditEvent& event) override;
};

// Forwards events to an optional sink. Sink failures are logged and
// counted, never propagated to the caller.
class AuditDispatcher {
public:
    explicit AuditDispatcher(AuditSink* sink = nullptr) : sink_(sink) {}

    void dispatch(const AuditEvent& event);

    bool enabled() const { return sink_ != nullptr; }
    uint64_t failures() const { return failures_.load(); }

private:
    AuditSink* sink_;
    std::atomic<uint64_t> failures_{0};
};

}}
