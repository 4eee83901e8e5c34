#pragma once

#include "../common/error_framework.hpp"
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace access_guard {
namespace core {

enum class GuardErrorCode {
    UNKNOWN_ROLE = 100,
    UNKNOWN_PERMISSION = 101,
    UNKNOWN_ENUM_VALUE = 102,
    INVALID_ARGUMENT = 103,

    ALERT_NOT_FOUND = 200,
    ALERT_INVALID_TRANSITION = 201,

    INCIDENT_NOT_FOUND = 300,
    INCIDENT_INVALID_TRANSITION = 301,

    PERSISTENCE_FAILED = 500,
    AUDIT_SINK_FAILED = 501,
    SERVICE_NOT_INITIALIZED = 502
};

using GuardErrorCodeHelper = common::ErrorRegistry<GuardErrorCode>;

}
}

namespace access_guard {
namespace common {

template<>
inline const std::unordered_map<core::GuardErrorCode, ErrorInfo<core::GuardErrorCode>>&
ErrorRegistry<core::GuardErrorCode>::getInfoMap() {
    static const std::unordered_map<core::GuardErrorCode, ErrorInfo<core::GuardErrorCode>> map = {
        {core::GuardErrorCode::UNKNOWN_ROLE, {
            core::GuardErrorCode::UNKNOWN_ROLE,
            "UNKNOWN_ROLE",
            ErrorKind::VALIDATION,
            "Unknown role"
        }},
        {core::GuardErrorCode::UNKNOWN_PERMISSION, {
            core::GuardErrorCode::UNKNOWN_PERMISSION,
            "UNKNOWN_PERMISSION",
            ErrorKind::VALIDATION,
            "Unknown permission"
        }},
        {core::GuardErrorCode::UNKNOWN_ENUM_VALUE, {
            core::GuardErrorCode::UNKNOWN_ENUM_VALUE,
            "UNKNOWN_ENUM_VALUE",
            ErrorKind::VALIDATION,
            "Unknown enumeration value"
        }},
        {core::GuardErrorCode::INVALID_ARGUMENT, {
            core::GuardErrorCode::INVALID_ARGUMENT,
            "INVALID_ARGUMENT",
            ErrorKind::VALIDATION,
            "Invalid argument"
        }},
        {core::GuardErrorCode::ALERT_NOT_FOUND, {
            core::GuardErrorCode::ALERT_NOT_FOUND,
            "ALERT_NOT_FOUND",
            ErrorKind::NOT_FOUND,
            "Security alert not found"
        }},
        {core::GuardErrorCode::ALERT_INVALID_TRANSITION, {
            core::GuardErrorCode::ALERT_INVALID_TRANSITION,
            "ALERT_INVALID_TRANSITION",
            ErrorKind::CONFLICT,
            "Alert status transition not allowed"
        }},
        {core::GuardErrorCode::INCIDENT_NOT_FOUND, {
            core::GuardErrorCode::INCIDENT_NOT_FOUND,
            "INCIDENT_NOT_FOUND",
            ErrorKind::NOT_FOUND,
            "Breach incident not found"
        }},
        {core::GuardErrorCode::INCIDENT_INVALID_TRANSITION, {
            core::GuardErrorCode::INCIDENT_INVALID_TRANSITION,
            "INCIDENT_INVALID_TRANSITION",
            ErrorKind::CONFLICT,
            "Incident status transition not allowed"
        }},
        {core::GuardErrorCode::PERSISTENCE_FAILED, {
            core::GuardErrorCode::PERSISTENCE_FAILED,
            "PERSISTENCE_FAILED",
            ErrorKind::INTERNAL,
            "Persistence operation failed"
        }},
        {core::GuardErrorCode::AUDIT_SINK_FAILED, {
            core::GuardErrorCode::AUDIT_SINK_FAILED,
            "AUDIT_SINK_FAILED",
            ErrorKind::INTERNAL,
            "Audit sink write failed"
        }},
        {core::GuardErrorCode::SERVICE_NOT_INITIALIZED, {
            core::GuardErrorCode::SERVICE_NOT_INITIALIZED,
            "SERVICE_NOT_INITIALIZED",
            ErrorKind::INTERNAL,
            "Access control service not initialized"
        }}
    };
    return map;
}

}
}

namespace access_guard {
namespace core {

class GuardError : public std::runtime_error {
public:
    GuardError(GuardErrorCode code, const std::string& detail)
        : std::runtime_error(std::string(GuardErrorCodeHelper::getMessage(code)) +
                             (detail.empty() ? "" : ": " + detail)),
          code_(code) {}

    explicit GuardError(GuardErrorCode code) : GuardError(code, "") {}

    GuardErrorCode code() const { return code_; }

    common::ErrorKind kind() const { return GuardErrorCodeHelper::kind(code_); }

private:
    GuardErrorCode code_;
};

}
}
