#pragma once

#include "../common/error_framework.hpp"

namespace access_guard {

namespace core {
enum class GuardErrorCode;
}

namespace http {

enum class ErrorCode {
    REQUEST_INVALID_ENDPOINT,
    REQUEST_METHOD_NOT_ALLOWED,
    REQUEST_MISSING_PARAMETER,
    REQUEST_INVALID_PARAMETER,
    REQUEST_INVALID_BODY,
    REQUEST_FORBIDDEN,

    ALERT_NOT_FOUND,
    ALERT_INVALID_TRANSITION,
    INCIDENT_NOT_FOUND,
    INCIDENT_INVALID_TRANSITION,

    SERVICE_NOT_INITIALIZED,
    SYSTEM_INTERNAL_ERROR
};

struct ApiError {
    ErrorCode code;
    const char* name;
    int http_status;
    const char* message;
};

class ApiErrors {
public:
    static const ApiError& describe(ErrorCode code);

    // Dedicated codes for alerts, incidents and service state; other
    // validation errors are bad parameters, the rest internal.
    static ErrorCode fromGuardError(core::GuardErrorCode guard_code, common::ErrorKind kind);
};

}}
