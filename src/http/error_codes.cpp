#include "access_guard/http/error_codes.hpp"
#include "access_guard/core/error_codes.hpp"

namespace access_guard {
namespace http {

namespace {

constexpr ApiError API_ERRORS[] = {
    {ErrorCode::REQUEST_INVALID_ENDPOINT,    "REQUEST_INVALID_ENDPOINT",    404, "The requested endpoint does not exist"},
    {ErrorCode::REQUEST_METHOD_NOT_ALLOWED,  "REQUEST_METHOD_NOT_ALLOWED",  405, "HTTP method not allowed for this endpoint"},
    {ErrorCode::REQUEST_MISSING_PARAMETER,   "REQUEST_MISSING_PARAMETER",   400, "Required parameter is missing"},
    {ErrorCode::REQUEST_INVALID_PARAMETER,   "REQUEST_INVALID_PARAMETER",   400, "Invalid parameter value"},
    {ErrorCode::REQUEST_INVALID_BODY,        "REQUEST_INVALID_BODY",        400, "Request body is not valid JSON"},
    {ErrorCode::REQUEST_FORBIDDEN,           "REQUEST_FORBIDDEN",           403, "Caller lacks security_admin permission"},
    {ErrorCode::ALERT_NOT_FOUND,             "ALERT_NOT_FOUND",             404, "Security alert not found"},
    {ErrorCode::ALERT_INVALID_TRANSITION,    "ALERT_INVALID_TRANSITION",    409, "Alert status cannot move backwards"},
    {ErrorCode::INCIDENT_NOT_FOUND,          "INCIDENT_NOT_FOUND",          404, "Breach incident not found"},
    {ErrorCode::INCIDENT_INVALID_TRANSITION, "INCIDENT_INVALID_TRANSITION", 409, "Incident status cannot move backwards"},
    {ErrorCode::SERVICE_NOT_INITIALIZED,     "SERVICE_NOT_INITIALIZED",     503, "Access control service is not initialized"},
    {ErrorCode::SYSTEM_INTERNAL_ERROR,       "SYSTEM_INTERNAL_ERROR",       500, "Internal server error"},
};

}

const ApiError& ApiErrors::describe(ErrorCode code) {
    for (const auto& entry : API_ERRORS) {
        if (entry.code == code) {
            return entry;
        }
    }
    return API_ERRORS[static_cast<size_t>(ErrorCode::SYSTEM_INTERNAL_ERROR)];
}

ErrorCode ApiErrors::fromGuardError(core::GuardErrorCode guard_code, common::ErrorKind kind) {
    using G = core::GuardErrorCode;

    switch (guard_code) {
        case G::ALERT_NOT_FOUND: return ErrorCode::ALERT_NOT_FOUND;
        case G::ALERT_INVALID_TRANSITION: return ErrorCode::ALERT_INVALID_TRANSITION;
        case G::INCIDENT_NOT_FOUND: return ErrorCode::INCIDENT_NOT_FOUND;
        case G::INCIDENT_INVALID_TRANSITION: return ErrorCode::INCIDENT_INVALID_TRANSITION;
        case G::SERVICE_NOT_INITIALIZED: return ErrorCode::SERVICE_NOT_INITIALIZED;
        default: break;
    }

    return kind == common::ErrorKind::VALIDATION ? ErrorCode::REQUEST_INVALID_PARAMETER
                                                 : ErrorCode::SYSTEM_INTERNAL_ERROR;
}

}}
