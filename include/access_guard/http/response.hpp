#pragma once

#include "error_codes.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <string>

namespace access_guard {

namespace core {
class GuardError;
}

namespace http {

// Every body is an envelope: {"success": true, "data": ...} or
// {"success": false, "error": {"code", "message", "details"?}}.
class HttpResponse {
public:
    static void sendSuccess(httplib::Response& res, const nlohmann::json& data);

    static void sendError(httplib::Response& res, ErrorCode code,
                          const nlohmann::json& details = nlohmann::json());

    static void sendError(httplib::Response& res, ErrorCode code,
                          const std::string& message, const nlohmann::json& details);

    static void sendGuardError(httplib::Response& res, const core::GuardError& error);
};

}}
