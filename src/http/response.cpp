#include "access_guard/http/response.hpp"
#include "access_guard/core/error_codes.hpp"

namespace access_guard {
namespace http {

namespace {

void writeEnvelope(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(body.dump(2, ' ', false, nlohmann::json::error_handler_t::replace), "application/json");
}

}

void HttpResponse::sendSuccess(httplib::Response& res, const nlohmann::json& data) {
    writeEnvelope(res, 200, {{"success", true}, {"data", data}});
}

void HttpResponse::sendError(httplib::Response& res, ErrorCode code, const nlohmann::json& details) {
    sendError(res, code, ApiErrors::describe(code).message, details);
}

void HttpResponse::sendError(httplib::Response& res, ErrorCode code,
                             const std::string& message, const nlohmann::json& details) {
    const ApiError& api_error = ApiErrors::describe(code);

    nlohmann::json error = {{"code", api_error.name}, {"message", message}};
    if (!details.is_null()) {
        error["details"] = details;
    }
    writeEnvelope(res, api_error.http_status, {{"success", false}, {"error", error}});
}

void HttpResponse::sendGuardError(httplib::Response& res, const core::GuardError& error) {
    nlohmann::json details = {
        {"guard_code", core::GuardErrorCodeHelper::toString(error.code())},
        {"kind", common::to_string(error.kind())}
    };
    sendError(res, ApiErrors::fromGuardError(error.code(), error.kind()), error.what(), details);
}

}}
