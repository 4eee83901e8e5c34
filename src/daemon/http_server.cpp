#include "access_guard/daemon/http_server.hpp"
#include "access_guard/http/response.hpp"
#include "access_guard/core/error_codes.hpp"
#include "access_guard/common/error_framework.hpp"
#include "access_guard/common/logger.hpp"
#include "access_guard/common/constants.hpp"
#include "access_guard/storage/json_codec.hpp"
#include <chrono>

namespace access_guard {
namespace daemon {

HttpApiServer::HttpApiServer(const std::string& host, uint16_t port, service::AccessControlService& service)
    : host_(host), port_(port), service_(service) {
    server_ = std::make_unique<httplib::Server>();
}

HttpApiServer::~HttpApiServer() {
    stop();
}

bool HttpApiServer::start() {
    if (running_) {
        return true;
    }

    setupRoutes();

    server_->set_read_timeout(10, 0);
    server_->set_write_timeout(10, 0);
    server_->set_idle_interval(1, 0);
    server_->set_keep_alive_max_count(100);

    if (port_ == 0) {
        int port = server_->bind_to_any_port(host_);
        if (port <= 0) {
            common::Logger::instance().error("[HTTP] Failed to bind | host={} | port=any", host_);
            return false;
        }
        bound_port_ = static_cast<uint16_t>(port);
    } else {
        if (!server_->bind_to_port(host_, port_)) {
            common::Logger::instance().error("[HTTP] Failed to bind | host={} | port={}", host_, port_);
            return false;
        }
        bound_port_ = port_;
    }

    running_ = true;

    server_thread_ = std::thread([this]() {
        common::Logger::instance().info("[HTTP] Server starting | host={} | port={}", host_, bound_port_);

        if (!server_->listen_after_bind()) {
            common::Logger::instance().error("[HTTP] Listen failed | host={} | port={}", host_, bound_port_);
            running_ = false;
        }
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    if (running_) {
        common::Logger::instance().info("[HTTP] Server started | host={} | port={}", host_, bound_port_);
    }

    return running_;
}

void HttpApiServer::stop() {
    if (!running_ && !server_thread_.joinable()) {
        return;
    }

    running_ = false;

    if (server_) {
        server_->stop();
    }

    if (server_thread_.joinable()) {
        server_thread_.join();
    }

    common::Logger::instance().info("[HTTP] Server stopped");
}

void HttpApiServer::setupRoutes() {
    server_->Get("/api/v1/health", [this](const auto& req, auto& res) {
        handleHealth(req, res);
    });

    server_->Get("/api/v1/metrics", [this](const auto& req, auto& res) {
        handleMetrics(req, res);
    });

    server_->Get("/api/v1/alerts", [this](const auto& req, auto& res) {
        handleListAlerts(req, res);
    });

    server_->Post(R"(/api/v1/alerts/([a-zA-Z0-9_]+)/status)", [this](const auto& req, auto& res) {
        handleUpdateAlertStatus(req, res);
    });

    server_->Get("/api/v1/incidents", [this](const auto& req, auto& res) {
        handleListIncidents(req, res);
    });

    server_->Post(R"(/api/v1/incidents/([a-zA-Z0-9_]+)/status)", [this](const auto& req, auto& res) {
        handleUpdateIncidentStatus(req, res);
    });

    server_->set_error_handler([](const auto& req, auto& res) {
        if (!res.body.empty()) {
            return;
        }

        if (res.status == 404) {
            http::HttpResponse::sendError(res, http::ErrorCode::REQUEST_INVALID_ENDPOINT);
        } else if (res.status == 405) {
            http::HttpResponse::sendError(res, http::ErrorCode::REQUEST_METHOD_NOT_ALLOWED);
        }
    });
}

void HttpApiServer::sendInternalError(httplib::Response& res, const std::string& endpoint, const std::exception& e) {
    common::ErrorContext ctx;
    ctx.component = "HTTP";
    ctx.details["exception"] = e.what();
    ctx.details["endpoint"] = endpoint;

    nlohmann::json details;
    details["exception"] = e.what();
    http::HttpResponse::sendError(res, http::ErrorCode::SYSTEM_INTERNAL_ERROR, details);
    common::Logger::instance().error("[HTTP] Request failed | {}", common::formatContext(ctx));
}

void HttpApiServer::handleHealth(const httplib::Request& req, httplib::Response& res) {
    nlohmann::json response;
    response["status"] = service_.isInitialized() ? "ok" : "starting";
    response["version"] = constants::version::VERSION;
    response["dropped_events"] = service_.activityQueue().dropped();
    http::HttpResponse::sendSuccess(res, response);
}

void HttpApiServer::handleMetrics(const httplib::Request& req, httplib::Response& res) {
    try {
        if (!service_.isInitialized()) {
            http::HttpResponse::sendError(res, http::ErrorCode::SERVICE_NOT_INITIALIZED);
            return;
        }
        http::HttpResponse::sendSuccess(res, nlohmann::json(service_.metrics()));
    } catch (const std::exception& e) {
        sendInternalError(res, "/api/v1/metrics", e);
    }
}

void HttpApiServer::handleListAlerts(const httplib::Request& req, httplib::Response& res) {
    try {
        std::vector<common::SecurityAlert> alerts;

        if (req.has_param("status")) {
            std::string status_name = req.get_param_value("status");
            try {
                alerts = service_.alerts().alertsByStatus(common::parseAlertStatus(status_name));
            } catch (const core::GuardError& e) {
                nlohmann::json details;
                details["status"] = status_name;
                http::HttpResponse::sendError(res, http::ErrorCode::REQUEST_INVALID_PARAMETER, e.what(), details);
                return;
            }
        } else {
            alerts = service_.alerts().alerts();
        }

        nlohmann::json data;
        data["count"] = alerts.size();
        data["alerts"] = alerts;
        http::HttpResponse::sendSuccess(res, data);

        common::Logger::instance().debug("[HTTP] List alerts | count={}", alerts.size());
    } catch (const std::exception& e) {
        sendInternalError(res, "/api/v1/alerts", e);
    }
}

std::optional<HttpApiServer::StatusUpdate> HttpApiServer::readStatusUpdate(const httplib::Request& req,
                                                                          httplib::Response& res) {
    nlohmann::json body = nlohmann::json::parse(req.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        http::HttpResponse::sendError(res, http::ErrorCode::REQUEST_INVALID_BODY);
        return std::nullopt;
    }

    StatusUpdate update;
    for (auto [field, target] : {std::pair<const char*, std::string*>{"status", &update.status},
                                 std::pair<const char*, std::string*>{"updated_by", &update.updated_by}}) {
        auto it = body.find(field);
        if (it == body.end() || !it->is_string() || it->get<std::string>().empty()) {
            http::HttpResponse::sendError(res, http::ErrorCode::REQUEST_MISSING_PARAMETER, {{"parameter", field}});
            return std::nullopt;
        }
        *target = it->get<std::string>();
    }

    if (!service_.checkPermission(update.updated_by, common::Permission::SECURITY_ADMIN)) {
        http::HttpResponse::sendError(res, http::ErrorCode::REQUEST_FORBIDDEN, {{"user_id", update.updated_by}});
        common::Logger::instance().warn("[HTTP] Status update forbidden | user={} | path={}", update.updated_by, req.path);
        return std::nullopt;
    }
    return update;
}

void HttpApiServer::handleUpdateAlertStatus(const httplib::Request& req, httplib::Response& res) {
    std::string alert_id = req.matches[1];

    try {
        auto update = readStatusUpdate(req, res);
        if (!update) {
            return;
        }

        auto alert = service_.alerts().updateStatus(alert_id, common::parseAlertStatus(update->status));
        http::HttpResponse::sendSuccess(res, nlohmann::json(alert));

        common::Logger::instance().info("[HTTP] Alert status updated | id={} | status={} | by={}",
                                        alert_id, update->status, update->updated_by);
    } catch (const core::GuardError& e) {
        http::HttpResponse::sendGuardError(res, e);
        common::Logger::instance().warn("[HTTP] Alert status rejected | id={} | error={}", alert_id, e.what());
    } catch (const std::exception& e) {
        sendInternalError(res, "/api/v1/alerts/:id/status", e);
    }
}

void HttpApiServer::handleListIncidents(const httplib::Request& req, httplib::Response& res) {
    try {
        auto incidents = service_.breach().incidents();

        nlohmann::json data;
        data["count"] = incidents.size();
        data["incidents"] = incidents;
        http::HttpResponse::sendSuccess(res, data);
    } catch (const std::exception& e) {
        sendInternalError(res, "/api/v1/incidents", e);
    }
}

void HttpApiServer::handleUpdateIncidentStatus(const httplib::Request& req, httplib::Response& res) {
    std::string incident_id = req.matches[1];

    try {
        auto update = readStatusUpdate(req, res);
        if (!update) {
            return;
        }

        auto incident = service_.breach().updateIncidentStatus(incident_id,
                                                               common::parseIncidentStatus(update->status));
        http::HttpResponse::sendSuccess(res, nlohmann::json(incident));

        common::Logger::instance().info("[HTTP] Incident status updated | id={} | status={} | by={}",
                                        incident_id, update->status, update->updated_by);
    } catch (const core::GuardError& e) {
        http::HttpResponse::sendGuardError(res, e);
        common::Logger::instance().warn("[HTTP] Incident status rejected | id={} | error={}", incident_id, e.what());
    } catch (const std::exception& e) {
        sendInternalError(res, "/api/v1/incidents/:id/status", e);
    }
}

}}
