#pragma once

#include "../service/access_control_service.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace access_guard {
namespace daemon {

// Read-mostly status API over the running service.
class HttpApiServer {
public:
    // Port 0 binds an ephemeral port; boundPort() reports it after start().
    HttpApiServer(const std::string& host, uint16_t port, service::AccessControlService& service);
    ~HttpApiServer();

    bool start();
    void stop();
    bool isRunning() const { return running_; }
    uint16_t boundPort() const { return bound_port_; }

private:
    std::string host_;
    uint16_t port_;
    uint16_t bound_port_ = 0;
    service::AccessControlService& service_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
    std::atomic<bool> running_{false};

    void setupRoutes();
    void handleHealth(const httplib::Request& req, httplib::Response& res);
    void handleMetrics(const httplib::Request& req, httplib::Response& res);
    void handleListAlerts(const httplib::Request& req, httplib::Response& res);
    void handleUpdateAlertStatus(const httplib::Request& req, httplib::Response& res);
    void handleListIncidents(const httplib::Request& req, httplib::Response& res);
    void handleUpdateIncidentStatus(const httplib::Request& req, httplib::Response& res);

    struct StatusUpdate {
        std::string status;
        std::string updated_by;
    };

    // Parses {"status", "updated_by"} and checks that the caller holds
    // security_admin. On failure the error response is already written.
    std::optional<StatusUpdate> readStatusUpdate(const httplib::Request& req, httplib::Response& res);
    void sendInternalError(httplib::Response& res, const std::string& endpoint, const std::exception& e);
};

}}
