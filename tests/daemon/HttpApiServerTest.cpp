#include <gtest/gtest.h>

#include "access_guard/daemon/http_server.hpp"
#include "../support/TestConfig.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>

using namespace access_guard;
using namespace access_guard::tests;

// ============================================================================
// Test Fixture
// ============================================================================

class HttpApiServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_.set(businessHours());
        config_ = testConfig();
        config_.rbac.bootstrap_admins = {"root"};

        service_ = std::make_unique<service::AccessControlService>(config_, clock_, service::ServiceCollaborators{});
        ASSERT_TRUE(service_->initialize(false));

        server_ = std::make_unique<daemon::HttpApiServer>("127.0.0.1", 0, *service_);
        ASSERT_TRUE(server_->start());
        ASSERT_GT(server_->boundPort(), 0);

        client_ = std::make_unique<httplib::Client>("127.0.0.1", server_->boundPort());
        client_->set_connection_timeout(2, 0);
        client_->set_read_timeout(5, 0);
    }

    void TearDown() override {
        client_.reset();
        server_->stop();
        service_->shutdown();
    }

    std::string raiseAlert() {
        return service_->createAlert(common::AlertType::SUSPICIOUS_ACTIVITY, common::Severity::MEDIUM,
                                     "Manual review", "operator flagged", "u1", "10.0.0.8").alert_id;
    }

    httplib::Result postStatus(const std::string& path, const std::string& body) {
        return client_->Post(path.c_str(), body, "application/json");
    }

    static nlohmann::json parse(const httplib::Result& res) {
        return nlohmann::json::parse(res->body);
    }

    common::GlobalConfig config_;
    common::ManualClock clock_;
    std::unique_ptr<service::AccessControlService> service_;
    std::unique_ptr<daemon::HttpApiServer> server_;
    std::unique_ptr<httplib::Client> client_;
};

// ============================================================================
// Read endpoints
// ============================================================================

TEST_F(HttpApiServerTest, Health_ReportsOk) {
    auto res = client_->Get("/api/v1/health");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);

    auto body = parse(res);
    EXPECT_TRUE(body["success"].get<bool>());
    EXPECT_EQ(body["data"]["status"], "ok");
}

TEST_F(HttpApiServerTest, Metrics_ReturnsServiceCounts) {
    auto res = client_->Get("/api/v1/metrics");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);

    auto body = parse(res);
    EXPECT_EQ(body["data"]["users"]["total"], 1);
    EXPECT_EQ(body["data"]["users"]["role_distribution"]["admin"], 1);
}

TEST_F(HttpApiServerTest, ListAlerts_FiltersByStatus) {
    raiseAlert();
    std::string second = raiseAlert();
    service_->alerts().updateStatus(second, common::AlertStatus::INVESTIGATING);

    auto all = client_->Get("/api/v1/alerts");
    ASSERT_TRUE(all);
    EXPECT_EQ(parse(all)["data"]["count"], 2);

    auto open = client_->Get("/api/v1/alerts?status=open");
    ASSERT_TRUE(open);
    EXPECT_EQ(parse(open)["data"]["count"], 1);
}

TEST_F(HttpApiServerTest, ListAlerts_UnknownStatus_BadRequest) {
    auto res = client_->Get("/api/v1/alerts?status=escalated");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
    EXPECT_EQ(parse(res)["error"]["code"], "REQUEST_INVALID_PARAMETER");
}

// ============================================================================
// Status updates
// ============================================================================

TEST_F(HttpApiServerTest, UpdateAlertStatus_Succeeds) {
    std::string id = raiseAlert();

    auto res = postStatus("/api/v1/alerts/" + id + "/status", R"({"status":"resolved","updated_by":"root"})");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(parse(res)["data"]["status"], "resolved");
    EXPECT_EQ(service_->alerts().find(id)->status, common::AlertStatus::RESOLVED);
}

TEST_F(HttpApiServerTest, UpdateAlertStatus_UnknownAlert_NotFound) {
    auto res = postStatus("/api/v1/alerts/alert_0_missing/status", R"({"status":"resolved","updated_by":"root"})");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);
    EXPECT_EQ(parse(res)["error"]["code"], "ALERT_NOT_FOUND");
}

TEST_F(HttpApiServerTest, UpdateAlertStatus_BackwardTransition_Conflict) {
    std::string id = raiseAlert();
    service_->alerts().updateStatus(id, common::AlertStatus::RESOLVED);

    auto res = postStatus("/api/v1/alerts/" + id + "/status", R"({"status":"open","updated_by":"root"})");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 409);
    EXPECT_EQ(parse(res)["error"]["code"], "ALERT_INVALID_TRANSITION");
}

TEST_F(HttpApiServerTest, UpdateAlertStatus_MalformedBody_BadRequest) {
    std::string id = raiseAlert();

    auto res = postStatus("/api/v1/alerts/" + id + "/status", "not json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
    EXPECT_EQ(parse(res)["error"]["code"], "REQUEST_INVALID_BODY");

    auto missing = postStatus("/api/v1/alerts/" + id + "/status", R"({"state":"resolved","updated_by":"root"})");
    ASSERT_TRUE(missing);
    EXPECT_EQ(missing->status, 400);
    EXPECT_EQ(parse(missing)["error"]["code"], "REQUEST_MISSING_PARAMETER");
}

TEST_F(HttpApiServerTest, UpdateAlertStatus_WithoutCaller_BadRequest) {
    std::string id = raiseAlert();

    auto res = postStatus("/api/v1/alerts/" + id + "/status", R"({"status":"false_positive"})");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
    EXPECT_EQ(parse(res)["error"]["code"], "REQUEST_MISSING_PARAMETER");
    EXPECT_EQ(parse(res)["error"]["details"]["parameter"], "updated_by");
    EXPECT_EQ(service_->alerts().find(id)->status, common::AlertStatus::OPEN);
}

TEST_F(HttpApiServerTest, UpdateAlertStatus_CallerWithoutSecurityAdmin_Forbidden) {
    std::string id = raiseAlert();
    ASSERT_TRUE(service_->users().assignRole("analyst1", common::Role::ANALYST, "root"));

    auto res = postStatus("/api/v1/alerts/" + id + "/status",
                          R"({"status":"false_positive","updated_by":"analyst1"})");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 403);
    EXPECT_EQ(parse(res)["error"]["code"], "REQUEST_FORBIDDEN");
    EXPECT_EQ(service_->alerts().find(id)->status, common::AlertStatus::OPEN);

    auto unknown = postStatus("/api/v1/alerts/" + id + "/status",
                              R"({"status":"false_positive","updated_by":"nobody"})");
    ASSERT_TRUE(unknown);
    EXPECT_EQ(unknown->status, 403);
}

TEST_F(HttpApiServerTest, UpdateIncidentStatus_CallerWithoutSecurityAdmin_Forbidden) {
    auto res = postStatus("/api/v1/incidents/breach_0_missing/status",
                          R"({"status":"contained","updated_by":"nobody"})");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 403);
}

TEST_F(HttpApiServerTest, ListAlerts_InvalidUtf8Address_StillServed) {
    service_->createAlert(common::AlertType::SUSPICIOUS_ACTIVITY, common::Severity::MEDIUM,
                          "Manual review", "operator flagged", "u1", "10.0.0.\xff");

    auto res = client_->Get("/api/v1/alerts");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(parse(res)["data"]["count"], 1);
}

TEST_F(HttpApiServerTest, UpdateIncidentStatus_UnknownIncident_NotFound) {
    auto res = postStatus("/api/v1/incidents/breach_0_missing/status", R"({"status":"contained","updated_by":"root"})");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);
    EXPECT_EQ(parse(res)["error"]["code"], "INCIDENT_NOT_FOUND");
}

TEST_F(HttpApiServerTest, UnknownEndpoint_NotFound) {
    auto res = client_->Get("/api/v1/nothing-here");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);
    EXPECT_EQ(parse(res)["error"]["code"], "REQUEST_INVALID_ENDPOINT");
}
