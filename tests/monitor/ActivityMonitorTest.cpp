#include <gtest/gtest.h>

#include "access_guard/service/access_control_service.hpp"
#include "../support/TestConfig.hpp"

using namespace access_guard;
using namespace access_guard::tests;
using common::ActivityType;
using common::AlertType;

class ActivityMonitorTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_.set(businessHours());
        config_ = testConfig();
    }

    void start() {
        service_ = std::make_unique<service::AccessControlService>(config_, clock_, service::ServiceCollaborators{});
        ASSERT_TRUE(service_->initialize(false));
    }

    std::vector<common::SecurityAlert> alertsOf(AlertType type) {
        std::vector<common::SecurityAlert> matching;
        for (const auto& alert : service_->alerts().alerts()) {
            if (alert.alert_type == type) {
                matching.push_back(alert);
            }
        }
        return matching;
    }

    common::GlobalConfig config_;
    common::ManualClock clock_;
    std::unique_ptr<service::AccessControlService> service_;
};

TEST_F(ActivityMonitorTest, OrdinaryActivity_NoAlert) {
    start();
    service_->logActivity("u1", ActivityType::DATA_ACCESS, "report");

    EXPECT_TRUE(service_->runMonitorOnce());
    EXPECT_TRUE(service_->alerts().alerts().empty());
    EXPECT_EQ(service_->activityQueue().size(), 0u);
}

TEST_F(ActivityMonitorTest, AfterHours_RaisesUnusualActivity) {
    start();
    clock_.set(afterHours());
    auto activity = service_->logActivity("u1", ActivityType::DATA_ACCESS, "report");

    service_->runMonitorOnce();

    auto unusual = alertsOf(AlertType::UNUSUAL_ACTIVITY);
    ASSERT_EQ(unusual.size(), 1u);
    EXPECT_EQ(unusual[0].severity, common::Severity::MEDIUM);
    EXPECT_EQ(unusual[0].evidence["activity_id"], activity.activity_id);
    EXPECT_EQ(unusual[0].evidence["reasons"], nlohmann::json::array({"outside_business_hours"}));
}

TEST_F(ActivityMonitorTest, SuspiciousIp_ReasonListed) {
    start();
    service_->logActivity("u1", ActivityType::DATA_ACCESS, "report", std::nullopt, {{"ip_address", "10.0.0.5"}});

    service_->runMonitorOnce();

    auto unusual = alertsOf(AlertType::UNUSUAL_ACTIVITY);
    ASSERT_EQ(unusual.size(), 1u);
    EXPECT_EQ(unusual[0].ip_address, "10.0.0.5");
    EXPECT_EQ(unusual[0].evidence["reasons"], nlohmann::json::array({"suspicious_ip"}));
}

TEST_F(ActivityMonitorTest, HighRiskScore_ReasonListed) {
    start();
    service_->logActivity("root", ActivityType::ROLE_CHANGE, "user", std::string("u1"));

    service_->runMonitorOnce();

    auto unusual = alertsOf(AlertType::UNUSUAL_ACTIVITY);
    ASSERT_EQ(unusual.size(), 1u);
    EXPECT_EQ(unusual[0].evidence["reasons"], nlohmann::json::array({"high_risk_score"}));
    EXPECT_EQ(unusual[0].evidence["risk_score"], 8);
}

TEST_F(ActivityMonitorTest, RapidActivity_StrictlyAboveThreshold) {
    start();
    for (int i = 0; i < config_.monitor.rapid_threshold; ++i) {
        service_->logActivity("u1", ActivityType::DATA_ACCESS, "report");
    }
    service_->runMonitorOnce();
    EXPECT_TRUE(alertsOf(AlertType::RAPID_ACTIVITY).empty());

    service_->logActivity("u1", ActivityType::DATA_ACCESS, "report");
    service_->runMonitorOnce();

    auto rapid = alertsOf(AlertType::RAPID_ACTIVITY);
    ASSERT_EQ(rapid.size(), 1u);
    EXPECT_EQ(rapid[0].severity, common::Severity::HIGH);
    EXPECT_EQ(rapid[0].user_id, "u1");
}

TEST_F(ActivityMonitorTest, RapidActivity_OlderEntriesOutsideWindowIgnored) {
    start();
    for (int i = 0; i < config_.monitor.rapid_threshold; ++i) {
        service_->logActivity("u1", ActivityType::DATA_ACCESS, "report");
    }
    service_->runMonitorOnce();

    clock_.advance(std::chrono::seconds(config_.monitor.rapid_window_seconds + 1));
    service_->logActivity("u1", ActivityType::DATA_ACCESS, "report");
    service_->runMonitorOnce();

    EXPECT_TRUE(alertsOf(AlertType::RAPID_ACTIVITY).empty());
}

TEST_F(ActivityMonitorTest, QueueOverflow_CountedInMetrics) {
    config_.monitor.queue_capacity = 3;
    start();
    for (int i = 0; i < 5; ++i) {
        service_->logActivity("u" + std::to_string(i), ActivityType::DATA_ACCESS, "report");
    }

    EXPECT_EQ(service_->metrics().dropped_events, 2u);
    EXPECT_EQ(service_->activityLog().size(), 5u);
}

TEST_F(ActivityMonitorTest, Retention_PrunesOldHistory) {
    start();
    service_->logActivity("u1", ActivityType::DATA_ACCESS, "report");
    service_->runMonitorOnce();

    clock_.advance(std::chrono::hours(config_.monitor.activity_retention_hours + 1));
    service_->runMonitorOnce();

    EXPECT_EQ(service_->activityLog().size(), 0u);
}
