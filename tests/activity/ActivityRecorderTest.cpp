#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "access_guard/activity/activity_recorder.hpp"
#include "../mocks/MockAuditSink.hpp"
#include "../support/TestConfig.hpp"
#include <cstdint>

using namespace access_guard;
using namespace access_guard::tests;
using common::ActivityType;
using ::testing::_;
using ::testing::AllOf;
using ::testing::Field;
using ::testing::Throw;

// ============================================================================
// Test Fixture
// ============================================================================

class ActivityRecorderTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = testConfig().monitor;
        clock_.set(businessHours());
        recorder_ = std::make_unique<activity::ActivityRecorder>(config_, clock_, ip_, log_, queue_, audit_);
    }

    common::MonitorConfig config_;
    common::ManualClock clock_;
    activity::PrivateRangeHeuristic ip_;
    activity::ActivityLog log_;
    activity::ActivityQueue queue_{100};
    ::testing::NiceMock<MockAuditSink> sink_;
    audit::AuditDispatcher audit_{&sink_};
    std::unique_ptr<activity::ActivityRecorder> recorder_;
};

// ============================================================================
// Risk scoring
// ============================================================================

TEST_F(ActivityRecorderTest, RiskScore_BaseOnlyDuringBusinessHours) {
    auto activity = recorder_->logActivity("u1", ActivityType::DATA_ACCESS, "report");
    EXPECT_EQ(activity.risk_score, 2);
}

TEST_F(ActivityRecorderTest, RiskScore_FailedAttemptsAddTwoEach) {
    auto activity = recorder_->logActivity("u1", ActivityType::LOGIN, "authentication", std::nullopt,
                                           {{"failed_attempts", 3}});
    EXPECT_EQ(activity.risk_score, 1 + 6);
}

TEST_F(ActivityRecorderTest, RiskScore_SuspiciousIpAddsFive) {
    auto activity = recorder_->logActivity("u1", ActivityType::DATA_ACCESS, "report", std::nullopt,
                                           {{"ip_address", "192.168.1.20"}});
    EXPECT_EQ(activity.risk_score, 2 + 5);
}

TEST_F(ActivityRecorderTest, RiskScore_OutsideBusinessHoursAddsThree) {
    clock_.set(afterHours());
    auto activity = recorder_->logActivity("u1", ActivityType::ACCOUNT_CREATION, "user");
    EXPECT_EQ(activity.risk_score, 3 + 3);
}

TEST_F(ActivityRecorderTest, RiskScore_ClampedToTen) {
    clock_.set(afterHours());
    auto activity = recorder_->logActivity("u1", ActivityType::SECURITY_VIOLATION, "security", std::nullopt,
                                           {{"ip_address", "10.1.2.3"}, {"failed_attempts", 4}});
    EXPECT_EQ(activity.risk_score, 10);
}

TEST_F(ActivityRecorderTest, RiskScore_HugeFailedAttemptsSaturate) {
    EXPECT_EQ(recorder_->riskScore(ActivityType::LOGIN, {{"failed_attempts", 1073741824}},
                                   "8.8.8.8", businessHours()), 10);
    EXPECT_EQ(recorder_->riskScore(ActivityType::LOGIN, {{"failed_attempts", 4294967297LL}},
                                   "8.8.8.8", businessHours()), 10);
    EXPECT_EQ(recorder_->riskScore(ActivityType::LOGIN, {{"failed_attempts", UINT64_MAX}},
                                   "8.8.8.8", businessHours()), 10);
}

TEST_F(ActivityRecorderTest, RiskScore_NegativeOrNonIntegerAttemptsIgnored) {
    EXPECT_EQ(recorder_->riskScore(ActivityType::LOGIN, {{"failed_attempts", -5}},
                                   "8.8.8.8", businessHours()), 1);
    EXPECT_EQ(recorder_->riskScore(ActivityType::LOGIN, {{"failed_attempts", 2.5}},
                                   "8.8.8.8", businessHours()), 1);
    EXPECT_EQ(recorder_->riskScore(ActivityType::LOGIN, {{"failed_attempts", "3"}},
                                   "8.8.8.8", businessHours()), 1);
}

TEST_F(ActivityRecorderTest, RiskScore_AlwaysWithinZeroToTen) {
    const std::vector<nlohmann::json> attempts = {
        nullptr, 0, 1, 4, -1, INT32_MIN, INT32_MAX, INT64_MIN, INT64_MAX,
        1073741824, UINT64_MAX, 1e300, -1e300, "many", nlohmann::json::array({1})
    };
    const std::vector<std::string> ips = {"8.8.8.8", "192.168.0.1", "10.0.0.1", "172.16.4.4", "unknown", ""};

    for (auto type : common::allActivityTypes()) {
        for (const auto& value : attempts) {
            nlohmann::json metadata = {{"failed_attempts", value}};
            for (const auto& ip : ips) {
                for (int hour = 0; hour < 24; ++hour) {
                    int score = recorder_->riskScore(type, metadata, ip,
                                                     common::ManualClock::utc(2024, 3, 12, hour));
                    EXPECT_GE(score, 0) << common::to_string(type) << " " << value.dump() << " " << ip << " " << hour;
                    EXPECT_LE(score, 10) << common::to_string(type) << " " << value.dump() << " " << ip << " " << hour;
                }
            }
        }
    }

    EXPECT_EQ(recorder_->riskScore(ActivityType::DATA_ACCESS, nlohmann::json::array(), "8.8.8.8", businessHours()), 2);
}

TEST_F(ActivityRecorderTest, BusinessHours_BoundariesAreInclusive) {
    EXPECT_FALSE(recorder_->isOutsideBusinessHours(common::ManualClock::utc(2024, 3, 12, 6)));
    EXPECT_FALSE(recorder_->isOutsideBusinessHours(common::ManualClock::utc(2024, 3, 12, 22, 59)));
    EXPECT_TRUE(recorder_->isOutsideBusinessHours(common::ManualClock::utc(2024, 3, 12, 5, 59)));
    EXPECT_TRUE(recorder_->isOutsideBusinessHours(common::ManualClock::utc(2024, 3, 12, 23)));
}

// ============================================================================
// Fan-out
// ============================================================================

TEST_F(ActivityRecorderTest, LogActivity_AppendsQueuesAndStamps) {
    auto first = recorder_->logActivity("u1", ActivityType::LOGOUT, "authentication");
    auto second = recorder_->logActivity("u2", ActivityType::DATA_ACCESS, "bank_account", std::string("acc-1"));

    EXPECT_EQ(log_.size(), 2u);
    EXPECT_EQ(queue_.size(), 2u);
    EXPECT_EQ(second.sequence, first.sequence + 1);
    EXPECT_EQ(first.timestamp, clock_.now());
    EXPECT_EQ(first.ip_address, "unknown");
    EXPECT_EQ(first.user_agent, "unknown");
    ASSERT_TRUE(second.resource_id.has_value());
    EXPECT_EQ(*second.resource_id, "acc-1");
}

TEST_F(ActivityRecorderTest, LogActivity_NonObjectMetadataReplaced) {
    auto activity = recorder_->logActivity("u1", ActivityType::DATA_ACCESS, "report", std::nullopt,
                                           nlohmann::json::array({1, 2}));
    EXPECT_TRUE(activity.metadata.is_object());
}

TEST_F(ActivityRecorderTest, ResumeSequence_ContinuesAfterRestoredHistory) {
    recorder_->resumeSequence(100);
    auto activity = recorder_->logActivity("u1", ActivityType::DATA_ACCESS, "report");
    EXPECT_EQ(activity.sequence, 101u);

    recorder_->resumeSequence(50);
    EXPECT_EQ(recorder_->logActivity("u1", ActivityType::DATA_ACCESS, "report").sequence, 102u);
}

TEST_F(ActivityRecorderTest, Audit_LoginMapsToAuthentication) {
    EXPECT_CALL(sink_, logEvent(AllOf(
        Field(&audit::AuditEvent::event_type, audit::AuditEventType::AUTHENTICATION),
        Field(&audit::AuditEvent::category, audit::AuditCategory::AUTHENTICATION),
        Field(&audit::AuditEvent::severity, audit::AuditSeverity::INFO),
        Field(&audit::AuditEvent::user_id, "u1")))).Times(1);

    recorder_->logActivity("u1", ActivityType::LOGIN, "authentication");
}

TEST_F(ActivityRecorderTest, Audit_ViolationIsSecurityIncidentWithErrorSeverity) {
    EXPECT_CALL(sink_, logEvent(AllOf(
        Field(&audit::AuditEvent::event_type, audit::AuditEventType::SECURITY_INCIDENT),
        Field(&audit::AuditEvent::severity, audit::AuditSeverity::ERROR)))).Times(1);

    recorder_->logActivity("u1", ActivityType::SECURITY_VIOLATION, "security");
}

TEST_F(ActivityRecorderTest, Audit_HighRiskDataAccessIsWarning) {
    EXPECT_CALL(sink_, logEvent(AllOf(
        Field(&audit::AuditEvent::event_type, audit::AuditEventType::DATA_ACCESS),
        Field(&audit::AuditEvent::severity, audit::AuditSeverity::WARNING)))).Times(1);

    recorder_->logActivity("u1", ActivityType::PERMISSION_CHANGE, "user");
}

TEST_F(ActivityRecorderTest, Audit_SinkFailureDoesNotReachCaller) {
    EXPECT_CALL(sink_, logEvent(_)).WillOnce(Throw(std::runtime_error("disk full")));

    EXPECT_NO_THROW(recorder_->logActivity("u1", ActivityType::DATA_ACCESS, "report"));
    EXPECT_EQ(audit_.failures(), 1u);
    EXPECT_EQ(log_.size(), 1u);
}

// ============================================================================
// IP heuristic
// ============================================================================

TEST(PrivateRangeHeuristicTest, FlagsPrivateAndLoopbackRanges) {
    activity::PrivateRangeHeuristic heuristic;

    EXPECT_TRUE(heuristic.isSuspicious("10.0.0.1"));
    EXPECT_TRUE(heuristic.isSuspicious("127.0.0.1"));
    EXPECT_TRUE(heuristic.isSuspicious("172.16.4.4"));
    EXPECT_TRUE(heuristic.isSuspicious("172.31.255.1"));
    EXPECT_TRUE(heuristic.isSuspicious("192.168.0.10"));
    EXPECT_TRUE(heuristic.isSuspicious("0.0.0.0"));

    EXPECT_FALSE(heuristic.isSuspicious("172.32.0.1"));
    EXPECT_FALSE(heuristic.isSuspicious("8.8.8.8"));
    EXPECT_FALSE(heuristic.isSuspicious("unknown"));
    EXPECT_FALSE(heuristic.isSuspicious(""));
}
