#include <gtest/gtest.h>

#include "access_guard/monitor/suspicious_activity_detector.hpp"
#include "../support/TestConfig.hpp"

using namespace access_guard;
using namespace access_guard::tests;
using common::ActivityType;
using Detector = monitor::SuspiciousActivityDetector;

// ============================================================================
// Test Fixture
// ============================================================================

class SuspiciousActivityDetectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = testConfig().monitor;
        clock_.set(businessHours());
        detector_ = std::make_unique<Detector>(config_, clock_, log_, alerts_);
    }

    void add(const std::string& user, ActivityType type, nlohmann::json metadata = nlohmann::json::object()) {
        common::Activity activity;
        activity.sequence = ++sequence_;
        activity.activity_id = "act_" + std::to_string(sequence_);
        activity.user_id = user;
        activity.activity_type = type;
        activity.timestamp = clock_.now();
        activity.metadata = std::move(metadata);
        log_.append(activity);
    }

    void failedLogins(const std::string& user, int count) {
        for (int i = 1; i <= count; ++i) {
            add(user, ActivityType::LOGIN, {{"success", false}, {"failed_attempts", i}});
        }
    }

    common::MonitorConfig config_;
    common::ManualClock clock_;
    audit::AuditDispatcher audit_;
    activity::ActivityLog log_;
    alert::SecurityAlertManager alerts_{clock_, audit_};
    std::unique_ptr<Detector> detector_;
    uint64_t sequence_ = 0;
};

// ============================================================================
// analyzeUser
// ============================================================================

TEST_F(SuspiciousActivityDetectorTest, AnalyzeUser_ThresholdsAreStrict) {
    failedLogins("u1", config_.failed_login_threshold);
    EXPECT_TRUE(detector_->analyzeUser("u1", log_.snapshot()).empty());

    failedLogins("u1", 1);
    auto findings = detector_->analyzeUser("u1", log_.snapshot());
    ASSERT_EQ(findings.size(), 1u);
    EXPECT_EQ(findings[0].kind, Detector::REPEATED_FAILED_LOGINS);
    EXPECT_EQ(findings[0].count, static_cast<size_t>(config_.failed_login_threshold + 1));
    EXPECT_EQ(findings[0].newest_sequence, sequence_);
}

TEST_F(SuspiciousActivityDetectorTest, AnalyzeUser_SuccessfulLoginsIgnored) {
    for (int i = 0; i < 10; ++i) {
        add("u1", ActivityType::LOGIN, {{"success", true}});
    }
    EXPECT_TRUE(detector_->analyzeUser("u1", log_.snapshot()).empty());
}

TEST_F(SuspiciousActivityDetectorTest, AnalyzeUser_RoleChanges) {
    add("root", ActivityType::ROLE_CHANGE);
    add("root", ActivityType::ROLE_CHANGE);

    auto findings = detector_->analyzeUser("root", log_.snapshot());
    ASSERT_EQ(findings.size(), 1u);
    EXPECT_EQ(findings[0].kind, Detector::EXCESSIVE_ROLE_CHANGES);
    EXPECT_EQ(findings[0].activity_ids, (std::vector<std::string>{"act_1", "act_2"}));
}

// ============================================================================
// scan
// ============================================================================

TEST_F(SuspiciousActivityDetectorTest, Scan_OneAlertPerUserWithAllPatterns) {
    for (int i = 0; i <= config_.data_access_threshold; ++i) {
        add("u1", ActivityType::DATA_ACCESS);
    }
    failedLogins("u1", config_.failed_login_threshold + 1);

    EXPECT_EQ(detector_->scan(), 1u);

    auto raised = alerts_.alerts();
    ASSERT_EQ(raised.size(), 1u);
    EXPECT_EQ(raised[0].alert_type, common::AlertType::SUSPICIOUS_PATTERN);
    EXPECT_EQ(raised[0].severity, common::Severity::HIGH);
    EXPECT_EQ(raised[0].title, "Suspicious activity pattern detected for user u1");

    const auto& patterns = raised[0].evidence["patterns"];
    ASSERT_EQ(patterns.size(), 2u);
    EXPECT_EQ(patterns[0]["type"], Detector::EXCESSIVE_DATA_ACCESS);
    EXPECT_EQ(patterns[1]["type"], Detector::REPEATED_FAILED_LOGINS);
    EXPECT_EQ(raised[0].evidence["window_minutes"], config_.detection_window_minutes);
}

TEST_F(SuspiciousActivityDetectorTest, Scan_SeparateUsersSeparateAlerts) {
    failedLogins("u1", config_.failed_login_threshold + 1);
    failedLogins("u2", config_.failed_login_threshold + 1);
    failedLogins("u3", 1);

    EXPECT_EQ(detector_->scan(), 2u);
}

TEST_F(SuspiciousActivityDetectorTest, Scan_SameEvidenceNotRealerted) {
    failedLogins("u1", config_.failed_login_threshold + 1);

    EXPECT_EQ(detector_->scan(), 1u);
    EXPECT_EQ(detector_->scan(), 0u);

    failedLogins("u1", 1);
    EXPECT_EQ(detector_->scan(), 1u);
    EXPECT_EQ(alerts_.size(), 2u);
}

TEST_F(SuspiciousActivityDetectorTest, Scan_ActivitiesOutsideWindowIgnored) {
    failedLogins("u1", config_.failed_login_threshold + 1);
    clock_.advance(std::chrono::minutes(config_.detection_window_minutes + 1));

    EXPECT_EQ(detector_->scan(), 0u);
    EXPECT_EQ(alerts_.size(), 0u);
}

TEST_F(SuspiciousActivityDetectorTest, Scan_ForgetsUsersThatLeftTheWindow) {
    failedLogins("u1", config_.failed_login_threshold + 1);
    EXPECT_EQ(detector_->scan(), 1u);
    EXPECT_EQ(detector_->trackedPatterns(), 1u);

    clock_.advance(std::chrono::minutes(config_.detection_window_minutes + 1));
    failedLogins("u2", 1);
    EXPECT_EQ(detector_->scan(), 0u);
    EXPECT_EQ(detector_->trackedPatterns(), 0u);

    failedLogins("u1", config_.failed_login_threshold + 1);
    EXPECT_EQ(detector_->scan(), 1u);
    EXPECT_EQ(alerts_.size(), 2u);
}
