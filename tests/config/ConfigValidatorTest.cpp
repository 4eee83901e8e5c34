#include <gtest/gtest.h>

#include "access_guard/config/validator.hpp"
#include "../support/TestConfig.hpp"
#include <algorithm>

using namespace access_guard;
using namespace access_guard::tests;

class ConfigValidatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = testConfig();
        config_.rbac.bootstrap_admins = {"root"};
    }

    static bool hasError(const config::ValidationResult& result, const std::string& key) {
        return std::any_of(result.errors.begin(), result.errors.end(),
                           [&](const std::string& e) { return e.rfind(key, 0) == 0; });
    }

    common::GlobalConfig config_;
    config::ConfigValidator validator_;
};

TEST_F(ConfigValidatorTest, Validate_Defaults_Pass) {
    auto result = validator_.validate(config_);
    EXPECT_TRUE(result.is_valid);
    EXPECT_TRUE(result.errors.empty());
}

TEST_F(ConfigValidatorTest, Validate_NoBootstrapAdmins_WarnsOnly) {
    config_.rbac.bootstrap_admins.clear();

    auto result = validator_.validate(config_);
    EXPECT_TRUE(result.is_valid);
    ASSERT_FALSE(result.warnings.empty());
    EXPECT_EQ(result.warnings[0].rfind("rbac.bootstrap_admins", 0), 0u);
}

TEST_F(ConfigValidatorTest, Validate_PrivilegedPort_Fails) {
    config_.daemon.http_port = 80;

    auto result = validator_.validate(config_);
    EXPECT_FALSE(result.is_valid);
    EXPECT_TRUE(hasError(result, "daemon.http_port"));
}

TEST_F(ConfigValidatorTest, Validate_BusinessHoursOutOfOrder_Fails) {
    config_.monitor.business_hours_start = 20;
    config_.monitor.business_hours_end = 8;

    auto result = validator_.validate(config_);
    EXPECT_FALSE(result.is_valid);
    EXPECT_TRUE(hasError(result, "monitor.business_hours_start"));
}

TEST_F(ConfigValidatorTest, Validate_NonPositiveIntervals_Fail) {
    config_.rbac.lockout_threshold = 0;
    config_.monitor.breach_window_minutes = -1;
    config_.monitor.queue_capacity = 0;

    auto result = validator_.validate(config_);
    EXPECT_FALSE(result.is_valid);
    EXPECT_TRUE(hasError(result, "rbac.lockout_threshold"));
    EXPECT_TRUE(hasError(result, "monitor.breach_window_minutes"));
    EXPECT_TRUE(hasError(result, "monitor.queue_capacity"));
}

TEST_F(ConfigValidatorTest, Validate_ZeroThresholdAllowed) {
    config_.monitor.export_threshold = 0;
    config_.monitor.role_change_threshold = 0;

    EXPECT_TRUE(validator_.validate(config_).is_valid);
}

TEST_F(ConfigValidatorTest, Validate_UnknownGatedConsentType_Fails) {
    config_.consent.gated_resources["profile_export"] = "telepathy";

    auto result = validator_.validate(config_);
    EXPECT_FALSE(result.is_valid);
    EXPECT_TRUE(hasError(result, "consent.gated_resources.profile_export"));
}

TEST_F(ConfigValidatorTest, Validate_AccountWithoutOwner_Fails) {
    config_.compliance.bank_accounts["acc-9"] = "";

    auto result = validator_.validate(config_);
    EXPECT_TRUE(hasError(result, "compliance.bank_accounts.acc-9"));
}

TEST_F(ConfigValidatorTest, ValidateFile_Missing_Fails) {
    auto result = validator_.validateFile("/tmp/access-guard-tests/does-not-exist.toml");
    EXPECT_FALSE(result.is_valid);
    ASSERT_EQ(result.errors.size(), 1u);
}

TEST_F(ConfigValidatorTest, StaticChecks) {
    EXPECT_TRUE(config::ConfigValidator::validateHour(0));
    EXPECT_TRUE(config::ConfigValidator::validateHour(23));
    EXPECT_FALSE(config::ConfigValidator::validateHour(24));
    EXPECT_FALSE(config::ConfigValidator::validatePort(1023));
    EXPECT_TRUE(config::ConfigValidator::validatePort(9317));
    EXPECT_FALSE(config::ConfigValidator::validatePath(""));
}
