#include <gtest/gtest.h>

#include "access_guard/service/access_control_service.hpp"
#include "access_guard/core/error_codes.hpp"
#include "../mocks/InMemoryPersistence.hpp"
#include "../support/TestConfig.hpp"
#include <atomic>
#include <set>
#include <thread>

using namespace access_guard;
using namespace access_guard::tests;
using common::ActivityType;
using common::AlertType;
using common::Permission;
using common::Role;

namespace access_guard::tests {

class FailingPersistence : public storage::PersistenceLayer {
public:
    explicit FailingPersistence(bool fail_load) : fail_load_(fail_load) {}

    void save(const storage::StateSnapshot&) override {
        throw core::GuardError(core::GuardErrorCode::PERSISTENCE_FAILED, "disk full");
    }

    storage::StateSnapshot load() override {
        if (fail_load_) {
            throw core::GuardError(core::GuardErrorCode::PERSISTENCE_FAILED, "corrupt state");
        }
        return {};
    }

private:
    bool fail_load_;
};

} // namespace access_guard::tests

// ============================================================================
// Test Fixture
// ============================================================================

class AccessControlServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_.set(businessHours());
        config_ = testConfig();
        config_.rbac.bootstrap_admins = {"root", "ops"};
    }

    std::unique_ptr<service::AccessControlService> make(service::ServiceCollaborators collaborators = {}) {
        return std::make_unique<service::AccessControlService>(config_, clock_, std::move(collaborators));
    }

    service::ServiceCollaborators withPersistence(storage::StateSnapshot initial = {}) {
        auto persistence = std::make_unique<InMemoryPersistence>(std::move(initial));
        persistence_ = persistence.get();
        service::ServiceCollaborators collaborators;
        collaborators.persistence = std::move(persistence);
        return collaborators;
    }

    common::GlobalConfig config_;
    common::ManualClock clock_;
    InMemoryPersistence* persistence_ = nullptr;
};

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(AccessControlServiceTest, Initialize_SeedsBootstrapAdmins) {
    auto service = make();
    ASSERT_TRUE(service->initialize(false));

    auto root = service->users().find("root");
    ASSERT_TRUE(root.has_value());
    EXPECT_EQ(root->role, Role::ADMIN);
    EXPECT_TRUE(service->users().find("ops").has_value());
    EXPECT_TRUE(service->isInitialized());
}

TEST_F(AccessControlServiceTest, SeedBootstrapAdmins_ExistingRecordUntouched) {
    auto service = make();
    ASSERT_TRUE(service->initialize(false));
    ASSERT_TRUE(service->assignRole("ops", Role::ANALYST, "root"));

    EXPECT_EQ(service->seedBootstrapAdmins({"root", "ops", "new-admin"}), 1u);
    EXPECT_EQ(service->users().find("ops")->role, Role::ANALYST);
}

TEST_F(AccessControlServiceTest, Initialize_RestoresStateAndResumesSequence) {
    storage::StateSnapshot state;
    common::UserAccess user;
    user.user_id = "u1";
    user.role = Role::SUPPORT;
    user.permissions = {Permission::READ_USER};
    state.users.push_back(user);

    common::Activity activity;
    activity.activity_id = "act_old";
    activity.sequence = 41;
    activity.user_id = "u1";
    activity.resource_type = "bank_account";
    activity.timestamp = businessHours() - std::chrono::minutes(5);
    state.activities.push_back(activity);

    auto service = make(withPersistence(state));
    ASSERT_TRUE(service->initialize(false));

    EXPECT_EQ(persistence_->loads(), 1);
    EXPECT_EQ(service->users().find("u1")->role, Role::SUPPORT);
    EXPECT_EQ(service->activityLog().size(), 1u);

    auto next = service->logActivity("u1", ActivityType::DATA_ACCESS, "bank_account", std::string("acc-9"));
    EXPECT_EQ(next.sequence, 42u);
}

TEST_F(AccessControlServiceTest, Initialize_LoadFailure_ReturnsFalse) {
    service::ServiceCollaborators collaborators;
    collaborators.persistence = std::make_unique<FailingPersistence>(true);
    auto service = make(std::move(collaborators));

    EXPECT_FALSE(service->initialize(false));
    EXPECT_FALSE(service->isInitialized());
}

TEST_F(AccessControlServiceTest, Shutdown_WritesCheckpoint) {
    auto service = make(withPersistence());
    ASSERT_TRUE(service->initialize(false));
    service->logActivity("root", ActivityType::LOGIN, "authentication");

    service->shutdown();

    EXPECT_EQ(persistence_->saves(), 1);
    EXPECT_EQ(persistence_->state().users.size(), 2u);
    EXPECT_EQ(persistence_->state().activities.size(), 1u);
    EXPECT_FALSE(service->isInitialized());

    service->shutdown();
    EXPECT_EQ(persistence_->saves(), 1);
}

TEST_F(AccessControlServiceTest, Checkpoint_SaveFailure_ReturnsFalse) {
    service::ServiceCollaborators collaborators;
    collaborators.persistence = std::make_unique<FailingPersistence>(false);
    auto service = make(std::move(collaborators));
    ASSERT_TRUE(service->initialize(false));

    EXPECT_FALSE(service->checkpoint());
}

TEST_F(AccessControlServiceTest, Checkpoint_WithoutPersistence_Succeeds) {
    auto service = make();
    ASSERT_TRUE(service->initialize(false));
    EXPECT_TRUE(service->checkpoint());
}

// ============================================================================
// Operations
// ============================================================================

TEST_F(AccessControlServiceTest, RecordConsent_LogsConsentActivity) {
    auto service = make();
    ASSERT_TRUE(service->initialize(false));

    std::string id = service->recordConsent("u1", common::ConsentType::MARKETING, true, "10.0.0.4", "app/2.1");

    auto activities = service->activityLog().snapshot();
    ASSERT_FALSE(activities.empty());
    const auto& last = activities.back();
    EXPECT_EQ(last.resource_type, "consent");
    EXPECT_EQ(last.resource_id, std::optional<std::string>(id));
    EXPECT_EQ(last.metadata["consent_type"], "marketing");
    EXPECT_EQ(last.metadata["consent_granted"], true);
    EXPECT_TRUE(service->consents().hasConsent("u1", common::ConsentType::MARKETING));
}

TEST_F(AccessControlServiceTest, RunMonitorOnce_DrainsQueue) {
    auto service = make();
    ASSERT_TRUE(service->initialize(false));
    service->logActivity("root", ActivityType::LOGIN, "authentication");
    ASSERT_GT(service->activityQueue().size(), 0u);

    EXPECT_TRUE(service->runMonitorOnce());
    EXPECT_EQ(service->activityQueue().size(), 0u);
}

// ============================================================================
// Metrics
// ============================================================================

TEST_F(AccessControlServiceTest, Metrics_CountsUsersAlertsAndActivities) {
    auto service = make();
    ASSERT_TRUE(service->initialize(false));
    service->users().seedUser("u1", Role::USER);
    for (int i = 0; i < 5; ++i) {
        service->recordLoginAttempt("u1", "203.0.113.9", "curl/8.0", false);
    }

    clock_.advance(std::chrono::hours(24 * 8));
    service->logActivity("root", ActivityType::LOGIN, "authentication");
    service->createAlert(AlertType::SUSPICIOUS_ACTIVITY, common::Severity::CRITICAL,
                         "Manual", "raised by operator", "root", "10.0.0.1");

    auto m = service->metrics();
    EXPECT_EQ(m.total_users, 3u);
    EXPECT_EQ(m.locked_users, 1u);
    EXPECT_EQ(m.active_users, 2u);
    EXPECT_EQ(m.role_distribution["admin"], 2u);
    EXPECT_EQ(m.role_distribution["user"], 1u);
    EXPECT_GE(m.total_alerts, 2u);
    EXPECT_GE(m.critical_alerts, 1u);
    EXPECT_EQ(m.recent_activities, 1u);

    nlohmann::json j = m;
    EXPECT_EQ(j["users"]["locked"], 1);
    EXPECT_TRUE(j.contains("incidents"));
}

TEST_F(AccessControlServiceTest, RunDetectionOnce_PrunesExpiredClosedAlerts) {
    config_.monitor.alert_retention_hours = 24;
    auto service = make();
    ASSERT_TRUE(service->initialize(false));

    auto closed = service->createAlert(AlertType::SUSPICIOUS_ACTIVITY, common::Severity::LOW,
                                       "Manual", "raised by operator", "root", "10.0.0.1");
    auto open = service->createAlert(AlertType::SUSPICIOUS_ACTIVITY, common::Severity::LOW,
                                     "Manual", "raised by operator", "root", "10.0.0.1");
    service->alerts().updateStatus(closed.alert_id, common::AlertStatus::RESOLVED);

    clock_.advance(std::chrono::hours(25));
    EXPECT_TRUE(service->runDetectionOnce());

    EXPECT_FALSE(service->alerts().find(closed.alert_id).has_value());
    EXPECT_TRUE(service->alerts().find(open.alert_id).has_value());
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_F(AccessControlServiceTest, RequestPathAndWorkers_RunConcurrently) {
    config_.monitor.monitor_interval_ms = 1;
    config_.monitor.detection_interval_seconds = 1;
    config_.monitor.breach_interval_seconds = 1;
    auto service = make();
    ASSERT_TRUE(service->initialize(true));

    for (int i = 0; i < 8; ++i) {
        service->users().seedUser("user" + std::to_string(i), Role::USER);
    }

    constexpr int iterations = 200;
    std::atomic<bool> revoked{false};

    std::thread admin([&] {
        for (int i = 0; i < iterations; ++i) {
            std::string target = "user" + std::to_string(i % 8);
            service->assignRole(target, i % 2 == 0 ? Role::ANALYST : Role::USER, "root");
        }
        ASSERT_TRUE(service->assignRole("target", Role::USER, "root"));
        ASSERT_TRUE(service->revokePermission("target", Permission::READ_BANK_DATA, "root"));
        revoked = true;
    });

    std::thread reader([&] {
        for (int i = 0; i < iterations; ++i) {
            service->checkPermission("user" + std::to_string(i % 8), Permission::READ_BANK_DATA);
            service->checkPermission("target", Permission::READ_BANK_DATA);
        }
    });

    std::thread logins([&] {
        for (int i = 0; i < iterations; ++i) {
            service->recordLoginAttempt("user" + std::to_string(i % 8), "203.0.113.9", "curl/8.0", i % 3 != 0);
        }
    });

    std::thread scans([&] {
        for (int i = 0; i < 20; ++i) {
            service->runDetectionOnce();
            service->runBreachScanOnce();
        }
    });

    admin.join();
    reader.join();
    logins.join();
    scans.join();

    ASSERT_TRUE(revoked.load());
    EXPECT_FALSE(service->checkPermission("target", Permission::READ_BANK_DATA));

    service->shutdown();

    auto activities = service->activityLog().snapshot();
    std::set<uint64_t> sequences;
    for (const auto& activity : activities) {
        EXPECT_GE(activity.risk_score, 0);
        EXPECT_LE(activity.risk_score, 10);
        EXPECT_TRUE(sequences.insert(activity.sequence).second) << activity.sequence;
    }
    EXPECT_GE(activities.size(), static_cast<size_t>(iterations * 3));
}
