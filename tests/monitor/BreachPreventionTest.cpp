#include <gtest/gtest.h>

#include "access_guard/service/access_control_service.hpp"
#include "access_guard/core/error_codes.hpp"
#include "../support/TestConfig.hpp"

using namespace access_guard;
using namespace access_guard::tests;
using common::IncidentStatus;
using common::Permission;
using common::Role;

// ============================================================================
// Test Fixture
// ============================================================================

class BreachPreventionTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_.set(businessHours());
        config_ = testConfig();
        config_.rbac.bootstrap_admins = {"root"};
        service_ = std::make_unique<service::AccessControlService>(config_, clock_, service::ServiceCollaborators{});
        ASSERT_TRUE(service_->initialize(false));
        service_->users().seedUser("u1", Role::USER);
    }

    monitor::BreachPreventionSystem& breach() { return service_->breach(); }

    void exportData(const std::string& user, int count) {
        for (int i = 0; i < count; ++i) {
            service_->checkPermission(user, Permission::EXPORT_BANK_DATA, std::string("bank_export"));
        }
    }

    common::BreachIncident openOne() {
        service_->checkPermission("u1", Permission::READ_BANK_DATA);
        service_->revokePermission("u1", Permission::READ_BANK_DATA, "root");
        breach().scan();
        return breach().incidents().at(0);
    }

    void expectTransitionError(const std::string& id, IncidentStatus to, core::GuardErrorCode expected) {
        try {
            breach().updateIncidentStatus(id, to);
            FAIL() << "expected GuardError";
        } catch (const core::GuardError& e) {
            EXPECT_EQ(e.code(), expected);
        }
    }

    common::GlobalConfig config_;
    common::ManualClock clock_;
    std::unique_ptr<service::AccessControlService> service_;
};

// ============================================================================
// scan
// ============================================================================

TEST_F(BreachPreventionTest, Scan_ValidGrants_NoIncident) {
    service_->checkPermission("u1", Permission::READ_BANK_DATA);
    service_->checkPermission("u1", Permission::VIEW_BALANCES);

    EXPECT_EQ(breach().scan(), 0u);
    EXPECT_TRUE(breach().incidents().empty());
}

TEST_F(BreachPreventionTest, Scan_GrantNoLongerValid_OpensIncident) {
    auto incident = openOne();

    EXPECT_EQ(incident.incident_type, "unauthorized_access");
    EXPECT_EQ(incident.severity, common::Severity::CRITICAL);
    EXPECT_EQ(incident.status, IncidentStatus::DETECTED);
    EXPECT_EQ(incident.affected_users, std::vector<std::string>{"u1"});
    EXPECT_EQ(incident.affected_data, std::vector<std::string>{"permission"});
    EXPECT_EQ(incident.containment_actions.size(), 4u);
    EXPECT_EQ(incident.detected_at, clock_.now());

    auto alerts = service_->alerts().alertsByStatus(common::AlertStatus::OPEN);
    ASSERT_EQ(countAlerts(alerts, common::AlertType::DATA_BREACH), 1u);
}

TEST_F(BreachPreventionTest, Scan_LockedAfterGrant_OpensIncident) {
    service_->checkPermission("u1", Permission::VIEW_BALANCES);
    for (int i = 0; i < config_.rbac.lockout_threshold; ++i) {
        service_->recordLoginAttempt("u1", "203.0.113.9", "curl/8.0", false);
    }

    EXPECT_EQ(breach().scan(), 1u);
}

TEST_F(BreachPreventionTest, Scan_SameEvidenceOpensOnce) {
    openOne();

    EXPECT_EQ(breach().scan(), 0u);
    EXPECT_EQ(breach().incidents().size(), 1u);
}

TEST_F(BreachPreventionTest, Scan_OldGrantsOutsideWindowIgnored) {
    service_->checkPermission("u1", Permission::READ_BANK_DATA);
    clock_.advance(std::chrono::minutes(config_.monitor.breach_window_minutes + 1));
    service_->revokePermission("u1", Permission::READ_BANK_DATA, "root");

    EXPECT_EQ(breach().scan(), 0u);
}

TEST_F(BreachPreventionTest, Scan_ExportVolume_StrictlyAboveThreshold) {
    exportData("root", config_.monitor.export_threshold);
    EXPECT_EQ(breach().scan(), 0u);

    exportData("root", 1);
    EXPECT_EQ(breach().scan(), 1u);

    auto incident = breach().incidents().at(0);
    EXPECT_EQ(incident.affected_users, std::vector<std::string>{"root"});
    EXPECT_EQ(incident.affected_data, std::vector<std::string>{"bank_export"});

    auto raised = service_->alerts().alerts();
    ASSERT_EQ(countAlerts(raised, common::AlertType::DATA_BREACH), 1u);
    for (const auto& alert : raised) {
        if (alert.alert_type == common::AlertType::DATA_BREACH) {
            EXPECT_EQ(alert.severity, common::Severity::CRITICAL);
        }
    }
}

TEST_F(BreachPreventionTest, Scan_ExportVolume_NewExportReopens) {
    exportData("root", config_.monitor.export_threshold + 1);
    EXPECT_EQ(breach().scan(), 1u);
    EXPECT_EQ(breach().scan(), 0u);

    exportData("root", 1);
    EXPECT_EQ(breach().scan(), 1u);
}

TEST_F(BreachPreventionTest, Scan_DeniedExportsNotCounted) {
    exportData("u1", config_.monitor.export_threshold + 3);

    EXPECT_EQ(breach().scan(), 0u);
}

// ============================================================================
// updateIncidentStatus
// ============================================================================

TEST_F(BreachPreventionTest, UpdateStatus_ForwardSkipAllowed) {
    auto incident = openOne();

    auto updated = breach().updateIncidentStatus(incident.incident_id, IncidentStatus::CONTAINED);
    EXPECT_EQ(updated.status, IncidentStatus::CONTAINED);
    EXPECT_EQ(breach().openCount(), 1u);

    breach().updateIncidentStatus(incident.incident_id, IncidentStatus::RESOLVED);
    EXPECT_EQ(breach().openCount(), 0u);
}

TEST_F(BreachPreventionTest, UpdateStatus_BackwardsRejected) {
    auto incident = openOne();
    breach().updateIncidentStatus(incident.incident_id, IncidentStatus::CONTAINED);

    expectTransitionError(incident.incident_id, IncidentStatus::INVESTIGATING,
                          core::GuardErrorCode::INCIDENT_INVALID_TRANSITION);
    expectTransitionError(incident.incident_id, IncidentStatus::CONTAINED,
                          core::GuardErrorCode::INCIDENT_INVALID_TRANSITION);
}

TEST_F(BreachPreventionTest, UpdateStatus_UnknownIncident) {
    expectTransitionError("breach_0_missing", IncidentStatus::RESOLVED, core::GuardErrorCode::INCIDENT_NOT_FOUND);
}
