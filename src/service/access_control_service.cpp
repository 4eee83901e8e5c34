#include "access_guard/service/access_control_service.hpp"
#include "access_guard/common/constants.hpp"
#include "access_guard/common/logger.hpp"
#include <algorithm>

namespace access_guard {
namespace service {

void to_json(nlohmann::json& j, const ServiceMetrics& metrics) {
    j = {
        {"users", {
            {"total", metrics.total_users},
            {"active", metrics.active_users},
            {"locked", metrics.locked_users},
            {"role_distribution", metrics.role_distribution}
        }},
        {"alerts", {
            {"total", metrics.total_alerts},
            {"open", metrics.open_alerts},
            {"critical", metrics.critical_alerts}
        }},
        {"activities", {
            {"recent", metrics.recent_activities},
            {"high_risk", metrics.high_risk_activities},
            {"dropped", metrics.dropped_events}
        }},
        {"consents", {
            {"total", metrics.total_consents},
            {"active", metrics.active_consents}
        }},
        {"incidents", {
            {"total", metrics.total_incidents},
            {"open", metrics.open_incidents}
        }},
        {"audit", {
            {"failures", metrics.audit_failures}
        }}
    };
}

AccessControlService::AccessControlService(const common::GlobalConfig& config,
                                           const common::Clock& clock,
                                           ServiceCollaborators collaborators)
    : config_(config),
      clock_(clock),
      collaborators_(std::move(collaborators)),
      audit_(collaborators_.audit_sink.get()),
      queue_(config.monitor.queue_capacity) {
    if (!collaborators_.ip_reputation) {
        collaborators_.ip_reputation = std::make_unique<activity::PrivateRangeHeuristic>();
    }
    if (!collaborators_.compliance) {
        collaborators_.compliance = std::make_unique<compliance::AccountOwnershipCompliance>(
            config_.compliance.bank_accounts);
    }

    recorder_ = std::make_unique<activity::ActivityRecorder>(
        config_.monitor, clock_, *collaborators_.ip_reputation, log_, queue_, audit_);
    alerts_ = std::make_unique<alert::SecurityAlertManager>(clock_, audit_);
    consents_ = std::make_unique<consent::ConsentStore>(clock_);
    store_ = std::make_unique<rbac::UserAccessStore>(
        config_.rbac, config_.consent,
        rbac::StoreCollaborators{registry_, *recorder_, *alerts_, *collaborators_.compliance, *consents_, clock_});
    monitor_ = std::make_unique<monitor::ActivityMonitor>(
        config_.monitor, clock_, queue_, log_, *recorder_, *alerts_);
    detector_ = std::make_unique<monitor::SuspiciousActivityDetector>(
        config_.monitor, clock_, log_, *alerts_);
    breach_ = std::make_unique<monitor::BreachPreventionSystem>(
        config_.monitor, clock_, log_, *store_, *alerts_, audit_);

    createWorkers();
}

AccessControlService::~AccessControlService() {
    shutdown();
}

ServiceCollaborators AccessControlService::defaultCollaborators(const common::GlobalConfig& config) {
    ServiceCollaborators collaborators;

    if (config.audit.enabled) {
        collaborators.audit_sink = std::make_unique<audit::JsonlAuditSink>(config.audit.audit_file);
    } else {
        collaborators.audit_sink = std::make_unique<audit::LoggerAuditSink>();
    }

    if (config.persistence.enabled) {
        collaborators.persistence = std::make_unique<storage::JsonFileStore>(config.state_dir);
    }

    collaborators.compliance = std::make_unique<compliance::AccountOwnershipCompliance>(
        config.compliance.bank_accounts);
    collaborators.ip_reputation = std::make_unique<activity::PrivateRangeHeuristic>();
    return collaborators;
}

void AccessControlService::createWorkers() {
    const auto& monitor = config_.monitor;
    auto degraded = [this](const std::string& worker, int failures) {
        onWorkerDegraded(worker, failures);
    };

    monitor_worker_ = std::make_unique<monitor::PeriodicWorker>(
        "activity_monitor",
        std::chrono::milliseconds(monitor.monitor_interval_ms),
        [this] { return monitor_->processPending(); },
        monitor.degraded_failure_threshold, degraded);

    detection_worker_ = std::make_unique<monitor::PeriodicWorker>(
        "suspicious_activity_detector",
        std::chrono::seconds(monitor.detection_interval_seconds),
        [this] {
            detector_->scan();
            alerts_->pruneClosed(clock_.now() - std::chrono::hours(config_.monitor.alert_retention_hours));
            return true;
        },
        monitor.degraded_failure_threshold, degraded);

    breach_worker_ = std::make_unique<monitor::PeriodicWorker>(
        "breach_prevention",
        std::chrono::seconds(monitor.breach_interval_seconds),
        [this] { breach_->scan(); return true; },
        monitor.degraded_failure_threshold, degraded);

    if (collaborators_.persistence) {
        checkpoint_worker_ = std::make_unique<monitor::PeriodicWorker>(
            "checkpoint",
            std::chrono::seconds(config_.persistence.checkpoint_interval_seconds),
            [this] { return checkpoint(); },
            monitor.degraded_failure_threshold, degraded);
    }
}

void AccessControlService::onWorkerDegraded(const std::string& worker, int consecutive_failures) {
    alerts_->createAlert(common::AlertType::MONITOR_DEGRADED,
                         common::Severity::HIGH,
                         "Monitor degraded: " + worker,
                         "Worker " + worker + " failed " + std::to_string(consecutive_failures) +
                             " consecutive iterations",
                         constants::system::BINARY_NAME,
                         constants::metadata_keys::UNKNOWN_VALUE,
                         {{"worker", worker}, {"consecutive_failures", consecutive_failures}});
}

bool AccessControlService::restoreState() {
    if (!collaborators_.persistence) {
        return true;
    }

    try {
        storage::StateSnapshot state = collaborators_.persistence->load();
        store_->restore(state.users);
        log_.restore(std::move(state.activities));
        alerts_->restore(std::move(state.alerts));
        breach_->restore(std::move(state.incidents));
        consents_->restore(std::move(state.consents));
        recorder_->resumeSequence(log_.lastSequence());
        return true;
    } catch (const std::exception& e) {
        common::Logger::instance().error("[Service] Failed to restore state | error={}", e.what());
        return false;
    }
}

bool AccessControlService::initialize(bool start_workers) {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (initialized_) {
        return true;
    }

    if (!restoreState()) {
        return false;
    }

    seedBootstrapAdmins(config_.rbac.bootstrap_admins);

    if (start_workers) {
        monitor_worker_->start();
        detection_worker_->start();
        breach_worker_->start();
        if (checkpoint_worker_) {
            checkpoint_worker_->start();
        }
    }

    initialized_ = true;
    common::Logger::instance().info("[Service] Initialized | users={} | activities={} | alerts={} | workers={}",
                                    store_->size(), log_.size(), alerts_->size(), start_workers);
    return true;
}

void AccessControlService::shutdown() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    bool expected = true;
    if (!initialized_.compare_exchange_strong(expected, false)) {
        return;
    }

    common::Logger::instance().info("[Service] Shutting down");

    if (checkpoint_worker_) {
        checkpoint_worker_->stop();
    }
    breach_worker_->stop();
    detection_worker_->stop();
    monitor_worker_->stop();

    checkpoint();

    common::Logger::instance().info("[Service] Shutdown complete");
}

bool AccessControlService::checkpoint() {
    if (!collaborators_.persistence) {
        return true;
    }

    std::lock_guard<std::mutex> lock(checkpoint_mutex_);
    storage::StateSnapshot state;
    state.users = store_->snapshot();
    state.activities = log_.snapshot();
    state.alerts = alerts_->alerts();
    state.incidents = breach_->incidents();
    state.consents = consents_->records();

    try {
        collaborators_.persistence->save(state);
        return true;
    } catch (const std::exception& e) {
        common::Logger::instance().error("[Service] Checkpoint failed | error={}", e.what());
        return false;
    }
}

bool AccessControlService::checkPermission(const std::string& user_id,
                                           common::Permission permission,
                                           const std::optional<std::string>& resource_type,
                                           const std::optional<std::string>& resource_id) {
    return store_->checkPermission(user_id, permission, resource_type, resource_id);
}

bool AccessControlService::recordLoginAttempt(const std::string& user_id,
                                              const std::string& ip_address,
                                              const std::string& user_agent,
                                              bool success) {
    return store_->recordLoginAttempt(user_id, ip_address, user_agent, success);
}

void AccessControlService::recordLogout(const std::string& user_id,
                                        const std::string& ip_address,
                                        const std::string& user_agent) {
    store_->recordLogout(user_id, ip_address, user_agent);
}

common::Activity AccessControlService::logActivity(const std::string& user_id,
                                                   common::ActivityType type,
                                                   const std::string& resource_type,
                                                   const std::optional<std::string>& resource_id,
                                                   const nlohmann::json& metadata) {
    return recorder_->logActivity(user_id, type, resource_type, resource_id, metadata);
}

common::SecurityAlert AccessControlService::createAlert(common::AlertType type,
                                                        common::Severity severity,
                                                        const std::string& title,
                                                        const std::string& description,
                                                        const std::string& user_id,
                                                        const std::string& ip_address,
                                                        const nlohmann::json& evidence) {
    return alerts_->createAlert(type, severity, title, description, user_id, ip_address, evidence);
}

std::string AccessControlService::recordConsent(const std::string& user_id,
                                                common::ConsentType type,
                                                bool granted,
                                                const std::string& ip_address,
                                                const std::string& user_agent,
                                                std::optional<common::Timestamp> expires_at) {
    std::string consent_id = consents_->recordConsent(user_id, type, granted, ip_address, user_agent, expires_at);

    recorder_->logActivity(user_id, common::ActivityType::DATA_ACCESS, constants::resources::CONSENT, consent_id,
                           {{"consent_type", common::to_string(type)},
                            {"consent_granted", granted},
                            {constants::metadata_keys::IP_ADDRESS, ip_address},
                            {constants::metadata_keys::USER_AGENT, user_agent}});
    return consent_id;
}

bool AccessControlService::assignRole(const std::string& user_id, common::Role role, const std::string& assigned_by) {
    return store_->assignRole(user_id, role, assigned_by);
}

bool AccessControlService::revokePermission(const std::string& user_id,
                                            common::Permission permission,
                                            const std::string& revoked_by) {
    return store_->revokePermission(user_id, permission, revoked_by);
}

bool AccessControlService::unlockAccount(const std::string& user_id, const std::string& unlocked_by) {
    return store_->unlockAccount(user_id, unlocked_by);
}

ServiceMetrics AccessControlService::metrics() const {
    ServiceMetrics m;

    for (const auto& user : store_->snapshot()) {
        ++m.total_users;
        if (user.is_locked) {
            ++m.locked_users;
        } else {
            ++m.active_users;
        }
        ++m.role_distribution[common::to_string(user.role)];
    }

    for (const auto& alert : alerts_->alerts()) {
        ++m.total_alerts;
        if (alert.status == common::AlertStatus::OPEN) {
            ++m.open_alerts;
        }
        if (alert.severity == common::Severity::CRITICAL) {
            ++m.critical_alerts;
        }
    }

    auto since = clock_.now() - std::chrono::hours(24 * constants::limits::RECENT_ACTIVITY_DAYS);
    for (const auto& activity : log_.window(since)) {
        ++m.recent_activities;
        if (activity.risk_score >= constants::limits::HIGH_RISK_SCORE) {
            ++m.high_risk_activities;
        }
    }

    m.total_consents = consents_->size();
    m.active_consents = consents_->activeCount();
    m.total_incidents = breach_->incidents().size();
    m.open_incidents = breach_->openCount();
    m.dropped_events = queue_.dropped();
    m.audit_failures = audit_.failures();
    return m;
}

size_t AccessControlService::seedBootstrapAdmins(const std::vector<std::string>& admins) {
    size_t seeded = 0;
    for (const auto& admin : admins) {
        if (!store_->find(admin)) {
            store_->seedUser(admin, common::Role::ADMIN);
            ++seeded;
            common::Logger::instance().info("[Service] Bootstrap admin seeded | user={}", admin);
        }
    }
    return seeded;
}

bool AccessControlService::runMonitorOnce() {
    return monitor_worker_->runOnce();
}

bool AccessControlService::runDetectionOnce() {
    return detection_worker_->runOnce();
}

bool AccessControlService::runBreachScanOnce() {
    return breach_worker_->runOnce();
}

}}
