#include "access_guard/config/validator.hpp"
#include "access_guard/common/logger.hpp"
#include "access_guard/common/types.hpp"
#include "access_guard/core/error_codes.hpp"
#include <filesystem>
#include <utility>

namespace access_guard {
namespace config {

void ConfigValidator::requirePositive(ValidationResult& result, const std::string& key, int value) {
    if (value <= 0) {
        result.fail(key + ": Must be > 0");
    }
}

void ConfigValidator::requireNonNegative(ValidationResult& result, const std::string& key, int value) {
    if (value < 0) {
        result.fail(key + ": Must be >= 0");
    }
}

ValidationResult ConfigValidator::validate(const common::GlobalConfig& config) {
    ValidationResult result;

    checkPaths(config, result);
    checkRbac(config.rbac, result);
    checkMonitor(config.monitor, result);
    checkPolicies(config, result);
    checkStorage(config, result);

    if (result.is_valid) {
        common::Logger::instance().debug("[Validator] Passed | warnings={}", result.warnings.size());
    } else {
        common::Logger::instance().error("[Validator] Failed | errors={}", result.errors.size());
    }

    return result;
}

void ConfigValidator::checkPaths(const common::GlobalConfig& config, ValidationResult& result) {
    if (!validatePath(config.state_dir)) {
        result.fail("state_dir: Invalid or inaccessible path");
    }

    if (!canCreateDirectory(std::filesystem::path(config.log_file).parent_path().string())) {
        result.fail("log_file: Cannot create parent directory");
    }

    if (config.audit.enabled &&
        !canCreateDirectory(std::filesystem::path(config.audit.audit_file).parent_path().string())) {
        result.fail("audit.audit_file: Cannot create parent directory");
    }

    if (!validatePort(config.daemon.http_port)) {
        result.fail("daemon.http_port: Invalid port number (must be >= 1024)");
    }
}

void ConfigValidator::checkRbac(const common::RbacConfig& rbac, ValidationResult& result) {
    requirePositive(result, "rbac.lockout_threshold", rbac.lockout_threshold);
    requirePositive(result, "rbac.session_timeout_minutes", rbac.session_timeout_minutes);

    if (rbac.bootstrap_admins.empty()) {
        result.warnings.push_back(
            "rbac.bootstrap_admins: Empty\n"
            "  Role assignment and permission revocation require an administrator.\n"
            "  Configure via:\n"
            "    - access-guard config set rbac.bootstrap_admins \"alice,bob\""
        );
    }
}

void ConfigValidator::checkMonitor(const common::MonitorConfig& monitor, ValidationResult& result) {
    if (!validateHour(monitor.business_hours_start) || !validateHour(monitor.business_hours_end)) {
        result.fail("monitor.business_hours_*: Must be between 0-23");
    } else if (monitor.business_hours_start > monitor.business_hours_end) {
        result.fail("monitor.business_hours_start: Must not be after business_hours_end");
    }

    if (monitor.queue_capacity < 1) {
        result.fail("monitor.queue_capacity: Must be >= 1");
    }

    const std::pair<const char*, int> intervals[] = {
        {"monitor.activity_retention_hours", monitor.activity_retention_hours},
        {"monitor.alert_retention_hours", monitor.alert_retention_hours},
        {"monitor.monitor_interval_ms", monitor.monitor_interval_ms},
        {"monitor.rapid_window_seconds", monitor.rapid_window_seconds},
        {"monitor.detection_interval_seconds", monitor.detection_interval_seconds},
        {"monitor.detection_window_minutes", monitor.detection_window_minutes},
        {"monitor.breach_interval_seconds", monitor.breach_interval_seconds},
        {"monitor.breach_window_minutes", monitor.breach_window_minutes},
        {"monitor.degraded_failure_threshold", monitor.degraded_failure_threshold},
    };
    for (const auto& [key, value] : intervals) {
        requirePositive(result, key, value);
    }

    // A zero threshold is legal: the pattern then fires on the first event.
    const std::pair<const char*, int> thresholds[] = {
        {"monitor.rapid_threshold", monitor.rapid_threshold},
        {"monitor.unusual_risk_threshold", monitor.unusual_risk_threshold},
        {"monitor.role_change_threshold", monitor.role_change_threshold},
        {"monitor.failed_login_threshold", monitor.failed_login_threshold},
        {"monitor.data_access_threshold", monitor.data_access_threshold},
        {"monitor.export_threshold", monitor.export_threshold},
    };
    for (const auto& [key, value] : thresholds) {
        requireNonNegative(result, key, value);
    }

    if (monitor.analysis_threads < 1 || monitor.analysis_threads > 64) {
        result.fail("monitor.analysis_threads: Must be between 1-64");
    }

    if (monitor.activity_retention_hours * 60 < monitor.detection_window_minutes) {
        result.warnings.push_back(
            "monitor.activity_retention_hours: Shorter than detection_window_minutes, "
            "pattern detection will see a truncated window"
        );
    }
}

void ConfigValidator::checkPolicies(const common::GlobalConfig& config, ValidationResult& result) {
    for (const auto& [resource, consent_type] : config.consent.gated_resources) {
        try {
            common::parseConsentType(consent_type);
        } catch (const core::GuardError& e) {
            result.fail("consent.gated_resources." + resource + ": " + e.what());
        }
    }

    for (const auto& [account, owner] : config.compliance.bank_accounts) {
        if (owner.empty()) {
            result.fail("compliance.bank_accounts." + account + ": Owner must not be empty");
        }
    }
}

void ConfigValidator::checkStorage(const common::GlobalConfig& config, ValidationResult& result) {
    if (config.persistence.enabled) {
        requirePositive(result, "persistence.checkpoint_interval_seconds",
                        config.persistence.checkpoint_interval_seconds);
    }

    if (config.logging.rotation_size_mb < 1) {
        result.fail("logging.rotation_size_mb: Must be >= 1");
    }

    if (config.logging.max_files < 1) {
        result.fail("logging.max_files: Must be >= 1");
    }
}

ValidationResult ConfigValidator::validateFile(const std::string& path) {
    ValidationResult result;

    if (!std::filesystem::exists(path)) {
        result.fail("Configuration file does not exist");
        common::Logger::instance().error("[Validator] File not found | path={}", path);
        return result;
    }

    auto& config = common::Config::instance();
    if (!config.load(path)) {
        result.fail("Failed to parse configuration file");
        common::Logger::instance().error("[Validator] Parse failed | path={}", path);
        return result;
    }

    return validate(config.global());
}

bool ConfigValidator::validatePath(const std::string& path) {
    if (path.empty()) return false;

    std::error_code ec;
    std::filesystem::path p(path);

    if (std::filesystem::exists(p, ec)) {
        return std::filesystem::is_directory(p, ec);
    }

    return canCreateDirectory(path);
}

bool ConfigValidator::validatePort(uint16_t port) {
    return port >= 1024;
}

bool ConfigValidator::validateHour(int hour) {
    return hour >= 0 && hour <= 23;
}

bool ConfigValidator::canCreateDirectory(const std::string& path) {
    std::error_code ec;
    std::filesystem::path p(path);

    if (p.empty()) return true;

    if (std::filesystem::exists(p, ec)) {
        return std::filesystem::is_directory(p, ec);
    }

    auto parent = p.parent_path();
    if (parent.empty() || parent == p) return true;

    if (std::filesystem::exists(parent, ec)) {
        auto perms = std::filesystem::status(parent, ec).permissions();
        if (ec) return false;
        return (perms & std::filesystem::perms::owner_write) != std::filesystem::perms::none;
    }

    return canCreateDirectory(parent.string());
}

}}
