#include "access_guard/common/config.hpp"
#include "access_guard/common/constants.hpp"
#include "access_guard/common/paths.hpp"
#include "access_guard/common/logger.hpp"
#include <toml.hpp>
#include <fstream>
#include <sstream>
#include <filesystem>
#include <unistd.h>
#include <sys/stat.h>

namespace access_guard {
namespace common {

namespace {

bool parseBool(const std::string& value) {
    return value == "true" || value == "1" || value == "yes";
}

template<typename T>
void readIfPresent(const toml::value& section, const char* key, T& target) {
    if (section.contains(key)) {
        target = toml::find<T>(section, key);
    }
}

toml::table toTable(const std::map<std::string, std::string>& values) {
    toml::table table;
    for (const auto& [key, value] : values) {
        table[key] = value;
    }
    return table;
}

}

Config& Config::instance() {
    static Config instance;
    return instance;
}

Config::Config() {
    global_ = createDefaultConfig();
}

GlobalConfig Config::createDefaultConfig() {
    using namespace constants::config_defaults;

    GlobalConfig config;

    config.log_level = LogLevel::INFO;
    config.log_file = "";
    config.state_dir = "";

    config.logging.rotation_size_mb = LOG_ROTATION_SIZE_MB;
    config.logging.max_files = LOG_MAX_FILES;
    config.logging.format = LogFormat::TEXT;

    config.rbac.lockout_threshold = LOCKOUT_THRESHOLD;
    config.rbac.session_timeout_minutes = SESSION_TIMEOUT_MINUTES;

    config.monitor.business_hours_start = BUSINESS_HOURS_START;
    config.monitor.business_hours_end = BUSINESS_HOURS_END;
    config.monitor.queue_capacity = QUEUE_CAPACITY;
    config.monitor.activity_retention_hours = ACTIVITY_RETENTION_HOURS;
    config.monitor.alert_retention_hours = ALERT_RETENTION_HOURS;
    config.monitor.monitor_interval_ms = MONITOR_INTERVAL_MS;
    config.monitor.rapid_window_seconds = RAPID_WINDOW_SECONDS;
    config.monitor.rapid_threshold = RAPID_THRESHOLD;
    config.monitor.unusual_risk_threshold = UNUSUAL_RISK_THRESHOLD;
    config.monitor.detection_interval_seconds = DETECTION_INTERVAL_SECONDS;
    config.monitor.detection_window_minutes = DETECTION_WINDOW_MINUTES;
    config.monitor.role_change_threshold = ROLE_CHANGE_THRESHOLD;
    config.monitor.failed_login_threshold = FAILED_LOGIN_THRESHOLD;
    config.monitor.data_access_threshold = DATA_ACCESS_THRESHOLD;
    config.monitor.breach_interval_seconds = BREACH_INTERVAL_SECONDS;
    config.monitor.breach_window_minutes = BREACH_WINDOW_MINUTES;
    config.monitor.export_threshold = EXPORT_THRESHOLD;
    config.monitor.degraded_failure_threshold = DEGRADED_FAILURE_THRESHOLD;
    config.monitor.analysis_threads = ANALYSIS_THREADS;

    config.consent.gated_resources = {
        {"third_party_share", "third_party"},
        {"marketing_profile", "marketing"}
    };

    config.audit.enabled = AUDIT_ENABLED;
    config.audit.audit_file = "";

    config.persistence.enabled = PERSISTENCE_ENABLED;
    config.persistence.checkpoint_interval_seconds = CHECKPOINT_INTERVAL_SECONDS;

    config.daemon.http_host = DAEMON_HTTP_HOST;
    config.daemon.http_port = DAEMON_HTTP_PORT;

    return config;
}

std::string Config::to_string(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN: return "WARN";
        case LogLevel::INFO: return "INFO";
        case LogLevel::DEBUG: return "DEBUG";
    }
    return "INFO";
}

std::optional<LogLevel> Config::parseLogLevel(const std::string& value) {
    if (value == "DEBUG") return LogLevel::DEBUG;
    if (value == "INFO") return LogLevel::INFO;
    if (value == "WARN") return LogLevel::WARN;
    if (value == "ERROR") return LogLevel::ERROR;
    return std::nullopt;
}

void Config::resetToDefaults() {
    global_ = createDefaultConfig();
    applyPathDefaults();
}

void Config::applyPathDefaults() {
    auto& path_manager = PathManager::instance();

    global_.log_file = path_manager.getLogFile();
    global_.state_dir = path_manager.getStateDir();
    global_.audit.audit_file = path_manager.getAuditFile();
}

std::optional<std::string> Config::findBestConfig() const {
    auto paths = PathManager::instance().getConfigSearchPaths();

    for (const auto& path : paths) {
        if (std::filesystem::exists(path) && access(path.c_str(), R_OK) == 0) {
            return path;
        }
    }

    return std::nullopt;
}

bool Config::load(const std::string& config_file) {
    try {
        global_ = createDefaultConfig();
        applyPathDefaults();

        std::string effective_config_file = config_file;
        if (effective_config_file.empty()) {
            auto best = findBestConfig();
            effective_config_file = best ? *best : PathManager::instance().getConfigFile();
        }

        current_config_path_ = effective_config_file;

        bool loaded = tryLoadTomlFile(effective_config_file);

        Logger::instance().info("[Config] Loaded | path={} | from_file={}", effective_config_file, loaded);
        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("[Config] Parse failed | error={}", e.what());
        return false;
    }
}

bool Config::tryLoadTomlFile(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        Logger::instance().debug("[Config] Config file not found | path={}", path);
        return false;
    }

    if (access(path.c_str(), R_OK) != 0) {
        Logger::instance().debug("[Config] Config file not readable | path={}", path);
        return false;
    }

    auto data = toml::parse(path);

    if (data.contains("global")) {
        const auto& section = data.at("global");
        readIfPresent(section, "log_file", global_.log_file);
        readIfPresent(section, "state_dir", global_.state_dir);
        if (section.contains("log_level")) {
            auto level = parseLogLevel(toml::find<std::string>(section, "log_level"));
            if (level) {
                global_.log_level = *level;
            }
        }
    }

    if (data.contains("logging")) {
        const auto& section = data.at("logging");
        readIfPresent(section, "rotation_size_mb", global_.logging.rotation_size_mb);
        readIfPresent(section, "max_files", global_.logging.max_files);
        if (section.contains("format")) {
            global_.logging.format = toml::find<std::string>(section, "format") == "json"
                ? LogFormat::JSON : LogFormat::TEXT;
        }
    }

    if (data.contains("rbac")) {
        const auto& section = data.at("rbac");
        readIfPresent(section, "lockout_threshold", global_.rbac.lockout_threshold);
        readIfPresent(section, "session_timeout_minutes", global_.rbac.session_timeout_minutes);
        readIfPresent(section, "bootstrap_admins", global_.rbac.bootstrap_admins);
    }

    if (data.contains("monitor")) {
        const auto& section = data.at("monitor");
        auto& monitor = global_.monitor;
        readIfPresent(section, "business_hours_start", monitor.business_hours_start);
        readIfPresent(section, "business_hours_end", monitor.business_hours_end);
        readIfPresent(section, "queue_capacity", monitor.queue_capacity);
        readIfPresent(section, "activity_retention_hours", monitor.activity_retention_hours);
        readIfPresent(section, "alert_retention_hours", monitor.alert_retention_hours);
        readIfPresent(section, "monitor_interval_ms", monitor.monitor_interval_ms);
        readIfPresent(section, "rapid_window_seconds", monitor.rapid_window_seconds);
        readIfPresent(section, "rapid_threshold", monitor.rapid_threshold);
        readIfPresent(section, "unusual_risk_threshold", monitor.unusual_risk_threshold);
        readIfPresent(section, "detection_interval_seconds", monitor.detection_interval_seconds);
        readIfPresent(section, "detection_window_minutes", monitor.detection_window_minutes);
        readIfPresent(section, "role_change_threshold", monitor.role_change_threshold);
        readIfPresent(section, "failed_login_threshold", monitor.failed_login_threshold);
        readIfPresent(section, "data_access_threshold", monitor.data_access_threshold);
        readIfPresent(section, "breach_interval_seconds", monitor.breach_interval_seconds);
        readIfPresent(section, "breach_window_minutes", monitor.breach_window_minutes);
        readIfPresent(section, "export_threshold", monitor.export_threshold);
        readIfPresent(section, "degraded_failure_threshold", monitor.degraded_failure_threshold);
        readIfPresent(section, "analysis_threads", monitor.analysis_threads);
    }

    if (data.contains("consent")) {
        const auto& section = data.at("consent");
        readIfPresent(section, "gated_resources", global_.consent.gated_resources);
    }

    if (data.contains("compliance")) {
        const auto& section = data.at("compliance");
        readIfPresent(section, "bank_accounts", global_.compliance.bank_accounts);
    }

    if (data.contains("audit")) {
        const auto& section = data.at("audit");
        readIfPresent(section, "enabled", global_.audit.enabled);
        readIfPresent(section, "audit_file", global_.audit.audit_file);
    }

    if (data.contains("persistence")) {
        const auto& section = data.at("persistence");
        readIfPresent(section, "enabled", global_.persistence.enabled);
        readIfPresent(section, "checkpoint_interval_seconds", global_.persistence.checkpoint_interval_seconds);
    }

    if (data.contains("daemon")) {
        const auto& section = data.at("daemon");
        readIfPresent(section, "http_host", global_.daemon.http_host);
        if (section.contains("http_port")) {
            global_.daemon.http_port = static_cast<uint16_t>(toml::find<int>(section, "http_port"));
        }
    }

    Logger::instance().debug("[Config] Config file parsed | path={}", path);
    return true;
}

bool Config::save(const std::string& config_file) {
    try {
        std::string effective_config_file = config_file;
        if (effective_config_file.empty()) {
            effective_config_file = current_config_path_.empty()
                ? PathManager::instance().getConfigFile()
                : current_config_path_;
        }

        const auto& monitor = global_.monitor;

        toml::array admins;
        for (const auto& admin : global_.rbac.bootstrap_admins) {
            admins.push_back(admin);
        }

        toml::value data = toml::table{
            {"global", toml::table{
                {"log_file", global_.log_file},
                {"log_level", to_string(global_.log_level)},
                {"state_dir", global_.state_dir}
            }},
            {"logging", toml::table{
                {"rotation_size_mb", global_.logging.rotation_size_mb},
                {"max_files", global_.logging.max_files},
                {"format", global_.logging.format == LogFormat::JSON ? "json" : "text"}
            }},
            {"rbac", toml::table{
                {"lockout_threshold", global_.rbac.lockout_threshold},
                {"session_timeout_minutes", global_.rbac.session_timeout_minutes},
                {"bootstrap_admins", admins}
            }},
            {"monitor", toml::table{
                {"business_hours_start", monitor.business_hours_start},
                {"business_hours_end", monitor.business_hours_end},
                {"queue_capacity", monitor.queue_capacity},
                {"activity_retention_hours", monitor.activity_retention_hours},
                {"alert_retention_hours", monitor.alert_retention_hours},
                {"monitor_interval_ms", monitor.monitor_interval_ms},
                {"rapid_window_seconds", monitor.rapid_window_seconds},
                {"rapid_threshold", monitor.rapid_threshold},
                {"unusual_risk_threshold", monitor.unusual_risk_threshold},
                {"detection_interval_seconds", monitor.detection_interval_seconds},
                {"detection_window_minutes", monitor.detection_window_minutes},
                {"role_change_threshold", monitor.role_change_threshold},
                {"failed_login_threshold", monitor.failed_login_threshold},
                {"data_access_threshold", monitor.data_access_threshold},
                {"breach_interval_seconds", monitor.breach_interval_seconds},
                {"breach_window_minutes", monitor.breach_window_minutes},
                {"export_threshold", monitor.export_threshold},
                {"degraded_failure_threshold", monitor.degraded_failure_threshold},
                {"analysis_threads", monitor.analysis_threads}
            }},
            {"consent", toml::table{
                {"gated_resources", toTable(global_.consent.gated_resources)}
            }},
            {"compliance", toml::table{
                {"bank_accounts", toTable(global_.compliance.bank_accounts)}
            }},
            {"audit", toml::table{
                {"enabled", global_.audit.enabled},
                {"audit_file", global_.audit.audit_file}
            }},
            {"persistence", toml::table{
                {"enabled", global_.persistence.enabled},
                {"checkpoint_interval_seconds", global_.persistence.checkpoint_interval_seconds}
            }},
            {"daemon", toml::table{
                {"http_host", global_.daemon.http_host},
                {"http_port", global_.daemon.http_port}
            }}
        };

        std::filesystem::path config_dir = std::filesystem::path(effective_config_file).parent_path();
        if (!config_dir.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(config_dir, ec);
        }

        std::ofstream file(effective_config_file);
        if (!file) {
            Logger::instance().error("[Config] File open failed | path={}", effective_config_file);
            return false;
        }

        file << toml::format(data);
        file.close();

        chmod(effective_config_file.c_str(), 0640);

        current_config_path_ = effective_config_file;

        Logger::instance().info("[Config] Saved | path={}", effective_config_file);
        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("[Config] Save failed | error={}", e.what());
        return false;
    }
}

bool Config::exists() const {
    return std::filesystem::exists(getConfigPath());
}

const std::vector<std::string>& Config::knownKeys() {
    static const std::vector<std::string> keys = {
        "log_file", "log_level", "state_dir",
        "logging.rotation_size_mb", "logging.max_files", "logging.format",
        "rbac.lockout_threshold", "rbac.session_timeout_minutes", "rbac.bootstrap_admins",
        "monitor.business_hours_start", "monitor.business_hours_end",
        "monitor.queue_capacity", "monitor.activity_retention_hours", "monitor.alert_retention_hours",
        "monitor.monitor_interval_ms", "monitor.rapid_window_seconds",
        "monitor.rapid_threshold", "monitor.unusual_risk_threshold",
        "monitor.detection_interval_seconds", "monitor.detection_window_minutes",
        "monitor.role_change_threshold", "monitor.failed_login_threshold",
        "monitor.data_access_threshold", "monitor.breach_interval_seconds",
        "monitor.breach_window_minutes", "monitor.export_threshold",
        "monitor.degraded_failure_threshold", "monitor.analysis_threads",
        "audit.enabled", "audit.audit_file",
        "persistence.enabled", "persistence.checkpoint_interval_seconds",
        "daemon.http_host", "daemon.http_port"
    };
    return keys;
}

bool Config::setValue(const std::string& key, const std::string& value) {
    auto& monitor = global_.monitor;

    if (key == "log_file") global_.log_file = value;
    else if (key == "log_level") {
        auto level = parseLogLevel(value);
        if (!level) return false;
        global_.log_level = *level;
    }
    else if (key == "state_dir") global_.state_dir = value;
    else if (key == "logging.rotation_size_mb") global_.logging.rotation_size_mb = std::stoull(value);
    else if (key == "logging.max_files") global_.logging.max_files = std::stoull(value);
    else if (key == "logging.format") {
        global_.logging.format = (value == "json") ? LogFormat::JSON : LogFormat::TEXT;
    }
    else if (key == "rbac.lockout_threshold") global_.rbac.lockout_threshold = std::stoi(value);
    else if (key == "rbac.session_timeout_minutes") global_.rbac.session_timeout_minutes = std::stoi(value);
    else if (key == "rbac.bootstrap_admins") {
        std::vector<std::string> admins;
        std::stringstream stream(value);
        std::string item;
        while (std::getline(stream, item, ',')) {
            auto start = item.find_first_not_of(" \t");
            auto end = item.find_last_not_of(" \t");
            if (start != std::string::npos) {
                admins.push_back(item.substr(start, end - start + 1));
            }
        }
        global_.rbac.bootstrap_admins = std::move(admins);
    }
    else if (key == "monitor.business_hours_start") monitor.business_hours_start = std::stoi(value);
    else if (key == "monitor.business_hours_end") monitor.business_hours_end = std::stoi(value);
    else if (key == "monitor.queue_capacity") monitor.queue_capacity = std::stoull(value);
    else if (key == "monitor.activity_retention_hours") monitor.activity_retention_hours = std::stoi(value);
    else if (key == "monitor.alert_retention_hours") monitor.alert_retention_hours = std::stoi(value);
    else if (key == "monitor.monitor_interval_ms") monitor.monitor_interval_ms = std::stoi(value);
    else if (key == "monitor.rapid_window_seconds") monitor.rapid_window_seconds = std::stoi(value);
    else if (key == "monitor.rapid_threshold") monitor.rapid_threshold = std::stoi(value);
    else if (key == "monitor.unusual_risk_threshold") monitor.unusual_risk_threshold = std::stoi(value);
    else if (key == "monitor.detection_interval_seconds") monitor.detection_interval_seconds = std::stoi(value);
    else if (key == "monitor.detection_window_minutes") monitor.detection_window_minutes = std::stoi(value);
    else if (key == "monitor.role_change_threshold") monitor.role_change_threshold = std::stoi(value);
    else if (key == "monitor.failed_login_threshold") monitor.failed_login_threshold = std::stoi(value);
    else if (key == "monitor.data_access_threshold") monitor.data_access_threshold = std::stoi(value);
    else if (key == "monitor.breach_interval_seconds") monitor.breach_interval_seconds = std::stoi(value);
    else if (key == "monitor.breach_window_minutes") monitor.breach_window_minutes = std::stoi(value);
    else if (key == "monitor.export_threshold") monitor.export_threshold = std::stoi(value);
    else if (key == "monitor.degraded_failure_threshold") monitor.degraded_failure_threshold = std::stoi(value);
    else if (key == "monitor.analysis_threads") monitor.analysis_threads = std::stoi(value);
    else if (key == "audit.enabled") global_.audit.enabled = parseBool(value);
    else if (key == "audit.audit_file") global_.audit.audit_file = value;
    else if (key == "persistence.enabled") global_.persistence.enabled = parseBool(value);
    else if (key == "persistence.checkpoint_interval_seconds") {
        global_.persistence.checkpoint_interval_seconds = std::stoi(value);
    }
    else if (key == "daemon.http_host") global_.daemon.http_host = value;
    else if (key == "daemon.http_port") global_.daemon.http_port = static_cast<uint16_t>(std::stoi(value));
    else return false;

    return true;
}

std::optional<std::string> Config::getValue(const std::string& key) const {
    const auto& monitor = global_.monitor;

    if (key == "log_file") return global_.log_file;
    else if (key == "log_level") return to_string(global_.log_level);
    else if (key == "state_dir") return global_.state_dir;
    else if (key == "logging.rotation_size_mb") return std::to_string(global_.logging.rotation_size_mb);
    else if (key == "logging.max_files") return std::to_string(global_.logging.max_files);
    else if (key == "logging.format") return global_.logging.format == LogFormat::JSON ? "json" : "text";
    else if (key == "rbac.lockout_threshold") return std::to_string(global_.rbac.lockout_threshold);
    else if (key == "rbac.session_timeout_minutes") return std::to_string(global_.rbac.session_timeout_minutes);
    else if (key == "rbac.bootstrap_admins") {
        std::string joined;
        for (const auto& admin : global_.rbac.bootstrap_admins) {
            if (!joined.empty()) joined += ",";
            joined += admin;
        }
        return joined;
    }
    else if (key == "monitor.business_hours_start") return std::to_string(monitor.business_hours_start);
    else if (key == "monitor.business_hours_end") return std::to_string(monitor.business_hours_end);
    else if (key == "monitor.queue_capacity") return std::to_string(monitor.queue_capacity);
    else if (key == "monitor.activity_retention_hours") return std::to_string(monitor.activity_retention_hours);
    else if (key == "monitor.alert_retention_hours") return std::to_string(monitor.alert_retention_hours);
    else if (key == "monitor.monitor_interval_ms") return std::to_string(monitor.monitor_interval_ms);
    else if (key == "monitor.rapid_window_seconds") return std::to_string(monitor.rapid_window_seconds);
    else if (key == "monitor.rapid_threshold") return std::to_string(monitor.rapid_threshold);
    else if (key == "monitor.unusual_risk_threshold") return std::to_string(monitor.unusual_risk_threshold);
    else if (key == "monitor.detection_interval_seconds") return std::to_string(monitor.detection_interval_seconds);
    else if (key == "monitor.detection_window_minutes") return std::to_string(monitor.detection_window_minutes);
    else if (key == "monitor.role_change_threshold") return std::to_string(monitor.role_change_threshold);
    else if (key == "monitor.failed_login_threshold") return std::to_string(monitor.failed_login_threshold);
    else if (key == "monitor.data_access_threshold") return std::to_string(monitor.data_access_threshold);
    else if (key == "monitor.breach_interval_seconds") return std::to_string(monitor.breach_interval_seconds);
    else if (key == "monitor.breach_window_minutes") return std::to_string(monitor.breach_window_minutes);
    else if (key == "monitor.export_threshold") return std::to_string(monitor.export_threshold);
    else if (key == "monitor.degraded_failure_threshold") return std::to_string(monitor.degraded_failure_threshold);
    else if (key == "monitor.analysis_threads") return std::to_string(monitor.analysis_threads);
    else if (key == "audit.enabled") return global_.audit.enabled ? "true" : "false";
    else if (key == "audit.audit_file") return global_.audit.audit_file;
    else if (key == "persistence.enabled") return global_.persistence.enabled ? "true" : "false";
    else if (key == "persistence.checkpoint_interval_seconds") {
        return std::to_string(global_.persistence.checkpoint_interval_seconds);
    }
    else if (key == "daemon.http_host") return global_.daemon.http_host;
    else if (key == "daemon.http_port") return std::to_string(global_.daemon.http_port);

    return std::nullopt;
}

std::string Config::getConfigPath() const {
    if (!current_config_path_.empty()) {
        return current_config_path_;
    }
    return PathManager::instance().getConfigFile();
}

std::string Config::getPidFilePath() const {
    return PathManager::instance().getPidFile();
}

}}
