#include "access_guard/common/paths.hpp"
#include "access_guard/common/constants.hpp"
#include <unistd.h>
#include <filesystem>
#include <cstdlib>

namespace access_guard {
namespace common {

namespace {

// $var when set and non-empty, otherwise $HOME/home_suffix.
std::string xdgDir(const char* var, const char* home_suffix) {
    const char* value = std::getenv(var);
    if (value && *value) {
        return value;
    }
    if (!home_suffix) {
        return "";
    }
    const char* home = std::getenv("HOME");
    return home ? std::string(home) + home_suffix : "";
}

const std::string APP_DIR = "/access-guard";

}

const char* to_string(InstallMode mode) {
    switch (mode) {
        case InstallMode::SYSTEM: return "system";
        case InstallMode::USER: return "user";
        case InstallMode::PORTABLE: return "portable";
    }
    return "user";
}

PathManager& PathManager::instance() {
    static PathManager instance;
    return instance;
}

PathManager::PathManager() : mode_(detectMode()) {}

// Runs before the logger exists, so detection stays silent.
InstallMode PathManager::detectMode() {
    if (const char* forced = std::getenv("ACCESS_GUARD_MODE")) {
        std::string value(forced);
        if (value == "system") return InstallMode::SYSTEM;
        if (value == "user") return InstallMode::USER;
        if (value == "portable") return InstallMode::PORTABLE;
    }

    std::error_code ec;
    std::string exe_dir = std::filesystem::read_symlink("/proc/self/exe", ec).parent_path().string();
    if (ec) {
        return getuid() == 0 ? InstallMode::SYSTEM : InstallMode::USER;
    }

    if (exe_dir.rfind("/usr/", 0) == 0 || exe_dir.rfind("/opt/", 0) == 0) {
        return InstallMode::SYSTEM;
    }

    const char* home = std::getenv("HOME");
    if (home && exe_dir.rfind(home, 0) == 0) {
        return InstallMode::USER;
    }
    return InstallMode::PORTABLE;
}

std::string PathManager::getConfigDir() const {
    switch (mode_) {
        case InstallMode::SYSTEM: return "/etc" + APP_DIR;
        case InstallMode::USER: return xdgDir("XDG_CONFIG_HOME", "/.config") + APP_DIR;
        case InstallMode::PORTABLE: return "./config";
    }
    return "./config";
}

std::string PathManager::getConfigFile() const {
    return getConfigDir() + "/" + constants::system::CONFIG_FILE_NAME;
}

std::vector<std::string> PathManager::getConfigSearchPaths() const {
    std::vector<std::string> paths;
    if (const char* env = std::getenv("ACCESS_GUARD_CONFIG")) {
        paths.push_back(env);
    }
    paths.push_back(getConfigFile());
    return paths;
}

std::string PathManager::dataDir() const {
    switch (mode_) {
        case InstallMode::SYSTEM: return "/var/lib" + APP_DIR;
        case InstallMode::USER: return xdgDir("XDG_DATA_HOME", "/.local/share") + APP_DIR;
        case InstallMode::PORTABLE: return "./data";
    }
    return "./data";
}

std::string PathManager::logDir() const {
    switch (mode_) {
        case InstallMode::SYSTEM: return "/var/log" + APP_DIR;
        case InstallMode::USER: return xdgDir("XDG_STATE_HOME", "/.local/state") + APP_DIR;
        case InstallMode::PORTABLE: return "./logs";
    }
    return "./logs";
}

std::string PathManager::runtimeDir() const {
    switch (mode_) {
        case InstallMode::SYSTEM:
            return "/run" + APP_DIR;
        case InstallMode::USER: {
            std::string runtime = xdgDir("XDG_RUNTIME_DIR", nullptr);
            return runtime.empty() ? logDir() + "/run" : runtime + APP_DIR;
        }
        case InstallMode::PORTABLE:
            return "./run";
    }
    return "./run";
}

std::string PathManager::getLogFile() const {
    return logDir() + "/access-guard.log";
}

// Persisted users, activities, alerts, incidents and consents.
std::string PathManager::getStateDir() const {
    return dataDir() + "/state";
}

std::string PathManager::getAuditFile() const {
    return dataDir() + "/audit.jsonl";
}

std::string PathManager::getPidFile() const {
    return runtimeDir() + "/access-guard.pid";
}

}}
