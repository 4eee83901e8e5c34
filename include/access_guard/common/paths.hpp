#pragma once

#include <string>
#include <vector>

namespace access_guard {
namespace common {

enum class InstallMode {
    SYSTEM,
    USER,
    PORTABLE
};

const char* to_string(InstallMode mode);

// Resolves where configuration, state, audit trail, logs and the PID file
// live for the detected install mode. ACCESS_GUARD_MODE overrides detection.
class PathManager {
public:
    static PathManager& instance();

    InstallMode mode() const { return mode_; }
    bool isSystemMode() const { return mode_ == InstallMode::SYSTEM; }

    std::string getConfigDir() const;
    std::string getConfigFile() const;
    std::vector<std::string> getConfigSearchPaths() const;

    std::string getLogFile() const;
    std::string getStateDir() const;
    std::string getAuditFile() const;
    std::string getPidFile() const;

private:
    PathManager();
    InstallMode mode_;

    static InstallMode detectMode();
    std::string dataDir() const;
    std::string logDir() const;
    std::string runtimeDir() const;
};

}}
