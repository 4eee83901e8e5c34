#pragma once

#include "../common/config.hpp"
#include <string>
#include <vector>

namespace access_guard {
namespace daemon {

// Settings a SIGHUP can change without restarting the daemon, plus the
// listener address, whose change is only reported.
struct ReloadableConfig {
    common::LogLevel log_level = common::LogLevel::INFO;
    std::vector<std::string> bootstrap_admins;
    std::string http_host;
    uint16_t http_port = 0;

    static ReloadableConfig capture(const common::GlobalConfig& config) {
        ReloadableConfig reloadable;
        reloadable.log_level = config.log_level;
        reloadable.bootstrap_admins = config.rbac.bootstrap_admins;
        reloadable.http_host = config.daemon.http_host;
        reloadable.http_port = config.daemon.http_port;
        return reloadable;
    }

    bool listenerChanged(const ReloadableConfig& other) const {
        return http_host != other.http_host || http_port != other.http_port;
    }
};

}}
