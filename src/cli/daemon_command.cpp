#define _DEFAULT_SOURCE

#include "daemon_command.hpp"
#include "access_guard/common/logger.hpp"
#include "access_guard/common/paths.hpp"
#include "access_guard/config/validator.hpp"
#include "access_guard/daemon/server.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <unistd.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <csignal>
#include <cstdlib>
#include <cerrno>
#include <cstring>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <thread>

namespace access_guard {
namespace cli {

namespace {

constexpr const char* UNIT_NAME = "access-guard";
constexpr int STOP_TIMEOUT_SECONDS = 30;

uint64_t metricCount(const nlohmann::json& data, const char* section, const char* key) {
    auto it = data.find(section);
    if (it == data.end() || !it->is_object()) {
        return 0;
    }
    return it->value(key, uint64_t{0});
}

}

DaemonCommand::DaemonCommand() = default;

void DaemonCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;

    run_cmd_ = subcommand->add_subcommand("run", "Run the monitoring service in the foreground");
    run_cmd_->add_option("-p,--http-port", http_port_, "Status API port");
    run_cmd_->add_option("-a,--http-host", http_host_, "Status API bind address (default: 127.0.0.1)");
    run_cmd_->add_option("-s,--state-dir", state_dir_, "Directory for persisted state");
    run_cmd_->add_flag("-c,--check-config", check_config_, "Validate configuration and exit");
    markCalledOn(run_cmd_);

    start_cmd_ = subcommand->add_subcommand("start", "Start the service in the background");
    markCalledOn(start_cmd_);

    stop_cmd_ = subcommand->add_subcommand("stop", "Stop the service and write a final checkpoint");
    markCalledOn(stop_cmd_);

    reload_cmd_ = subcommand->add_subcommand("reload", "Reload log level and bootstrap admins");
    markCalledOn(reload_cmd_);

    status_cmd_ = subcommand->add_subcommand("status", "Show service status and alert counts");
    markCalledOn(status_cmd_);

    restart_cmd_ = subcommand->add_subcommand("restart", "Restart the service");
    markCalledOn(restart_cmd_);
}

int DaemonCommand::execute() {
    if (run_cmd_->parsed()) return executeRun();
    if (start_cmd_->parsed()) return executeStart();
    if (stop_cmd_->parsed()) return executeStop();
    if (reload_cmd_->parsed()) return executeReload();
    if (status_cmd_->parsed()) return executeStatus();
    if (restart_cmd_->parsed()) return executeRestart();

    std::cout << subcommand_->help() << std::endl;
    return 0;
}

bool DaemonCommand::isSystemdAvailable() {
    return std::filesystem::exists("/run/systemd/system") &&
           std::filesystem::exists("/usr/bin/systemctl");
}

int DaemonCommand::systemctl(const std::string& action) {
    std::string cmd = common::PathManager::instance().isSystemMode() ? "sudo systemctl" : "systemctl --user";
    cmd += " " + action + " " + UNIT_NAME;
    std::cout << "Running: " << cmd << std::endl;
    return system(cmd.c_str()) == 0 ? 0 : 1;
}

// The background process chdirs to "/", so portable-mode relative paths
// must be pinned first.
void DaemonCommand::absolutizePaths(common::GlobalConfig& config) {
    std::error_code ec;
    for (std::string* path : {&config.state_dir, &config.log_file, &config.audit.audit_file}) {
        if (!path->empty()) {
            auto absolute = std::filesystem::absolute(*path, ec);
            if (!ec) {
                *path = absolute.lexically_normal().string();
            }
        }
    }
}

int DaemonCommand::executeStart() {
    if (isSystemdAvailable()) {
        return systemctl("start");
    }
    return startManually();
}

int DaemonCommand::startManually() {
    int running_pid = daemon::DaemonServer::getDaemonPid();
    if (running_pid > 0) {
        std::cerr << "access-guard is already running (PID: " << running_pid << ")" << std::endl;
        return 1;
    }

    auto& global_config = common::Config::instance().global();
    absolutizePaths(global_config);

    common::Logger::instance().flush();

    pid_t pid = fork();
    if (pid < 0) {
        std::cerr << "Failed to fork: " << strerror(errno) << std::endl;
        return 1;
    }

    if (pid > 0) {
        std::cout << "access-guard starting in background" << std::endl;
        std::cout << "Check status with: access-guard daemon status" << std::endl;
        return 0;
    }

    if (daemonize() != 0) {
        _exit(1);
    }

    common::Logger::instance().shutdown();
    common::Logger::instance().initialize(
        common::LogMode::FILE_ONLY,
        global_config.log_file,
        global_config.log_level,
        global_config.logging
    );
    common::Logger::instance().info("[Daemon] Background mode");

    exit(runServer(global_config.daemon));
}

int DaemonCommand::executeStop() {
    if (isSystemdAvailable()) {
        return systemctl("stop");
    }
    return stopManually();
}

int DaemonCommand::stopManually() {
    if (!daemon::DaemonServer::sendSignalToDaemon(SIGTERM)) {
        std::cerr << "access-guard is not running" << std::endl;
        return 1;
    }

    std::cout << "Stop signal sent, waiting for final checkpoint..." << std::endl;

    for (int i = 0; i < STOP_TIMEOUT_SECONDS; ++i) {
        if (!daemon::DaemonServer::isDaemonRunning()) {
            std::cout << "access-guard stopped" << std::endl;
            return 0;
        }
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }

    std::cerr << "access-guard did not stop within " << STOP_TIMEOUT_SECONDS << "s" << std::endl;
    return 1;
}

int DaemonCommand::executeReload() {
    if (daemon::DaemonServer::sendSignalToDaemon(SIGHUP)) {
        std::cout << "✓ Reload signal sent" << std::endl;
        return 0;
    }

    std::cerr << "access-guard is not running" << std::endl;
    return 1;
}

int DaemonCommand::executeStatus() {
    int pid = daemon::DaemonServer::getDaemonPid();
    if (pid < 0 && isSystemdAvailable()) {
        return systemctl("status");
    }

    std::cout << "● access-guard - access control and security monitoring" << std::endl;
    if (pid < 0) {
        std::cout << "   Active: inactive (dead)" << std::endl;
        return 3;
    }

    std::cout << "   Active: active (running)" << std::endl;
    std::cout << "   PID: " << pid << std::endl;
    printServiceSummary();
    return 0;
}

void DaemonCommand::printServiceSummary() {
    const auto& config = common::Config::instance().global();
    std::cout << "   Status API: " << config.daemon.http_host << ":" << config.daemon.http_port << std::endl;
    std::cout << "   State: " << config.state_dir << std::endl;

    httplib::Client client(config.daemon.http_host, config.daemon.http_port);
    client.set_connection_timeout(2, 0);
    client.set_read_timeout(5, 0);

    auto res = client.Get("/api/v1/metrics");
    if (!res || res->status != 200) {
        std::cout << "   Metrics: unavailable" << std::endl;
        return;
    }

    auto body = nlohmann::json::parse(res->body, nullptr, false);
    if (body.is_discarded() || !body.contains("data") || !body["data"].is_object()) {
        std::cout << "   Metrics: unreadable response" << std::endl;
        return;
    }

    const auto& data = body["data"];
    std::cout << "   Users: " << metricCount(data, "users", "total")
              << " (" << metricCount(data, "users", "locked") << " locked)" << std::endl;
    std::cout << "   Alerts: " << metricCount(data, "alerts", "open") << " open, "
              << metricCount(data, "alerts", "critical") << " critical" << std::endl;
    std::cout << "   Incidents: " << metricCount(data, "incidents", "open") << " open" << std::endl;

    uint64_t dropped = metricCount(data, "activities", "dropped");
    if (dropped > 0) {
        std::cout << "   Dropped activities: " << dropped << std::endl;
    }
}

int DaemonCommand::executeRestart() {
    if (isSystemdAvailable()) {
        return systemctl("restart");
    }

    if (daemon::DaemonServer::isDaemonRunning() && stopManually() != 0) {
        std::cerr << "Failed to stop access-guard" << std::endl;
        return 1;
    }
    return startManually();
}

int DaemonCommand::executeRun() {
    auto& global_config = common::Config::instance().global();

    if (http_port_ > 0) {
        global_config.daemon.http_port = http_port_;
    }
    if (!http_host_.empty()) {
        global_config.daemon.http_host = http_host_;
    }
    if (!state_dir_.empty()) {
        global_config.state_dir = state_dir_;
    }

    config::ConfigValidator validator;
    auto result = validator.validate(global_config);

    for (const auto& warning : result.warnings) {
        std::cerr << "  WARNING: " << warning << std::endl;
    }

    if (!result.is_valid) {
        std::cerr << "Configuration validation failed:" << std::endl;
        for (const auto& error : result.errors) {
            std::cerr << "  ERROR: " << error << std::endl;
        }
        return 1;
    }

    if (check_config_) {
        std::cout << "Configuration is valid" << std::endl;
        return 0;
    }

    common::Logger::instance().info("[Daemon] Foreground mode | http={}:{} | log_to_file={}",
                                    global_config.daemon.http_host,
                                    global_config.daemon.http_port,
                                    common::Logger::instance().writesToFile());

    return runServer(global_config.daemon);
}

int DaemonCommand::runServer(common::DaemonConfig daemon_config) {
    try {
        daemon::DaemonServer server(daemon_config);

        if (!server.startService()) {
            common::Logger::instance().error("[Daemon] Failed to start service");
            return 1;
        }

        server.run();
        server.stopService();
        return 0;
    } catch (const std::exception& e) {
        common::Logger::instance().error("[Daemon] Fatal | error={}", e.what());
        return 1;
    }
}

int DaemonCommand::daemonize() {
    pid_t pid = fork();
    if (pid < 0) {
        return -1;
    }
    if (pid > 0) {
        _exit(0);
    }

    if (setsid() < 0) {
        return -1;
    }

    signal(SIGCHLD, SIG_IGN);
    signal(SIGHUP, SIG_IGN);

    pid = fork();
    if (pid < 0) {
        return -1;
    }
    if (pid > 0) {
        _exit(0);
    }

    umask(027);
    if (chdir("/") < 0) {
        return -1;
    }

    for (int fd = static_cast<int>(sysconf(_SC_OPEN_MAX)); fd >= 0; fd--) {
        close(fd);
    }

    if (open("/dev/null", O_RDWR) < 0) return -1;
    if (dup(0) < 0) return -1;
    if (dup(0) < 0) return -1;

    return 0;
}

}}
