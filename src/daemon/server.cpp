#include "access_guard/daemon/server.hpp"
#include "access_guard/common/logger.hpp"
#include "access_guard/common/constants.hpp"
#include "access_guard/common/paths.hpp"
#include <unistd.h>
#include <signal.h>
#include <filesystem>
#include <thread>
#include <cstdlib>

namespace access_guard {
namespace daemon {

namespace {

constexpr auto TICK = std::chrono::milliseconds(100);
constexpr auto HEARTBEAT_INTERVAL = std::chrono::minutes(5);

}

std::atomic<bool> DaemonServer::shutdown_requested_{false};
std::atomic<bool> DaemonServer::reload_requested_{false};

DaemonServer::DaemonServer(const common::DaemonConfig& config)
    : config_(config),
      active_config_(ReloadableConfig::capture(common::Config::instance().global())) {}

DaemonServer::~DaemonServer() {
    stopService();
}

bool DaemonServer::runningInContainer() {
    return std::getenv("ACCESS_GUARD_CONTAINER") != nullptr ||
           std::getenv("KUBERNETES_SERVICE_HOST") != nullptr ||
           std::filesystem::exists("/.dockerenv");
}

bool DaemonServer::isDaemonRunning() {
    return getDaemonPid() > 0;
}

int DaemonServer::getDaemonPid() {
    return PidFile::livePid(common::Config::instance().getPidFilePath());
}

bool DaemonServer::sendSignalToDaemon(int signal) {
    int pid = getDaemonPid();
    return pid > 0 && kill(pid, signal) == 0;
}

bool DaemonServer::startService() {
    auto& logger = common::Logger::instance();

    if (running_) {
        logger.warn("[Daemon] Already running");
        return true;
    }

    // Orchestrators supervise the container; a PID file there is noise.
    if (!runningInContainer()) {
        pid_file_ = std::make_unique<PidFile>(common::Config::instance().getPidFilePath());
        if (!pid_file_->acquire()) {
            pid_file_.reset();
            return false;
        }
    }

    const auto& global_config = common::Config::instance().global();
    logger.info("[Daemon] Starting | version={} | mode={} | pid={} | state_dir={}",
                constants::version::VERSION,
                common::to_string(common::PathManager::instance().mode()),
                getpid(), global_config.state_dir);

    try {
        service_ = std::make_unique<service::AccessControlService>(
            global_config, clock_, service::AccessControlService::defaultCollaborators(global_config));
    } catch (const std::exception& e) {
        logger.error("[Daemon] Service construction failed | error={}", e.what());
        pid_file_.reset();
        return false;
    }

    if (!service_->initialize()) {
        logger.error("[Daemon] Service initialization failed | state_dir={}", global_config.state_dir);
        service_.reset();
        pid_file_.reset();
        return false;
    }

    http_server_ = std::make_unique<HttpApiServer>(config_.http_host, config_.http_port, *service_);
    if (!http_server_->start()) {
        logger.error("[Daemon] Status API failed to start | host={} | port={}", config_.http_host, config_.http_port);
        http_server_.reset();
        service_->shutdown();
        service_.reset();
        pid_file_.reset();
        return false;
    }

    active_config_ = ReloadableConfig::capture(global_config);
    shutdown_requested_ = false;
    reload_requested_ = false;
    installSignalHandlers();

    running_ = true;
    return true;
}

void DaemonServer::stopService() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false)) {
        return;
    }

    common::Logger::instance().info("[Daemon] Shutting down");

    if (http_server_) {
        http_server_->stop();
        http_server_.reset();
    }

    // Stops workers and writes the final checkpoint.
    if (service_) {
        service_->shutdown();
        service_.reset();
    }

    pid_file_.reset();
    common::Logger::instance().info("[Daemon] Stopped");
}

void DaemonServer::run() {
    if (!running_) {
        common::Logger::instance().error("[Daemon] Not started, cannot run");
        return;
    }

    auto next_heartbeat = std::chrono::steady_clock::now() + HEARTBEAT_INTERVAL;

    while (running_ && !shutdown_requested_.load()) {
        std::this_thread::sleep_for(TICK);

        if (reload_requested_.exchange(false)) {
            reloadConfiguration();
        }

        if (std::chrono::steady_clock::now() >= next_heartbeat) {
            logHeartbeat();
            next_heartbeat += HEARTBEAT_INTERVAL;
        }
    }

    common::Logger::instance().info("[Daemon] Shutdown signal received");
}

void DaemonServer::installSignalHandlers() {
    struct sigaction action {};
    action.sa_handler = &DaemonServer::onSignal;
    sigemptyset(&action.sa_mask);

    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
    sigaction(SIGHUP, &action, nullptr);
}

// Async-signal context: only lock-free atomics are touched here.
void DaemonServer::onSignal(int signal) {
    if (signal == SIGHUP) {
        reload_requested_.store(true);
    } else {
        shutdown_requested_.store(true);
    }
}

void DaemonServer::reloadConfiguration() {
    auto& logger = common::Logger::instance();
    auto started = std::chrono::steady_clock::now();
    logger.info("[Reload] Configuration reload initiated");

    try {
        auto& config = common::Config::instance();
        if (!config.load()) {
            logger.error("[Reload] Failed to load config | retaining previous configuration");
            return;
        }

        auto next = ReloadableConfig::capture(config.global());

        if (next.log_level != active_config_.log_level) {
            logger.info("[Reload] Log level changed | {}→{}",
                        common::Config::to_string(active_config_.log_level),
                        common::Config::to_string(next.log_level));
            logger.setLevel(next.log_level);
        }

        if (service_ && next.bootstrap_admins != active_config_.bootstrap_admins) {
            size_t seeded = service_->seedBootstrapAdmins(next.bootstrap_admins);
            logger.info("[Reload] Bootstrap admins updated | seeded={}", seeded);
        }

        if (next.listenerChanged(active_config_)) {
            logger.warn("[Reload] HTTP listener change requires restart | host={} | port={}",
                        next.http_host, next.http_port);
        }

        active_config_ = next;

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        logger.info("[Reload] Complete | duration_ms={}", elapsed.count());
    } catch (const std::exception& e) {
        logger.error("[Reload] Failed | error={} | retaining previous configuration", e.what());
    }
}

void DaemonServer::logHeartbeat() {
    if (!service_) {
        return;
    }
    auto m = service_->metrics();
    common::Logger::instance().info(
        "[Daemon] Heartbeat | users={} | locked={} | open_alerts={} | open_incidents={} | dropped={} | audit_failures={}",
        m.total_users, m.locked_users, m.open_alerts, m.open_incidents, m.dropped_events, m.audit_failures);
}

}}
