#include "access_guard/daemon/pid_file.hpp"
#include "access_guard/common/logger.hpp"
#include <sys/stat.h>
#include <unistd.h>
#include <signal.h>
#include <filesystem>
#include <fstream>

namespace access_guard {
namespace daemon {

namespace {

int readPid(const std::string& path) {
    std::ifstream file(path);
    int pid = -1;
    if (!file || !(file >> pid) || pid <= 0) {
        return -1;
    }
    return pid;
}

}

PidFile::PidFile(std::string path) : path_(std::move(path)) {}

PidFile::~PidFile() {
    release();
}

int PidFile::livePid(const std::string& path) {
    int pid = readPid(path);
    if (pid > 0 && kill(pid, 0) == 0) {
        return pid;
    }
    return -1;
}

bool PidFile::acquire() {
    if (held_) {
        return true;
    }

    auto& logger = common::Logger::instance();
    std::error_code ec;

    std::filesystem::path dir = std::filesystem::path(path_).parent_path();
    if (!dir.empty() && !std::filesystem::exists(dir, ec) && !std::filesystem::create_directories(dir, ec)) {
        logger.error("[Daemon] PID directory unavailable | path={} | error={}", dir.string(), ec.message());
        return false;
    }

    int existing = readPid(path_);
    if (existing > 0) {
        if (kill(existing, 0) == 0) {
            logger.error("[Daemon] Already running | pid={}", existing);
            return false;
        }
        logger.warn("[Daemon] Stale PID file removed | old_pid={}", existing);
        std::filesystem::remove(path_, ec);
    }

    {
        std::ofstream file(path_, std::ios::trunc);
        if (!(file << getpid())) {
            logger.error("[Daemon] PID file creation failed | path={}", path_);
            return false;
        }
    }
    chmod(path_.c_str(), 0644);

    held_ = true;
    logger.info("[Daemon] PID file created | path={} | pid={}", path_, getpid());
    return true;
}

void PidFile::release() {
    if (!held_) {
        return;
    }
    held_ = false;

    // A restarted daemon may already own the path.
    if (readPid(path_) != getpid()) {
        return;
    }

    std::error_code ec;
    if (std::filesystem::remove(path_, ec)) {
        common::Logger::instance().debug("[Daemon] PID file removed | path={}", path_);
    }
}

}}
