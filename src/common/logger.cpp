#include "access_guard/common/logger.hpp"
#include "access_guard/common/constants.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>
#include <filesystem>
#include <cstdlib>

namespace access_guard {
namespace common {

namespace {

// Containers collect stderr, so a log file would only hide output.
bool preferConsole() {
    return std::getenv("ACCESS_GUARD_CONTAINER") != nullptr ||
           std::getenv("KUBERNETES_SERVICE_HOST") != nullptr ||
           std::filesystem::exists("/.dockerenv");
}

spdlog::sink_ptr makeConsoleSink() {
    return std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
}

}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

std::string Logger::patternFor(LogFormat format) {
    if (format == LogFormat::JSON) {
        return std::string(R"({"timestamp":"%Y-%m-%dT%H:%M:%S.%e","service":")") +
               constants::system::LOGGER_NAME +
               R"(","pid":%P,"thread":%t,"level":"%l","message":"%v"})";
    }
    return "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v";
}

spdlog::sink_ptr Logger::makeFileSink(const std::string& log_file, const LoggingConfig& logging_config) {
    std::filesystem::path log_dir = std::filesystem::path(log_file).parent_path();

    std::error_code ec;
    if (!log_dir.empty() && !std::filesystem::exists(log_dir, ec) &&
        !std::filesystem::create_directories(log_dir, ec)) {
        std::cerr << "[Logger] Cannot create log directory " << log_dir << ": " << ec.message() << std::endl;
        return nullptr;
    }

    try {
        size_t max_size = logging_config.rotation_size_mb * 1024 * 1024;
        return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            formattedLogPath(logging_config.format, log_file), max_size, logging_config.max_files);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "[Logger] Cannot open log file " << log_file << ": " << ex.what() << std::endl;
        return nullptr;
    }
}

void Logger::initialize(LogMode mode, const std::string& log_file, LogLevel level, const LoggingConfig& logging_config) {
    if (initialized_) {
        if (logger_) {
            logger_->warn("[Logger] Already initialized, ignoring duplicate initialization");
        }
        return;
    }

    const char* logger_name = constants::system::LOGGER_NAME;
    spdlog::drop(logger_name);

    spdlog::sink_ptr sink;
    file_mode_ = false;

    if (mode == LogMode::FILE_ONLY && !log_file.empty() && !preferConsole()) {
        sink = makeFileSink(log_file, logging_config);
        file_mode_ = sink != nullptr;
        if (!file_mode_) {
            std::cerr << "[Logger] Falling back to console output" << std::endl;
        }
    }

    if (!sink) {
        sink = makeConsoleSink();
    }

    auto spdlog_level = toSpdlogLevel(level);
    sink->set_level(spdlog_level);

    logger_ = std::make_shared<spdlog::logger>(logger_name, sink);
    logger_->set_pattern(patternFor(logging_config.format));
    logger_->set_level(spdlog_level);

    if (file_mode_) {
        // Worker threads log continuously; bound how much a crash can lose.
        logger_->flush_on(spdlog::level::warn);
        spdlog::flush_every(std::chrono::seconds(3));
    }

    spdlog::register_logger(logger_);
    initialized_ = true;
}

void Logger::setLevel(LogLevel level) {
    if (!logger_) {
        return;
    }
    auto spdlog_level = toSpdlogLevel(level);
    logger_->set_level(spdlog_level);
    for (auto& sink : logger_->sinks()) {
        sink->set_level(spdlog_level);
    }
}

void Logger::shutdown() {
    if (logger_) {
        logger_->flush();
        spdlog::drop(constants::system::LOGGER_NAME);
        logger_.reset();
    }
    spdlog::shutdown();
    initialized_ = false;
    file_mode_ = false;
}

void Logger::flush() {
    if (logger_) {
        logger_->flush();
    }
}

spdlog::level::level_enum Logger::toSpdlogLevel(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::WARN: return spdlog::level::warn;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::DEBUG: return spdlog::level::debug;
    }
    return spdlog::level::info;
}

// access-guard.log becomes access-guard.json.log so text and JSON logs
// never interleave in one file.
std::string Logger::formattedLogPath(LogFormat format, const std::string& base_path) {
    if (format != LogFormat::JSON) {
        return base_path;
    }
    std::filesystem::path p(base_path);
    std::filesystem::path renamed = p.parent_path() / (p.stem().string() + ".json" + p.extension().string());
    return renamed.string();
}

}}
