#pragma once

#include "config.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <memory>
#include <string>
#include <vector>

namespace access_guard {
namespace common {

enum class LogMode {
    CONSOLE_ONLY,
    FILE_ONLY
};

// Process-wide spdlog front end. Every call is a no-op until initialize()
// runs, so library code can log unconditionally from tests.
class Logger {
public:
    static Logger& instance();

    void initialize(LogMode mode, const std::string& log_file, LogLevel level, const LoggingConfig& logging_config);
    void setLevel(LogLevel level);
    void shutdown();
    void flush();

    // Breach incidents and other events an operator must act on.
    template<typename... Args>
    void critical(const std::string& format, Args&&... args) {
        if (logger_) logger_->critical(fmt::runtime(format), std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(const std::string& format, Args&&... args) {
        if (logger_) logger_->error(fmt::runtime(format), std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(const std::string& format, Args&&... args) {
        if (logger_) logger_->warn(fmt::runtime(format), std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(const std::string& format, Args&&... args) {
        if (logger_) logger_->info(fmt::runtime(format), std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(const std::string& format, Args&&... args) {
        if (logger_) logger_->debug(fmt::runtime(format), std::forward<Args>(args)...);
    }

    bool isInitialized() const { return initialized_; }
    bool writesToFile() const { return file_mode_; }

private:
    Logger() = default;

    std::shared_ptr<spdlog::logger> logger_;
    bool initialized_ = false;
    bool file_mode_ = false;

    static spdlog::level::level_enum toSpdlogLevel(LogLevel level);
    static std::string formattedLogPath(LogFormat format, const std::string& base_path);
    static std::string patternFor(LogFormat format);

    // Returns an empty pointer when the file cannot be opened.
    static spdlog::sink_ptr makeFileSink(const std::string& log_file, const LoggingConfig& logging_config);
};

}}
