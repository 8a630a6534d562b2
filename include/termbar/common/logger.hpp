#pragma once

#include "config.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <memory>
#include <string>

namespace termbar {
namespace common {

enum class LogMode {
    CONSOLE_ONLY,
    FILE_ONLY
};

// Every call is a no-op until initialize() runs, so an embedding program
// that never configures logging gets no log lines mixed into its bars.
class Logger {
public:
    static Logger& instance();

    void initialize(LogMode mode, const LoggingConfig& logging_config);
    void setLevel(LogLevel level);
    void shutdown();

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

    void flush();

    // False before initialize() and for levels below the configured one.
    bool shouldLog(LogLevel level) const;

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> logger_;
    bool initialized_ = false;
    LogFormat current_format_ = LogFormat::TEXT;

    static spdlog::level::level_enum toSpdlogLevel(LogLevel level);
    std::string getLogFileWithSuffix(LogFormat format, const std::string& base_path) const;
};

// Tags every line with "[component] ", the same tag formatContext() puts
// on error messages, so a bar's log lines and its errors read alike.
class ComponentLog {
public:
    explicit ComponentLog(const char* component) : component_(component) {}

    template<typename... Args>
    void error(const std::string& format, Args&&... args) const {
        if (Logger::instance().shouldLog(LogLevel::ERROR))
            Logger::instance().error(tagged(format), std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(const std::string& format, Args&&... args) const {
        if (Logger::instance().shouldLog(LogLevel::WARN))
            Logger::instance().warn(tagged(format), std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(const std::string& format, Args&&... args) const {
        if (Logger::instance().shouldLog(LogLevel::INFO))
            Logger::instance().info(tagged(format), std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(const std::string& format, Args&&... args) const {
        if (Logger::instance().shouldLog(LogLevel::DEBUG))
            Logger::instance().debug(tagged(format), std::forward<Args>(args)...);
    }

private:
    const char* component_;

    std::string tagged(const std::string& format) const {
        return std::string("[") + component_ + "] " + format;
    }
};

}}
