#pragma once

#include "termbar/bar/options.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace termbar {
namespace common {

enum class LogLevel {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3
};

enum class LogFormat {
    TEXT,
    JSON
};

std::optional<LogLevel> parseLogLevel(const std::string& name);

struct LoggingConfig {
    LogLevel level;
    std::string log_file;
    size_t rotation_size_mb;
    size_t max_files;
    LogFormat format;
};

struct GlobalConfig {
    LoggingConfig logging;
    bar::BarOptions bar;
};

class Config {
public:
    static Config& instance();

    // Resets to defaults, then overlays the file if it exists. Returns
    // false when the file exists but could not be parsed; the settings
    // from the previous load stay in effect.
    bool load(const std::string& config_file = "");

    std::optional<std::string> findBestConfig() const;
    std::vector<std::string> getConfigSearchPaths() const;

    const GlobalConfig& global() const { return global_; }
    GlobalConfig& global() { return global_; }

    bar::BarOptions barDefaults() const { return global_.bar; }

    // Path of the most recent load attempt, empty when none was found.
    const std::string& getConfigPath() const { return current_config_path_; }

private:
    Config();
    GlobalConfig global_;
    std::string current_config_path_;

    static GlobalConfig createDefaultConfig();
    bool tryLoadTomlFile(const std::string& path);
};

}}
