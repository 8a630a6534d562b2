#include "termbar/common/config.hpp"
#include "termbar/common/constants.hpp"
#include "termbar/common/error_codes.hpp"
#include "termbar/common/logger.hpp"
#include "termbar/term/terminal.hpp"
#include <toml.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <unistd.h>

namespace termbar {
namespace common {

static const ComponentLog config_log("Config");

std::optional<LogLevel> parseLogLevel(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "error") return LogLevel::ERROR;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "debug") return LogLevel::DEBUG;
    return std::nullopt;
}

Config& Config::instance() {
    static Config instance;
    return instance;
}

Config::Config() {
    global_ = createDefaultConfig();
}

GlobalConfig Config::createDefaultConfig() {
    using namespace constants::config_defaults;

    GlobalConfig config;

    config.logging.level = LogLevel::WARN;
    config.logging.log_file = "";
    config.logging.rotation_size_mb = LOG_ROTATION_SIZE_MB;
    config.logging.max_files = LOG_MAX_FILES;
    config.logging.format = LogFormat::TEXT;

    config.bar = bar::BarOptions{};

    return config;
}

std::vector<std::string> Config::getConfigSearchPaths() const {
    std::vector<std::string> paths;

    if (const char* env = std::getenv(constants::system::CONFIG_ENV)) {
        if (*env) {
            paths.emplace_back(env);
        }
    }

    if (const char* xdg = std::getenv("XDG_CONFIG_HOME")) {
        if (*xdg) {
            paths.push_back(std::string(xdg) + "/termbar/" + constants::system::CONFIG_FILE_NAME);
        }
    }

    if (const char* home = std::getenv("HOME")) {
        if (*home) {
            paths.push_back(std::string(home) + "/.config/termbar/" +
                            constants::system::CONFIG_FILE_NAME);
        }
    }

    return paths;
}

std::optional<std::string> Config::findBestConfig() const {
    for (const auto& path : getConfigSearchPaths()) {
        if (std::filesystem::exists(path) && access(path.c_str(), R_OK) == 0) {
            return path;
        }
    }
    return std::nullopt;
}

bool Config::load(const std::string& config_file) {
    GlobalConfig previous = global_;

    global_ = createDefaultConfig();
    current_config_path_.clear();

    std::string effective_config_file = config_file;
    if (effective_config_file.empty()) {
        auto best = findBestConfig();
        if (!best) {
            config_log.debug("No configuration file found, using defaults");
            return true;
        }
        effective_config_file = *best;
    }

    current_config_path_ = effective_config_file;
    if (!tryLoadTomlFile(effective_config_file)) {
        global_ = std::move(previous);
        return false;
    }
    return true;
}

namespace {

template<typename T>
void assignIfPresent(const toml::value& section, const char* key, T& target) {
    if (section.contains(key)) {
        target = toml::find<T>(section, key);
    }
}

[[noreturn]] void invalidValue(const char* key, const std::string& value) {
    throw TermbarError(ErrorCode::CONFIG_INVALID_VALUE, "Invalid configuration value",
                       ErrorContext{"Config", {{"key", key}, {"value", value}}});
}

void loadBarSection(const toml::value& section, bar::BarOptions& options) {
    assignIfPresent(section, "mininterval", options.mininterval);
    assignIfPresent(section, "dynamic_miniters", options.dynamic_miniters);
    assignIfPresent(section, "dynamic_ncols", options.dynamic_ncols);
    assignIfPresent(section, "ascii", options.ascii);
    assignIfPresent(section, "unit", options.unit);
    assignIfPresent(section, "unit_scale", options.unit_scale);
    assignIfPresent(section, "leave", options.leave);
    assignIfPresent(section, "delay", options.delay);
    assignIfPresent(section, "fill", options.fill);
    assignIfPresent(section, "max_fps", options.max_fps);

    if (section.contains("miniters")) {
        auto miniters = toml::find<int64_t>(section, "miniters");
        if (miniters < 0) invalidValue("miniters", std::to_string(miniters));
        options.miniters = static_cast<uint64_t>(miniters);
    }

    if (section.contains("unit_divisor")) {
        auto divisor = toml::find<int64_t>(section, "unit_divisor");
        if (divisor <= 0) invalidValue("unit_divisor", std::to_string(divisor));
        options.unit_divisor = static_cast<uint64_t>(divisor);
    }

    if (section.contains("ncols")) {
        auto ncols = toml::find<int64_t>(section, "ncols");
        if (ncols < 0) invalidValue("ncols", std::to_string(ncols));
        options.ncols = static_cast<int>(ncols);
    }

    if (section.contains("colour")) {
        auto colour = toml::find<std::string>(section, "colour");
        try {
            term::resolveColour(colour);
        } catch (const TermbarError&) {
            invalidValue("colour", colour);
        }
        options.colour = colour;
    }

    if (section.contains("animation")) {
        auto name = toml::find<std::string>(section, "animation");
        auto animation = bar::parseAnimation(name);
        if (!animation) invalidValue("animation", name);
        options.animation = *animation;
    }

    if (section.contains("output")) {
        auto output = toml::find<std::string>(section, "output");
        if (output == "stderr") {
            options.output = term::Stream::STDERR;
        } else if (output == "stdout") {
            options.output = term::Stream::STDOUT;
        } else {
            invalidValue("output", output);
        }
    }
}

void loadLoggingSection(const toml::value& section, LoggingConfig& logging) {
    assignIfPresent(section, "file", logging.log_file);
    assignIfPresent(section, "rotation_size_mb", logging.rotation_size_mb);
    assignIfPresent(section, "max_files", logging.max_files);

    if (section.contains("level")) {
        auto name = toml::find<std::string>(section, "level");
        auto level = parseLogLevel(name);
        if (!level) invalidValue("level", name);
        logging.level = *level;
    }

    if (section.contains("format")) {
        auto format = toml::find<std::string>(section, "format");
        if (format == "json") {
            logging.format = LogFormat::JSON;
        } else if (format == "text") {
            logging.format = LogFormat::TEXT;
        } else {
            invalidValue("format", format);
        }
    }
}

}

bool Config::tryLoadTomlFile(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        config_log.debug("File not found, using defaults | path={}", path);
        return true;
    }

    if (access(path.c_str(), R_OK) != 0) {
        config_log.warn("File not readable | path={}", path);
        return false;
    }

    GlobalConfig loaded = global_;

    try {
        auto data = toml::parse(path);

        if (data.contains("bar")) {
            loadBarSection(data.at("bar"), loaded.bar);
        }

        if (data.contains("logging")) {
            loadLoggingSection(data.at("logging"), loaded.logging);
        }
    } catch (const TermbarError& e) {
        config_log.error("{} | path={}", e.what(), path);
        return false;
    } catch (const std::exception& e) {
        config_log.error("{} | path={} | error={}",
                         ErrorCodeHelper::toString(ErrorCode::CONFIG_PARSE_FAILED),
                         path, e.what());
        return false;
    }

    global_ = loaded;
    config_log.info("Loaded | path={}", path);
    return true;
}

}}
