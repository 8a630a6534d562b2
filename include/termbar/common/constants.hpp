#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace termbar {
namespace constants {

namespace version {
    constexpr const char* VERSION = "0.3.0";

    inline std::string getFullVersion() {
        return std::string("termbar v") + VERSION;
    }
}

namespace system {
    constexpr const char* APPLICATION_NAME = "termbar";
    constexpr const char* LOGGER_NAME = "termbar";
    constexpr const char* CONFIG_ENV = "TERMBAR_CONFIG";
    constexpr const char* CONFIG_FILE_NAME = "termbar.toml";
}

namespace bar_defaults {
    constexpr double MININTERVAL = 0.1;
    constexpr uint64_t MINITERS = 1;
    constexpr int FALLBACK_NCOLS = 10;
    constexpr uint64_t UNIT_DIVISOR = 1000;
    constexpr const char* UNIT = "it";
    constexpr const char* FILL = " ";
    constexpr const char* COLOUR = "default";
    constexpr const char* ZERO_INTERVAL = "00:00";
    constexpr const char* UNKNOWN_RATE = "?";
}

namespace escape {
    constexpr const char* COLOUR_RESET = "\x1b[0m";
}

namespace config_defaults {
    constexpr size_t LOG_ROTATION_SIZE_MB = 10;
    constexpr size_t LOG_MAX_FILES = 3;
}

}}
