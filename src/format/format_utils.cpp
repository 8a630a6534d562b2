#include "termbar/format/format_utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <array>
#include <cmath>

namespace termbar {
namespace format {

std::string formatInterval(uint64_t seconds, bool human) {
    if (human && seconds < 60) {
        return std::to_string(seconds) + "s";
    }

    auto [minutes, secs] = divmod(seconds, 60);
    auto [hours, mins] = divmod(minutes, 60);

    if (hours == 0) {
        return fmt::format("{:02}:{:02}", mins, secs);
    }
    return fmt::format("{:02}:{:02}:{:02}", hours, mins, secs);
}

std::string formatSizeof(double num, double divisor) {
    static const std::array<const char*, 8> prefixes = {"", "k", "M", "G", "T", "P", "E", "Z"};

    double value = num;
    for (const char* prefix : prefixes) {
        if (std::fabs(value) < 999.5) {
            if (std::fabs(value) < 99.95) {
                if (std::fabs(value) < 9.995) {
                    return fmt::format("{:1.2f}{}", value, prefix);
                }
                return fmt::format("{:2.1f}{}", value, prefix);
            }
            return fmt::format("{:3.0f}{}", value, prefix);
        }
        value /= divisor;
    }
    return fmt::format("{:3.1f}Y", value);
}

std::string formatTime(double seconds) {
    static const std::array<std::pair<double, const char*>, 3> units = {{
        {60.0, "s"}, {60.0, "min"}, {24.0, "hr"}
    }};

    double value = seconds;
    for (const auto& [limit, suffix] : units) {
        if (std::fabs(value) < limit - 0.005) {
            return fmt::format("{:1.2f}{}", value, suffix);
        }
        value /= limit;
    }
    return fmt::format("{:1.2f}days", value);
}

size_t displayWidth(const std::string& text) {
    size_t width = 0;
    size_t i = 0;

    while (i < text.size()) {
        unsigned char c = static_cast<unsigned char>(text[i]);

        if (c == 0x1b && i + 1 < text.size() && text[i + 1] == '[') {
            i += 2;
            while (i < text.size() && !(text[i] >= 0x40 && text[i] <= 0x7e)) {
                ++i;
            }
            ++i;
            continue;
        }

        if (c >= 0x20 && (c & 0xC0) != 0x80) {
            ++width;
        }
        ++i;
    }

    return width;
}

std::string repeat(const std::string& unit, size_t count) {
    std::string result;
    result.reserve(unit.size() * count);
    for (size_t i = 0; i < count; ++i) {
        result += unit;
    }
    return result;
}

}
}
