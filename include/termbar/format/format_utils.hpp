#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace termbar {
namespace format {

inline std::pair<uint64_t, uint64_t> divmod(uint64_t x, uint64_t y) {
    return {x / y, x % y};
}

// [H:]MM:SS clock time. With human set, values under a minute render as "59s".
std::string formatInterval(uint64_t seconds, bool human = false);

// Three significant figures with an SI prefix: 999 -> "999", 1000 -> "1.00k".
std::string formatSizeof(double num, double divisor = 1000.0);

// Duration with units: "1.50s", "2.00min", "3.00hr", "1.25days".
std::string formatTime(double seconds);

// Columns occupied by text: UTF-8 code points, ANSI escape sequences excluded.
size_t displayWidth(const std::string& text);

std::string repeat(const std::string& unit, size_t count);

}
}
