#include "termbar/term/terminal.hpp"
#include "termbar/common/constants.hpp"
#include "termbar/common/error_codes.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cctype>
#include <unordered_map>
#include <sys/ioctl.h>
#include <unistd.h>

namespace termbar {
namespace term {

static int fileDescriptor(Stream stream) {
    return stream == Stream::STDOUT ? STDOUT_FILENO : STDERR_FILENO;
}

uint16_t getColumns(Stream stream) {
    struct winsize w;
    if (ioctl(fileDescriptor(stream), TIOCGWINSZ, &w) == 0 && w.ws_col > 0) {
        return w.ws_col;
    }
    return 0;
}

static int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

static std::optional<std::string> parseHexColour(const std::string& colour) {
    if (colour.size() != 7 || colour[0] != '#') {
        return std::nullopt;
    }

    int rgb[3];
    for (int i = 0; i < 3; ++i) {
        int hi = hexValue(colour[1 + i * 2]);
        int lo = hexValue(colour[2 + i * 2]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        rgb[i] = hi * 16 + lo;
    }
    return fmt::format("\x1b[38;2;{};{};{}m", rgb[0], rgb[1], rgb[2]);
}

static const std::unordered_map<std::string, int>& namedColours() {
    static const std::unordered_map<std::string, int> colours = {
        {"black", 30}, {"red", 31}, {"green", 32}, {"yellow", 33},
        {"blue", 34}, {"magenta", 35}, {"cyan", 36}, {"white", 37},
        {"bright_black", 90}, {"bright_red", 91}, {"bright_green", 92},
        {"bright_yellow", 93}, {"bright_blue", 94}, {"bright_magenta", 95},
        {"bright_cyan", 96}, {"bright_white", 97}
    };
    return colours;
}

std::optional<std::string> resolveColour(const std::string& colour) {
    if (colour == constants::bar_defaults::COLOUR) {
        return std::nullopt;
    }

    if (colour.size() > 3 && colour.compare(0, 2, "\x1b[") == 0 && colour.back() == 'm') {
        return colour;
    }

    if (auto hex = parseHexColour(colour)) {
        return hex;
    }

    std::string name = colour;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::replace(name.begin(), name.end(), ' ', '_');

    auto it = namedColours().find(name);
    if (it != namedColours().end()) {
        return fmt::format("\x1b[{}m", it->second);
    }

    throw common::TermbarError(common::ErrorCode::INVALID_COLOUR, "Unrecognised colour",
                               common::ErrorContext{"Terminal", {{"colour", colour}}});
}

std::string cursorUp(uint16_t lines) {
    return fmt::format("\x1b[{}A", lines);
}

}}
