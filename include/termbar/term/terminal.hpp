#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace termbar {
namespace term {

enum class Stream {
    STDERR,
    STDOUT
};

// Width in columns of the terminal behind the stream, 0 when the stream
// is not a terminal or the query fails.
uint16_t getColumns(Stream stream);

// Maps "red", "bright_blue", "#a485ca" (or an SGR sequence produced by a
// previous call) to a colour-start escape. "default" yields nullopt.
// Throws TermbarError(INVALID_COLOUR) for anything else.
std::optional<std::string> resolveColour(const std::string& colour);

std::string cursorUp(uint16_t lines);

}}
