#pragma once

#include "termbar/term/terminal.hpp"
#include <cstdint>
#include <functional>
#include <istream>
#include <mutex>
#include <ostream>
#include <string>

namespace termbar {
namespace term {

// Serialises every write to the terminal streams. All indicators sharing
// a coordinator may be driven from different threads; each one only ever
// touches its own reserved row.
class OutputCoordinator {
public:
    using WidthProbe = std::function<uint16_t(Stream)>;

    // Process-wide coordinator bound to std::cerr, std::cout and std::cin.
    static OutputCoordinator& instance();

    OutputCoordinator(std::ostream& err, std::ostream& out, std::istream& in,
                      WidthProbe probe = WidthProbe());

    OutputCoordinator(const OutputCoordinator&) = delete;
    OutputCoordinator& operator=(const OutputCoordinator&) = delete;

    // Best effort. Row 0 overwrites in place; row k moves down k lines,
    // writes, and moves back up.
    void writeAt(Stream stream, uint16_t position, const std::string& frame);
    void clearAt(Stream stream, uint16_t position, size_t width);
    void newline(Stream stream);

    // Writes text to the standard output stream. Throws on failure.
    void writeMessage(const std::string& text);

    // Prints the prompt and blocks for one line. The returned text keeps
    // its trailing newline; an empty string means end of input.
    std::string readLine(const std::string& prompt);

    uint16_t columns(Stream stream) const;

private:
    std::ostream& err_;
    std::ostream& out_;
    std::istream& in_;
    WidthProbe probe_;
    std::mutex mutex_;
    bool write_failure_logged_ = false;

    std::ostream& streamFor(Stream stream);
    void writeBestEffort(Stream stream, const std::string& text);
};

}}
