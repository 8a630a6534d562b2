#include "termbar/term/output.hpp"
#include "termbar/common/error_codes.hpp"
#include "termbar/common/logger.hpp"
#include <iostream>

namespace termbar {
namespace term {

static const common::ComponentLog output_log("Output");

OutputCoordinator& OutputCoordinator::instance() {
    static OutputCoordinator instance(std::cerr, std::cout, std::cin);
    return instance;
}

OutputCoordinator::OutputCoordinator(std::ostream& err, std::ostream& out, std::istream& in,
                                     WidthProbe probe)
    : err_(err),
      out_(out),
      in_(in),
      probe_(std::move(probe)) {}

std::ostream& OutputCoordinator::streamFor(Stream stream) {
    return stream == Stream::STDOUT ? out_ : err_;
}

void OutputCoordinator::writeBestEffort(Stream stream, const std::string& text) {
    std::ostream& os = streamFor(stream);
    os << text << std::flush;

    if (!os) {
        os.clear();
        if (!write_failure_logged_) {
            write_failure_logged_ = true;
            output_log.warn("Frame write failed | stream={}",
                            stream == Stream::STDOUT ? "stdout" : "stderr");
        }
    }
}

void OutputCoordinator::writeAt(Stream stream, uint16_t position, const std::string& frame) {
    std::string text;
    if (position == 0) {
        text = "\r" + frame;
    } else {
        text.assign(position, '\n');
        text += "\r" + frame + cursorUp(position);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    writeBestEffort(stream, text);
}

void OutputCoordinator::clearAt(Stream stream, uint16_t position, size_t width) {
    std::string blank = "\r" + std::string(width, ' ') + "\r";
    std::string text;
    if (position == 0) {
        text = blank;
    } else {
        text.assign(position, '\n');
        text += blank + cursorUp(position);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    writeBestEffort(stream, text);
}

void OutputCoordinator::newline(Stream stream) {
    std::lock_guard<std::mutex> lock(mutex_);
    writeBestEffort(stream, "\n");
}

void OutputCoordinator::writeMessage(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << text << std::flush;

    if (!out_) {
        out_.clear();
        throw common::TermbarError(common::ErrorCode::IO_WRITE_FAILED, "Message write failed",
                                   common::ErrorContext{"Output", {{"stream", "stdout"}}});
    }
}

std::string OutputCoordinator::readLine(const std::string& prompt) {
    writeMessage(prompt);

    std::string line;
    if (std::getline(in_, line)) {
        if (!in_.eof()) {
            line += '\n';
        }
        return line;
    }

    if (in_.bad()) {
        in_.clear();
        throw common::TermbarError(common::ErrorCode::INPUT_READ_FAILED, "Input read failed",
                                   common::ErrorContext{"Output", {{"stream", "stdin"}}});
    }

    in_.clear();
    return line;
}

uint16_t OutputCoordinator::columns(Stream stream) const {
    if (probe_) {
        return probe_(stream);
    }
    return getColumns(stream);
}

}}
