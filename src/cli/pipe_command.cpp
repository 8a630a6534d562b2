#include "pipe_command.hpp"
#include "termbar/bar/bar.hpp"
#include "termbar/common/error_codes.hpp"
#include "termbar/common/logger.hpp"
#include "termbar/format/stats_formatter.hpp"
#include <algorithm>
#include <iostream>
#include <vector>

namespace termbar {
namespace cli {

static const common::ComponentLog pipe_log("Pipe");

PipeCommand::PipeCommand() : was_called_(false) {}

void PipeCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;
    addBarFlags(subcommand);

    subcommand->add_flag("-b,--bytes", count_bytes_, "Count bytes instead of lines");
    subcommand->add_option("--buffer-size", buffer_size_, "Read size in bytes when counting bytes")
              ->check(CLI::PositiveNumber);
    subcommand->add_option("--stats", stats_format_, "Print a summary on stderr: none, text, json")
              ->check(CLI::IsMember({"none", "text", "json"}));

    subcommand->callback([this]() { was_called_ = true; });
}

bool PipeCommand::wasCalled() const {
    return was_called_;
}

bool PipeCommand::validateArguments() const {
    if (bar_flags_.stdout_output) {
        std::cerr << "Error: pipe writes data to stdout; the indicator must stay on stderr\n";
        return false;
    }
    return MainCommand::validateArguments();
}

int PipeCommand::execute() {
    if (!validateArguments()) {
        return 1;
    }

    try {
        return copyStream();
    } catch (const common::TermbarError& e) {
        std::cerr << "\nError: " << e.what() << "\n";
        return 1;
    }
}

int PipeCommand::copyStream() {
    bar::BarOptions options = buildBarOptions();
    if (count_bytes_ && !bar_flags_.unit) {
        options.unit = "B";
        options.unit_scale = true;
        options.unit_divisor = 1024;
    }

    bar::Bar bar(options);
    pipe_log.debug("Starting | mode={} | total={}", count_bytes_ ? "bytes" : "lines", options.total);

    if (count_bytes_) {
        std::vector<char> buffer(buffer_size_);
        while (std::cin.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) ||
               std::cin.gcount() > 0) {
            auto count = std::cin.gcount();
            std::cout.write(buffer.data(), count);
            if (!std::cout) {
                break;
            }
            bar.update(static_cast<uint64_t>(count));
        }
    } else {
        std::string line;
        while (std::getline(std::cin, line)) {
            std::cout << line;
            if (!std::cin.eof()) {
                std::cout << '\n';
            }
            if (!std::cout) {
                break;
            }
            bar.update(1);
        }
    }

    std::cout.flush();
    bool output_failed = !std::cout;

    bar.close();

    auto stats_format = format::parseStatsFormat(stats_format_);
    if (stats_format != format::StatsFormat::NONE) {
        std::cerr << format::formatStats(bar.stats(), stats_format) << std::endl;
    }

    if (output_failed) {
        pipe_log.error("Output stream closed early | n={}", bar.n());
        std::cerr << "Error: " << common::ErrorCodeHelper::getMessage(common::ErrorCode::IO_WRITE_FAILED)
                  << "\n";
        return 1;
    }

    pipe_log.debug("Finished | n={}", bar.n());
    return 0;
}

}}
