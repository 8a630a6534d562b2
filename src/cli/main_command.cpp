#include "main_command.hpp"
#include "termbar/common/config.hpp"
#include "termbar/common/error_codes.hpp"
#include <iostream>

namespace termbar {
namespace cli {

MainCommand::MainCommand() = default;
MainCommand::~MainCommand() = default;

bool MainCommand::validateArguments() const {
    if (bar_flags_.animation && !bar::parseAnimation(*bar_flags_.animation)) {
        std::cerr << "Error: unknown animation '" << *bar_flags_.animation << "'\n";
        std::cerr << "Expected one of: tqdm, tqdm_ascii, fillup, classic, arrow, firacode\n";
        return false;
    }
    if (bar_flags_.ncols && *bar_flags_.ncols < 0) {
        std::cerr << "Error: --ncols must not be negative\n";
        return false;
    }
    return true;
}

void MainCommand::addBarFlags(CLI::App* subcommand) {
    subcommand->add_option("-t,--total", bar_flags_.total,
                           "Expected number of iterations (0 = unknown)");
    subcommand->add_option("-d,--desc", bar_flags_.desc, "Prefix text");
    subcommand->add_option("--unit", bar_flags_.unit, "Unit label (default: it)");
    subcommand->add_option("--colour,--color", bar_flags_.colour,
                           "Meter colour: name or #rrggbb");
    subcommand->add_option("-a,--animation", bar_flags_.animation,
                           "tqdm, tqdm_ascii, fillup, classic, arrow, firacode");
    subcommand->add_option("--ncols", bar_flags_.ncols,
                           "Fixed meter width (0 hides the meter)");
    subcommand->add_option("--mininterval", bar_flags_.mininterval,
                           "Minimum seconds between redraws");
    subcommand->add_option("--delay", bar_flags_.delay,
                           "Seconds to wait before the first redraw");
    subcommand->add_flag("--unit-scale", bar_flags_.unit_scale,
                         "Scale counts with SI prefixes");
    subcommand->add_flag("--ascii", bar_flags_.ascii, "ASCII glyphs only");
    subcommand->add_flag("--no-leave", bar_flags_.no_leave,
                         "Erase the indicator when done");
    subcommand->add_flag("--stdout", bar_flags_.stdout_output,
                         "Draw on stdout instead of stderr");
}

bar::BarOptions MainCommand::buildBarOptions() const {
    bar::BarOptions options = common::Config::instance().barDefaults();

    if (bar_flags_.total) options.total = *bar_flags_.total;
    if (bar_flags_.desc) options.desc = *bar_flags_.desc;
    if (bar_flags_.unit) options.unit = *bar_flags_.unit;
    if (bar_flags_.colour) options.colour = *bar_flags_.colour;
    if (bar_flags_.ncols) options.ncols = *bar_flags_.ncols;
    if (bar_flags_.mininterval) options.mininterval = *bar_flags_.mininterval;
    if (bar_flags_.delay) options.delay = *bar_flags_.delay;
    if (bar_flags_.unit_scale) options.unit_scale = true;
    if (bar_flags_.ascii) options.ascii = true;
    if (bar_flags_.no_leave) options.leave = false;
    if (bar_flags_.stdout_output) options.output = term::Stream::STDOUT;

    if (bar_flags_.animation) {
        auto animation = bar::parseAnimation(*bar_flags_.animation);
        if (!animation) {
            throw common::TermbarError(common::ErrorCode::INVALID_ARGUMENT, "Unknown animation",
                                       common::ErrorContext{"CLI", {{"animation", *bar_flags_.animation}}});
        }
        options.animation = *animation;
    }

    return options;
}

}}
