#pragma once

#include "termbar/bar/styles.hpp"
#include "termbar/common/constants.hpp"
#include "termbar/term/terminal.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>

namespace termbar {
namespace term {
class OutputCoordinator;
}

namespace bar {

using Clock = std::function<std::chrono::steady_clock::time_point()>;

struct BarOptions {
    std::string desc;
    // 0 puts the indicator in indefinite mode.
    uint64_t total = 0;
    bool leave = true;
    term::Stream output = term::Stream::STDERR;
    // When set, frames go here line by line instead of to the terminal.
    std::ostream* writer = nullptr;
    // Meter width. nullopt resizes to the terminal, 0 suppresses the meter.
    std::optional<int> ncols;
    double mininterval = constants::bar_defaults::MININTERVAL;
    uint64_t miniters = constants::bar_defaults::MINITERS;
    bool dynamic_miniters = false;
    bool ascii = false;
    bool disable = false;
    std::string unit = constants::bar_defaults::UNIT;
    bool unit_scale = false;
    uint64_t unit_divisor = constants::bar_defaults::UNIT_DIVISOR;
    bool dynamic_ncols = false;
    uint64_t initial = 0;
    // Terminal row below the cursor reserved for this indicator.
    uint16_t position = 0;
    std::string postfix;
    std::string colour = constants::bar_defaults::COLOUR;
    double delay = 0.0;
    std::string fill = constants::bar_defaults::FILL;
    Animation animation = Animation::TQDM;
    bool max_fps = false;

    // nullptr means OutputCoordinator::instance().
    term::OutputCoordinator* coordinator = nullptr;
    // Empty means std::chrono::steady_clock::now.
    Clock clock;
};

}}
