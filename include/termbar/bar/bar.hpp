#pragma once

#include "termbar/bar/options.hpp"
#include "termbar/bar/render.hpp"
#include "termbar/bar/styles.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace termbar {
namespace term {
class OutputCoordinator;
}

namespace bar {

struct BarStats {
    uint64_t n;
    uint64_t total;
    double elapsed;
    double rate;
    std::optional<double> remaining;
    std::optional<double> percentage;
    std::string desc;
    std::string unit;
    bool completed;
};

// A single progress indicator. Not thread-safe on its own; wrap it in a
// SharedBar to drive it from several threads.
class Bar {
public:
    explicit Bar(uint64_t total = 0);
    explicit Bar(BarOptions options);

    // Advances the counter and redraws when the throttle allows it.
    void update(uint64_t n = 1);

    // Sets the counter to an absolute value and re-evaluates the throttle.
    void setCounter(uint64_t value);

    // Redraws now, bypassing the throttle.
    void refresh();

    // Blanks the indicator's row.
    void clear();

    // Starts over from the initial count. The timer restarts on the next update.
    void reset(std::optional<uint64_t> total = std::nullopt);

    // Draws the final frame and leaves the cursor below it (or erases it
    // when leave is off).
    void close();

    void setDescription(const std::string& desc);
    void setPostfix(const std::string& postfix);
    void setColour(const std::string& colour);
    void setCharset(const std::vector<std::string>& charset);

    // Prints a line on stdout above the indicator, then redraws it.
    void write(const std::string& text);

    // Prompts on stdout and blocks for one line of input, redrawing afterwards.
    std::string input(const std::string& prompt);

    Segments render(uint64_t n);

    bool completed() const;
    BarStats stats() const;

    uint64_t n() const { return n_; }
    uint64_t total() const { return options_.total; }
    bool started() const { return started_; }
    int ncols() const { return ncols_; }
    size_t renderedWidth() const { return rendered_width_; }
    uint64_t miniters() const { return miniters_; }
    const BarOptions& options() const { return options_; }
    const Style& style() const { return style_; }
    const std::optional<std::string>& colour() const { return colour_; }

private:
    BarOptions options_;

    uint64_t n_ = 0;
    uint64_t miniters_ = 1;
    bool started_ = false;
    bool force_refresh_ = false;
    std::chrono::steady_clock::time_point start_time_;
    double last_elapsed_ = 0.0;
    double rate_ = 0.0;
    int ncols_ = constants::bar_defaults::FALLBACK_NCOLS;
    std::optional<int> pinned_ncols_;
    size_t rendered_width_ = 0;
    size_t spinner_index_ = 0;

    Style style_;
    std::optional<std::string> colour_;
    std::vector<std::string> custom_charset_;

    void start();
    void draw();
    void emit(const std::string& frame);
    void resolveMeterWidth(size_t text_width);
    Snapshot takeSnapshot(uint64_t n);
    double elapsedSeconds() const;
    std::chrono::steady_clock::time_point now() const;
    term::OutputCoordinator& coordinator() const;
};

}}
