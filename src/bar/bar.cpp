#include "termbar/bar/bar.hpp"
#include "termbar/common/error_codes.hpp"
#include "termbar/common/logger.hpp"
#include "termbar/format/format_utils.hpp"
#include "termbar/term/output.hpp"
#include "termbar/term/terminal.hpp"
#include <algorithm>

namespace termbar {
namespace bar {

static const common::ComponentLog bar_log("Bar");

static BarOptions withTotal(uint64_t total) {
    BarOptions options;
    options.total = total;
    return options;
}

Bar::Bar(uint64_t total) : Bar(withTotal(total)) {}

Bar::Bar(BarOptions options)
    : options_(std::move(options)),
      n_(options_.initial),
      miniters_(options_.miniters) {
    style_ = resolveStyle(options_.animation, options_.ascii, options_.fill, custom_charset_);
    colour_ = term::resolveColour(options_.colour);
}

std::chrono::steady_clock::time_point Bar::now() const {
    if (options_.clock) {
        return options_.clock();
    }
    return std::chrono::steady_clock::now();
}

double Bar::elapsedSeconds() const {
    if (!started_) {
        return 0.0;
    }
    return std::chrono::duration<double>(now() - start_time_).count();
}

term::OutputCoordinator& Bar::coordinator() const {
    if (options_.coordinator) {
        return *options_.coordinator;
    }
    return term::OutputCoordinator::instance();
}

void Bar::start() {
    started_ = true;
    start_time_ = now();
    last_elapsed_ = 0.0;
    rate_ = 0.0;
    spinner_index_ = 0;
    miniters_ = options_.miniters;
    pinned_ncols_ = options_.ncols;

    colour_ = term::resolveColour(options_.colour);
    style_ = resolveStyle(options_.animation, options_.ascii, options_.fill, custom_charset_);

    if (options_.max_fps) {
        force_refresh_ = true;
    }

    bar_log.debug("Started | desc={} | total={} | position={} | animation={}",
                  options_.desc, options_.total, options_.position,
                  animationName(style_.animation));
}

void Bar::update(uint64_t n) {
    if (!started_) {
        start();
    }

    n_ += n;

    if (options_.disable) {
        return;
    }

    double elapsed = elapsedSeconds();
    bool interval_ok = options_.mininterval <= elapsed - last_elapsed_;

    if (options_.dynamic_miniters && !interval_ok) {
        miniters_ += n;
    }

    bool iterations_ok = miniters_ <= 1 || n_ % miniters_ == 0;
    bool delay_ok = options_.delay <= elapsed;

    if ((interval_ok && iterations_ok && delay_ok) || completed() || force_refresh_) {
        if (options_.dynamic_miniters) {
            miniters_ = 0;
        }
        draw();
    }
}

Snapshot Bar::takeSnapshot(uint64_t n) {
    last_elapsed_ = elapsedSeconds();
    rate_ = last_elapsed_ > 0.0 ? static_cast<double>(n) / last_elapsed_ : 0.0;
    return Snapshot{last_elapsed_, rate_};
}

void Bar::resolveMeterWidth(size_t text_width) {
    if (pinned_ncols_) {
        ncols_ = *pinned_ncols_;
        return;
    }

    int overflow = static_cast<int>(text_width) + ncols_ + 2 - static_cast<int>(rendered_width_);
    if (!options_.dynamic_ncols && overflow <= 0) {
        return;
    }

    uint16_t columns = coordinator().columns(options_.output);
    if (columns != 0) {
        ncols_ = std::max(static_cast<int>(columns) - static_cast<int>(text_width) - 3, 0);
        return;
    }

    ncols_ = constants::bar_defaults::FALLBACK_NCOLS;
    if (!options_.dynamic_ncols) {
        pinned_ncols_ = ncols_;
        bar_log.debug("Terminal width unavailable, pinning meter width | ncols={}", ncols_);
    }
}

Segments Bar::render(uint64_t n) {
    double progress = render::progressFraction(n, options_.total);
    std::string lbar = render::left(options_, progress);

    if (progress >= 1.0) {
        n = options_.total;

        if (!options_.leave) {
            return Segments{std::string(rendered_width_, ' '), "", "\r"};
        }
    }

    Snapshot snapshot = takeSnapshot(n);
    std::string rbar = render::right(options_, snapshot, n);

    resolveMeterWidth(format::displayWidth(lbar) + format::displayWidth(rbar) + 1);

    if (ncols_ <= 0) {
        return Segments{lbar, "", rbar};
    }

    return Segments{lbar, render::meter(style_, colour_, progress, ncols_), rbar};
}

void Bar::draw() {
    if (options_.total != 0) {
        bool erasing = !options_.leave && render::progressFraction(n_, options_.total) >= 1.0;
        Segments segments = render(n_);

        if (!erasing) {
            rendered_width_ = format::displayWidth(segments.left) +
                              format::displayWidth(segments.meter) +
                              format::displayWidth(segments.right);
        }
        emit(segments.left + segments.meter + segments.right);
        return;
    }

    Snapshot snapshot = takeSnapshot(n_);
    const std::string& spinner = style_.spinner[spinner_index_ % style_.spinner.size()];
    ++spinner_index_;

    std::string text = render::indefinite(options_, snapshot, n_, spinner);
    rendered_width_ = format::displayWidth(text);
    emit(text);
}

void Bar::emit(const std::string& frame) {
    if (options_.writer) {
        std::ostream& sink = *options_.writer;
        sink << frame << '\n' << std::flush;

        if (!sink) {
            sink.clear();
            throw common::TermbarError(common::ErrorCode::IO_WRITE_FAILED, "Frame write failed",
                                       common::ErrorContext{"Bar", {{"sink", "writer"},
                                                                    {"desc", options_.desc}}});
        }
        return;
    }

    coordinator().writeAt(options_.output, options_.position, frame);
}

void Bar::setCounter(uint64_t value) {
    n_ = value;
    update(0);
}

void Bar::refresh() {
    force_refresh_ = true;
    try {
        update(0);
    } catch (...) {
        force_refresh_ = options_.max_fps;
        throw;
    }
    force_refresh_ = options_.max_fps;
}

void Bar::clear() {
    if (options_.writer) {
        return;
    }

    size_t width = rendered_width_;
    if (width == 0) {
        width = coordinator().columns(options_.output);
    }
    coordinator().clearAt(options_.output, options_.position, width);
}

void Bar::reset(std::optional<uint64_t> total) {
    started_ = false;
    force_refresh_ = false;

    if (total) {
        options_.total = *total;
    }
    n_ = options_.initial;

    bar_log.debug("Reset | desc={} | total={} | initial={}",
                  options_.desc, options_.total, options_.initial);
}

void Bar::close() {
    if (options_.disable) {
        return;
    }

    refresh();

    if (options_.writer) {
        return;
    }

    if (!options_.leave) {
        clear();
    } else if (options_.position == 0) {
        coordinator().newline(options_.output);
    }
}

void Bar::setDescription(const std::string& desc) {
    options_.desc = desc;
}

void Bar::setPostfix(const std::string& postfix) {
    options_.postfix = postfix.empty() ? "" : ", " + postfix;
}

void Bar::setColour(const std::string& colour) {
    auto resolved = term::resolveColour(colour);
    options_.colour = colour;
    colour_ = resolved;
}

void Bar::setCharset(const std::vector<std::string>& charset) {
    if (charset.size() < 2) {
        throw common::TermbarError(common::ErrorCode::INVALID_CHARSET, "Charset needs at least two glyphs",
                                   common::ErrorContext{"Bar", {{"glyphs", std::to_string(charset.size())}}});
    }

    custom_charset_ = charset;
    style_ = resolveStyle(options_.animation, options_.ascii, options_.fill, custom_charset_);
    options_.animation = style_.animation;
}

void Bar::write(const std::string& text) {
    clear();
    coordinator().writeMessage(text + "\n");

    if (options_.leave) {
        refresh();
    }
}

std::string Bar::input(const std::string& prompt) {
    clear();
    std::string line = coordinator().readLine(prompt);

    if (options_.leave) {
        refresh();
    }
    return line;
}

bool Bar::completed() const {
    return options_.total > 0 && n_ >= options_.total;
}

BarStats Bar::stats() const {
    BarStats stats;
    stats.n = n_;
    stats.total = options_.total;
    stats.elapsed = elapsedSeconds();
    stats.rate = (stats.elapsed > 0.0 && n_ > 0) ? static_cast<double>(n_) / stats.elapsed : 0.0;
    stats.desc = options_.desc;
    stats.unit = options_.unit;
    stats.completed = completed();

    if (options_.total > 0) {
        stats.percentage = render::progressFraction(n_, options_.total) * 100.0;
        if (stats.rate > 0.0) {
            uint64_t left = options_.total - std::min(n_, options_.total);
            stats.remaining = static_cast<double>(left) / stats.rate;
        }
    }
    return stats;
}

}}
