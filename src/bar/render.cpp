#include "termbar/bar/render.hpp"
#include "termbar/common/constants.hpp"
#include "termbar/format/format_utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <cmath>

namespace termbar {
namespace bar {
namespace render {

using constants::bar_defaults::UNKNOWN_RATE;
using constants::bar_defaults::ZERO_INTERVAL;
using constants::escape::COLOUR_RESET;

static bool rateKnown(const Snapshot& snapshot, uint64_t n) {
    return n > 0 && std::isfinite(snapshot.rate) && snapshot.rate > 0.0;
}

static const char* descSeparator(const BarOptions& options) {
    return options.desc.empty() ? "" : ": ";
}

double progressFraction(uint64_t n, uint64_t total) {
    if (total == 0) {
        return 0.0;
    }
    double progress = static_cast<double>(n) / static_cast<double>(total);
    return progress >= 1.0 ? 1.0 : progress;
}

std::string left(const BarOptions& options, double progress) {
    auto percentage = static_cast<uint64_t>(progress * 100.0);

    const char* spacing = percentage >= 10 ? " " : "  ";
    if (progress >= 1.0) {
        spacing = "";
    }

    return fmt::format("{}{}{}{}%", options.desc, descSeparator(options), spacing, percentage);
}

std::string formatCount(const BarOptions& options, uint64_t value) {
    if (options.unit_scale) {
        return format::formatSizeof(static_cast<double>(value),
                                    static_cast<double>(options.unit_divisor));
    }
    return std::to_string(value);
}

std::string formatRate(const BarOptions& options, const Snapshot& snapshot, uint64_t n) {
    if (!rateKnown(snapshot, n)) {
        return UNKNOWN_RATE;
    }
    if (options.unit_scale) {
        return format::formatSizeof(snapshot.rate, static_cast<double>(options.unit_divisor));
    }
    return fmt::format("{:.2f}", snapshot.rate);
}

std::string right(const BarOptions& options, const Snapshot& snapshot, uint64_t n) {
    std::string remaining = ZERO_INTERVAL;
    if (rateKnown(snapshot, n) && n < options.total) {
        double seconds = static_cast<double>(options.total - n) / snapshot.rate;
        remaining = format::formatInterval(static_cast<uint64_t>(seconds));
    }

    return fmt::format(" {}/{} [{}<{}, {}{}/s{}]",
                       formatCount(options, n),
                       formatCount(options, options.total),
                       format::formatInterval(static_cast<uint64_t>(snapshot.elapsed)),
                       remaining,
                       formatRate(options, snapshot, n),
                       options.unit,
                       options.postfix);
}

static std::string blockRun(const Style& style, double progress, int ncols) {
    const uint64_t nsyms = style.glyphs.size() - 1;
    const uint64_t width = static_cast<uint64_t>(ncols);

    auto [full_blocks, remainder] = format::divmod(
        static_cast<uint64_t>(progress * static_cast<double>(width) * static_cast<double>(nsyms)),
        nsyms);

    std::string run = format::repeat(style.glyphs.back(), full_blocks);
    if (full_blocks < width) {
        run += style.glyphs[remainder + 1];
        run += format::repeat(style.fill, width - full_blocks - 1);
    }
    return run;
}

static std::string solidRun(const Style& style, double progress, int ncols, bool arrow) {
    auto filled = static_cast<int>(static_cast<double>(ncols) * progress);

    std::string run = format::repeat(style.glyphs.front(), static_cast<size_t>(filled));
    if (!arrow) {
        run += format::repeat(style.fill, static_cast<size_t>(ncols - filled));
    } else if (filled < ncols) {
        run += charsets::ARROW_TIP;
        run += format::repeat(style.fill, static_cast<size_t>(ncols - filled - 1));
    }
    return run;
}

std::string meter(const Style& style, const std::optional<std::string>& colour,
                  double progress, int ncols) {
    std::string run;
    switch (familyOf(style.animation)) {
        case MeterFamily::BLOCK:
            run = blockRun(style, progress, ncols);
            break;
        case MeterFamily::SOLID:
            run = solidRun(style, progress, ncols, false);
            break;
        case MeterFamily::SOLID_ARROW:
            run = solidRun(style, progress, ncols, true);
            break;
    }

    if (colour) {
        run = *colour + run + COLOUR_RESET;
    }

    switch (style.animation) {
        case Animation::CLASSIC:
        case Animation::ARROW:
            return "[" + run + "]";
        case Animation::FIRA_CODE:
            return std::string(charsets::FIRA_CODE_OPEN) + run +
                   (progress >= 1.0 ? charsets::FIRA_CODE_CLOSE_DONE : charsets::FIRA_CODE_CLOSE);
        default:
            return "|" + run + "|";
    }
}

std::string indefinite(const BarOptions& options, const Snapshot& snapshot, uint64_t n,
                       const std::string& spinner) {
    return fmt::format("{} {}{}{} [{}, {}{}/s{}]",
                       spinner,
                       options.desc,
                       descSeparator(options),
                       formatCount(options, n),
                       format::formatInterval(static_cast<uint64_t>(snapshot.elapsed)),
                       formatRate(options, snapshot, n),
                       options.unit,
                       options.postfix);
}

}
}}
