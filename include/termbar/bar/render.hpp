#pragma once

#include "termbar/bar/options.hpp"
#include "termbar/bar/styles.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace termbar {
namespace bar {

struct Segments {
    std::string left;
    std::string meter;
    std::string right;
};

// Timing values captured at render time.
struct Snapshot {
    double elapsed = 0.0;
    double rate = 0.0;
};

namespace render {

// n / total clamped to [0, 1]. Indefinite indicators report 0.
double progressFraction(uint64_t n, uint64_t total);

// "desc: " + right-aligned percentage, e.g. "Copying:  5%", " 50%", "100%".
std::string left(const BarOptions& options, double progress);

// " n/total [elapsed<remaining, rate unit/s, postfix]"
std::string right(const BarOptions& options, const Snapshot& snapshot, uint64_t n);

// The bracketed glyph run for the given width.
std::string meter(const Style& style, const std::optional<std::string>& colour,
                  double progress, int ncols);

// "spinner desc: n [elapsed, rate unit/s, postfix]"
std::string indefinite(const BarOptions& options, const Snapshot& snapshot, uint64_t n,
                       const std::string& spinner);

std::string formatCount(const BarOptions& options, uint64_t value);
std::string formatRate(const BarOptions& options, const Snapshot& snapshot, uint64_t n);

}

}}
