#include "termbar/format/stats_formatter.hpp"
#include "termbar/format/format_utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <sstream>

namespace termbar {
namespace format {

StatsFormat parseStatsFormat(const std::string& name) {
    if (name == "json") return StatsFormat::JSON;
    if (name == "text") return StatsFormat::TEXT;
    return StatsFormat::NONE;
}

nlohmann::json statsToJson(const bar::BarStats& stats) {
    nlohmann::json j;
    j["n"] = stats.n;
    j["total"] = stats.total;
    j["elapsed"] = stats.elapsed;
    j["rate"] = stats.rate;
    j["unit"] = stats.unit;
    j["completed"] = stats.completed;

    if (!stats.desc.empty()) {
        j["desc"] = stats.desc;
    }

    j["percentage"] = stats.percentage ? nlohmann::json(*stats.percentage) : nlohmann::json(nullptr);
    j["remaining"] = stats.remaining ? nlohmann::json(*stats.remaining) : nlohmann::json(nullptr);

    return j;
}

std::string statsToText(const bar::BarStats& stats) {
    std::ostringstream oss;

    if (!stats.desc.empty()) {
        oss << stats.desc << ": ";
    }

    oss << stats.n;
    if (stats.total > 0) {
        oss << "/" << stats.total;
    }
    oss << " " << stats.unit;

    oss << " in " << formatTime(stats.elapsed);
    oss << fmt::format(" ({:.2f} {}/s)", stats.rate, stats.unit);

    if (stats.percentage) {
        oss << fmt::format(", {:.1f}%", *stats.percentage);
    }

    if (stats.total > 0 && !stats.completed) {
        oss << ", incomplete";
    }

    return oss.str();
}

std::string formatStats(const bar::BarStats& stats, StatsFormat format) {
    switch (format) {
        case StatsFormat::JSON:
            return statsToJson(stats).dump();
        case StatsFormat::TEXT:
            return statsToText(stats);
        case StatsFormat::NONE:
        default:
            return "";
    }
}

}
}
