#pragma once

#include "termbar/bar/bar.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace termbar {
namespace format {

enum class StatsFormat {
    NONE,
    TEXT,
    JSON
};

StatsFormat parseStatsFormat(const std::string& name);

nlohmann::json statsToJson(const bar::BarStats& stats);

std::string statsToText(const bar::BarStats& stats);

std::string formatStats(const bar::BarStats& stats, StatsFormat format);

}
}
