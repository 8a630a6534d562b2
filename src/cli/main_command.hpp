#pragma once

#include "termbar/bar/options.hpp"
#include <CLI/CLI.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace termbar {
namespace cli {

// Flags shared by every command that draws an indicator. Unset flags
// leave the configured defaults alone.
struct BarFlags {
    std::optional<uint64_t> total;
    std::optional<std::string> desc;
    std::optional<std::string> unit;
    std::optional<std::string> colour;
    std::optional<std::string> animation;
    std::optional<int> ncols;
    std::optional<double> mininterval;
    std::optional<double> delay;
    bool unit_scale = false;
    bool ascii = false;
    bool no_leave = false;
    bool stdout_output = false;
};

class MainCommand {
public:
    MainCommand();
    virtual ~MainCommand();

    virtual bool validateArguments() const;

protected:
    CLI::App* subcommand_ = nullptr;
    BarFlags bar_flags_;

    void addBarFlags(CLI::App* subcommand);

    // Config defaults overlaid with the command line. Throws TermbarError
    // for an unknown animation.
    bar::BarOptions buildBarOptions() const;
};

}}
