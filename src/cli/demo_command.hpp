#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>
#include <optional>
#include <string>

namespace termbar {
namespace cli {

// Simulated work loops: stacked indicators on worker threads, optional
// monitor threads, and message/prompt interjection.
class DemoCommand : public MainCommand {
public:
    DemoCommand();

    void setup(CLI::App* subcommand);
    bool wasCalled() const;
    bool validateArguments() const override;
    int execute();

private:
    bool was_called_;
    int bars_ = 1;
    int step_ms_ = 20;
    std::optional<double> monitor_interval_;
    bool ask_ = false;
    std::string message_;

    int runSingle();
    int runStacked();
};

}}
