#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>
#include <string>

namespace termbar {
namespace cli {

// Copies stdin to stdout while counting lines or bytes on an indicator.
class PipeCommand : public MainCommand {
public:
    PipeCommand();

    void setup(CLI::App* subcommand);
    bool wasCalled() const;
    bool validateArguments() const override;
    int execute();

private:
    bool was_called_;
    bool count_bytes_ = false;
    size_t buffer_size_ = 65536;
    std::string stats_format_ = "none";

    int copyStream();
};

}}
