#include <CLI/CLI.hpp>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "termbar/common/config.hpp"
#include "termbar/common/constants.hpp"
#include "termbar/common/logger.hpp"
#include "cli/demo_command.hpp"
#include "cli/pipe_command.hpp"

int main(int argc, char** argv) {
    try {
        CLI::App app{"Terminal progress indicators", termbar::constants::system::APPLICATION_NAME};
        app.set_version_flag("--version,-v", termbar::constants::version::getFullVersion());
        app.require_subcommand(0, 1);

        std::string config_path;
        std::optional<std::string> log_level;
        std::optional<std::string> log_file;

        app.add_option("-c,--config", config_path, "Configuration file path");
        app.add_option("--log-level", log_level, "error, warn, info, debug")
           ->check(CLI::IsMember({"error", "warn", "info", "debug"}));
        app.add_option("--log-file", log_file, "Write logs to this file instead of stderr");

        auto pipe_cmd = std::make_unique<termbar::cli::PipeCommand>();
        auto demo_cmd = std::make_unique<termbar::cli::DemoCommand>();

        pipe_cmd->setup(app.add_subcommand("pipe", "Copy stdin to stdout with a progress indicator"));
        demo_cmd->setup(app.add_subcommand("demo", "Run simulated work with progress indicators"));

        CLI11_PARSE(app, argc, argv);

        auto& config = termbar::common::Config::instance();
        if (!config.load(config_path)) {
            std::cerr << "Error: failed to load configuration";
            if (!config.getConfigPath().empty()) {
                std::cerr << " from " << config.getConfigPath();
            }
            std::cerr << "\n";
            return 1;
        }

        termbar::common::LoggingConfig logging = config.global().logging;
        if (log_level) {
            logging.level = *termbar::common::parseLogLevel(*log_level);
        }
        if (log_file) {
            logging.log_file = *log_file;
        }

        termbar::common::Logger::instance().initialize(
            logging.log_file.empty() ? termbar::common::LogMode::CONSOLE_ONLY
                                     : termbar::common::LogMode::FILE_ONLY,
            logging);

        int result = 0;
        if (pipe_cmd->wasCalled()) {
            result = pipe_cmd->execute();
        } else if (demo_cmd->wasCalled()) {
            result = demo_cmd->execute();
        } else {
            std::cout << app.help() << std::endl;
        }

        termbar::common::Logger::instance().shutdown();
        return result;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
