#include "demo_command.hpp"
#include "termbar/bar/monitor.hpp"
#include "termbar/common/error_codes.hpp"
#include "termbar/common/logger.hpp"
#include "termbar/term/output.hpp"
#include <chrono>
#include <iostream>
#include <thread>
#include <vector>

namespace termbar {
namespace cli {

static constexpr uint64_t DEFAULT_DEMO_TOTAL = 100;
static const common::ComponentLog demo_log("Demo");

DemoCommand::DemoCommand() : was_called_(false) {}

void DemoCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;
    addBarFlags(subcommand);

    subcommand->add_option("-n,--bars", bars_, "Number of stacked indicators")
              ->check(CLI::Range(1, 32));
    subcommand->add_option("--step-ms", step_ms_, "Milliseconds of simulated work per step")
              ->check(CLI::NonNegativeNumber);
    subcommand->add_option("-m,--monitor", monitor_interval_,
                           "Refresh from a monitor thread every SECONDS");
    subcommand->add_flag("--ask", ask_, "Prompt half way through (single indicator only)");
    subcommand->add_option("--message", message_, "Print a message half way through");

    subcommand->callback([this]() { was_called_ = true; });
}

bool DemoCommand::wasCalled() const {
    return was_called_;
}

bool DemoCommand::validateArguments() const {
    if (ask_ && bars_ > 1) {
        std::cerr << "Error: --ask needs a single indicator\n";
        return false;
    }
    if (monitor_interval_ && *monitor_interval_ <= 0.0) {
        std::cerr << "Error: --monitor needs a positive interval\n";
        return false;
    }
    if (monitor_interval_ && bar_flags_.total && *bar_flags_.total == 0) {
        std::cerr << "Error: --monitor needs a known total\n";
        return false;
    }
    return MainCommand::validateArguments();
}

int DemoCommand::execute() {
    if (!validateArguments()) {
        return 1;
    }

    try {
        return bars_ > 1 ? runStacked() : runSingle();
    } catch (const common::TermbarError& e) {
        std::cerr << "\nError: " << e.what() << "\n";
        return 1;
    }
}

int DemoCommand::runSingle() {
    bar::BarOptions options = buildBarOptions();
    if (!bar_flags_.total) {
        options.total = DEFAULT_DEMO_TOTAL;
    }

    auto shared = std::make_shared<bar::SharedBar>(bar::Bar(options));
    std::thread monitor_thread;
    if (monitor_interval_) {
        monitor_thread = bar::monitor(shared, std::chrono::duration<double>(*monitor_interval_));
    }

    const uint64_t total = options.total == 0 ? DEFAULT_DEMO_TOTAL : options.total;
    const uint64_t halfway = total / 2;
    bool stopped = false;

    for (uint64_t i = 0; i < total; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(step_ms_));

        if (i == halfway) {
            if (!message_.empty()) {
                shared->lock()->write(message_);
            }
            if (ask_) {
                std::string answer = shared->lock()->input("Stop here? [y/N]: ");
                if (!answer.empty() && (answer[0] == 'y' || answer[0] == 'Y')) {
                    stopped = true;
                    break;
                }
            }
        }

        shared->lock()->update(1);
    }

    uint64_t reached = 0;
    {
        auto bar = shared->lock();
        reached = bar->n();
        if (stopped && monitor_thread.joinable()) {
            // The monitor thread only exits once its bar completes.
            bar->setCounter(bar->total());
        }
        bar->close();
    }

    if (monitor_thread.joinable()) {
        monitor_thread.join();
    }

    if (stopped) {
        std::cout << "Stopped at " << reached << "/" << total << std::endl;
    }

    return 0;
}

int DemoCommand::runStacked() {
    bar::BarOptions base = buildBarOptions();
    if (!bar_flags_.total) {
        base.total = DEFAULT_DEMO_TOTAL;
    }

    std::vector<bar::SharedBarPtr> bars;
    for (int i = 0; i < bars_; ++i) {
        bar::BarOptions options = base;
        options.position = static_cast<uint16_t>(i);
        options.desc = base.desc.empty() ? "task " + std::to_string(i)
                                         : base.desc + " #" + std::to_string(i);
        bars.push_back(std::make_shared<bar::SharedBar>(bar::Bar(options)));
    }

    std::vector<std::thread> monitors;
    if (monitor_interval_) {
        for (auto& shared : bars) {
            monitors.push_back(bar::monitor(shared, std::chrono::duration<double>(*monitor_interval_)));
        }
    }

    const uint64_t total = base.total == 0 ? DEFAULT_DEMO_TOTAL : base.total;
    std::vector<std::thread> workers;
    for (int i = 0; i < bars_; ++i) {
        workers.emplace_back([this, i, total, shared = bars[static_cast<size_t>(i)]]() {
            auto step = std::chrono::milliseconds(step_ms_ * (i + 1));
            for (uint64_t j = 0; j < total; ++j) {
                std::this_thread::sleep_for(step);
                shared->lock()->update(1);
            }
        });
    }

    for (auto& worker : workers) {
        worker.join();
    }
    for (auto& monitor_thread : monitors) {
        monitor_thread.join();
    }

    for (auto it = bars.rbegin(); it != bars.rend(); ++it) {
        (*it)->lock()->close();
    }

    auto stream = base.output;
    for (int i = 1; i < bars_; ++i) {
        term::OutputCoordinator::instance().newline(stream);
    }

    if (!message_.empty()) {
        std::cout << message_ << std::endl;
    }

    demo_log.debug("Finished | bars={} | total={}", bars_, total);
    return 0;
}

}}
