#include "termbar/bar/monitor.hpp"
#include "termbar/common/error_codes.hpp"
#include "termbar/common/logger.hpp"

namespace termbar {
namespace bar {

static const common::ComponentLog monitor_log("Monitor");

static void monitorLoop(SharedBarPtr shared, std::chrono::duration<double> interval) {
    monitor_log.debug("Started | interval={}s", interval.count());

    while (true) {
        std::this_thread::sleep_for(interval);
        auto bar = shared->lock();

        if (bar->completed()) {
            break;
        }

        try {
            bar->refresh();
        } catch (const common::TermbarError& e) {
            monitor_log.error("Refresh failed, stopping | error={}", e.what());
            return;
        }
    }

    monitor_log.debug("Stopped");
}

std::thread monitor(SharedBarPtr bar, std::chrono::duration<double> interval) {
    if (!bar || interval.count() <= 0.0) {
        throw common::TermbarError(common::ErrorCode::INVALID_ARGUMENT,
                                   "Monitor needs a bar and a positive interval",
                                   common::ErrorContext{"Monitor", {{"interval", std::to_string(interval.count())}}});
    }
    return std::thread(monitorLoop, std::move(bar), interval);
}

MonitorHandle monitor(Bar bar, std::chrono::duration<double> interval) {
    MonitorHandle handle;
    handle.bar = std::make_shared<SharedBar>(std::move(bar));
    handle.thread = monitor(handle.bar, interval);
    return handle;
}

}}
