#pragma once

#include "termbar/bar/bar.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>

namespace termbar {
namespace bar {

// A Bar behind its own mutex. Lock order is always this mutex first, then
// the output coordinator's, which Bar takes internally while writing.
class SharedBar {
public:
    class Guard {
    public:
        Guard(std::mutex& mutex, Bar& bar) : lock_(mutex), bar_(bar) {}

        Bar* operator->() { return &bar_; }
        Bar& operator*() { return bar_; }

    private:
        std::unique_lock<std::mutex> lock_;
        Bar& bar_;
    };

    explicit SharedBar(Bar bar) : bar_(std::move(bar)) {}

    Guard lock() { return Guard(mutex_, bar_); }

private:
    std::mutex mutex_;
    Bar bar_;
};

using SharedBarPtr = std::shared_ptr<SharedBar>;

struct MonitorHandle {
    SharedBarPtr bar;
    std::thread thread;
};

// Moves the bar into shared ownership and starts a thread that refreshes
// it every interval until it completes. The thread has no stop signal:
// join it only once the bar is driven to completion, otherwise detach it.
MonitorHandle monitor(Bar bar, std::chrono::duration<double> interval);

std::thread monitor(SharedBarPtr bar, std::chrono::duration<double> interval);

}}
