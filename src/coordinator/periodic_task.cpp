/**
 * @file periodic_task.cpp
 * @brief PeriodicTask implementation.
 */

#include "coordinator/periodic_task.hpp"

#include <chrono>
#include <exception>

namespace fleet_coordinator {

PeriodicTask::PeriodicTask(std::string name, Millis interval, Tick tick, Logger& logger)
    : name_(std::move(name))
    , interval_(interval)
    , tick_(std::move(tick))
    , logger_(logger) {}

PeriodicTask::~PeriodicTask() {
    stop();
}

void PeriodicTask::start() {
    if (running_.exchange(true)) return;

    thread_ = std::jthread([this](std::stop_token stop) {
        run(stop);
    });
}

void PeriodicTask::stop() {
    if (!running_.exchange(false)) return;

    if (thread_.joinable()) {
        thread_.request_stop();
        wait_cv_.notify_all();
        thread_.join();
    }
}

void PeriodicTask::run(std::stop_token stop) {
    logger_.debug(name_ + " loop started (interval " + std::to_string(interval_.count()) + "ms)");

    while (!stop.stop_requested()) {
        // Sleep first: the first tick lands one interval after start
        {
            std::unique_lock lock(wait_mutex_);
            auto deadline = std::chrono::steady_clock::now() + interval_;
            wait_cv_.wait_until(lock, stop, deadline, [] { return false; });
        }
        if (stop.stop_requested()) break;

        try {
            tick_();
            ticks_.fetch_add(1);
        } catch (const std::exception& ex) {
            failures_.fetch_add(1);
            logger_.error(name_ + " tick failed: " + ex.what());
        }
    }

    logger_.debug(name_ + " loop stopped");
}

}  // namespace fleet_coordinator
