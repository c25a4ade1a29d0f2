/**
 * @file periodic_task.hpp
 * @brief Supervised background loop with cooperative cancellation.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace fleet_coordinator {

/**
 * @brief Runs a tick function every interval on its own std::jthread.
 *
 * An exception escaping a tick is logged and counted; the loop carries on
 * at the next interval. stop() wakes the sleeping thread and joins it, so
 * once it returns no tick is running and none will start.
 */
class PeriodicTask {
public:
    using Tick = std::function<void()>;

    PeriodicTask(std::string name, Millis interval, Tick tick, Logger& logger);
    ~PeriodicTask();

    // Non-copyable
    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    void start();
    void stop();

    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }
    [[nodiscard]] uint64_t ticks() const noexcept { return ticks_.load(); }
    [[nodiscard]] uint64_t failures() const noexcept { return failures_.load(); }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    void run(std::stop_token stop);

    std::string name_;
    Millis interval_;
    Tick tick_;
    Logger& logger_;

    std::jthread thread_;
    std::mutex wait_mutex_;
    std::condition_variable_any wait_cv_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> ticks_{0};
    std::atomic<uint64_t> failures_{0};
};

}  // namespace fleet_coordinator
