#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace mcpipe {

// ═══════════════════════════════════════════════════════════════════════════
// Periodic Task
// ═══════════════════════════════════════════════════════════════════════════
// Runs `tick` on its own thread every `interval`, first after one full
// interval. stop() wakes the thread immediately and joins it; a tick already
// running is allowed to finish. Ticks never overlap.

class PeriodicTask {
public:
    using Tick = std::function<void()>;

    PeriodicTask(std::string name, std::chrono::milliseconds interval, Tick tick);
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    /// Returns false when the interval is zero or the task already started
    bool start();

    void stop();

    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }
    [[nodiscard]] std::uint64_t ticks() const noexcept { return ticks_.load(); }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] std::chrono::milliseconds interval() const noexcept { return interval_; }

private:
    void run();

    std::string name_;
    std::chrono::milliseconds interval_;
    Tick tick_;

    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_{false};
    bool started_{false};
    std::atomic<bool> running_{false};
    std::atomic<std::uint64_t> ticks_{0};
};

}  // namespace mcpipe
