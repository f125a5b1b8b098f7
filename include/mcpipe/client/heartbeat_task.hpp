#pragma once

#include "mcpipe/client/client_error.hpp"
#include "mcpipe/client/periodic_task.hpp"
#include "mcpipe/client/request_multiplexer.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>

namespace mcpipe {

struct HeartbeatConfig {
    std::chrono::milliseconds interval{5'000};  // 0 disables the heartbeat
    std::chrono::milliseconds timeout{2'000};   // per ping
};

/// Outcome of one heartbeat. `error` is empty on success.
struct HeartbeatEvent {
    bool ok{false};
    std::chrono::milliseconds round_trip{0};
    std::optional<ClientError> error;
    std::uint32_t consecutive_failures{0};
};

using HeartbeatSink = std::function<void(const HeartbeatEvent&)>;

// ═══════════════════════════════════════════════════════════════════════════
// Heartbeat Task
// ═══════════════════════════════════════════════════════════════════════════
// Sends MCP `ping` through the shared multiplexer. A failed ping is logged,
// counted and retried on the next tick; it never touches foreground calls.
// SessionClosed is not counted: the listener already owns that teardown.

class HeartbeatTask {
public:
    HeartbeatTask(RequestMultiplexer& mux, HeartbeatConfig config, HeartbeatSink sink = {});

    bool start() { return task_.start(); }
    void stop() { task_.stop(); }

    /// One ping, on the calling thread. Returns true on success.
    bool beat();

    [[nodiscard]] std::uint64_t successes() const noexcept { return successes_.load(); }
    [[nodiscard]] std::uint64_t failures() const noexcept { return failures_.load(); }
    [[nodiscard]] std::uint32_t consecutive_failures() const noexcept { return consecutive_failures_.load(); }
    [[nodiscard]] bool is_running() const noexcept { return task_.is_running(); }

private:
    RequestMultiplexer& mux_;
    HeartbeatConfig config_;
    HeartbeatSink sink_;

    std::atomic<std::uint64_t> successes_{0};
    std::atomic<std::uint64_t> failures_{0};
    std::atomic<std::uint32_t> consecutive_failures_{0};

    PeriodicTask task_;  // last: its thread uses the members above
};

}  // namespace mcpipe
