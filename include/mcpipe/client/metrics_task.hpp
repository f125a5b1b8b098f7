#pragma once

#include "mcpipe/client/periodic_task.hpp"
#include "mcpipe/client/request_multiplexer.hpp"
#include "mcpipe/client/session_metrics.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace mcpipe {

struct MetricsConfig {
    std::chrono::milliseconds interval{10'000};  // 0 disables the task
    bool publish_to_peer{false};                 // also send as a notification
    std::string method{"$/metrics"};
};

using MetricsSink = std::function<void(const MetricsSnapshot&)>;
using SnapshotProvider = std::function<MetricsSnapshot()>;

// ═══════════════════════════════════════════════════════════════════════════
// Metrics Task
// ═══════════════════════════════════════════════════════════════════════════
// Each tick takes a snapshot and hands it to the sink (or the debug log when
// there is none), then optionally notifies the peer. Failures are logged and
// the next tick tries again.

class MetricsTask {
public:
    MetricsTask(SnapshotProvider provider, RequestMultiplexer& mux, MetricsConfig config, MetricsSink sink = {});

    bool start() { return task_.start(); }
    void stop() { task_.stop(); }

    /// One publication on the calling thread; false if any step failed
    bool publish();

    [[nodiscard]] std::uint64_t published() const noexcept { return published_.load(); }
    [[nodiscard]] std::uint64_t failures() const noexcept { return failures_.load(); }
    [[nodiscard]] bool is_running() const noexcept { return task_.is_running(); }

private:
    SnapshotProvider provider_;
    RequestMultiplexer& mux_;
    MetricsConfig config_;
    MetricsSink sink_;

    std::atomic<std::uint64_t> published_{0};
    std::atomic<std::uint64_t> failures_{0};

    PeriodicTask task_;
};

}  // namespace mcpipe
