#pragma once

#include "mcpipe/client/session_state.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace mcpipe {

/// Point-in-time view of one session, built by AgentSession::metrics()
struct MetricsSnapshot {
    SessionState state{SessionState::Uninitialized};
    std::chrono::milliseconds uptime{0};
    std::size_t pending_requests{0};

    std::uint64_t requests_sent{0};
    std::uint64_t responses_matched{0};
    std::uint64_t errors_received{0};
    std::uint64_t anomalies{0};
    std::uint64_t frame_errors{0};
    std::uint64_t timeouts{0};
    std::uint64_t heartbeat_ok{0};
    std::uint64_t heartbeat_failed{0};
    std::uint64_t notifications_received{0};

    [[nodiscard]] nlohmann::json to_json() const;
};

}  // namespace mcpipe
