#pragma once

#include "mcpipe/client/client_error.hpp"
#include "mcpipe/client/handshake.hpp"
#include "mcpipe/client/heartbeat_task.hpp"
#include "mcpipe/client/metrics_task.hpp"
#include "mcpipe/client/request_multiplexer.hpp"
#include "mcpipe/client/response_listener.hpp"
#include "mcpipe/client/session_metrics.hpp"
#include "mcpipe/client/session_state.hpp"
#include "mcpipe/client/tool_catalog.hpp"
#include "mcpipe/process/child_process.hpp"
#include "mcpipe/protocol/mcp_types.hpp"
#include "mcpipe/transport/frame_codec.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcpipe {

// ═══════════════════════════════════════════════════════════════════════════
// Session Configuration
// ═══════════════════════════════════════════════════════════════════════════

struct AgentSessionConfig {
    ChildProcessConfig process;
    FrameCodecConfig codec;
    HandshakeConfig handshake;
    HeartbeatConfig heartbeat;
    MetricsConfig metrics;

    /// Deadline for tools/call, ping and refresh requests; 0 waits forever
    std::chrono::milliseconds request_timeout{60'000};

    /// Tell the server when a request was abandoned after its timeout
    bool cancel_on_timeout{true};

    NotificationSink notification_sink;
    HeartbeatSink heartbeat_sink;
    MetricsSink metrics_sink;
};

// ═══════════════════════════════════════════════════════════════════════════
// Agent Session
// ═══════════════════════════════════════════════════════════════════════════
// One child process, one pipe, one session. Owns the process, the codec, the
// multiplexer and the background threads (listener, heartbeat, metrics).
//
//   mcpipe::AgentSession session("my-mcp-server", {"--stdio"});
//   if (auto started = session.start(); !started) {
//       std::cerr << started.error().describe() << "\n";
//       return 1;
//   }
//   auto tools = session.list_tools();
//   auto result = session.call_tool("echo", {{"text", "hi"}});
//   session.close();
//
// All public methods are thread-safe. call_tool() may be issued from many
// threads at once; responses are matched by id in whatever order they come.
// Callbacks (state, notification, heartbeat, metrics sinks) run on internal
// threads and must not block on this session's responses.

class AgentSession {
public:
    using StateCallback = std::function<void(SessionState from, SessionState to)>;

    explicit AgentSession(AgentSessionConfig config);
    AgentSession(std::string command, std::vector<std::string> args = {});
    ~AgentSession();

    AgentSession(const AgentSession&) = delete;
    AgentSession& operator=(const AgentSession&) = delete;
    AgentSession(AgentSession&&) = delete;
    AgentSession& operator=(AgentSession&&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    /// Spawn, start the listener, run the handshake, start background tasks.
    /// On failure the session is Closed and the error is SpawnError or
    /// InitializationError. Only valid once, from Uninitialized.
    [[nodiscard]] ClientResult<void> start();

    /// Stop tasks, fail pending calls with SessionClosed, terminate the
    /// process, join the listener. Idempotent.
    void close();

    // ─────────────────────────────────────────────────────────────────────────
    // Tools (Ready only; NotReady otherwise, with nothing written)
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] ClientResult<CallToolResult> call_tool(const std::string& name,
                                                         Json arguments = Json::object());

    /// Same request, result payload returned untouched
    [[nodiscard]] ClientResult<Json> call_tool_raw(const std::string& name,
                                                   Json arguments = Json::object());

    /// Cached catalog from the handshake; no wire traffic
    [[nodiscard]] ClientResult<std::vector<ToolDescriptor>> list_tools() const;

    /// Re-run tools/list and swap the catalog in one step
    [[nodiscard]] ClientResult<void> refresh_tools();

    [[nodiscard]] ClientResult<void> ping();

    // ─────────────────────────────────────────────────────────────────────────
    // State
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] SessionState state() const;
    [[nodiscard]] bool is_ready() const { return state() == SessionState::Ready; }

    [[nodiscard]] std::optional<Implementation> server_info() const;
    [[nodiscard]] std::optional<ServerCapabilities> server_capabilities() const;
    [[nodiscard]] std::optional<std::string> server_instructions() const;

    [[nodiscard]] MetricsSnapshot metrics() const;

    /// Child pid once spawned
    [[nodiscard]] std::optional<pid_t> pid() const;

    /// Called on every state change, outside internal locks
    void on_state_change(StateCallback callback);

    [[nodiscard]] const AgentSessionConfig& config() const noexcept { return config_; }

private:
    bool transition(std::initializer_list<SessionState> from, SessionState to);
    [[nodiscard]] ClientResult<void> ensure_ready() const;
    ClientResult<void> fail_start(ClientError error);
    void handle_transport_closed(const FrameError& reason);
    void teardown();
    void start_background_tasks();

    AgentSessionConfig config_;

    mutable std::mutex mutex_;  // state_, server_, catalog_
    SessionState state_{SessionState::Uninitialized};
    std::optional<InitializeResult> server_;
    std::shared_ptr<const ToolCatalog> catalog_;
    std::chrono::steady_clock::time_point started_at_{};

    std::mutex callback_mutex_;
    StateCallback state_callback_;

    std::mutex close_mutex_;     // one close() at a time
    std::mutex teardown_mutex_;
    bool torn_down_{false};

    // Assigned once in start() before wired_ is set; never reset before destruction
    std::atomic<bool> wired_{false};
    std::unique_ptr<ChildProcess> process_;
    std::unique_ptr<FrameCodec> codec_;
    std::unique_ptr<RequestMultiplexer> mux_;
    std::unique_ptr<ResponseListener> listener_;
    std::unique_ptr<HeartbeatTask> heartbeat_;
    std::unique_ptr<MetricsTask> metrics_task_;
};

}  // namespace mcpipe
