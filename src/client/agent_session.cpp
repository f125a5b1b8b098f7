#include "mcpipe/client/agent_session.hpp"
#include "mcpipe/log/logger.hpp"

#include <algorithm>

namespace mcpipe {

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

AgentSession::AgentSession(AgentSessionConfig config)
    : config_(std::move(config))
{}

AgentSession::AgentSession(std::string command, std::vector<std::string> args)
    : AgentSession([&] {
          AgentSessionConfig config;
          config.process.command = std::move(command);
          config.process.args = std::move(args);
          return config;
      }())
{}

AgentSession::~AgentSession() {
    close();
}

// ─────────────────────────────────────────────────────────────────────────────
// State machine
// ─────────────────────────────────────────────────────────────────────────────

bool AgentSession::transition(std::initializer_list<SessionState> from, SessionState to) {
    SessionState previous;
    {
        std::lock_guard lock(mutex_);
        if (std::find(from.begin(), from.end(), state_) == from.end()) {
            return false;
        }
        previous = state_;
        state_ = to;
    }

    MCPIPE_LOG_INFO("Session " + std::string(to_string(previous)) + " -> " + std::string(to_string(to)));

    StateCallback callback;
    {
        std::lock_guard lock(callback_mutex_);
        callback = state_callback_;
    }
    if (callback) {
        try {
            callback(previous, to);
        } catch (const std::exception& e) {
            MCPIPE_LOG_WARN(std::string("State callback threw: ") + e.what());
        }
    }
    return true;
}

SessionState AgentSession::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

void AgentSession::on_state_change(StateCallback callback) {
    std::lock_guard lock(callback_mutex_);
    state_callback_ = std::move(callback);
}

ClientResult<void> AgentSession::ensure_ready() const {
    std::lock_guard lock(mutex_);
    if (state_ != SessionState::Ready) {
        return tl::unexpected(ClientError::not_ready(to_string(state_)));
    }
    return {};
}

// ─────────────────────────────────────────────────────────────────────────────
// Start
// ─────────────────────────────────────────────────────────────────────────────

ClientResult<void> AgentSession::start() {
    if (!transition({SessionState::Uninitialized}, SessionState::Initializing)) {
        return tl::unexpected(ClientError::protocol_error("Session already started"));
    }
    {
        std::lock_guard lock(mutex_);
        started_at_ = std::chrono::steady_clock::now();
    }

    auto process = ChildProcess::spawn(config_.process);
    if (!process) {
        MCPIPE_LOG_ERROR("Spawn failed: " + process.error().message);
        return fail_start(ClientError::spawn_error(process.error().message));
    }
    process_ = std::move(*process);

    auto codec = FrameCodec::create(process_->stdout_fd(), process_->stdin_fd(), config_.codec);
    if (!codec) {
        process_->terminate();
        return fail_start(ClientError::spawn_error(codec.error().message));
    }
    codec_ = std::move(*codec);

    {
        // close() only touches the components once wired_ is set, and the
        // listener must be running by then
        std::lock_guard close_lock(close_mutex_);
        mux_ = std::make_unique<RequestMultiplexer>(*codec_, MultiplexerConfig{config_.cancel_on_timeout});
        listener_ = std::make_unique<ResponseListener>(
            *codec_, *mux_, config_.notification_sink,
            [this](const FrameError& reason) { handle_transport_closed(reason); });
        heartbeat_ = std::make_unique<HeartbeatTask>(*mux_, config_.heartbeat, config_.heartbeat_sink);
        metrics_task_ = std::make_unique<MetricsTask>(
            [this] { return metrics(); }, *mux_, config_.metrics, config_.metrics_sink);
        listener_->start();
        wired_ = true;
    }

    if (state() != SessionState::Initializing) {
        return fail_start(ClientError::initialization_failed(
            "initialize", ClientError::session_closed("Session closed during initialization")));
    }

    HandshakeCoordinator handshake(*mux_, config_.handshake);
    auto outcome = handshake.run();
    if (!outcome) {
        MCPIPE_LOG_ERROR("Handshake failed: " + outcome.error().message);
        return fail_start(outcome.error());
    }

    {
        std::lock_guard lock(mutex_);
        server_ = outcome->server;
        catalog_ = std::make_shared<const ToolCatalog>(std::move(outcome->catalog));
    }

    // The listener or a concurrent close() may have ended the session while
    // the last handshake response was in flight.
    if (!transition({SessionState::Initializing}, SessionState::Ready)) {
        return fail_start(ClientError::initialization_failed(
            "handshake", ClientError::session_closed("Session closed during initialization")));
    }

    start_background_tasks();
    return {};
}

ClientResult<void> AgentSession::fail_start(ClientError error) {
    {
        // A concurrent close() may be joining the listener too
        std::lock_guard close_lock(close_mutex_);
        if (wired_) {
            mux_->fail_all(ClientError::session_closed("Session failed to start"));
            teardown();
            listener_->join();
        }
    }
    transition({SessionState::Initializing, SessionState::Closing}, SessionState::Closed);
    return tl::unexpected(std::move(error));
}

void AgentSession::start_background_tasks() {
    std::lock_guard lock(teardown_mutex_);
    if (torn_down_) {
        return;
    }
    heartbeat_->start();
    metrics_task_->start();
}

// ─────────────────────────────────────────────────────────────────────────────
// Shutdown
// ─────────────────────────────────────────────────────────────────────────────

void AgentSession::teardown() {
    std::lock_guard lock(teardown_mutex_);
    if (torn_down_ || !wired_) {
        return;
    }
    torn_down_ = true;

    heartbeat_->stop();
    metrics_task_->stop();
    mux_->fail_all(ClientError::session_closed());

    // No writer may touch stdin once the process closes it
    codec_->shutdown();
    process_->terminate();
    if (auto code = process_->exit_code()) {
        MCPIPE_LOG_DEBUG("Server exited with status " + std::to_string(*code));
    }
}

void AgentSession::handle_transport_closed(const FrameError& reason) {
    {
        std::lock_guard lock(mutex_);
        if (state_ == SessionState::Closing || state_ == SessionState::Closed) {
            return;  // close() owns the teardown
        }
    }

    if (reason.kind != FrameError::Kind::Interrupted) {
        MCPIPE_LOG_WARN("Transport closed: " + reason.message);
    }
    teardown();
    transition({SessionState::Uninitialized, SessionState::Initializing, SessionState::Ready},
               SessionState::Closed);
}

void AgentSession::close() {
    if (transition({SessionState::Uninitialized}, SessionState::Closed)) {
        return;  // nothing was ever started
    }

    // From a listener callback the listener cannot be joined; the owner's
    // later close() (or the destructor) does that.
    const bool from_listener = wired_.load() && listener_->on_listener_thread();
    std::unique_lock<std::mutex> close_lock(close_mutex_, std::defer_lock);
    if (!from_listener) {
        close_lock.lock();
    }

    transition({SessionState::Initializing, SessionState::Ready}, SessionState::Closing);

    // Read under the lock: start() may have finished wiring meanwhile
    const bool wired = wired_.load();

    if (wired) {
        mux_->fail_all(ClientError::session_closed());
        teardown();
        if (!from_listener) {
            listener_->join();
        }
    }

    // Still Initializing without wiring: start() finishes the job in fail_start()
    if (wired || state() != SessionState::Closing) {
        transition({SessionState::Closing}, SessionState::Closed);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Tools
// ─────────────────────────────────────────────────────────────────────────────

ClientResult<Json> AgentSession::call_tool_raw(const std::string& name, Json arguments) {
    if (auto ready = ensure_ready(); !ready) {
        return tl::unexpected(ready.error());
    }
    if (arguments.is_null()) {
        arguments = Json::object();
    }

    {
        std::lock_guard lock(mutex_);
        if (catalog_ && !catalog_->contains(name)) {
            MCPIPE_LOG_DEBUG("Calling tool not in the catalog: " + name);
        }
    }

    CallToolParams params{name, std::move(arguments)};
    return mux_->request(method::ToolsCall, params.to_json(), config_.request_timeout);
}

ClientResult<CallToolResult> AgentSession::call_tool(const std::string& name, Json arguments) {
    auto raw = call_tool_raw(name, std::move(arguments));
    if (!raw) {
        return tl::unexpected(raw.error());
    }
    if (raw->is_object() == false) {
        return tl::unexpected(ClientError::protocol_error("Malformed tools/call result: " + raw->dump()));
    }
    return CallToolResult::from_json(*raw);
}

ClientResult<std::vector<ToolDescriptor>> AgentSession::list_tools() const {
    std::lock_guard lock(mutex_);
    if (state_ != SessionState::Ready) {
        return tl::unexpected(ClientError::not_ready(to_string(state_)));
    }
    if (!catalog_) {
        return std::vector<ToolDescriptor>{};
    }
    return catalog_->tools();
}

ClientResult<void> AgentSession::refresh_tools() {
    if (auto ready = ensure_ready(); !ready) {
        return tl::unexpected(ready.error());
    }

    auto catalog = HandshakeCoordinator::discover_tools(
        *mux_, config_.request_timeout, config_.handshake.max_tool_pages);
    if (!catalog) {
        MCPIPE_LOG_WARN("Tool refresh failed: " + catalog.error().describe());
        return tl::unexpected(catalog.error());
    }

    auto replacement = std::make_shared<const ToolCatalog>(std::move(*catalog));
    std::lock_guard lock(mutex_);
    catalog_ = std::move(replacement);
    MCPIPE_LOG_INFO("Tool catalog refreshed: " + std::to_string(catalog_->size()) + " tool(s)");
    return {};
}

ClientResult<void> AgentSession::ping() {
    if (auto ready = ensure_ready(); !ready) {
        return tl::unexpected(ready.error());
    }
    auto result = mux_->request(method::Ping, std::nullopt, config_.request_timeout);
    if (!result) {
        return tl::unexpected(result.error());
    }
    return {};
}

// ─────────────────────────────────────────────────────────────────────────────
// Accessors
// ─────────────────────────────────────────────────────────────────────────────

std::optional<Implementation> AgentSession::server_info() const {
    std::lock_guard lock(mutex_);
    if (!server_) {
        return std::nullopt;
    }
    return server_->server_info;
}

std::optional<ServerCapabilities> AgentSession::server_capabilities() const {
    std::lock_guard lock(mutex_);
    if (!server_) {
        return std::nullopt;
    }
    return server_->capabilities;
}

std::optional<std::string> AgentSession::server_instructions() const {
    std::lock_guard lock(mutex_);
    if (!server_) {
        return std::nullopt;
    }
    return server_->instructions;
}

std::optional<pid_t> AgentSession::pid() const {
    if (!wired_) {
        return std::nullopt;
    }
    return process_->pid();
}

MetricsSnapshot AgentSession::metrics() const {
    MetricsSnapshot snapshot;
    std::chrono::steady_clock::time_point started;
    {
        std::lock_guard lock(mutex_);
        snapshot.state = state_;
        started = started_at_;
    }
    if (started != std::chrono::steady_clock::time_point{}) {
        snapshot.uptime = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
    }

    if (!wired_) {
        return snapshot;
    }

    const auto mux = mux_->counters();
    snapshot.pending_requests = mux_->pending_count();
    snapshot.requests_sent = mux.requests_sent;
    snapshot.responses_matched = mux.responses_matched;
    snapshot.errors_received = mux.errors_received;
    snapshot.anomalies = mux.anomalies;
    snapshot.timeouts = mux.timeouts;

    const auto listener = listener_->counters();
    snapshot.frame_errors = listener.frame_errors;
    snapshot.notifications_received = listener.notifications;

    snapshot.heartbeat_ok = heartbeat_->successes();
    snapshot.heartbeat_failed = heartbeat_->failures();
    return snapshot;
}

}  // namespace mcpipe
