#include "mcpipe/client/response_listener.hpp"
#include "mcpipe/log/logger.hpp"
#include "mcpipe/protocol/mcp_types.hpp"

#include <type_traits>
#include <utility>
#include <variant>

namespace mcpipe {

ResponseListener::ResponseListener(FrameCodec& codec,
                                   RequestMultiplexer& mux,
                                   NotificationSink sink,
                                   ClosedCallback on_closed)
    : codec_(codec)
    , mux_(mux)
    , sink_(std::move(sink))
    , on_closed_(std::move(on_closed))
{}

ResponseListener::~ResponseListener() {
    stop();
}

bool ResponseListener::start() {
    if (started_.exchange(true)) {
        return false;
    }
    running_ = true;
    reply_thread_ = std::thread([this] { write_replies(); });
    thread_ = std::thread([this] { run(); });
    return true;
}

void ResponseListener::stop() {
    codec_.interrupt();
    join();
}

void ResponseListener::join() {
    if (on_listener_thread()) {
        return;
    }
    if (thread_.joinable()) {
        thread_.join();
    }
    {
        std::lock_guard lock(reply_mutex_);
        replies_closed_ = true;
    }
    reply_cv_.notify_all();
    if (reply_thread_.joinable()) {
        reply_thread_.join();
    }
}

ListenerCounters ResponseListener::counters() const noexcept {
    return ListenerCounters{
        frames_received_.load(),
        frame_errors_.load(),
        notifications_.load(),
        peer_requests_.load(),
        replies_failed_.load()
    };
}

// ─────────────────────────────────────────────────────────────────────────────
// Read loop
// ─────────────────────────────────────────────────────────────────────────────

void ResponseListener::run() {
    reader_id_ = std::this_thread::get_id();
    MCPIPE_LOG_DEBUG("Response listener started");

    FrameError reason{FrameError::Kind::Io, false, "listener stopped"};
    try {
        while (true) {
            auto frame = codec_.read_next();
            if (!frame) {
                const FrameError& err = frame.error();
                if (err.recoverable) {
                    frame_errors_.fetch_add(1);
                    MCPIPE_LOG_WARN("Skipping bad frame (" + std::string(to_string(err.kind)) + "): " + err.message);
                    continue;
                }
                reason = err;
                break;
            }

            frames_received_.fetch_add(1);
            dispatch(*frame);
        }
    } catch (const std::exception& e) {
        reason = FrameError{FrameError::Kind::Io, false, std::string("listener failed: ") + e.what()};
        MCPIPE_LOG_ERROR(reason.message);
    }

    finish(reason);
}

void ResponseListener::finish(const FrameError& reason) {
    if (reason.kind == FrameError::Kind::Interrupted) {
        MCPIPE_LOG_DEBUG("Response listener interrupted");
    } else {
        MCPIPE_LOG_INFO("Response listener stopping: " + std::string(to_string(reason.kind)) + ": " + reason.message);
    }

    mux_.fail_all(ClientError::session_closed("Connection to server closed: " + reason.message));
    running_ = false;

    if (on_closed_) {
        try {
            on_closed_(reason);
        } catch (const std::exception& e) {
            MCPIPE_LOG_ERROR(std::string("on_closed callback threw: ") + e.what());
        }
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Dispatch
// ─────────────────────────────────────────────────────────────────────────────

void ResponseListener::dispatch(const Json& frame) {
    auto message = classify_message(frame);
    if (!message) {
        // Valid JSON that is not a usable JSON-RPC message. A null-id error is
        // the peer telling us it could not parse something we sent.
        mux_.record_anomaly();
        if (frame.is_object() && frame.contains("error") && frame["error"].is_object()) {
            const auto err = JsonRpcError::from_json(frame["error"]);
            MCPIPE_LOG_WARN("Peer reported an uncorrelated error " + std::to_string(err.code) + ": " + err.message);
        } else {
            MCPIPE_LOG_WARN("Protocol anomaly: " + message.error().message);
        }
        return;
    }

    std::visit([this](const auto& msg) {
        using T = std::decay_t<decltype(msg)>;
        if constexpr (std::is_same_v<T, JsonRpcResponse>) {
            handle_response(msg);
        } else if constexpr (std::is_same_v<T, JsonRpcNotification>) {
            handle_notification(msg);
        } else {
            answer_peer_request(msg);
        }
    }, *message);
}

void ResponseListener::handle_response(const JsonRpcResponse& response) {
    if (response.is_error()) {
        const auto& rpc = response.error();
        McpError err{rpc.code, rpc.message, rpc.data};
        mux_.fail(response.id(), ClientError::from_rpc_error(err));
        return;
    }
    mux_.resolve(response.id(), response.result());
}

void ResponseListener::handle_notification(const JsonRpcNotification& notification) {
    notifications_.fetch_add(1);
    MCPIPE_LOG_DEBUG("Notification: " + notification.method());

    if (notification.method() == method::ToolListChanged) {
        MCPIPE_LOG_INFO("Server reports its tool list changed; call refresh_tools() to re-discover");
    }

    if (!sink_) {
        return;
    }
    try {
        sink_(notification.method(), notification.params().value_or(Json()));
    } catch (const std::exception& e) {
        MCPIPE_LOG_WARN("Notification sink threw on " + notification.method() + ": " + e.what());
    }
}

void ResponseListener::answer_peer_request(const JsonRpcRequest& request) {
    peer_requests_.fetch_add(1);

    Json reply;
    if (request.method() == method::Ping) {
        reply = JsonRpcResponse::success(request.id(), Json::object()).to_json();
    } else {
        MCPIPE_LOG_DEBUG("Rejecting server request: " + request.method());
        reply = JsonRpcResponse::failure(
            request.id(),
            JsonRpcError{ErrorCode::MethodNotFound, "Method not found: " + request.method(), std::nullopt}
        ).to_json();
    }

    {
        std::lock_guard lock(reply_mutex_);
        if (replies_closed_) {
            return;
        }
        replies_.push_back(std::move(reply));
    }
    reply_cv_.notify_one();
}

// ─────────────────────────────────────────────────────────────────────────────
// Reply writer
// ─────────────────────────────────────────────────────────────────────────────

void ResponseListener::write_replies() {
    while (true) {
        Json reply;
        {
            std::unique_lock lock(reply_mutex_);
            reply_cv_.wait(lock, [this] { return replies_closed_ || !replies_.empty(); });
            if (replies_closed_) {
                if (!replies_.empty()) {
                    MCPIPE_LOG_DEBUG("Dropping " + std::to_string(replies_.size()) + " unsent peer replies");
                }
                return;
            }
            reply = std::move(replies_.front());
            replies_.pop_front();
        }

        auto written = codec_.write_message(reply);
        if (!written) {
            replies_failed_.fetch_add(1);
            MCPIPE_LOG_WARN("Failed to answer server request " + reply["id"].dump() + ": " + written.error().message);
        }
    }
}

}  // namespace mcpipe
