#include "mcpipe/client/request_multiplexer.hpp"
#include "mcpipe/log/logger.hpp"

namespace mcpipe {

RequestMultiplexer::RequestMultiplexer(FrameCodec& codec, MultiplexerConfig config)
    : codec_(codec)
    , config_(config)
{}

RequestMultiplexer::~RequestMultiplexer() {
    // Nobody may be left waiting on a promise that is about to be destroyed
    fail_all(ClientError::session_closed("Multiplexer destroyed"));
}

PendingCall RequestMultiplexer::completed_call(std::int64_t id, std::string method, ClientError error) {
    std::promise<ClientResult<Json>> promise;
    PendingCall call{id, std::move(method), promise.get_future(), std::chrono::steady_clock::now()};
    promise.set_value(tl::unexpected(std::move(error)));
    return call;
}

// ─────────────────────────────────────────────────────────────────────────────
// Sending
// ─────────────────────────────────────────────────────────────────────────────

PendingCall RequestMultiplexer::send(std::string method, std::optional<Json> params) {
    std::int64_t id = -1;
    PendingCall call;
    {
        std::lock_guard lock(mutex_);
        if (closed_error_) {
            return completed_call(-1, std::move(method), *closed_error_);
        }
        id = next_id_++;

        PendingRequest entry{method, {}, std::chrono::steady_clock::now()};
        call = PendingCall{id, method, entry.promise.get_future(), entry.issued_at};
        pending_.emplace(id, std::move(entry));
    }

    // Written after registration: a fast peer cannot outrun the table
    const JsonRpcRequest request(std::move(method), id, std::move(params));
    auto written = codec_.write_message(request.to_json());
    if (!written) {
        MCPIPE_LOG_WARN("Failed to send request " + std::to_string(id) + " (" + call.method + "): " +
                        written.error().message);
        if (auto entry = take(id)) {
            entry->promise.set_value(tl::unexpected(ClientError::from_transport(written.error())));
        }
        return call;
    }

    requests_sent_.fetch_add(1);
    MCPIPE_LOG_DEBUG("Sent request " + std::to_string(id) + " (" + call.method + ")");
    return call;
}

ClientResult<Json> RequestMultiplexer::await(PendingCall& call, std::chrono::milliseconds timeout) {
    if (call.result.valid() == false) {
        return tl::unexpected(ClientError::protocol_error("Call " + std::to_string(call.id) + " was already awaited"));
    }

    if (timeout.count() > 0 &&
        call.result.wait_for(timeout) == std::future_status::timeout) {
        // Whoever removes the entry completes it; if the listener got there
        // first the real response is already in the future.
        if (auto entry = take(call.id)) {
            timeouts_.fetch_add(1);
            MCPIPE_LOG_WARN("Request " + std::to_string(call.id) + " (" + call.method + ") timed out after " +
                            std::to_string(timeout.count()) + "ms");
            entry->promise.set_value(tl::unexpected(ClientError::timeout(
                "Request '" + call.method + "' timed out after " + std::to_string(timeout.count()) + "ms")));

            if (config_.cancel_on_timeout) {
                const CancelledNotification cancelled{call.id, "timeout"};
                auto sent = notify(method::Cancelled, cancelled.to_json());
                if (!sent) {
                    MCPIPE_LOG_DEBUG("Could not send cancellation for " + std::to_string(call.id) + ": " +
                                     sent.error().message);
                }
            }
        }
    }

    return call.result.get();
}

ClientResult<Json> RequestMultiplexer::request(std::string method,
                                               std::optional<Json> params,
                                               std::chrono::milliseconds timeout) {
    auto call = send(std::move(method), std::move(params));
    return await(call, timeout);
}

ClientResult<void> RequestMultiplexer::notify(std::string method, std::optional<Json> params) {
    {
        std::lock_guard lock(mutex_);
        if (closed_error_) {
            return tl::unexpected(*closed_error_);
        }
    }

    const JsonRpcNotification notification(std::move(method), std::move(params));
    auto written = codec_.write_message(notification.to_json());
    if (!written) {
        return tl::unexpected(ClientError::from_transport(written.error()));
    }
    notifications_sent_.fetch_add(1);
    return {};
}

// ─────────────────────────────────────────────────────────────────────────────
// Completion
// ─────────────────────────────────────────────────────────────────────────────

std::optional<RequestMultiplexer::PendingRequest> RequestMultiplexer::take(std::int64_t id) {
    std::lock_guard lock(mutex_);
    auto it = pending_.find(id);
    if (it == pending_.end()) {
        return std::nullopt;
    }
    PendingRequest entry = std::move(it->second);
    pending_.erase(it);
    return entry;
}

std::optional<RequestMultiplexer::PendingRequest> RequestMultiplexer::take(const JsonRpcId& id, std::string_view context) {
    std::optional<PendingRequest> entry;
    if (id.is_integer()) {
        entry = take(std::get<std::int64_t>(id.value));
    }
    if (!entry) {
        anomalies_.fetch_add(1);
        MCPIPE_LOG_WARN("Protocol anomaly: " + std::string(context) + " for unknown id " + id.to_string() + " dropped");
    }
    return entry;
}

bool RequestMultiplexer::resolve(const JsonRpcId& id, Json result) {
    auto entry = take(id, "response");
    if (!entry) {
        return false;
    }
    responses_matched_.fetch_add(1);
    entry->promise.set_value(ClientResult<Json>(std::move(result)));
    return true;
}

bool RequestMultiplexer::fail(const JsonRpcId& id, ClientError error) {
    auto entry = take(id, "error response");
    if (!entry) {
        return false;
    }
    responses_matched_.fetch_add(1);
    errors_received_.fetch_add(1);
    entry->promise.set_value(tl::unexpected(std::move(error)));
    return true;
}

std::size_t RequestMultiplexer::fail_all(const ClientError& error) {
    std::unordered_map<std::int64_t, PendingRequest> drained;
    {
        std::lock_guard lock(mutex_);
        if (!closed_error_) {
            closed_error_ = error;
        }
        drained.swap(pending_);
    }

    for (auto& [id, entry] : drained) {
        entry.promise.set_value(tl::unexpected(error));
    }
    if (!drained.empty()) {
        MCPIPE_LOG_INFO("Failed " + std::to_string(drained.size()) + " pending request(s): " + error.message);
    }
    return drained.size();
}

bool RequestMultiplexer::is_closed() const {
    std::lock_guard lock(mutex_);
    return closed_error_.has_value();
}

std::size_t RequestMultiplexer::pending_count() const {
    std::lock_guard lock(mutex_);
    return pending_.size();
}

MultiplexerCounters RequestMultiplexer::counters() const noexcept {
    return MultiplexerCounters{
        requests_sent_.load(),
        notifications_sent_.load(),
        responses_matched_.load(),
        errors_received_.load(),
        anomalies_.load(),
        timeouts_.load()
    };
}

}  // namespace mcpipe
