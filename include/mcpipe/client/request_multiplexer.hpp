#pragma once

#include "mcpipe/client/client_error.hpp"
#include "mcpipe/protocol/json_rpc.hpp"
#include "mcpipe/transport/frame_codec.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace mcpipe {

// ═══════════════════════════════════════════════════════════════════════════
// Request Multiplexer
// ═══════════════════════════════════════════════════════════════════════════
// Many callers, one pipe. Each request gets a fresh integer id and a promise
// registered in the pending table before its bytes are written, so the
// listener can never see a response for an id it does not know yet.
//
//   auto call = mux.send("tools/call", params);
//   auto result = mux.await(call, std::chrono::seconds(30));
//
// Every PendingRequest ends exactly once: resolved by the listener, failed
// by a timeout, or failed by fail_all(). Whoever erases the entry under the
// lock fulfils the promise, outside the lock.

struct MultiplexerConfig {
    /// Send notifications/cancelled to the peer when a request times out
    bool cancel_on_timeout{true};
};

struct MultiplexerCounters {
    std::uint64_t requests_sent{0};
    std::uint64_t notifications_sent{0};
    std::uint64_t responses_matched{0};
    std::uint64_t errors_received{0};   // matched responses carrying an error
    std::uint64_t anomalies{0};         // responses for unknown ids
    std::uint64_t timeouts{0};
};

/// Handle returned by send(); the future completes exactly once
struct PendingCall {
    std::int64_t id{-1};            // -1: never written
    std::string method;
    std::future<ClientResult<Json>> result;
    std::chrono::steady_clock::time_point issued_at{};
};

class RequestMultiplexer {
public:
    explicit RequestMultiplexer(FrameCodec& codec, MultiplexerConfig config = {});
    ~RequestMultiplexer();

    RequestMultiplexer(const RequestMultiplexer&) = delete;
    RequestMultiplexer& operator=(const RequestMultiplexer&) = delete;

    /// Register and write one request. Never blocks on the response.
    /// A write failure or a closed multiplexer yields an already-completed call.
    [[nodiscard]] PendingCall send(std::string method, std::optional<Json> params = std::nullopt);

    /// Wait for the call to complete. timeout == 0 waits forever.
    [[nodiscard]] ClientResult<Json> await(PendingCall& call, std::chrono::milliseconds timeout);

    /// send() + await()
    [[nodiscard]] ClientResult<Json> request(std::string method,
                                             std::optional<Json> params,
                                             std::chrono::milliseconds timeout);

    /// Fire-and-forget notification
    [[nodiscard]] ClientResult<void> notify(std::string method, std::optional<Json> params = std::nullopt);

    // ─────────────────────────────────────────────────────────────────────────
    // Listener side
    // ─────────────────────────────────────────────────────────────────────────
    // Unknown or already-completed ids are logged and counted as anomalies.
    // Both return false in that case.

    bool resolve(const JsonRpcId& id, Json result);
    bool fail(const JsonRpcId& id, ClientError error);

    /// Fail every pending request with `error` and close the multiplexer:
    /// later send() calls complete immediately with the same error.
    /// Returns the number of requests failed.
    std::size_t fail_all(const ClientError& error);

    [[nodiscard]] bool is_closed() const;
    [[nodiscard]] std::size_t pending_count() const;
    [[nodiscard]] MultiplexerCounters counters() const noexcept;

    /// Counts a protocol anomaly detected outside resolve()/fail()
    void record_anomaly() noexcept { anomalies_.fetch_add(1); }

private:
    struct PendingRequest {
        std::string method;
        std::promise<ClientResult<Json>> promise;
        std::chrono::steady_clock::time_point issued_at;
    };

    /// Remove the entry for `id` if present. Caller fulfils the promise.
    std::optional<PendingRequest> take(std::int64_t id);
    std::optional<PendingRequest> take(const JsonRpcId& id, std::string_view context);

    static PendingCall completed_call(std::int64_t id, std::string method, ClientError error);

    FrameCodec& codec_;
    MultiplexerConfig config_;

    mutable std::mutex mutex_;
    std::unordered_map<std::int64_t, PendingRequest> pending_;
    std::int64_t next_id_{0};
    std::optional<ClientError> closed_error_;

    std::atomic<std::uint64_t> requests_sent_{0};
    std::atomic<std::uint64_t> notifications_sent_{0};
    std::atomic<std::uint64_t> responses_matched_{0};
    std::atomic<std::uint64_t> errors_received_{0};
    std::atomic<std::uint64_t> anomalies_{0};
    std::atomic<std::uint64_t> timeouts_{0};
};

}  // namespace mcpipe
