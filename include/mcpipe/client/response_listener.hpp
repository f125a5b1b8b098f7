#pragma once

#include "mcpipe/client/request_multiplexer.hpp"
#include "mcpipe/protocol/json_rpc.hpp"
#include "mcpipe/transport/frame_codec.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace mcpipe {

/// Receives every server notification (method, params; params is null when absent).
/// Runs on the listener thread: it must not wait on a response from the peer.
using NotificationSink = std::function<void(const std::string& method, const Json& params)>;

struct ListenerCounters {
    std::uint64_t frames_received{0};
    std::uint64_t frame_errors{0};       // recoverable, skipped frames
    std::uint64_t notifications{0};
    std::uint64_t peer_requests{0};
    std::uint64_t replies_failed{0};     // peer-request replies that could not be written
};

// ═══════════════════════════════════════════════════════════════════════════
// Response Listener
// ═══════════════════════════════════════════════════════════════════════════
// The only reader of the codec. Runs until the stream ends or the codec is
// interrupted, then fails every pending request with SessionClosed and calls
// `on_closed` (still on the listener thread).
//
// The reader never writes. Replies to peer requests go through a queue to a
// second thread, so a foreground write blocked on a full pipe cannot stop
// the reader from draining the peer's output.

class ResponseListener {
public:
    using ClosedCallback = std::function<void(const FrameError& reason)>;

    ResponseListener(FrameCodec& codec,
                     RequestMultiplexer& mux,
                     NotificationSink sink = {},
                     ClosedCallback on_closed = {});
    ~ResponseListener();

    ResponseListener(const ResponseListener&) = delete;
    ResponseListener& operator=(const ResponseListener&) = delete;

    /// Start the reader and reply threads. Returns false if already started.
    bool start();

    /// Interrupt the codec and join. From the listener thread itself this only
    /// interrupts; the owner joins later.
    void stop();

    /// Wait for the reader to finish without interrupting it, then stop the
    /// reply thread. Unsent replies are dropped. A reply blocked on a full
    /// pipe holds this until the codec is shut down.
    void join();

    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    /// True when called from inside a listener callback
    [[nodiscard]] bool on_listener_thread() const noexcept {
        return std::this_thread::get_id() == reader_id_.load();
    }

    [[nodiscard]] ListenerCounters counters() const noexcept;

private:
    void run();
    void dispatch(const Json& frame);
    void handle_response(const JsonRpcResponse& response);
    void handle_notification(const JsonRpcNotification& notification);
    void answer_peer_request(const JsonRpcRequest& request);
    void finish(const FrameError& reason);
    void write_replies();

    FrameCodec& codec_;
    RequestMultiplexer& mux_;
    NotificationSink sink_;
    ClosedCallback on_closed_;

    std::thread thread_;
    std::atomic<std::thread::id> reader_id_{};
    std::atomic<bool> started_{false};
    std::atomic<bool> running_{false};

    std::thread reply_thread_;
    std::mutex reply_mutex_;
    std::condition_variable reply_cv_;
    std::deque<Json> replies_;
    bool replies_closed_{false};

    std::atomic<std::uint64_t> frames_received_{0};
    std::atomic<std::uint64_t> frame_errors_{0};
    std::atomic<std::uint64_t> notifications_{0};
    std::atomic<std::uint64_t> peer_requests_{0};
    std::atomic<std::uint64_t> replies_failed_{0};
};

}  // namespace mcpipe
