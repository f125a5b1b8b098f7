// ─────────────────────────────────────────────────────────────────────────────
// Response Listener Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "mcpipe/client/response_listener.hpp"
#include "mocks/capture_logger.hpp"
#include "mocks/pipe_peer.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace mcpipe;
using mcpipe::testing::PipePeer;
using mcpipe::testing::ScopedCaptureLogger;
using namespace std::chrono_literals;

namespace {

struct Harness {
    PipePeer peer;
    std::unique_ptr<FrameCodec> codec;
    std::unique_ptr<RequestMultiplexer> mux;
    std::unique_ptr<ResponseListener> listener;

    std::mutex mutex;
    std::condition_variable cv;
    std::vector<std::pair<std::string, Json>> notifications;

    std::promise<FrameError> closed;

    Harness() {
        auto created = FrameCodec::create(peer.client_read_fd(), peer.client_write_fd());
        REQUIRE(created.has_value());
        codec = std::move(*created);
        mux = std::make_unique<RequestMultiplexer>(*codec);
        listener = std::make_unique<ResponseListener>(
            *codec, *mux,
            [this](const std::string& method, const Json& params) {
                std::lock_guard lock(mutex);
                notifications.emplace_back(method, params);
                cv.notify_all();
            },
            [this](const FrameError& reason) { closed.set_value(reason); });
        REQUIRE(listener->start());
    }

    ~Harness() {
        listener.reset();
        mux.reset();
        codec.reset();
    }

    bool wait_for_notifications(std::size_t count) {
        std::unique_lock lock(mutex);
        return cv.wait_for(lock, 2s, [&] { return notifications.size() >= count; });
    }
};

bool eventually(const std::function<bool()>& predicate) {
    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(5ms);
    }
    return predicate();
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Responses
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ResponseListener completes calls from peer responses", "[listener][routing]") {
    Harness h;

    auto ok = h.mux->send("tools/call", Json{{"name", "echo"}});
    auto bad = h.mux->send("tools/call", Json{{"name", "missing"}});

    h.peer.send({{"jsonrpc", "2.0"}, {"id", bad.id},
                 {"error", {{"code", -32602}, {"message", "Unknown tool: missing"}}}});
    h.peer.send({{"jsonrpc", "2.0"}, {"id", ok.id},
                 {"result", {{"content", Json::array({{{"type", "text"}, {"text", "hi"}}})}}}});

    auto ok_result = h.mux->await(ok, 2s);
    REQUIRE(ok_result.has_value());
    REQUIRE((*ok_result)["content"][0]["text"] == "hi");

    auto bad_result = h.mux->await(bad, 2s);
    REQUIRE(bad_result.has_value() == false);
    REQUIRE(bad_result.error().code == ClientErrorCode::ProtocolError);
    REQUIRE(bad_result.error().rpc_error->code == -32602);
}

TEST_CASE("ResponseListener survives unknown ids and junk frames", "[listener][anomaly]") {
    ScopedCaptureLogger log(LogLevel::Warn);
    Harness h;
    auto call = h.mux->send("ping");

    h.peer.send({{"jsonrpc", "2.0"}, {"id", 987654}, {"result", Json::object()}});
    h.peer.send_raw("this is not json\n");
    h.peer.send({{"jsonrpc", "2.0"}, {"id", nullptr}, {"error", {{"code", -32700}, {"message", "Parse error"}}}});
    h.peer.send(Json::array({1, 2, 3}));
    h.peer.send({{"jsonrpc", "2.0"}, {"id", call.id}, {"result", Json::object()}});

    REQUIRE(h.mux->await(call, 2s).has_value());
    REQUIRE(h.listener->is_running());

    const auto counters = h.listener->counters();
    REQUIRE(counters.frame_errors == 1);
    REQUIRE(counters.frames_received == 4);
    REQUIRE(h.mux->counters().anomalies == 3);
    REQUIRE(log->contains(LogLevel::Warn, "Protocol anomaly"));
    REQUIRE(log->contains(LogLevel::Warn, "uncorrelated error -32700"));
}

// ═══════════════════════════════════════════════════════════════════════════
// Notifications and peer requests
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ResponseListener hands notifications to the sink", "[listener][notifications]") {
    Harness h;

    h.peer.send({{"jsonrpc", "2.0"}, {"method", "notifications/tools/list_changed"}});
    h.peer.send({{"jsonrpc", "2.0"}, {"method", "notifications/message"},
                 {"params", {{"level", "info"}, {"data", "hello"}}}});

    REQUIRE(h.wait_for_notifications(2));
    std::lock_guard lock(h.mutex);
    REQUIRE(h.notifications[0].first == "notifications/tools/list_changed");
    REQUIRE(h.notifications[0].second.is_null());
    REQUIRE(h.notifications[1].first == "notifications/message");
    REQUIRE(h.notifications[1].second["data"] == "hello");
    REQUIRE(h.listener->counters().notifications == 2);
}

TEST_CASE("ResponseListener answers the peer's own requests", "[listener][peer-requests]") {
    Harness h;

    h.peer.send({{"jsonrpc", "2.0"}, {"id", "srv-1"}, {"method", "ping"}});
    auto pong = h.peer.read_message();
    REQUIRE(pong.has_value());
    REQUIRE((*pong)["id"] == "srv-1");
    REQUIRE((*pong)["result"] == Json::object());

    h.peer.send({{"jsonrpc", "2.0"}, {"id", 7}, {"method", "sampling/createMessage"}, {"params", Json::object()}});
    auto rejected = h.peer.read_message();
    REQUIRE(rejected.has_value());
    REQUIRE((*rejected)["id"] == 7);
    REQUIRE((*rejected)["error"]["code"] == -32601);
    REQUIRE(rejected->contains("result") == false);

    REQUIRE(h.listener->counters().peer_requests == 2);
}

TEST_CASE("ResponseListener keeps reading while a request write is stalled", "[listener][peer-requests]") {
    Harness h;

    // Several pipe buffers' worth: the write stalls until the peer reads
    const std::string blob(512 * 1024, 'x');
    auto sending = std::async(std::launch::async, [&] {
        return h.mux->send("tools/call", Json{{"name", "echo"}, {"arguments", {{"blob", blob}}}});
    });
    std::this_thread::sleep_for(100ms);

    // The peer writes everything before it reads anything
    constexpr std::size_t kNotifications = 2000;
    const std::string padding(80, 'n');
    std::thread peer_writer([&] {
        h.peer.send({{"jsonrpc", "2.0"}, {"id", "p1"}, {"method", "ping"}});
        for (std::size_t i = 0; i < kNotifications; ++i) {
            h.peer.send({{"jsonrpc", "2.0"}, {"method", "notifications/message"}, {"params", {{"data", padding}}}});
        }
    });

    bool drained = false;
    {
        std::unique_lock lock(h.mutex);
        drained = h.cv.wait_for(lock, 5s, [&] { return h.notifications.size() >= kNotifications; });
    }
    if (!drained) {
        h.codec->shutdown();  // let the stalled writer go so the test can finish
    }
    peer_writer.join();
    REQUIRE(drained);

    // Now the peer reads: the large request, then the ping reply
    std::vector<Json> written;
    for (int i = 0; i < 2; ++i) {
        auto message = h.peer.read_message(5s);
        REQUIRE(message.has_value());
        written.push_back(std::move(*message));
    }
    auto call = sending.get();
    REQUIRE(call.id == 0);

    const auto pong = std::find_if(written.begin(), written.end(),
                                   [](const Json& m) { return m.value("id", Json()) == "p1"; });
    REQUIRE(pong != written.end());
    REQUIRE((*pong)["result"] == Json::object());

    const auto request = std::find_if(written.begin(), written.end(),
                                      [](const Json& m) { return m.value("method", "") == "tools/call"; });
    REQUIRE(request != written.end());
    REQUIRE((*request)["params"]["arguments"]["blob"].get<std::string>().size() == blob.size());

    const auto counters = h.listener->counters();
    REQUIRE(counters.peer_requests == 1);
    REQUIRE(counters.replies_failed == 0);
}

// ═══════════════════════════════════════════════════════════════════════════
// Shutdown
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ResponseListener fails pending calls when the peer goes away", "[listener][close]") {
    Harness h;
    auto pending = h.mux->send("tools/call", Json{{"name", "slow"}});

    h.peer.close_output();

    auto result = h.mux->await(pending, 2s);
    REQUIRE(result.has_value() == false);
    REQUIRE(result.error().code == ClientErrorCode::SessionClosed);

    auto closed = h.closed.get_future();
    REQUIRE(closed.wait_for(2s) == std::future_status::ready);
    REQUIRE(closed.get().kind == FrameError::Kind::Eof);

    REQUIRE(eventually([&] { return h.listener->is_running() == false; }));
    REQUIRE(h.mux->is_closed());
}

TEST_CASE("ResponseListener stop interrupts a blocked read", "[listener][close]") {
    Harness h;
    auto pending = h.mux->send("ping");
    REQUIRE(h.listener->is_running());

    h.listener->stop();

    REQUIRE(h.listener->is_running() == false);
    REQUIRE(h.mux->await(pending, 1s).error().code == ClientErrorCode::SessionClosed);

    auto closed = h.closed.get_future();
    REQUIRE(closed.get().kind == FrameError::Kind::Interrupted);

    // Second start is refused; second stop is harmless
    REQUIRE(h.listener->start() == false);
    h.listener->stop();
}

TEST_CASE("ResponseListener tolerates a throwing sink", "[listener][notifications]") {
    PipePeer peer;
    auto codec = FrameCodec::create(peer.client_read_fd(), peer.client_write_fd());
    REQUIRE(codec.has_value());
    RequestMultiplexer mux(**codec);
    ResponseListener listener(**codec, mux, [](const std::string&, const Json&) {
        throw std::runtime_error("sink failure");
    });
    REQUIRE(listener.start());

    auto call = mux.send("ping");
    peer.send({{"jsonrpc", "2.0"}, {"method", "notifications/progress"}});
    peer.send({{"jsonrpc", "2.0"}, {"id", call.id}, {"result", Json::object()}});

    REQUIRE(mux.await(call, 2s).has_value());
    REQUIRE(listener.is_running());
    listener.stop();
}
