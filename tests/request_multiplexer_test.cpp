// ─────────────────────────────────────────────────────────────────────────────
// Request Multiplexer Tests
// ─────────────────────────────────────────────────────────────────────────────
// No listener thread here: the test plays the listener by calling resolve()
// and fail() directly, and reads what the multiplexer wrote from a PipePeer.

#include <catch2/catch_test_macros.hpp>

#include "mcpipe/client/request_multiplexer.hpp"
#include "mcpipe/protocol/mcp_types.hpp"
#include "mocks/pipe_peer.hpp"

#include <chrono>
#include <future>
#include <thread>
#include <vector>

using namespace mcpipe;
using mcpipe::testing::PipePeer;
using namespace std::chrono_literals;

namespace {

struct Harness {
    PipePeer peer;
    std::unique_ptr<FrameCodec> codec;
    std::unique_ptr<RequestMultiplexer> mux;

    explicit Harness(MultiplexerConfig config = {}) {
        auto created = FrameCodec::create(peer.client_read_fd(), peer.client_write_fd());
        REQUIRE(created.has_value());
        codec = std::move(*created);
        mux = std::make_unique<RequestMultiplexer>(*codec, config);
    }

    ~Harness() {
        mux.reset();
        codec.reset();
    }
};

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Ids and routing
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("RequestMultiplexer issues increasing ids from zero", "[mux][ids]") {
    Harness h;

    auto first = h.mux->send("ping");
    auto second = h.mux->send("tools/list", Json{{"cursor", "c1"}});
    auto third = h.mux->send("ping");

    REQUIRE(first.id == 0);
    REQUIRE(second.id == 1);
    REQUIRE(third.id == 2);
    REQUIRE(h.mux->pending_count() == 3);

    auto wire = h.peer.read_message();
    REQUIRE(wire.has_value());
    REQUIRE((*wire)["id"] == 0);
    REQUIRE((*wire)["method"] == "ping");

    wire = h.peer.read_message();
    REQUIRE((*wire)["id"] == 1);
    REQUIRE((*wire)["params"]["cursor"] == "c1");

    REQUIRE(h.mux->counters().requests_sent == 3);
    h.mux->fail_all(ClientError::session_closed());
}

TEST_CASE("RequestMultiplexer routes out-of-order responses", "[mux][routing]") {
    Harness h;

    std::vector<PendingCall> calls;
    for (int i = 0; i < 3; ++i) {
        calls.push_back(h.mux->send("tools/call", Json{{"name", "echo"}}));
    }

    REQUIRE(h.mux->resolve(JsonRpcId::integer(2), Json{{"n", 2}}));
    REQUIRE(h.mux->resolve(JsonRpcId::integer(0), Json{{"n", 0}}));
    REQUIRE(h.mux->resolve(JsonRpcId::integer(1), Json{{"n", 1}}));

    for (int i = 0; i < 3; ++i) {
        auto result = h.mux->await(calls[static_cast<std::size_t>(i)], 1s);
        REQUIRE(result.has_value());
        REQUIRE((*result)["n"] == i);
    }
    REQUIRE(h.mux->pending_count() == 0);
    REQUIRE(h.mux->counters().responses_matched == 3);
}

TEST_CASE("RequestMultiplexer hands peer errors to the caller", "[mux][routing]") {
    Harness h;
    auto call = h.mux->send("tools/call", Json{{"name", "nope"}});

    REQUIRE(h.mux->fail(JsonRpcId::integer(call.id),
                        ClientError::from_rpc_error(McpError{-32602, "Unknown tool", std::nullopt})));

    auto result = h.mux->await(call, 1s);
    REQUIRE(result.has_value() == false);
    REQUIRE(result.error().code == ClientErrorCode::ProtocolError);
    REQUIRE(result.error().rpc_error->code == -32602);
    REQUIRE(h.mux->counters().errors_received == 1);
}

TEST_CASE("RequestMultiplexer counts responses nobody asked for", "[mux][anomaly]") {
    Harness h;
    auto call = h.mux->send("ping");

    SECTION("unknown integer id") {
        REQUIRE(h.mux->resolve(JsonRpcId::integer(987654), Json::object()) == false);
    }

    SECTION("string id") {
        REQUIRE(h.mux->resolve(JsonRpcId::string("0"), Json::object()) == false);
    }

    SECTION("second response for the same id") {
        REQUIRE(h.mux->resolve(JsonRpcId::integer(call.id), Json::object()));
        REQUIRE(h.mux->resolve(JsonRpcId::integer(call.id), Json::object()) == false);
        REQUIRE(h.mux->await(call, 1s).has_value());
    }

    REQUIRE(h.mux->counters().anomalies == 1);
    REQUIRE(h.mux->is_closed() == false);
    h.mux->fail_all(ClientError::session_closed());
}

TEST_CASE("RequestMultiplexer rejects a second await on the same call", "[mux][routing]") {
    Harness h;
    auto call = h.mux->send("ping");
    REQUIRE(h.mux->resolve(JsonRpcId::integer(call.id), Json::object()));

    REQUIRE(h.mux->await(call, 1s).has_value());
    auto again = h.mux->await(call, 1s);
    REQUIRE(again.has_value() == false);
    REQUIRE(again.error().code == ClientErrorCode::ProtocolError);
}

// ═══════════════════════════════════════════════════════════════════════════
// Concurrency
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("RequestMultiplexer serves concurrent callers", "[mux][concurrency]") {
    Harness h;
    constexpr int kCallers = 16;

    // Echo every request back as a response, like a listener would
    std::thread responder([&] {
        for (int i = 0; i < kCallers; ++i) {
            auto request = h.peer.read_message(5s);
            if (!request) {
                return;
            }
            h.mux->resolve(JsonRpcId::integer((*request)["id"].get<std::int64_t>()),
                           Json{{"echo", (*request)["params"]["value"]}});
        }
    });

    std::vector<std::future<bool>> callers;
    for (int i = 0; i < kCallers; ++i) {
        callers.push_back(std::async(std::launch::async, [&h, i] {
            auto result = h.mux->request("tools/call", Json{{"value", i}}, 5s);
            return result.has_value() && (*result)["echo"] == i;
        }));
    }

    for (auto& c : callers) {
        REQUIRE(c.get());
    }
    responder.join();
    REQUIRE(h.mux->counters().requests_sent == kCallers);
}

// ═══════════════════════════════════════════════════════════════════════════
// Timeouts
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("RequestMultiplexer times out and tells the peer", "[mux][timeout]") {
    Harness h;
    auto call = h.mux->send("tools/call", Json{{"name", "slow"}});

    auto result = h.mux->await(call, 50ms);
    REQUIRE(result.has_value() == false);
    REQUIRE(result.error().code == ClientErrorCode::Timeout);
    REQUIRE(h.mux->pending_count() == 0);
    REQUIRE(h.mux->counters().timeouts == 1);

    auto request = h.peer.read_message();
    REQUIRE(request.has_value());
    REQUIRE((*request)["method"] == "tools/call");

    auto cancelled = h.peer.read_message();
    REQUIRE(cancelled.has_value());
    REQUIRE((*cancelled)["method"] == "notifications/cancelled");
    REQUIRE((*cancelled)["params"]["requestId"] == call.id);
    REQUIRE((*cancelled)["params"]["reason"] == "timeout");

    // A late response is an anomaly, not a crash
    REQUIRE(h.mux->resolve(JsonRpcId::integer(call.id), Json::object()) == false);
    REQUIRE(h.mux->counters().anomalies == 1);
}

TEST_CASE("RequestMultiplexer can skip the cancellation notice", "[mux][timeout]") {
    Harness h(MultiplexerConfig{false});
    auto call = h.mux->send("tools/call");

    REQUIRE(h.mux->await(call, 30ms).error().code == ClientErrorCode::Timeout);

    REQUIRE(h.peer.read_message().has_value());
    REQUIRE(h.peer.read_message(200ms).has_value() == false);
    REQUIRE(h.mux->counters().notifications_sent == 0);
}

// ═══════════════════════════════════════════════════════════════════════════
// Closing
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("fail_all completes every pending call and closes", "[mux][close]") {
    Harness h;

    auto a = h.mux->send("tools/call");
    auto b = h.mux->send("ping");
    auto waiter = std::async(std::launch::async, [&] { return h.mux->await(a, 0ms); });

    std::this_thread::sleep_for(20ms);
    REQUIRE(h.mux->fail_all(ClientError::session_closed("Server process exited")) == 2);

    auto ra = waiter.get();
    REQUIRE(ra.error().code == ClientErrorCode::SessionClosed);
    REQUIRE(h.mux->await(b, 1s).error().code == ClientErrorCode::SessionClosed);
    REQUIRE(h.mux->is_closed());

    SECTION("later sends complete at once without touching the pipe") {
        auto late = h.mux->send("ping");
        REQUIRE(late.id == -1);
        auto result = h.mux->await(late, 1s);
        REQUIRE(result.error().code == ClientErrorCode::SessionClosed);
        REQUIRE(result.error().message == "Server process exited");
    }

    SECTION("later notifications fail") {
        auto sent = h.mux->notify("notifications/initialized");
        REQUIRE(sent.has_value() == false);
        REQUIRE(sent.error().code == ClientErrorCode::SessionClosed);
    }

    SECTION("a second fail_all finds nothing") {
        REQUIRE(h.mux->fail_all(ClientError::session_closed()) == 0);
    }
}

TEST_CASE("RequestMultiplexer reports a write failure on the call", "[mux][errors]") {
    Harness h;
    h.peer.close_input();

    auto call = h.mux->send("ping");
    REQUIRE(call.id == 0);
    REQUIRE(h.mux->pending_count() == 0);

    auto result = h.mux->await(call, 1s);
    REQUIRE(result.has_value() == false);
    REQUIRE(result.error().code == ClientErrorCode::TransportError);
    REQUIRE(h.mux->counters().requests_sent == 0);
}

TEST_CASE("RequestMultiplexer maps a shut-down codec to SessionClosed", "[mux][errors]") {
    Harness h;
    h.codec->shutdown();

    auto result = h.mux->request("ping", std::nullopt, 1s);
    REQUIRE(result.error().code == ClientErrorCode::SessionClosed);
}
