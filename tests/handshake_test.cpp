// ─────────────────────────────────────────────────────────────────────────────
// Handshake Tests
// ─────────────────────────────────────────────────────────────────────────────
// A scripted peer answers on its own thread; each test supplies the replies.

#include <catch2/catch_test_macros.hpp>

#include "mcpipe/client/handshake.hpp"
#include "mcpipe/client/request_multiplexer.hpp"
#include "mcpipe/client/response_listener.hpp"
#include "mcpipe/transport/frame_codec.hpp"
#include "mocks/pipe_peer.hpp"
#include "mocks/scripted_peer.hpp"

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace mcpipe;
using namespace std::chrono_literals;

namespace {

using mcpipe::testing::ScriptedPeer;

Json result(Json value) { return ScriptedPeer::result(std::move(value)); }

Json error(int code, const std::string& message) { return ScriptedPeer::error(code, message); }

Json default_initialize() {
    return result({
        {"protocolVersion", MCP_PROTOCOL_VERSION},
        {"capabilities", {{"tools", {{"listChanged", true}}}}},
        {"serverInfo", {{"name", "scripted"}, {"version", "9.9"}}}
    });
}

Json tool(const std::string& name) {
    return Json{{"name", name}, {"inputSchema", {{"type", "object"}}}};
}

HandshakeConfig quick_config() {
    HandshakeConfig config;
    config.timeout = 2000ms;
    return config;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Happy path
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Handshake runs initialize, initialized and every tools/list page", "[handshake]") {
    ScriptedPeer peer([](const std::string& method, const Json& params) -> Json {
        if (method == "initialize") {
            return default_initialize();
        }
        if (method == "tools/list") {
            if (params.contains("cursor") == false) {
                return result({{"tools", Json::array({tool("alpha"), tool("beta")})}, {"nextCursor", "page-2"}});
            }
            if (params["cursor"] != "page-2") {
                return error(-32602, "Unexpected cursor");
            }
            return result({{"tools", Json::array({tool("gamma")})}});
        }
        return error(-32601, "Method not found");
    });

    HandshakeCoordinator handshake(peer.mux(), quick_config());
    auto outcome = handshake.run();

    REQUIRE(outcome.has_value());
    REQUIRE(outcome->server.server_info.name == "scripted");
    REQUIRE(outcome->server.capabilities.tools.has_value());
    REQUIRE(outcome->catalog.names() == std::vector<std::string>{"alpha", "beta", "gamma"});

    const auto methods = peer.methods();
    REQUIRE(methods == std::vector<std::string>{
        "initialize", "notifications/initialized", "tools/list", "tools/list"});

    const Json init = peer.received().front();
    REQUIRE(init["params"]["protocolVersion"] == MCP_PROTOCOL_VERSION);
    REQUIRE(init["params"]["clientInfo"]["name"] == "mcpipe");
    REQUIRE(init["params"]["clientInfo"]["version"] == MCPIPE_VERSION);
}

TEST_CASE("Handshake accepts a minimal initialize result", "[handshake]") {
    ScriptedPeer peer([](const std::string& method, const Json&) -> Json {
        if (method == "initialize") {
            return result(Json::object());
        }
        return result({{"tools", Json::array({tool("echo")})}});
    });

    auto outcome = HandshakeCoordinator(peer.mux(), quick_config()).run();
    REQUIRE(outcome.has_value());
    REQUIRE(outcome->server.server_info.name.empty());
    REQUIRE(outcome->catalog.names() == std::vector<std::string>{"echo"});
}

TEST_CASE("Handshake completes against a peer that omits the jsonrpc member", "[handshake]") {
    mcpipe::testing::PipePeer pipe;
    auto codec = FrameCodec::create(pipe.client_read_fd(), pipe.client_write_fd());
    REQUIRE(codec.has_value());
    RequestMultiplexer mux(**codec);
    ResponseListener listener(**codec, mux);
    REQUIRE(listener.start());

    // Bare replies, exactly as a minimal server writes them
    std::atomic<bool> served{false};
    std::thread server([&] {
        auto initialize = pipe.read_message();
        if (!initialize || (*initialize)["method"] != "initialize" || (*initialize)["id"] != 0) {
            return;
        }
        pipe.send_raw(R"({"id":0,"result":{}})" "\n");

        auto initialized = pipe.read_message();
        auto list = pipe.read_message();
        if (!initialized || !list || (*list)["method"] != "tools/list" || (*list)["id"] != 1) {
            return;
        }
        pipe.send_raw(R"({"id":1,"result":{"tools":[{"name":"echo"}]}})" "\n");
        served = true;
    });

    auto outcome = HandshakeCoordinator(mux, quick_config()).run();
    server.join();

    REQUIRE(served);
    REQUIRE(outcome.has_value());
    REQUIRE(outcome->catalog.names() == std::vector<std::string>{"echo"});
    REQUIRE(mux.counters().anomalies == 0);

    listener.stop();
}

TEST_CASE("Handshake tolerates a different protocol version", "[handshake]") {
    ScriptedPeer peer([](const std::string& method, const Json&) -> Json {
        if (method == "initialize") {
            return result({{"protocolVersion", "2099-01-01"}, {"capabilities", Json::object()}});
        }
        return result({{"tools", Json::array()}});
    });

    auto outcome = HandshakeCoordinator(peer.mux(), quick_config()).run();
    REQUIRE(outcome.has_value());
    REQUIRE(outcome->server.protocol_version == "2099-01-01");
    REQUIRE(outcome->catalog.empty());
}

TEST_CASE("Handshake treats a missing tools/list as no tools when none are advertised", "[handshake][tools]") {
    ScriptedPeer peer([](const std::string& method, const Json&) -> Json {
        if (method == "initialize") {
            return result({{"capabilities", Json::object()}, {"serverInfo", {{"name", "bare"}}}});
        }
        return error(-32601, "Method not found");
    });

    auto outcome = HandshakeCoordinator(peer.mux(), quick_config()).run();
    REQUIRE(outcome.has_value());
    REQUIRE(outcome->catalog.empty());
}

// ═══════════════════════════════════════════════════════════════════════════
// Failures
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Handshake reports an initialize error with its cause", "[handshake][errors]") {
    ScriptedPeer peer([](const std::string&, const Json&) -> Json {
        return error(-32603, "Internal error");
    });

    auto outcome = HandshakeCoordinator(peer.mux(), quick_config()).run();
    REQUIRE(outcome.has_value() == false);
    REQUIRE(outcome.error().code == ClientErrorCode::InitializationError);
    REQUIRE(outcome.error().cause == ClientErrorCode::ProtocolError);
    REQUIRE(outcome.error().rpc_error.has_value());
    REQUIRE(outcome.error().rpc_error->code == -32603);
    REQUIRE(outcome.error().message.find("initialize") != std::string::npos);

    // Nothing else goes out after a failed initialize
    std::this_thread::sleep_for(50ms);
    REQUIRE(peer.methods() == std::vector<std::string>{"initialize"});
}

TEST_CASE("Handshake rejects a non-object initialize result", "[handshake][errors]") {
    ScriptedPeer peer([](const std::string&, const Json&) -> Json {
        return result("hello");
    });

    auto outcome = HandshakeCoordinator(peer.mux(), quick_config()).run();
    REQUIRE(outcome.error().code == ClientErrorCode::InitializationError);
    REQUIRE(outcome.error().cause == ClientErrorCode::ProtocolError);
}

TEST_CASE("Handshake times out on a silent server", "[handshake][errors]") {
    ScriptedPeer peer([](const std::string&, const Json&) -> Json { return nullptr; });

    HandshakeConfig config;
    config.timeout = 100ms;
    auto outcome = HandshakeCoordinator(peer.mux(), config).run();

    REQUIRE(outcome.error().code == ClientErrorCode::InitializationError);
    REQUIRE(outcome.error().cause == ClientErrorCode::Timeout);
}

TEST_CASE("Handshake fails when tools/list is missing but tools are advertised", "[handshake][tools][errors]") {
    ScriptedPeer peer([](const std::string& method, const Json&) -> Json {
        if (method == "initialize") {
            return default_initialize();
        }
        return error(-32601, "Method not found");
    });

    auto outcome = HandshakeCoordinator(peer.mux(), quick_config()).run();
    REQUIRE(outcome.error().code == ClientErrorCode::InitializationError);
    REQUIRE(outcome.error().message.find("tools/list") != std::string::npos);
}

TEST_CASE("Handshake rejects a malformed tools/list result", "[handshake][tools][errors]") {
    ScriptedPeer peer([](const std::string& method, const Json&) -> Json {
        if (method == "initialize") {
            return default_initialize();
        }
        return result({{"tools", "not-a-list"}});
    });

    auto outcome = HandshakeCoordinator(peer.mux(), quick_config()).run();
    REQUIRE(outcome.error().code == ClientErrorCode::InitializationError);
    REQUIRE(outcome.error().cause == ClientErrorCode::ProtocolError);
}

TEST_CASE("Handshake stops a cursor loop", "[handshake][tools][errors]") {
    SECTION("same cursor twice") {
        ScriptedPeer peer([](const std::string& method, const Json&) -> Json {
            if (method == "initialize") {
                return default_initialize();
            }
            return result({{"tools", Json::array({tool("a")})}, {"nextCursor", "again"}});
        });

        auto outcome = HandshakeCoordinator(peer.mux(), quick_config()).run();
        REQUIRE(outcome.error().code == ClientErrorCode::InitializationError);
        REQUIRE(outcome.error().cause == ClientErrorCode::ProtocolError);
    }

    SECTION("page limit") {
        std::atomic<int> page{0};
        ScriptedPeer peer([&page](const std::string& method, const Json&) -> Json {
            if (method == "initialize") {
                return default_initialize();
            }
            const int n = page.fetch_add(1);
            return result({{"tools", Json::array({tool("t" + std::to_string(n))})}, {"nextCursor", std::to_string(n + 1)}});
        });

        HandshakeConfig config = quick_config();
        config.max_tool_pages = 3;
        auto outcome = HandshakeCoordinator(peer.mux(), config).run();
        REQUIRE(outcome.error().code == ClientErrorCode::InitializationError);
        REQUIRE(page.load() == 3);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Tool catalog
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("discover_tools can be reused for a refresh", "[handshake][tools]") {
    ScriptedPeer peer([](const std::string&, const Json&) -> Json {
        return result({{"tools", Json::array({tool("one"), tool("two")})}});
    });

    auto catalog = HandshakeCoordinator::discover_tools(peer.mux(), 2000ms, 4);
    REQUIRE(catalog.has_value());
    REQUIRE(catalog->size() == 2);
    REQUIRE(catalog->contains("two"));
    REQUIRE(catalog->find("three") == nullptr);
}

TEST_CASE("ToolCatalog drops unnamed and duplicate tools", "[tools]") {
    std::vector<ToolDescriptor> tools(4);
    tools[0].name = "read";
    tools[0].description = "first";
    tools[1].name = "";
    tools[2].name = "read";
    tools[2].description = "second";
    tools[3].name = "write";

    const ToolCatalog catalog(std::move(tools));
    REQUIRE(catalog.names() == std::vector<std::string>{"read", "write"});
    REQUIRE(catalog.find("read")->description == "first");
}
