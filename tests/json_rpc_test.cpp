#include <catch2/catch_test_macros.hpp>

#include "mcpipe/protocol/json_rpc.hpp"

using namespace mcpipe;

// ─────────────────────────────────────────────────────────────────────────────
// Outgoing messages
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("JsonRpcRequest serializes version, id, method and params", "[jsonrpc]") {
    const JsonRpcRequest request("tools/call", 7, Json{{"name", "echo"}});
    const Json payload = request.to_json();

    REQUIRE(payload["jsonrpc"] == "2.0");
    REQUIRE(payload["id"] == 7);
    REQUIRE(payload["method"] == "tools/call");
    REQUIRE(payload["params"]["name"] == "echo");
}

TEST_CASE("JsonRpcRequest omits absent params", "[jsonrpc]") {
    const JsonRpcRequest request("ping", 0);
    REQUIRE(request.to_json().contains("params") == false);
}

TEST_CASE("JsonRpcNotification has no id", "[jsonrpc]") {
    const JsonRpcNotification notification("notifications/initialized");
    const Json payload = notification.to_json();

    REQUIRE(payload["method"] == "notifications/initialized");
    REQUIRE(payload.contains("id") == false);
}

TEST_CASE("JsonRpcResponse serializes exactly one outcome", "[jsonrpc]") {
    const Json ok = JsonRpcResponse::success(JsonRpcId::string("srv-1"), Json::object()).to_json();
    REQUIRE(ok["id"] == "srv-1");
    REQUIRE(ok.contains("result"));
    REQUIRE(ok.contains("error") == false);

    const Json err = JsonRpcResponse::failure(
        JsonRpcId::integer(3), JsonRpcError{-32601, "Method not found", std::nullopt}).to_json();
    REQUIRE(err["error"]["code"] == -32601);
    REQUIRE(err.contains("result") == false);
}

TEST_CASE("JsonRpcId renders both forms", "[jsonrpc]") {
    REQUIRE(JsonRpcId::integer(42).to_string() == "42");
    REQUIRE(JsonRpcId::string("abc").to_string() == "\"abc\"");
    REQUIRE(JsonRpcId::integer(1) == JsonRpcId::integer(1));
    REQUIRE((JsonRpcId::integer(1) == JsonRpcId::string("1")) == false);
}

// ─────────────────────────────────────────────────────────────────────────────
// Classification
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("classify_message recognises responses", "[jsonrpc][classify]") {
    auto message = classify_message(Json::parse(R"({"jsonrpc":"2.0","id":4,"result":{"tools":[]}})"));

    REQUIRE(message.has_value());
    REQUIRE(std::holds_alternative<JsonRpcResponse>(*message));
    const auto& response = std::get<JsonRpcResponse>(*message);
    REQUIRE(response.id() == JsonRpcId::integer(4));
    REQUIRE(response.is_error() == false);
    REQUIRE(response.result()["tools"].is_array());
}

TEST_CASE("classify_message recognises error responses", "[jsonrpc][classify]") {
    auto message = classify_message(Json::parse(
        R"({"jsonrpc":"2.0","id":5,"error":{"code":-32602,"message":"bad args","data":{"field":"x"}}})"));

    REQUIRE(message.has_value());
    const auto& response = std::get<JsonRpcResponse>(*message);
    REQUIRE(response.is_error());
    REQUIRE(response.error().code == -32602);
    REQUIRE(response.error().message == "bad args");
    REQUIRE(response.error().data.has_value());
}

TEST_CASE("classify_message separates notifications from peer requests", "[jsonrpc][classify]") {
    auto notification = classify_message(Json::parse(
        R"({"jsonrpc":"2.0","method":"notifications/tools/list_changed"})"));
    REQUIRE(notification.has_value());
    REQUIRE(std::holds_alternative<JsonRpcNotification>(*notification));

    auto request = classify_message(Json::parse(R"({"jsonrpc":"2.0","id":"p1","method":"ping"})"));
    REQUIRE(request.has_value());
    REQUIRE(std::holds_alternative<JsonRpcRequest>(*request));
    REQUIRE(std::get<JsonRpcRequest>(*request).id() == JsonRpcId::string("p1"));
}

TEST_CASE("classify_message accepts frames without a version member", "[jsonrpc][classify]") {
    auto response = classify_message(Json::parse(R"({"id":1,"result":{"tools":[{"name":"echo"}]}})"));
    REQUIRE(response.has_value());
    REQUIRE(std::holds_alternative<JsonRpcResponse>(*response));
    REQUIRE(std::get<JsonRpcResponse>(*response).id() == JsonRpcId::integer(1));

    auto notification = classify_message(Json::parse(R"({"method":"notifications/message","params":{}})"));
    REQUIRE(notification.has_value());
    REQUIRE(std::holds_alternative<JsonRpcNotification>(*notification));

    auto request = classify_message(Json::parse(R"({"id":7,"method":"ping"})"));
    REQUIRE(request.has_value());
    REQUIRE(std::holds_alternative<JsonRpcRequest>(*request));
}

TEST_CASE("classify_message rejects unusable frames", "[jsonrpc][classify]") {
    SECTION("not an object") {
        auto m = classify_message(Json::array({1, 2}));
        REQUIRE(m.has_value() == false);
        REQUIRE(m.error().code == JsonError::Code::InvalidShape);
    }

    SECTION("wrong version") {
        auto m = classify_message(Json::parse(R"({"jsonrpc":"1.0","id":1,"result":{}})"));
        REQUIRE(m.error().code == JsonError::Code::InvalidVersion);
    }

    SECTION("non-string version") {
        auto m = classify_message(Json::parse(R"({"jsonrpc":2,"id":1,"result":{}})"));
        REQUIRE(m.error().code == JsonError::Code::InvalidVersion);
    }

    SECTION("null id on an error response") {
        auto m = classify_message(Json::parse(
            R"({"jsonrpc":"2.0","id":null,"error":{"code":-32700,"message":"Parse error"}})"));
        REQUIRE(m.error().code == JsonError::Code::InvalidId);
    }

    SECTION("fractional id") {
        auto m = classify_message(Json::parse(R"({"jsonrpc":"2.0","id":1.5,"result":{}})"));
        REQUIRE(m.error().code == JsonError::Code::InvalidId);
    }

    SECTION("both result and error") {
        auto m = classify_message(Json::parse(
            R"({"jsonrpc":"2.0","id":1,"result":{},"error":{"code":1,"message":"x"}})"));
        REQUIRE(m.error().code == JsonError::Code::InvalidShape);
    }

    SECTION("neither method nor outcome") {
        auto m = classify_message(Json::parse(R"({"jsonrpc":"2.0","id":1})"));
        REQUIRE(m.error().code == JsonError::Code::InvalidShape);
    }

    SECTION("scalar params") {
        auto m = classify_message(Json::parse(R"({"jsonrpc":"2.0","method":"x","params":5})"));
        REQUIRE(m.error().code == JsonError::Code::InvalidParams);
    }
}
