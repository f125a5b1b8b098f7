#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <tl/expected.hpp>

namespace mcpipe {

using Json = nlohmann::json;

inline constexpr std::string_view kJsonRpcVersion{"2.0"};

struct JsonError {
    enum class Code {
        InvalidVersion,
        MissingField,
        InvalidId,
        InvalidParams,
        InvalidShape      // neither request, response nor notification
    };

    Code code{Code::InvalidShape};
    std::string message;
};

template <typename T>
using JsonResult = tl::expected<T, JsonError>;

/// JSON-RPC id. This client only issues integer ids, but peers may use strings.
struct JsonRpcId {
    std::variant<std::int64_t, std::string> value;

    static JsonRpcId integer(std::int64_t v);
    static JsonRpcId string(std::string v);

    [[nodiscard]] bool is_integer() const noexcept {
        return std::holds_alternative<std::int64_t>(value);
    }

    [[nodiscard]] Json to_json() const;
    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const JsonRpcId&, const JsonRpcId&) = default;
};

struct JsonRpcError {
    std::int64_t code{};
    std::string message;
    std::optional<Json> data{};

    [[nodiscard]] Json to_json() const;
    static JsonRpcError from_json(const Json& node);
};

class JsonRpcRequest {
public:
    JsonRpcRequest(std::string method, JsonRpcId id, std::optional<Json> params = std::nullopt);
    JsonRpcRequest(std::string method, std::int64_t id, std::optional<Json> params = std::nullopt);

    [[nodiscard]] const std::string& method() const noexcept;
    [[nodiscard]] const JsonRpcId& id() const noexcept;
    [[nodiscard]] const std::optional<Json>& params() const noexcept;

    [[nodiscard]] Json to_json() const;

private:
    std::string method_;
    JsonRpcId id_;
    std::optional<Json> params_;
};

class JsonRpcNotification {
public:
    explicit JsonRpcNotification(std::string method, std::optional<Json> params = std::nullopt);

    [[nodiscard]] const std::string& method() const noexcept;
    [[nodiscard]] const std::optional<Json>& params() const noexcept;

    [[nodiscard]] Json to_json() const;

private:
    std::string method_;
    std::optional<Json> params_;
};

/// Response to a request: exactly one of result / error is present
class JsonRpcResponse {
public:
    static JsonRpcResponse success(JsonRpcId id, Json result);
    static JsonRpcResponse failure(JsonRpcId id, JsonRpcError error);

    [[nodiscard]] const JsonRpcId& id() const noexcept;
    [[nodiscard]] bool is_error() const noexcept;
    [[nodiscard]] const Json& result() const noexcept;
    [[nodiscard]] const JsonRpcError& error() const noexcept;

    [[nodiscard]] Json to_json() const;

private:
    JsonRpcResponse(JsonRpcId id, std::variant<Json, JsonRpcError> outcome);

    JsonRpcId id_;
    std::variant<Json, JsonRpcError> outcome_;
};

/// Any inbound frame after classification
using JsonRpcMessage = std::variant<JsonRpcRequest, JsonRpcResponse, JsonRpcNotification>;

/// Classify a decoded frame:
///   method + id  -> request (peer-initiated)
///   method only  -> notification
///   id + result|error -> response
/// A response with a null id (the peer could not read ours) is InvalidId.
/// A missing "jsonrpc" member is accepted; a present one must be "2.0".
[[nodiscard]] JsonResult<JsonRpcMessage> classify_message(const Json& payload);

}  // namespace mcpipe
