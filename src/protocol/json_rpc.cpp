#include "mcpipe/protocol/json_rpc.hpp"

namespace mcpipe {

namespace {

bool is_valid_params_type(const Json& node) {
    return node.is_object() || node.is_array();
}

JsonResult<JsonRpcId> parse_id_field(const Json& id_node) {
    if (id_node.is_number_integer() == true) {
        return JsonRpcId::integer(id_node.get<std::int64_t>());
    }
    if (id_node.is_string() == true) {
        return JsonRpcId::string(id_node.get<std::string>());
    }

    return tl::unexpected(JsonError{
        JsonError::Code::InvalidId,
        "id must be an integer or string"});
}

JsonResult<std::optional<Json>> parse_params_field(const Json& payload) {
    if (payload.contains("params") == false) {
        return std::optional<Json>{};
    }
    const Json& params_node = payload.at("params");
    if (is_valid_params_type(params_node) == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidParams,
            "params must be an object or array"});
    }
    return std::optional<Json>{params_node};
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcId
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcId JsonRpcId::integer(std::int64_t value) {
    return JsonRpcId{value};
}

JsonRpcId JsonRpcId::string(std::string value) {
    return JsonRpcId{std::move(value)};
}

Json JsonRpcId::to_json() const {
    return std::visit([](const auto& v) { return Json(v); }, value);
}

std::string JsonRpcId::to_string() const {
    if (is_integer()) {
        return std::to_string(std::get<std::int64_t>(value));
    }
    return "\"" + std::get<std::string>(value) + "\"";
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcError
// ─────────────────────────────────────────────────────────────────────────────

Json JsonRpcError::to_json() const {
    Json payload;
    payload["code"] = code;
    payload["message"] = message;
    if (data.has_value()) {
        payload["data"] = *data;
    }
    return payload;
}

JsonRpcError JsonRpcError::from_json(const Json& node) {
    JsonRpcError error;
    if (node.is_object() == false) {
        error.message = "malformed error object";
        return error;
    }
    if (node.contains("code") && node["code"].is_number_integer()) {
        error.code = node["code"].get<std::int64_t>();
    }
    if (node.contains("message") && node["message"].is_string()) {
        error.message = node["message"].get<std::string>();
    }
    if (node.contains("data")) {
        error.data = node["data"];
    }
    return error;
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcRequest
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcRequest::JsonRpcRequest(std::string method,
                               JsonRpcId id,
                               std::optional<Json> params)
    : method_(std::move(method)),
      id_(std::move(id)),
      params_(std::move(params)) {}

JsonRpcRequest::JsonRpcRequest(std::string method,
                               std::int64_t id,
                               std::optional<Json> params)
    : JsonRpcRequest(std::move(method), JsonRpcId::integer(id), std::move(params)) {}

const std::string& JsonRpcRequest::method() const noexcept {
    return method_;
}

const JsonRpcId& JsonRpcRequest::id() const noexcept {
    return id_;
}

const std::optional<Json>& JsonRpcRequest::params() const noexcept {
    return params_;
}

Json JsonRpcRequest::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["id"] = id_.to_json();
    payload["method"] = method_;
    if (params_.has_value()) {
        payload["params"] = *params_;
    }
    return payload;
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcNotification
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcNotification::JsonRpcNotification(std::string method,
                                         std::optional<Json> params)
    : method_(std::move(method)),
      params_(std::move(params)) {}

const std::string& JsonRpcNotification::method() const noexcept {
    return method_;
}

const std::optional<Json>& JsonRpcNotification::params() const noexcept {
    return params_;
}

Json JsonRpcNotification::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["method"] = method_;
    if (params_.has_value()) {
        payload["params"] = *params_;
    }
    return payload;
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcResponse
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcResponse::JsonRpcResponse(JsonRpcId id, std::variant<Json, JsonRpcError> outcome)
    : id_(std::move(id)),
      outcome_(std::move(outcome)) {}

JsonRpcResponse JsonRpcResponse::success(JsonRpcId id, Json result) {
    return JsonRpcResponse(std::move(id), std::variant<Json, JsonRpcError>(std::in_place_index<0>, std::move(result)));
}

JsonRpcResponse JsonRpcResponse::failure(JsonRpcId id, JsonRpcError error) {
    return JsonRpcResponse(std::move(id), std::variant<Json, JsonRpcError>(std::in_place_index<1>, std::move(error)));
}

const JsonRpcId& JsonRpcResponse::id() const noexcept {
    return id_;
}

bool JsonRpcResponse::is_error() const noexcept {
    return outcome_.index() == 1;
}

const Json& JsonRpcResponse::result() const noexcept {
    return *std::get_if<0>(&outcome_);
}

const JsonRpcError& JsonRpcResponse::error() const noexcept {
    return *std::get_if<1>(&outcome_);
}

Json JsonRpcResponse::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["id"] = id_.to_json();
    if (is_error()) {
        payload["error"] = error().to_json();
    } else {
        payload["result"] = result();
    }
    return payload;
}

// ─────────────────────────────────────────────────────────────────────────────
// Classification
// ─────────────────────────────────────────────────────────────────────────────

JsonResult<JsonRpcMessage> classify_message(const Json& payload) {
    if (payload.is_object() == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidShape,
            "payload must be a JSON object"});
    }

    // Lenient peers omit the version member; only a wrong one is rejected
    if (payload.contains("jsonrpc")) {
        const Json& version_node = payload.at("jsonrpc");
        if ((version_node.is_string() == false) || (version_node.get<std::string>() != kJsonRpcVersion)) {
            return tl::unexpected(JsonError{
                JsonError::Code::InvalidVersion,
                "jsonrpc must equal \"2.0\""});
        }
    }

    const bool has_method = payload.contains("method");
    const bool has_id = payload.contains("id") && (payload.at("id").is_null() == false);

    if (has_method == true) {
        const Json& method_node = payload.at("method");
        if (method_node.is_string() == false) {
            return tl::unexpected(JsonError{
                JsonError::Code::InvalidParams,
                "method must be a string"});
        }

        auto params = parse_params_field(payload);
        if (params.has_value() == false) {
            return tl::unexpected(params.error());
        }

        if (has_id == false) {
            return JsonRpcMessage{JsonRpcNotification(method_node.get<std::string>(), *params)};
        }

        auto id = parse_id_field(payload.at("id"));
        if (id.has_value() == false) {
            return tl::unexpected(id.error());
        }
        return JsonRpcMessage{JsonRpcRequest(method_node.get<std::string>(), *id, *params)};
    }

    const bool has_result = payload.contains("result");
    const bool has_error = payload.contains("error");
    if ((has_result == false) && (has_error == false)) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidShape,
            "message has neither method nor result/error"});
    }
    if (has_result && has_error) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidShape,
            "response carries both result and error"});
    }
    if (has_id == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidId,
            "response without a usable id"});
    }

    auto id = parse_id_field(payload.at("id"));
    if (id.has_value() == false) {
        return tl::unexpected(id.error());
    }

    if (has_error) {
        return JsonRpcMessage{JsonRpcResponse::failure(*id, JsonRpcError::from_json(payload.at("error")))};
    }
    return JsonRpcMessage{JsonRpcResponse::success(*id, payload.at("result"))};
}

}  // namespace mcpipe
