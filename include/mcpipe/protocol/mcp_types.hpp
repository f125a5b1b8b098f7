#ifndef MCPIPE_PROTOCOL_MCP_TYPES_HPP
#define MCPIPE_PROTOCOL_MCP_TYPES_HPP

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace mcpipe {

using Json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════
// MCP Protocol Version & Method Names
// ═══════════════════════════════════════════════════════════════════════════

inline constexpr const char* MCP_PROTOCOL_VERSION = "2024-11-05";

namespace method {
    inline constexpr const char* Initialize = "initialize";
    inline constexpr const char* Initialized = "notifications/initialized";
    inline constexpr const char* ToolsList = "tools/list";
    inline constexpr const char* ToolsCall = "tools/call";
    inline constexpr const char* Ping = "ping";
    inline constexpr const char* Cancelled = "notifications/cancelled";
    inline constexpr const char* ToolListChanged = "notifications/tools/list_changed";
}

// Peers send whatever they like; a field of the wrong type reads as absent.
namespace detail {
    inline std::string string_field(const Json& j, const char* key) {
        if (j.is_object() && j.contains(key) && j[key].is_string()) {
            return j[key].get<std::string>();
        }
        return {};
    }

    inline bool bool_field(const Json& j, const char* key, bool fallback = false) {
        if (j.is_object() && j.contains(key) && j[key].is_boolean()) {
            return j[key].get<bool>();
        }
        return fallback;
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Client/Server Info
// ═══════════════════════════════════════════════════════════════════════════

struct Implementation {
    std::string name;
    std::string version;

    [[nodiscard]] Json to_json() const {
        return {{"name", name}, {"version", version}};
    }

    static Implementation from_json(const Json& j) {
        return {
            detail::string_field(j, "name"),
            detail::string_field(j, "version")
        };
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Capabilities
// ═══════════════════════════════════════════════════════════════════════════
// The client advertises nothing beyond what the caller adds to `experimental`;
// server-initiated sampling, roots and elicitation are not handled here.

struct ClientCapabilities {
    Json experimental = Json::object();

    [[nodiscard]] Json to_json() const {
        Json j = Json::object();
        if (!experimental.empty()) {
            j["experimental"] = experimental;
        }
        return j;
    }
};

struct ServerCapabilities {
    struct Tools {
        bool list_changed = false;
    };

    std::optional<Tools> tools;
    bool logging = false;
    bool prompts = false;
    bool resources = false;
    Json experimental;

    static ServerCapabilities from_json(const Json& j) {
        ServerCapabilities caps;
        if (j.is_object() == false) {
            return caps;
        }
        if (j.contains("tools") && j["tools"].is_object()) {
            caps.tools = Tools{detail::bool_field(j["tools"], "listChanged")};
        }
        caps.logging = j.contains("logging");
        caps.prompts = j.contains("prompts");
        caps.resources = j.contains("resources");
        if (j.contains("experimental")) {
            caps.experimental = j["experimental"];
        }
        return caps;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Initialize
// ═══════════════════════════════════════════════════════════════════════════

struct InitializeParams {
    std::string protocol_version = MCP_PROTOCOL_VERSION;
    ClientCapabilities capabilities;
    Implementation client_info;

    [[nodiscard]] Json to_json() const {
        return {
            {"protocolVersion", protocol_version},
            {"capabilities", capabilities.to_json()},
            {"clientInfo", client_info.to_json()}
        };
    }
};

struct InitializeResult {
    std::string protocol_version;
    ServerCapabilities capabilities;
    Implementation server_info;
    std::optional<std::string> instructions;

    static InitializeResult from_json(const Json& j) {
        InitializeResult result;
        result.protocol_version = detail::string_field(j, "protocolVersion");
        if (j.contains("capabilities")) {
            result.capabilities = ServerCapabilities::from_json(j["capabilities"]);
        }
        if (j.contains("serverInfo") && j["serverInfo"].is_object()) {
            result.server_info = Implementation::from_json(j["serverInfo"]);
        }
        if (j.contains("instructions") && j["instructions"].is_string()) {
            result.instructions = j["instructions"].get<std::string>();
        }
        return result;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Tools
// ═══════════════════════════════════════════════════════════════════════════

// Behaviour hints published by the server; advisory only.
struct ToolAnnotations {
    std::optional<std::string> title;
    std::optional<bool> destructive_hint;
    std::optional<bool> idempotent_hint;
    std::optional<bool> read_only_hint;
    std::optional<bool> open_world_hint;

    [[nodiscard]] static ToolAnnotations from_json(const Json& j) {
        ToolAnnotations ann;
        if (j.contains("title") && j["title"].is_string()) {
            ann.title = j["title"].get<std::string>();
        }
        if (j.contains("destructiveHint") && j["destructiveHint"].is_boolean()) {
            ann.destructive_hint = j["destructiveHint"].get<bool>();
        }
        if (j.contains("idempotentHint") && j["idempotentHint"].is_boolean()) {
            ann.idempotent_hint = j["idempotentHint"].get<bool>();
        }
        if (j.contains("readOnlyHint") && j["readOnlyHint"].is_boolean()) {
            ann.read_only_hint = j["readOnlyHint"].get<bool>();
        }
        if (j.contains("openWorldHint") && j["openWorldHint"].is_boolean()) {
            ann.open_world_hint = j["openWorldHint"].get<bool>();
        }
        return ann;
    }

    [[nodiscard]] Json to_json() const {
        Json j = Json::object();
        if (title) j["title"] = *title;
        if (destructive_hint) j["destructiveHint"] = *destructive_hint;
        if (idempotent_hint) j["idempotentHint"] = *idempotent_hint;
        if (read_only_hint) j["readOnlyHint"] = *read_only_hint;
        if (open_world_hint) j["openWorldHint"] = *open_world_hint;
        return j;
    }

    [[nodiscard]] bool empty() const {
        return !title && !destructive_hint && !idempotent_hint &&
               !read_only_hint && !open_world_hint;
    }
};

/// One callable tool. `input_schema` is carried verbatim and never validated.
struct ToolDescriptor {
    std::string name;
    std::optional<std::string> description;
    Json input_schema = Json::object();
    std::optional<ToolAnnotations> annotations;

    static ToolDescriptor from_json(const Json& j) {
        ToolDescriptor tool;
        tool.name = detail::string_field(j, "name");
        if (j.contains("description") && j["description"].is_string()) {
            tool.description = j["description"].get<std::string>();
        }
        if (j.contains("inputSchema")) {
            tool.input_schema = j["inputSchema"];
        }
        if (j.contains("annotations") && j["annotations"].is_object()) {
            tool.annotations = ToolAnnotations::from_json(j["annotations"]);
        }
        return tool;
    }

    [[nodiscard]] Json to_json() const {
        Json j = {{"name", name}, {"inputSchema", input_schema}};
        if (description) {
            j["description"] = *description;
        }
        if (annotations && !annotations->empty()) {
            j["annotations"] = annotations->to_json();
        }
        return j;
    }
};

/// One page of tools/list
struct ListToolsResult {
    std::vector<ToolDescriptor> tools;
    std::optional<std::string> next_cursor;

    static ListToolsResult from_json(const Json& j) {
        ListToolsResult result;
        if (j.contains("tools") && j["tools"].is_array()) {
            for (const auto& t : j["tools"]) {
                if (t.is_object()) {
                    result.tools.push_back(ToolDescriptor::from_json(t));
                }
            }
        }
        if (j.contains("nextCursor") && j["nextCursor"].is_string()) {
            result.next_cursor = j["nextCursor"].get<std::string>();
        }
        return result;
    }
};

struct CallToolParams {
    std::string name;
    Json arguments = Json::object();

    [[nodiscard]] Json to_json() const {
        return {{"name", name}, {"arguments", arguments}};
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Tool Result Content
// ═══════════════════════════════════════════════════════════════════════════

struct TextContent {
    std::string text;

    static TextContent from_json(const Json& j) {
        return {detail::string_field(j, "text")};
    }
};

struct ImageContent {
    std::string data;  // Base64
    std::string mime_type;

    static ImageContent from_json(const Json& j) {
        return {detail::string_field(j, "data"), detail::string_field(j, "mimeType")};
    }
};

struct AudioContent {
    std::string data;  // Base64
    std::string mime_type;

    static AudioContent from_json(const Json& j) {
        return {detail::string_field(j, "data"), detail::string_field(j, "mimeType")};
    }
};

struct EmbeddedResource {
    std::string uri;
    std::optional<std::string> mime_type;
    std::optional<std::string> text;
    std::optional<std::string> blob;  // Base64

    static EmbeddedResource from_json(const Json& j) {
        EmbeddedResource res;
        if (j.contains("resource") && j["resource"].is_object()) {
            const auto& r = j["resource"];
            res.uri = detail::string_field(r, "uri");
            if (r.contains("mimeType") && r["mimeType"].is_string()) {
                res.mime_type = r["mimeType"].get<std::string>();
            }
            if (r.contains("text") && r["text"].is_string()) {
                res.text = r["text"].get<std::string>();
            }
            if (r.contains("blob") && r["blob"].is_string()) {
                res.blob = r["blob"].get<std::string>();
            }
        }
        return res;
    }
};

using Content = std::variant<TextContent, ImageContent, AudioContent, EmbeddedResource>;

struct CallToolResult {
    std::vector<Content> content;
    std::optional<Json> structured_content;
    bool is_error = false;
    Json raw;  // the untouched result payload

    static CallToolResult from_json(const Json& j) {
        CallToolResult result;
        result.raw = j;
        result.is_error = detail::bool_field(j, "isError");
        if (j.contains("structuredContent")) {
            result.structured_content = j["structuredContent"];
        }
        if (j.contains("content") && j["content"].is_array()) {
            for (const auto& c : j["content"]) {
                if (c.is_object() == false) {
                    continue;
                }
                const auto type = detail::string_field(c, "type");
                if (type == "text") {
                    result.content.push_back(TextContent::from_json(c));
                } else if (type == "image") {
                    result.content.push_back(ImageContent::from_json(c));
                } else if (type == "audio") {
                    result.content.push_back(AudioContent::from_json(c));
                } else if (type == "resource") {
                    result.content.push_back(EmbeddedResource::from_json(c));
                }
            }
        }
        return result;
    }

    /// Concatenation of all text blocks, newline separated
    [[nodiscard]] std::string text() const {
        std::string out;
        for (const auto& block : content) {
            if (const auto* t = std::get_if<TextContent>(&block)) {
                if (!out.empty()) {
                    out += '\n';
                }
                out += t->text;
            }
        }
        return out;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Errors
// ═══════════════════════════════════════════════════════════════════════════

struct McpError {
    std::int64_t code{0};
    std::string message;
    std::optional<Json> data;

    [[nodiscard]] Json to_json() const {
        Json j = {{"code", code}, {"message", message}};
        if (data) j["data"] = *data;
        return j;
    }
};

// Standard JSON-RPC error codes
namespace ErrorCode {
    inline constexpr int ParseError = -32700;
    inline constexpr int InvalidRequest = -32600;
    inline constexpr int MethodNotFound = -32601;
    inline constexpr int InvalidParams = -32602;
    inline constexpr int InternalError = -32603;
}

// ═══════════════════════════════════════════════════════════════════════════
// Cancellation
// ═══════════════════════════════════════════════════════════════════════════
// Sent when a request is abandoned locally (timeout) so the peer can stop work.

struct CancelledNotification {
    std::int64_t request_id{0};
    std::optional<std::string> reason;

    [[nodiscard]] Json to_json() const {
        Json j = {{"requestId", request_id}};
        if (reason) {
            j["reason"] = *reason;
        }
        return j;
    }
};

}  // namespace mcpipe

#endif  // MCPIPE_PROTOCOL_MCP_TYPES_HPP
