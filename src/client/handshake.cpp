#include "mcpipe/client/handshake.hpp"
#include "mcpipe/log/logger.hpp"

namespace mcpipe {

HandshakeCoordinator::HandshakeCoordinator(RequestMultiplexer& mux, HandshakeConfig config)
    : mux_(mux)
    , config_(std::move(config))
{}

ClientResult<HandshakeOutcome> HandshakeCoordinator::run() {
    InitializeParams params;
    params.protocol_version = config_.protocol_version;
    params.client_info = config_.client_info;
    params.capabilities = config_.capabilities;

    MCPIPE_LOG_DEBUG("Sending initialize (protocol " + params.protocol_version + ")");
    auto response = mux_.request(method::Initialize, params.to_json(), config_.timeout);
    if (!response) {
        return tl::unexpected(ClientError::initialization_failed("initialize", response.error()));
    }
    if (response->is_object() == false) {
        return tl::unexpected(ClientError::initialization_failed(
            "initialize", ClientError::protocol_error("Malformed initialize result: " + response->dump())));
    }

    HandshakeOutcome outcome;
    outcome.server = InitializeResult::from_json(*response);
    if (!outcome.server.protocol_version.empty() &&
        outcome.server.protocol_version != config_.protocol_version) {
        MCPIPE_LOG_WARN("Server negotiated protocol " + outcome.server.protocol_version +
                        " (requested " + config_.protocol_version + ")");
    }
    MCPIPE_LOG_INFO("Connected to " + outcome.server.server_info.name + " " + outcome.server.server_info.version);

    auto notified = mux_.notify(method::Initialized);
    if (!notified) {
        return tl::unexpected(ClientError::initialization_failed("notifications/initialized", notified.error()));
    }

    // tools/list is always attempted. A server that neither advertises tools
    // nor implements the method simply has an empty catalog.
    auto catalog = discover_tools(mux_, config_.timeout, config_.max_tool_pages);
    if (!catalog) {
        const auto& err = catalog.error();
        const bool method_missing = err.rpc_error && err.rpc_error->code == ErrorCode::MethodNotFound;
        if (method_missing && !outcome.server.capabilities.tools) {
            MCPIPE_LOG_INFO("Server does not provide tools; catalog is empty");
            return outcome;
        }
        return tl::unexpected(ClientError::initialization_failed("tools/list", err));
    }
    outcome.catalog = std::move(*catalog);
    MCPIPE_LOG_INFO("Discovered " + std::to_string(outcome.catalog.size()) + " tool(s)");
    return outcome;
}

ClientResult<ToolCatalog> HandshakeCoordinator::discover_tools(RequestMultiplexer& mux,
                                                               std::chrono::milliseconds timeout,
                                                               std::size_t max_pages) {
    std::vector<ToolDescriptor> tools;
    std::optional<std::string> cursor;

    for (std::size_t page = 0; page < max_pages; ++page) {
        Json params = Json::object();
        if (cursor) {
            params["cursor"] = *cursor;
        }

        auto response = mux.request(method::ToolsList, params, timeout);
        if (!response) {
            return tl::unexpected(response.error());
        }
        if (response->is_object() == false ||
            response->contains("tools") == false ||
            (*response)["tools"].is_array() == false) {
            return tl::unexpected(ClientError::protocol_error("Malformed tools/list result: " + response->dump()));
        }

        auto result = ListToolsResult::from_json(*response);
        for (auto& tool : result.tools) {
            tools.push_back(std::move(tool));
        }

        if (!result.next_cursor || result.next_cursor->empty()) {
            return ToolCatalog(std::move(tools));
        }
        if (cursor && *cursor == *result.next_cursor) {
            return tl::unexpected(ClientError::protocol_error("tools/list returned the same cursor twice"));
        }
        cursor = std::move(result.next_cursor);
    }

    return tl::unexpected(ClientError::protocol_error(
        "tools/list did not finish within " + std::to_string(max_pages) + " pages"));
}

}  // namespace mcpipe
