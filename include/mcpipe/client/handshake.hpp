#pragma once

#include "mcpipe/client/client_error.hpp"
#include "mcpipe/client/request_multiplexer.hpp"
#include "mcpipe/client/tool_catalog.hpp"
#include "mcpipe/protocol/mcp_types.hpp"

#include <chrono>
#include <cstddef>
#include <string>

namespace mcpipe {

inline constexpr const char* MCPIPE_VERSION = "0.1.0";

struct HandshakeConfig {
    Implementation client_info{"mcpipe", MCPIPE_VERSION};
    ClientCapabilities capabilities;
    std::string protocol_version = MCP_PROTOCOL_VERSION;

    /// Applies to each request of the exchange separately
    std::chrono::milliseconds timeout{30'000};

    /// Upper bound on tools/list pages followed through nextCursor
    std::size_t max_tool_pages{64};
};

struct HandshakeOutcome {
    InitializeResult server;
    ToolCatalog catalog;
};

// ═══════════════════════════════════════════════════════════════════════════
// Handshake Coordinator
// ═══════════════════════════════════════════════════════════════════════════
// initialize -> notifications/initialized -> tools/list (all pages).
// Every failure comes back as InitializationError with the failing step and
// the underlying error code; the caller tears the session down.

class HandshakeCoordinator {
public:
    HandshakeCoordinator(RequestMultiplexer& mux, HandshakeConfig config);

    [[nodiscard]] ClientResult<HandshakeOutcome> run();

    /// tools/list until nextCursor runs out. Errors are reported unwrapped
    /// (ProtocolError, Timeout, ...) so a later refresh can reuse this.
    [[nodiscard]] static ClientResult<ToolCatalog> discover_tools(RequestMultiplexer& mux,
                                                                  std::chrono::milliseconds timeout,
                                                                  std::size_t max_pages);

private:
    RequestMultiplexer& mux_;
    HandshakeConfig config_;
};

}  // namespace mcpipe
