#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Client Error
// ═══════════════════════════════════════════════════════════════════════════
// Error type for everything above the framing layer: the multiplexer, the
// handshake and the session façade all report ClientError.

#include "mcpipe/protocol/mcp_types.hpp"
#include "mcpipe/transport.hpp"

#include <tl/expected.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace mcpipe {

enum class ClientErrorCode {
    SpawnError,           ///< Child process could not be started
    TransportError,       ///< Write or read failure on the pipe
    ProtocolError,        ///< Peer returned a JSON-RPC error or an unusable result
    InitializationError,  ///< Handshake failed; the session never became Ready
    NotReady,             ///< Call made outside the Ready state; nothing was sent
    SessionClosed,        ///< Process ended or session closed while the call was pending
    Timeout               ///< Per-request deadline elapsed
};

[[nodiscard]] constexpr std::string_view to_string(ClientErrorCode code) noexcept {
    switch (code) {
        case ClientErrorCode::SpawnError:          return "SpawnError";
        case ClientErrorCode::TransportError:      return "TransportError";
        case ClientErrorCode::ProtocolError:       return "ProtocolError";
        case ClientErrorCode::InitializationError: return "InitializationError";
        case ClientErrorCode::NotReady:            return "NotReady";
        case ClientErrorCode::SessionClosed:       return "SessionClosed";
        case ClientErrorCode::Timeout:             return "Timeout";
    }
    return "Unknown";
}

struct ClientError {
    ClientErrorCode code;
    std::string message;
    std::optional<McpError> rpc_error;          ///< Peer's error object, if any
    std::optional<ClientErrorCode> cause{};     ///< Underlying code for InitializationError

    // ─────────────────────────────────────────────────────────────────────────
    // Factory Methods
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] static ClientError spawn_error(std::string msg) {
        return {ClientErrorCode::SpawnError, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static ClientError transport_error(std::string msg) {
        return {ClientErrorCode::TransportError, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static ClientError protocol_error(std::string msg) {
        return {ClientErrorCode::ProtocolError, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static ClientError not_ready(std::string_view state) {
        return {ClientErrorCode::NotReady,
                "Session is not ready (state: " + std::string(state) + ")", std::nullopt};
    }

    [[nodiscard]] static ClientError session_closed(std::string msg = "Session closed") {
        return {ClientErrorCode::SessionClosed, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static ClientError timeout(std::string msg = "Request timed out") {
        return {ClientErrorCode::Timeout, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static ClientError from_rpc_error(const McpError& err) {
        return {ClientErrorCode::ProtocolError, err.message, err};
    }

    [[nodiscard]] static ClientError from_transport(const TransportError& err) {
        if (err.category == TransportError::Category::Spawn) {
            return spawn_error(err.message);
        }
        if (err.category == TransportError::Category::Closed) {
            return session_closed(err.message);
        }
        return transport_error(err.message);
    }

    /// Wrap a handshake step failure; the original code is kept in `cause`
    [[nodiscard]] static ClientError initialization_failed(std::string_view step, const ClientError& underlying) {
        ClientError err{
            ClientErrorCode::InitializationError,
            std::string(step) + " failed: " + std::string(to_string(underlying.code)) + ": " + underlying.message,
            underlying.rpc_error
        };
        err.cause = underlying.code;
        return err;
    }

    [[nodiscard]] std::string describe() const {
        return std::string(to_string(code)) + ": " + message;
    }
};

template <typename T>
using ClientResult = tl::expected<T, ClientError>;

}  // namespace mcpipe
