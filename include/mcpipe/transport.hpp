#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Transport Common Types
// ═══════════════════════════════════════════════════════════════════════════
// Shared types used by the process and framing layers.
//
// For the child process, use: #include "mcpipe/process/child_process.hpp"
// For wire framing, use: #include "mcpipe/transport/frame_codec.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

namespace mcpipe {

using Json = nlohmann::json;

/// Error type for process and pipe operations
struct TransportError {
    enum class Category {
        Spawn,      // Process could not be started
        Io,         // Read/write failure on a pipe
        Closed,     // Pipe or process already gone
        Protocol    // Bad configuration or misuse
    };

    Category category{};
    std::string message;
    std::optional<int> os_error{};  // errno, when the failure came from a syscall
};

[[nodiscard]] constexpr std::string_view to_string(TransportError::Category category) noexcept {
    switch (category) {
        case TransportError::Category::Spawn:    return "Spawn";
        case TransportError::Category::Io:       return "Io";
        case TransportError::Category::Closed:   return "Closed";
        case TransportError::Category::Protocol: return "Protocol";
    }
    return "Unknown";
}

/// Result type for transport operations
template <typename T>
using TransportResult = tl::expected<T, TransportError>;

}  // namespace mcpipe
