#pragma once

#include <string_view>

namespace mcpipe {

/// Uninitialized -> Initializing -> Ready -> Closing -> Closed.
/// A fatal transport event moves any state other than Closed straight to Closed.
enum class SessionState {
    Uninitialized,
    Initializing,
    Ready,
    Closing,
    Closed
};

[[nodiscard]] constexpr std::string_view to_string(SessionState state) noexcept {
    switch (state) {
        case SessionState::Uninitialized: return "Uninitialized";
        case SessionState::Initializing:  return "Initializing";
        case SessionState::Ready:         return "Ready";
        case SessionState::Closing:       return "Closing";
        case SessionState::Closed:        return "Closed";
    }
    return "Unknown";
}

}  // namespace mcpipe
