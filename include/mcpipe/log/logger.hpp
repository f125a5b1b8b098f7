#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

namespace mcpipe {

// ─────────────────────────────────────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────────────────────────────────────

enum class LogLevel : std::uint8_t {
    Trace = 0,  // Every frame on the wire
    Debug = 1,  // Request/response bookkeeping, peer requests
    Info  = 2,  // Spawn, handshake, state changes
    Warn  = 3,  // Anomalies, skipped frames, missed heartbeats
    Error = 4,  // Spawn or handshake failed, listener died
    Off   = 5
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Off:   return "off";
    }
    return "unknown";
}

/// Case-insensitive; nullopt for anything that is not a level name
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name);

// One call site's worth of log output. Time and thread are stamped by the
// backend.
struct LogRecord {
    LogLevel level;
    std::string message;
    std::source_location location;
};

// ─────────────────────────────────────────────────────────────────────────────
// ILogger
// ─────────────────────────────────────────────────────────────────────────────
// Called concurrently from the listener, stderr reader, heartbeat and metrics
// threads and from foreground callers.

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(const LogRecord& record) = 0;

    [[nodiscard]] virtual bool should_log(LogLevel level) const noexcept = 0;
};

class NullLogger final : public ILogger {
public:
    void log(const LogRecord&) override {}
    [[nodiscard]] bool should_log(LogLevel) const noexcept override { return false; }
};

/// Current process-wide logger. Holding the returned pointer keeps that
/// logger alive across a concurrent set_logger().
[[nodiscard]] std::shared_ptr<ILogger> get_logger() noexcept;

/// Replace the process-wide logger; nullptr installs a NullLogger
void set_logger(std::shared_ptr<ILogger> logger) noexcept;

namespace detail {

void log_if_enabled(LogLevel level, std::string_view message, std::source_location location);

}  // namespace detail

}  // namespace mcpipe

// The message expression is evaluated only when the level is enabled.
#define MCPIPE_LOG(level, msg)                                                              \
    do {                                                                                    \
        if (::mcpipe::get_logger()->should_log(level)) {                                    \
            ::mcpipe::detail::log_if_enabled(level, (msg), std::source_location::current()); \
        }                                                                                   \
    } while (false)

#define MCPIPE_LOG_TRACE(msg) MCPIPE_LOG(::mcpipe::LogLevel::Trace, msg)
#define MCPIPE_LOG_DEBUG(msg) MCPIPE_LOG(::mcpipe::LogLevel::Debug, msg)
#define MCPIPE_LOG_INFO(msg)  MCPIPE_LOG(::mcpipe::LogLevel::Info, msg)
#define MCPIPE_LOG_WARN(msg)  MCPIPE_LOG(::mcpipe::LogLevel::Warn, msg)
#define MCPIPE_LOG_ERROR(msg) MCPIPE_LOG(::mcpipe::LogLevel::Error, msg)
