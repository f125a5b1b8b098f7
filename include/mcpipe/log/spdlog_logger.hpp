#pragma once

#include "mcpipe/log/logger.hpp"

#include <memory>
#include <string>
#include <vector>

#include <spdlog/logger.h>

namespace mcpipe {

// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger - ILogger backed by spdlog
// ─────────────────────────────────────────────────────────────────────────────
// Console output goes to stderr: a process embedding mcpipe may be an MCP
// server itself, with stdout as its protocol channel.

class SpdlogLogger final : public ILogger {
public:
    SpdlogLogger(std::vector<spdlog::sink_ptr> sinks, LogLevel min_level);

    void log(const LogRecord& record) override;

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override;

    void set_pattern(const std::string& pattern);

    void flush();

private:
    std::shared_ptr<spdlog::logger> logger_;
    LogLevel min_level_;
};

/// Colored stderr
[[nodiscard]] std::shared_ptr<SpdlogLogger> make_spdlog_console_logger(LogLevel min_level = LogLevel::Info);

/// Appends to `path`; flushes on every warning and above
[[nodiscard]] std::shared_ptr<SpdlogLogger> make_spdlog_file_logger(const std::string& path,
                                                                    LogLevel min_level = LogLevel::Info);

}  // namespace mcpipe
