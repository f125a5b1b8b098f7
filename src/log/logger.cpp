#include "mcpipe/log/logger.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>
#include <utility>

namespace mcpipe {

namespace {

std::mutex& logger_mutex() {
    static std::mutex mutex;
    return mutex;
}

std::shared_ptr<ILogger>& logger_slot() {
    static std::shared_ptr<ILogger> slot = std::make_shared<NullLogger>();
    return slot;
}

}  // namespace

std::optional<LogLevel> parse_log_level(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (auto level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info,
                       LogLevel::Warn, LogLevel::Error, LogLevel::Off}) {
        if (lower == to_string(level)) {
            return level;
        }
    }
    if (lower == "warning") {
        return LogLevel::Warn;
    }
    return std::nullopt;
}

std::shared_ptr<ILogger> get_logger() noexcept {
    std::lock_guard lock(logger_mutex());
    return logger_slot();
}

void set_logger(std::shared_ptr<ILogger> logger) noexcept {
    if (logger == nullptr) {
        logger = std::make_shared<NullLogger>();
    }
    std::shared_ptr<ILogger> previous;
    {
        std::lock_guard lock(logger_mutex());
        previous = std::exchange(logger_slot(), std::move(logger));
    }
    // previous is released outside the lock
}

namespace detail {

void log_if_enabled(LogLevel level, std::string_view message, std::source_location location) {
    auto logger = get_logger();
    if (logger->should_log(level)) {
        logger->log(LogRecord{level, std::string(message), location});
    }
}

}  // namespace detail

}  // namespace mcpipe
