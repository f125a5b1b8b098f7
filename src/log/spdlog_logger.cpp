#include "mcpipe/log/spdlog_logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <cstdint>

namespace mcpipe {

namespace {

// Time, level, thread, call site. The thread id tells the listener, stderr
// reader and heartbeat apart from the caller.
constexpr const char* kPattern = "%H:%M:%S.%e %^%-5l%$ [%t] %s:%# %v";

spdlog::level::level_enum to_spdlog(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return spdlog::level::trace;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info:  return spdlog::level::info;
        case LogLevel::Warn:  return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Off:   return spdlog::level::off;
    }
    return spdlog::level::info;
}

// Loggers are never registered, but distinct names keep file output readable
// when several sessions log at once
std::string next_logger_name() {
    static std::atomic<std::uint32_t> counter{0};
    return "mcpipe-" + std::to_string(counter.fetch_add(1));
}

}  // namespace

SpdlogLogger::SpdlogLogger(std::vector<spdlog::sink_ptr> sinks, LogLevel min_level)
    : logger_(std::make_shared<spdlog::logger>(next_logger_name(), sinks.begin(), sinks.end()))
    , min_level_(min_level)
{
    logger_->set_level(to_spdlog(min_level));
    logger_->set_pattern(kPattern);
    logger_->flush_on(spdlog::level::warn);
}

void SpdlogLogger::log(const LogRecord& record) {
    if (!should_log(record.level)) {
        return;
    }
    const spdlog::source_loc where{
        record.location.file_name(),
        static_cast<int>(record.location.line()),
        record.location.function_name()
    };
    logger_->log(where, to_spdlog(record.level), "{}", record.message);
}

bool SpdlogLogger::should_log(LogLevel level) const noexcept {
    return min_level_ != LogLevel::Off && level >= min_level_;
}

void SpdlogLogger::set_pattern(const std::string& pattern) {
    logger_->set_pattern(pattern);
}

void SpdlogLogger::flush() {
    logger_->flush();
}

std::shared_ptr<SpdlogLogger> make_spdlog_console_logger(LogLevel min_level) {
    return std::make_shared<SpdlogLogger>(
        std::vector<spdlog::sink_ptr>{std::make_shared<spdlog::sinks::stderr_color_sink_mt>()},
        min_level);
}

std::shared_ptr<SpdlogLogger> make_spdlog_file_logger(const std::string& path, LogLevel min_level) {
    return std::make_shared<SpdlogLogger>(
        std::vector<spdlog::sink_ptr>{std::make_shared<spdlog::sinks::basic_file_sink_mt>(path)},
        min_level);
}

}  // namespace mcpipe
