#include "mcpipe/client/heartbeat_task.hpp"
#include "mcpipe/log/logger.hpp"
#include "mcpipe/protocol/mcp_types.hpp"

namespace mcpipe {

HeartbeatTask::HeartbeatTask(RequestMultiplexer& mux, HeartbeatConfig config, HeartbeatSink sink)
    : mux_(mux)
    , config_(config)
    , sink_(std::move(sink))
    , task_("heartbeat", config.interval, [this] { beat(); })
{}

bool HeartbeatTask::beat() {
    const auto started = std::chrono::steady_clock::now();
    auto result = mux_.request(method::Ping, std::nullopt, config_.timeout);
    const auto rtt = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    HeartbeatEvent event;
    event.round_trip = rtt;

    if (result) {
        successes_.fetch_add(1);
        consecutive_failures_ = 0;
        event.ok = true;
        MCPIPE_LOG_TRACE("Heartbeat ok in " + std::to_string(rtt.count()) + "ms");
    } else if (result.error().code == ClientErrorCode::SessionClosed) {
        MCPIPE_LOG_DEBUG("Heartbeat skipped: " + result.error().message);
        event.error = result.error();
        event.consecutive_failures = consecutive_failures_.load();
    } else {
        failures_.fetch_add(1);
        event.consecutive_failures = consecutive_failures_.fetch_add(1) + 1;
        event.error = result.error();
        MCPIPE_LOG_WARN("Heartbeat failed (" + std::to_string(event.consecutive_failures) + " in a row): " +
                        result.error().describe());
    }

    if (sink_) {
        try {
            sink_(event);
        } catch (const std::exception& e) {
            MCPIPE_LOG_WARN(std::string("Heartbeat sink threw: ") + e.what());
        }
    }
    return event.ok;
}

}  // namespace mcpipe
