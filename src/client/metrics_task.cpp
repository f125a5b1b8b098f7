#include "mcpipe/client/metrics_task.hpp"
#include "mcpipe/log/logger.hpp"

namespace mcpipe {

nlohmann::json MetricsSnapshot::to_json() const {
    return {
        {"state", std::string(to_string(state))},
        {"uptimeMs", uptime.count()},
        {"pendingRequests", pending_requests},
        {"requestsSent", requests_sent},
        {"responsesMatched", responses_matched},
        {"errorsReceived", errors_received},
        {"anomalies", anomalies},
        {"frameErrors", frame_errors},
        {"timeouts", timeouts},
        {"heartbeatOk", heartbeat_ok},
        {"heartbeatFailed", heartbeat_failed},
        {"notificationsReceived", notifications_received}
    };
}

MetricsTask::MetricsTask(SnapshotProvider provider, RequestMultiplexer& mux, MetricsConfig config, MetricsSink sink)
    : provider_(std::move(provider))
    , mux_(mux)
    , config_(std::move(config))
    , sink_(std::move(sink))
    , task_("metrics", config_.interval, [this] { publish(); })
{}

bool MetricsTask::publish() {
    if (!provider_) {
        return false;
    }

    bool ok = true;
    const MetricsSnapshot snapshot = provider_();

    if (sink_) {
        try {
            sink_(snapshot);
        } catch (const std::exception& e) {
            ok = false;
            MCPIPE_LOG_WARN(std::string("Metrics sink threw: ") + e.what());
        }
    } else {
        MCPIPE_LOG_DEBUG("Metrics: " + snapshot.to_json().dump());
    }

    if (config_.publish_to_peer) {
        auto sent = mux_.notify(config_.method, snapshot.to_json());
        if (!sent) {
            ok = false;
            MCPIPE_LOG_WARN("Failed to publish metrics: " + sent.error().describe());
        }
    }

    if (ok) {
        published_.fetch_add(1);
    } else {
        failures_.fetch_add(1);
    }
    return ok;
}

}  // namespace mcpipe
