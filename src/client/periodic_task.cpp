#include "mcpipe/client/periodic_task.hpp"
#include "mcpipe/log/logger.hpp"

namespace mcpipe {

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval, Tick tick)
    : name_(std::move(name))
    , interval_(interval)
    , tick_(std::move(tick))
{}

PeriodicTask::~PeriodicTask() {
    stop();
}

bool PeriodicTask::start() {
    if (interval_.count() <= 0 || !tick_) {
        return false;
    }
    {
        std::lock_guard lock(mutex_);
        if (started_) {
            return false;
        }
        started_ = true;
        stop_requested_ = false;
    }
    running_ = true;
    thread_ = std::thread([this] { run(); });
    MCPIPE_LOG_DEBUG("Started " + name_ + " every " + std::to_string(interval_.count()) + "ms");
    return true;
}

void PeriodicTask::stop() {
    {
        std::lock_guard lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

void PeriodicTask::run() {
    std::unique_lock lock(mutex_);
    while (true) {
        if (cv_.wait_for(lock, interval_, [this] { return stop_requested_; })) {
            break;
        }

        lock.unlock();
        try {
            tick_();
        } catch (const std::exception& e) {
            MCPIPE_LOG_WARN(name_ + " tick threw: " + e.what());
        }
        ticks_.fetch_add(1);
        lock.lock();
    }
    running_ = false;
}

}  // namespace mcpipe
