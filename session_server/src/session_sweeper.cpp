/**
 * @file session_sweeper.cpp
 * @brief 会话清扫线程实现
 */

#include "session_server/session_sweeper.hpp"
#include "session_server/signaling_relay.hpp"
#include "session_core/logger.hpp"

namespace telelink::server {

SessionSweeper::SessionSweeper(SignalingRelay& relay, std::chrono::milliseconds interval)
    : relay_(relay)
    , interval_(interval)
{
}

SessionSweeper::~SessionSweeper() {
    stop();
}

void SessionSweeper::start() {
    if (running_) {
        return;
    }

    running_ = true;
    thread_ = std::thread(&SessionSweeper::sweep_thread, this);

    LOG_INFO("[Sweeper] Started (interval: " << interval_.count() << "ms, grace: "
             << relay_.options().reconnect_grace.count() << "ms)");
}

void SessionSweeper::stop() {
    if (!running_) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        running_ = false;
    }
    wake_cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }

    LOG_INFO("[Sweeper] Stopped");
}

void SessionSweeper::sweep_thread() {
    while (running_) {
        {
            std::unique_lock<std::mutex> lock(wake_mutex_);
            wake_cv_.wait_for(lock, interval_, [this] { return !running_; });
        }

        if (!running_) {
            break;
        }

        try {
            relay_.sweep(std::chrono::steady_clock::now());
        } catch (const std::exception& e) {
            LOG_ERROR("[Sweeper] Sweep failed: " << e.what());
        }
    }
}

} // namespace telelink::server
