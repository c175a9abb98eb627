/**
 * @file session_sweeper.hpp
 * @brief 会话清扫线程
 *
 * 定期检查断线宽限期并回收已结束的会话
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace telelink::server {

class SignalingRelay;

class SessionSweeper {
public:
    /**
     * @param relay 信令中继
     * @param interval 检查周期
     */
    SessionSweeper(SignalingRelay& relay, std::chrono::milliseconds interval);

    ~SessionSweeper();

    void start();

    void stop();

    std::chrono::milliseconds interval() const { return interval_; }

private:
    void sweep_thread();

private:
    SignalingRelay& relay_;
    std::chrono::milliseconds interval_;

    std::atomic<bool> running_{false};
    std::thread thread_;

    // stop() 时立即唤醒
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
};

} // namespace telelink::server
