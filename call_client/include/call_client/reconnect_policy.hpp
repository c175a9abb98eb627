/**
 * @file reconnect_policy.hpp
 * @brief 断线重连退避策略
 *
 * 第 n 次重试的基础延迟为 min(cap, base * factor^(n-1))，
 * 再乘以 [1 - jitter, 1 + jitter] 内的随机系数并限制在 cap 以内
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <random>

namespace telelink::client {

struct BackoffConfig {
    std::chrono::milliseconds base{1000};
    double factor = 2.0;
    std::chrono::milliseconds cap{30000};
    double jitter = 0.2;
    int max_attempts = 10;
};

/**
 * @brief 取消令牌（可复制，共享同一状态）
 */
class CancellationToken {
public:
    CancellationToken() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { cancelled_->store(true); }
    bool cancelled() const { return cancelled_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> cancelled_;
};

class ReconnectPolicy {
public:
    explicit ReconnectPolicy(BackoffConfig config = {},
                             uint32_t seed = std::random_device{}());

    /**
     * @brief 下一次重试的延迟
     * @return 已取消或次数用尽时返回 nullopt
     */
    std::optional<std::chrono::milliseconds> next_delay();

    /**
     * @brief 不含抖动的延迟（attempt 从 1 开始）
     */
    std::chrono::milliseconds base_delay(int attempt) const;

    /**
     * @brief 连接成功后重置计数（取消状态保持不变）
     */
    void reset() { attempts_ = 0; }

    void cancel() { token_.cancel(); }
    bool cancelled() const { return token_.cancelled(); }

    CancellationToken token() const { return token_; }

    int attempts() const { return attempts_; }
    bool exhausted() const { return attempts_ >= config_.max_attempts; }

    const BackoffConfig& config() const { return config_; }

private:
    BackoffConfig config_;
    std::mt19937 rng_;
    int attempts_ = 0;
    CancellationToken token_;
};

} // namespace telelink::client
