/**
 * @file reconnect_policy.cpp
 * @brief 断线重连退避策略实现
 */

#include "call_client/reconnect_policy.hpp"

#include <algorithm>
#include <cmath>

namespace telelink::client {

ReconnectPolicy::ReconnectPolicy(BackoffConfig config, uint32_t seed)
    : config_(config)
    , rng_(seed)
{
}

std::chrono::milliseconds ReconnectPolicy::base_delay(int attempt) const {
    if (attempt < 1) {
        attempt = 1;
    }
    double delay = static_cast<double>(config_.base.count()) *
                   std::pow(config_.factor, attempt - 1);
    double cap = static_cast<double>(config_.cap.count());
    return std::chrono::milliseconds(static_cast<int64_t>(std::min(delay, cap)));
}

std::optional<std::chrono::milliseconds> ReconnectPolicy::next_delay() {
    if (cancelled() || exhausted()) {
        return std::nullopt;
    }

    ++attempts_;
    double delay = static_cast<double>(base_delay(attempts_).count());

    if (config_.jitter > 0.0) {
        std::uniform_real_distribution<double> dist(1.0 - config_.jitter, 1.0 + config_.jitter);
        delay *= dist(rng_);
    }

    delay = std::min(delay, static_cast<double>(config_.cap.count()));
    return std::chrono::milliseconds(static_cast<int64_t>(std::max(0.0, delay)));
}

} // namespace telelink::client
