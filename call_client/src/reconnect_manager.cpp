/**
 * @file reconnect_manager.cpp
 * @brief 断线重连管理器实现
 */

#include "call_client/reconnect_manager.hpp"
#include "session_core/logger.hpp"

namespace telelink::client {

ReconnectManager::ReconnectManager(net::any_io_executor executor, ReconnectPolicy policy)
    : timer_(executor)
    , policy_(std::move(policy))
{
}

void ReconnectManager::on_socket_closed() {
    if (policy_.cancelled() || gave_up_) {
        return;
    }
    if (pending_) {
        return;
    }

    auto delay = policy_.next_delay();
    if (!delay) {
        gave_up_ = true;
        LOG_ERROR("[Reconnect] Giving up after " << policy_.attempts() << " attempts");
        if (on_give_up_) {
            on_give_up_();
        }
        return;
    }

    int attempt = policy_.attempts();
    LOG_INFO("[Reconnect] Attempt " << attempt << "/" << policy_.config().max_attempts
             << " in " << delay->count() << "ms");

    pending_ = true;
    timer_.expires_after(*delay);
    timer_.async_wait([this, attempt](const boost::system::error_code& ec) {
        on_timer(ec, attempt);
    });
}

void ReconnectManager::on_timer(const boost::system::error_code& ec, int attempt) {
    if (ec == net::error::operation_aborted) {
        return;
    }
    pending_ = false;
    if (ec) {
        LOG_WARN("[Reconnect] Timer error: " << ec.message());
        return;
    }
    if (policy_.cancelled()) {
        return;
    }
    if (on_connect_) {
        on_connect_(attempt);
    }
}

void ReconnectManager::on_connected() {
    if (pending_) {
        timer_.cancel();
        pending_ = false;
    }
}

void ReconnectManager::on_session_state(core::SessionState state) {
    switch (state) {
        case core::SessionState::Connected:
            policy_.reset();
            gave_up_ = false;
            break;
        case core::SessionState::Ended:
            cancel();
            break;
        default:
            break;
    }
}

void ReconnectManager::cancel() {
    policy_.cancel();
    if (pending_) {
        timer_.cancel();
        pending_ = false;
    }
}

} // namespace telelink::client
