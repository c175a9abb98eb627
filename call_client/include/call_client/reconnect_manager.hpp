/**
 * @file reconnect_manager.hpp
 * @brief 断线重连管理器
 *
 * 由 ReconnectPolicy 计算延迟，单个 steady_timer 驱动重试。
 * 所有方法须在同一个 io_context 线程中调用
 */

#pragma once

#include "call_client/reconnect_policy.hpp"
#include "session_core/types.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>

#include <functional>

namespace telelink::client {

namespace net = boost::asio;

class ReconnectManager {
public:
    using ConnectHandler = std::function<void(int attempt)>;
    using GiveUpHandler = std::function<void()>;

    ReconnectManager(net::any_io_executor executor, ReconnectPolicy policy);

    void set_connect_handler(ConnectHandler handler) { on_connect_ = std::move(handler); }
    void set_give_up_handler(GiveUpHandler handler) { on_give_up_ = std::move(handler); }

    /**
     * @brief 连接意外断开，安排下一次重试
     */
    void on_socket_closed();

    /**
     * @brief 信令连接已建立（挂起的重试不再需要）
     */
    void on_connected();

    /**
     * @brief 服务端会话状态通知
     *
     * connected 重置重试计数；ended 取消全部重试
     */
    void on_session_state(core::SessionState state);

    /**
     * @brief 取消所有重试（主动结束会话）
     */
    void cancel();

    bool pending() const { return pending_; }
    bool cancelled() const { return policy_.cancelled(); }
    int attempts() const { return policy_.attempts(); }

private:
    void on_timer(const boost::system::error_code& ec, int attempt);

    net::steady_timer timer_;
    ReconnectPolicy policy_;
    ConnectHandler on_connect_;
    GiveUpHandler on_give_up_;
    bool pending_ = false;
    bool gave_up_ = false;
};

} // namespace telelink::client
