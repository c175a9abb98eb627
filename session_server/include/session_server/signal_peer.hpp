/**
 * @file signal_peer.hpp
 * @brief 信令连接抽象
 */

#pragma once

#include <string>

namespace telelink::server {

/**
 * @brief 一条可以接收信令的连接（WebSocket 会话实现该接口）
 *
 * send() 必须是非阻塞的：只负责入队，由连接自己的执行器写出
 */
class SignalPeer {
public:
    virtual ~SignalPeer() = default;

    virtual void send(const std::string& message) = 0;

    virtual const std::string& connection_id() const = 0;
};

} // namespace telelink::server
