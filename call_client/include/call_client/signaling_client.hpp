/**
 * @file signaling_client.hpp
 * @brief 信令 WebSocket 客户端
 *
 * 每次 connect() 都新建 WebSocket 流；旧连接残留的回调按连接代号丢弃。
 * 单线程 io_context 中使用
 */

#pragma once

#include "call_client/config.hpp"
#include "session_core/types.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>

namespace telelink::client {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

class SignalingClient : public std::enable_shared_from_this<SignalingClient> {
public:
    using MessageHandler = std::function<void(const core::SignalMessage&)>;
    using OpenHandler = std::function<void()>;
    /// expected 为 true 表示由 close() 主动关闭
    using CloseHandler = std::function<void(bool expected)>;

    SignalingClient(net::io_context& io, SignalingConfig config);

    void set_message_handler(MessageHandler handler) { on_message_ = std::move(handler); }
    void set_open_handler(OpenHandler handler) { on_open_ = std::move(handler); }
    void set_close_handler(CloseHandler handler) { on_close_ = std::move(handler); }

    /**
     * @brief 发起连接（已有连接会被丢弃）
     */
    void connect();

    /**
     * @brief 发送信令消息，未连接时丢弃并返回 false
     */
    bool send(const core::SignalMessage& msg);

    /**
     * @brief 主动关闭，不触发重连
     */
    void close();

    bool is_open() const { return open_; }

private:
    void on_resolve(uint64_t gen, beast::error_code ec, tcp::resolver::results_type results);
    void on_connect(uint64_t gen, beast::error_code ec, tcp::resolver::results_type::endpoint_type ep);
    void on_handshake(uint64_t gen, beast::error_code ec);
    void do_read(uint64_t gen);
    void on_read(uint64_t gen, beast::error_code ec, std::size_t bytes);
    void do_write(uint64_t gen);
    void on_write(uint64_t gen, beast::error_code ec, std::size_t bytes);
    void fail(uint64_t gen, beast::error_code ec, const char* what);

    net::io_context& io_;
    SignalingConfig config_;
    tcp::resolver resolver_;
    std::unique_ptr<websocket::stream<beast::tcp_stream>> ws_;
    beast::flat_buffer buffer_;
    std::deque<std::string> write_queue_;

    uint64_t generation_ = 0;
    bool open_ = false;
    bool closing_ = false;
    bool writing_ = false;

    MessageHandler on_message_;
    OpenHandler on_open_;
    CloseHandler on_close_;
};

} // namespace telelink::client
