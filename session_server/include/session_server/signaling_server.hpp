/**
 * @file signaling_server.hpp
 * @brief 信令 WebSocket 服务器
 *
 * JSON 文本帧，每条连接在自己的 strand 上读写，
 * 解码后的消息交给 SignalingRelay 处理
 */

#pragma once

#include "session_server/auth.hpp"
#include "session_server/signal_peer.hpp"
#include "session_core/types.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>

namespace telelink::server {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

// 前向声明
class Config;
class SignalingRelay;
class SignalingServer;

/**
 * @brief 信令连接
 */
class SignalingSession : public SignalPeer,
                         public std::enable_shared_from_this<SignalingSession> {
public:
    SignalingSession(tcp::socket&& socket, SignalingServer& server);

    ~SignalingSession() override;

    void start();
    void close();

    void send(const std::string& message) override;

    const std::string& connection_id() const override { return connection_id_; }

    void send_error(const std::string& session_id, core::ErrorCode code, const std::string& message);

    bool is_authenticated() const { return authenticated_; }

private:
    void do_accept();
    void on_accept(beast::error_code ec);
    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes);
    void do_write();
    void on_write(beast::error_code ec, std::size_t bytes);

    void handle_message(const std::string& text);
    void handle_auth(const core::SignalMessage& msg);
    void mark_authenticated(const Principal& principal);

    /**
     * @brief 连接结束：通知中继解除所有绑定
     */
    void release();

private:
    websocket::stream<beast::tcp_stream> ws_;
    SignalingServer& server_;

    std::string connection_id_;
    net::steady_timer auth_timer_;

    beast::flat_buffer read_buffer_;
    std::queue<std::string> write_queue_;
    std::mutex write_mutex_;
    bool writing_ = false;

    bool authenticated_ = false;
    std::string authenticated_id_;

    // (sessionId, participantId)，只在读回调中访问
    std::set<std::pair<std::string, std::string>> bindings_;
    bool released_ = false;
};

/**
 * @brief 信令服务器
 */
class SignalingServer : public std::enable_shared_from_this<SignalingServer> {
public:
    SignalingServer(net::io_context& io_context, const Config& config, SignalingRelay& relay);
    ~SignalingServer();

    /**
     * @brief 开始监听
     * @return 绑定或监听失败返回 false
     */
    bool start();
    void stop();

    /**
     * @brief 验证 JWT Token（未配置密钥时总是失败）
     */
    std::optional<Principal> verify_token(const std::string& token) const;

    bool require_auth() const { return require_auth_; }
    int auth_timeout_sec() const;
    size_t max_message_bytes() const;

    SignalingRelay& relay() { return relay_; }

    void add_session(const std::string& connection_id, std::shared_ptr<SignalingSession> session);
    void remove_session(const std::string& connection_id);

    size_t connection_count() const;

private:
    void do_accept();
    void on_accept(beast::error_code ec, tcp::socket socket);

private:
    net::io_context& io_context_;
    tcp::acceptor acceptor_;
    const Config& config_;
    SignalingRelay& relay_;

    std::unordered_map<std::string, std::shared_ptr<SignalingSession>> sessions_;
    mutable std::mutex sessions_mutex_;

    std::unique_ptr<JwtVerifier> jwt_verifier_;

    bool require_auth_ = false;
    std::atomic<bool> running_{false};
};

/**
 * @brief 生成连接 ID
 */
std::string generate_connection_id();

} // namespace telelink::server
