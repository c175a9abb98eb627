/**
 * @file telemetry_server.hpp
 * @brief 遥测 WebSocket 服务器
 *
 * 二进制 protobuf 帧（TelemetryMessage）：
 * 客户端先发 Hello 绑定会话，随后发送 PoseFrame；
 * 每帧回复 SubmitAck，分析结果推送给绑定同一会话的所有连接
 */

#pragma once

#include "session_server/auth.hpp"
#include "session_core/types.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <unordered_map>

namespace telelink::telemetry {
class TelemetryMessage;
class Hello;
class PoseFrame;
}

namespace telelink::server {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

class Config;
class SessionRegistry;
class TelemetryPipeline;
class TelemetryServer;

/**
 * @brief 遥测连接状态
 */
enum class TelemetryConnState {
    CONNECTING,     // 等待 Hello
    BOUND,          // 已绑定会话
    CLOSING
};

/**
 * @brief 遥测连接
 */
class TelemetrySession : public std::enable_shared_from_this<TelemetrySession> {
public:
    TelemetrySession(tcp::socket&& socket, TelemetryServer& server);

    ~TelemetrySession();

    void start();
    void close();

    void send(const telemetry::TelemetryMessage& msg);

    const std::string& connection_id() const { return connection_id_; }

private:
    void do_accept();
    void on_accept(beast::error_code ec);
    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes);
    void do_write();
    void on_write(beast::error_code ec, std::size_t bytes);

    void handle_message(const std::string& data);
    void handle_hello(const telemetry::Hello& hello);
    void handle_frame(const telemetry::PoseFrame& frame);

    void send_error(core::ErrorCode code, const std::string& message);

    void release();

private:
    websocket::stream<beast::tcp_stream> ws_;
    TelemetryServer& server_;

    std::string connection_id_;
    net::steady_timer hello_timer_;
    TelemetryConnState state_ = TelemetryConnState::CONNECTING;

    std::string session_id_;
    std::string participant_id_;
    uint64_t subscription_ = 0;

    beast::flat_buffer read_buffer_;
    std::queue<std::shared_ptr<const std::string>> write_queue_;
    std::mutex write_mutex_;
    bool writing_ = false;
    bool released_ = false;
};

/**
 * @brief 遥测服务器
 */
class TelemetryServer : public std::enable_shared_from_this<TelemetryServer> {
public:
    TelemetryServer(net::io_context& io_context,
                    const Config& config,
                    SessionRegistry& registry,
                    TelemetryPipeline& pipeline);
    ~TelemetryServer();

    bool start();
    void stop();

    std::optional<Principal> verify_token(const std::string& token) const;

    bool require_auth() const { return require_auth_; }
    int auth_timeout_sec() const;
    size_t max_message_bytes() const;

    SessionRegistry& registry() { return registry_; }
    TelemetryPipeline& pipeline() { return pipeline_; }

    void add_session(const std::string& connection_id, std::shared_ptr<TelemetrySession> session);
    void remove_session(const std::string& connection_id);

    size_t connection_count() const;

private:
    void do_accept();
    void on_accept(beast::error_code ec, tcp::socket socket);

private:
    net::io_context& io_context_;
    tcp::acceptor acceptor_;
    const Config& config_;
    SessionRegistry& registry_;
    TelemetryPipeline& pipeline_;

    std::unordered_map<std::string, std::shared_ptr<TelemetrySession>> sessions_;
    mutable std::mutex sessions_mutex_;

    std::unique_ptr<JwtVerifier> jwt_verifier_;
    bool require_auth_ = false;
    std::atomic<bool> running_{false};
};

} // namespace telelink::server
