/**
 * @file signaling_server.cpp
 * @brief 信令 WebSocket 服务器实现
 */

#include "session_server/signaling_server.hpp"
#include "session_server/config.hpp"
#include "session_server/signaling_relay.hpp"
#include "session_core/signal_codec.hpp"
#include "session_core/logger.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>

#include <chrono>
#include <iomanip>
#include <random>
#include <sstream>

namespace telelink::server {

std::string generate_connection_id() {
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 255);

    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (int i = 0; i < 8; ++i) {
        ss << std::setw(2) << dis(gen);
    }

    return ss.str();
}

// ==================== SignalingSession ====================

SignalingSession::SignalingSession(tcp::socket&& socket, SignalingServer& server)
    : ws_(std::move(socket))
    , server_(server)
    , connection_id_(generate_connection_id())
    , auth_timer_(ws_.get_executor())
{
    ws_.binary(false);  // JSON 文本模式
    ws_.read_message_max(server_.max_message_bytes());

    // 空闲连接依靠 ping/pong 探测
    ws_.set_option(websocket::stream_base::timeout{
        std::chrono::seconds(30),
        std::chrono::seconds(60),
        true
    });
}

SignalingSession::~SignalingSession() {
    LOG_DEBUG("[Signaling] Connection destroyed: " << connection_id_);
}

void SignalingSession::start() {
    server_.add_session(connection_id_, shared_from_this());
    do_accept();
}

void SignalingSession::close() {
    net::post(ws_.get_executor(), [self = shared_from_this()]() {
        beast::error_code ec;
        self->auth_timer_.cancel(ec);
        self->ws_.async_close(websocket::close_code::normal,
            [self](beast::error_code close_ec) {
                if (close_ec) {
                    LOG_DEBUG("[Signaling] Close " << self->connection_id_ << ": " << close_ec.message());
                }
            });
    });
}

void SignalingSession::send(const std::string& message) {
    bool should_start_write = false;
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        write_queue_.push(message);
        if (!writing_) {
            writing_ = true;
            should_start_write = true;
        }
    }

    if (should_start_write) {
        net::post(ws_.get_executor(), [self = shared_from_this()]() {
            self->do_write();
        });
    }
}

void SignalingSession::send_error(const std::string& session_id,
                                  core::ErrorCode code,
                                  const std::string& message) {
    send(core::encode_message(core::make_error_message(session_id, code, message)));
}

void SignalingSession::do_accept() {
    ws_.async_accept(
        beast::bind_front_handler(&SignalingSession::on_accept, shared_from_this())
    );
}

void SignalingSession::on_accept(beast::error_code ec) {
    if (ec) {
        LOG_ERROR("[Signaling] WebSocket accept error: " << ec.message());
        release();
        return;
    }

    LOG_INFO("[Signaling] Connection established: " << connection_id_);

    if (server_.require_auth() && server_.auth_timeout_sec() > 0) {
        auth_timer_.expires_after(std::chrono::seconds(server_.auth_timeout_sec()));
        auth_timer_.async_wait([self = shared_from_this()](const beast::error_code& timer_ec) {
            if (timer_ec) {
                return;
            }
            if (!self->authenticated_) {
                LOG_WARN("[Signaling] Authentication timed out: " << self->connection_id_);
                self->send_error("", core::ErrorCode::Unauthorized, "authentication timed out");
                self->close();
            }
        });
    }

    do_read();
}

void SignalingSession::do_read() {
    ws_.async_read(
        read_buffer_,
        beast::bind_front_handler(&SignalingSession::on_read, shared_from_this())
    );
}

void SignalingSession::on_read(beast::error_code ec, std::size_t bytes) {
    if (ec == websocket::error::closed) {
        LOG_INFO("[Signaling] Connection closed: " << connection_id_);
        release();
        return;
    }

    if (ec) {
        LOG_WARN("[Signaling] Read error on " << connection_id_ << ": " << ec.message());
        release();
        return;
    }

    std::string text = beast::buffers_to_string(read_buffer_.data());
    read_buffer_.consume(bytes);

    handle_message(text);

    do_read();
}

void SignalingSession::do_write() {
    std::string* message = nullptr;
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (write_queue_.empty()) {
            writing_ = false;
            return;
        }
        message = &write_queue_.front();
    }

    ws_.async_write(
        net::buffer(*message),
        beast::bind_front_handler(&SignalingSession::on_write, shared_from_this())
    );
}

void SignalingSession::on_write(beast::error_code ec, std::size_t /*bytes*/) {
    if (ec) {
        LOG_WARN("[Signaling] Write error on " << connection_id_ << ": " << ec.message());
        std::lock_guard<std::mutex> lock(write_mutex_);
        std::queue<std::string>().swap(write_queue_);
        writing_ = false;
        return;
    }

    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        write_queue_.pop();
    }

    do_write();
}

void SignalingSession::handle_message(const std::string& text) {
    core::SignalMessage msg;
    try {
        msg = core::decode_message(text);
    } catch (const core::MalformedMessage& e) {
        LOG_WARN("[Signaling] Malformed message on " << connection_id_ << ": " << e.what());
        send_error("", core::ErrorCode::MalformedMessage, e.what());
        return;
    }

    if (msg.type == core::SignalType::Auth) {
        handle_auth(msg);
        return;
    }

    if (server_.require_auth()) {
        if (!authenticated_) {
            send_error(msg.session_id, core::ErrorCode::Unauthorized, "authentication required");
            return;
        }
        if (msg.sender_id != authenticated_id_) {
            send_error(msg.session_id, core::ErrorCode::Unauthorized,
                       "senderId does not match authenticated participant");
            return;
        }
    }

    try {
        auto result = server_.relay().handle(msg, shared_from_this());
        if (result.ok() && msg.type == core::SignalType::StartSession) {
            bindings_.emplace(result.session_id, msg.sender_id);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("[Signaling] Error handling " << core::to_string(msg.type)
                  << " on " << connection_id_ << ": " << e.what());
        send_error(msg.session_id, core::ErrorCode::InvalidState, "internal error");
    }
}

void SignalingSession::handle_auth(const core::SignalMessage& msg) {
    auto principal = server_.verify_token(msg.auth().token);
    if (!principal) {
        LOG_WARN("[Signaling] Authentication failed on " << connection_id_);
        send_error("", core::ErrorCode::Unauthorized, "invalid or expired token");
        return;
    }
    if (principal->participant_id != msg.sender_id) {
        send_error("", core::ErrorCode::Unauthorized, "token subject does not match senderId");
        return;
    }

    mark_authenticated(*principal);
    LOG_INFO("[Signaling] Connection " << connection_id_ << " authenticated as " << authenticated_id_);
}

void SignalingSession::mark_authenticated(const Principal& principal) {
    authenticated_ = true;
    authenticated_id_ = principal.participant_id;
    beast::error_code ec;
    auth_timer_.cancel(ec);
}

void SignalingSession::release() {
    if (released_) {
        return;
    }
    released_ = true;

    beast::error_code ec;
    auth_timer_.cancel(ec);

    for (const auto& [session_id, participant_id] : bindings_) {
        server_.relay().on_disconnect(session_id, participant_id, connection_id_);
    }
    bindings_.clear();

    server_.remove_session(connection_id_);
}

// ==================== SignalingServer ====================

SignalingServer::SignalingServer(net::io_context& io_context,
                                 const Config& config,
                                 SignalingRelay& relay)
    : io_context_(io_context)
    , acceptor_(io_context)
    , config_(config)
    , relay_(relay)
{
    require_auth_ = config_.auth.require_auth;
    if (!config_.auth.jwt_secret.empty()) {
        jwt_verifier_ = std::make_unique<JwtVerifier>(config_.auth.jwt_secret);
    } else if (require_auth_) {
        LOG_WARN("[Signaling] Authentication required but no JWT secret configured");
    }
}

SignalingServer::~SignalingServer() {
    stop();
}

int SignalingServer::auth_timeout_sec() const {
    return config_.auth.auth_timeout_sec;
}

size_t SignalingServer::max_message_bytes() const {
    return config_.server.max_message_bytes;
}

bool SignalingServer::start() {
    beast::error_code ec;

    auto address = net::ip::make_address(config_.server.host, ec);
    if (ec) {
        LOG_ERROR("[Signaling] Invalid address: " << ec.message());
        return false;
    }

    tcp::endpoint endpoint{address, config_.server.signaling_port};

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
        LOG_ERROR("[Signaling] Failed to open acceptor: " << ec.message());
        return false;
    }

    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) {
        LOG_ERROR("[Signaling] Failed to set SO_REUSEADDR: " << ec.message());
        return false;
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
        LOG_ERROR("[Signaling] Failed to bind: " << ec.message());
        return false;
    }

    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        LOG_ERROR("[Signaling] Failed to listen: " << ec.message());
        return false;
    }

    running_ = true;
    LOG_INFO("[Signaling] Listening on " << config_.server.host << ":"
             << config_.server.signaling_port
             << (require_auth_ ? " (authentication required)" : ""));

    do_accept();
    return true;
}

void SignalingServer::stop() {
    if (!running_) {
        return;
    }

    running_ = false;

    beast::error_code ec;
    acceptor_.close(ec);

    // 持锁调用 close 会与 remove_session 死锁
    std::vector<std::shared_ptr<SignalingSession>> sessions_copy;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_copy.reserve(sessions_.size());
        for (auto& [id, session] : sessions_) {
            sessions_copy.push_back(session);
        }
    }
    for (auto& session : sessions_copy) {
        session->close();
    }
}

std::optional<Principal> SignalingServer::verify_token(const std::string& token) const {
    if (!jwt_verifier_ || token.empty()) {
        return std::nullopt;
    }
    return jwt_verifier_->verify(token);
}

void SignalingServer::add_session(const std::string& connection_id,
                                  std::shared_ptr<SignalingSession> session) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_[connection_id] = std::move(session);
}

void SignalingServer::remove_session(const std::string& connection_id) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_.erase(connection_id);
}

size_t SignalingServer::connection_count() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}

void SignalingServer::do_accept() {
    acceptor_.async_accept(
        net::make_strand(io_context_),
        beast::bind_front_handler(&SignalingServer::on_accept, shared_from_this())
    );
}

void SignalingServer::on_accept(beast::error_code ec, tcp::socket socket) {
    if (ec) {
        if (running_) {
            LOG_ERROR("[Signaling] Accept error: " << ec.message());
        }
    } else if (connection_count() >= config_.server.max_connections) {
        LOG_WARN("[Signaling] Connection limit reached, rejecting");
        beast::error_code close_ec;
        socket.close(close_ec);
    } else {
        auto session = std::make_shared<SignalingSession>(std::move(socket), *this);
        session->start();
    }

    if (running_) {
        do_accept();
    }
}

} // namespace telelink::server
