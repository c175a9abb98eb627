/**
 * @file telemetry_server.cpp
 * @brief 遥测 WebSocket 服务器实现
 */

#include "session_server/telemetry_server.hpp"
#include "session_server/config.hpp"
#include "session_server/session_registry.hpp"
#include "session_server/signaling_server.hpp"
#include "session_server/telemetry_codec.hpp"
#include "session_server/telemetry_pipeline.hpp"
#include "session_core/logger.hpp"

#include "telemetry.pb.h"

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>

#include <chrono>

namespace telelink::server {

// ==================== TelemetrySession ====================

TelemetrySession::TelemetrySession(tcp::socket&& socket, TelemetryServer& server)
    : ws_(std::move(socket))
    , server_(server)
    , connection_id_(generate_connection_id())
    , hello_timer_(ws_.get_executor())
{
    ws_.binary(true);
    ws_.read_message_max(server_.max_message_bytes());

    ws_.set_option(websocket::stream_base::timeout{
        std::chrono::seconds(30),
        std::chrono::seconds(60),
        true
    });
}

TelemetrySession::~TelemetrySession() {
    LOG_DEBUG("[Telemetry] Connection destroyed: " << connection_id_);
}

void TelemetrySession::start() {
    server_.add_session(connection_id_, shared_from_this());
    do_accept();
}

void TelemetrySession::close() {
    net::post(ws_.get_executor(), [self = shared_from_this()]() {
        if (self->state_ == TelemetryConnState::CLOSING) {
            return;
        }
        self->state_ = TelemetryConnState::CLOSING;

        beast::error_code ec;
        self->hello_timer_.cancel(ec);
        self->ws_.async_close(websocket::close_code::normal,
            [self](beast::error_code close_ec) {
                if (close_ec) {
                    LOG_DEBUG("[Telemetry] Close " << self->connection_id_ << ": " << close_ec.message());
                }
            });
    });
}

void TelemetrySession::send(const telemetry::TelemetryMessage& msg) {
    auto data = std::make_shared<std::string>();
    if (!msg.SerializeToString(data.get())) {
        LOG_ERROR("[Telemetry] Failed to serialize message type " << static_cast<int>(msg.type()));
        return;
    }

    bool should_start_write = false;
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        write_queue_.push(std::move(data));
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

void TelemetrySession::send_error(core::ErrorCode code, const std::string& message) {
    send(make_error(code, message));
}

void TelemetrySession::do_accept() {
    ws_.async_accept(
        beast::bind_front_handler(&TelemetrySession::on_accept, shared_from_this())
    );
}

void TelemetrySession::on_accept(beast::error_code ec) {
    if (ec) {
        LOG_ERROR("[Telemetry] WebSocket accept error: " << ec.message());
        release();
        return;
    }

    LOG_INFO("[Telemetry] Connection established: " << connection_id_);

    // 超时未绑定会话的连接直接关闭
    if (server_.auth_timeout_sec() > 0) {
        hello_timer_.expires_after(std::chrono::seconds(server_.auth_timeout_sec()));
        hello_timer_.async_wait([self = shared_from_this()](const beast::error_code& timer_ec) {
            if (timer_ec) {
                return;
            }
            if (self->state_ == TelemetryConnState::CONNECTING) {
                LOG_WARN("[Telemetry] Hello timed out: " << self->connection_id_);
                self->send_error(core::ErrorCode::Unauthorized, "hello timed out");
                self->close();
            }
        });
    }

    do_read();
}

void TelemetrySession::do_read() {
    ws_.async_read(
        read_buffer_,
        beast::bind_front_handler(&TelemetrySession::on_read, shared_from_this())
    );
}

void TelemetrySession::on_read(beast::error_code ec, std::size_t bytes) {
    if (ec == websocket::error::closed) {
        LOG_INFO("[Telemetry] Connection closed: " << connection_id_);
        release();
        return;
    }

    if (ec) {
        LOG_WARN("[Telemetry] Read error on " << connection_id_ << ": " << ec.message());
        release();
        return;
    }

    std::string data = beast::buffers_to_string(read_buffer_.data());
    read_buffer_.consume(bytes);

    handle_message(data);

    do_read();
}

void TelemetrySession::do_write() {
    std::shared_ptr<const std::string> data;
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (write_queue_.empty()) {
            writing_ = false;
            return;
        }
        data = write_queue_.front();
    }

    ws_.async_write(
        net::buffer(*data),
        [self = shared_from_this(), data](beast::error_code ec, std::size_t bytes) {
            self->on_write(ec, bytes);
        }
    );
}

void TelemetrySession::on_write(beast::error_code ec, std::size_t /*bytes*/) {
    if (ec) {
        LOG_WARN("[Telemetry] Write error on " << connection_id_ << ": " << ec.message());
        std::lock_guard<std::mutex> lock(write_mutex_);
        std::queue<std::shared_ptr<const std::string>>().swap(write_queue_);
        writing_ = false;
        return;
    }

    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (!write_queue_.empty()) {
            write_queue_.pop();
        }
    }

    do_write();
}

void TelemetrySession::handle_message(const std::string& data) {
    telemetry::TelemetryMessage msg;
    if (!msg.ParseFromString(data)) {
        LOG_WARN("[Telemetry] Failed to parse TelemetryMessage, size=" << data.size());
        send_error(core::ErrorCode::MalformedMessage, "invalid message format");
        return;
    }

    switch (msg.type()) {
        case telemetry::MSG_HELLO:
            if (!msg.has_hello()) {
                send_error(core::ErrorCode::MalformedMessage, "missing hello payload");
                return;
            }
            handle_hello(msg.hello());
            break;

        case telemetry::MSG_POSE_FRAME:
            if (!msg.has_pose_frame()) {
                send_error(core::ErrorCode::MalformedMessage, "missing pose_frame payload");
                return;
            }
            handle_frame(msg.pose_frame());
            break;

        default:
            LOG_WARN("[Telemetry] Unexpected message type: " << static_cast<int>(msg.type()));
            send_error(core::ErrorCode::MalformedMessage, "unexpected message type");
            break;
    }
}

void TelemetrySession::handle_hello(const telemetry::Hello& hello) {
    if (state_ != TelemetryConnState::CONNECTING) {
        send(make_hello_ack(false, "already bound"));
        return;
    }

    if (hello.session_id().empty() || hello.participant_id().empty()) {
        send(make_hello_ack(false, "session_id and participant_id are required"));
        return;
    }

    if (server_.require_auth()) {
        auto principal = server_.verify_token(hello.token());
        if (!principal || principal->participant_id != hello.participant_id()) {
            LOG_WARN("[Telemetry] Authentication failed on " << connection_id_);
            send(make_hello_ack(false, core::to_string(core::ErrorCode::Unauthorized)));
            return;
        }
    }

    core::ErrorCode error = core::ErrorCode::None;
    bool found = server_.registry().with_session(hello.session_id(), [&](Session& s) {
        if (s.state == core::SessionState::Ended) {
            error = core::ErrorCode::SessionClosed;
        } else if (!s.has_participant(hello.participant_id())) {
            error = core::ErrorCode::NotParticipant;
        }
    });
    if (!found) {
        error = core::ErrorCode::SessionNotFound;
    }
    if (error != core::ErrorCode::None) {
        send(make_hello_ack(false, core::to_string(error)));
        return;
    }

    std::weak_ptr<TelemetrySession> weak = shared_from_this();
    subscription_ = server_.pipeline().subscribe(hello.session_id(),
        [weak](const core::AnalysisResult& result) {
            if (auto self = weak.lock()) {
                self->send(make_result_message(result));
            }
        });
    if (subscription_ == 0) {
        send(make_hello_ack(false, core::to_string(core::ErrorCode::SessionClosed)));
        return;
    }

    session_id_ = hello.session_id();
    participant_id_ = hello.participant_id();
    state_ = TelemetryConnState::BOUND;

    beast::error_code ec;
    hello_timer_.cancel(ec);

    LOG_INFO("[Telemetry] Connection " << connection_id_ << " bound to session "
             << session_id_ << " as " << participant_id_);
    send(make_hello_ack(true, "bound"));
}

void TelemetrySession::handle_frame(const telemetry::PoseFrame& frame) {
    if (state_ != TelemetryConnState::BOUND) {
        send_error(core::ErrorCode::InvalidState, "hello required before frames");
        return;
    }

    core::PoseFrame pose = from_proto(frame);
    if (pose.session_id.empty()) {
        pose.session_id = session_id_;
    } else if (pose.session_id != session_id_) {
        send_error(core::ErrorCode::NotParticipant, "frame belongs to another session");
        return;
    }

    auto result = server_.pipeline().submit_frame(pose);
    if (result.status == SubmitStatus::Rejected) {
        LOG_DEBUG("[Telemetry] Frame " << session_id_ << "#" << pose.sequence_number
                  << " rejected: " << core::to_string(result.reason));
    }
    send(make_submit_ack(session_id_, pose.sequence_number, result));
}

void TelemetrySession::release() {
    if (released_) {
        return;
    }
    released_ = true;
    state_ = TelemetryConnState::CLOSING;

    beast::error_code ec;
    hello_timer_.cancel(ec);

    if (subscription_ != 0) {
        server_.pipeline().unsubscribe(subscription_);
        subscription_ = 0;
    }

    server_.remove_session(connection_id_);
}

// ==================== TelemetryServer ====================

TelemetryServer::TelemetryServer(net::io_context& io_context,
                                 const Config& config,
                                 SessionRegistry& registry,
                                 TelemetryPipeline& pipeline)
    : io_context_(io_context)
    , acceptor_(io_context)
    , config_(config)
    , registry_(registry)
    , pipeline_(pipeline)
{
    require_auth_ = config_.auth.require_auth;
    if (!config_.auth.jwt_secret.empty()) {
        jwt_verifier_ = std::make_unique<JwtVerifier>(config_.auth.jwt_secret);
    }
}

TelemetryServer::~TelemetryServer() {
    stop();
}

int TelemetryServer::auth_timeout_sec() const {
    return config_.auth.auth_timeout_sec;
}

size_t TelemetryServer::max_message_bytes() const {
    return config_.server.max_message_bytes;
}

bool TelemetryServer::start() {
    beast::error_code ec;

    auto address = net::ip::make_address(config_.server.host, ec);
    if (ec) {
        LOG_ERROR("[Telemetry] Invalid address: " << ec.message());
        return false;
    }

    tcp::endpoint endpoint{address, config_.server.telemetry_port};

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
        LOG_ERROR("[Telemetry] Failed to open acceptor: " << ec.message());
        return false;
    }

    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) {
        LOG_ERROR("[Telemetry] Failed to set SO_REUSEADDR: " << ec.message());
        return false;
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
        LOG_ERROR("[Telemetry] Failed to bind: " << ec.message());
        return false;
    }

    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        LOG_ERROR("[Telemetry] Failed to listen: " << ec.message());
        return false;
    }

    running_ = true;
    LOG_INFO("[Telemetry] Listening on " << config_.server.host << ":" << config_.server.telemetry_port);

    do_accept();
    return true;
}

void TelemetryServer::stop() {
    if (!running_) {
        return;
    }

    running_ = false;

    beast::error_code ec;
    acceptor_.close(ec);

    std::vector<std::shared_ptr<TelemetrySession>> sessions_copy;
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

std::optional<Principal> TelemetryServer::verify_token(const std::string& token) const {
    if (!jwt_verifier_ || token.empty()) {
        return std::nullopt;
    }
    return jwt_verifier_->verify(token);
}

void TelemetryServer::add_session(const std::string& connection_id,
                                  std::shared_ptr<TelemetrySession> session) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_[connection_id] = std::move(session);
}

void TelemetryServer::remove_session(const std::string& connection_id) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_.erase(connection_id);
}

size_t TelemetryServer::connection_count() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}

void TelemetryServer::do_accept() {
    acceptor_.async_accept(
        net::make_strand(io_context_),
        beast::bind_front_handler(&TelemetryServer::on_accept, shared_from_this())
    );
}

void TelemetryServer::on_accept(beast::error_code ec, tcp::socket socket) {
    if (ec) {
        if (running_) {
            LOG_ERROR("[Telemetry] Accept error: " << ec.message());
        }
    } else if (connection_count() >= config_.server.max_connections) {
        LOG_WARN("[Telemetry] Connection limit reached, rejecting");
        beast::error_code close_ec;
        socket.close(close_ec);
    } else {
        auto session = std::make_shared<TelemetrySession>(std::move(socket), *this);
        session->start();
    }

    if (running_) {
        do_accept();
    }
}

} // namespace telelink::server
