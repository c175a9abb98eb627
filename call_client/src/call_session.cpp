/**
 * @file call_session.cpp
 * @brief 通话端会话实现
 */

#include "call_client/call_session.hpp"
#include "session_core/logger.hpp"

#include <boost/asio/post.hpp>

#include <chrono>

namespace telelink::client {

namespace {

constexpr const char* kRemoteLane = "remote";
constexpr auto kEndReplyTimeout = std::chrono::seconds(3);

/**
 * @brief 转换为 libdatachannel URL 形式（turn:user:credential@host:port）
 */
std::string to_rtc_url(const core::IceServer& server) {
    if (server.username.empty()) {
        return server.urls;
    }
    auto pos = server.urls.find(':');
    if (pos == std::string::npos) {
        return server.urls;
    }
    return server.urls.substr(0, pos + 1) + server.username + ":" +
           server.credential + "@" + server.urls.substr(pos + 1);
}

} // namespace

CallSession::CallSession(net::io_context& io, Config config)
    : io_(io)
    , config_(std::move(config))
    , signaling_(std::make_shared<SignalingClient>(io, config_.signaling))
    , reconnect_(io.get_executor(), ReconnectPolicy(config_.reconnect))
    , end_timer_(io)
    , creator_(config_.participant.session_id.empty())
    , ice_servers_(config_.webrtc.ice_servers)
{
    session_id_ = config_.participant.session_id;
    kind_ = core::parse_session_kind(config_.participant.kind).value_or(core::SessionKind::PeerCall);
}

CallSession::~CallSession() {
    close_peer_connection();
}

void CallSession::start() {
    std::weak_ptr<CallSession> weak = shared_from_this();

    signaling_->set_open_handler([weak]() {
        if (auto self = weak.lock()) self->on_signaling_open();
    });
    signaling_->set_close_handler([weak](bool expected) {
        if (auto self = weak.lock()) self->on_signaling_close(expected);
    });
    signaling_->set_message_handler([weak](const core::SignalMessage& msg) {
        if (auto self = weak.lock()) self->on_signal(msg);
    });

    reconnect_.set_connect_handler([weak](int attempt) {
        auto self = weak.lock();
        if (!self) return;
        LOG_INFO("[Call] Reconnecting (attempt " << attempt << ")");
        self->signaling_->connect();
    });
    reconnect_.set_give_up_handler([weak]() {
        auto self = weak.lock();
        if (!self) return;
        LOG_ERROR("[Call] Reconnect budget exhausted");
        self->finish();
    });

    signaling_->connect();
}

void CallSession::end(const std::string& reason) {
    if (ending_ || finished_) {
        return;
    }
    ending_ = true;
    reconnect_.cancel();

    if (session_id_.empty() || !signaling_->is_open()) {
        finish();
        return;
    }

    LOG_INFO("[Call] Ending session " << session_id_ << " (" << reason << ")");
    core::EndSessionPayload payload;
    payload.reason = reason;
    send_signal(core::SignalType::EndSession, payload);

    // 服务端无回复时也要退出
    end_timer_.expires_after(kEndReplyTimeout);
    end_timer_.async_wait([weak = std::weak_ptr<CallSession>(shared_from_this())](
                              const boost::system::error_code& ec) {
        if (ec) return;
        if (auto self = weak.lock()) {
            LOG_WARN("[Call] No end-session reply, closing");
            self->finish();
        }
    });
}

// ==================== 信令事件 ====================

void CallSession::on_signaling_open() {
    reconnect_.on_connected();

    if (!config_.signaling.token.empty()) {
        core::AuthPayload auth;
        auth.token = config_.signaling.token;
        send_signal(core::SignalType::Auth, auth);
    }

    core::StartSessionPayload start;
    if (session_id_.empty()) {
        if (!config_.participant.peer_id.empty()) {
            start.participants.push_back(config_.participant.peer_id);
        }
        start.kind = kind_;
    }
    send_signal(core::SignalType::StartSession, start);
}

void CallSession::on_signaling_close(bool expected) {
    if (expected || ending_ || finished_) {
        return;
    }
    if (state_ == core::SessionState::Ended) {
        return;
    }

    LOG_WARN("[Call] Signaling connection lost");
    reconnect_.on_socket_closed();
}

void CallSession::on_signal(const core::SignalMessage& msg) {
    if (!session_id_.empty() && !msg.session_id.empty() && msg.session_id != session_id_) {
        LOG_DEBUG("[Call] Ignoring message for session " << msg.session_id);
        return;
    }

    switch (msg.type) {
        case core::SignalType::StartSession: handle_start_ack(msg); break;
        case core::SignalType::Offer:        handle_offer(msg); break;
        case core::SignalType::Answer:       handle_answer(msg); break;
        case core::SignalType::IceCandidate: handle_candidate(msg); break;
        case core::SignalType::SessionState: handle_state(msg); break;
        case core::SignalType::EndSession:   handle_end(msg); break;
        case core::SignalType::Error:        handle_error(msg); break;
        case core::SignalType::Auth:
            break;
    }
}

void CallSession::handle_start_ack(const core::SignalMessage& msg) {
    const auto& payload = msg.start();
    bool first = session_id_.empty();
    session_id_ = msg.session_id;
    if (payload.kind) {
        kind_ = *payload.kind;
    }
    if (!payload.ice_servers.empty()) {
        ice_servers_ = payload.ice_servers;
    }

    if (payload.state) {
        state_ = *payload.state;
    }

    LOG_INFO("[Call] Session " << session_id_ << " " << (first && creator_ ? "created" : "joined")
             << ", state=" << (state_ ? core::to_string(*state_) : "unknown"));

    if (kind_ != core::SessionKind::PeerCall) {
        return;
    }

    // 创建方在协商前发起 offer
    if (creator_ && state_ == core::SessionState::Created) {
        start_offer();
    }
}

void CallSession::handle_offer(const core::SignalMessage& msg) {
    if (!peer_connection_usable()) {
        create_peer_connection();
    }

    LOG_INFO("[Call] Received offer from " << msg.sender_id);
    try {
        pc_->setRemoteDescription(rtc::Description(msg.sdp().sdp, "offer"));
    } catch (const std::exception& e) {
        LOG_ERROR("[Call] Failed to apply offer: " << e.what());
        return;
    }

    // 应答由 libdatachannel 自动生成，经 onLocalDescription 发出
    remote_candidates_.flush(kRemoteLane, [this](const core::IceCandidate& c) {
        add_remote_candidate(c);
    });
}

void CallSession::handle_answer(const core::SignalMessage& msg) {
    if (!pc_) {
        LOG_WARN("[Call] Answer without a peer connection, ignored");
        return;
    }

    LOG_INFO("[Call] Received answer from " << msg.sender_id);
    try {
        pc_->setRemoteDescription(rtc::Description(msg.sdp().sdp, "answer"));
    } catch (const std::exception& e) {
        LOG_ERROR("[Call] Failed to apply answer: " << e.what());
        return;
    }

    remote_candidates_.flush(kRemoteLane, [this](const core::IceCandidate& c) {
        add_remote_candidate(c);
    });
}

void CallSession::handle_candidate(const core::SignalMessage& msg) {
    remote_candidates_.enqueue(kRemoteLane, msg.candidate(), [this](const core::IceCandidate& c) {
        add_remote_candidate(c);
    });
}

void CallSession::handle_state(const core::SignalMessage& msg) {
    auto state = msg.state().state;
    state_ = state;
    reconnect_.on_session_state(state);

    switch (state) {
        case core::SessionState::Connected:
            LOG_INFO("[Call] Call connected");
            // 恢复后媒体通道已失效时由发起方重新协商
            if (creator_ && kind_ == core::SessionKind::PeerCall && !peer_connection_usable()) {
                start_offer();
            }
            break;
        case core::SessionState::Reconnecting:
            LOG_INFO("[Call] Call reconnecting");
            break;
        case core::SessionState::Ended:
            LOG_INFO("[Call] Call ended");
            break;
        default:
            LOG_DEBUG("[Call] Session state: " << core::to_string(state));
            break;
    }
}

void CallSession::handle_end(const core::SignalMessage& msg) {
    state_ = core::SessionState::Ended;
    reconnect_.cancel();

    if (std::holds_alternative<core::EndSessionPayload>(msg.payload)) {
        const auto& payload = msg.end();
        if (payload.summary) {
            const auto& s = *payload.summary;
            LOG_INFO("[Call] Session summary: duration=" << s.duration_ms << "ms"
                     << ", frames=" << s.frames_submitted
                     << ", analyzed=" << s.frames_analyzed
                     << ", reason=" << s.end_reason);
        } else if (!payload.reason.empty()) {
            LOG_INFO("[Call] Session ended: " << payload.reason);
        }
    }

    finish();
}

void CallSession::handle_error(const core::SignalMessage& msg) {
    const auto& err = msg.error();
    LOG_WARN("[Call] Server error: " << core::to_string(err.code) << " " << err.message);

    switch (err.code) {
        case core::ErrorCode::SessionClosed:
        case core::ErrorCode::SessionNotFound:
        case core::ErrorCode::SessionFull:
        case core::ErrorCode::NotParticipant:
        case core::ErrorCode::Unauthorized:
            // 会话无法继续
            reconnect_.cancel();
            finish();
            break;
        case core::ErrorCode::MalformedMessage:
            // start-session 被拒绝，尚未拿到会话
            if (session_id_.empty()) {
                reconnect_.cancel();
                finish();
            }
            break;
        default:
            break;
    }
}

// ==================== WebRTC ====================

void CallSession::create_peer_connection() {
    close_peer_connection();

    rtc::Configuration config;
    for (const auto& server : ice_servers_) {
        config.iceServers.emplace_back(to_rtc_url(server));
    }

    pc_ = std::make_shared<rtc::PeerConnection>(config);
    remote_candidates_.release(kRemoteLane);

    // libdatachannel 回调在其内部线程，统一投递回 io_context
    std::weak_ptr<CallSession> weak = shared_from_this();
    auto& io = io_;

    pc_->onLocalDescription([&io, weak](rtc::Description desc) {
        std::string sdp(desc);
        std::string type = desc.typeString();
        net::post(io, [weak, sdp, type]() {
            if (auto self = weak.lock()) self->on_local_description(sdp, type);
        });
    });

    pc_->onLocalCandidate([&io, weak](rtc::Candidate candidate) {
        std::string cand(candidate);
        std::string mid = candidate.mid();
        net::post(io, [weak, cand, mid]() {
            if (auto self = weak.lock()) self->on_local_candidate(cand, mid);
        });
    });

    pc_->onStateChange([](rtc::PeerConnection::State state) {
        LOG_DEBUG("[Call] PeerConnection state: " << state);
    });

    pc_->onDataChannel([&io, weak](std::shared_ptr<rtc::DataChannel> dc) {
        net::post(io, [weak, dc]() {
            auto self = weak.lock();
            if (!self) return;
            LOG_INFO("[Call] Data channel '" << dc->label() << "' received");
            self->channel_ = dc;
        });
    });
}

void CallSession::close_peer_connection() {
    if (channel_) {
        channel_.reset();
    }
    if (pc_) {
        pc_->close();
        pc_.reset();
    }
}

bool CallSession::peer_connection_usable() const {
    if (!pc_) {
        return false;
    }
    auto state = pc_->state();
    return state != rtc::PeerConnection::State::Failed &&
           state != rtc::PeerConnection::State::Closed;
}

void CallSession::start_offer() {
    create_peer_connection();

    // 创建数据通道即触发 offer 生成
    channel_ = pc_->createDataChannel("telelink");
    channel_->onOpen([]() {
        LOG_INFO("[Call] Data channel open");
    });
}

void CallSession::on_local_description(const std::string& sdp, const std::string& type) {
    core::SdpPayload payload;
    payload.sdp = sdp;

    if (type == "offer") {
        LOG_INFO("[Call] Sending offer");
        send_signal(core::SignalType::Offer, payload);
    } else if (type == "answer") {
        LOG_INFO("[Call] Sending answer");
        send_signal(core::SignalType::Answer, payload);
    } else {
        LOG_WARN("[Call] Unexpected local description type: " << type);
    }
}

void CallSession::on_local_candidate(const std::string& candidate, const std::string& mid) {
    core::IceCandidate payload;
    payload.candidate = candidate;
    payload.sdp_mid = mid;
    send_signal(core::SignalType::IceCandidate, payload);
}

void CallSession::add_remote_candidate(const core::IceCandidate& candidate) {
    if (!pc_) {
        return;
    }
    try {
        pc_->addRemoteCandidate(rtc::Candidate(candidate.candidate, candidate.sdp_mid));
    } catch (const std::exception& e) {
        LOG_WARN("[Call] Failed to add remote candidate: " << e.what());
    }
}

// ==================== 辅助 ====================

void CallSession::send_signal(core::SignalType type, core::SignalPayload payload) {
    core::SignalMessage msg;
    msg.type = type;
    msg.session_id = session_id_;
    msg.sender_id = config_.participant.id;
    msg.payload = std::move(payload);
    signaling_->send(msg);
}

void CallSession::finish() {
    if (finished_) {
        return;
    }
    finished_ = true;

    boost::system::error_code ec;
    end_timer_.cancel(ec);
    reconnect_.cancel();
    close_peer_connection();
    signaling_->close();

    if (on_finished_) {
        on_finished_();
    }
}

} // namespace telelink::client
