/**
 * @file call_session.hpp
 * @brief 通话端会话
 *
 * 连接信令服务，创建或加入会话，驱动 libdatachannel PeerConnection，
 * 断线后按重连策略以原 sessionId 恢复。
 * 通话状态只以服务端 session-state 通知为准
 */

#pragma once

#include "call_client/config.hpp"
#include "call_client/reconnect_manager.hpp"
#include "call_client/signaling_client.hpp"
#include "session_core/ice_candidate_buffer.hpp"
#include "session_core/types.hpp"

#include <rtc/rtc.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace telelink::client {

class CallSession : public std::enable_shared_from_this<CallSession> {
public:
    /// 会话结束（或放弃重连）后调用一次
    using FinishedHandler = std::function<void()>;

    CallSession(net::io_context& io, Config config);
    ~CallSession();

    void set_finished_handler(FinishedHandler handler) { on_finished_ = std::move(handler); }

    /**
     * @brief 连接信令服务并开始会话
     */
    void start();

    /**
     * @brief 主动结束会话（发送 end-session 并取消重连）
     */
    void end(const std::string& reason);

    const std::string& session_id() const { return session_id_; }
    std::optional<core::SessionState> state() const { return state_; }

private:
    // 信令事件
    void on_signaling_open();
    void on_signaling_close(bool expected);
    void on_signal(const core::SignalMessage& msg);

    void handle_start_ack(const core::SignalMessage& msg);
    void handle_offer(const core::SignalMessage& msg);
    void handle_answer(const core::SignalMessage& msg);
    void handle_candidate(const core::SignalMessage& msg);
    void handle_state(const core::SignalMessage& msg);
    void handle_end(const core::SignalMessage& msg);
    void handle_error(const core::SignalMessage& msg);

    // WebRTC
    void create_peer_connection();
    void close_peer_connection();
    bool peer_connection_usable() const;
    void start_offer();
    void on_local_description(const std::string& sdp, const std::string& type);
    void on_local_candidate(const std::string& candidate, const std::string& mid);
    void add_remote_candidate(const core::IceCandidate& candidate);

    void send_signal(core::SignalType type, core::SignalPayload payload);
    void finish();

    net::io_context& io_;
    Config config_;
    std::shared_ptr<SignalingClient> signaling_;
    ReconnectManager reconnect_;
    net::steady_timer end_timer_;

    std::string session_id_;
    std::optional<core::SessionState> state_;
    core::SessionKind kind_ = core::SessionKind::PeerCall;
    bool creator_ = false;
    bool ending_ = false;
    bool finished_ = false;
    std::vector<core::IceServer> ice_servers_;

    std::shared_ptr<rtc::PeerConnection> pc_;
    std::shared_ptr<rtc::DataChannel> channel_;

    // 远端描述设置前到达的 candidate
    core::IceCandidateBuffer remote_candidates_;

    FinishedHandler on_finished_;
};

} // namespace telelink::client
