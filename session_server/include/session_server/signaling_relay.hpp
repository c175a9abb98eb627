/**
 * @file signaling_relay.hpp
 * @brief 信令中继
 *
 * 在同一会话的两位参与者之间转发 offer / answer / ice-candidate，
 * 对端连接缺席时写入其 outbox，重新绑定时按顺序补发。
 * 每次状态转换都会向在线参与者推送 session-state。
 */

#pragma once

#include "session_server/session_registry.hpp"
#include "session_server/session_state_machine.hpp"
#include "session_server/signal_peer.hpp"
#include "session_core/types.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace telelink::server {

/**
 * @brief 中继处理结果
 */
struct RelayResult {
    core::ErrorCode code = core::ErrorCode::None;
    std::string message;
    std::string session_id;

    bool ok() const { return code == core::ErrorCode::None; }
};

class SignalingRelay {
public:
    struct Options {
        std::chrono::milliseconds reconnect_grace{30000};
        std::chrono::milliseconds eviction_grace{60000};
        size_t outbox_capacity = 256;
        std::vector<core::IceServer> ice_servers;
    };

    /**
     * @brief 会话结束前回调（在会话锁内调用，用于取消遥测请求）
     */
    using SessionEndHook = std::function<void(Session&)>;

    SignalingRelay(SessionRegistry& registry, Options options);

    SignalingRelay(const SignalingRelay&) = delete;
    SignalingRelay& operator=(const SignalingRelay&) = delete;

    void set_session_end_hook(SessionEndHook hook) { end_hook_ = std::move(hook); }

    /**
     * @brief 处理一条已解码的信令
     * @param msg 消息
     * @param from 来源连接（错误与回复发往该连接）
     * @param now 当前时间
     */
    RelayResult handle(const core::SignalMessage& msg,
                       const std::shared_ptr<SignalPeer>& from,
                       SteadyClock::time_point now = SteadyClock::now());

    /**
     * @brief 创建会话
     * @param creator 创建者（自动加入参与者）
     * @param from 创建者的连接，可为空
     */
    RelayResult start_session(const std::string& creator,
                              const std::vector<std::string>& participants,
                              core::SessionKind kind,
                              const std::map<std::string, std::string>& metadata,
                              const std::shared_ptr<SignalPeer>& from);

    /**
     * @brief 结束会话（幂等，重复调用返回同一摘要）
     * @return 会话不存在时返回 nullopt
     */
    std::optional<core::SessionSummary> end_session(const std::string& session_id,
                                                    const std::string& reason,
                                                    SteadyClock::time_point now = SteadyClock::now());

    /**
     * @brief 连接断开
     *
     * 只有当参与者当前绑定的仍是该连接时才解除路由，
     * 已被新连接取代的旧连接断开不影响会话
     */
    void on_disconnect(const std::string& session_id,
                       const std::string& participant_id,
                       const std::string& connection_id,
                       SteadyClock::time_point now = SteadyClock::now());

    /**
     * @brief 宽限期检查与回收
     * @return 本次结束的会话数量
     */
    size_t sweep(SteadyClock::time_point now = SteadyClock::now());

    const Options& options() const { return options_; }

private:
    /// 锁外发送的消息
    struct Outgoing {
        std::shared_ptr<SignalPeer> peer;
        std::string text;
    };
    using OutgoingList = std::vector<Outgoing>;

    RelayResult handle_start(const core::SignalMessage& msg,
                             const std::shared_ptr<SignalPeer>& from);
    RelayResult handle_offer(const core::SignalMessage& msg, OutgoingList& out);
    RelayResult handle_answer(const core::SignalMessage& msg, OutgoingList& out);
    RelayResult handle_candidate(const core::SignalMessage& msg, OutgoingList& out);
    RelayResult handle_end(const core::SignalMessage& msg,
                           const std::shared_ptr<SignalPeer>& from,
                           SteadyClock::time_point now);

    /**
     * @brief 投递给参与者：在线则加入发送列表，否则写入 outbox
     * @return true 表示投递到在线连接
     */
    bool deliver(Participant& participant, const std::string& text, OutgoingList& out);

    /**
     * @brief 向所有在线参与者推送当前状态
     */
    void notify_state(Session& session, OutgoingList& out);

    /**
     * @brief 绑定连接并补发 outbox
     */
    SessionStateMachine::Outcome attach(Session& session,
                                        Participant& participant,
                                        const std::shared_ptr<SignalPeer>& peer,
                                        OutgoingList& out);

    /**
     * @brief 在会话锁内结束会话，通知写入 out
     */
    void end_locked(Session& session, const std::string& reason,
                    SteadyClock::time_point now, OutgoingList& out);

    core::StartSessionPayload describe(const Session& session) const;

    static core::SessionSummary summarize(const Session& session);

    static void flush(OutgoingList& out);

    static RelayResult reply_error(const std::shared_ptr<SignalPeer>& to,
                                   const std::string& session_id,
                                   core::ErrorCode code,
                                   const std::string& message);

    SessionRegistry& registry_;
    Options options_;
    SessionEndHook end_hook_;
};

} // namespace telelink::server
