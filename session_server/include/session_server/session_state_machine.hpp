/**
 * @file session_state_machine.hpp
 * @brief 会话状态机
 *
 * 合法转换:
 *   Created      -> Offering | Ended
 *   Offering     -> Answering | Ended
 *   Answering    -> Connected | Ended
 *   Connected    -> Reconnecting | Offering（重新协商） | Ended
 *   Reconnecting -> Connected | Ended
 *   Ended        终态
 *
 * 所有函数都在会话锁内调用
 */

#pragma once

#include "session_server/session_registry.hpp"
#include "session_core/types.hpp"

#include <chrono>
#include <string>

namespace telelink::server {

class SessionStateMachine {
public:
    /**
     * @brief 处理结果
     */
    struct Outcome {
        core::ErrorCode error = core::ErrorCode::None;
        std::string message;
        bool changed = false;

        bool ok() const { return error == core::ErrorCode::None; }
    };

    static bool is_legal(core::SessionState from, core::SessionState to);

    /**
     * @brief 会话是否可接受遥测帧
     *
     * peer-call 需处于 Connected；ai-call 没有对端，Created 即可推流
     */
    static bool is_streaming_eligible(const Session& session);

    /**
     * @brief 检查发送者可以向该会话发送信令
     */
    static Outcome check_sender(const Session& session, const std::string& sender_id);

    /**
     * @brief 收到 offer
     *
     * 首个 offer 的发送方成为发起方；对端在 Offering 期间再发 offer 为冲突
     */
    static Outcome on_offer(Session& session, const std::string& sender_id);

    /**
     * @brief 收到 answer（只能由非发起方在 Offering 状态发送）
     */
    static Outcome on_answer(Session& session, const std::string& sender_id);

    /**
     * @brief answer 已投递给发起方的在线连接
     */
    static Outcome on_answer_delivered(Session& session);

    /**
     * @brief 参与者连接断开（调用前已解除其路由）
     */
    static Outcome on_detach(Session& session, Participant& participant, SteadyClock::time_point now);

    /**
     * @brief 参与者重新绑定连接（调用前已设置其路由）
     */
    static Outcome on_attach(Session& session, Participant& participant);

    /**
     * @brief 宽限期是否已过
     *
     * 建连后：任一缺席参与者自身的断开时长达到宽限期；
     * 建连前：会话无人在线的时长达到宽限期
     */
    static bool grace_expired(const Session& session,
                              SteadyClock::time_point now,
                              std::chrono::milliseconds grace);

    /**
     * @brief 结束会话（幂等）
     */
    static Outcome end(Session& session, const std::string& reason, SteadyClock::time_point now);

private:
    static Outcome transition(Session& session, core::SessionState to);
};

} // namespace telelink::server
