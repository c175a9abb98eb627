/**
 * @file session_registry.hpp
 * @brief 会话注册表
 *
 * 会话状态、参与者与时间戳的唯一来源。
 * 表结构由读写锁保护，每个会话条目有独立的互斥锁（按键加锁），
 * 同一会话的信令与遥测在该锁下串行处理。
 */

#pragma once

#include "session_server/signal_peer.hpp"
#include "session_core/ice_candidate_buffer.hpp"
#include "session_core/types.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace telelink::server {

using SteadyClock = std::chrono::steady_clock;

using ResultCallback = std::function<void(const core::AnalysisResult&)>;

/**
 * @brief 会话参与者
 */
struct Participant {
    std::string id;
    std::weak_ptr<SignalPeer> route;    // 当前绑定的连接
    std::string connection_id;          // 绑定连接的 ID，用于识别过期的断开通知
    std::deque<std::string> outbox;     // 连接缺席期间暂存的信令
    size_t outbox_dropped = 0;
    std::optional<SteadyClock::time_point> detached_since;  // 各自的重连宽限期起点

    bool attached() const { return !route.expired(); }
};

/**
 * @brief 会话内遥测状态（单飞请求、节流与统计）
 */
struct TelemetryState {
    std::optional<uint64_t> last_sequence;
    std::optional<SteadyClock::time_point> last_accepted_at;

    bool in_flight = false;
    uint64_t in_flight_sequence = 0;
    uint64_t generation = 0;
    std::function<void()> cancel_in_flight;

    std::map<uint64_t, ResultCallback> subscribers;
    std::optional<core::AnalysisResult> last_result;

    uint64_t frames_submitted = 0;
    uint64_t frames_analyzed = 0;
    uint64_t frames_throttled = 0;
    uint64_t analysis_failures = 0;
    std::optional<double> best_score;
};

/**
 * @brief 会话记录
 */
struct Session {
    std::string id;
    core::SessionKind kind = core::SessionKind::PeerCall;
    core::SessionState state = core::SessionState::Created;
    std::vector<Participant> participants;
    std::map<std::string, std::string> metadata;

    std::chrono::system_clock::time_point created_at;
    std::optional<std::chrono::system_clock::time_point> ended_at;
    std::optional<SteadyClock::time_point> ended_mono;
    std::optional<SteadyClock::time_point> unattended_since;   // 建连前无人在线的起点

    std::string initiator_id;           // 首个 offer 的发送方
    bool answer_in_outbox = false;      // answer 暂存在发起方的 outbox 中
    std::string end_reason;

    core::IceCandidateBuffer ice_buffer;
    TelemetryState telemetry;

    explicit Session(size_t ice_capacity = core::IceCandidateBuffer::kDefaultCapacity)
        : ice_buffer(ice_capacity) {}

    Participant* find_participant(const std::string& participant_id);
    const Participant* find_participant(const std::string& participant_id) const;

    /**
     * @brief 获取另一位参与者（不存在时返回 nullptr）
     */
    Participant* other_participant(const std::string& participant_id);

    bool has_participant(const std::string& participant_id) const {
        return find_participant(participant_id) != nullptr;
    }

    std::vector<std::string> participant_ids() const;

    bool all_attached() const;
    bool any_attached() const;
};

/**
 * @brief 会话快照（只读副本，供查询使用）
 */
struct SessionSnapshot {
    std::string id;
    core::SessionKind kind = core::SessionKind::PeerCall;
    core::SessionState state = core::SessionState::Created;
    std::vector<std::string> participants;
    std::map<std::string, std::string> metadata;
    std::string initiator_id;
    std::chrono::system_clock::time_point created_at;
    std::optional<std::chrono::system_clock::time_point> ended_at;
};

/**
 * @brief 会话注册表
 */
class SessionRegistry {
public:
    static constexpr size_t kMaxParticipants = 2;

    explicit SessionRegistry(size_t ice_buffer_capacity = core::IceCandidateBuffer::kDefaultCapacity);

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    /**
     * @brief 创建会话
     * @param kind 会话类型
     * @param participants 参与者（去重后不超过 2 人）
     * @param metadata 附加信息
     * @return 会话 ID；参与者数量非法时返回 nullopt
     */
    std::optional<std::string> create(core::SessionKind kind,
                                      const std::vector<std::string>& participants,
                                      const std::map<std::string, std::string>& metadata);

    /**
     * @brief 在会话锁内访问会话
     *
     * fn 内不得再次访问同一会话
     * @return 会话不存在时返回 false
     */
    bool with_session(const std::string& session_id,
                      const std::function<void(Session&)>& fn);

    std::optional<core::SessionState> state_of(const std::string& session_id) const;

    std::optional<SessionSnapshot> snapshot(const std::string& session_id) const;

    /**
     * @brief 所有会话 ID（包括已结束、尚未回收的）
     */
    std::vector<std::string> session_ids() const;

    /**
     * @brief 回收结束时间早于 now - grace 的会话
     * @return 回收数量
     */
    size_t evict_ended(SteadyClock::time_point now, std::chrono::milliseconds grace);

    size_t size() const;

    /**
     * @brief 生成会话 ID
     */
    static std::string generate_session_id();

private:
    struct Entry {
        std::mutex mutex;
        Session session;

        explicit Entry(size_t ice_capacity) : session(ice_capacity) {}
    };

    std::shared_ptr<Entry> find_entry(const std::string& session_id) const;

    size_t ice_buffer_capacity_;

    std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
    mutable std::shared_mutex map_mutex_;
};

} // namespace telelink::server
