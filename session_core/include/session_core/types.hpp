/**
 * @file types.hpp
 * @brief 会话层公共类型
 *
 * 信令消息、会话状态、姿态帧与分析结果，服务端与客户端共用
 */

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace telelink::core {

/**
 * @brief 错误码
 */
enum class ErrorCode {
    None,
    MalformedMessage,   // 编解码失败
    ConflictingOffer,   // 另一方已发起 offer
    SessionFull,        // 参与者已满 2 人
    SessionClosed,      // 会话已结束或不可推流
    SessionNotFound,    // 会话不存在（或已被回收）
    NotParticipant,     // 发送者不属于该会话
    InvalidState,       // 当前状态不允许该消息
    StaleFrame,         // 帧序号过期或重复
    AnalysisTimeout,    // 分析服务超时
    AnalysisFailure,    // 分析服务失败
    SocketDropped,      // 连接断开
    Unauthorized        // 未认证
};

const char* to_string(ErrorCode code);
std::optional<ErrorCode> parse_error_code(const std::string& name);

/**
 * @brief 会话状态
 */
enum class SessionState {
    Created,
    Offering,
    Answering,
    Connected,
    Reconnecting,
    Ended
};

const char* to_string(SessionState state);
std::optional<SessionState> parse_session_state(const std::string& name);

/**
 * @brief 会话类型
 */
enum class SessionKind {
    PeerCall,   // 两个真人之间的视频通话
    AiCall      // 单人 + 动作分析
};

const char* to_string(SessionKind kind);
std::optional<SessionKind> parse_session_kind(const std::string& name);

/**
 * @brief STUN/TURN 服务器
 */
struct IceServer {
    std::string urls;
    std::string username;
    std::string credential;
};

/**
 * @brief ICE Candidate
 */
struct IceCandidate {
    std::string candidate;
    std::string sdp_mid;
    int sdp_mline_index = -1;
};

/**
 * @brief 会话结束摘要
 */
struct SessionSummary {
    std::string session_id;
    SessionKind kind = SessionKind::PeerCall;
    std::vector<std::string> participants;
    int64_t duration_ms = 0;
    uint64_t frames_submitted = 0;
    uint64_t frames_analyzed = 0;
    uint64_t frames_throttled = 0;
    std::optional<double> best_score;
    std::string end_reason;
};

// ==================== 信令负载 ====================

/**
 * @brief start-session 负载
 *
 * 客户端请求只填 participants/kind/metadata；
 * 服务端回复额外携带 state 与 ice_servers
 */
struct StartSessionPayload {
    std::vector<std::string> participants;
    std::optional<SessionKind> kind;
    std::map<std::string, std::string> metadata;
    std::optional<SessionState> state;
    std::vector<IceServer> ice_servers;
};

struct SdpPayload {
    std::string sdp;
};

struct EndSessionPayload {
    std::string reason;
    std::optional<SessionSummary> summary;
};

struct ErrorPayload {
    ErrorCode code = ErrorCode::None;
    std::string message;
};

struct SessionStatePayload {
    SessionState state = SessionState::Created;
};

struct AuthPayload {
    std::string token;
};

using SignalPayload = std::variant<std::monostate,
                                   StartSessionPayload,
                                   SdpPayload,
                                   IceCandidate,
                                   EndSessionPayload,
                                   ErrorPayload,
                                   SessionStatePayload,
                                   AuthPayload>;

/**
 * @brief 信令消息类型
 */
enum class SignalType {
    StartSession,
    Offer,
    Answer,
    IceCandidate,
    EndSession,
    Error,
    SessionState,
    Auth
};

const char* to_string(SignalType type);
std::optional<SignalType> parse_signal_type(const std::string& name);

/**
 * @brief 信令消息
 *
 * type 决定 payload 的具体类型，由编解码器保证一致
 */
struct SignalMessage {
    SignalType type = SignalType::Error;
    std::string session_id;
    std::string sender_id;
    SignalPayload payload;

    const StartSessionPayload& start() const { return std::get<StartSessionPayload>(payload); }
    const SdpPayload& sdp() const { return std::get<SdpPayload>(payload); }
    const IceCandidate& candidate() const { return std::get<IceCandidate>(payload); }
    const EndSessionPayload& end() const { return std::get<EndSessionPayload>(payload); }
    const ErrorPayload& error() const { return std::get<ErrorPayload>(payload); }
    const SessionStatePayload& state() const { return std::get<SessionStatePayload>(payload); }
    const AuthPayload& auth() const { return std::get<AuthPayload>(payload); }
};

/// 服务端发出消息时使用的 senderId
inline constexpr const char* kServerSenderId = "server";

SignalMessage make_error_message(const std::string& session_id,
                                 ErrorCode code,
                                 const std::string& message);

SignalMessage make_state_message(const std::string& session_id, SessionState state);

// ==================== 遥测 ====================

/**
 * @brief 关节点
 */
struct Keypoint {
    std::string name;
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
    double confidence = 0.0;
};

/**
 * @brief 姿态帧
 */
struct PoseFrame {
    std::string session_id;
    uint64_t sequence_number = 0;
    int64_t captured_at_ms = 0;
    std::vector<Keypoint> keypoints;
    std::string exercise;
};

/**
 * @brief 分析结果
 */
struct AnalysisResult {
    std::string session_id;
    uint64_t frame_sequence_number = 0;
    double score = 0.0;
    std::string feedback;
    int64_t computed_at_ms = 0;
};

/**
 * @brief 当前系统时间（毫秒）
 */
int64_t now_unix_ms();

} // namespace telelink::core
