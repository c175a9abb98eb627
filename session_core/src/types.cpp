/**
 * @file types.cpp
 * @brief 会话层公共类型实现
 */

#include "session_core/types.hpp"

#include <chrono>

namespace telelink::core {

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:             return "None";
        case ErrorCode::MalformedMessage: return "MalformedMessage";
        case ErrorCode::ConflictingOffer: return "ConflictingOffer";
        case ErrorCode::SessionFull:      return "SessionFull";
        case ErrorCode::SessionClosed:    return "SessionClosed";
        case ErrorCode::SessionNotFound:  return "SessionNotFound";
        case ErrorCode::NotParticipant:   return "NotParticipant";
        case ErrorCode::InvalidState:     return "InvalidState";
        case ErrorCode::StaleFrame:       return "StaleFrame";
        case ErrorCode::AnalysisTimeout:  return "AnalysisTimeout";
        case ErrorCode::AnalysisFailure:  return "AnalysisFailure";
        case ErrorCode::SocketDropped:    return "SocketDropped";
        case ErrorCode::Unauthorized:     return "Unauthorized";
    }
    return "None";
}

std::optional<ErrorCode> parse_error_code(const std::string& name) {
    static const ErrorCode all[] = {
        ErrorCode::None, ErrorCode::MalformedMessage, ErrorCode::ConflictingOffer,
        ErrorCode::SessionFull, ErrorCode::SessionClosed, ErrorCode::SessionNotFound,
        ErrorCode::NotParticipant, ErrorCode::InvalidState, ErrorCode::StaleFrame,
        ErrorCode::AnalysisTimeout, ErrorCode::AnalysisFailure, ErrorCode::SocketDropped,
        ErrorCode::Unauthorized
    };
    for (auto code : all) {
        if (name == to_string(code)) {
            return code;
        }
    }
    return std::nullopt;
}

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Created:      return "created";
        case SessionState::Offering:     return "offering";
        case SessionState::Answering:    return "answering";
        case SessionState::Connected:    return "connected";
        case SessionState::Reconnecting: return "reconnecting";
        case SessionState::Ended:        return "ended";
    }
    return "ended";
}

std::optional<SessionState> parse_session_state(const std::string& name) {
    if (name == "created") return SessionState::Created;
    if (name == "offering") return SessionState::Offering;
    if (name == "answering") return SessionState::Answering;
    if (name == "connected") return SessionState::Connected;
    if (name == "reconnecting") return SessionState::Reconnecting;
    if (name == "ended") return SessionState::Ended;
    return std::nullopt;
}

const char* to_string(SessionKind kind) {
    return kind == SessionKind::AiCall ? "ai-call" : "peer-call";
}

std::optional<SessionKind> parse_session_kind(const std::string& name) {
    if (name == "peer-call") return SessionKind::PeerCall;
    if (name == "ai-call") return SessionKind::AiCall;
    return std::nullopt;
}

const char* to_string(SignalType type) {
    switch (type) {
        case SignalType::StartSession: return "start-session";
        case SignalType::Offer:        return "offer";
        case SignalType::Answer:       return "answer";
        case SignalType::IceCandidate: return "ice-candidate";
        case SignalType::EndSession:   return "end-session";
        case SignalType::Error:        return "error";
        case SignalType::SessionState: return "session-state";
        case SignalType::Auth:         return "auth";
    }
    return "error";
}

std::optional<SignalType> parse_signal_type(const std::string& name) {
    if (name == "start-session") return SignalType::StartSession;
    if (name == "offer") return SignalType::Offer;
    if (name == "answer") return SignalType::Answer;
    if (name == "ice-candidate") return SignalType::IceCandidate;
    if (name == "end-session") return SignalType::EndSession;
    if (name == "error") return SignalType::Error;
    if (name == "session-state") return SignalType::SessionState;
    if (name == "auth") return SignalType::Auth;
    return std::nullopt;
}

SignalMessage make_error_message(const std::string& session_id,
                                 ErrorCode code,
                                 const std::string& message) {
    SignalMessage msg;
    msg.type = SignalType::Error;
    msg.session_id = session_id;
    msg.sender_id = kServerSenderId;
    msg.payload = ErrorPayload{code, message};
    return msg;
}

SignalMessage make_state_message(const std::string& session_id, SessionState state) {
    SignalMessage msg;
    msg.type = SignalType::SessionState;
    msg.session_id = session_id;
    msg.sender_id = kServerSenderId;
    msg.payload = SessionStatePayload{state};
    return msg;
}

int64_t now_unix_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace telelink::core
