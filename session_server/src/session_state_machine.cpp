/**
 * @file session_state_machine.cpp
 * @brief 会话状态机实现
 */

#include "session_server/session_state_machine.hpp"
#include "session_core/logger.hpp"

#include <algorithm>

namespace telelink::server {

using core::ErrorCode;
using core::SessionState;

namespace {

SessionStateMachine::Outcome fail(ErrorCode code, const std::string& message) {
    SessionStateMachine::Outcome outcome;
    outcome.error = code;
    outcome.message = message;
    return outcome;
}

} // namespace

bool SessionStateMachine::is_legal(SessionState from, SessionState to) {
    if (to == SessionState::Ended) {
        return from != SessionState::Ended;
    }

    switch (from) {
        case SessionState::Created:
            return to == SessionState::Offering;
        case SessionState::Offering:
            return to == SessionState::Answering;
        case SessionState::Answering:
            return to == SessionState::Connected;
        case SessionState::Connected:
            return to == SessionState::Reconnecting || to == SessionState::Offering;
        case SessionState::Reconnecting:
            return to == SessionState::Connected;
        case SessionState::Ended:
            return false;
    }
    return false;
}

bool SessionStateMachine::is_streaming_eligible(const Session& session) {
    if (session.state == SessionState::Connected) {
        return true;
    }
    return session.kind == core::SessionKind::AiCall &&
           session.state == SessionState::Created;
}

SessionStateMachine::Outcome SessionStateMachine::check_sender(const Session& session,
                                                               const std::string& sender_id) {
    if (session.state == SessionState::Ended) {
        return fail(ErrorCode::SessionClosed, "session has ended");
    }
    if (!session.has_participant(sender_id)) {
        return fail(ErrorCode::NotParticipant, "sender is not a participant of this session");
    }
    return {};
}

SessionStateMachine::Outcome SessionStateMachine::transition(Session& session, SessionState to) {
    if (session.state == to) {
        return {};
    }
    if (!is_legal(session.state, to)) {
        return fail(ErrorCode::InvalidState,
                    std::string("illegal transition ") + core::to_string(session.state) +
                    " -> " + core::to_string(to));
    }

    LOG_INFO("[Session " << session.id << "] " << core::to_string(session.state)
             << " -> " << core::to_string(to));
    session.state = to;

    Outcome outcome;
    outcome.changed = true;
    return outcome;
}

SessionStateMachine::Outcome SessionStateMachine::on_offer(Session& session,
                                                           const std::string& sender_id) {
    switch (session.state) {
        case SessionState::Created:
            session.initiator_id = sender_id;
            return transition(session, SessionState::Offering);

        case SessionState::Offering:
            if (sender_id != session.initiator_id) {
                return fail(ErrorCode::ConflictingOffer, "an offer from the other participant is pending");
            }
            // 发起方更新 offer
            return {};

        case SessionState::Connected:
            // 重新协商只能由原发起方发起
            if (sender_id != session.initiator_id) {
                return fail(ErrorCode::ConflictingOffer, "renegotiation must come from the initiator");
            }
            return transition(session, SessionState::Offering);

        case SessionState::Answering:
        case SessionState::Reconnecting:
            return fail(ErrorCode::InvalidState,
                        std::string("offer not allowed in state ") + core::to_string(session.state));

        case SessionState::Ended:
            return fail(ErrorCode::SessionClosed, "session has ended");
    }
    return fail(ErrorCode::InvalidState, "unknown state");
}

SessionStateMachine::Outcome SessionStateMachine::on_answer(Session& session,
                                                            const std::string& sender_id) {
    if (session.state == SessionState::Ended) {
        return fail(ErrorCode::SessionClosed, "session has ended");
    }
    if (session.state != SessionState::Offering) {
        return fail(ErrorCode::InvalidState,
                    std::string("answer not allowed in state ") + core::to_string(session.state));
    }
    if (sender_id == session.initiator_id) {
        return fail(ErrorCode::InvalidState, "initiator cannot answer its own offer");
    }
    return transition(session, SessionState::Answering);
}

SessionStateMachine::Outcome SessionStateMachine::on_answer_delivered(Session& session) {
    session.answer_in_outbox = false;
    if (session.state != SessionState::Answering) {
        return {};
    }
    return transition(session, SessionState::Connected);
}

SessionStateMachine::Outcome SessionStateMachine::on_detach(Session& session,
                                                            Participant& participant,
                                                            SteadyClock::time_point now) {
    if (session.state == SessionState::Ended) {
        return {};
    }
    participant.detached_since = now;

    switch (session.state) {
        case SessionState::Connected:
            return transition(session, SessionState::Reconnecting);

        case SessionState::Created:
        case SessionState::Offering:
        case SessionState::Answering:
            // 建连前无人在线则开始计时，超时视为放弃
            if (!session.any_attached() && !session.unattended_since) {
                session.unattended_since = now;
            }
            return {};

        case SessionState::Reconnecting:
        case SessionState::Ended:
            return {};
    }
    return {};
}

SessionStateMachine::Outcome SessionStateMachine::on_attach(Session& session, Participant& participant) {
    if (session.state == SessionState::Ended) {
        return fail(ErrorCode::SessionClosed, "session has ended");
    }
    participant.detached_since.reset();
    session.unattended_since.reset();

    if (session.state == SessionState::Reconnecting && session.all_attached()) {
        return transition(session, SessionState::Connected);
    }
    return {};
}

bool SessionStateMachine::grace_expired(const Session& session,
                                        SteadyClock::time_point now,
                                        std::chrono::milliseconds grace) {
    switch (session.state) {
        case SessionState::Connected:
        case SessionState::Reconnecting:
            return std::any_of(session.participants.begin(), session.participants.end(),
                               [&](const Participant& p) {
                                   return !p.attached() && p.detached_since &&
                                          now - *p.detached_since >= grace;
                               });

        case SessionState::Created:
        case SessionState::Offering:
        case SessionState::Answering:
            return session.unattended_since && now - *session.unattended_since >= grace;

        case SessionState::Ended:
            return false;
    }
    return false;
}

SessionStateMachine::Outcome SessionStateMachine::end(Session& session,
                                                      const std::string& reason,
                                                      SteadyClock::time_point now) {
    if (session.state == SessionState::Ended) {
        return {};
    }

    auto outcome = transition(session, SessionState::Ended);
    session.end_reason = reason;
    session.ended_at = std::chrono::system_clock::now();
    session.ended_mono = now;
    session.unattended_since.reset();
    session.answer_in_outbox = false;
    return outcome;
}

} // namespace telelink::server
