/**
 * @file signaling_relay.cpp
 * @brief 信令中继实现
 */

#include "session_server/signaling_relay.hpp"
#include "session_core/signal_codec.hpp"
#include "session_core/logger.hpp"

#include <algorithm>

namespace telelink::server {

using core::ErrorCode;
using core::SessionState;
using core::SignalMessage;
using core::SignalType;

namespace {

std::string encode_candidate(const std::string& session_id,
                             const std::string& sender_id,
                             const core::IceCandidate& candidate) {
    SignalMessage msg;
    msg.type = SignalType::IceCandidate;
    msg.session_id = session_id;
    msg.sender_id = sender_id;
    msg.payload = candidate;
    return core::encode_message(msg);
}

} // namespace

SignalingRelay::SignalingRelay(SessionRegistry& registry, Options options)
    : registry_(registry)
    , options_(std::move(options))
{
}

RelayResult SignalingRelay::handle(const SignalMessage& msg,
                                   const std::shared_ptr<SignalPeer>& from,
                                   SteadyClock::time_point now) {
    switch (msg.type) {
        case SignalType::StartSession:
            return handle_start(msg, from);

        case SignalType::EndSession:
            return handle_end(msg, from, now);

        case SignalType::Offer:
        case SignalType::Answer:
        case SignalType::IceCandidate: {
            OutgoingList out;
            RelayResult result;
            if (msg.type == SignalType::Offer) {
                result = handle_offer(msg, out);
            } else if (msg.type == SignalType::Answer) {
                result = handle_answer(msg, out);
            } else {
                result = handle_candidate(msg, out);
            }
            flush(out);

            if (!result.ok()) {
                LOG_WARN("[Relay] " << core::to_string(msg.type) << " from " << msg.sender_id
                         << " rejected: " << core::to_string(result.code) << " (" << result.message << ")");
                reply_error(from, msg.session_id, result.code, result.message);
            }
            return result;
        }

        case SignalType::Error:
            LOG_WARN("[Relay] Client " << msg.sender_id << " reported error: "
                     << core::to_string(msg.error().code) << " " << msg.error().message);
            return {};

        case SignalType::SessionState:
        case SignalType::Auth:
            break;
    }

    return reply_error(from, msg.session_id, ErrorCode::InvalidState,
                       std::string("unexpected message type ") + core::to_string(msg.type));
}

// ==================== 会话生命周期 ====================

RelayResult SignalingRelay::start_session(const std::string& creator,
                                          const std::vector<std::string>& participants,
                                          core::SessionKind kind,
                                          const std::map<std::string, std::string>& metadata,
                                          const std::shared_ptr<SignalPeer>& from) {
    std::vector<std::string> all;
    all.push_back(creator);
    for (const auto& p : participants) {
        if (std::find(all.begin(), all.end(), p) == all.end()) {
            all.push_back(p);
        }
    }

    // 双方通话必须在创建时指定对端，否则 offer 无处可发
    if (kind == core::SessionKind::PeerCall && all.size() < 2) {
        LOG_WARN("[Relay] start-session from " << creator << " rejected: peer-call without a peer");
        return reply_error(from, "", ErrorCode::MalformedMessage,
                           "peer-call requires the other participant in participants");
    }

    auto id = registry_.create(kind, all, metadata);
    if (!id) {
        return reply_error(from, "", ErrorCode::SessionFull,
                           "a session holds at most " +
                           std::to_string(SessionRegistry::kMaxParticipants) + " participants");
    }

    RelayResult result;
    result.session_id = *id;

    if (!from) {
        return result;
    }

    OutgoingList out;
    registry_.with_session(*id, [&](Session& s) {
        Participant* p = s.find_participant(creator);
        if (!p) {
            return;
        }
        attach(s, *p, from, out);

        SignalMessage ack;
        ack.type = SignalType::StartSession;
        ack.session_id = s.id;
        ack.sender_id = core::kServerSenderId;
        ack.payload = describe(s);
        out.insert(out.begin(), Outgoing{from, core::encode_message(ack)});
    });
    flush(out);

    return result;
}

RelayResult SignalingRelay::handle_start(const SignalMessage& msg,
                                         const std::shared_ptr<SignalPeer>& from) {
    const auto& payload = msg.start();

    if (msg.session_id.empty()) {
        return start_session(msg.sender_id, payload.participants,
                             payload.kind.value_or(core::SessionKind::PeerCall),
                             payload.metadata, from);
    }

    // 加入或恢复已有会话
    RelayResult result;
    result.session_id = msg.session_id;
    bool resumed = false;
    OutgoingList out;

    bool found = registry_.with_session(msg.session_id, [&](Session& s) {
        if (s.state == SessionState::Ended) {
            result.code = ErrorCode::SessionClosed;
            result.message = "session has ended";
            return;
        }

        Participant* p = s.find_participant(msg.sender_id);
        resumed = p != nullptr;
        if (!p) {
            if (s.participants.size() >= SessionRegistry::kMaxParticipants) {
                result.code = ErrorCode::SessionFull;
                result.message = "session already has " +
                                 std::to_string(SessionRegistry::kMaxParticipants) + " participants";
                return;
            }
            Participant joined;
            joined.id = msg.sender_id;
            s.participants.push_back(std::move(joined));
            p = &s.participants.back();
        }

        if (!from) {
            return;
        }

        auto outcome = attach(s, *p, from, out);

        SignalMessage ack;
        ack.type = SignalType::StartSession;
        ack.session_id = s.id;
        ack.sender_id = core::kServerSenderId;
        ack.payload = describe(s);
        out.insert(out.begin(), Outgoing{from, core::encode_message(ack)});

        if (outcome.changed) {
            notify_state(s, out);
        }
    });

    if (!found) {
        result.code = ErrorCode::SessionNotFound;
        result.message = "unknown session " + msg.session_id;
    }

    flush(out);

    if (!result.ok()) {
        LOG_WARN("[Relay] start-session from " << msg.sender_id << " rejected: "
                 << core::to_string(result.code));
        reply_error(from, msg.session_id, result.code, result.message);
    } else {
        LOG_INFO("[Relay] Participant " << msg.sender_id
                 << (resumed ? " resumed " : " joined ") << "session " << msg.session_id);
    }
    return result;
}

RelayResult SignalingRelay::handle_end(const SignalMessage& msg,
                                       const std::shared_ptr<SignalPeer>& from,
                                       SteadyClock::time_point now) {
    RelayResult result;
    result.session_id = msg.session_id;

    std::string reason = msg.end().reason.empty() ? "ended_by_participant" : msg.end().reason;
    std::optional<core::SessionSummary> summary;
    OutgoingList out;

    bool found = registry_.with_session(msg.session_id, [&](Session& s) {
        if (!s.has_participant(msg.sender_id)) {
            result.code = ErrorCode::NotParticipant;
            result.message = "sender is not a participant of this session";
            return;
        }
        if (s.state != SessionState::Ended) {
            end_locked(s, reason, now, out);
        }
        summary = summarize(s);
    });

    if (!found) {
        return reply_error(from, msg.session_id, ErrorCode::SessionNotFound,
                           "unknown session " + msg.session_id);
    }
    if (!result.ok()) {
        return reply_error(from, msg.session_id, result.code, result.message);
    }

    bool requester_notified = std::any_of(out.begin(), out.end(),
        [&](const Outgoing& o) { return from && o.peer == from; });
    flush(out);

    // 重复结束或请求方不是绑定连接时单独回复
    if (from && !requester_notified) {
        SignalMessage reply;
        reply.type = SignalType::EndSession;
        reply.session_id = msg.session_id;
        reply.sender_id = core::kServerSenderId;
        reply.payload = core::EndSessionPayload{summary->end_reason, summary};
        from->send(core::encode_message(reply));
    }

    return result;
}

std::optional<core::SessionSummary> SignalingRelay::end_session(const std::string& session_id,
                                                                const std::string& reason,
                                                                SteadyClock::time_point now) {
    std::optional<core::SessionSummary> summary;
    OutgoingList out;

    registry_.with_session(session_id, [&](Session& s) {
        if (s.state != SessionState::Ended) {
            end_locked(s, reason, now, out);
        }
        summary = summarize(s);
    });

    flush(out);
    return summary;
}

void SignalingRelay::on_disconnect(const std::string& session_id,
                                   const std::string& participant_id,
                                   const std::string& connection_id,
                                   SteadyClock::time_point now) {
    OutgoingList out;

    registry_.with_session(session_id, [&](Session& s) {
        Participant* p = s.find_participant(participant_id);
        if (!p || p->connection_id.empty() || p->connection_id != connection_id) {
            return;
        }

        p->route.reset();
        p->connection_id.clear();

        LOG_INFO("[Relay] Participant " << participant_id << " detached from session "
                 << session_id << " (" << core::to_string(ErrorCode::SocketDropped) << ")");

        auto outcome = SessionStateMachine::on_detach(s, *p, now);
        if (outcome.changed) {
            notify_state(s, out);
        }
    });

    flush(out);
}

size_t SignalingRelay::sweep(SteadyClock::time_point now) {
    size_t ended = 0;

    for (const auto& id : registry_.session_ids()) {
        OutgoingList out;
        registry_.with_session(id, [&](Session& s) {
            if (!SessionStateMachine::grace_expired(s, now, options_.reconnect_grace)) {
                return;
            }
            const char* reason = s.state == SessionState::Reconnecting ||
                                 s.state == SessionState::Connected
                                 ? "reconnect_timeout" : "abandoned";
            LOG_INFO("[Relay] Session " << s.id << " grace window expired (" << reason << ")");
            end_locked(s, reason, now, out);
            ++ended;
        });
        flush(out);
    }

    size_t evicted = registry_.evict_ended(now, options_.eviction_grace);
    if (ended > 0 || evicted > 0) {
        LOG_DEBUG("[Relay] Sweep: ended=" << ended << ", evicted=" << evicted);
    }
    return ended;
}

// ==================== 转发 ====================

RelayResult SignalingRelay::handle_offer(const SignalMessage& msg, OutgoingList& out) {
    RelayResult result;
    result.session_id = msg.session_id;

    bool found = registry_.with_session(msg.session_id, [&](Session& s) {
        auto check = SessionStateMachine::check_sender(s, msg.sender_id);
        if (!check.ok()) {
            result.code = check.error;
            result.message = check.message;
            return;
        }

        Participant* peer = s.other_participant(msg.sender_id);
        if (!peer) {
            result.code = ErrorCode::InvalidState;
            result.message = "no other participant has joined";
            return;
        }

        auto outcome = SessionStateMachine::on_offer(s, msg.sender_id);
        if (!outcome.ok()) {
            result.code = outcome.error;
            result.message = outcome.message;
            return;
        }
        if (outcome.changed) {
            notify_state(s, out);
        }

        deliver(*peer, core::encode_message(msg), out);

        // offer 成为应答方的远端描述，之后的 candidate 可以转发
        s.ice_buffer.flush(peer->id, [&](const core::IceCandidate& c) {
            deliver(*peer, encode_candidate(s.id, msg.sender_id, c), out);
        });
    });

    if (!found) {
        result.code = ErrorCode::SessionNotFound;
        result.message = "unknown session " + msg.session_id;
    }
    return result;
}

RelayResult SignalingRelay::handle_answer(const SignalMessage& msg, OutgoingList& out) {
    RelayResult result;
    result.session_id = msg.session_id;

    bool found = registry_.with_session(msg.session_id, [&](Session& s) {
        auto check = SessionStateMachine::check_sender(s, msg.sender_id);
        if (!check.ok()) {
            result.code = check.error;
            result.message = check.message;
            return;
        }

        auto outcome = SessionStateMachine::on_answer(s, msg.sender_id);
        if (!outcome.ok()) {
            result.code = outcome.error;
            result.message = outcome.message;
            return;
        }
        if (outcome.changed) {
            notify_state(s, out);
        }

        Participant* initiator = s.find_participant(s.initiator_id);
        if (!initiator) {
            result.code = ErrorCode::InvalidState;
            result.message = "initiator is no longer part of the session";
            return;
        }

        bool live = deliver(*initiator, core::encode_message(msg), out);

        s.ice_buffer.flush(initiator->id, [&](const core::IceCandidate& c) {
            deliver(*initiator, encode_candidate(s.id, msg.sender_id, c), out);
        });

        if (!live) {
            // 等发起方重新绑定后补发
            s.answer_in_outbox = true;
            return;
        }

        auto delivered = SessionStateMachine::on_answer_delivered(s);
        if (delivered.changed) {
            notify_state(s, out);
        }
    });

    if (!found) {
        result.code = ErrorCode::SessionNotFound;
        result.message = "unknown session " + msg.session_id;
    }
    return result;
}

RelayResult SignalingRelay::handle_candidate(const SignalMessage& msg, OutgoingList& out) {
    RelayResult result;
    result.session_id = msg.session_id;

    bool found = registry_.with_session(msg.session_id, [&](Session& s) {
        auto check = SessionStateMachine::check_sender(s, msg.sender_id);
        if (!check.ok()) {
            result.code = check.error;
            result.message = check.message;
            return;
        }

        Participant* peer = s.other_participant(msg.sender_id);
        if (!peer) {
            result.code = ErrorCode::InvalidState;
            result.message = "no other participant has joined";
            return;
        }

        s.ice_buffer.enqueue(peer->id, msg.candidate(), [&](const core::IceCandidate& c) {
            deliver(*peer, encode_candidate(s.id, msg.sender_id, c), out);
        });
    });

    if (!found) {
        result.code = ErrorCode::SessionNotFound;
        result.message = "unknown session " + msg.session_id;
    }
    return result;
}

// ==================== 内部 ====================

bool SignalingRelay::deliver(Participant& participant, const std::string& text, OutgoingList& out) {
    if (auto peer = participant.route.lock()) {
        out.push_back(Outgoing{peer, text});
        return true;
    }

    participant.outbox.push_back(text);
    while (participant.outbox.size() > options_.outbox_capacity) {
        participant.outbox.pop_front();
        ++participant.outbox_dropped;
        LOG_WARN("[Relay] Outbox of " << participant.id << " full, dropped oldest message");
    }
    return false;
}

void SignalingRelay::notify_state(Session& session, OutgoingList& out) {
    std::string text = core::encode_message(core::make_state_message(session.id, session.state));
    for (auto& p : session.participants) {
        if (auto peer = p.route.lock()) {
            out.push_back(Outgoing{peer, text});
        }
    }
}

SessionStateMachine::Outcome SignalingRelay::attach(Session& session,
                                                    Participant& participant,
                                                    const std::shared_ptr<SignalPeer>& peer,
                                                    OutgoingList& out) {
    participant.route = peer;
    participant.connection_id = peer->connection_id();

    // 按入队顺序补发
    bool drained = !participant.outbox.empty();
    while (!participant.outbox.empty()) {
        out.push_back(Outgoing{peer, std::move(participant.outbox.front())});
        participant.outbox.pop_front();
    }

    auto outcome = SessionStateMachine::on_attach(session, participant);

    if (drained && session.answer_in_outbox && participant.id == session.initiator_id) {
        auto delivered = SessionStateMachine::on_answer_delivered(session);
        outcome.changed = outcome.changed || delivered.changed;
    }
    return outcome;
}

void SignalingRelay::end_locked(Session& session, const std::string& reason,
                                SteadyClock::time_point now, OutgoingList& out) {
    // 先取消遥测请求、释放缓冲与路由，最后标记 Ended
    if (end_hook_) {
        end_hook_(session);
    }

    session.ice_buffer.clear();

    std::vector<std::shared_ptr<SignalPeer>> routes;
    for (auto& p : session.participants) {
        if (auto peer = p.route.lock()) {
            routes.push_back(peer);
        }
        p.route.reset();
        p.connection_id.clear();
        p.outbox.clear();
    }

    SessionStateMachine::end(session, reason, now);

    auto summary = summarize(session);
    LOG_INFO("[Relay] Session " << session.id << " ended (" << reason << "), duration="
             << summary.duration_ms << "ms, frames=" << summary.frames_submitted);

    SignalMessage end_msg;
    end_msg.type = SignalType::EndSession;
    end_msg.session_id = session.id;
    end_msg.sender_id = core::kServerSenderId;
    end_msg.payload = core::EndSessionPayload{reason, summary};

    std::string state_text = core::encode_message(core::make_state_message(session.id, session.state));
    std::string end_text = core::encode_message(end_msg);
    for (const auto& peer : routes) {
        out.push_back(Outgoing{peer, state_text});
        out.push_back(Outgoing{peer, end_text});
    }
}

core::StartSessionPayload SignalingRelay::describe(const Session& session) const {
    core::StartSessionPayload payload;
    payload.participants = session.participant_ids();
    payload.kind = session.kind;
    payload.metadata = session.metadata;
    payload.state = session.state;
    payload.ice_servers = options_.ice_servers;
    return payload;
}

core::SessionSummary SignalingRelay::summarize(const Session& session) {
    core::SessionSummary summary;
    summary.session_id = session.id;
    summary.kind = session.kind;
    summary.participants = session.participant_ids();

    auto end = session.ended_at.value_or(std::chrono::system_clock::now());
    summary.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        end - session.created_at).count();

    summary.frames_submitted = session.telemetry.frames_submitted;
    summary.frames_analyzed = session.telemetry.frames_analyzed;
    summary.frames_throttled = session.telemetry.frames_throttled;
    summary.best_score = session.telemetry.best_score;
    summary.end_reason = session.end_reason;
    return summary;
}

void SignalingRelay::flush(OutgoingList& out) {
    for (auto& o : out) {
        o.peer->send(o.text);
    }
    out.clear();
}

RelayResult SignalingRelay::reply_error(const std::shared_ptr<SignalPeer>& to,
                                        const std::string& session_id,
                                        ErrorCode code,
                                        const std::string& message) {
    if (to) {
        to->send(core::encode_message(core::make_error_message(session_id, code, message)));
    }

    RelayResult result;
    result.code = code;
    result.message = message;
    result.session_id = session_id;
    return result;
}

} // namespace telelink::server
