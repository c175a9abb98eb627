/**
 * @file signal_codec.cpp
 * @brief 信令消息编解码实现
 */

#include "session_core/signal_codec.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>

using json = nlohmann::json;

namespace telelink::core {

namespace {

[[noreturn]] void fail(const std::string& what) {
    throw MalformedMessage(what);
}

const json& require_object(const json& payload, SignalType type) {
    if (!payload.is_object()) {
        fail(std::string("payload of '") + to_string(type) + "' must be an object");
    }
    return payload;
}

std::string optional_string(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return "";
    }
    if (!it->is_string()) {
        fail(std::string("'") + key + "' must be a string");
    }
    return it->get<std::string>();
}

std::string required_string(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) {
        fail(std::string("missing string field '") + key + "'");
    }
    auto value = it->get<std::string>();
    if (value.empty()) {
        fail(std::string("field '") + key + "' must not be empty");
    }
    return value;
}

// ==================== SessionSummary ====================

json summary_to_json(const SessionSummary& s) {
    json j;
    j["sessionId"] = s.session_id;
    j["kind"] = to_string(s.kind);
    j["participants"] = s.participants;
    j["durationMs"] = s.duration_ms;
    j["framesSubmitted"] = s.frames_submitted;
    j["framesAnalyzed"] = s.frames_analyzed;
    j["framesThrottled"] = s.frames_throttled;
    if (s.best_score) {
        j["bestScore"] = *s.best_score;
    }
    j["endReason"] = s.end_reason;
    return j;
}

SessionSummary summary_from_json(const json& j) {
    if (!j.is_object()) {
        fail("'summary' must be an object");
    }
    SessionSummary s;
    try {
        s.session_id = j.value("sessionId", "");
        s.kind = parse_session_kind(j.value("kind", "peer-call")).value_or(SessionKind::PeerCall);
        s.participants = j.value("participants", std::vector<std::string>{});
        s.duration_ms = j.value("durationMs", int64_t{0});
        s.frames_submitted = j.value("framesSubmitted", uint64_t{0});
        s.frames_analyzed = j.value("framesAnalyzed", uint64_t{0});
        s.frames_throttled = j.value("framesThrottled", uint64_t{0});
        if (j.contains("bestScore") && j["bestScore"].is_number()) {
            s.best_score = j["bestScore"].get<double>();
        }
        s.end_reason = j.value("endReason", "");
    } catch (const json::type_error& e) {
        fail(std::string("invalid summary: ") + e.what());
    }
    return s;
}

// ==================== payload 编码 ====================

json encode_payload(const SignalMessage& msg) {
    switch (msg.type) {
        case SignalType::StartSession: {
            const auto& p = msg.start();
            json j = json::object();
            if (!p.participants.empty()) {
                j["participants"] = p.participants;
            }
            if (p.kind) {
                j["kind"] = to_string(*p.kind);
            }
            if (!p.metadata.empty()) {
                j["metadata"] = p.metadata;
            }
            if (p.state) {
                j["state"] = to_string(*p.state);
            }
            if (!p.ice_servers.empty()) {
                json servers = json::array();
                for (const auto& server : p.ice_servers) {
                    json s;
                    s["urls"] = server.urls;
                    if (!server.username.empty()) s["username"] = server.username;
                    if (!server.credential.empty()) s["credential"] = server.credential;
                    servers.push_back(s);
                }
                j["iceServers"] = servers;
            }
            return j;
        }
        case SignalType::Offer:
        case SignalType::Answer:
            return json{{"sdp", msg.sdp().sdp}};
        case SignalType::IceCandidate: {
            const auto& c = msg.candidate();
            json j;
            j["candidate"] = c.candidate;
            if (!c.sdp_mid.empty()) j["sdpMid"] = c.sdp_mid;
            if (c.sdp_mline_index >= 0) j["sdpMLineIndex"] = c.sdp_mline_index;
            return j;
        }
        case SignalType::EndSession: {
            if (!std::holds_alternative<EndSessionPayload>(msg.payload)) {
                return nullptr;
            }
            const auto& p = msg.end();
            json j = json::object();
            if (!p.reason.empty()) j["reason"] = p.reason;
            if (p.summary) j["summary"] = summary_to_json(*p.summary);
            return j;
        }
        case SignalType::Error:
            return json{{"code", to_string(msg.error().code)},
                        {"message", msg.error().message}};
        case SignalType::SessionState:
            return json{{"state", to_string(msg.state().state)}};
        case SignalType::Auth:
            return json{{"token", msg.auth().token}};
    }
    return nullptr;
}

// ==================== payload 解码 ====================

StartSessionPayload decode_start(const json& payload) {
    StartSessionPayload p;
    if (payload.is_null()) {
        return p;
    }
    require_object(payload, SignalType::StartSession);

    if (auto it = payload.find("participants"); it != payload.end() && !it->is_null()) {
        if (!it->is_array()) {
            fail("'participants' must be an array");
        }
        for (const auto& item : *it) {
            if (!item.is_string() || item.get<std::string>().empty()) {
                fail("'participants' entries must be non-empty strings");
            }
            p.participants.push_back(item.get<std::string>());
        }
    }

    auto kind = optional_string(payload, "kind");
    if (!kind.empty()) {
        p.kind = parse_session_kind(kind);
        if (!p.kind) {
            fail("unknown session kind '" + kind + "'");
        }
    }

    if (auto it = payload.find("metadata"); it != payload.end() && !it->is_null()) {
        if (!it->is_object()) {
            fail("'metadata' must be an object");
        }
        for (const auto& [key, value] : it->items()) {
            if (value.is_string()) {
                p.metadata[key] = value.get<std::string>();
            } else if (value.is_primitive() && !value.is_null()) {
                p.metadata[key] = value.dump();
            } else {
                fail("'metadata." + key + "' must be a scalar");
            }
        }
    }

    auto state = optional_string(payload, "state");
    if (!state.empty()) {
        p.state = parse_session_state(state);
        if (!p.state) {
            fail("unknown session state '" + state + "'");
        }
    }

    if (auto it = payload.find("iceServers"); it != payload.end() && !it->is_null()) {
        if (!it->is_array()) {
            fail("'iceServers' must be an array");
        }
        for (const auto& item : *it) {
            if (!item.is_object()) {
                fail("'iceServers' entries must be objects");
            }
            IceServer server;
            server.urls = required_string(item, "urls");
            server.username = optional_string(item, "username");
            server.credential = optional_string(item, "credential");
            p.ice_servers.push_back(server);
        }
    }
    return p;
}

IceCandidate decode_candidate(const json& payload) {
    require_object(payload, SignalType::IceCandidate);

    auto it = payload.find("candidate");
    if (it == payload.end() || !it->is_string()) {
        fail("missing string field 'candidate'");
    }

    IceCandidate c;
    c.candidate = it->get<std::string>();
    c.sdp_mid = optional_string(payload, "sdpMid");
    if (auto idx = payload.find("sdpMLineIndex"); idx != payload.end() && !idx->is_null()) {
        if (!idx->is_number_integer()) {
            fail("'sdpMLineIndex' must be an integer");
        }
        // 无符号与有符号整数分开取值，避免窄化
        bool in_range = idx->is_number_unsigned()
            ? idx->get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int>::max())
            : idx->get<int64_t>() >= 0 && idx->get<int64_t>() <= std::numeric_limits<int>::max();
        if (!in_range) {
            fail("'sdpMLineIndex' out of range");
        }
        c.sdp_mline_index = static_cast<int>(idx->get<int64_t>());
    }
    return c;
}

EndSessionPayload decode_end(const json& payload) {
    EndSessionPayload p;
    if (payload.is_null()) {
        return p;
    }
    require_object(payload, SignalType::EndSession);
    p.reason = optional_string(payload, "reason");
    if (auto it = payload.find("summary"); it != payload.end() && !it->is_null()) {
        p.summary = summary_from_json(*it);
    }
    return p;
}

ErrorPayload decode_error(const json& payload) {
    require_object(payload, SignalType::Error);
    auto name = required_string(payload, "code");
    auto code = parse_error_code(name);
    if (!code) {
        fail("unknown error code '" + name + "'");
    }
    return ErrorPayload{*code, optional_string(payload, "message")};
}

SessionStatePayload decode_state(const json& payload) {
    require_object(payload, SignalType::SessionState);
    auto name = required_string(payload, "state");
    auto state = parse_session_state(name);
    if (!state) {
        fail("unknown session state '" + name + "'");
    }
    return SessionStatePayload{*state};
}

bool requires_session_id(SignalType type) {
    switch (type) {
        case SignalType::StartSession:
        case SignalType::Auth:
        case SignalType::Error:
            return false;
        default:
            return true;
    }
}

} // anonymous namespace

std::string encode_message(const SignalMessage& msg) {
    json j;
    j["type"] = to_string(msg.type);
    j["sessionId"] = msg.session_id;
    j["senderId"] = msg.sender_id;
    j["payload"] = encode_payload(msg);
    return j.dump();
}

SignalMessage decode_message(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        fail(std::string("invalid JSON: ") + e.what());
    }

    if (!j.is_object()) {
        fail("message must be a JSON object");
    }

    auto type_name = optional_string(j, "type");
    auto type = parse_signal_type(type_name);
    if (!type) {
        fail(type_name.empty() ? "missing 'type' field"
                               : "unknown message type '" + type_name + "'");
    }

    SignalMessage msg;
    msg.type = *type;
    msg.sender_id = required_string(j, "senderId");
    msg.session_id = optional_string(j, "sessionId");
    if (requires_session_id(msg.type) && msg.session_id.empty()) {
        fail(std::string("'") + type_name + "' requires a sessionId");
    }

    static const json null_payload = nullptr;
    auto it = j.find("payload");
    const json& payload = (it == j.end()) ? null_payload : *it;

    switch (msg.type) {
        case SignalType::StartSession:
            msg.payload = decode_start(payload);
            break;
        case SignalType::Offer:
        case SignalType::Answer:
            require_object(payload, msg.type);
            msg.payload = SdpPayload{required_string(payload, "sdp")};
            break;
        case SignalType::IceCandidate:
            msg.payload = decode_candidate(payload);
            break;
        case SignalType::EndSession:
            msg.payload = decode_end(payload);
            break;
        case SignalType::Error:
            msg.payload = decode_error(payload);
            break;
        case SignalType::SessionState:
            msg.payload = decode_state(payload);
            break;
        case SignalType::Auth:
            require_object(payload, msg.type);
            msg.payload = AuthPayload{required_string(payload, "token")};
            break;
    }
    return msg;
}

} // namespace telelink::core
