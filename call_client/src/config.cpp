/**
 * @file config.cpp
 * @brief 通话端配置实现
 */

#include "call_client/config.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdlib>

namespace telelink::client {

Config load_config(const std::string& path) {
    Config cfg;

    YAML::Node root = YAML::LoadFile(path);
    if (root["signaling"]) {
        auto s = root["signaling"];
        cfg.signaling.host = s["host"].as<std::string>(cfg.signaling.host);
        cfg.signaling.port = s["port"].as<std::string>(cfg.signaling.port);
        cfg.signaling.path = s["path"].as<std::string>(cfg.signaling.path);
        cfg.signaling.token = s["token"].as<std::string>(cfg.signaling.token);
        cfg.signaling.idle_timeout = std::chrono::milliseconds(
            s["idle_timeout_ms"].as<int>(static_cast<int>(cfg.signaling.idle_timeout.count())));
    }
    if (root["participant"]) {
        auto p = root["participant"];
        cfg.participant.id = p["id"].as<std::string>(cfg.participant.id);
        cfg.participant.peer_id = p["peer_id"].as<std::string>(cfg.participant.peer_id);
        cfg.participant.session_id = p["session_id"].as<std::string>(cfg.participant.session_id);
        cfg.participant.kind = p["kind"].as<std::string>(cfg.participant.kind);
    }
    if (root["reconnect"]) {
        auto r = root["reconnect"];
        cfg.reconnect.base = std::chrono::milliseconds(
            r["base_ms"].as<int>(static_cast<int>(cfg.reconnect.base.count())));
        cfg.reconnect.factor = r["factor"].as<double>(cfg.reconnect.factor);
        cfg.reconnect.cap = std::chrono::milliseconds(
            r["cap_ms"].as<int>(static_cast<int>(cfg.reconnect.cap.count())));
        cfg.reconnect.jitter = r["jitter"].as<double>(cfg.reconnect.jitter);
        cfg.reconnect.max_attempts = r["max_attempts"].as<int>(cfg.reconnect.max_attempts);
    }
    if (root["webrtc"] && root["webrtc"]["ice_servers"]) {
        for (const auto& node : root["webrtc"]["ice_servers"]) {
            core::IceServer s;
            s.urls = node["urls"].as<std::string>("");
            s.username = node["username"].as<std::string>("");
            s.credential = node["credential"].as<std::string>("");
            if (!s.urls.empty()) {
                cfg.webrtc.ice_servers.push_back(s);
            }
        }
    }
    if (root["logging"]) {
        cfg.logging.level = root["logging"]["level"].as<std::string>(cfg.logging.level);
    }

    return cfg;
}

void apply_env_overrides(Config& config) {
    if (const char* val = std::getenv("TELELINK_SIGNALING_HOST")) {
        config.signaling.host = val;
    }
    if (const char* val = std::getenv("TELELINK_SIGNALING_PORT")) {
        config.signaling.port = val;
    }
    if (const char* val = std::getenv("TELELINK_TOKEN")) {
        config.signaling.token = val;
    }
    if (const char* val = std::getenv("TELELINK_PARTICIPANT_ID")) {
        config.participant.id = val;
    }
    if (const char* val = std::getenv("TELELINK_LOG_LEVEL")) {
        config.logging.level = val;
    }
}

std::string validate_config(const Config& config) {
    if (config.participant.id.empty()) {
        return "participant.id is required";
    }

    auto kind = core::parse_session_kind(config.participant.kind);
    if (!kind) {
        return "participant.kind must be peer-call or ai-call";
    }

    // 创建双方通话时必须指定对端
    if (config.participant.session_id.empty() && *kind == core::SessionKind::PeerCall) {
        if (config.participant.peer_id.empty()) {
            return "participant.peer_id is required to create a peer-call";
        }
        if (config.participant.peer_id == config.participant.id) {
            return "participant.peer_id must differ from participant.id";
        }
    }
    return {};
}

} // namespace telelink::client
