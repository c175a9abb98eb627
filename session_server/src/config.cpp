/**
 * @file config.cpp
 * @brief 会话服务配置实现
 */

#include "session_server/config.hpp"
#include "session_core/logger.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace telelink::server {

Config::Config() {
    webrtc.ice_servers.push_back({"stun:stun.l.google.com:19302", "", ""});
    webrtc.ice_servers.push_back({"stun:stun1.l.google.com:19302", "", ""});
}

bool Config::load_from_file(const std::string& path) {
    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            LOG_WARN("Failed to open config file: " << path);
            return false;
        }

        YAML::Node config = YAML::LoadFile(path);

        // Server 配置
        if (config["server"]) {
            auto s = config["server"];
            if (s["host"]) server.host = s["host"].as<std::string>();
            if (s["signaling_port"]) server.signaling_port = s["signaling_port"].as<uint16_t>();
            if (s["telemetry_port"]) server.telemetry_port = s["telemetry_port"].as<uint16_t>();
            if (s["max_connections"]) server.max_connections = s["max_connections"].as<size_t>();
            if (s["max_message_bytes"]) server.max_message_bytes = s["max_message_bytes"].as<size_t>();
            if (s["threads"]) server.threads = s["threads"].as<int>();
        }

        // Auth 配置
        if (config["auth"]) {
            auto a = config["auth"];
            if (a["jwt_secret"]) auth.jwt_secret = expand_env(a["jwt_secret"].as<std::string>());
            if (a["require_auth"]) auth.require_auth = a["require_auth"].as<bool>();
            if (a["auth_timeout_sec"]) auth.auth_timeout_sec = a["auth_timeout_sec"].as<int>();
        }

        // WebRTC 配置
        if (config["webrtc"] && config["webrtc"]["ice_servers"]) {
            webrtc.ice_servers.clear();
            for (const auto& node : config["webrtc"]["ice_servers"]) {
                core::IceServer s;
                s.urls = node["urls"].as<std::string>("");
                s.username = node["username"].as<std::string>("");
                s.credential = expand_env(node["credential"].as<std::string>(""));
                if (!s.urls.empty()) {
                    webrtc.ice_servers.push_back(s);
                }
            }
        }

        // Session 配置
        if (config["session"]) {
            auto s = config["session"];
            if (s["reconnect_grace_ms"]) session.reconnect_grace_ms = s["reconnect_grace_ms"].as<int>();
            if (s["eviction_grace_ms"]) session.eviction_grace_ms = s["eviction_grace_ms"].as<int>();
            if (s["sweep_interval_ms"]) session.sweep_interval_ms = s["sweep_interval_ms"].as<int>();
            if (s["outbox_capacity"]) session.outbox_capacity = s["outbox_capacity"].as<size_t>();
            if (s["ice_buffer_capacity"]) session.ice_buffer_capacity = s["ice_buffer_capacity"].as<size_t>();
        }

        // Telemetry 配置
        if (config["telemetry"]) {
            auto t = config["telemetry"];
            if (t["min_interval_ms"]) telemetry.min_interval_ms = t["min_interval_ms"].as<int>();
            if (t["analysis_timeout_ms"]) telemetry.analysis_timeout_ms = t["analysis_timeout_ms"].as<int>();
            if (t["analysis_threads"]) telemetry.analysis_threads = t["analysis_threads"].as<int>();
            if (t["analysis_url"]) telemetry.analysis_url = t["analysis_url"].as<std::string>();
            if (t["persistence_url"]) telemetry.persistence_url = t["persistence_url"].as<std::string>();
            if (t["service_token"]) telemetry.service_token = expand_env(t["service_token"].as<std::string>());
        }

        // Logging 配置
        if (config["logging"]) {
            auto l = config["logging"];
            if (l["level"]) logging.level = l["level"].as<std::string>();
        }

        LOG_INFO("Loaded config from: " << path);
        LOG_INFO("  - Signaling port: " << server.signaling_port);
        LOG_INFO("  - Telemetry port: " << server.telemetry_port);
        LOG_INFO("  - ICE servers: " << webrtc.ice_servers.size());
        LOG_INFO("  - Auth required: " << (auth.require_auth ? "yes" : "no"));

        return true;

    } catch (const YAML::Exception& e) {
        LOG_ERROR("YAML parse error: " << e.what());
        return false;
    }
}

namespace {

// 数值环境变量，非法值记录警告并保留原配置
template <typename T>
void env_number(const char* name, T& target, long long min_value, long long max_value) {
    const char* val = std::getenv(name);
    if (!val) {
        return;
    }
    try {
        size_t used = 0;
        long long parsed = std::stoll(val, &used);
        if (used != std::strlen(val) || parsed < min_value || parsed > max_value) {
            throw std::out_of_range(name);
        }
        target = static_cast<T>(parsed);
    } catch (const std::logic_error&) {
        LOG_WARN("Ignoring invalid " << name << "=" << val);
    }
}

} // namespace

void Config::load_from_env() {
    // 环境变量覆盖
    if (const char* val = std::getenv("TELELINK_HOST")) {
        server.host = val;
    }

    env_number("TELELINK_SIGNALING_PORT", server.signaling_port, 1, 65535);
    env_number("TELELINK_TELEMETRY_PORT", server.telemetry_port, 1, 65535);

    // JWT 密钥从环境变量获取（安全性更高）
    if (const char* val = std::getenv("JWT_SECRET")) {
        auth.jwt_secret = val;
    }

    if (const char* val = std::getenv("REQUIRE_AUTH")) {
        auth.require_auth = (std::string(val) == "true" || std::string(val) == "1");
    }

    env_number("TELELINK_RECONNECT_GRACE_MS", session.reconnect_grace_ms, 0, std::numeric_limits<int>::max());
    env_number("TELELINK_THROTTLE_INTERVAL_MS", telemetry.min_interval_ms, 0, std::numeric_limits<int>::max());

    if (const char* val = std::getenv("TELELINK_ANALYSIS_URL")) {
        telemetry.analysis_url = val;
    }

    if (const char* val = std::getenv("TELELINK_PERSISTENCE_URL")) {
        telemetry.persistence_url = val;
    }

    if (const char* val = std::getenv("TELELINK_SERVICE_TOKEN")) {
        telemetry.service_token = val;
    }

    if (const char* val = std::getenv("TELELINK_LOG_LEVEL")) {
        logging.level = val;
    }
}

std::string Config::expand_env(const std::string& value) {
    // 只展开 ${VAR}，替换结果不再扫描；其余 $ 原样保留
    std::string result;
    result.reserve(value.size());

    size_t pos = 0;
    while (pos < value.size()) {
        size_t open = value.find("${", pos);
        if (open == std::string::npos) {
            break;
        }
        size_t close = value.find('}', open + 2);
        if (close == std::string::npos) {
            break;
        }

        std::string name = value.substr(open + 2, close - open - 2);
        bool valid = !name.empty() && !std::isdigit(static_cast<unsigned char>(name[0])) &&
                     std::all_of(name.begin(), name.end(), [](char c) {
                         return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
                     });

        result.append(value, pos, open - pos);
        if (valid) {
            if (const char* val = std::getenv(name.c_str())) {
                result += val;
            } else {
                LOG_WARN("Config references unset environment variable " << name);
            }
        } else {
            result.append(value, open, close - open + 1);
        }
        pos = close + 1;
    }

    result.append(value, pos, std::string::npos);
    return result;
}

} // namespace telelink::server
