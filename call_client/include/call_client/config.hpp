/**
 * @file config.hpp
 * @brief 通话端配置
 */

#pragma once

#include "call_client/reconnect_policy.hpp"
#include "session_core/types.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace telelink::client {

struct SignalingConfig {
    std::string host = "127.0.0.1";
    std::string port = "8890";
    std::string path = "/";
    std::string token;                  // 服务端要求认证时发送
    std::chrono::milliseconds idle_timeout{20000};  // 无数据超过该时长视为断线，期间自动发送 ping
};

struct ParticipantConfig {
    std::string id;                     // 本端参与者 ID（必填）
    std::string peer_id;                // 创建会话时邀请的对端
    std::string session_id;             // 非空时加入已有会话
    std::string kind = "peer-call";
};

struct WebRtcConfig {
    std::vector<core::IceServer> ice_servers;   // 服务端下发的列表优先
};

struct LoggingConfig {
    std::string level = "INFO";
};

struct Config {
    SignalingConfig signaling;
    ParticipantConfig participant;
    BackoffConfig reconnect;
    WebRtcConfig webrtc;
    LoggingConfig logging;
};

/**
 * @brief 从 YAML 文件加载配置
 * @throws YAML::Exception 文件不存在或格式错误
 */
Config load_config(const std::string& path);

/**
 * @brief 环境变量覆盖（TELELINK_SIGNALING_HOST 等）
 */
void apply_env_overrides(Config& config);

/**
 * @brief 检查启动所需字段
 * @return 错误描述，配置可用时为空
 */
std::string validate_config(const Config& config);

} // namespace telelink::client
