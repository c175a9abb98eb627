/**
 * @file config.hpp
 * @brief 会话服务配置
 */

#pragma once

#include "session_core/types.hpp"

#include <string>
#include <vector>
#include <cstdint>

namespace telelink::server {

/**
 * @brief 服务器配置
 */
struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t signaling_port = 8890;     // JSON 信令
    uint16_t telemetry_port = 8891;     // Protobuf 遥测
    size_t max_connections = 200;
    size_t max_message_bytes = 1024 * 1024;
    int threads = 0;                    // 0 表示使用硬件并发数
};

/**
 * @brief 认证配置
 */
struct AuthConfig {
    std::string jwt_secret;
    bool require_auth = false;          // 开发模式可关闭
    int auth_timeout_sec = 10;
};

/**
 * @brief WebRTC 配置（下发给客户端）
 */
struct WebRTCConfig {
    std::vector<core::IceServer> ice_servers;
};

/**
 * @brief 会话生命周期配置
 */
struct SessionConfig {
    int reconnect_grace_ms = 30000;     // 断线重连宽限期
    int eviction_grace_ms = 60000;      // 结束后保留时长
    int sweep_interval_ms = 1000;
    size_t outbox_capacity = 256;       // 对端离线时暂存的信令条数
    size_t ice_buffer_capacity = 64;
};

/**
 * @brief 遥测配置
 */
struct TelemetryConfig {
    int min_interval_ms = 500;          // 两次分析请求的最小间隔
    int analysis_timeout_ms = 5000;
    int analysis_threads = 4;
    std::string analysis_url = "http://127.0.0.1:8000/motion/analyze";
    std::string persistence_url;        // 为空时不持久化
    std::string service_token;          // 调用外部服务时的 Bearer Token
};

/**
 * @brief 日志配置
 */
struct LoggingConfig {
    std::string level = "INFO";
};

/**
 * @brief 总配置
 */
class Config {
public:
    Config();

    /**
     * @brief 从文件加载配置
     * @param path 配置文件路径
     * @return 是否成功
     */
    bool load_from_file(const std::string& path);

    /**
     * @brief 从环境变量覆盖配置（非法数值记录警告后忽略）
     */
    void load_from_env();

    // 配置项
    ServerConfig server;
    AuthConfig auth;
    WebRTCConfig webrtc;
    SessionConfig session;
    TelemetryConfig telemetry;
    LoggingConfig logging;

    /**
     * @brief 展开 ${VAR} 形式的环境变量引用
     *
     * 未设置的变量展开为空串；其余 $ 字符原样保留，替换结果不再展开
     */
    static std::string expand_env(const std::string& value);
};

} // namespace telelink::server
