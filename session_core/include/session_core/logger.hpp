/**
 * @file logger.hpp
 * @brief 简单的日志宏定义
 *
 * 提供带时间戳和级别过滤的日志输出，确保在 systemd 环境下能正确显示
 */

#pragma once

#include <atomic>
#include <iostream>
#include <iomanip>
#include <chrono>
#include <ctime>
#include <sstream>
#include <string>

namespace telelink::core {

/**
 * @brief 日志级别
 */
enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3
};

inline std::atomic<int>& log_level_storage() {
    static std::atomic<int> level{static_cast<int>(LogLevel::Info)};
    return level;
}

/**
 * @brief 设置最低输出级别
 */
inline void set_log_level(LogLevel level) {
    log_level_storage() = static_cast<int>(level);
}

inline bool log_enabled(LogLevel level) {
    return static_cast<int>(level) >= log_level_storage().load();
}

/**
 * @brief 解析配置中的级别名称（DEBUG/INFO/WARN/ERROR），未知名称按 INFO 处理
 */
inline LogLevel parse_log_level(const std::string& name) {
    if (name == "DEBUG" || name == "debug") return LogLevel::Debug;
    if (name == "WARN" || name == "warn" || name == "WARNING") return LogLevel::Warn;
    if (name == "ERROR" || name == "error") return LogLevel::Error;
    return LogLevel::Info;
}

/**
 * @brief 获取当前时间戳字符串
 * @return 格式: YYYY-MM-DD HH:MM:SS.mmm
 */
inline std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&now_c, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

} // namespace telelink::core

// 日志宏定义（自动刷新缓冲区，避免 systemd 日志丢失）
#define LOG_DEBUG(msg) \
    do { \
        if (telelink::core::log_enabled(telelink::core::LogLevel::Debug)) { \
            std::cout << "[" << telelink::core::get_timestamp() << "] [DEBUG] " \
                      << msg << std::endl; \
        } \
    } while(0)

#define LOG_INFO(msg) \
    do { \
        if (telelink::core::log_enabled(telelink::core::LogLevel::Info)) { \
            std::cout << "[" << telelink::core::get_timestamp() << "] [INFO] " \
                      << msg << std::endl; \
        } \
    } while(0)

#define LOG_WARN(msg) \
    do { \
        if (telelink::core::log_enabled(telelink::core::LogLevel::Warn)) { \
            std::cout << "[" << telelink::core::get_timestamp() << "] [WARN] " \
                      << msg << std::endl; \
        } \
    } while(0)

#define LOG_ERROR(msg) \
    do { \
        if (telelink::core::log_enabled(telelink::core::LogLevel::Error)) { \
            std::cerr << "[" << telelink::core::get_timestamp() << "] [ERROR] " \
                      << msg << std::endl; \
        } \
    } while(0)
