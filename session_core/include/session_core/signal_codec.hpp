/**
 * @file signal_codec.hpp
 * @brief 信令消息编解码
 *
 * 线上格式为 JSON 对象:
 *   { "type": ..., "sessionId": ..., "senderId": ..., "payload": {...} }
 * payload 的结构由 type 决定，解码时严格校验
 */

#pragma once

#include "session_core/types.hpp"

#include <stdexcept>
#include <string>

namespace telelink::core {

/**
 * @brief 消息格式错误
 */
class MalformedMessage : public std::runtime_error {
public:
    explicit MalformedMessage(const std::string& what)
        : std::runtime_error(what) {}
};

/**
 * @brief 编码信令消息
 * @param msg 消息（payload 必须与 type 匹配）
 * @return JSON 文本
 */
std::string encode_message(const SignalMessage& msg);

/**
 * @brief 解码信令消息
 * @param text JSON 文本
 * @return 解码后的消息
 * @throws MalformedMessage type 未知、缺少必要字段或 payload 结构不匹配
 */
SignalMessage decode_message(const std::string& text);

} // namespace telelink::core
