/**
 * @file auth.hpp
 * @brief 参与者令牌校验
 *
 * 令牌由外部认证服务签发（HS256，共享密钥），此处只做校验。
 * 令牌的 sub 即参与者 ID，连接通过校验后只能以该 ID 发言
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace telelink::server {

/**
 * @brief 令牌中的参与者角色
 */
enum class ParticipantRole {
    Patient,
    Therapist,
    Service,
    Unknown
};

ParticipantRole parse_role(const std::string& role);

/**
 * @brief 已认证的参与者
 */
struct Principal {
    std::string participant_id;
    ParticipantRole role = ParticipantRole::Unknown;
    std::chrono::system_clock::time_point expires_at = std::chrono::system_clock::time_point::max();
};

/**
 * @brief HS256 令牌校验器
 */
class JwtVerifier {
public:
    /**
     * @param secret 与认证服务共享的密钥，为空时拒绝所有令牌
     * @param leeway exp/nbf 允许的时钟偏差
     */
    explicit JwtVerifier(std::string secret,
                         std::chrono::seconds leeway = std::chrono::seconds(30));

    /**
     * @brief 校验令牌
     * @return 参与者身份（签名、算法或有效期不符时返回 nullopt）
     */
    std::optional<Principal> verify(const std::string& token) const;

private:
    bool signature_matches(const std::string& signing_input, const std::string& signature) const;

    std::string secret_;
    std::chrono::seconds leeway_;
};

} // namespace telelink::server
