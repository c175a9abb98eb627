/**
 * @file auth.cpp
 * @brief 参与者令牌校验实现
 */

#include "session_server/auth.hpp"
#include "session_core/logger.hpp"

#include <nlohmann/json.hpp>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace telelink::server {

using json = nlohmann::json;
using Clock = std::chrono::system_clock;

namespace {

// base64url（无填充）解码，非法输入返回 nullopt
std::optional<std::string> decode_segment(const std::string& segment) {
    std::string padded = segment;
    for (auto& c : padded) {
        if (c == '-') c = '+';
        else if (c == '_') c = '/';
        else if (c == '+' || c == '/' || c == '=') return std::nullopt;
    }
    size_t pad = (4 - padded.size() % 4) % 4;
    if (pad == 3) {
        return std::nullopt;
    }
    padded.append(pad, '=');

    std::string out(padded.size() / 4 * 3, '\0');
    int len = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                              reinterpret_cast<const unsigned char*>(padded.data()),
                              static_cast<int>(padded.size()));
    if (len < 0) {
        return std::nullopt;
    }
    // EVP_DecodeBlock 把填充也算进长度
    out.resize(static_cast<size_t>(len) - pad);
    return out;
}

Clock::time_point from_unix(int64_t seconds) {
    return Clock::time_point(std::chrono::seconds(seconds));
}

} // namespace

ParticipantRole parse_role(const std::string& role) {
    if (role == "patient") return ParticipantRole::Patient;
    if (role == "therapist") return ParticipantRole::Therapist;
    if (role == "service") return ParticipantRole::Service;
    return ParticipantRole::Unknown;
}

JwtVerifier::JwtVerifier(std::string secret, std::chrono::seconds leeway)
    : secret_(std::move(secret))
    , leeway_(leeway)
{
}

std::optional<Principal> JwtVerifier::verify(const std::string& token) const {
    if (secret_.empty()) {
        return std::nullopt;
    }

    auto first = token.find('.');
    auto second = first == std::string::npos ? first : token.find('.', first + 1);
    if (second == std::string::npos || token.find('.', second + 1) != std::string::npos) {
        return std::nullopt;
    }

    const std::string signing_input = token.substr(0, second);
    auto header_raw = decode_segment(token.substr(0, first));
    auto payload_raw = decode_segment(token.substr(first + 1, second - first - 1));
    if (!header_raw || !payload_raw) {
        return std::nullopt;
    }

    try {
        auto header = json::parse(*header_raw);
        if (header.value("alg", "") != "HS256") {
            LOG_DEBUG("[Auth] Unsupported token algorithm");
            return std::nullopt;
        }

        if (!signature_matches(signing_input, token.substr(second + 1))) {
            LOG_DEBUG("[Auth] Token signature mismatch");
            return std::nullopt;
        }

        auto payload = json::parse(*payload_raw);

        Principal principal;
        principal.participant_id = payload.value("sub", "");
        principal.role = parse_role(payload.value("role", ""));
        if (principal.participant_id.empty()) {
            return std::nullopt;
        }

        auto now = Clock::now();
        if (payload.contains("exp")) {
            principal.expires_at = from_unix(payload.at("exp").get<int64_t>());
            if (now >= principal.expires_at + leeway_) {
                LOG_DEBUG("[Auth] Token for " << principal.participant_id << " expired");
                return std::nullopt;
            }
        }
        if (payload.contains("nbf") && now + leeway_ < from_unix(payload.at("nbf").get<int64_t>())) {
            LOG_DEBUG("[Auth] Token for " << principal.participant_id << " not yet valid");
            return std::nullopt;
        }

        return principal;

    } catch (const json::exception& e) {
        LOG_WARN("[Auth] Token parse error: " << e.what());
        return std::nullopt;
    }
}

bool JwtVerifier::signature_matches(const std::string& signing_input, const std::string& signature) const {
    auto expected = decode_segment(signature);
    if (!expected || expected->empty()) {
        return false;
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (!HMAC(EVP_sha256(), secret_.data(), static_cast<int>(secret_.size()),
              reinterpret_cast<const unsigned char*>(signing_input.data()), signing_input.size(),
              digest, &digest_len)) {
        return false;
    }

    return expected->size() == digest_len &&
           CRYPTO_memcmp(expected->data(), digest, digest_len) == 0;
}

} // namespace telelink::server
