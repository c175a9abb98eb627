/**
 * @file result_sink.cpp
 * @brief 分析结果持久化实现
 */

#include "session_server/result_sink.hpp"
#include "session_server/http_client.hpp"
#include "session_core/logger.hpp"

#include <boost/asio/post.hpp>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace telelink::server {

HttpResultSink::HttpResultSink(boost::asio::thread_pool& pool,
                               std::string url,
                               std::string service_token,
                               long timeout_ms)
    : pool_(pool)
    , url_(std::move(url))
    , service_token_(std::move(service_token))
    , timeout_ms_(timeout_ms)
{
}

void HttpResultSink::store(const core::AnalysisResult& result) {
    if (url_.empty()) {
        return;
    }

    boost::asio::post(pool_, [this, body = to_json(result), id = result.session_id]() {
        auto response = http_post_json(url_, body, service_token_, timeout_ms_);
        if (!response.ok) {
            LOG_WARN("[ResultSink] Failed to persist result for " << id << ": " << response.error);
        }
    });
}

std::string HttpResultSink::to_json(const core::AnalysisResult& result) {
    json body = {
        {"session_id", result.session_id},
        {"frame_sequence_number", result.frame_sequence_number},
        {"score", result.score},
        {"feedback", result.feedback},
        {"computed_at", result.computed_at_ms}
    };
    return body.dump();
}

} // namespace telelink::server
