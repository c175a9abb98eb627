/**
 * @file analysis_client.cpp
 * @brief 动作分析服务客户端实现
 */

#include "session_server/analysis_client.hpp"
#include "session_server/http_client.hpp"
#include "session_core/logger.hpp"

#include <boost/asio/post.hpp>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace telelink::server {

HttpAnalysisClient::HttpAnalysisClient(boost::asio::thread_pool& pool,
                                       std::string url,
                                       std::string service_token,
                                       long timeout_ms)
    : pool_(pool)
    , url_(std::move(url))
    , service_token_(std::move(service_token))
    , timeout_ms_(timeout_ms)
{
}

void HttpAnalysisClient::analyze(const core::PoseFrame& frame, Callback done) {
    boost::asio::post(pool_, [this, frame, done = std::move(done)]() {
        done(perform(frame));
    });
}

AnalysisOutcome HttpAnalysisClient::perform(const core::PoseFrame& frame) const {
    auto response = http_post_json(url_, build_request(frame), service_token_, timeout_ms_);

    if (!response.ok) {
        AnalysisOutcome outcome;
        outcome.error = response.timed_out
                        ? core::ErrorCode::AnalysisTimeout
                        : core::ErrorCode::AnalysisFailure;
        outcome.message = response.error;
        LOG_WARN("[Analysis] Request for " << frame.session_id << "#" << frame.sequence_number
                 << " failed: " << response.error);
        return outcome;
    }

    return parse_response(response.body);
}

std::string HttpAnalysisClient::build_request(const core::PoseFrame& frame) {
    json keypoints = json::array();
    for (const auto& kp : frame.keypoints) {
        keypoints.push_back({
            {"name", kp.name},
            {"x", kp.x},
            {"y", kp.y},
            {"z", kp.z},
            {"confidence", kp.confidence}
        });
    }

    json body = {
        {"session_id", frame.session_id},
        {"sequence_number", frame.sequence_number},
        {"captured_at", frame.captured_at_ms},
        {"exercise", frame.exercise},
        {"pose_data", keypoints}
    };
    return body.dump();
}

AnalysisOutcome HttpAnalysisClient::parse_response(const std::string& body) {
    AnalysisOutcome outcome;
    try {
        auto j = json::parse(body);
        if (!j.is_object() || !j.contains("score") || !j["score"].is_number()) {
            outcome.error = core::ErrorCode::AnalysisFailure;
            outcome.message = "response has no numeric score";
            return outcome;
        }
        outcome.score = j["score"].get<double>();
        if (j.contains("feedback") && j["feedback"].is_string()) {
            outcome.feedback = j["feedback"].get<std::string>();
        }
    } catch (const json::exception& e) {
        outcome.error = core::ErrorCode::AnalysisFailure;
        outcome.message = std::string("invalid response: ") + e.what();
    }
    return outcome;
}

} // namespace telelink::server
