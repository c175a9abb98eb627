/**
 * @file analysis_client.hpp
 * @brief 动作分析服务客户端
 */

#pragma once

#include "session_core/types.hpp"

#include <boost/asio/thread_pool.hpp>

#include <functional>
#include <string>

namespace telelink::server {

/**
 * @brief 分析调用结果
 */
struct AnalysisOutcome {
    core::ErrorCode error = core::ErrorCode::None;
    double score = 0.0;
    std::string feedback;
    std::string message;

    bool ok() const { return error == core::ErrorCode::None; }
};

/**
 * @brief 分析服务接口
 *
 * analyze() 立即返回，完成回调可能在任意线程执行（也可能在 analyze 内同步执行）
 */
class AnalysisClient {
public:
    using Callback = std::function<void(const AnalysisOutcome&)>;

    virtual ~AnalysisClient() = default;

    virtual void analyze(const core::PoseFrame& frame, Callback done) = 0;
};

/**
 * @brief HTTP 分析客户端：POST {analysis_url}，在线程池中执行
 */
class HttpAnalysisClient : public AnalysisClient {
public:
    HttpAnalysisClient(boost::asio::thread_pool& pool,
                       std::string url,
                       std::string service_token,
                       long timeout_ms);

    void analyze(const core::PoseFrame& frame, Callback done) override;

    /**
     * @brief 构造请求体
     */
    static std::string build_request(const core::PoseFrame& frame);

    /**
     * @brief 解析响应体 {score, feedback}
     */
    static AnalysisOutcome parse_response(const std::string& body);

private:
    AnalysisOutcome perform(const core::PoseFrame& frame) const;

    boost::asio::thread_pool& pool_;
    std::string url_;
    std::string service_token_;
    long timeout_ms_;
};

} // namespace telelink::server
