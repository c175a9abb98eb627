/**
 * @file result_sink.hpp
 * @brief 分析结果持久化
 */

#pragma once

#include "session_core/types.hpp"

#include <boost/asio/thread_pool.hpp>

#include <string>

namespace telelink::server {

/**
 * @brief 结果接收方（尽力而为，失败只记录日志）
 */
class ResultSink {
public:
    virtual ~ResultSink() = default;

    virtual void store(const core::AnalysisResult& result) = 0;
};

/**
 * @brief 通过 HTTP POST 持久化结果
 */
class HttpResultSink : public ResultSink {
public:
    HttpResultSink(boost::asio::thread_pool& pool,
                   std::string url,
                   std::string service_token,
                   long timeout_ms = 3000);

    void store(const core::AnalysisResult& result) override;

    static std::string to_json(const core::AnalysisResult& result);

private:
    boost::asio::thread_pool& pool_;
    std::string url_;
    std::string service_token_;
    long timeout_ms_;
};

} // namespace telelink::server
