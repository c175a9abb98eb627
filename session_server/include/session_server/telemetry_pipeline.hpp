/**
 * @file telemetry_pipeline.hpp
 * @brief 姿态帧遥测管线
 *
 * 每个会话同一时刻最多一个分析请求（单飞），
 * 请求进行中或距上次接受不足 min_interval 的帧直接丢弃（节流），
 * 结果扇出给所有订阅者并交给持久化（尽力而为）。
 */

#pragma once

#include "session_server/analysis_client.hpp"
#include "session_server/result_sink.hpp"
#include "session_server/session_registry.hpp"
#include "session_core/types.hpp"

#include <boost/asio/any_io_executor.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace telelink::server {

/// 节流时客户端继续显示上一次结果
inline constexpr const char* kThrottledFeedback = "Processing previous movement...";

enum class SubmitStatus {
    Accepted,
    Throttled,
    Rejected
};

const char* to_string(SubmitStatus status);

struct SubmitResult {
    SubmitStatus status = SubmitStatus::Rejected;
    core::ErrorCode reason = core::ErrorCode::None;
    std::string message;

    bool accepted() const { return status == SubmitStatus::Accepted; }
};

class TelemetryPipeline {
public:
    struct Options {
        std::chrono::milliseconds min_interval{500};
        std::chrono::milliseconds analysis_timeout{5000};
    };

    /**
     * @param registry 会话注册表
     * @param analyzer 分析服务
     * @param timer_executor 超时定时器所用执行器
     */
    TelemetryPipeline(SessionRegistry& registry,
                      AnalysisClient& analyzer,
                      boost::asio::any_io_executor timer_executor,
                      Options options);

    TelemetryPipeline(const TelemetryPipeline&) = delete;
    TelemetryPipeline& operator=(const TelemetryPipeline&) = delete;

    void set_result_sink(ResultSink* sink) { sink_ = sink; }

    /**
     * @brief 提交一帧（立即返回）
     */
    SubmitResult submit_frame(const core::PoseFrame& frame,
                              SteadyClock::time_point now = SteadyClock::now());

    /**
     * @brief 订阅会话的分析结果
     * @return 订阅 ID；会话不存在或已结束时返回 0
     */
    uint64_t subscribe(const std::string& session_id, ResultCallback callback);

    void unsubscribe(uint64_t subscription_id);

    /**
     * @brief 取消进行中的请求、释放单飞槽位并移除订阅者
     */
    void close_session(const std::string& session_id);

    /**
     * @brief 同 close_session，调用方已持有会话锁（会话结束钩子）
     */
    void close_locked(Session& session);

    std::optional<core::AnalysisResult> last_result(const std::string& session_id);

private:
    void on_analysis_complete(const std::string& session_id,
                              uint64_t sequence,
                              uint64_t generation,
                              const AnalysisOutcome& outcome);

    void on_analysis_timeout(const std::string& session_id,
                             uint64_t sequence,
                             uint64_t generation);

    void forget_subscriptions(const Session& session);

    SessionRegistry& registry_;
    AnalysisClient& analyzer_;
    boost::asio::any_io_executor timer_executor_;
    Options options_;
    ResultSink* sink_ = nullptr;

    std::atomic<uint64_t> next_subscription_{1};
    std::unordered_map<uint64_t, std::string> subscription_sessions_;
    std::mutex subscriptions_mutex_;
};

} // namespace telelink::server
