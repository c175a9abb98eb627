/**
 * @file telemetry_pipeline.cpp
 * @brief 姿态帧遥测管线实现
 */

#include "session_server/telemetry_pipeline.hpp"
#include "session_server/session_state_machine.hpp"
#include "session_core/logger.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

#include <memory>
#include <vector>

namespace telelink::server {

namespace net = boost::asio;

const char* to_string(SubmitStatus status) {
    switch (status) {
        case SubmitStatus::Accepted:  return "accepted";
        case SubmitStatus::Throttled: return "throttled";
        case SubmitStatus::Rejected:  return "rejected";
    }
    return "unknown";
}

TelemetryPipeline::TelemetryPipeline(SessionRegistry& registry,
                                     AnalysisClient& analyzer,
                                     net::any_io_executor timer_executor,
                                     Options options)
    : registry_(registry)
    , analyzer_(analyzer)
    , timer_executor_(std::move(timer_executor))
    , options_(options)
{
}

SubmitResult TelemetryPipeline::submit_frame(const core::PoseFrame& frame,
                                             SteadyClock::time_point now) {
    SubmitResult result;
    result.status = SubmitStatus::Rejected;
    result.reason = core::ErrorCode::SessionClosed;
    result.message = "unknown session";

    bool dispatch = false;
    uint64_t generation = 0;

    registry_.with_session(frame.session_id, [&](Session& s) {
        if (!SessionStateMachine::is_streaming_eligible(s)) {
            result.message = std::string("session not streaming (") + core::to_string(s.state) + ")";
            return;
        }

        auto& t = s.telemetry;

        if (t.last_sequence && frame.sequence_number <= *t.last_sequence) {
            result.reason = core::ErrorCode::StaleFrame;
            result.message = "sequence " + std::to_string(frame.sequence_number) +
                             " not after " + std::to_string(*t.last_sequence);
            return;
        }

        ++t.frames_submitted;
        t.last_sequence = frame.sequence_number;

        if (t.in_flight ||
            (t.last_accepted_at && now - *t.last_accepted_at < options_.min_interval)) {
            ++t.frames_throttled;
            result.status = SubmitStatus::Throttled;
            result.reason = core::ErrorCode::None;
            result.message = kThrottledFeedback;
            return;
        }

        t.in_flight = true;
        t.in_flight_sequence = frame.sequence_number;
        t.last_accepted_at = now;
        generation = ++t.generation;

        // 超时释放槽位；定时器在锁内启动，保证取消发生在 async_wait 之后
        auto timer = std::make_shared<net::steady_timer>(timer_executor_, options_.analysis_timeout);
        std::string session_id = s.id;
        uint64_t sequence = frame.sequence_number;
        timer->async_wait([this, timer, session_id, sequence, generation](const boost::system::error_code& ec) {
            if (ec) {
                return;
            }
            on_analysis_timeout(session_id, sequence, generation);
        });
        t.cancel_in_flight = [timer, executor = timer_executor_]() {
            net::post(executor, [timer]() { timer->cancel(); });
        };

        dispatch = true;
        result.status = SubmitStatus::Accepted;
        result.reason = core::ErrorCode::None;
        result.message.clear();
    });

    if (dispatch) {
        std::string session_id = frame.session_id;
        uint64_t sequence = frame.sequence_number;
        analyzer_.analyze(frame, [this, session_id, sequence, generation](const AnalysisOutcome& outcome) {
            on_analysis_complete(session_id, sequence, generation, outcome);
        });
    }

    return result;
}

void TelemetryPipeline::on_analysis_complete(const std::string& session_id,
                                             uint64_t sequence,
                                             uint64_t generation,
                                             const AnalysisOutcome& outcome) {
    std::optional<core::AnalysisResult> result;
    std::vector<ResultCallback> subscribers;

    registry_.with_session(session_id, [&](Session& s) {
        auto& t = s.telemetry;

        // 超时、取消或已被新请求取代
        if (!t.in_flight || t.generation != generation || t.in_flight_sequence != sequence) {
            LOG_DEBUG("[Telemetry] Discarding late result for " << session_id << "#" << sequence);
            return;
        }

        t.in_flight = false;
        if (t.cancel_in_flight) {
            t.cancel_in_flight();
            t.cancel_in_flight = nullptr;
        }

        if (s.state == core::SessionState::Ended) {
            return;
        }

        if (!outcome.ok()) {
            ++t.analysis_failures;
            LOG_WARN("[Telemetry] Analysis " << core::to_string(outcome.error) << " for "
                     << session_id << "#" << sequence << ": " << outcome.message);
            return;
        }

        core::AnalysisResult r;
        r.session_id = session_id;
        r.frame_sequence_number = sequence;
        r.score = outcome.score;
        r.feedback = outcome.feedback;
        r.computed_at_ms = core::now_unix_ms();

        ++t.frames_analyzed;
        if (!t.best_score || r.score > *t.best_score) {
            t.best_score = r.score;
        }
        t.last_result = r;
        result = r;

        subscribers.reserve(t.subscribers.size());
        for (const auto& [id, callback] : t.subscribers) {
            subscribers.push_back(callback);
        }
    });

    if (!result) {
        return;
    }

    for (const auto& callback : subscribers) {
        callback(*result);
    }

    if (sink_) {
        sink_->store(*result);
    }
}

void TelemetryPipeline::on_analysis_timeout(const std::string& session_id,
                                            uint64_t sequence,
                                            uint64_t generation) {
    registry_.with_session(session_id, [&](Session& s) {
        auto& t = s.telemetry;
        if (!t.in_flight || t.generation != generation) {
            return;
        }

        t.in_flight = false;
        t.cancel_in_flight = nullptr;
        ++t.analysis_failures;

        LOG_WARN("[Telemetry] " << core::to_string(core::ErrorCode::AnalysisTimeout) << " for "
                 << session_id << "#" << sequence << ", keeping previous result");
    });
}

uint64_t TelemetryPipeline::subscribe(const std::string& session_id, ResultCallback callback) {
    uint64_t id = 0;

    registry_.with_session(session_id, [&](Session& s) {
        if (s.state == core::SessionState::Ended) {
            return;
        }
        id = next_subscription_.fetch_add(1);
        s.telemetry.subscribers.emplace(id, std::move(callback));

        std::lock_guard<std::mutex> lock(subscriptions_mutex_);
        subscription_sessions_.emplace(id, session_id);
    });

    return id;
}

void TelemetryPipeline::unsubscribe(uint64_t subscription_id) {
    std::string session_id;
    {
        std::lock_guard<std::mutex> lock(subscriptions_mutex_);
        auto it = subscription_sessions_.find(subscription_id);
        if (it == subscription_sessions_.end()) {
            return;
        }
        session_id = it->second;
        subscription_sessions_.erase(it);
    }

    registry_.with_session(session_id, [&](Session& s) {
        s.telemetry.subscribers.erase(subscription_id);
    });
}

void TelemetryPipeline::close_session(const std::string& session_id) {
    registry_.with_session(session_id, [&](Session& s) {
        close_locked(s);
    });
}

void TelemetryPipeline::close_locked(Session& session) {
    auto& t = session.telemetry;

    if (t.in_flight) {
        LOG_DEBUG("[Telemetry] Cancelling in-flight analysis for " << session.id
                  << "#" << t.in_flight_sequence);
    }

    t.in_flight = false;
    ++t.generation;
    if (t.cancel_in_flight) {
        t.cancel_in_flight();
        t.cancel_in_flight = nullptr;
    }

    forget_subscriptions(session);
    t.subscribers.clear();
}

void TelemetryPipeline::forget_subscriptions(const Session& session) {
    std::lock_guard<std::mutex> lock(subscriptions_mutex_);
    for (const auto& [id, callback] : session.telemetry.subscribers) {
        subscription_sessions_.erase(id);
    }
}

std::optional<core::AnalysisResult> TelemetryPipeline::last_result(const std::string& session_id) {
    std::optional<core::AnalysisResult> result;
    registry_.with_session(session_id, [&](Session& s) {
        result = s.telemetry.last_result;
    });
    return result;
}

} // namespace telelink::server
