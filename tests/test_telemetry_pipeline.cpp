/**
 * @file test_telemetry_pipeline.cpp
 * @brief 遥测管线测试
 */

#include "session_server/signaling_relay.hpp"
#include "session_server/telemetry_pipeline.hpp"

#include <boost/asio/io_context.hpp>
#include <gtest/gtest.h>

#include <chrono>
#include <utility>
#include <vector>

using namespace telelink;
using namespace telelink::server;
using core::ErrorCode;
using core::SessionKind;
using std::chrono::milliseconds;

namespace {

/// 同步返回结果，或挂起回调由测试手动完成
class FakeAnalyzer : public AnalysisClient {
public:
    void analyze(const core::PoseFrame& frame, Callback done) override {
        ++calls;
        if (hold) {
            pending.emplace_back(frame, std::move(done));
            return;
        }
        done(success(score));
    }

    static AnalysisOutcome success(double s) {
        AnalysisOutcome outcome;
        outcome.score = s;
        outcome.feedback = "Keep your back straight";
        return outcome;
    }

    void complete(size_t index, const AnalysisOutcome& outcome) {
        pending.at(index).second(outcome);
    }

    bool hold = false;
    double score = 80.0;
    int calls = 0;
    std::vector<std::pair<core::PoseFrame, Callback>> pending;
};

class FakeSink : public ResultSink {
public:
    void store(const core::AnalysisResult& result) override {
        stored.push_back(result);
    }

    std::vector<core::AnalysisResult> stored;
};

core::PoseFrame make_frame(const std::string& session_id, uint64_t sequence) {
    core::PoseFrame frame;
    frame.session_id = session_id;
    frame.sequence_number = sequence;
    frame.captured_at_ms = 1700000000000 + static_cast<int64_t>(sequence) * 33;
    frame.exercise = "squat";
    core::Keypoint k;
    k.name = "left_knee";
    k.x = 0.4;
    k.y = 0.7;
    k.confidence = 0.9;
    frame.keypoints.push_back(k);
    return frame;
}

class TelemetryPipelineTest : public ::testing::Test {
protected:
    TelemetryPipelineTest()
        : pipeline_(registry_, analyzer_, io_.get_executor(), TelemetryPipeline::Options{})
        , t0_(SteadyClock::now())
    {
        pipeline_.set_result_sink(&sink_);
        session_id_ = *registry_.create(SessionKind::AiCall, {"patient"}, {});
    }

    core::SessionSummary summary() {
        core::SessionSummary s;
        registry_.with_session(session_id_, [&](Session& session) {
            s.frames_submitted = session.telemetry.frames_submitted;
            s.frames_analyzed = session.telemetry.frames_analyzed;
            s.frames_throttled = session.telemetry.frames_throttled;
            s.best_score = session.telemetry.best_score;
        });
        return s;
    }

    boost::asio::io_context io_;
    SessionRegistry registry_;
    FakeAnalyzer analyzer_;
    FakeSink sink_;
    TelemetryPipeline pipeline_;
    SteadyClock::time_point t0_;
    std::string session_id_;
};

} // namespace

TEST_F(TelemetryPipelineTest, ThrottlesWithinMinimumInterval) {
    auto r5 = pipeline_.submit_frame(make_frame(session_id_, 5), t0_);
    EXPECT_EQ(r5.status, SubmitStatus::Accepted);

    auto r6 = pipeline_.submit_frame(make_frame(session_id_, 6), t0_ + milliseconds(80));
    EXPECT_EQ(r6.status, SubmitStatus::Throttled);
    EXPECT_EQ(r6.message, kThrottledFeedback);

    auto r7 = pipeline_.submit_frame(make_frame(session_id_, 7), t0_ + milliseconds(600));
    EXPECT_EQ(r7.status, SubmitStatus::Accepted);

    EXPECT_EQ(analyzer_.calls, 2);
    auto s = summary();
    EXPECT_EQ(s.frames_submitted, 3u);
    EXPECT_EQ(s.frames_throttled, 1u);
    EXPECT_EQ(s.frames_analyzed, 2u);
}

TEST_F(TelemetryPipelineTest, AtMostOneAcceptedPerInterval) {
    int accepted = 0;
    for (uint64_t i = 0; i < 40; ++i) {
        auto r = pipeline_.submit_frame(make_frame(session_id_, i + 1), t0_ + milliseconds(50 * i));
        if (r.accepted()) {
            ++accepted;
        } else {
            EXPECT_EQ(r.status, SubmitStatus::Throttled);
        }
    }
    // 2 秒内每 500ms 一次
    EXPECT_EQ(accepted, 4);
}

TEST_F(TelemetryPipelineTest, SingleFlightDropsFramesWhileInFlight) {
    analyzer_.hold = true;

    EXPECT_TRUE(pipeline_.submit_frame(make_frame(session_id_, 1), t0_).accepted());
    auto busy = pipeline_.submit_frame(make_frame(session_id_, 2), t0_ + milliseconds(700));
    EXPECT_EQ(busy.status, SubmitStatus::Throttled);
    EXPECT_EQ(analyzer_.calls, 1);

    analyzer_.complete(0, FakeAnalyzer::success(72.0));
    auto last = pipeline_.last_result(session_id_);
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->frame_sequence_number, 1u);

    EXPECT_TRUE(pipeline_.submit_frame(make_frame(session_id_, 3), t0_ + milliseconds(1400)).accepted());
    EXPECT_EQ(analyzer_.calls, 2);
}

TEST_F(TelemetryPipelineTest, RejectsStaleAndDuplicateFrames) {
    EXPECT_TRUE(pipeline_.submit_frame(make_frame(session_id_, 5), t0_).accepted());

    auto dup = pipeline_.submit_frame(make_frame(session_id_, 5), t0_ + milliseconds(600));
    EXPECT_EQ(dup.status, SubmitStatus::Rejected);
    EXPECT_EQ(dup.reason, ErrorCode::StaleFrame);

    auto old = pipeline_.submit_frame(make_frame(session_id_, 4), t0_ + milliseconds(700));
    EXPECT_EQ(old.reason, ErrorCode::StaleFrame);
}

TEST_F(TelemetryPipelineTest, ThrottledFrameStillAdvancesSequence) {
    pipeline_.submit_frame(make_frame(session_id_, 1), t0_);
    pipeline_.submit_frame(make_frame(session_id_, 2), t0_ + milliseconds(100));

    auto r = pipeline_.submit_frame(make_frame(session_id_, 2), t0_ + milliseconds(700));
    EXPECT_EQ(r.reason, ErrorCode::StaleFrame);
}

TEST_F(TelemetryPipelineTest, RejectsIneligibleSessions) {
    auto unknown = pipeline_.submit_frame(make_frame("missing", 1), t0_);
    EXPECT_EQ(unknown.status, SubmitStatus::Rejected);
    EXPECT_EQ(unknown.reason, ErrorCode::SessionClosed);

    // 视频通话未建连前不可推流
    auto peer_call = *registry_.create(SessionKind::PeerCall, {"doctor", "patient"}, {});
    auto not_connected = pipeline_.submit_frame(make_frame(peer_call, 1), t0_);
    EXPECT_EQ(not_connected.reason, ErrorCode::SessionClosed);
    EXPECT_EQ(analyzer_.calls, 0);
}

TEST_F(TelemetryPipelineTest, FansOutToSubscribersAndSink) {
    std::vector<core::AnalysisResult> first;
    std::vector<core::AnalysisResult> second;
    auto sub1 = pipeline_.subscribe(session_id_, [&](const core::AnalysisResult& r) { first.push_back(r); });
    auto sub2 = pipeline_.subscribe(session_id_, [&](const core::AnalysisResult& r) { second.push_back(r); });
    ASSERT_NE(sub1, 0u);
    ASSERT_NE(sub2, 0u);

    pipeline_.submit_frame(make_frame(session_id_, 1), t0_);
    ASSERT_EQ(first.size(), 1u);
    ASSERT_EQ(second.size(), 1u);
    EXPECT_DOUBLE_EQ(first[0].score, 80.0);
    EXPECT_EQ(first[0].session_id, session_id_);
    ASSERT_EQ(sink_.stored.size(), 1u);

    pipeline_.unsubscribe(sub1);
    pipeline_.submit_frame(make_frame(session_id_, 2), t0_ + milliseconds(600));
    EXPECT_EQ(first.size(), 1u);
    EXPECT_EQ(second.size(), 2u);
    EXPECT_EQ(sink_.stored.size(), 2u);

    EXPECT_EQ(pipeline_.subscribe("missing", [](const core::AnalysisResult&) {}), 0u);
}

TEST_F(TelemetryPipelineTest, FailureKeepsPreviousResult) {
    analyzer_.hold = true;
    pipeline_.submit_frame(make_frame(session_id_, 1), t0_);
    analyzer_.complete(0, FakeAnalyzer::success(65.0));

    pipeline_.submit_frame(make_frame(session_id_, 2), t0_ + milliseconds(600));
    AnalysisOutcome failure;
    failure.error = ErrorCode::AnalysisFailure;
    failure.message = "HTTP 503";
    analyzer_.complete(1, failure);

    auto last = pipeline_.last_result(session_id_);
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->frame_sequence_number, 1u);
    EXPECT_EQ(sink_.stored.size(), 1u);

    // 失败后槽位已释放
    EXPECT_TRUE(pipeline_.submit_frame(make_frame(session_id_, 3), t0_ + milliseconds(1200)).accepted());
}

TEST(TelemetryPipelineTimeout, TimeoutReleasesSlotAndDiscardsLateResult) {
    boost::asio::io_context io;
    SessionRegistry registry;
    FakeAnalyzer analyzer;
    analyzer.hold = true;

    TelemetryPipeline::Options options;
    options.analysis_timeout = milliseconds(5);
    TelemetryPipeline pipeline(registry, analyzer, io.get_executor(), options);

    auto id = *registry.create(SessionKind::AiCall, {"patient"}, {});
    int delivered = 0;
    pipeline.subscribe(id, [&](const core::AnalysisResult&) { ++delivered; });

    auto t0 = SteadyClock::now();
    ASSERT_TRUE(pipeline.submit_frame(make_frame(id, 1), t0).accepted());

    // 超时定时器触发后 run() 返回
    io.run();

    analyzer.complete(0, FakeAnalyzer::success(99.0));
    EXPECT_EQ(delivered, 0);
    EXPECT_FALSE(pipeline.last_result(id).has_value());

    EXPECT_TRUE(pipeline.submit_frame(make_frame(id, 2), t0 + milliseconds(600)).accepted());
}

TEST_F(TelemetryPipelineTest, CloseSessionCancelsInFlight) {
    analyzer_.hold = true;
    int delivered = 0;
    pipeline_.subscribe(session_id_, [&](const core::AnalysisResult&) { ++delivered; });

    pipeline_.submit_frame(make_frame(session_id_, 1), t0_);
    pipeline_.close_session(session_id_);

    analyzer_.complete(0, FakeAnalyzer::success(90.0));
    EXPECT_EQ(delivered, 0);
    EXPECT_TRUE(sink_.stored.empty());
}

TEST_F(TelemetryPipelineTest, EndingSessionThroughRelayStopsStreaming) {
    SignalingRelay relay(registry_, SignalingRelay::Options{});
    relay.set_session_end_hook([this](Session& s) { pipeline_.close_locked(s); });

    analyzer_.hold = true;
    pipeline_.submit_frame(make_frame(session_id_, 1), t0_);
    analyzer_.complete(0, FakeAnalyzer::success(60.0));
    pipeline_.submit_frame(make_frame(session_id_, 2), t0_ + milliseconds(600));
    analyzer_.complete(1, FakeAnalyzer::success(91.0));
    pipeline_.submit_frame(make_frame(session_id_, 3), t0_ + milliseconds(1200));

    auto summary = relay.end_session(session_id_, "completed", t0_ + milliseconds(1300));
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary->frames_submitted, 3u);
    EXPECT_EQ(summary->frames_analyzed, 2u);
    ASSERT_TRUE(summary->best_score.has_value());
    EXPECT_DOUBLE_EQ(*summary->best_score, 91.0);
    EXPECT_EQ(summary->end_reason, "completed");

    // 结束后到达的结果被丢弃
    analyzer_.complete(2, FakeAnalyzer::success(99.0));
    EXPECT_EQ(sink_.stored.size(), 2u);

    auto late = pipeline_.submit_frame(make_frame(session_id_, 4), t0_ + milliseconds(2000));
    EXPECT_EQ(late.status, SubmitStatus::Rejected);
    EXPECT_EQ(late.reason, ErrorCode::SessionClosed);
}
