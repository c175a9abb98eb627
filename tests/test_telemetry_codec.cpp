/**
 * @file test_telemetry_codec.cpp
 * @brief 遥测 protobuf 转换测试
 */

#include "session_server/telemetry_codec.hpp"

#include <gtest/gtest.h>

using namespace telelink;
using namespace telelink::server;

TEST(TelemetryCodec, ConvertsPoseFrame) {
    telemetry::PoseFrame frame;
    frame.set_session_id("s1");
    frame.set_sequence_number(9);
    frame.set_captured_at_ms(1700000000000);
    frame.set_exercise("squat");
    auto* kp = frame.add_keypoints();
    kp->set_name("nose");
    kp->set_x(0.5);
    kp->set_y(0.25);
    kp->set_confidence(0.99);

    // 经过序列化，与网络收到的一致
    telemetry::PoseFrame parsed;
    ASSERT_TRUE(parsed.ParseFromString(frame.SerializeAsString()));

    auto out = from_proto(parsed);
    EXPECT_EQ(out.session_id, "s1");
    EXPECT_EQ(out.sequence_number, 9u);
    EXPECT_EQ(out.exercise, "squat");
    ASSERT_EQ(out.keypoints.size(), 1u);
    EXPECT_EQ(out.keypoints[0].name, "nose");
    EXPECT_DOUBLE_EQ(out.keypoints[0].y, 0.25);
}

TEST(TelemetryCodec, ThrottledAckCarriesPlaceholderFeedback) {
    SubmitResult result;
    result.status = SubmitStatus::Throttled;

    auto msg = make_submit_ack("s1", 6, result);
    ASSERT_EQ(msg.type(), telemetry::MSG_SUBMIT_ACK);
    ASSERT_TRUE(msg.has_submit_ack());
    EXPECT_EQ(msg.submit_ack().status(), telemetry::SUBMIT_THROTTLED);
    EXPECT_EQ(msg.submit_ack().sequence_number(), 6u);
    EXPECT_EQ(msg.submit_ack().feedback(), kThrottledFeedback);
}

TEST(TelemetryCodec, RejectedAckCarriesReason) {
    SubmitResult result;
    result.status = SubmitStatus::Rejected;
    result.reason = core::ErrorCode::StaleFrame;
    result.message = "sequence 4 not after 5";

    auto msg = make_submit_ack("s1", 4, result);
    EXPECT_EQ(msg.submit_ack().status(), telemetry::SUBMIT_REJECTED);
    EXPECT_EQ(msg.submit_ack().reason(), "StaleFrame");
}

TEST(TelemetryCodec, ResultMessage) {
    core::AnalysisResult result;
    result.session_id = "s1";
    result.frame_sequence_number = 5;
    result.score = 77.0;
    result.feedback = "Lower your hips";

    auto msg = make_result_message(result);
    ASSERT_TRUE(msg.has_analysis_result());
    EXPECT_EQ(msg.analysis_result().frame_sequence_number(), 5u);
    EXPECT_DOUBLE_EQ(msg.analysis_result().score(), 77.0);

    auto err = make_error(core::ErrorCode::SessionClosed, "ended");
    EXPECT_EQ(err.type(), telemetry::MSG_ERROR);
    EXPECT_EQ(err.error().code(), "SessionClosed");
}
