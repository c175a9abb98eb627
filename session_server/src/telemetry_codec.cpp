/**
 * @file telemetry_codec.cpp
 * @brief 遥测 protobuf 消息与内部类型互转
 */

#include "session_server/telemetry_codec.hpp"

namespace telelink::server {

core::PoseFrame from_proto(const telemetry::PoseFrame& frame) {
    core::PoseFrame out;
    out.session_id = frame.session_id();
    out.sequence_number = frame.sequence_number();
    out.captured_at_ms = frame.captured_at_ms();
    out.exercise = frame.exercise();

    out.keypoints.reserve(frame.keypoints_size());
    for (const auto& kp : frame.keypoints()) {
        core::Keypoint k;
        k.name = kp.name();
        k.x = kp.x();
        k.y = kp.y();
        k.z = kp.z();
        k.confidence = kp.confidence();
        out.keypoints.push_back(std::move(k));
    }
    return out;
}

void to_proto(const core::AnalysisResult& result, telemetry::AnalysisResult* out) {
    out->set_session_id(result.session_id);
    out->set_frame_sequence_number(result.frame_sequence_number);
    out->set_score(result.score);
    out->set_feedback(result.feedback);
    out->set_computed_at_ms(result.computed_at_ms);
}

telemetry::TelemetryMessage make_submit_ack(const std::string& session_id,
                                            uint64_t sequence_number,
                                            const SubmitResult& result) {
    telemetry::TelemetryMessage msg;
    msg.set_type(telemetry::MSG_SUBMIT_ACK);
    msg.set_timestamp_ms(core::now_unix_ms());

    auto* ack = msg.mutable_submit_ack();
    ack->set_session_id(session_id);
    ack->set_sequence_number(sequence_number);

    switch (result.status) {
        case SubmitStatus::Accepted:
            ack->set_status(telemetry::SUBMIT_ACCEPTED);
            break;
        case SubmitStatus::Throttled:
            ack->set_status(telemetry::SUBMIT_THROTTLED);
            ack->set_feedback(kThrottledFeedback);
            break;
        case SubmitStatus::Rejected:
            ack->set_status(telemetry::SUBMIT_REJECTED);
            ack->set_reason(core::to_string(result.reason));
            ack->set_feedback(result.message);
            break;
    }
    return msg;
}

telemetry::TelemetryMessage make_result_message(const core::AnalysisResult& result) {
    telemetry::TelemetryMessage msg;
    msg.set_type(telemetry::MSG_ANALYSIS_RESULT);
    msg.set_timestamp_ms(core::now_unix_ms());
    to_proto(result, msg.mutable_analysis_result());
    return msg;
}

telemetry::TelemetryMessage make_hello_ack(bool success, const std::string& message) {
    telemetry::TelemetryMessage msg;
    msg.set_type(telemetry::MSG_HELLO_ACK);
    msg.set_timestamp_ms(core::now_unix_ms());
    msg.mutable_hello_ack()->set_success(success);
    msg.mutable_hello_ack()->set_message(message);
    return msg;
}

telemetry::TelemetryMessage make_error(core::ErrorCode code, const std::string& message) {
    telemetry::TelemetryMessage msg;
    msg.set_type(telemetry::MSG_ERROR);
    msg.set_timestamp_ms(core::now_unix_ms());
    msg.mutable_error()->set_code(core::to_string(code));
    msg.mutable_error()->set_message(message);
    return msg;
}

} // namespace telelink::server
