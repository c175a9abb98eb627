/**
 * @file telemetry_codec.hpp
 * @brief 遥测 protobuf 消息与内部类型互转
 */

#pragma once

#include "session_server/telemetry_pipeline.hpp"
#include "session_core/types.hpp"

#include "telemetry.pb.h"

#include <string>

namespace telelink::server {

core::PoseFrame from_proto(const telemetry::PoseFrame& frame);

void to_proto(const core::AnalysisResult& result, telemetry::AnalysisResult* out);

telemetry::TelemetryMessage make_submit_ack(const std::string& session_id,
                                            uint64_t sequence_number,
                                            const SubmitResult& result);

telemetry::TelemetryMessage make_result_message(const core::AnalysisResult& result);

telemetry::TelemetryMessage make_hello_ack(bool success, const std::string& message);

telemetry::TelemetryMessage make_error(core::ErrorCode code, const std::string& message);

} // namespace telelink::server
