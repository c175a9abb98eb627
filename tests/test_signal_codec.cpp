/**
 * @file test_signal_codec.cpp
 * @brief 信令编解码测试
 */

#include "session_core/signal_codec.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace telelink::core;
using json = nlohmann::json;

TEST(SignalCodec, DecodesOffer) {
    auto msg = decode_message(R"({"type":"offer","sessionId":"s1","senderId":"alice","payload":{"sdp":"v=0"}})");

    EXPECT_EQ(msg.type, SignalType::Offer);
    EXPECT_EQ(msg.session_id, "s1");
    EXPECT_EQ(msg.sender_id, "alice");
    EXPECT_EQ(msg.sdp().sdp, "v=0");
}

TEST(SignalCodec, DecodesStartSessionWithoutPayload) {
    auto msg = decode_message(R"({"type":"start-session","senderId":"alice"})");

    EXPECT_EQ(msg.type, SignalType::StartSession);
    EXPECT_TRUE(msg.session_id.empty());
    EXPECT_TRUE(msg.start().participants.empty());
    EXPECT_FALSE(msg.start().kind.has_value());
}

TEST(SignalCodec, DecodesStartSessionPayload) {
    auto msg = decode_message(R"({
        "type": "start-session",
        "senderId": "doctor",
        "payload": {
            "participants": ["patient"],
            "kind": "ai-call",
            "metadata": {"appointment": "42", "priority": 3}
        }
    })");

    const auto& p = msg.start();
    ASSERT_EQ(p.participants.size(), 1u);
    EXPECT_EQ(p.participants[0], "patient");
    ASSERT_TRUE(p.kind.has_value());
    EXPECT_EQ(*p.kind, SessionKind::AiCall);
    EXPECT_EQ(p.metadata.at("appointment"), "42");
    EXPECT_EQ(p.metadata.at("priority"), "3");
}

TEST(SignalCodec, DecodesIceCandidate) {
    auto msg = decode_message(R"({"type":"ice-candidate","sessionId":"s1","senderId":"bob",
        "payload":{"candidate":"candidate:1 1 UDP 2122 10.0.0.2 5000 typ host","sdpMid":"0","sdpMLineIndex":0}})");

    const auto& c = msg.candidate();
    EXPECT_EQ(c.sdp_mid, "0");
    EXPECT_EQ(c.sdp_mline_index, 0);
    EXPECT_NE(c.candidate.find("typ host"), std::string::npos);
}

TEST(SignalCodec, EndSessionAcceptsNullPayload) {
    auto msg = decode_message(R"({"type":"end-session","sessionId":"s1","senderId":"bob","payload":null})");

    EXPECT_EQ(msg.type, SignalType::EndSession);
    EXPECT_TRUE(msg.end().reason.empty());
    EXPECT_FALSE(msg.end().summary.has_value());
}

TEST(SignalCodec, EncodesErrorWithCodeName) {
    auto text = encode_message(make_error_message("s1", ErrorCode::SessionFull, "full"));
    auto j = json::parse(text);

    EXPECT_EQ(j["type"], "error");
    EXPECT_EQ(j["senderId"], kServerSenderId);
    EXPECT_EQ(j["payload"]["code"], "SessionFull");
    EXPECT_EQ(j["payload"]["message"], "full");
}

TEST(SignalCodec, EncodesSessionState) {
    auto j = json::parse(encode_message(make_state_message("s1", SessionState::Reconnecting)));

    EXPECT_EQ(j["type"], "session-state");
    EXPECT_EQ(j["sessionId"], "s1");
    EXPECT_EQ(j["payload"]["state"], "reconnecting");
}

TEST(SignalCodec, SummarySurvivesEncoding) {
    SessionSummary summary;
    summary.session_id = "s1";
    summary.kind = SessionKind::AiCall;
    summary.participants = {"patient"};
    summary.duration_ms = 1500;
    summary.frames_submitted = 10;
    summary.frames_analyzed = 4;
    summary.frames_throttled = 6;
    summary.best_score = 87.5;
    summary.end_reason = "ended_by_participant";

    SignalMessage msg;
    msg.type = SignalType::EndSession;
    msg.session_id = "s1";
    msg.sender_id = kServerSenderId;
    msg.payload = EndSessionPayload{"ended_by_participant", summary};

    auto decoded = decode_message(encode_message(msg));
    ASSERT_TRUE(decoded.end().summary.has_value());
    const auto& s = *decoded.end().summary;
    EXPECT_EQ(s.kind, SessionKind::AiCall);
    EXPECT_EQ(s.frames_throttled, 6u);
    ASSERT_TRUE(s.best_score.has_value());
    EXPECT_DOUBLE_EQ(*s.best_score, 87.5);
}

// ==================== 非法输入 ====================

TEST(SignalCodec, RejectsInvalidJson) {
    EXPECT_THROW(decode_message("{not json"), MalformedMessage);
}

TEST(SignalCodec, RejectsNonObject) {
    EXPECT_THROW(decode_message("[1,2,3]"), MalformedMessage);
}

TEST(SignalCodec, RejectsUnknownType) {
    EXPECT_THROW(decode_message(R"({"type":"hangup","sessionId":"s1","senderId":"a"})"), MalformedMessage);
}

TEST(SignalCodec, RejectsMissingSender) {
    EXPECT_THROW(decode_message(R"({"type":"offer","sessionId":"s1","payload":{"sdp":"v=0"}})"), MalformedMessage);
    EXPECT_THROW(decode_message(R"({"type":"offer","sessionId":"s1","senderId":"","payload":{"sdp":"v=0"}})"), MalformedMessage);
}

TEST(SignalCodec, RejectsMissingSessionId) {
    EXPECT_THROW(decode_message(R"({"type":"answer","senderId":"b","payload":{"sdp":"v=0"}})"), MalformedMessage);
}

TEST(SignalCodec, RejectsWrongPayloadShape) {
    EXPECT_THROW(decode_message(R"({"type":"offer","sessionId":"s1","senderId":"a","payload":"v=0"})"), MalformedMessage);
    EXPECT_THROW(decode_message(R"({"type":"offer","sessionId":"s1","senderId":"a","payload":{"sdp":""}})"), MalformedMessage);
    EXPECT_THROW(decode_message(R"({"type":"ice-candidate","sessionId":"s1","senderId":"a","payload":{"sdpMid":"0"}})"), MalformedMessage);
    EXPECT_THROW(decode_message(R"({"type":"start-session","senderId":"a","payload":{"participants":"bob"}})"), MalformedMessage);
    EXPECT_THROW(decode_message(R"({"type":"start-session","senderId":"a","payload":{"kind":"group-call"}})"), MalformedMessage);
    EXPECT_THROW(decode_message(R"({"type":"error","senderId":"a","payload":{"code":"Oops"}})"), MalformedMessage);
}

TEST(SignalCodec, RejectsOutOfRangeMLineIndex) {
    auto candidate = [](const std::string& index) {
        return R"({"type":"ice-candidate","sessionId":"s1","senderId":"a","payload":{"candidate":"candidate:1","sdpMLineIndex":)" +
               index + "}}";
    };

    EXPECT_THROW(decode_message(candidate("-1")), MalformedMessage);
    EXPECT_THROW(decode_message(candidate("2147483648")), MalformedMessage);
    EXPECT_THROW(decode_message(candidate("18446744073709551615")), MalformedMessage);
    EXPECT_THROW(decode_message(candidate("1.5")), MalformedMessage);

    auto msg = decode_message(candidate("2147483647"));
    EXPECT_EQ(msg.candidate().sdp_mline_index, 2147483647);
    EXPECT_EQ(decode_message(candidate("3")).candidate().sdp_mline_index, 3);
}
