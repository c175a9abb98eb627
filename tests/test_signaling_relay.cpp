/**
 * @file test_signaling_relay.cpp
 * @brief 信令转发测试
 */

#include "session_server/signaling_relay.hpp"
#include "session_core/signal_codec.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>

using namespace telelink;
using namespace telelink::server;
using core::ErrorCode;
using core::SessionKind;
using core::SessionState;
using core::SignalMessage;
using core::SignalType;

namespace {

/// 记录收到的信令
class FakePeer : public SignalPeer {
public:
    explicit FakePeer(std::string connection_id) : connection_id_(std::move(connection_id)) {}

    void send(const std::string& message) override {
        sent.push_back(core::decode_message(message));
    }

    const std::string& connection_id() const override { return connection_id_; }

    std::vector<SignalMessage> of_type(SignalType type) const {
        std::vector<SignalMessage> out;
        std::copy_if(sent.begin(), sent.end(), std::back_inserter(out),
                     [type](const SignalMessage& m) { return m.type == type; });
        return out;
    }

    bool received_state(SessionState state) const {
        auto states = of_type(SignalType::SessionState);
        return std::any_of(states.begin(), states.end(),
                           [state](const SignalMessage& m) { return m.state().state == state; });
    }

    std::vector<SignalMessage> sent;

private:
    std::string connection_id_;
};

SignalMessage make_start(const std::string& session_id, const std::string& sender) {
    SignalMessage msg;
    msg.type = SignalType::StartSession;
    msg.session_id = session_id;
    msg.sender_id = sender;
    msg.payload = core::StartSessionPayload{};
    return msg;
}

SignalMessage make_sdp(SignalType type, const std::string& session_id,
                       const std::string& sender, const std::string& sdp) {
    SignalMessage msg;
    msg.type = type;
    msg.session_id = session_id;
    msg.sender_id = sender;
    msg.payload = core::SdpPayload{sdp};
    return msg;
}

SignalMessage make_candidate(const std::string& session_id, const std::string& sender,
                             const std::string& candidate) {
    SignalMessage msg;
    msg.type = SignalType::IceCandidate;
    msg.session_id = session_id;
    msg.sender_id = sender;
    core::IceCandidate c;
    c.candidate = candidate;
    c.sdp_mid = "0";
    msg.payload = c;
    return msg;
}

SignalMessage make_end(const std::string& session_id, const std::string& sender) {
    SignalMessage msg;
    msg.type = SignalType::EndSession;
    msg.session_id = session_id;
    msg.sender_id = sender;
    msg.payload = core::EndSessionPayload{};
    return msg;
}

class SignalingRelayTest : public ::testing::Test {
protected:
    SignalingRelayTest()
        : relay_(registry_, SignalingRelay::Options{})
        , alice_(std::make_shared<FakePeer>("conn-alice"))
        , bob_(std::make_shared<FakePeer>("conn-bob"))
        , t0_(SteadyClock::now())
    {
    }

    /// alice 创建会话并邀请 bob，双方均已连接
    std::string start_both() {
        auto created = relay_.start_session("alice", {"bob"}, SessionKind::PeerCall, {}, alice_);
        EXPECT_TRUE(created.ok());
        EXPECT_TRUE(relay_.handle(make_start(created.session_id, "bob"), bob_, t0_).ok());
        return created.session_id;
    }

    /// 完成 offer/answer 协商
    std::string connect_both() {
        auto id = start_both();
        EXPECT_TRUE(relay_.handle(make_sdp(SignalType::Offer, id, "alice", "offer-sdp"), alice_, t0_).ok());
        EXPECT_TRUE(relay_.handle(make_sdp(SignalType::Answer, id, "bob", "answer-sdp"), bob_, t0_).ok());
        EXPECT_EQ(registry_.state_of(id), SessionState::Connected);
        return id;
    }

    SessionRegistry registry_;
    SignalingRelay relay_;
    std::shared_ptr<FakePeer> alice_;
    std::shared_ptr<FakePeer> bob_;
    SteadyClock::time_point t0_;
};

} // namespace

TEST_F(SignalingRelayTest, StartSessionAcknowledgesCreator) {
    auto result = relay_.start_session("alice", {"bob"}, SessionKind::PeerCall, {{"appointment", "7"}}, alice_);
    ASSERT_TRUE(result.ok());

    ASSERT_FALSE(alice_->sent.empty());
    const auto& ack = alice_->sent.front();
    EXPECT_EQ(ack.type, SignalType::StartSession);
    EXPECT_EQ(ack.session_id, result.session_id);
    EXPECT_EQ(ack.sender_id, core::kServerSenderId);
    ASSERT_TRUE(ack.start().state.has_value());
    EXPECT_EQ(*ack.start().state, SessionState::Created);
    EXPECT_EQ(ack.start().participants, (std::vector<std::string>{"alice", "bob"}));
}

TEST_F(SignalingRelayTest, OfferAnswerConnectsAndThirdParticipantIsRejected) {
    auto id = start_both();

    auto offer = relay_.handle(make_sdp(SignalType::Offer, id, "alice", "offer-sdp"), alice_, t0_);
    ASSERT_TRUE(offer.ok());
    EXPECT_EQ(registry_.state_of(id), SessionState::Offering);

    auto offers = bob_->of_type(SignalType::Offer);
    ASSERT_EQ(offers.size(), 1u);
    EXPECT_EQ(offers[0].sdp().sdp, "offer-sdp");
    EXPECT_EQ(offers[0].sender_id, "alice");
    EXPECT_TRUE(bob_->received_state(SessionState::Offering));

    auto answer = relay_.handle(make_sdp(SignalType::Answer, id, "bob", "answer-sdp"), bob_, t0_);
    ASSERT_TRUE(answer.ok());
    EXPECT_EQ(registry_.state_of(id), SessionState::Connected);

    auto answers = alice_->of_type(SignalType::Answer);
    ASSERT_EQ(answers.size(), 1u);
    EXPECT_EQ(answers[0].sdp().sdp, "answer-sdp");
    EXPECT_TRUE(alice_->received_state(SessionState::Connected));
    EXPECT_TRUE(bob_->received_state(SessionState::Connected));

    auto carol = std::make_shared<FakePeer>("conn-carol");
    auto joined = relay_.handle(make_start(id, "carol"), carol, t0_);
    EXPECT_EQ(joined.code, ErrorCode::SessionFull);

    auto errors = carol->of_type(SignalType::Error);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].error().code, ErrorCode::SessionFull);
    EXPECT_EQ(registry_.snapshot(id)->participants.size(), 2u);
}

TEST_F(SignalingRelayTest, ConflictingOfferIsRejected) {
    auto id = start_both();
    relay_.handle(make_sdp(SignalType::Offer, id, "alice", "offer-a"), alice_, t0_);

    auto result = relay_.handle(make_sdp(SignalType::Offer, id, "bob", "offer-b"), bob_, t0_);
    EXPECT_EQ(result.code, ErrorCode::ConflictingOffer);
    EXPECT_TRUE(alice_->of_type(SignalType::Offer).empty());
    ASSERT_EQ(bob_->of_type(SignalType::Error).size(), 1u);
}

TEST_F(SignalingRelayTest, RejectsUnknownSessionAndNonParticipant) {
    auto id = start_both();

    auto unknown = relay_.handle(make_sdp(SignalType::Offer, "nope", "alice", "sdp"), alice_, t0_);
    EXPECT_EQ(unknown.code, ErrorCode::SessionNotFound);

    auto mallory = std::make_shared<FakePeer>("conn-mallory");
    auto outsider = relay_.handle(make_sdp(SignalType::Offer, id, "mallory", "sdp"), mallory, t0_);
    EXPECT_EQ(outsider.code, ErrorCode::NotParticipant);
    EXPECT_EQ(registry_.state_of(id), SessionState::Created);
}

TEST_F(SignalingRelayTest, CandidatesBufferedUntilOfferThenForwardedInOrder) {
    auto id = start_both();

    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(relay_.handle(make_candidate(id, "alice", "cand-" + std::to_string(i)), alice_, t0_).ok());
    }
    EXPECT_TRUE(bob_->of_type(SignalType::IceCandidate).empty());

    relay_.handle(make_sdp(SignalType::Offer, id, "alice", "offer-sdp"), alice_, t0_);
    relay_.handle(make_candidate(id, "alice", "cand-3"), alice_, t0_);

    // offer 先于其后的 candidate 到达
    std::vector<std::string> received;
    bool offer_seen = false;
    for (const auto& m : bob_->sent) {
        if (m.type == SignalType::Offer) {
            offer_seen = true;
        } else if (m.type == SignalType::IceCandidate) {
            EXPECT_TRUE(offer_seen);
            received.push_back(m.candidate().candidate);
        }
    }
    EXPECT_EQ(received, (std::vector<std::string>{"cand-0", "cand-1", "cand-2", "cand-3"}));
}

TEST_F(SignalingRelayTest, AnswererCandidatesWaitForAnswer) {
    auto id = start_both();
    relay_.handle(make_sdp(SignalType::Offer, id, "alice", "offer-sdp"), alice_, t0_);

    relay_.handle(make_candidate(id, "bob", "bob-0"), bob_, t0_);
    EXPECT_TRUE(alice_->of_type(SignalType::IceCandidate).empty());

    relay_.handle(make_sdp(SignalType::Answer, id, "bob", "answer-sdp"), bob_, t0_);
    auto candidates = alice_->of_type(SignalType::IceCandidate);
    ASSERT_EQ(candidates.size(), 1u);
    EXPECT_EQ(candidates[0].candidate().candidate, "bob-0");
}

TEST_F(SignalingRelayTest, PeerCallWithoutPeerIsRejectedAtCreation) {
    auto result = relay_.start_session("alice", {}, SessionKind::PeerCall, {}, alice_);
    EXPECT_EQ(result.code, ErrorCode::MalformedMessage);
    EXPECT_TRUE(result.session_id.empty());
    EXPECT_EQ(registry_.size(), 0u);

    auto errors = alice_->of_type(SignalType::Error);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].error().code, ErrorCode::MalformedMessage);
    EXPECT_TRUE(alice_->of_type(SignalType::StartSession).empty());

    // 只列出自己也不算对端
    EXPECT_FALSE(relay_.start_session("alice", {"alice"}, SessionKind::PeerCall, {}, alice_).ok());

    SignalMessage start = make_start("", "alice");
    EXPECT_EQ(relay_.handle(start, alice_, t0_).code, ErrorCode::MalformedMessage);
    EXPECT_EQ(registry_.size(), 0u);
}

TEST_F(SignalingRelayTest, CreatorOfferReachesPeerThatJoinsLater) {
    auto created = relay_.start_session("alice", {"bob"}, SessionKind::PeerCall, {}, alice_);
    ASSERT_TRUE(created.ok());
    auto id = created.session_id;

    // 对端尚未连接时 offer 被接受并排队
    ASSERT_TRUE(relay_.handle(make_sdp(SignalType::Offer, id, "alice", "offer-sdp"), alice_, t0_).ok());
    ASSERT_TRUE(relay_.handle(make_start(id, "bob"), bob_, t0_).ok());
    ASSERT_EQ(bob_->of_type(SignalType::Offer).size(), 1u);

    ASSERT_TRUE(relay_.handle(make_sdp(SignalType::Answer, id, "bob", "answer-sdp"), bob_, t0_).ok());
    EXPECT_EQ(registry_.state_of(id), SessionState::Connected);
}

TEST_F(SignalingRelayTest, CandidateWithoutPeerIsInvalidState) {
    auto created = relay_.start_session("alice", {}, SessionKind::AiCall, {}, alice_);
    ASSERT_TRUE(created.ok());

    auto result = relay_.handle(make_candidate(created.session_id, "alice", "cand"), alice_, t0_);
    EXPECT_EQ(result.code, ErrorCode::InvalidState);
}

TEST_F(SignalingRelayTest, OfferQueuedForAbsentPeerIsDrainedOnJoin) {
    auto created = relay_.start_session("alice", {"bob"}, SessionKind::PeerCall, {}, alice_);
    auto id = created.session_id;

    ASSERT_TRUE(relay_.handle(make_sdp(SignalType::Offer, id, "alice", "offer-sdp"), alice_, t0_).ok());
    relay_.handle(make_candidate(id, "alice", "cand-0"), alice_, t0_);
    EXPECT_TRUE(bob_->sent.empty());

    ASSERT_TRUE(relay_.handle(make_start(id, "bob"), bob_, t0_).ok());

    ASSERT_GE(bob_->sent.size(), 3u);
    EXPECT_EQ(bob_->sent[0].type, SignalType::StartSession);
    EXPECT_EQ(bob_->sent[1].type, SignalType::Offer);
    EXPECT_EQ(bob_->sent[2].type, SignalType::IceCandidate);
    EXPECT_EQ(bob_->sent[2].candidate().candidate, "cand-0");
}

TEST_F(SignalingRelayTest, AnswerToAbsentInitiatorConnectsOnReattach) {
    auto id = start_both();
    relay_.handle(make_sdp(SignalType::Offer, id, "alice", "offer-sdp"), alice_, t0_);

    relay_.on_disconnect(id, "alice", alice_->connection_id(), t0_);
    ASSERT_TRUE(relay_.handle(make_sdp(SignalType::Answer, id, "bob", "answer-sdp"), bob_, t0_).ok());
    EXPECT_EQ(registry_.state_of(id), SessionState::Answering);

    auto alice2 = std::make_shared<FakePeer>("conn-alice-2");
    ASSERT_TRUE(relay_.handle(make_start(id, "alice"), alice2, t0_).ok());

    EXPECT_EQ(registry_.state_of(id), SessionState::Connected);
    ASSERT_EQ(alice2->of_type(SignalType::Answer).size(), 1u);
    EXPECT_TRUE(bob_->received_state(SessionState::Connected));
}

TEST_F(SignalingRelayTest, EndSessionIsIdempotent) {
    auto id = connect_both();

    auto first = relay_.handle(make_end(id, "alice"), alice_, t0_);
    ASSERT_TRUE(first.ok());
    EXPECT_EQ(registry_.state_of(id), SessionState::Ended);

    auto ends = bob_->of_type(SignalType::EndSession);
    ASSERT_EQ(ends.size(), 1u);
    ASSERT_TRUE(ends[0].end().summary.has_value());
    EXPECT_EQ(ends[0].end().summary->end_reason, "ended_by_participant");
    EXPECT_TRUE(bob_->received_state(SessionState::Ended));

    alice_->sent.clear();
    auto second = relay_.handle(make_end(id, "bob"), bob_, t0_);
    EXPECT_TRUE(second.ok());
    EXPECT_EQ(registry_.state_of(id), SessionState::Ended);
    EXPECT_TRUE(bob_->of_type(SignalType::Error).empty());
    EXPECT_EQ(bob_->of_type(SignalType::EndSession).size(), 2u);
    EXPECT_TRUE(alice_->sent.empty());

    auto summary = relay_.end_session(id, "again", t0_);
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary->end_reason, "ended_by_participant");
}

TEST_F(SignalingRelayTest, ResumeWithinGraceReturnsToConnected) {
    auto id = connect_both();

    relay_.on_disconnect(id, "bob", bob_->connection_id(), t0_);
    EXPECT_EQ(registry_.state_of(id), SessionState::Reconnecting);
    EXPECT_TRUE(alice_->received_state(SessionState::Reconnecting));

    auto bob2 = std::make_shared<FakePeer>("conn-bob-2");
    ASSERT_TRUE(relay_.handle(make_start(id, "bob"), bob2, t0_ + std::chrono::seconds(10)).ok());

    EXPECT_EQ(registry_.state_of(id), SessionState::Connected);
    EXPECT_EQ(registry_.snapshot(id)->participants, (std::vector<std::string>{"alice", "bob"}));

    EXPECT_EQ(relay_.sweep(t0_ + std::chrono::seconds(45)), 0u);
    EXPECT_EQ(registry_.state_of(id), SessionState::Connected);
}

TEST_F(SignalingRelayTest, SecondDropGetsFullGraceWindow) {
    auto id = connect_both();

    relay_.on_disconnect(id, "bob", bob_->connection_id(), t0_);
    relay_.on_disconnect(id, "alice", alice_->connection_id(), t0_ + std::chrono::seconds(29));

    auto bob2 = std::make_shared<FakePeer>("conn-bob-2");
    ASSERT_TRUE(relay_.handle(make_start(id, "bob"), bob2, t0_ + std::chrono::seconds(29)).ok());
    EXPECT_EQ(registry_.state_of(id), SessionState::Reconnecting);

    EXPECT_EQ(relay_.sweep(t0_ + std::chrono::seconds(30)), 0u);
    EXPECT_EQ(relay_.sweep(t0_ + std::chrono::seconds(58)), 0u);

    auto alice2 = std::make_shared<FakePeer>("conn-alice-2");
    ASSERT_TRUE(relay_.handle(make_start(id, "alice"), alice2, t0_ + std::chrono::seconds(58)).ok());
    EXPECT_EQ(registry_.state_of(id), SessionState::Connected);
    EXPECT_EQ(relay_.sweep(t0_ + std::chrono::seconds(90)), 0u);
}

TEST_F(SignalingRelayTest, SecondDropExpiresOnItsOwnClock) {
    auto id = connect_both();

    relay_.on_disconnect(id, "bob", bob_->connection_id(), t0_);
    relay_.on_disconnect(id, "alice", alice_->connection_id(), t0_ + std::chrono::seconds(29));
    auto bob2 = std::make_shared<FakePeer>("conn-bob-2");
    relay_.handle(make_start(id, "bob"), bob2, t0_ + std::chrono::seconds(29));

    EXPECT_EQ(relay_.sweep(t0_ + std::chrono::seconds(59)), 1u);
    EXPECT_EQ(registry_.state_of(id), SessionState::Ended);
    auto ends = bob2->of_type(SignalType::EndSession);
    ASSERT_EQ(ends.size(), 1u);
    EXPECT_EQ(ends[0].end().reason, "reconnect_timeout");
}

TEST_F(SignalingRelayTest, StaleDisconnectIsIgnored) {
    auto id = connect_both();
    relay_.on_disconnect(id, "bob", bob_->connection_id(), t0_);

    auto bob2 = std::make_shared<FakePeer>("conn-bob-2");
    relay_.handle(make_start(id, "bob"), bob2, t0_);
    ASSERT_EQ(registry_.state_of(id), SessionState::Connected);

    // 旧连接的关闭事件晚到
    relay_.on_disconnect(id, "bob", "conn-bob", t0_);
    EXPECT_EQ(registry_.state_of(id), SessionState::Connected);
}

TEST_F(SignalingRelayTest, GraceExpiryEndsSessionAndClosesIt) {
    auto id = connect_both();

    relay_.on_disconnect(id, "bob", bob_->connection_id(), t0_);
    EXPECT_EQ(relay_.sweep(t0_ + std::chrono::seconds(29)), 0u);
    EXPECT_EQ(relay_.sweep(t0_ + std::chrono::seconds(30)), 1u);
    EXPECT_EQ(registry_.state_of(id), SessionState::Ended);

    auto ends = alice_->of_type(SignalType::EndSession);
    ASSERT_EQ(ends.size(), 1u);
    EXPECT_EQ(ends[0].end().reason, "reconnect_timeout");

    alice_->sent.clear();
    auto result = relay_.handle(make_candidate(id, "alice", "late"), alice_, t0_ + std::chrono::seconds(31));
    EXPECT_EQ(result.code, ErrorCode::SessionClosed);
    auto errors = alice_->of_type(SignalType::Error);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].error().code, ErrorCode::SessionClosed);

    auto rejoin = relay_.handle(make_start(id, "bob"), bob_, t0_ + std::chrono::seconds(31));
    EXPECT_EQ(rejoin.code, ErrorCode::SessionClosed);
}

TEST_F(SignalingRelayTest, AbandonedSessionIsEndedAndEvicted) {
    auto created = relay_.start_session("alice", {"bob"}, SessionKind::PeerCall, {}, alice_);
    auto id = created.session_id;

    relay_.on_disconnect(id, "alice", alice_->connection_id(), t0_);
    EXPECT_EQ(relay_.sweep(t0_ + std::chrono::seconds(30)), 1u);
    EXPECT_EQ(registry_.state_of(id), SessionState::Ended);

    relay_.sweep(t0_ + std::chrono::seconds(90));
    EXPECT_FALSE(registry_.state_of(id).has_value());
}
