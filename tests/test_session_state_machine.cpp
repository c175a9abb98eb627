/**
 * @file test_session_state_machine.cpp
 * @brief 会话注册表与状态机测试
 */

#include "session_server/session_registry.hpp"
#include "session_server/session_state_machine.hpp"

#include <gtest/gtest.h>

#include <set>

using namespace telelink;
using namespace telelink::server;
using core::ErrorCode;
using core::SessionKind;
using core::SessionState;
using SM = SessionStateMachine;

namespace {

Session make_session(std::vector<std::string> ids, SessionKind kind = SessionKind::PeerCall) {
    Session s;
    s.id = "s1";
    s.kind = kind;
    for (auto& id : ids) {
        Participant p;
        p.id = id;
        s.participants.push_back(std::move(p));
    }
    return s;
}

} // namespace

// ==================== 注册表 ====================

TEST(SessionRegistry, CreatesSessionInCreatedState) {
    SessionRegistry registry;
    auto id = registry.create(SessionKind::PeerCall, {"alice", "bob"}, {{"appointment", "42"}});

    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(id->size(), 32u);
    EXPECT_EQ(registry.state_of(*id), SessionState::Created);

    auto snap = registry.snapshot(*id);
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->participants, (std::vector<std::string>{"alice", "bob"}));
    EXPECT_EQ(snap->metadata.at("appointment"), "42");
}

TEST(SessionRegistry, EnforcesParticipantCap) {
    SessionRegistry registry;

    EXPECT_FALSE(registry.create(SessionKind::PeerCall, {}, {}).has_value());
    EXPECT_FALSE(registry.create(SessionKind::PeerCall, {"a", "b", "c"}, {}).has_value());

    // 重复 ID 去重后合法
    auto id = registry.create(SessionKind::PeerCall, {"a", "b", "a"}, {});
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(registry.snapshot(*id)->participants.size(), 2u);
    EXPECT_EQ(registry.size(), 1u);
}

TEST(SessionRegistry, GeneratesDistinctIds) {
    std::set<std::string> ids;
    for (int i = 0; i < 100; ++i) {
        ids.insert(SessionRegistry::generate_session_id());
    }
    EXPECT_EQ(ids.size(), 100u);
}

TEST(SessionRegistry, WithSessionReportsUnknownId) {
    SessionRegistry registry;
    bool called = false;
    EXPECT_FALSE(registry.with_session("missing", [&](Session&) { called = true; }));
    EXPECT_FALSE(called);
    EXPECT_FALSE(registry.state_of("missing").has_value());
}

TEST(SessionRegistry, EvictsEndedSessionsAfterGrace) {
    SessionRegistry registry;
    auto id = registry.create(SessionKind::PeerCall, {"a", "b"}, {});
    ASSERT_TRUE(id.has_value());

    auto t0 = SteadyClock::now();
    registry.with_session(*id, [&](Session& s) { SM::end(s, "test", t0); });

    EXPECT_EQ(registry.evict_ended(t0 + std::chrono::seconds(59), std::chrono::seconds(60)), 0u);
    EXPECT_EQ(registry.evict_ended(t0 + std::chrono::seconds(60), std::chrono::seconds(60)), 1u);
    EXPECT_EQ(registry.size(), 0u);
}

// ==================== 状态机 ====================

TEST(SessionStateMachine, LegalTransitions) {
    EXPECT_TRUE(SM::is_legal(SessionState::Created, SessionState::Offering));
    EXPECT_TRUE(SM::is_legal(SessionState::Created, SessionState::Ended));
    EXPECT_TRUE(SM::is_legal(SessionState::Connected, SessionState::Reconnecting));
    EXPECT_TRUE(SM::is_legal(SessionState::Reconnecting, SessionState::Connected));

    EXPECT_FALSE(SM::is_legal(SessionState::Created, SessionState::Connected));
    EXPECT_FALSE(SM::is_legal(SessionState::Ended, SessionState::Created));
    EXPECT_FALSE(SM::is_legal(SessionState::Ended, SessionState::Ended));
}

TEST(SessionStateMachine, OfferAnswerReachesConnected) {
    auto s = make_session({"alice", "bob"});

    auto offer = SM::on_offer(s, "alice");
    EXPECT_TRUE(offer.ok());
    EXPECT_TRUE(offer.changed);
    EXPECT_EQ(s.state, SessionState::Offering);
    EXPECT_EQ(s.initiator_id, "alice");

    EXPECT_TRUE(SM::on_answer(s, "bob").ok());
    EXPECT_EQ(s.state, SessionState::Answering);

    EXPECT_TRUE(SM::on_answer_delivered(s).changed);
    EXPECT_EQ(s.state, SessionState::Connected);
}

TEST(SessionStateMachine, ConflictingOfferRejected) {
    auto s = make_session({"alice", "bob"});
    SM::on_offer(s, "alice");

    auto second = SM::on_offer(s, "bob");
    EXPECT_EQ(second.error, ErrorCode::ConflictingOffer);
    EXPECT_EQ(s.initiator_id, "alice");

    // 发起方可更新 offer
    EXPECT_TRUE(SM::on_offer(s, "alice").ok());
}

TEST(SessionStateMachine, AnswerOutsideOfferingRejected) {
    auto s = make_session({"alice", "bob"});
    EXPECT_EQ(SM::on_answer(s, "bob").error, ErrorCode::InvalidState);

    SM::on_offer(s, "alice");
    EXPECT_EQ(SM::on_answer(s, "alice").error, ErrorCode::InvalidState);
}

TEST(SessionStateMachine, RenegotiationFromConnected) {
    auto s = make_session({"alice", "bob"});
    SM::on_offer(s, "alice");
    SM::on_answer(s, "bob");
    SM::on_answer_delivered(s);

    EXPECT_EQ(SM::on_offer(s, "bob").error, ErrorCode::ConflictingOffer);
    EXPECT_TRUE(SM::on_offer(s, "alice").changed);
    EXPECT_EQ(s.state, SessionState::Offering);
}

TEST(SessionStateMachine, DetachFromConnectedStartsGraceWindow) {
    auto s = make_session({"alice", "bob"});
    SM::on_offer(s, "alice");
    SM::on_answer(s, "bob");
    SM::on_answer_delivered(s);

    auto t0 = SteadyClock::now();
    EXPECT_TRUE(SM::on_detach(s, *s.find_participant("bob"), t0).changed);
    EXPECT_EQ(s.state, SessionState::Reconnecting);

    auto grace = std::chrono::seconds(30);
    EXPECT_FALSE(SM::grace_expired(s, t0 + std::chrono::seconds(29), grace));
    EXPECT_TRUE(SM::grace_expired(s, t0 + std::chrono::seconds(30), grace));
}

TEST(SessionStateMachine, EachParticipantHasItsOwnGraceWindow) {
    auto s = make_session({"alice", "bob"});
    SM::on_offer(s, "alice");
    SM::on_answer(s, "bob");
    SM::on_answer_delivered(s);

    auto t0 = SteadyClock::now();
    auto grace = std::chrono::seconds(30);
    SM::on_detach(s, *s.find_participant("bob"), t0);
    SM::on_detach(s, *s.find_participant("alice"), t0 + std::chrono::seconds(29));
    ASSERT_EQ(s.state, SessionState::Reconnecting);

    // bob 回来后只剩 alice 自己的计时
    SM::on_attach(s, *s.find_participant("bob"));
    EXPECT_FALSE(SM::grace_expired(s, t0 + std::chrono::seconds(30), grace));
    EXPECT_FALSE(SM::grace_expired(s, t0 + std::chrono::seconds(58), grace));
    EXPECT_TRUE(SM::grace_expired(s, t0 + std::chrono::seconds(59), grace));
}

TEST(SessionStateMachine, AbandonmentCountsFromLastDeparture) {
    auto s = make_session({"alice", "bob"});
    auto t0 = SteadyClock::now();
    auto grace = std::chrono::seconds(30);

    SM::on_detach(s, *s.find_participant("alice"), t0);
    EXPECT_TRUE(SM::grace_expired(s, t0 + grace, grace));

    SM::on_attach(s, *s.find_participant("alice"));
    EXPECT_FALSE(SM::grace_expired(s, t0 + grace, grace));
    EXPECT_EQ(s.state, SessionState::Created);
}

TEST(SessionStateMachine, EndIsIdempotent) {
    auto s = make_session({"alice", "bob"});
    auto t0 = SteadyClock::now();

    EXPECT_TRUE(SM::end(s, "first", t0).changed);
    EXPECT_EQ(s.state, SessionState::Ended);
    EXPECT_EQ(s.end_reason, "first");

    auto again = SM::end(s, "second", t0);
    EXPECT_TRUE(again.ok());
    EXPECT_FALSE(again.changed);
    EXPECT_EQ(s.end_reason, "first");
}

TEST(SessionStateMachine, CheckSender) {
    auto s = make_session({"alice", "bob"});
    EXPECT_TRUE(SM::check_sender(s, "alice").ok());
    EXPECT_EQ(SM::check_sender(s, "mallory").error, ErrorCode::NotParticipant);

    SM::end(s, "done", SteadyClock::now());
    EXPECT_EQ(SM::check_sender(s, "alice").error, ErrorCode::SessionClosed);
}

TEST(SessionStateMachine, StreamingEligibility) {
    auto peer = make_session({"alice", "bob"});
    EXPECT_FALSE(SM::is_streaming_eligible(peer));

    auto ai = make_session({"patient"}, SessionKind::AiCall);
    EXPECT_TRUE(SM::is_streaming_eligible(ai));

    SM::end(ai, "done", SteadyClock::now());
    EXPECT_FALSE(SM::is_streaming_eligible(ai));
}
