#include <gtest/gtest.h>
#include "state/evtx_stream_layout.hpp"

using namespace evtx;

// 三个流名由参与者身份与状态名推导
TEST(StreamLayoutTest, DerivesThreeStreams) {
    StreamLayout layout = StreamLayout::forParticipant("bankaccount", "alice", "account");

    EXPECT_EQ(layout.main, "bankaccount-alice-account");
    EXPECT_EQ(layout.pending, "bankaccount-alice-account-pending");
    EXPECT_EQ(layout.metadata, "bankaccount-alice-account-metadata");
}

TEST(StreamLayoutTest, ContextOverloadMatches) {
    ParticipantContext context("greeter", "42");
    StreamLayout a = StreamLayout::forParticipant(context, "greetings");
    StreamLayout b = StreamLayout::forParticipant("greeter", "42", "greetings");

    EXPECT_EQ(a.main, b.main);
    EXPECT_EQ(a.pending, b.pending);
    EXPECT_EQ(a.metadata, b.metadata);
}

// 不同参与者或不同状态名不会共享流
TEST(StreamLayoutTest, DistinctIdentitiesDoNotCollide) {
    StreamLayout alice = StreamLayout::forParticipant("bankaccount", "alice", "account");
    StreamLayout bob = StreamLayout::forParticipant("bankaccount", "bob", "account");
    StreamLayout audit = StreamLayout::forParticipant("bankaccount", "alice", "audit");

    EXPECT_NE(alice.main, bob.main);
    EXPECT_NE(alice.main, audit.main);
    EXPECT_NE(alice.pending, alice.main);
}
