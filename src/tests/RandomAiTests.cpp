#include <gtest/gtest.h>
#include <variant>

#include "TestSupport.hpp"
#include "../core/RandomAi.hpp"

using namespace bluff::core;
using bluff::test::C;
using bluff::test::Epoch;

namespace
{
    auto TwoSeatView() -> SessionView
    {
        SessionView v{};
        v.id = "s";
        v.players = {PlayerSummary{"a", "A", true, 3}, PlayerSummary{"b", "B", false, 3}};
        v.started = true;
        v.current_turn = "a";
        v.required_rank = Rank::Four;
        return v;
    }
}

TEST(RandomAi, IdleBeforeStart)
{
    RandomAI ai{1, 1.0, 1.0};
    SessionView v = TwoSeatView();
    v.started = false;
    EXPECT_FALSE(ai.Decide(v, HandView{"a", {C(Rank::Ace, Suit::Spades)}}, Epoch()).has_value());
}

TEST(RandomAi, PlaysHonestCardsWhenHoldingTheRank)
{
    HandView const hand{"a", {C(Rank::Four, Suit::Spades), C(Rank::Nine, Suit::Hearts), C(Rank::Four, Suit::Clubs)}};
    for (uint64_t seed = 0; seed < 50; ++seed)
    {
        RandomAI ai{seed, 0.0, 0.0};
        auto const act = ai.Decide(TwoSeatView(), hand, Epoch());
        ASSERT_TRUE(act.has_value());
        ASSERT_TRUE(std::holds_alternative<PlayAction>(*act));
        PlayAction const& play = std::get<PlayAction>(*act);
        EXPECT_EQ(play.claimed, Rank::Four);
        ASSERT_GE(play.cards.size(), 1u);
        ASSERT_LE(play.cards.size(), 2u);
        for (Card const& c : play.cards) EXPECT_EQ(c.rank, Rank::Four);
    }
}

TEST(RandomAi, BluffsWithinTheCeiling)
{
    HandView hand{"a", {}};
    for (int i = 0; i < 12; ++i) hand.hand.push_back(C(Rank::King, static_cast<Suit>(i % 4)));
    for (uint64_t seed = 0; seed < 50; ++seed)
    {
        RandomAI ai{seed, 0.0, 0.0};
        auto const act = ai.Decide(TwoSeatView(), hand, Epoch());
        ASSERT_TRUE(act.has_value());
        PlayAction const& play = std::get<PlayAction>(*act);
        EXPECT_EQ(play.claimed, Rank::Four);
        EXPECT_LE(play.cards.size(), 4u);
    }
}

TEST(RandomAi, ChallengesOthersButNeverItself)
{
    SessionView v = TwoSeatView();
    v.current_turn = "b";
    v.last_play = LastPlaySummary{"B", 2, Rank::Three};
    v.pile_count = 2;
    v.challenge_deadline = Epoch() + constants::ChallengeWindow;

    RandomAI eager{3, 1.0, 0.0};
    auto const act = eager.Decide(v, HandView{"a", {C(Rank::Ace, Suit::Spades)}}, Epoch());
    ASSERT_TRUE(act.has_value());
    EXPECT_TRUE(std::holds_alternative<ChallengeAction>(*act));

    // B made the last play and is not on turn: it must not accuse itself
    SessionView off_turn = v;
    off_turn.current_turn = "a";
    RandomAI self{3, 1.0, 1.0};
    EXPECT_FALSE(self.Decide(off_turn, HandView{"b", {C(Rank::Ace, Suit::Spades)}}, Epoch()).has_value());

    // closed window: nothing to do off-turn without a counter attempt
    RandomAI late{3, 1.0, 0.0};
    EXPECT_FALSE(late.Decide(v, HandView{"a", {C(Rank::Ace, Suit::Spades)}},
                             Epoch() + constants::ChallengeWindow + std::chrono::seconds(1)).has_value());
}
