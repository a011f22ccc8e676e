#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <format>
#include <latch>
#include <thread>
#include <vector>

#include "TestSupport.hpp"
#include "../core/Registry.hpp"
#include "../debug/Invariants.hpp"

using namespace bluff::core;
using bluff::test::ManualClock;
using bluff::test::RecordingSink;
using RC = error::RejectCode;
using namespace std::chrono_literals;

namespace
{
    struct Fixture
    {
        std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>();
        std::shared_ptr<RecordingSink> sink = std::make_shared<RecordingSink>();
        SessionRegistry registry{Config{.seed = 2024}, clock, sink};
    };

    // host on connection 1, the rest on 2..n
    auto Seat(Fixture& f, std::size_t n) -> std::vector<Joined>
    {
        std::vector<Joined> out;
        out.push_back(f.registry.Create("host", 1));
        for (std::size_t i = 1; i < n; ++i)
        {
            auto const j = f.registry.Join(out.front().session_id, std::format("guest{}", i), i + 1);
            EXPECT_TRUE(j);
            if (j) out.push_back(*j);
        }
        return out;
    }

    auto TurnHolder(Fixture const& f, SessionId const& sid) -> std::pair<PlayerId, std::vector<Card>>
    {
        std::pair<PlayerId, std::vector<Card>> out;
        f.registry.Visit(sid, [&](Session const& s)
        {
            PlayerSeat const& seat = s.SeatAt(s.TurnIndex());
            out = {seat.id, seat.hand};
        });
        return out;
    }
}

TEST(Registry, CreateBroadcastsLobbyToCreator)
{
    Fixture f;
    Joined const j = f.registry.Create("alice", 1);
    EXPECT_FALSE(j.session_id.empty());
    EXPECT_FALSE(j.player_id.empty());
    EXPECT_NE(j.session_id, j.player_id);
    EXPECT_EQ(j.session_id.size(), 36u);
    EXPECT_EQ(f.registry.SessionCount(), 1u);

    auto const states = f.sink->States();
    ASSERT_EQ(states.size(), 1u);
    EXPECT_EQ(states[0].event, StateEvent::Session);
    EXPECT_EQ(states[0].audience, (std::vector<ConnectionId>{1}));
    ASSERT_EQ(states[0].view.players.size(), 1u);
    EXPECT_EQ(states[0].view.players[0].name, "alice");
    EXPECT_TRUE(states[0].view.players[0].is_host);
}

TEST(Registry, JoinFailuresDoNotBroadcast)
{
    Fixture f;
    auto const seats = Seat(f, constants::MaxPlayers);
    ASSERT_EQ(seats.size(), constants::MaxPlayers);
    f.sink->Clear();

    auto const full = f.registry.Join(seats[0].session_id, "eleventh", 50);
    ASSERT_FALSE(full);
    EXPECT_EQ(full.error().code, RC::Session_Full);

    auto const missing = f.registry.Join("no-such-session", "bob", 51);
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, RC::Session_NotFound);
    EXPECT_EQ(f.sink->Events(), 0u);

    Fixture g;
    auto const two = Seat(g, 2);
    ASSERT_TRUE(g.registry.Start(two[0].session_id, two[0].player_id));
    g.sink->Clear();
    auto const late = g.registry.Join(two[0].session_id, "late", 9);
    ASSERT_FALSE(late);
    EXPECT_EQ(late.error().code, RC::Session_AlreadyStarted);
    EXPECT_EQ(g.sink->Events(), 0u);
}

TEST(Registry, KickedConnectionSeesRosterOnce)
{
    Fixture f;
    auto const seats = Seat(f, 3);
    f.sink->Clear();

    ASSERT_TRUE(f.registry.Kick(seats[0].session_id, seats[1].player_id, seats[0].player_id));
    auto const states = f.sink->States();
    ASSERT_EQ(states.size(), 1u);
    EXPECT_EQ(states[0].audience, (std::vector<ConnectionId>{1, 3, 2}));
    EXPECT_EQ(states[0].view.players.size(), 2u);

    f.sink->Clear();
    auto const not_host = f.registry.Kick(seats[0].session_id, seats[2].player_id, seats[2].player_id);
    ASSERT_FALSE(not_host);
    EXPECT_EQ(not_host.error().code, RC::Lobby_NotHost);
    EXPECT_EQ(f.sink->Events(), 0u);
}

TEST(Registry, StartDealsPrivateHands)
{
    Fixture f;
    auto const seats = Seat(f, 3);
    f.sink->Clear();

    ASSERT_TRUE(f.registry.Start(seats[0].session_id, seats[0].player_id));
    auto const states = f.sink->States();
    ASSERT_EQ(states.size(), 1u);
    EXPECT_EQ(states[0].event, StateEvent::Started);
    EXPECT_TRUE(states[0].view.started);
    EXPECT_EQ(states[0].view.current_turn, std::optional<PlayerId>{seats[1].player_id});

    auto const hands = f.sink->Hands();
    ASSERT_EQ(hands.size(), 3u);
    std::size_t total{};
    for (std::size_t i = 0; i < hands.size(); ++i)
    {
        // each hand goes only to its owner's connection
        EXPECT_EQ(hands[i].conn, i + 1);
        EXPECT_EQ(hands[i].hand.player_id, seats[i].player_id);
        total += hands[i].hand.hand.size();
    }
    EXPECT_EQ(total, constants::CardsPerDeck);

    auto const again = f.registry.Start(seats[0].session_id, seats[0].player_id);
    ASSERT_FALSE(again);
    EXPECT_EQ(again.error().code, RC::Session_AlreadyStarted);
}

TEST(Registry, RejectedActionsStaySilent)
{
    Fixture f;
    auto const seats = Seat(f, 3);
    SessionId const sid = seats[0].session_id;
    ASSERT_TRUE(f.registry.Start(sid, seats[0].player_id));
    f.sink->Clear();

    // host is not on turn
    std::vector<Card> host_hand;
    f.registry.Visit(sid, [&](Session const& s) { host_hand = s.SeatAt(0).hand; });
    auto const r = f.registry.Play(sid, seats[0].player_id, {host_hand.front()}, Rank::Ace);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, RC::Play_NotYourTurn);

    EXPECT_FALSE(f.registry.CallChallenge(sid, seats[2].player_id));
    EXPECT_FALSE(f.registry.InvokeCounter(sid, seats[2].player_id));
    EXPECT_FALSE(f.registry.CallChallenge("gone", seats[2].player_id));
    EXPECT_EQ(f.sink->Events(), 0u);
}

TEST(Registry, ChallengeUsesInjectedClock)
{
    Fixture f;
    auto const seats = Seat(f, 2);
    SessionId const sid = seats[0].session_id;
    ASSERT_TRUE(f.registry.Start(sid, seats[0].player_id));

    auto const [actor, hand] = TurnHolder(f, sid);
    ASSERT_TRUE(f.registry.Play(sid, actor, {hand.front()}, Rank::Ace));

    auto const view = f.registry.View(sid);
    ASSERT_TRUE(view);
    ASSERT_TRUE(view->challenge_deadline.has_value());
    EXPECT_EQ(*view->challenge_deadline, f.clock->Now() + constants::ChallengeWindow);

    f.clock->Advance(constants::ChallengeWindow + 1ms);
    f.sink->Clear();
    auto const late = f.registry.CallChallenge(sid, seats[0].player_id);
    ASSERT_FALSE(late);
    EXPECT_EQ(late.error().code, RC::Challenge_WindowClosed);
    EXPECT_EQ(f.sink->Events(), 0u);
}

TEST(Registry, AcceptedPlayBroadcastsGameState)
{
    Fixture f;
    auto const seats = Seat(f, 3);
    SessionId const sid = seats[0].session_id;
    ASSERT_TRUE(f.registry.Start(sid, seats[0].player_id));
    f.sink->Clear();

    auto const [actor, hand] = TurnHolder(f, sid);
    ASSERT_TRUE(f.registry.Play(sid, actor, {hand[0], hand[1]}, Rank::Queen));

    auto const states = f.sink->States();
    ASSERT_EQ(states.size(), 1u);
    EXPECT_EQ(states[0].event, StateEvent::Game);
    EXPECT_EQ(states[0].view.pile_count, 2u);
    ASSERT_TRUE(states[0].view.last_play.has_value());
    EXPECT_EQ(states[0].view.last_play->count, 2u);
    EXPECT_EQ(states[0].view.last_play->claimed, Rank::Queen);
    EXPECT_EQ(states[0].view.required_rank, Rank::Two);
    EXPECT_EQ(f.sink->Hands().size(), 3u);
}

TEST(Registry, DisconnectMigratesHostAndKeepsTurn)
{
    Fixture f;
    auto const seats = Seat(f, 3);
    SessionId const sid = seats[0].session_id;
    ASSERT_TRUE(f.registry.Start(sid, seats[0].player_id));
    f.sink->Clear();

    EXPECT_EQ(f.registry.HandleDisconnect(1), 1u);

    auto const states = f.sink->States();
    ASSERT_EQ(states.size(), 1u);
    EXPECT_EQ(states[0].audience, (std::vector<ConnectionId>{2, 3}));
    ASSERT_EQ(states[0].view.players.size(), 2u);
    EXPECT_EQ(states[0].view.players[0].id, seats[1].player_id);
    EXPECT_TRUE(states[0].view.players[0].is_host);
    EXPECT_EQ(states[0].view.current_turn, std::optional<PlayerId>{seats[1].player_id});

    EXPECT_TRUE(f.registry.Visit(sid, [](Session const& s) { debug::CheckInvariants(s); }));

    // a connection nobody holds touches nothing
    EXPECT_EQ(f.registry.HandleDisconnect(99), 0u);
}

TEST(Registry, EmptySessionsAreRetired)
{
    Fixture f;
    Joined const a = f.registry.Create("alone", 7);
    Joined const b = f.registry.Create("other", 8);
    ASSERT_EQ(f.registry.SessionCount(), 2u);

    EXPECT_EQ(f.registry.HandleDisconnect(7), 1u);
    EXPECT_EQ(f.registry.SessionCount(), 1u);
    EXPECT_FALSE(f.registry.View(a.session_id).has_value());
    EXPECT_TRUE(f.registry.View(b.session_id).has_value());

    auto const j = f.registry.Join(a.session_id, "late", 9);
    ASSERT_FALSE(j);
    EXPECT_EQ(j.error().code, RC::Session_NotFound);
}

TEST(Registry, OneConnectionManySeats)
{
    Fixture f;
    Joined const host = f.registry.Create("left", 5);
    ASSERT_TRUE(f.registry.Join(host.session_id, "right", 5));
    f.sink->Clear();

    ASSERT_TRUE(f.registry.Start(host.session_id, host.player_id));
    auto const states = f.sink->States();
    ASSERT_EQ(states.size(), 1u);
    EXPECT_EQ(states[0].audience, (std::vector<ConnectionId>{5}));

    EXPECT_EQ(f.registry.HandleDisconnect(5), 1u);
    EXPECT_EQ(f.registry.SessionCount(), 0u);
}

TEST(Registry, CounterLapseIsRejectedWithoutBroadcast)
{
    Fixture f;
    auto const seats = Seat(f, 3);
    SessionId const sid = seats[0].session_id;
    ASSERT_TRUE(f.registry.Start(sid, seats[0].player_id));

    auto const [p1, h1] = TurnHolder(f, sid);
    ASSERT_TRUE(f.registry.Play(sid, p1, {h1.front()}, Rank::Ace));
    auto const [p2, h2] = TurnHolder(f, sid);
    ASSERT_TRUE(f.registry.Play(sid, p2, {h2.front()}, Rank::Two));

    ASSERT_EQ(f.registry.HandleDisconnect(3), 1u); // the second player
    f.sink->Clear();

    auto const r = f.registry.InvokeCounter(sid, p1);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, RC::Counter_PlayerGone);
    EXPECT_EQ(f.sink->Events(), 0u);

    auto const again = f.registry.InvokeCounter(sid, p1);
    ASSERT_FALSE(again);
    EXPECT_EQ(again.error().code, RC::Counter_NotArmed);
}

TEST(Registry, RacingChallengesSettleOnce)
{
    Fixture f;
    auto const seats = Seat(f, 8);
    SessionId const sid = seats[0].session_id;
    ASSERT_TRUE(f.registry.Start(sid, seats[0].player_id));

    auto const [actor, hand] = TurnHolder(f, sid);
    ASSERT_TRUE(f.registry.Play(sid, actor, {hand[0], hand[1], hand[2]}, Rank::Ace));
    f.sink->Clear();

    std::atomic<int> won{0};
    std::atomic<int> no_play{0};
    std::latch go{static_cast<std::ptrdiff_t>(seats.size())};
    std::vector<std::thread> threads;
    for (Joined const& j : seats)
    {
        threads.emplace_back([&, who = j.player_id]()
        {
            go.arrive_and_wait();
            auto const r = f.registry.CallChallenge(sid, who);
            if (r) ++won;
            else if (r.error().code == RC::Challenge_NoPlay) ++no_play;
        });
    }
    for (std::thread& t : threads) t.join();

    EXPECT_EQ(won.load(), 1);
    EXPECT_EQ(no_play.load(), static_cast<int>(seats.size()) - 1);
    EXPECT_EQ(f.sink->States().size(), 1u);

    EXPECT_TRUE(f.registry.Visit(sid, [](Session const& s)
    {
        EXPECT_EQ(s.PileSize(), 0u);
        debug::CheckInvariants(s);
    }));
}

TEST(Registry, SessionsProgressIndependently)
{
    Fixture f;
    constexpr std::size_t Sessions = 6;
    constexpr int Plays = 40;

    std::vector<SessionId> ids;
    for (std::size_t i = 0; i < Sessions; ++i)
    {
        ConnectionId const base = 100 * (i + 1);
        Joined const h = f.registry.Create("h", base);
        ASSERT_TRUE(f.registry.Join(h.session_id, "g", base + 1));
        ASSERT_TRUE(f.registry.Start(h.session_id, h.player_id));
        ids.push_back(h.session_id);
    }

    std::latch go{static_cast<std::ptrdiff_t>(Sessions)};
    std::atomic<int> accepted{0};
    std::vector<std::thread> threads;
    for (SessionId const& sid : ids)
    {
        threads.emplace_back([&, sid]()
        {
            go.arrive_and_wait();
            for (int i = 0; i < Plays; ++i)
            {
                auto const [actor, hand] = TurnHolder(f, sid);
                if (hand.empty()) break;
                if (f.registry.Play(sid, actor, {hand.front()}, Rank::Ace)) ++accepted;
            }
        });
    }
    for (std::thread& t : threads) t.join();

    EXPECT_EQ(accepted.load(), static_cast<int>(Sessions) * Plays);
    for (SessionId const& sid : ids)
    {
        auto const v = f.registry.View(sid);
        ASSERT_TRUE(v);
        EXPECT_EQ(v->pile_count, static_cast<std::size_t>(Plays));
        EXPECT_EQ(v->required_rank, static_cast<Rank>(Plays % constants::RankCount));
        EXPECT_TRUE(f.registry.Visit(sid, [](Session const& s) { debug::CheckInvariants(s); }));
    }
}
