#include <gtest/gtest.h>
#include <chrono>
#include <cstddef>
#include <span>
#include <string>
#include <variant>
#include <vector>

#include "../core/Types.hpp"
#include "../core/State.hpp"
#include "../core/Exception.hpp"
#include "../net/Codec.hpp"

using namespace bluff::core;
namespace cnet = bluff::core::net;
namespace fbn = bluff::gen::net;

namespace
{
    inline std::span<const std::byte> AsBytes(const flatbuffers::DetachedBuffer& buf)
    {
        const uint8_t* p = buf.data();
        return {reinterpret_cast<const std::byte*>(p), buf.size()};
    }

    template <typename T>
    auto DecodeAs(flatbuffers::DetachedBuffer const& buf) -> T
    {
        auto const r = cnet::DecodeRequest(AsBytes(buf));
        EXPECT_TRUE(r.has_value()) << (r ? "" : r.error().message);
        if (!r) return T{};
        EXPECT_TRUE(std::holds_alternative<T>(r->request));
        return std::holds_alternative<T>(r->request) ? std::get<T>(r->request) : T{};
    }

    template <typename T>
    auto DecodeServerAs(flatbuffers::DetachedBuffer const& buf) -> T
    {
        auto const r = cnet::DecodeServerMessage(AsBytes(buf));
        EXPECT_TRUE(r.has_value()) << (r ? "" : r.error().message);
        if (!r || !std::holds_alternative<T>(*r)) return T{};
        return std::get<T>(*r);
    }
}

TEST(Codec, PlayRequestCarriesCardsAndClaim)
{
    std::vector<Card> const cards{{Rank::Ten, Suit::Hearts}, {Rank::King, Suit::Clubs}, {Rank::Ten, Suit::Hearts}};
    auto const buf = cnet::BuildRequest_Play("sid-1", "pid-1", cards, Rank::Jack, 41);

    auto const decoded = cnet::DecodeRequest(AsBytes(buf));
    ASSERT_TRUE(decoded);
    EXPECT_EQ(decoded->msg_id, 41u);
    ASSERT_TRUE(std::holds_alternative<cnet::PlayRequest>(decoded->request));

    auto const& play = std::get<cnet::PlayRequest>(decoded->request);
    EXPECT_EQ(play.session_id, "sid-1");
    EXPECT_EQ(play.by, "pid-1");
    EXPECT_EQ(play.play.cards, cards);
    EXPECT_EQ(play.play.claimed, Rank::Jack);
}

TEST(Codec, LobbyRequestsDecodeToTheirVariant)
{
    EXPECT_EQ(DecodeAs<cnet::CreateRequest>(cnet::BuildRequest_Create("alice", 1)).username, "alice");

    auto const join = DecodeAs<cnet::JoinRequest>(cnet::BuildRequest_Join("s", "bob", 2));
    EXPECT_EQ(join.session_id, "s");
    EXPECT_EQ(join.username, "bob");

    auto const kick = DecodeAs<cnet::KickRequest>(cnet::BuildRequest_Kick("s", "victim", "host", 3));
    EXPECT_EQ(kick.target, "victim");
    EXPECT_EQ(kick.by, "host");

    EXPECT_EQ(DecodeAs<cnet::StartRequest>(cnet::BuildRequest_Start("s", "host", 4)).by, "host");
    EXPECT_EQ(DecodeAs<cnet::ChallengeRequest>(cnet::BuildRequest_Challenge("s", "c", 5)).by, "c");
    EXPECT_EQ(DecodeAs<cnet::CounterRequest>(cnet::BuildRequest_Counter("s", "pb", 6)).by, "pb");
}

TEST(Codec, RejectsGarbageAndTruncation)
{
    std::vector<std::byte> junk(64, std::byte{0xAB});
    EXPECT_FALSE(cnet::DecodeRequest(junk));
    EXPECT_FALSE(cnet::DecodeRequest(std::span<std::byte const>{}));

    auto const buf = cnet::BuildRequest_Create("alice", 1);
    auto const bytes = AsBytes(buf);
    EXPECT_FALSE(cnet::DecodeRequest(bytes.first(bytes.size() / 2)));
}

TEST(Codec, ServerMessagesAreNotRequests)
{
    auto const buf = cnet::BuildSessionCreated("s", "p", 1);
    auto const r = cnet::DecodeRequest(AsBytes(buf));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().message, "not a RequestMsg");
}

TEST(Codec, OutOfRangeRankIsRejected)
{
    flatbuffers::FlatBufferBuilder fbb;
    auto const s = fbb.CreateString("s");
    auto const b = fbb.CreateString("p");
    std::vector<flatbuffers::Offset<fbn::Card>> v{fbn::CreateCard(fbb, fbn::Rank::Ace, fbn::Suit::Spades)};
    auto const cards = fbb.CreateVector(v);
    auto const play = fbn::CreateRequest_Play(fbb, s, b, cards, static_cast<fbn::Rank>(13));
    auto const m = fbn::CreateRequestMsg(fbb, 1, fbn::Request::Request_Play, play.Union());
    fbb.Finish(fbn::CreateEnvelope(fbb, fbn::Message::RequestMsg, m.Union()));
    auto const buf = fbb.Release();

    auto const r = cnet::DecodeRequest(AsBytes(buf));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().message, "claimed rank out of range");
}

TEST(Codec, TaggedUnionWithoutBodyIsRejected)
{
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const m = fbn::CreateRequestMsg(fbb, 1, fbn::Request::Request_Play, flatbuffers::Offset<void>());
        fbb.Finish(fbn::CreateEnvelope(fbb, fbn::Message::RequestMsg, m.Union()));
        auto const buf = fbb.Release();

        auto const r = cnet::DecodeRequest(AsBytes(buf));
        ASSERT_FALSE(r);
        EXPECT_EQ(r.error().message, "empty request body");
    }
    {
        flatbuffers::FlatBufferBuilder fbb;
        fbb.Finish(fbn::CreateEnvelope(fbb, fbn::Message::RequestMsg, flatbuffers::Offset<void>()));
        auto const buf = fbb.Release();

        auto const r = cnet::DecodeRequest(AsBytes(buf));
        ASSERT_FALSE(r);
        EXPECT_EQ(r.error().message, "empty RequestMsg");
    }
    {
        flatbuffers::FlatBufferBuilder fbb;
        fbb.Finish(fbn::CreateEnvelope(fbb, fbn::Message::PlayerHand, flatbuffers::Offset<void>()));
        auto const buf = fbb.Release();

        auto const r = cnet::DecodeServerMessage(AsBytes(buf));
        ASSERT_FALSE(r);
        EXPECT_EQ(r.error().message, "empty message body");
    }
}

TEST(Codec, SessionStateKeepsProjectionFields)
{
    SessionView v{};
    v.id = "sid";
    v.players = {PlayerSummary{"a", "Alice", true, 17}, PlayerSummary{"b", "Bob", false, 18}};
    v.started = true;
    v.current_turn = "b";
    v.required_rank = Rank::Seven;
    v.last_play = LastPlaySummary{"Alice", 3, Rank::Six};
    v.pile_count = 9;
    v.challenge_deadline = TimePoint{std::chrono::milliseconds{1735689605123}};

    auto const msg = DecodeServerAs<cnet::StateMsg>(cnet::BuildSessionState(v, StateEvent::Game));
    EXPECT_EQ(msg.event, StateEvent::Game);
    EXPECT_EQ(msg.view.id, "sid");
    ASSERT_EQ(msg.view.players.size(), 2u);
    EXPECT_EQ(msg.view.players[1].name, "Bob");
    EXPECT_EQ(msg.view.players[1].card_count, 18u);
    EXPECT_TRUE(msg.view.players[0].is_host);
    EXPECT_EQ(msg.view.current_turn, std::optional<PlayerId>{"b"});
    EXPECT_EQ(msg.view.required_rank, Rank::Seven);
    ASSERT_TRUE(msg.view.last_play.has_value());
    EXPECT_EQ(msg.view.last_play->count, 3u);
    EXPECT_EQ(msg.view.last_play->claimed, Rank::Six);
    EXPECT_EQ(msg.view.pile_count, 9u);
    EXPECT_EQ(msg.view.challenge_deadline, v.challenge_deadline);
}

TEST(Codec, LobbyStateHasNoTurnOrDeadline)
{
    SessionView v{};
    v.id = "lobby";
    v.players = {PlayerSummary{"a", "Alice", true, 0}};

    auto const msg = DecodeServerAs<cnet::StateMsg>(cnet::BuildSessionState(v, StateEvent::Session));
    EXPECT_EQ(msg.event, StateEvent::Session);
    EXPECT_FALSE(msg.view.started);
    EXPECT_FALSE(msg.view.current_turn.has_value());
    EXPECT_FALSE(msg.view.last_play.has_value());
    EXPECT_FALSE(msg.view.challenge_deadline.has_value());
}

TEST(Codec, HandAndViolation)
{
    HandView const h{"me", {{Rank::Ace, Suit::Spades}, {Rank::Queen, Suit::Diamonds}}};
    auto const hand = DecodeServerAs<HandView>(cnet::BuildPlayerHand(h));
    EXPECT_EQ(hand.player_id, "me");
    EXPECT_EQ(hand.hand, h.hand);

    error::Rejection why = error::Reject(error::RejectCode::Play_CountOutOfRange);
    why.with_count(9).with_limit(4);
    auto const vio = DecodeServerAs<cnet::ViolationMsg>(cnet::BuildViolation(why, 77));
    EXPECT_EQ(vio.msg_id, 77u);
    EXPECT_EQ(vio.code, static_cast<int16_t>(error::RejectCode::Play_CountOutOfRange));
    EXPECT_EQ(vio.text, error::describe(why));
}

TEST(Codec, JoinResultOutcome)
{
    auto const ok = DecodeServerAs<cnet::JoinResultMsg>(cnet::BuildJoinResult(true, "s", "p", 3));
    EXPECT_TRUE(ok.ok);
    EXPECT_EQ(ok.player_id, "p");

    auto const refused = DecodeServerAs<cnet::JoinResultMsg>(cnet::BuildJoinResult(false, {}, {}, 4));
    EXPECT_FALSE(refused.ok);
    EXPECT_EQ(refused.msg_id, 4u);
    EXPECT_TRUE(refused.session_id.empty());
}
