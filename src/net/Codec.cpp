//
// Codec.cpp
//
#include "Codec.hpp"

#include <algorithm>
#include <chrono>
#include <utility>
#include <vector>

namespace fbn = bluff::gen::net;

namespace
{
    // Verify enum layouts (both ends of each enum catch drift)
    static_assert((int)bluff::core::Suit::Spades == (int)fbn::Suit::Spades);
    static_assert((int)bluff::core::Suit::Clubs == (int)fbn::Suit::Clubs);
    static_assert((int)bluff::core::Rank::Ace == (int)fbn::Rank::Ace);
    static_assert((int)bluff::core::Rank::King == (int)fbn::Rank::King);
    static_assert((int)bluff::core::StateEvent::Game == (int)fbn::StateEvent::Game);

    // the verifier checks offsets, not enum ranges
    template <typename E>
    auto in_range(E const v) -> bool
    {
        return v >= E::MIN && v <= E::MAX;
    }

    inline auto str(flatbuffers::String const* s) -> std::string
    {
        return s ? s->str() : std::string{};
    }

    inline auto to_epoch_ms(bluff::core::TimePoint const tp) -> int64_t
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    }

    inline auto from_epoch_ms(int64_t const ms) -> bluff::core::TimePoint
    {
        return bluff::core::TimePoint{
            std::chrono::duration_cast<bluff::core::WallClock::duration>(std::chrono::milliseconds{ms})};
    }

    auto verified_envelope(std::span<std::byte const> bytes)
        -> std::expected<fbn::Envelope const*, bluff::core::net::ParseError>
    {
        using bluff::core::net::ParseError;
        if (bytes.size() < sizeof(flatbuffers::uoffset_t))
            return std::unexpected(ParseError{"buffer too small"});

        auto const* data = reinterpret_cast<uint8_t const*>(bytes.data());
        flatbuffers::Verifier verifier(data, bytes.size());
        if (!fbn::VerifyEnvelopeBuffer(verifier))
            return std::unexpected(ParseError{"envelope failed verification"});

        return fbn::GetEnvelope(data);
    }

    auto cards_from_fb(flatbuffers::Vector<flatbuffers::Offset<fbn::Card>> const* v)
        -> std::expected<std::vector<bluff::core::Card>, bluff::core::net::ParseError>
    {
        std::vector<bluff::core::Card> out;
        if (!v) return out;
        out.reserve(v->size());
        for (auto const* c : *v)
        {
            if (!in_range(c->rank()) || !in_range(c->suit()))
                return std::unexpected(bluff::core::net::ParseError{"card out of range"});
            out.push_back(bluff::core::Card{bluff::core::net::FromFbRank(c->rank()),
                                            bluff::core::net::FromFbSuit(c->suit())});
        }
        return out;
    }

    auto cards_to_fb(flatbuffers::FlatBufferBuilder& fbb, std::span<bluff::core::Card const> cards)
        -> flatbuffers::Offset<flatbuffers::Vector<flatbuffers::Offset<fbn::Card>>>
    {
        std::vector<flatbuffers::Offset<fbn::Card>> vec;
        vec.reserve(cards.size());
        for (bluff::core::Card const& c : cards)
        {
            vec.push_back(fbn::CreateCard(fbb, bluff::core::net::ToFbRank(c.rank),
                                          bluff::core::net::ToFbSuit(c.suit)));
        }
        return fbb.CreateVector(vec);
    }

    template <typename T>
    auto finish_request(flatbuffers::FlatBufferBuilder& fbb, std::uint64_t const msg_id,
                        fbn::Request const kind, flatbuffers::Offset<T> const body)
        -> flatbuffers::DetachedBuffer
    {
        auto const m = fbn::CreateRequestMsg(fbb, msg_id, kind, body.Union());
        auto const e = fbn::CreateEnvelope(fbb, fbn::Message::RequestMsg, m.Union());
        fbb.Finish(e);
        return fbb.Release();
    }

    template <typename T>
    auto finish_message(flatbuffers::FlatBufferBuilder& fbb, fbn::Message const kind,
                        flatbuffers::Offset<T> const body) -> flatbuffers::DetachedBuffer
    {
        auto const e = fbn::CreateEnvelope(fbb, kind, body.Union());
        fbb.Finish(e);
        return fbb.Release();
    }
} // anonymous

namespace bluff::core::net
{
    auto ToFbSuit(Suit const s) noexcept -> fbn::Suit { return static_cast<fbn::Suit>(s); }
    auto ToFbRank(Rank const r) noexcept -> fbn::Rank { return static_cast<fbn::Rank>(r); }
    auto ToFbEvent(StateEvent const e) noexcept -> fbn::StateEvent { return static_cast<fbn::StateEvent>(e); }

    auto FromFbSuit(fbn::Suit const s) noexcept -> Suit { return static_cast<Suit>(s); }
    auto FromFbRank(fbn::Rank const r) noexcept -> Rank { return static_cast<Rank>(r); }
    auto FromFbEvent(fbn::StateEvent const e) noexcept -> StateEvent { return static_cast<StateEvent>(e); }

    // ---------- Server -> client ----------

    auto BuildSessionCreated(SessionId const& sid, PlayerId const& pid, std::uint64_t const msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const s = fbb.CreateString(sid);
        auto const p = fbb.CreateString(pid);
        return finish_message(fbb, fbn::Message::SessionCreated, fbn::CreateSessionCreated(fbb, msg_id, s, p));
    }

    auto BuildJoinResult(bool const ok, SessionId const& sid, PlayerId const& pid, std::uint64_t const msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const s = fbb.CreateString(sid);
        auto const p = fbb.CreateString(pid);
        return finish_message(fbb, fbn::Message::JoinResult, fbn::CreateJoinResult(fbb, msg_id, ok, s, p));
    }

    auto BuildSessionState(SessionView const& view, StateEvent const event) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;

        std::vector<flatbuffers::Offset<fbn::PlayerSummary>> players;
        players.reserve(view.players.size());
        for (PlayerSummary const& p : view.players)
        {
            auto const id = fbb.CreateString(p.id);
            auto const name = fbb.CreateString(p.name);
            players.push_back(fbn::CreatePlayerSummary(fbb, id, name, p.is_host,
                                                       static_cast<uint32_t>(p.card_count)));
        }
        auto const players_vec = fbb.CreateVector(players);
        auto const sid = fbb.CreateString(view.id);

        flatbuffers::Offset<flatbuffers::String> turn{};
        if (view.current_turn) turn = fbb.CreateString(*view.current_turn);

        flatbuffers::Offset<fbn::LastPlay> last{};
        if (view.last_play)
        {
            auto const actor = fbb.CreateString(view.last_play->actor_name);
            last = fbn::CreateLastPlay(fbb, actor, static_cast<uint32_t>(view.last_play->count),
                                       ToFbRank(view.last_play->claimed));
        }

        auto const st = fbn::CreateSessionState(
            fbb,
            /*event*/ ToFbEvent(event),
            /*session_id*/ sid,
            /*players*/ players_vec,
            /*started*/ view.started,
            /*current_turn_id*/ turn,
            /*required_rank*/ ToFbRank(view.required_rank),
            /*last_play*/ last,
            /*pile_count*/ static_cast<uint32_t>(view.pile_count),
            /*has_challenge_deadline*/ view.challenge_deadline.has_value(),
            /*challenge_deadline_ms*/ view.challenge_deadline ? to_epoch_ms(*view.challenge_deadline) : 0
        );
        return finish_message(fbb, fbn::Message::SessionState, st);
    }

    auto BuildPlayerHand(HandView const& hand) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const pid = fbb.CreateString(hand.player_id);
        auto const cards = cards_to_fb(fbb, hand.hand);
        return finish_message(fbb, fbn::Message::PlayerHand, fbn::CreatePlayerHand(fbb, pid, cards));
    }

    auto BuildViolation(error::Rejection const& v, std::uint64_t const msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const txt = fbb.CreateString(error::describe(v));
        auto const vio = fbn::CreateViolation(fbb, msg_id, static_cast<int16_t>(v.code), txt);
        return finish_message(fbb, fbn::Message::Violation, vio);
    }

    // ---------- Client -> server ----------

    auto BuildRequest_Create(std::string const& username, std::uint64_t const msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const name = fbb.CreateString(username);
        return finish_request(fbb, msg_id, fbn::Request::Request_Create, fbn::CreateRequest_Create(fbb, name));
    }

    auto BuildRequest_Join(SessionId const& sid, std::string const& username, std::uint64_t const msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const s = fbb.CreateString(sid);
        auto const name = fbb.CreateString(username);
        return finish_request(fbb, msg_id, fbn::Request::Request_Join, fbn::CreateRequest_Join(fbb, s, name));
    }

    auto BuildRequest_Kick(SessionId const& sid, PlayerId const& target, PlayerId const& by,
                           std::uint64_t const msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const s = fbb.CreateString(sid);
        auto const t = fbb.CreateString(target);
        auto const b = fbb.CreateString(by);
        return finish_request(fbb, msg_id, fbn::Request::Request_Kick, fbn::CreateRequest_Kick(fbb, s, t, b));
    }

    auto BuildRequest_Start(SessionId const& sid, PlayerId const& by, std::uint64_t const msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const s = fbb.CreateString(sid);
        auto const b = fbb.CreateString(by);
        return finish_request(fbb, msg_id, fbn::Request::Request_Start, fbn::CreateRequest_Start(fbb, s, b));
    }

    auto BuildRequest_Play(SessionId const& sid, PlayerId const& by, std::span<Card const> cards,
                           Rank const claimed, std::uint64_t const msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const s = fbb.CreateString(sid);
        auto const b = fbb.CreateString(by);
        auto const vec = cards_to_fb(fbb, cards);
        auto const play = fbn::CreateRequest_Play(fbb, s, b, vec, ToFbRank(claimed));
        return finish_request(fbb, msg_id, fbn::Request::Request_Play, play);
    }

    auto BuildRequest_Challenge(SessionId const& sid, PlayerId const& by, std::uint64_t const msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const s = fbb.CreateString(sid);
        auto const b = fbb.CreateString(by);
        return finish_request(fbb, msg_id, fbn::Request::Request_Challenge, fbn::CreateRequest_Challenge(fbb, s, b));
    }

    auto BuildRequest_Counter(SessionId const& sid, PlayerId const& by, std::uint64_t const msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const s = fbb.CreateString(sid);
        auto const b = fbb.CreateString(by);
        return finish_request(fbb, msg_id, fbn::Request::Request_Counter, fbn::CreateRequest_Counter(fbb, s, b));
    }

    // ---------- Decode (server <- client) ----------

    auto DecodeRequest(std::span<std::byte const> bytes) -> std::expected<DecodedRequest, ParseError>
    {
        auto const env = verified_envelope(bytes);
        if (!env) return std::unexpected(env.error());

        if ((*env)->message_type() != fbn::Message::RequestMsg)
            return std::unexpected(ParseError{"not a RequestMsg"});

        // the union verifier accepts an absent table, so a tagged union may still be empty
        auto const* msg = (*env)->message_as_RequestMsg();
        if (msg == nullptr) return std::unexpected(ParseError{"empty RequestMsg"});
        if (msg->request() == nullptr) return std::unexpected(ParseError{"empty request body"});

        DecodedRequest out{};
        out.msg_id = msg->msg_id();

        switch (msg->request_type())
        {
        case fbn::Request::Request_Create:
        {
            auto const* r = msg->request_as_Request_Create();
            out.request = CreateRequest{str(r->username())};
            return out;
        }
        case fbn::Request::Request_Join:
        {
            auto const* r = msg->request_as_Request_Join();
            out.request = JoinRequest{str(r->session_id()), str(r->username())};
            return out;
        }
        case fbn::Request::Request_Kick:
        {
            auto const* r = msg->request_as_Request_Kick();
            out.request = KickRequest{str(r->session_id()), str(r->target_id()), str(r->by())};
            return out;
        }
        case fbn::Request::Request_Start:
        {
            auto const* r = msg->request_as_Request_Start();
            out.request = StartRequest{str(r->session_id()), str(r->by())};
            return out;
        }
        case fbn::Request::Request_Play:
        {
            auto const* r = msg->request_as_Request_Play();
            if (!in_range(r->claimed_rank()))
                return std::unexpected(ParseError{"claimed rank out of range"});

            auto cards = cards_from_fb(r->cards());
            if (!cards) return std::unexpected(cards.error());

            out.request = PlayRequest{str(r->session_id()), str(r->by()),
                                      PlayAction{std::move(*cards), FromFbRank(r->claimed_rank())}};
            return out;
        }
        case fbn::Request::Request_Challenge:
        {
            auto const* r = msg->request_as_Request_Challenge();
            out.request = ChallengeRequest{str(r->session_id()), str(r->by())};
            return out;
        }
        case fbn::Request::Request_Counter:
        {
            auto const* r = msg->request_as_Request_Counter();
            out.request = CounterRequest{str(r->session_id()), str(r->by())};
            return out;
        }
        default:
            return std::unexpected(ParseError{"unknown request variant"});
        }
    }

    // ---------- Decode (client <- server) ----------

    auto DecodeServerMessage(std::span<std::byte const> bytes) -> std::expected<ServerMessage, ParseError>
    {
        auto const env = verified_envelope(bytes);
        if (!env) return std::unexpected(env.error());
        if ((*env)->message() == nullptr) return std::unexpected(ParseError{"empty message body"});

        switch ((*env)->message_type())
        {
        case fbn::Message::SessionCreated:
        {
            auto const* m = (*env)->message_as_SessionCreated();
            return SessionCreatedMsg{m->msg_id(), str(m->session_id()), str(m->player_id())};
        }
        case fbn::Message::JoinResult:
        {
            auto const* m = (*env)->message_as_JoinResult();
            return JoinResultMsg{m->msg_id(), m->ok(), str(m->session_id()), str(m->player_id())};
        }
        case fbn::Message::SessionState:
        {
            auto const* m = (*env)->message_as_SessionState();
            if (!in_range(m->event()) || !in_range(m->required_rank()))
                return std::unexpected(ParseError{"state enum out of range"});

            StateMsg out{};
            out.event = FromFbEvent(m->event());
            out.view.id = str(m->session_id());
            out.view.started = m->started();
            out.view.required_rank = FromFbRank(m->required_rank());
            out.view.pile_count = m->pile_count();
            if (auto const* players = m->players())
            {
                out.view.players.reserve(players->size());
                for (auto const* p : *players)
                {
                    out.view.players.push_back(PlayerSummary{str(p->id()), str(p->name()),
                                                             p->is_host(), p->card_count()});
                }
            }
            if (m->current_turn_id()) out.view.current_turn = m->current_turn_id()->str();
            if (auto const* lp = m->last_play())
            {
                if (!in_range(lp->claimed()))
                    return std::unexpected(ParseError{"claimed rank out of range"});
                out.view.last_play = LastPlaySummary{str(lp->actor_name()), lp->count(), FromFbRank(lp->claimed())};
            }
            if (m->has_challenge_deadline())
                out.view.challenge_deadline = from_epoch_ms(m->challenge_deadline_ms());
            return out;
        }
        case fbn::Message::PlayerHand:
        {
            auto const* m = (*env)->message_as_PlayerHand();
            auto cards = cards_from_fb(m->hand());
            if (!cards) return std::unexpected(cards.error());
            return HandView{str(m->player_id()), std::move(*cards)};
        }
        case fbn::Message::Violation:
        {
            auto const* m = (*env)->message_as_Violation();
            return ViolationMsg{m->msg_id(), m->code(), str(m->text())};
        }
        default:
            return std::unexpected(ParseError{"not a server message"});
        }
    }
} // namespace bluff::core::net
