//
// Codec.hpp: FlatBuffers envelopes <-> engine values
//

#ifndef BLUFFGAME_CODEC_HPP
#define BLUFFGAME_CODEC_HPP

#include <cstddef>   // std::byte
#include <cstdint>
#include <span>
#include <variant>
#include <vector>
#include <string>
#include <expected>
#include <flatbuffers/flatbuffers.h>

#include "../core/Types.hpp"
#include "../core/Actions.hpp"
#include "../core/State.hpp"
#include "../core/Exception.hpp"

#include "generated/flatbuffers/bluff_net_generated.h"

namespace bluff::core::net
{
    struct ParseError
    {
        std::string message;
    };

    // ----- Inbound requests (client -> server) -----
    struct CreateRequest    { std::string username; };
    struct JoinRequest      { SessionId session_id; std::string username; };
    struct KickRequest      { SessionId session_id; PlayerId target; PlayerId by; };
    struct StartRequest     { SessionId session_id; PlayerId by; };
    struct PlayRequest      { SessionId session_id; PlayerId by; PlayAction play; };
    struct ChallengeRequest { SessionId session_id; PlayerId by; };
    struct CounterRequest   { SessionId session_id; PlayerId by; };

    using Request = std::variant<CreateRequest, JoinRequest, KickRequest, StartRequest,
                                 PlayRequest, ChallengeRequest, CounterRequest>;

    struct DecodedRequest
    {
        std::uint64_t msg_id{};
        Request request{};
    };

    // ----- Outbound messages as a client sees them (server -> client) -----
    struct SessionCreatedMsg { std::uint64_t msg_id{}; SessionId session_id; PlayerId player_id; };
    struct JoinResultMsg     { std::uint64_t msg_id{}; bool ok{false}; SessionId session_id; PlayerId player_id; };
    struct StateMsg          { StateEvent event{}; SessionView view; };
    struct ViolationMsg      { std::uint64_t msg_id{}; std::int16_t code{}; std::string text; };

    using ServerMessage = std::variant<SessionCreatedMsg, JoinResultMsg, StateMsg, HandView, ViolationMsg>;

    auto ToFbSuit(Suit s) noexcept -> bluff::gen::net::Suit;
    auto ToFbRank(Rank r) noexcept -> bluff::gen::net::Rank;
    auto ToFbEvent(StateEvent e) noexcept -> bluff::gen::net::StateEvent;

    auto FromFbSuit(bluff::gen::net::Suit s) noexcept -> Suit;
    auto FromFbRank(bluff::gen::net::Rank r) noexcept -> Rank;
    auto FromFbEvent(bluff::gen::net::StateEvent e) noexcept -> StateEvent;

    // ----- Server -> client builders -----
    auto BuildSessionCreated(SessionId const& sid, PlayerId const& pid, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    // sid/pid are empty when ok is false
    auto BuildJoinResult(bool ok, SessionId const& sid, PlayerId const& pid, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto BuildSessionState(SessionView const& view, StateEvent event) -> flatbuffers::DetachedBuffer;
    auto BuildPlayerHand(HandView const& hand) -> flatbuffers::DetachedBuffer;

    auto BuildViolation(error::Rejection const& v, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    // ----- Client -> server builders -----
    auto BuildRequest_Create(std::string const& username, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;
    auto BuildRequest_Join(SessionId const& sid, std::string const& username, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;
    auto BuildRequest_Kick(SessionId const& sid, PlayerId const& target, PlayerId const& by, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;
    auto BuildRequest_Start(SessionId const& sid, PlayerId const& by, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;
    auto BuildRequest_Play(SessionId const& sid, PlayerId const& by, std::span<Card const> cards,
                           Rank claimed, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;
    auto BuildRequest_Challenge(SessionId const& sid, PlayerId const& by, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;
    auto BuildRequest_Counter(SessionId const& sid, PlayerId const& by, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    // ----- Decode (verified, and empty union bodies rejected, before any field is read) -----
    auto DecodeRequest(std::span<std::byte const> bytes) -> std::expected<DecodedRequest, ParseError>;
    auto DecodeServerMessage(std::span<std::byte const> bytes) -> std::expected<ServerMessage, ParseError>;
} // namespace bluff::core::net

#endif //BLUFFGAME_CODEC_HPP
