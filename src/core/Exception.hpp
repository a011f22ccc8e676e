//
// Exception.hpp: engine-misuse exceptions and ordinary rule rejections
//

#ifndef BLUFFGAME_EXCEPTION_HPP
#define BLUFFGAME_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <expected>
#include <stdexcept>
#include <format>
#include <utility>
#include "Types.hpp"
#include "Actions.hpp"

namespace bluff::core::error
{
    enum class Code : unsigned
    {
        Rules, // rules engine misuse (not a rejected action)
        State, // session state misuse (not a rejected action)
        Assertion // internal assertion failed
    };

    struct RulesError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct StateError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg,
                     std::source_location const& loc = std::source_location::current()) -> void
    {
        switch (c)
        {
        case Code::Rules: throw RulesError(std::move(msg), c, loc);
        case Code::State: throw StateError(std::move(msg), c, loc);
        case Code::Assertion: throw AssertionError(std::move(msg), c, loc);
        }
        throw std::runtime_error(msg);
    }

#define BLF_THROW(code_enum, msg) ::bluff::core::error::fail((code_enum), (msg))
#define BLF_ASSERT(cond, msg) do { if(!(cond)) ::bluff::core::error::fail(::bluff::core::error::Code::Assertion, (msg)); } while(0)

    // Why an inbound action was refused; grouped by action type.
    enum class RejectCode : std::uint16_t
    {
        // Session lookup / membership
        Session_NotFound,
        Session_AlreadyStarted,
        Session_NotStarted,
        Session_Full,
        Player_NotInSession,

        // Lobby management
        Lobby_NotHost,
        Lobby_NotEnoughPlayers,
        Lobby_TargetNotFound,
        Lobby_CannotKickHost,

        // Play
        Play_NotYourTurn,
        Play_CountOutOfRange,
        Play_CardNotInHand,

        // Challenge
        Challenge_NoPlay,
        Challenge_WindowClosed,
        Challenge_PlayerGone,

        // Counter-challenge
        Counter_NoPlay,
        Counter_NotArmed,
        Counter_NotClaimant,
        Counter_PlayerGone,

        // Safety net
        Internal_Unreachable
    };

    // Compact, optional context carried with the rejection.
    struct Rejection
    {
        RejectCode code{};
        std::optional<PlayerId> actor{};
        std::optional<PlayerId> expected_actor{};
        std::optional<std::size_t> count{};
        std::optional<std::size_t> limit{};
        std::optional<std::size_t> players{};
        std::optional<Card> card{};

        auto with_actor(PlayerId id) -> Rejection&
        {
            actor = std::move(id);
            return *this;
        }

        auto with_expected(PlayerId id) -> Rejection&
        {
            expected_actor = std::move(id);
            return *this;
        }

        auto with_count(std::size_t v) -> Rejection&
        {
            count = v;
            return *this;
        }

        auto with_limit(std::size_t v) -> Rejection&
        {
            limit = v;
            return *this;
        }

        auto with_players(std::size_t v) -> Rejection&
        {
            players = v;
            return *this;
        }

        auto with_card(Card c) -> Rejection&
        {
            card = c;
            return *this;
        }
    };

    inline auto Reject(RejectCode code) -> Rejection
    {
        return Rejection{ .code = code };
    }

    inline auto to_string(RejectCode c) -> std::string_view
    {
        using E = RejectCode;
        switch (c)
        {
        case E::Session_NotFound: return "Session: not found";
        case E::Session_AlreadyStarted: return "Session: already started";
        case E::Session_NotStarted: return "Session: not started";
        case E::Session_Full: return "Session: player limit reached";
        case E::Player_NotInSession: return "Player: not in session";

        case E::Lobby_NotHost: return "Lobby: only the host may do this";
        case E::Lobby_NotEnoughPlayers: return "Lobby: not enough players to start";
        case E::Lobby_TargetNotFound: return "Lobby: kick target not in session";
        case E::Lobby_CannotKickHost: return "Lobby: host cannot be kicked";

        case E::Play_NotYourTurn: return "Play: not the caller's turn";
        case E::Play_CountOutOfRange: return "Play: card count out of range";
        case E::Play_CardNotInHand: return "Play: card not in caller's hand";

        case E::Challenge_NoPlay: return "Challenge: no play to challenge";
        case E::Challenge_WindowClosed: return "Challenge: window closed";
        case E::Challenge_PlayerGone: return "Challenge: challenged player left";

        case E::Counter_NoPlay: return "Counter: no unsettled play";
        case E::Counter_NotArmed: return "Counter: no other player has played since";
        case E::Counter_NotClaimant: return "Counter: caller is not the eligible player";
        case E::Counter_PlayerGone: return "Counter: recipient left, eligibility consumed";

        case E::Internal_Unreachable: return "Internal: unreachable";
        }
        return "Unknown";
    }

    inline auto describe(Rejection const& v) -> std::string
    {
        // Build a compact, reproducible message for logs/tests.
        auto s = std::format("{}", to_string(v.code));
        if (v.actor) s += std::format(" | actor={}", *v.actor);
        if (v.expected_actor) s += std::format(" | expected={}", *v.expected_actor);
        if (v.count) s += std::format(" | count={}", *v.count);
        if (v.limit) s += std::format(" | limit={}", *v.limit);
        if (v.players) s += std::format(" | players={}", *v.players);
        if (v.card) s += std::format(" | card={}{}", RankLabel(v.card->rank), SuitLabel(v.card->suit));
        return s;
    }

    using ValidateResult = std::expected<void, Rejection>;
    using ActionResult = std::expected<void, Rejection>;
}

#endif //BLUFFGAME_EXCEPTION_HPP
