//
// BluffRules.cpp
//

#include "BluffRules.hpp"

#include "Session.hpp"
#include "Util.hpp"
#include <algorithm>
#include <ranges>

namespace
{
    inline auto Viol(bluff::core::error::RejectCode code) -> bluff::core::error::Rejection
    {
        return bluff::core::error::Rejection{ .code = code };
    }
}

namespace bluff::core
{
    auto BluffRules::IsTruthful(std::span<Card const> placed, Rank const claimed) -> bool
    {
        return std::ranges::all_of(placed, [claimed](Card const& c) { return c.rank == claimed; });
    }

auto BluffRules::Validate(Session const& session, PlyrIdxT const actor,
                          PlayerAction const& a, TimePoint const now) const -> CheckResult
{
    using RVC = ::bluff::core::error::RejectCode;

    PlayerId const& actor_id = session.players_.at(actor).id;

    return std::visit([&]<typename T0>(T0 const& act) -> CheckResult
    {
        using T = std::decay_t<T0>;

        if constexpr (std::is_same_v<T, PlayAction>)
        {
            if (actor != session.turn_idx_)
                return std::unexpected(Viol(RVC::Play_NotYourTurn)
                                       .with_actor(actor_id)
                                       .with_expected(session.players_.at(session.turn_idx_).id));

            std::size_t const limit = session.MaxPlayable();
            if (act.cards.empty() || act.cards.size() > limit)
                return std::unexpected(Viol(RVC::Play_CountOutOfRange)
                                       .with_actor(actor_id)
                                       .with_count(act.cards.size())
                                       .with_limit(limit));

            // multi-deck games hold duplicates, so compare multiplicities
            util::CardTally const named{std::span{act.cards}};
            util::CardTally const owned{std::span{session.players_.at(actor).hand}};
            if (std::optional<Card> const missing = named.FirstExcess(owned))
                return std::unexpected(Viol(RVC::Play_CardNotInHand)
                                       .with_actor(actor_id).with_card(*missing));

            return {};
        }
        else if constexpr (std::is_same_v<T, ChallengeAction>)
        {
            if (!session.last_play_)
                return std::unexpected(Viol(RVC::Challenge_NoPlay).with_actor(actor_id));

            if (!session.window_.IsOpen(now))
                return std::unexpected(Viol(RVC::Challenge_WindowClosed).with_actor(actor_id));

            if (!session.IndexOf(session.last_play_->actor))
                return std::unexpected(Viol(RVC::Challenge_PlayerGone)
                                       .with_actor(actor_id).with_expected(session.last_play_->actor));

            BLF_ASSERT(session.last_play_->count <= session.pile_.size(), "Last play larger than pile");
            return {};
        }
        else if constexpr (std::is_same_v<T, CounterAction>)
        {
            if (!session.last_play_)
                return std::unexpected(Viol(RVC::Counter_NoPlay).with_actor(actor_id));

            if (!session.gate_ || !session.gate_->armed)
                return std::unexpected(Viol(RVC::Counter_NotArmed).with_actor(actor_id));

            if (session.gate_->claimant != actor_id)
                return std::unexpected(Viol(RVC::Counter_NotClaimant)
                                       .with_actor(actor_id).with_expected(session.gate_->claimant));

            return {};
        }
        else
        {
            return std::unexpected(Viol(RVC::Internal_Unreachable));
        }
    }, a);
}

auto BluffRules::Apply(Session& session, PlyrIdxT const actor,
                       PlayerAction const& a, TimePoint const now) -> MoveOutcome
{
    return std::visit([&]<typename T0>(T0 const& act) -> MoveOutcome
    {
        using T = std::decay_t<T0>;
        PlayerSeat const& seat = session.players_.at(actor);

        if constexpr (std::is_same_v<T, PlayAction>)
        {
            // counter gate looks at the play being superseded
            if (session.last_play_ && session.last_play_->actor != seat.id)
                session.gate_ = CounterGate{session.last_play_->actor, true};
            else
                session.gate_ = CounterGate{seat.id, false};

            session.MoveHandToPile(actor, std::span{act.cards});
            session.last_play_ = PlayRecord{seat.id, seat.name, act.cards.size(), act.claimed};
            session.window_.Stamp(now);

            session.AdvanceTurn();
            session.AdvanceRank();
            return MoveOutcome::Played;
        }
        else if constexpr (std::is_same_v<T, ChallengeAction>)
        {
            PlayRecord const challenged = *session.last_play_;
            std::optional<PlyrIdxT> const liar_idx = session.IndexOf(challenged.actor);
            BLF_ASSERT(liar_idx.has_value(), "Challenged player vanished after validation");

            // exactly the cards the challenged play placed
            std::span<Card const> const placed =
                std::span{session.pile_}.last(challenged.count);
            bool const truthful = IsTruthful(placed, challenged.claimed);

            PlyrIdxT const loser = truthful ? actor : *liar_idx;
            PlayerId const loser_id = session.players_.at(loser).id;
            std::size_t const moved = session.MovePileToHand(loser);
            session.ClearRound();

            MoveOutcome const out = truthful ? MoveOutcome::ChallengerTookPile : MoveOutcome::LiarTookPile;
            session.last_settlement_ = Settlement{out, loser_id, moved};
            return out;
        }
        else if constexpr (std::is_same_v<T, CounterAction>)
        {
            // eligibility is spent as soon as the claimant invokes it
            session.gate_.reset();

            std::optional<PlyrIdxT> const recipient = session.IndexOf(session.last_play_->actor);
            if (!recipient)
            {
                return MoveOutcome::CounterLapsed;
            }

            PlayerId const recipient_id = session.players_.at(*recipient).id;
            std::size_t const moved = session.MovePileToHand(*recipient);
            session.ClearRound();
            session.last_settlement_ = Settlement{MoveOutcome::CounterApplied, recipient_id, moved};
            return MoveOutcome::CounterApplied;
        }
        else
        {
            BLF_THROW(error::Code::Rules, "Unhandled action in Apply");
        }
    }, a);
}
}
