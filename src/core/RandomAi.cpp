//
// RandomAi.cpp
//

#include "RandomAi.hpp"
#include <algorithm>
#include <random>
#include <ranges>
#include <utility>

#include "Deck.hpp"

namespace bluff::core
{
    RandomAI::RandomAI(uint64_t const rng_seed, double const challenge_rate, double const counter_rate):
        rng_(static_cast<std::mt19937::result_type>(rng_seed)),
        challenge_rate_(challenge_rate),
        counter_rate_(counter_rate) {}

    auto RandomAI::Decide(SessionView const& view, HandView const& hand, TimePoint const now)
        -> std::optional<PlayerAction>
    {
        if (!view.started) return std::nullopt;

        bool const my_turn = view.current_turn && *view.current_turn == hand.player_id;
        bool const window_open = view.challenge_deadline && now <= *view.challenge_deadline;

        // the projection names the last actor only by display name
        auto const me = std::ranges::find(view.players, hand.player_id, &PlayerSummary::id);
        bool const last_was_mine = view.last_play && me != view.players.end()
                                   && view.last_play->actor_name == me->name;

        if (window_open && !last_was_mine && chance(challenge_rate_))
        {
            return ChallengeAction{};
        }
        if (view.last_play && !last_was_mine && chance(counter_rate_))
        {
            return CounterAction{};
        }
        if (my_turn && !hand.hand.empty())
        {
            return PlayMove(view, hand);
        }
        return std::nullopt;
    }

    auto RandomAI::PlayMove(SessionView const& view, HandView const& hand) -> PlayerAction
    {
        std::size_t const limit = DeckFactory::MaxPlayableFor(view.players.size());

        // prefer honest cards when holding the required rank
        std::vector<Card> honest;
        std::ranges::copy_if(hand.hand, std::back_inserter(honest),
                             [&](Card const& c) { return c.rank == view.required_rank; });

        std::vector<Card> pool = honest.empty() ? hand.hand : honest;
        std::ranges::shuffle(pool, rng_);

        std::size_t const upper = std::min(limit, pool.size());
        std::size_t const n = std::uniform_int_distribution<std::size_t>{1, upper}(rng_);
        pool.resize(n);

        return PlayAction{std::move(pool), view.required_rank};
    }
}
