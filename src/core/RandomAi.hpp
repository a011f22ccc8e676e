//
// RandomAi.hpp: random but legal-minded player driven by public projections
//

#ifndef BLUFFGAME_RANDOMAI_HPP
#define BLUFFGAME_RANDOMAI_HPP

#include "Actions.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace bluff::core
{
    class RandomAI
    {
    public:
        explicit RandomAI(uint64_t rng_seed, double challenge_rate = 0.25, double counter_rate = 0.15);

        // nullopt = nothing to do for this projection
        auto Decide(SessionView const& view, HandView const& hand, TimePoint now) -> std::optional<PlayerAction>;

    private:
        template <class Vec>
        auto pick(Vec const& v) -> std::size_t
        {
            return std::uniform_int_distribution<std::size_t>{0, v.size() - 1}(rng_);
        }

        auto chance(double p) -> bool { return std::bernoulli_distribution{p}(rng_); }

        auto PlayMove(SessionView const& view, HandView const& hand) -> PlayerAction;

    private:
        std::mt19937 rng_;
        double challenge_rate_;
        double counter_rate_;
    };
}

#endif //BLUFFGAME_RANDOMAI_HPP
