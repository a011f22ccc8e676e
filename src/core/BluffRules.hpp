//
// BluffRules.hpp: play validation and pile settlement (challenge / counter-challenge)
//

#ifndef BLUFFGAME_BLUFFRULES_HPP
#define BLUFFGAME_BLUFFRULES_HPP
#include <span>
#include "Rules.hpp"

namespace bluff::core
{
    class BluffRules final : public Rules
    {
    public:
        auto Validate(Session const& session, PlyrIdxT actor,
                      PlayerAction const& a, TimePoint now) const -> CheckResult override;
        auto Apply(Session& session, PlyrIdxT actor,
                   PlayerAction const& a, TimePoint now) -> MoveOutcome override;

        // true iff every card carries the claimed rank
        static auto IsTruthful(std::span<Card const> placed, Rank claimed) -> bool;
    };
}

#endif //BLUFFGAME_BLUFFRULES_HPP
