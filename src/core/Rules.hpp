//
// Rules.hpp: strategy that judges and applies in-game actions
//

#ifndef BLUFFGAME_RULES_HPP
#define BLUFFGAME_RULES_HPP

#include "Actions.hpp"
#include "Types.hpp"
#include "Exception.hpp"

namespace bluff::core
{
    //forward declaration
    class Session;

    class Rules
    {
    public:
        using CheckResult = error::ValidateResult;

        virtual ~Rules() = default;

        // Returns unexpected(reason) for ordinary rule violations (NOT exceptions).
        // Throw only for engine misuse / broken invariants.
        virtual auto Validate(Session const& session, PlyrIdxT actor,
                              PlayerAction const& a, TimePoint now) const -> CheckResult = 0;

        // Mutate authoritative state. Only called after Validate succeeded.
        virtual auto Apply(Session& session, PlyrIdxT actor,
                           PlayerAction const& a, TimePoint now) -> MoveOutcome = 0;
    };
}

#endif //BLUFFGAME_RULES_HPP
