//
// Actions.hpp: in-game actions and their outcomes
//

#ifndef BLUFFGAME_ACTIONS_HPP
#define BLUFFGAME_ACTIONS_HPP

#include "Types.hpp"

namespace bluff::core
{
    // cards are named by value; ownership is checked against the actor's hand
    struct PlayAction      { std::vector<Card> cards; Rank claimed{Rank::Ace}; };
    struct ChallengeAction {};
    struct CounterAction   {};

    using PlayerAction = std::variant<PlayAction, ChallengeAction, CounterAction>;

    enum class MoveOutcome : uint8_t
    {
        Played,
        LiarTookPile,
        ChallengerTookPile,
        CounterApplied,
        CounterLapsed
    };

    // Which broadcast channel a public projection goes out on
    enum class StateEvent : uint8_t
    {
        Session, // membership changes: create, join, kick, departure
        Started,
        Game
    };
} // namespace bluff::core

#endif //BLUFFGAME_ACTIONS_HPP
