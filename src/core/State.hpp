//
// State.hpp: outbound projections of a session
//

#ifndef BLUFFGAME_STATE_HPP
#define BLUFFGAME_STATE_HPP

#include "Types.hpp"
#include "Actions.hpp"

namespace bluff::core
{
    struct PlayerSummary
    {
        PlayerId    id;
        std::string name;
        bool        is_host{false};
        std::size_t card_count{};
    };

    struct LastPlaySummary
    {
        std::string actor_name;
        std::size_t count{};
        Rank        claimed{Rank::Ace};
    };

    // Public projection broadcast to every member. Never carries hand contents.
    struct SessionView
    {
        SessionId                      id;
        std::vector<PlayerSummary>     players;
        bool                           started{false};
        std::optional<PlayerId>        current_turn;
        Rank                           required_rank{Rank::Ace};
        std::optional<LastPlaySummary> last_play;
        std::size_t                    pile_count{};
        std::optional<TimePoint>       challenge_deadline;
    };

    // Private delivery, sent to the owning connection only
    struct HandView
    {
        PlayerId          player_id;
        std::vector<Card> hand;
    };

} // namespace bluff::core

#endif //BLUFFGAME_STATE_HPP
