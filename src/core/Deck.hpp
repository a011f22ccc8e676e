//
// Deck.hpp: shuffled multi-deck construction sized to the table
//

#ifndef BLUFFGAME_DECK_HPP
#define BLUFFGAME_DECK_HPP

#include <random>
#include "Types.hpp"

namespace bluff::core
{
    class DeckFactory
    {
    public:
        explicit DeckFactory(uint64_t seed);

        // deck_count x 52 cards, uniformly permuted
        auto Build(std::size_t deck_count) -> std::vector<Card>;

        // max(1, ceil(players / 5))
        static auto DeckCountFor(std::size_t player_count) noexcept -> std::size_t;
        // ceiling on cards in a single play
        static auto MaxPlayableFor(std::size_t player_count) noexcept -> std::size_t;

    private:
        std::mt19937_64 rng_;
    };
}

#endif //BLUFFGAME_DECK_HPP
