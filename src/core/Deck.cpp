//
// Deck.cpp
//
#include "Deck.hpp"

#include <algorithm>

namespace bluff::core
{
    DeckFactory::DeckFactory(uint64_t const seed) :
        rng_{seed}
    {
    }

    auto DeckFactory::DeckCountFor(std::size_t const player_count) noexcept -> std::size_t
    {
        std::size_t const decks = (player_count + constants::PlayersPerDeck - 1) / constants::PlayersPerDeck;
        return std::max<std::size_t>(1, decks);
    }

    auto DeckFactory::MaxPlayableFor(std::size_t const player_count) noexcept -> std::size_t
    {
        return DeckCountFor(player_count) * constants::SuitCount;
    }

    auto DeckFactory::Build(std::size_t const deck_count) -> std::vector<Card>
    {
        std::vector<Card> deck;
        deck.reserve(deck_count * constants::CardsPerDeck);
        for (std::size_t d{}; d < deck_count; ++d)
        {
            for (std::size_t r{}; r < constants::RankCount; ++r)
            {
                for (std::size_t s{}; s < constants::SuitCount; ++s)
                {
                    deck.push_back(Card{static_cast<Rank>(r), static_cast<Suit>(s)});
                }
            }
        }
        std::ranges::shuffle(deck, rng_);
        return deck;
    }
}
