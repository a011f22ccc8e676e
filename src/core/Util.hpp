//
// Util.hpp: card tallies and identifier generation
//

#ifndef BLUFFGAME_UTIL_HPP
#define BLUFFGAME_UTIL_HPP

#include <algorithm>
#include <array>
#include <format>
#include <random>
#include <span>
#include <string>
#include "Types.hpp"

namespace bluff::core::util
{
    inline auto CardToUID(Card const& c) -> std::size_t
    {
        return static_cast<std::size_t>(c.suit) * constants::RankCount + static_cast<std::size_t>(c.rank);
    }

    inline auto CardFromUID(std::size_t const uid) -> Card
    {
        return Card{static_cast<Rank>(uid % constants::RankCount), static_cast<Suit>(uid / constants::RankCount)};
    }

    // Multiset of cards keyed by rank+suit. Multi-deck games hold duplicates,
    // so ownership checks compare counts rather than presence.
    class CardTally
    {
    public:
        CardTally() : counts_{} {}

        explicit CardTally(std::span<Card const> cards) : counts_{}
        {
            for (Card const& c : cards) Add(c);
        }

        auto Add(Card const& c) -> void { ++counts_[CardToUID(c)]; }

        [[nodiscard]]
        auto Count(Card const& c) const -> std::size_t { return counts_[CardToUID(c)]; }

        // first card whose count here exceeds the count in `owner`
        [[nodiscard]]
        auto FirstExcess(CardTally const& owner) const -> std::optional<Card>
        {
            for (std::size_t uid{}; uid < counts_.size(); ++uid)
            {
                if (counts_[uid] > owner.counts_[uid]) return CardFromUID(uid);
            }
            return std::nullopt;
        }

        [[nodiscard]]
        auto Counts() const -> std::array<std::size_t, constants::CardsPerDeck> const& { return counts_; }

    private:
        std::array<std::size_t, constants::CardsPerDeck> counts_;
    };

    // RFC 4122 version-4 layout drawn from the caller's generator
    inline auto MakeUuid(std::mt19937_64& rng) -> std::string
    {
        uint64_t hi = rng();
        uint64_t lo = rng();
        hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
        lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;
        return std::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
                           hi >> 32, (hi >> 16) & 0xFFFFULL, hi & 0xFFFFULL,
                           lo >> 48, lo & 0xFFFFFFFFFFFFULL);
    }
}

#endif //BLUFFGAME_UTIL_HPP
