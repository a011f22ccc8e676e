//
// Types.hpp: cards, identifiers and engine configuration
//

#ifndef BLUFFGAME_TYPES_HPP
#define BLUFFGAME_TYPES_HPP

#define BLF_ENABLE_TEST_HOOKS true

#include <cstdint>
#include <cstddef>
#include <compare>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <array>
#include <chrono>
#include <random>
#include <variant>

namespace bluff::core::constants
{
    inline constexpr std::size_t RankCount = 13;
    inline constexpr std::size_t SuitCount = 4;
    inline constexpr std::size_t CardsPerDeck = RankCount * SuitCount;
    // one extra deck for every started block of this many players
    inline constexpr std::size_t PlayersPerDeck = 5;
    inline constexpr std::size_t MaxPlayers = 10;
    inline constexpr std::size_t MinPlayersToStart = 2;
    inline constexpr std::chrono::milliseconds ChallengeWindow{5000};
}

namespace bluff::core
{
    enum class Suit : uint8_t
    {
        Spades = 0,
        Hearts,
        Diamonds,
        Clubs
    };

    // Declaration order is the required-rank cycle: A,2,...,10,J,Q,K
    enum class Rank : uint8_t
    {
        Ace = 0,
        Two,
        Three,
        Four,
        Five,
        Six,
        Seven,
        Eight,
        Nine,
        Ten,
        Jack,
        Queen,
        King
    };

    struct Card
    {
        Rank rank{Rank::Ace};
        Suit suit{Suit::Spades};

        auto operator==(Card const&) const -> bool = default;
        auto operator<=>(Card const&) const = default;
    };

    using PlayerId     = std::string;
    using SessionId    = std::string;
    using ConnectionId = std::uint64_t;
    using PlyrIdxT     = std::size_t;

    using WallClock = std::chrono::system_clock;
    using TimePoint = WallClock::time_point;

    inline auto RankLabel(Rank const r) -> std::string_view
    {
        static constexpr std::array<std::string_view, constants::RankCount> map{
            "A","2","3","4","5","6","7","8","9","10","J","Q","K"
        };
        return map[static_cast<std::size_t>(r)];
    }

    inline auto SuitLabel(Suit const s) -> std::string_view
    {
        switch (s)
        {
            case Suit::Spades:   return "S";
            case Suit::Hearts:   return "H";
            case Suit::Diamonds: return "D";
            case Suit::Clubs:    return "C";
        }
        return "?";
    }

    struct Config
    {
        uint64_t    seed{std::random_device{}()};
        std::chrono::milliseconds challenge_window{constants::ChallengeWindow};
        std::size_t max_players{constants::MaxPlayers};
        std::size_t min_players{constants::MinPlayersToStart};
    };
}

#endif //BLUFFGAME_TYPES_HPP
