//
// Invariants.hpp: structural checks over a session, used by tests and self-play
//

#ifndef BLUFFGAME_INVARIANTS_HPP
#define BLUFFGAME_INVARIANTS_HPP

#include "../core/Session.hpp"
#include "../core/Exception.hpp"
#include "../core/Util.hpp"
#include "Inspector.hpp"
#include <algorithm>
#include <format>
#include <ranges>

namespace bluff::core::debug
{
    // A second layer of checks: card conservation and composition, turn pointer,
    // host uniqueness and round-state coherence. Throws AssertionError on the first breach.
    inline auto CheckInvariants(Session const& g) -> void
    {
#if BLF_ENABLE_TEST_HOOKS == false
        (void)g;
#else
        Inspector::SnapshotAll const s = Inspector::Gather(g);

        // 1) Exactly one host while seated, and the flag agrees with the id
        if (!s.hands.empty())
        {
            auto const hosts = std::ranges::count(s.host_flags, true);
            BLF_ASSERT(hosts == 1, std::format("Expected one host, found {}", hosts));
            std::optional<PlyrIdxT> const idx = g.IndexOf(s.host_id);
            BLF_ASSERT(idx.has_value() && s.host_flags[*idx], "Host id does not match host flag");
        }

        if (!s.started)
        {
            BLF_ASSERT(s.pile.empty(), "Pile not empty in lobby");
            return;
        }

        // 2) Turn pointer names a seated player
        if (!s.hands.empty())
        {
            BLF_ASSERT(s.turn_idx < s.hands.size(), "Turn pointer out of range");
        }

        // 3) Conservation and composition: every rank+suit exactly deck_count times
        util::CardTally tally{};
        std::size_t total{};
        auto add = [&](std::vector<Card> const& zone)
        {
            for (Card const& c : zone) tally.Add(c);
            total += zone.size();
        };
        for (auto const& h : s.hands) add(h);
        add(s.pile);
        add(s.discard);

        BLF_ASSERT(total == s.deck_count * constants::CardsPerDeck,
                   std::format("Materialized card count {} != {}", total, s.deck_count * constants::CardsPerDeck));
        BLF_ASSERT(std::ranges::all_of(tally.Counts(), [&](std::size_t n) { return n == s.deck_count; }),
                   "Card composition drifted from the dealt decks");

        // 4) Round state: a deadline or a gate needs a play, and the play fits in the pile
        if (s.last_play_count)
        {
            BLF_ASSERT(*s.last_play_count >= 1 && *s.last_play_count <= s.pile.size(), "Last play larger than pile");
        }
        else
        {
            BLF_ASSERT(!s.has_deadline, "Challenge deadline without a play");
            BLF_ASSERT(!s.gate.has_value(), "Counter gate without a play");
            BLF_ASSERT(s.pile.empty(), "Pile holds cards with no play on record");
        }
#endif // BLF_ENABLE_TEST_HOOKS == true
    }
}
#endif //BLUFFGAME_INVARIANTS_HPP
