//
// Inspector.hpp: read access to a session's private zones for tests and invariant checks
//

#ifndef BLUFFGAME_INSPECTOR_HPP
#define BLUFFGAME_INSPECTOR_HPP

#include <vector>
#include <cstddef>
#include <cstdint>
#include <optional>

#include "../core/Types.hpp"
#include "../core/Session.hpp"

namespace bluff::core::debug
{
    struct Inspector
    {
        struct SnapshotAll
        {
            std::vector<std::vector<Card>> hands;
            std::vector<bool> host_flags;
            std::vector<Card> pile;
            std::vector<Card> discard;
            PlayerId host_id;
            bool started{false};
            std::size_t deck_count{};
            PlyrIdxT turn_idx{};
            Rank required_rank{};
            std::optional<std::size_t> last_play_count;
            bool has_deadline{false};
            std::optional<CounterGate> gate;
        };

        static inline auto Gather(Session const& s) -> SnapshotAll
        {
            SnapshotAll ret{};
            ret.hands.reserve(s.players_.size());
            for (PlayerSeat const& p : s.players_)
            {
                ret.hands.push_back(p.hand);
                ret.host_flags.push_back(p.is_host);
            }
            ret.pile = s.pile_;
            ret.discard = s.discard_;
            ret.host_id = s.host_id_;
            ret.started = s.started_;
            ret.deck_count = s.deck_count_;
            ret.turn_idx = s.turn_idx_;
            ret.required_rank = s.required_rank_;
            if (s.last_play_) ret.last_play_count = s.last_play_->count;
            ret.has_deadline = s.window_.Deadline().has_value();
            ret.gate = s.gate_;
            return ret;
        }

        // Test hook: puts a known card sequence on top of the pile / into a hand
        // without going through the rules.
        static inline auto Pile(Session& s) -> std::vector<Card>& { return s.pile_; }
        static inline auto Hand(Session& s, PlyrIdxT seat) -> std::vector<Card>& { return s.players_.at(seat).hand; }
    };
}

#endif //BLUFFGAME_INSPECTOR_HPP
