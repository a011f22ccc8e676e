//
// Session.hpp: one match: lobby, dealing, turn/rank cursor, pile and round state
//

#ifndef BLUFFGAME_SESSION_HPP
#define BLUFFGAME_SESSION_HPP

#include <expected>
#include <span>
#include <string>
#include "Types.hpp"
#include "Actions.hpp"
#include "State.hpp"
#include "Rules.hpp"
#include "Deck.hpp"
#include "ChallengeWindow.hpp"

namespace bluff::core::debug {struct Inspector;}
namespace bluff::core
{
    struct PlayerSeat
    {
        PlayerId          id;
        std::string       name;
        ConnectionId      connection{};
        bool              is_host{false};
        std::vector<Card> hand;
    };

    struct PlayRecord
    {
        PlayerId    actor;
        std::string actor_name;
        std::size_t count{};
        Rank        claimed{Rank::Ace};
    };

    // claimant: actor of the play before the most recent one.
    // armed: the most recent play came from a different player.
    struct CounterGate
    {
        PlayerId claimant;
        bool     armed{false};
    };

    struct Settlement
    {
        MoveOutcome outcome{MoveOutcome::Played};
        PlayerId    recipient;
        std::size_t cards{};
    };

    struct Departure
    {
        PlayerId                player_id;
        std::string             name;
        ConnectionId            connection{};
        bool                    was_host{false};
        std::optional<PlayerId> new_host;
        std::size_t             cards_discarded{};
    };

    class Session
    {
    public:
        Session() = delete;
        Session(SessionId id,
                Config const& config,
                std::unique_ptr<Rules> rules,
                uint64_t deck_seed);

        Session(Session const&) = delete;
        auto operator=(Session const&) -> Session& = delete;

        // ---- lobby ----
        // first seat added becomes host
        auto AddPlayer(PlayerSeat seat) -> error::ActionResult;
        // returns the removed seat so the caller can notify it
        auto Kick(PlayerId const& target, PlayerId const& by) -> std::expected<Departure, error::Rejection>;
        auto Start(PlayerId const& by) -> error::ActionResult;

        // ---- in-game ----
        // Validate then Apply through the rules strategy; all-or-nothing.
        auto Submit(PlayerId const& actor, PlayerAction const& a, TimePoint now)
            -> std::expected<MoveOutcome, error::Rejection>;

        // Drops every seat bound to the connection (any phase)
        auto RemoveConnection(ConnectionId conn) -> std::vector<Departure>;

        // ---- turn engine ----
        auto DealInitial(PlayerId const& dealer) -> void;
        auto AdvanceTurn() noexcept -> void;
        auto AdvanceRank() noexcept -> void;
        static auto NextRank(Rank r) noexcept -> Rank;

        // ---- projections ----
        auto PublicView() const -> SessionView;
        auto HandFor(PlyrIdxT seat) const -> HandView;
        auto Audience() const -> std::vector<ConnectionId>;

        auto Id() const noexcept           -> SessionId const& { return id_; }
        auto Started() const noexcept      -> bool { return started_; }
        auto PlayerCount() const noexcept  -> std::size_t { return players_.size(); }
        auto HostId() const noexcept       -> PlayerId const& { return host_id_; }
        auto TurnIndex() const noexcept    -> PlyrIdxT { return turn_idx_; }
        auto RequiredRank() const noexcept -> Rank { return required_rank_; }
        auto PileSize() const noexcept     -> std::size_t { return pile_.size(); }
        auto DeckCount() const noexcept    -> std::size_t { return deck_count_; }
        auto MaxPlayable() const noexcept  -> std::size_t { return deck_count_ * constants::SuitCount; }
        auto LastPlay() const noexcept     -> std::optional<PlayRecord> const& { return last_play_; }
        auto Gate() const noexcept         -> std::optional<CounterGate> const& { return gate_; }
        auto Window() const noexcept       -> ChallengeWindow const& { return window_; }
        auto LastSettlement() const noexcept -> std::optional<Settlement> const& { return last_settlement_; }

        auto IndexOf(PlayerId const& id) const -> std::optional<PlyrIdxT>;
        auto SeatAt(PlyrIdxT seat) const -> PlayerSeat const& { return players_.at(seat); }

        //allows class to directly access private data on an instance
        friend class BluffRules;
        friend struct debug::Inspector;

        // Moves exactly the named cards, in order, from the seat's hand to the pile tail.
        // Throws if a card is missing; callers validate first.
        auto MoveHandToPile(PlyrIdxT seat, std::span<Card const> cards) -> void;
        // Whole pile onto the seat's hand; returns the number of cards moved
        auto MovePileToHand(PlyrIdxT seat) -> std::size_t;
        // Clears last play, challenge deadline and counter eligibility
        auto ClearRound() noexcept -> void;

    private:
        auto RemoveAt(PlyrIdxT idx) -> Departure;

    private:
        SessionId id_;
        Config cfg_;
        std::unique_ptr<Rules> rules_;
        DeckFactory deck_factory_;

        // Authoritative state
        std::vector<PlayerSeat> players_;
        std::vector<Card> pile_;                  // face-down, append-only until settled
        std::vector<Card> discard_;               // hands of players who left mid-game
        PlayerId host_id_;
        bool started_{false};
        std::size_t deck_count_{1};

        // Turn/round state
        PlyrIdxT turn_idx_{0};
        Rank required_rank_{Rank::Ace};
        std::optional<PlayRecord> last_play_;
        ChallengeWindow window_;
        std::optional<CounterGate> gate_;
        std::optional<Settlement> last_settlement_;
    };
}
#endif //BLUFFGAME_SESSION_HPP
