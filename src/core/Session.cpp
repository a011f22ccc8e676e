//
// Session.cpp
//
#include "Session.hpp"

#include <algorithm>
#include <iterator>
#include <ranges>
#include <utility>

#include "Exception.hpp"

namespace
{
    inline auto Rej(bluff::core::error::RejectCode code) -> bluff::core::error::Rejection
    {
        return bluff::core::error::Reject(code);
    }
}

namespace bluff::core
{
    using RC = error::RejectCode;

    Session::Session(SessionId id,
                     Config const& config,
                     std::unique_ptr<Rules> rules,
                     uint64_t const deck_seed) :
        id_(std::move(id)),
        cfg_(config),
        rules_(std::move(rules)),
        deck_factory_(deck_seed),
        window_(config.challenge_window)
    {
        BLF_ASSERT(rules_ != nullptr, "Session constructed without rules");
        BLF_ASSERT(cfg_.min_players >= 1 && cfg_.min_players <= cfg_.max_players, "Invalid player limits in config");
    }

    auto Session::IndexOf(PlayerId const& id) const -> std::optional<PlyrIdxT>
    {
        auto const it = std::ranges::find(players_, id, &PlayerSeat::id);
        if (it == std::cend(players_)) return std::nullopt;
        return static_cast<PlyrIdxT>(std::distance(std::cbegin(players_), it));
    }

    auto Session::AddPlayer(PlayerSeat seat) -> error::ActionResult
    {
        if (started_)
            return std::unexpected(Rej(RC::Session_AlreadyStarted).with_actor(seat.id));
        if (players_.size() >= cfg_.max_players)
            return std::unexpected(Rej(RC::Session_Full).with_actor(seat.id)
                                   .with_players(players_.size()).with_limit(cfg_.max_players));
        BLF_ASSERT(!IndexOf(seat.id).has_value(), "Duplicate player id in session");

        seat.hand.clear();
        seat.is_host = players_.empty();
        if (seat.is_host) host_id_ = seat.id;
        players_.push_back(std::move(seat));
        return {};
    }

    auto Session::Kick(PlayerId const& target, PlayerId const& by) -> std::expected<Departure, error::Rejection>
    {
        if (by != host_id_)
            return std::unexpected(Rej(RC::Lobby_NotHost).with_actor(by).with_expected(host_id_));
        if (started_)
            return std::unexpected(Rej(RC::Session_AlreadyStarted).with_actor(by));

        std::optional<PlyrIdxT> const idx = IndexOf(target);
        if (!idx)
            return std::unexpected(Rej(RC::Lobby_TargetNotFound).with_actor(by));
        if (target == host_id_)
            return std::unexpected(Rej(RC::Lobby_CannotKickHost).with_actor(by));

        return RemoveAt(*idx);
    }

    auto Session::Start(PlayerId const& by) -> error::ActionResult
    {
        if (by != host_id_)
            return std::unexpected(Rej(RC::Lobby_NotHost).with_actor(by).with_expected(host_id_));
        if (started_)
            return std::unexpected(Rej(RC::Session_AlreadyStarted).with_actor(by));
        if (players_.size() < cfg_.min_players)
            return std::unexpected(Rej(RC::Lobby_NotEnoughPlayers).with_actor(by)
                                   .with_players(players_.size()).with_limit(cfg_.min_players));

        for (PlayerSeat& p : players_) p.hand.clear();
        pile_.clear();
        discard_.clear();
        DealInitial(host_id_);

        std::optional<PlyrIdxT> const dealer = IndexOf(host_id_);
        BLF_ASSERT(dealer.has_value(), "Host missing from player list");
        turn_idx_ = (*dealer + 1) % players_.size();
        required_rank_ = Rank::Ace;
        ClearRound();
        last_settlement_.reset();
        started_ = true;
        return {};
    }

    auto Session::DealInitial(PlayerId const& dealer) -> void
    {
        BLF_ASSERT(!players_.empty(), "Dealing to an empty table");

        deck_count_ = DeckFactory::DeckCountFor(players_.size());
        std::vector<Card> deck = deck_factory_.Build(deck_count_);

        std::size_t const n = players_.size();
        PlyrIdxT const dealer_idx = IndexOf(dealer).value_or(0);
        PlyrIdxT const start = (dealer_idx + 1) % n;

        //round robin from the seat after the dealer until the deck runs out
        for (std::size_t i{}; !deck.empty(); ++i)
        {
            players_[(start + i) % n].hand.push_back(deck.back());
            deck.pop_back();
        }
    }

    auto Session::AdvanceTurn() noexcept -> void
    {
        if (players_.empty()) return;
        turn_idx_ = (turn_idx_ + 1) % players_.size();
    }

    auto Session::NextRank(Rank const r) noexcept -> Rank
    {
        return static_cast<Rank>((static_cast<std::size_t>(r) + 1) % constants::RankCount);
    }

    auto Session::AdvanceRank() noexcept -> void
    {
        required_rank_ = NextRank(required_rank_);
    }

    auto Session::Submit(PlayerId const& actor, PlayerAction const& a, TimePoint const now)
        -> std::expected<MoveOutcome, error::Rejection>
    {
        if (!started_)
            return std::unexpected(Rej(RC::Session_NotStarted).with_actor(actor));

        std::optional<PlyrIdxT> const seat = IndexOf(actor);
        if (!seat)
            return std::unexpected(Rej(RC::Player_NotInSession).with_actor(actor));

        if (auto const ok = rules_->Validate(*this, *seat, a, now); !ok.has_value())
        {
            return std::unexpected(ok.error());
        }
        return rules_->Apply(*this, *seat, a, now);
    }

    auto Session::MoveHandToPile(PlyrIdxT const seat, std::span<Card const> cards) -> void
    {
        auto& hand = players_.at(seat).hand;
        for (Card const& c : cards)
        {
            auto const it = std::ranges::find(hand, c);
            if (it == std::end(hand))
                BLF_THROW(error::Code::State, "Card moved to pile is not in the actor's hand");
            pile_.push_back(*it);
            hand.erase(it);
        }
    }

    auto Session::MovePileToHand(PlyrIdxT const seat) -> std::size_t
    {
        auto& hand = players_.at(seat).hand;
        std::size_t const moved = pile_.size();
        hand.insert(std::end(hand), std::begin(pile_), std::end(pile_));
        pile_.clear();
        return moved;
    }

    auto Session::ClearRound() noexcept -> void
    {
        last_play_.reset();
        window_.Clear();
        gate_.reset();
    }

    auto Session::RemoveAt(PlyrIdxT const idx) -> Departure
    {
        BLF_ASSERT(idx < players_.size(), "Removing a seat that does not exist");

        PlayerSeat& leaving = players_[idx];
        Departure out{};
        out.player_id = leaving.id;
        out.name = leaving.name;
        out.connection = leaving.connection;
        out.was_host = (leaving.id == host_id_);
        out.cards_discarded = leaving.hand.size();

        discard_.insert(std::end(discard_), std::begin(leaving.hand), std::end(leaving.hand));
        players_.erase(std::begin(players_) + static_cast<std::ptrdiff_t>(idx));

        // keep the pointer on the same logical player
        if (!players_.empty())
        {
            if (idx < turn_idx_) --turn_idx_;
            if (turn_idx_ >= players_.size()) turn_idx_ = 0;
        }
        else
        {
            turn_idx_ = 0;
        }

        if (out.was_host)
        {
            host_id_.clear();
            if (!players_.empty())
            {
                players_.front().is_host = true;
                host_id_ = players_.front().id;
                out.new_host = host_id_;
            }
        }
        return out;
    }

    auto Session::RemoveConnection(ConnectionId const conn) -> std::vector<Departure>
    {
        std::vector<Departure> gone;
        for (;;)
        {
            auto const it = std::ranges::find(players_, conn, &PlayerSeat::connection);
            if (it == std::end(players_)) break;
            gone.push_back(RemoveAt(static_cast<PlyrIdxT>(std::distance(std::begin(players_), it))));
        }
        return gone;
    }

    auto Session::PublicView() const -> SessionView
    {
        SessionView v{};
        v.id = id_;
        v.players.reserve(players_.size());
        for (PlayerSeat const& p : players_)
        {
            v.players.push_back(PlayerSummary{p.id, p.name, p.is_host, p.hand.size()});
        }
        v.started = started_;
        if (started_ && turn_idx_ < players_.size())
        {
            v.current_turn = players_[turn_idx_].id;
        }
        v.required_rank = required_rank_;
        if (last_play_)
        {
            v.last_play = LastPlaySummary{last_play_->actor_name, last_play_->count, last_play_->claimed};
        }
        v.pile_count = pile_.size();
        v.challenge_deadline = window_.Deadline();
        return v;
    }

    auto Session::HandFor(PlyrIdxT const seat) const -> HandView
    {
        PlayerSeat const& p = players_.at(seat);
        return HandView{p.id, p.hand};
    }

    auto Session::Audience() const -> std::vector<ConnectionId>
    {
        std::vector<ConnectionId> out;
        out.reserve(players_.size());
        std::ranges::transform(players_, std::back_inserter(out), &PlayerSeat::connection);
        // one connection may hold several seats
        std::ranges::sort(out);
        auto const dup = std::ranges::unique(out);
        out.erase(dup.begin(), dup.end());
        return out;
    }
}
