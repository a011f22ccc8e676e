#include "AuditLogger.hpp"

#include <format>
#include <string_view>
#include <vector>

using namespace bluff::core;

namespace
{

auto s_card(Card const& c) -> std::string
{
    return std::format("{}{}", RankLabel(c.rank), SuitLabel(c.suit));
}

auto s_cards(std::vector<Card> const& cards) -> std::string
{
    std::string body;
    for (std::size_t i{}; i < cards.size(); ++i)
    {
        body += (i ? "," : "");
        body += s_card(cards[i]);
    }
    return body;
}

auto s_outcome(MoveOutcome const m) -> std::string_view
{
    switch (m)
    {
        case MoveOutcome::Played:             return "Played";
        case MoveOutcome::LiarTookPile:       return "LiarTookPile";
        case MoveOutcome::ChallengerTookPile: return "ChallengerTookPile";
        case MoveOutcome::CounterApplied:     return "CounterApplied";
        case MoveOutcome::CounterLapsed:      return "CounterLapsed";
    }
    return "?";
}

auto s_name(Session const& s, PlayerId const& id) -> std::string
{
    if (auto const idx = s.IndexOf(id)) return s.SeatAt(*idx).name;
    return std::string("<gone>");
}

auto hand_sizes(Session const& s) -> std::string
{
    std::string body;
    for (PlyrIdxT i{}; i < s.PlayerCount(); ++i)
    {
        body += std::format("{}{}:{}", (i ? "," : ""), s.SeatAt(i).name, s.SeatAt(i).hand.size());
    }
    return body;
}

} // anonymous namespace

namespace bluff::core::debug
{

AuditLogger::AuditLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::write(std::string const& line) -> void
{
    std::lock_guard<std::mutex> lock(mtx_);
    out_ << line;
}

auto AuditLogger::created(Session const& s) -> void
{
    write(std::format("Created session={} host={}\n", s.Id(), s_name(s, s.HostId())));
}

auto AuditLogger::joined(Session const& s, PlayerId const& who) -> void
{
    write(std::format("Joined session={} player={} seats={}\n", s.Id(), s_name(s, who), s.PlayerCount()));
}

auto AuditLogger::kicked(Session const& s, Departure const& d) -> void
{
    write(std::format("Kicked session={} player={} seats={}\n", s.Id(), d.name, s.PlayerCount()));
}

auto AuditLogger::started(Session const& s) -> void
{
    write(std::format("Started session={} decks={} turn={} hands=[{}]\n",
                      s.Id(), s.DeckCount(), s.SeatAt(s.TurnIndex()).name, hand_sizes(s)));
}

auto AuditLogger::played(Session const& s, PlayerId const& actor, PlayAction const& a) -> void
{
    write(std::format("Play session={} actor={} claim={}x{} cards=[{}] pile={} next={}\n",
                      s.Id(), s_name(s, actor), a.cards.size(), RankLabel(a.claimed),
                      s_cards(a.cards), s.PileSize(), RankLabel(s.RequiredRank())));
}

auto AuditLogger::settled(Session const& s, Settlement const& st) -> void
{
    write(std::format("Settle session={} outcome={} recipient={} cards={} hands=[{}]\n",
                      s.Id(), s_outcome(st.outcome), s_name(s, st.recipient), st.cards, hand_sizes(s)));
}

auto AuditLogger::departed(Session const& s, Departure const& d) -> void
{
    write(std::format("Departed session={} player={} discarded={} host={}\n",
                      s.Id(), d.name, d.cards_discarded,
                      d.new_host ? s_name(s, *d.new_host) : std::string(d.was_host ? "<none>" : "unchanged")));
}

auto AuditLogger::retired(SessionId const& sid) -> void
{
    write(std::format("Retired session={}\n", sid));
}

auto AuditLogger::flush() -> void
{
    std::lock_guard<std::mutex> lock(mtx_);
    out_.flush();
}

}
