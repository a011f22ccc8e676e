//
// Registry.cpp
//
#include "Registry.hpp"

#include <algorithm>
#include <array>
#include <print>
#include <vector>

#include "BluffRules.hpp"
#include "Util.hpp"
#include "../debug/AuditLogger.hpp"

namespace bluff::core
{
    using RC = error::RejectCode;

    SessionRegistry::SessionRegistry(Config const& config,
                                     std::shared_ptr<Clock const> clock,
                                     std::shared_ptr<EventSink> sink,
                                     std::shared_ptr<debug::AuditLogger> audit) :
        cfg_(config),
        clock_(std::move(clock)),
        sink_(std::move(sink)),
        audit_(std::move(audit)),
        rng_{config.seed}
    {
        BLF_ASSERT(clock_ != nullptr, "Registry constructed without a clock");
        BLF_ASSERT(sink_ != nullptr, "Registry constructed without an event sink");
    }

    auto SessionRegistry::NextId() -> std::string
    {
        std::lock_guard<std::mutex> lock(rng_mx_);
        return util::MakeUuid(rng_);
    }

    auto SessionRegistry::NextSeed() -> uint64_t
    {
        std::lock_guard<std::mutex> lock(rng_mx_);
        return rng_();
    }

    auto SessionRegistry::Find(SessionId const& sid) const -> std::shared_ptr<Slot>
    {
        std::shared_lock<std::shared_mutex> lock(map_mx_);
        auto const it = sessions_.find(sid);
        return it != sessions_.end() ? it->second : nullptr;
    }

    auto SessionRegistry::LogRejection(std::string_view const verb, error::Rejection const& why) const -> void
    {
        std::print("[Registry] {} rejected: {}\n", verb, error::describe(why));
    }

    auto SessionRegistry::Publish(Session const& session, StateEvent const event,
                                  std::span<ConnectionId const> extra) -> void
    {
        std::vector<ConnectionId> audience = session.Audience();
        for (ConnectionId const c : extra)
        {
            if (std::ranges::find(audience, c) == audience.end()) audience.push_back(c);
        }
        sink_->PublishState(audience, session.PublicView(), event);

        for (PlyrIdxT seat{}; seat < session.PlayerCount(); ++seat)
        {
            sink_->PublishHand(session.SeatAt(seat).connection, session.HandFor(seat));
        }
    }

    auto SessionRegistry::Create(std::string username, ConnectionId const conn) -> Joined
    {
        Joined out{NextId(), NextId()};
        auto slot = std::make_shared<Slot>(out.session_id, cfg_, std::make_unique<BluffRules>(), NextSeed());

        std::lock_guard<std::mutex> slot_lock(slot->mtx);
        auto const added = slot->session.AddPlayer(PlayerSeat{out.player_id, std::move(username), conn});
        BLF_ASSERT(added.has_value(), "A fresh session refused its host");
        {
            std::unique_lock<std::shared_mutex> map_lock(map_mx_);
            sessions_.emplace(out.session_id, slot);
        }

        if (audit_) audit_->created(slot->session);
        Publish(slot->session, StateEvent::Session);
        return out;
    }

    auto SessionRegistry::Join(SessionId const& sid, std::string username, ConnectionId const conn)
        -> std::expected<Joined, error::Rejection>
    {
        std::shared_ptr<Slot> const slot = Find(sid);
        if (!slot)
        {
            error::Rejection const why = error::Reject(RC::Session_NotFound);
            LogRejection("join", why);
            return std::unexpected(why);
        }

        std::lock_guard<std::mutex> lock(slot->mtx);
        if (slot->retired)
        {
            error::Rejection const why = error::Reject(RC::Session_NotFound);
            LogRejection("join", why);
            return std::unexpected(why);
        }

        Joined out{sid, NextId()};
        if (auto const ok = slot->session.AddPlayer(PlayerSeat{out.player_id, std::move(username), conn}); !ok)
        {
            LogRejection("join", ok.error());
            return std::unexpected(ok.error());
        }

        if (audit_) audit_->joined(slot->session, out.player_id);
        Publish(slot->session, StateEvent::Session);
        return out;
    }

    auto SessionRegistry::Kick(SessionId const& sid, PlayerId const& target, PlayerId const& by)
        -> error::ActionResult
    {
        std::shared_ptr<Slot> const slot = Find(sid);
        if (!slot) return std::unexpected(error::Reject(RC::Session_NotFound).with_actor(by));

        std::lock_guard<std::mutex> lock(slot->mtx);
        if (slot->retired) return std::unexpected(error::Reject(RC::Session_NotFound).with_actor(by));

        auto const kicked = slot->session.Kick(target, by);
        if (!kicked)
        {
            LogRejection("kick", kicked.error());
            return std::unexpected(kicked.error());
        }

        if (audit_) audit_->kicked(slot->session, *kicked);
        // the kicked connection sees the roster it was removed from
        std::array<ConnectionId, 1> const extra{kicked->connection};
        Publish(slot->session, StateEvent::Session, extra);
        return {};
    }

    auto SessionRegistry::Start(SessionId const& sid, PlayerId const& by) -> error::ActionResult
    {
        std::shared_ptr<Slot> const slot = Find(sid);
        if (!slot) return std::unexpected(error::Reject(RC::Session_NotFound).with_actor(by));

        std::lock_guard<std::mutex> lock(slot->mtx);
        if (slot->retired) return std::unexpected(error::Reject(RC::Session_NotFound).with_actor(by));

        if (auto const ok = slot->session.Start(by); !ok)
        {
            LogRejection("start", ok.error());
            return ok;
        }

        if (audit_) audit_->started(slot->session);
        Publish(slot->session, StateEvent::Started);
        return {};
    }

    auto SessionRegistry::Submit(SessionId const& sid, PlayerId const& by,
                                 PlayerAction const& action, std::string_view const verb) -> error::ActionResult
    {
        std::shared_ptr<Slot> const slot = Find(sid);
        if (!slot) return std::unexpected(error::Reject(RC::Session_NotFound).with_actor(by));

        std::lock_guard<std::mutex> lock(slot->mtx);
        if (slot->retired) return std::unexpected(error::Reject(RC::Session_NotFound).with_actor(by));

        // sampled under the lock so commit order and time order agree
        TimePoint const now = clock_->Now();
        auto const outcome = slot->session.Submit(by, action, now);
        if (!outcome)
        {
            LogRejection(verb, outcome.error());
            return std::unexpected(outcome.error());
        }

        if (*outcome == MoveOutcome::CounterLapsed)
        {
            error::Rejection why = error::Reject(RC::Counter_PlayerGone).with_actor(by);
            LogRejection(verb, why);
            return std::unexpected(std::move(why));
        }

        if (audit_)
        {
            if (*outcome == MoveOutcome::Played)
                audit_->played(slot->session, by, std::get<PlayAction>(action));
            else if (slot->session.LastSettlement())
                audit_->settled(slot->session, *slot->session.LastSettlement());
        }
        Publish(slot->session, StateEvent::Game);
        return {};
    }

    auto SessionRegistry::Play(SessionId const& sid, PlayerId const& by,
                               std::vector<Card> cards, Rank const claimed) -> error::ActionResult
    {
        return Submit(sid, by, PlayAction{std::move(cards), claimed}, "play");
    }

    auto SessionRegistry::CallChallenge(SessionId const& sid, PlayerId const& by) -> error::ActionResult
    {
        return Submit(sid, by, ChallengeAction{}, "challenge");
    }

    auto SessionRegistry::InvokeCounter(SessionId const& sid, PlayerId const& by) -> error::ActionResult
    {
        return Submit(sid, by, CounterAction{}, "counter");
    }

    auto SessionRegistry::HandleDisconnect(ConnectionId const conn) -> std::size_t
    {
        // snapshot first so the scan never holds the map lock while a session is locked
        std::vector<std::pair<SessionId, std::shared_ptr<Slot>>> live;
        {
            std::shared_lock<std::shared_mutex> lock(map_mx_);
            live.reserve(sessions_.size());
            for (auto const& [sid, slot] : sessions_) live.emplace_back(sid, slot);
        }

        std::size_t touched{};
        std::vector<std::pair<SessionId, std::shared_ptr<Slot>>> emptied;
        for (auto& [sid, slot] : live)
        {
            std::lock_guard<std::mutex> lock(slot->mtx);
            if (slot->retired) continue;

            std::vector<Departure> const gone = slot->session.RemoveConnection(conn);
            if (gone.empty()) continue;
            ++touched;

            if (audit_)
            {
                for (Departure const& d : gone) audit_->departed(slot->session, d);
            }

            if (slot->session.PlayerCount() == 0)
            {
                slot->retired = true;
                emptied.emplace_back(sid, slot);
                continue;
            }
            Publish(slot->session, slot->session.Started() ? StateEvent::Game : StateEvent::Session);
        }

        if (!emptied.empty())
        {
            std::unique_lock<std::shared_mutex> lock(map_mx_);
            for (auto const& [sid, slot] : emptied)
            {
                auto const it = sessions_.find(sid);
                if (it != sessions_.end() && it->second == slot) sessions_.erase(it);
                if (audit_) audit_->retired(sid);
            }
        }
        return touched;
    }

    auto SessionRegistry::SessionCount() const -> std::size_t
    {
        std::shared_lock<std::shared_mutex> lock(map_mx_);
        return sessions_.size();
    }

    auto SessionRegistry::View(SessionId const& sid) const -> std::optional<SessionView>
    {
        std::optional<SessionView> out;
        Visit(sid, [&out](Session const& s) { out = s.PublicView(); });
        return out;
    }
}
