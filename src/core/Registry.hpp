//
// Registry.hpp: process-wide collection of independent sessions
//

#ifndef BLUFFGAME_REGISTRY_HPP
#define BLUFFGAME_REGISTRY_HPP

#include <expected>
#include <memory>
#include <mutex>
#include <random>
#include <shared_mutex>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

#include "Types.hpp"
#include "Actions.hpp"
#include "State.hpp"
#include "Exception.hpp"
#include "Session.hpp"
#include "Clock.hpp"
#include "EventSink.hpp"

namespace bluff::core::debug {class AuditLogger;}
namespace bluff::core
{
    struct Joined
    {
        SessionId session_id;
        PlayerId  player_id;
    };

    // Every operation on one session runs under that session's own mutex, so
    // concurrent actions against it commit one at a time (first committed wins)
    // while distinct sessions never contend. The map lock only guards lookup,
    // insert and erase, and is never taken first with a session lock nested in it.
    class SessionRegistry
    {
    public:
        SessionRegistry(Config const& config,
                        std::shared_ptr<Clock const> clock,
                        std::shared_ptr<EventSink> sink,
                        std::shared_ptr<debug::AuditLogger> audit = {});

        SessionRegistry(SessionRegistry const&) = delete;
        auto operator=(SessionRegistry const&) -> SessionRegistry& = delete;

        // always succeeds; the caller becomes host
        auto Create(std::string username, ConnectionId conn) -> Joined;
        auto Join(SessionId const& sid, std::string username, ConnectionId conn)
            -> std::expected<Joined, error::Rejection>;
        auto Kick(SessionId const& sid, PlayerId const& target, PlayerId const& by) -> error::ActionResult;
        auto Start(SessionId const& sid, PlayerId const& by) -> error::ActionResult;

        auto Play(SessionId const& sid, PlayerId const& by,
                  std::vector<Card> cards, Rank claimed) -> error::ActionResult;
        auto CallChallenge(SessionId const& sid, PlayerId const& by) -> error::ActionResult;
        auto InvokeCounter(SessionId const& sid, PlayerId const& by) -> error::ActionResult;

        // Removes the connection's seats from every live session.
        // Returns the number of sessions that lost a player.
        auto HandleDisconnect(ConnectionId conn) -> std::size_t;

        auto SessionCount() const -> std::size_t;
        auto View(SessionId const& sid) const -> std::optional<SessionView>;

        // Runs fn(Session const&) under the session lock; false if the session is gone
        template <typename Fn>
        auto Visit(SessionId const& sid, Fn&& fn) const -> bool
        {
            std::shared_ptr<Slot> const slot = Find(sid);
            if (!slot) return false;
            std::lock_guard<std::mutex> lock(slot->mtx);
            if (slot->retired) return false;
            std::forward<Fn>(fn)(std::as_const(slot->session));
            return true;
        }

    private:
        struct Slot
        {
            Slot(SessionId id, Config const& cfg, std::unique_ptr<Rules> rules, uint64_t seed) :
                session(std::move(id), cfg, std::move(rules), seed)
            {
            }

            std::mutex mtx;
            Session    session;
            bool       retired{false}; // set once the last player left; lookups treat it as missing
        };

        auto Find(SessionId const& sid) const -> std::shared_ptr<Slot>;
        auto Submit(SessionId const& sid, PlayerId const& by,
                    PlayerAction const& action, std::string_view verb) -> error::ActionResult;
        // caller holds the slot lock
        auto Publish(Session const& session, StateEvent event,
                     std::span<ConnectionId const> extra = {}) -> void;
        auto NextId() -> std::string;
        auto NextSeed() -> uint64_t;
        auto LogRejection(std::string_view verb, error::Rejection const& why) const -> void;

    private:
        Config cfg_;
        std::shared_ptr<Clock const> clock_;
        std::shared_ptr<EventSink> sink_;
        std::shared_ptr<debug::AuditLogger> audit_;

        mutable std::shared_mutex map_mx_;
        std::unordered_map<SessionId, std::shared_ptr<Slot>> sessions_;

        std::mutex rng_mx_;
        std::mt19937_64 rng_;
    };
}

#endif //BLUFFGAME_REGISTRY_HPP
