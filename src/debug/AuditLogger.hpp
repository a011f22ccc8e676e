//
// AuditLogger.hpp: line-oriented transcript of every committed session event
//

#ifndef BLUFFGAME_AUDITLOGGER_HPP
#define BLUFFGAME_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>

#include "../core/Session.hpp"
#include "../core/Actions.hpp"
#include "../core/Types.hpp"

namespace bluff::core::debug
{
    // Shared by every session in the process; each call writes whole lines under one lock.
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        [[nodiscard]]
        auto is_open() const -> bool { return out_.is_open(); }

        // Session header (id, host)
        auto created(Session const& s) -> void;
        auto joined(Session const& s, PlayerId const& who) -> void;
        auto kicked(Session const& s, Departure const& d) -> void;

        // Deck count, dealer, first actor and the dealt hand sizes
        auto started(Session const& s) -> void;

        // After Apply: the claim next to the cards actually placed
        auto played(Session const& s, PlayerId const& actor, PlayAction const& a) -> void;

        // Challenge or counter-challenge resolution
        auto settled(Session const& s, Settlement const& st) -> void;

        auto departed(Session const& s, Departure const& d) -> void;
        auto retired(SessionId const& sid) -> void;

        // Manual flush
        auto flush() -> void;

    private:
        auto write(std::string const& line) -> void;

    private:
        std::mutex mtx_;
        std::ofstream out_;
    };
}

#endif //BLUFFGAME_AUDITLOGGER_HPP
