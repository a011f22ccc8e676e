//
// ChallengeWindow.hpp: deadline during which the latest play may be challenged
//

#ifndef BLUFFGAME_CHALLENGEWINDOW_HPP
#define BLUFFGAME_CHALLENGEWINDOW_HPP

#include "Types.hpp"

namespace bluff::core
{
    // No timer backs this: expiry is only observed by comparing a request's
    // arrival time against the stored deadline.
    class ChallengeWindow
    {
    public:
        explicit ChallengeWindow(std::chrono::milliseconds length) noexcept :
            length_{length}
        {
        }

        auto Stamp(TimePoint const now) noexcept -> void { deadline_ = now + length_; }
        auto Clear() noexcept -> void { deadline_.reset(); }

        // open at exactly the deadline, closed one tick after
        [[nodiscard]]
        auto IsOpen(TimePoint const now) const noexcept -> bool
        {
            return deadline_.has_value() && now <= *deadline_;
        }

        auto Deadline() const noexcept -> std::optional<TimePoint> const& { return deadline_; }
        auto Length() const noexcept -> std::chrono::milliseconds { return length_; }

    private:
        std::chrono::milliseconds length_;
        std::optional<TimePoint> deadline_{};
    };
}

#endif //BLUFFGAME_CHALLENGEWINDOW_HPP
