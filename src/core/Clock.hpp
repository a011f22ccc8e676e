//
// Clock.hpp: time source for challenge deadlines
//

#ifndef BLUFFGAME_CLOCK_HPP
#define BLUFFGAME_CLOCK_HPP

#include "Types.hpp"

namespace bluff::core
{
    class Clock
    {
    public:
        virtual ~Clock() = default;
        virtual auto Now() const -> TimePoint = 0;
    };

    class SystemClock final : public Clock
    {
    public:
        auto Now() const -> TimePoint override { return WallClock::now(); }
    };
}

#endif //BLUFFGAME_CLOCK_HPP
