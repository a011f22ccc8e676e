//
// EventSink.hpp: outbound side of the engine (implemented by the transport)
//

#ifndef BLUFFGAME_EVENTSINK_HPP
#define BLUFFGAME_EVENTSINK_HPP

#include <span>
#include "State.hpp"

namespace bluff::core
{
    // Called while the session is locked; implementations must not block
    // and must not call back into the registry.
    class EventSink
    {
    public:
        virtual ~EventSink() = default;

        virtual auto PublishState(std::span<ConnectionId const> audience,
                                  SessionView const& view,
                                  StateEvent event) -> void = 0;

        virtual auto PublishHand(ConnectionId conn, HandView const& hand) -> void = 0;
    };
}

#endif //BLUFFGAME_EVENTSINK_HPP
