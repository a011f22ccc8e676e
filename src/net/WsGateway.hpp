//
// WsGateway.hpp: WebSocket++ transport: frames in, registry calls, frames out
//

#ifndef BLUFFGAME_WSGATEWAY_HPP
#define BLUFFGAME_WSGATEWAY_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <unordered_map>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "core/Types.hpp"
#include "core/State.hpp"
#include "core/EventSink.hpp"
#include "core/Registry.hpp"

#include "net/Codec.hpp"

namespace bluff::net
{
    using WsServer = websocketpp::server<websocketpp::config::asio>;
    using Hdl      = websocketpp::connection_hdl;

    // One gateway per endpoint. Every open socket gets a ConnectionId; the
    // registry only ever sees those ids, never handles.
    class WsGateway final : public core::EventSink
    {
    public:
        explicit WsGateway(WsServer& server);

        // Late-bind the registry (it needs this gateway as its sink first)
        void BindRegistry(core::SessionRegistry& registry);

        // Installs open/close/message handlers on the endpoint
        void Install();

        auto PublishState(std::span<core::ConnectionId const> audience,
                          core::SessionView const& view,
                          core::StateEvent event) -> void override;

        auto PublishHand(core::ConnectionId conn, core::HandView const& hand) -> void override;

        auto ConnectionCount() const -> std::size_t;

        void OnOpen(Hdl hdl);
        void OnClose(Hdl hdl);
        void OnMessage(Hdl hdl, WsServer::message_ptr msg);

    private:
        void Dispatch(core::ConnectionId conn, core::net::DecodedRequest const& req);
        auto SendTo(core::ConnectionId conn, flatbuffers::DetachedBuffer const& buf) -> void;
        auto Lookup(Hdl const& hdl) const -> std::optional<core::ConnectionId>;

    private:
        WsServer&              server_;
        core::SessionRegistry* registry_{nullptr}; // late-bound

        mutable std::mutex mx_;
        std::map<Hdl, core::ConnectionId, std::owner_less<Hdl>> ids_;
        std::unordered_map<core::ConnectionId, Hdl> hdls_;
        core::ConnectionId next_id_{1};
    };
}

#endif // BLUFFGAME_WSGATEWAY_HPP
