//
// WsGateway.cpp
//

#include "net/WsGateway.hpp"

#include <print>
#include <type_traits>
#include <variant>

namespace bluff::net
{
    namespace cnet = core::net;

    WsGateway::WsGateway(WsServer& server)
        : server_{server}
    {
    }

    void WsGateway::BindRegistry(core::SessionRegistry& registry)
    {
        registry_ = &registry;
    }

    void WsGateway::Install()
    {
        server_.set_open_handler([this](Hdl hdl) { OnOpen(std::move(hdl)); });
        server_.set_close_handler([this](Hdl hdl) { OnClose(std::move(hdl)); });
        server_.set_message_handler([this](Hdl hdl, WsServer::message_ptr msg)
        {
            OnMessage(std::move(hdl), std::move(msg));
        });
    }

    auto WsGateway::ConnectionCount() const -> std::size_t
    {
        std::lock_guard<std::mutex> lock(mx_);
        return ids_.size();
    }

    auto WsGateway::Lookup(Hdl const& hdl) const -> std::optional<core::ConnectionId>
    {
        std::lock_guard<std::mutex> lock(mx_);
        auto const it = ids_.find(hdl);
        if (it == ids_.end()) return std::nullopt;
        return it->second;
    }

    void WsGateway::OnOpen(Hdl hdl)
    {
        core::ConnectionId id{};
        {
            std::lock_guard<std::mutex> lock(mx_);
            id = next_id_++;
            ids_.emplace(hdl, id);
            hdls_.emplace(id, hdl);
        }
        std::print("[Gateway] Connection {} opened\n", id);
    }

    void WsGateway::OnClose(Hdl hdl)
    {
        std::optional<core::ConnectionId> id;
        {
            std::lock_guard<std::mutex> lock(mx_);
            auto const it = ids_.find(hdl);
            if (it != ids_.end())
            {
                id = it->second;
                hdls_.erase(it->second);
                ids_.erase(it);
            }
        }
        if (!id) return;

        std::size_t const touched = registry_ ? registry_->HandleDisconnect(*id) : 0;
        std::print("[Gateway] Connection {} closed ({} session(s) updated)\n", *id, touched);
    }

    void WsGateway::OnMessage(Hdl hdl, WsServer::message_ptr msg)
    {
        // Only binary frames are valid
        if (msg->get_opcode() != websocketpp::frame::opcode::binary)
        {
            std::print("[Gateway] Ignoring non-binary frame\n");
            return;
        }

        std::optional<core::ConnectionId> const conn = Lookup(hdl);
        if (!conn) return;

        std::string const& payload = msg->get_payload();
        std::span<std::byte const> const bytes{
            reinterpret_cast<std::byte const*>(payload.data()), payload.size()
        };

        auto const parsed = cnet::DecodeRequest(bytes);
        if (!parsed)
        {
            std::print("[Gateway] Connection {} parse error: {}\n", *conn, parsed.error().message);
            return;
        }

        if (!registry_)
        {
            std::print("[Gateway] Dropping request before the registry is bound\n");
            return;
        }

        try
        {
            Dispatch(*conn, *parsed);
        }
        catch (core::error::OmegaException<core::error::Code> const& e)
        {
            std::print("[Gateway] Request {} from connection {} failed:\n{}\n", parsed->msg_id, *conn, e);
        }
        catch (std::exception const& e)
        {
            std::print("[Gateway] Request {} from connection {} failed: {}\n", parsed->msg_id, *conn, e.what());
        }
    }

    void WsGateway::Dispatch(core::ConnectionId const conn, cnet::DecodedRequest const& req)
    {
        std::uint64_t const msg_id = req.msg_id;

        // rejections go back to the caller only
        auto answer = [&](core::error::ActionResult const& r)
        {
            if (!r) SendTo(conn, cnet::BuildViolation(r.error(), msg_id));
        };

        std::visit([&]<typename T0>(T0 const& r)
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, cnet::CreateRequest>)
            {
                core::Joined const j = registry_->Create(r.username, conn);
                SendTo(conn, cnet::BuildSessionCreated(j.session_id, j.player_id, msg_id));
            }
            else if constexpr (std::is_same_v<T, cnet::JoinRequest>)
            {
                auto const j = registry_->Join(r.session_id, r.username, conn);
                if (j)
                {
                    SendTo(conn, cnet::BuildJoinResult(true, j->session_id, j->player_id, msg_id));
                }
                else
                {
                    SendTo(conn, cnet::BuildJoinResult(false, {}, {}, msg_id));
                    SendTo(conn, cnet::BuildViolation(j.error(), msg_id));
                }
            }
            else if constexpr (std::is_same_v<T, cnet::KickRequest>)
            {
                answer(registry_->Kick(r.session_id, r.target, r.by));
            }
            else if constexpr (std::is_same_v<T, cnet::StartRequest>)
            {
                answer(registry_->Start(r.session_id, r.by));
            }
            else if constexpr (std::is_same_v<T, cnet::PlayRequest>)
            {
                answer(registry_->Play(r.session_id, r.by, r.play.cards, r.play.claimed));
            }
            else if constexpr (std::is_same_v<T, cnet::ChallengeRequest>)
            {
                answer(registry_->CallChallenge(r.session_id, r.by));
            }
            else if constexpr (std::is_same_v<T, cnet::CounterRequest>)
            {
                answer(registry_->InvokeCounter(r.session_id, r.by));
            }
        }, req.request);
    }

    auto WsGateway::SendTo(core::ConnectionId const conn, flatbuffers::DetachedBuffer const& buf) -> void
    {
        Hdl hdl;
        {
            std::lock_guard<std::mutex> lock(mx_);
            auto const it = hdls_.find(conn);
            if (it == hdls_.end()) return; // already closed
            hdl = it->second;
        }

        websocketpp::lib::error_code ec;
        server_.send(hdl, buf.data(), buf.size(), websocketpp::frame::opcode::binary, ec);
        if (ec)
        {
            std::print("[Gateway] send() to connection {} failed: {}\n", conn, ec.message());
        }
    }

    auto WsGateway::PublishState(std::span<core::ConnectionId const> audience,
                                 core::SessionView const& view,
                                 core::StateEvent const event) -> void
    {
        flatbuffers::DetachedBuffer const buf = cnet::BuildSessionState(view, event);
        for (core::ConnectionId const c : audience)
        {
            SendTo(c, buf);
        }
    }

    auto WsGateway::PublishHand(core::ConnectionId const conn, core::HandView const& hand) -> void
    {
        SendTo(conn, cnet::BuildPlayerHand(hand));
    }
}
