// File: src/BluffBotMain.cpp
//
// bluff_bot: a headless client that plays via RandomAI. Creates a session (or
// joins one with --session), prints the ids, and answers every projection
// it receives with at most one request.
//

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <expected>
#include <format>
#include <memory>
#include <optional>
#include <print>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <variant>

#include <websocketpp/config/asio_no_tls_client.hpp>
#include <websocketpp/client.hpp>

#include "core/Types.hpp"
#include "core/State.hpp"
#include "core/Actions.hpp"
#include "core/RandomAi.hpp"
#include "net/Codec.hpp"

namespace
{
    using WsClient = websocketpp::client<websocketpp::config::asio_client>;
    namespace cnet = bluff::core::net;

    struct CmdLine
    {
        std::string   host{"127.0.0.1"};
        std::uint16_t port{9002};
        std::string   name{"bot"};
        std::string   session{};      // empty: create a new one
        std::uint32_t start_at{2};
        std::uint64_t seed{424242ULL};
        std::uint32_t moves{200};
    };

    template <typename T>
    auto parse_number(std::string_view const key, std::string_view const text) -> std::expected<T, std::string>
    {
        T value{};
        auto const [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc{} || ptr != text.data() + text.size())
        {
            return std::unexpected(std::format("{} expects a number, got '{}'", key, text));
        }
        return value;
    }

    auto parse_args(int argc, char** argv) -> std::expected<CmdLine, std::string>
    {
        CmdLine c{};
        for (int i = 1; i < argc; ++i)
        {
            std::string_view const k = argv[i];
            if (i + 1 >= argc)
            {
                return std::unexpected(std::format("{} is missing its value", k));
            }
            std::string_view const v = argv[++i];

            if (k == "--host") { c.host = v; }
            else if (k == "--name") { c.name = v; }
            else if (k == "--session") { c.session = v; }
            else if (k == "--port")
            {
                auto const n = parse_number<std::uint16_t>(k, v);
                if (!n) return std::unexpected(n.error());
                c.port = *n;
            }
            else if (k == "--start-at")
            {
                auto const n = parse_number<std::uint32_t>(k, v);
                if (!n) return std::unexpected(n.error());
                c.start_at = *n;
            }
            else if (k == "--seed")
            {
                auto const n = parse_number<std::uint64_t>(k, v);
                if (!n) return std::unexpected(n.error());
                c.seed = *n;
            }
            else if (k == "--moves")
            {
                auto const n = parse_number<std::uint32_t>(k, v);
                if (!n) return std::unexpected(n.error());
                c.moves = *n;
            }
            else
            {
                return std::unexpected(std::format("unknown option {}", k));
            }
        }
        return c;
    }

    // All state is touched from the single client io thread only.
    class Bot
    {
    public:
        Bot(WsClient& client, CmdLine cfg)
            : client_{client}, cfg_{std::move(cfg)}, ai_{cfg_.seed}
        {
        }

        void OnOpen(websocketpp::connection_hdl hdl)
        {
            hdl_ = hdl;
            std::print("[bot] Connected as '{}'\n", cfg_.name);
            if (cfg_.session.empty())
                Send(cnet::BuildRequest_Create(cfg_.name, NextMsgId()));
            else
                Send(cnet::BuildRequest_Join(cfg_.session, cfg_.name, NextMsgId()));
        }

        void OnMessage(WsClient::message_ptr msg)
        {
            if (msg->get_opcode() != websocketpp::frame::opcode::binary)
            {
                std::print("[bot] Ignoring non-binary frame\n");
                return;
            }

            std::string const& pl = msg->get_payload();
            auto const decoded = cnet::DecodeServerMessage(
                std::span<std::byte const>{reinterpret_cast<std::byte const*>(pl.data()), pl.size()});
            if (!decoded)
            {
                std::print("[bot] Bad frame: {}\n", decoded.error().message);
                return;
            }

            std::visit([this]<typename T0>(T0 const& m)
            {
                using T = std::decay_t<T0>;
                if constexpr (std::is_same_v<T, cnet::SessionCreatedMsg>)
                {
                    sid_ = m.session_id;
                    me_ = m.player_id;
                    std::print("[bot] Created session {} (player {})\n", sid_, me_);
                }
                else if constexpr (std::is_same_v<T, cnet::JoinResultMsg>)
                {
                    if (!m.ok)
                    {
                        std::print("[bot] Join refused\n");
                        Close("join refused");
                        return;
                    }
                    sid_ = m.session_id;
                    me_ = m.player_id;
                    std::print("[bot] Joined session {} (player {})\n", sid_, me_);
                }
                else if constexpr (std::is_same_v<T, cnet::StateMsg>)
                {
                    OnState(m);
                }
                else if constexpr (std::is_same_v<T, bluff::core::HandView>)
                {
                    if (m.player_id != me_) return;
                    hand_ = m;
                    // the hand trails its projection, so both are fresh here
                    Act();
                }
                else if constexpr (std::is_same_v<T, cnet::ViolationMsg>)
                {
                    std::print("[bot] Request {} rejected: {}\n", m.msg_id, m.text);
                    if (retries_ > 0)
                    {
                        --retries_;
                        Act();
                    }
                }
            }, *decoded);
        }

    private:
        void OnState(cnet::StateMsg const& m)
        {
            view_ = m.view;
            retries_ = 3;

            bool const am_host = std::ranges::any_of(view_->players, [this](bluff::core::PlayerSummary const& p)
            {
                return p.id == me_ && p.is_host;
            });

            if (!view_->started && am_host && !start_sent_ && view_->players.size() >= cfg_.start_at)
            {
                std::print("[bot] {} players seated, starting\n", view_->players.size());
                Send(cnet::BuildRequest_Start(sid_, me_, NextMsgId()));
                start_sent_ = true;
            }
            if (m.event == bluff::core::StateEvent::Started)
            {
                std::print("[bot] Game started\n");
            }
        }

        void Act()
        {
            if (!view_ || !hand_ || me_.empty()) return;

            if (moves_ >= cfg_.moves)
            {
                Close("move budget reached");
                return;
            }

            std::optional<bluff::core::PlayerAction> const act =
                ai_.Decide(*view_, *hand_, bluff::core::WallClock::now());
            if (!act) return;

            std::visit([this]<typename T0>(T0 const& a)
            {
                using T = std::decay_t<T0>;
                if constexpr (std::is_same_v<T, bluff::core::PlayAction>)
                {
                    std::print("[bot] Play {} card(s) as {}\n", a.cards.size(), bluff::core::RankLabel(a.claimed));
                    Send(cnet::BuildRequest_Play(sid_, me_, a.cards, a.claimed, NextMsgId()));
                }
                else if constexpr (std::is_same_v<T, bluff::core::ChallengeAction>)
                {
                    std::print("[bot] Call BS\n");
                    Send(cnet::BuildRequest_Challenge(sid_, me_, NextMsgId()));
                }
                else if constexpr (std::is_same_v<T, bluff::core::CounterAction>)
                {
                    std::print("[bot] Peanut butter\n");
                    Send(cnet::BuildRequest_Counter(sid_, me_, NextMsgId()));
                }
            }, *act);
            ++moves_;
        }

        void Send(flatbuffers::DetachedBuffer const& buf)
        {
            websocketpp::lib::error_code ec;
            client_.send(hdl_, buf.data(), buf.size(), websocketpp::frame::opcode::binary, ec);
            if (ec)
            {
                std::print("[bot] send() failed: {}\n", ec.message());
            }
        }

        void Close(std::string const& why)
        {
            websocketpp::lib::error_code ec;
            client_.close(hdl_, websocketpp::close::status::normal, why, ec);
            if (ec)
            {
                std::print("[bot] close() failed: {}\n", ec.message());
            }
        }

        auto NextMsgId() -> std::uint64_t { return ++msg_id_; }

    private:
        WsClient& client_;
        CmdLine cfg_;
        bluff::core::RandomAI ai_;
        websocketpp::connection_hdl hdl_{};

        bluff::core::SessionId sid_{};
        bluff::core::PlayerId me_{};
        std::optional<bluff::core::SessionView> view_{};
        std::optional<bluff::core::HandView> hand_{};

        std::uint64_t msg_id_{0};
        std::uint32_t moves_{0};
        int retries_{3};
        bool start_sent_{false};
    };
} // anon

int main(int argc, char** argv)
{
    auto const parsed = parse_args(argc, argv);
    if (!parsed)
    {
        std::print(stderr, "[bot] {}\n", parsed.error());
        std::print(stderr, "usage: bluff_bot [--host H] [--port N] [--name S] [--session ID] "
                           "[--start-at N] [--seed N] [--moves N]\n");
        return 2;
    }

    std::string const url = std::format("ws://{}:{}", parsed->host, parsed->port);
    std::print("[bot] Connecting to {} | seed={}\n", url, parsed->seed);

    WsClient c;
    c.clear_access_channels(websocketpp::log::alevel::all);
    c.init_asio();

    Bot bot(c, *parsed);

    c.set_open_handler([&bot](websocketpp::connection_hdl hdl) { bot.OnOpen(hdl); });
    c.set_message_handler([&bot](websocketpp::connection_hdl, WsClient::message_ptr msg)
    {
        bot.OnMessage(std::move(msg));
    });
    c.set_close_handler([](websocketpp::connection_hdl)
    {
        std::print("[bot] Closed.\n");
    });

    websocketpp::lib::error_code ec;
    WsClient::connection_ptr con = c.get_connection(url, ec);
    if (ec)
    {
        std::print(stderr, "[bot] get_connection error: {}\n", ec.message());
        return 2;
    }

    c.connect(con);

    // Run the client loop (blocking)
    c.run();

    return 0;
}
