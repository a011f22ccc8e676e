// File: src/BluffServerMain.cpp
//
// bluffd: authoritative Bluff server over WebSocket++ (no TLS) on Boost.Asio.
// Every connection may create or join any number of sessions; all game
// state lives in one SessionRegistry for the lifetime of the process.

#include <charconv>
#include <chrono>
#include <cstdio>
#include <csignal>
#include <cstdint>
#include <expected>
#include <format>
#include <memory>
#include <print>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

#include <boost/asio/signal_set.hpp>
#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "core/Types.hpp"
#include "core/Clock.hpp"
#include "core/Registry.hpp"
#include "debug/AuditLogger.hpp"
#include "net/WsGateway.hpp"

namespace
{
    struct CmdLine
    {
        std::uint16_t port{9002};
        std::uint64_t seed{std::random_device{}()};
        std::uint32_t challenge_ms{static_cast<std::uint32_t>(bluff::core::constants::ChallengeWindow.count())};
        std::uint32_t io_threads{1};
        std::string   audit_log{};
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
            std::string_view const key = argv[i];
            if (i + 1 >= argc)
            {
                return std::unexpected(std::format("{} is missing its value", key));
            }
            std::string_view const val = argv[++i];

            if (key == "--port")
            {
                auto const v = parse_number<std::uint16_t>(key, val);
                if (!v) return std::unexpected(v.error());
                c.port = *v;
            }
            else if (key == "--seed")
            {
                auto const v = parse_number<std::uint64_t>(key, val);
                if (!v) return std::unexpected(v.error());
                c.seed = *v;
            }
            else if (key == "--challenge-ms")
            {
                auto const v = parse_number<std::uint32_t>(key, val);
                if (!v) return std::unexpected(v.error());
                c.challenge_ms = *v;
            }
            else if (key == "--io-threads")
            {
                auto const v = parse_number<std::uint32_t>(key, val);
                if (!v) return std::unexpected(v.error());
                c.io_threads = *v;
            }
            else if (key == "--audit-log")
            {
                c.audit_log = val;
            }
            else
            {
                return std::unexpected(std::format("unknown option {}", key));
            }
        }
        if (c.io_threads == 0)
        {
            c.io_threads = 1;
        }
        return c;
    }
} // anon

int main(int argc, char** argv)
{
    auto const parsed = parse_args(argc, argv);
    if (!parsed)
    {
        std::print(stderr, "[bluffd] {}\n", parsed.error());
        std::print(stderr, "usage: bluffd [--port N] [--seed N] [--challenge-ms N] [--io-threads N] [--audit-log PATH]\n");
        return 2;
    }
    CmdLine const& cli = *parsed;

    bluff::core::Config cfg{};
    cfg.seed = cli.seed;
    cfg.challenge_window = std::chrono::milliseconds(cli.challenge_ms);

    std::shared_ptr<bluff::core::debug::AuditLogger> audit;
    if (!cli.audit_log.empty())
    {
        audit = std::make_shared<bluff::core::debug::AuditLogger>(cli.audit_log);
        if (!audit->is_open())
        {
            std::print(stderr, "[bluffd] Cannot open audit log {}\n", cli.audit_log);
            return 1;
        }
    }

    bluff::net::WsServer server;
    server.clear_access_channels(websocketpp::log::alevel::all);
    server.set_access_channels(websocketpp::log::alevel::connect |
        websocketpp::log::alevel::disconnect);
    server.init_asio();
    server.set_reuse_addr(true);

    auto gateway = std::make_shared<bluff::net::WsGateway>(server);
    bluff::core::SessionRegistry registry(cfg, std::make_shared<bluff::core::SystemClock>(), gateway, audit);
    gateway->BindRegistry(registry);
    gateway->Install();

    websocketpp::lib::error_code ec;
    server.listen(cli.port, ec);
    if (ec)
    {
        std::print(stderr, "[bluffd] listen on port {} failed: {}\n", cli.port, ec.message());
        return 1;
    }
    server.start_accept(ec);
    if (ec)
    {
        std::print(stderr, "[bluffd] start_accept failed: {}\n", ec.message());
        return 1;
    }

    boost::asio::signal_set signals(server.get_io_service(), SIGINT, SIGTERM);
    signals.async_wait([&server](boost::system::error_code const& sig_ec, int const signo)
    {
        if (sig_ec) return;
        std::print("[bluffd] Signal {} received, shutting down\n", signo);
        websocketpp::lib::error_code stop_ec;
        server.stop_listening(stop_ec);
        if (stop_ec)
        {
            std::print("[bluffd] stop_listening: {}\n", stop_ec.message());
        }
        server.stop();
    });

    std::print("[bluffd] Listening on port {} | seed={} window={}ms io-threads={}{}\n",
               cli.port, cli.seed, cli.challenge_ms, cli.io_threads,
               audit ? std::format(" audit={}", cli.audit_log) : std::string{});

    std::vector<std::thread> pool;
    pool.reserve(cli.io_threads);
    for (std::uint32_t t = 0; t < cli.io_threads; ++t)
    {
        pool.emplace_back([&server]()
        {
            server.run();
        });
    }
    for (std::thread& th : pool)
    {
        th.join();
    }

    if (audit)
    {
        audit->flush();
    }
    std::print("[bluffd] Stopped with {} live session(s)\n", registry.SessionCount());
    return 0;
}
