// File: src/DuelServerMain.cpp
//
// Authoritative duel server: WebSocket++ (no TLS) over standalone Asio.
// Clients bind an identity with Hello, then challenge, play and watch duels by context key.

#include <cstdio>
#include <print>
#include <string>
#include <vector>

#include "net/DuelHost.hpp"
#include "net/ServerConfig.hpp"

namespace
{
    auto PrintUsage() -> void
    {
        std::print(stderr,
                   "usage: duel_server [--port N] [--challenge-timeout-ms N] [--moderator ID]...\n"
                   "                   [--house-bot ID] [--seed N] [--transcripts DIR]\n");
    }
} // anon

int main(int argc, char** argv)
{
    std::vector<char const*> const args(argv + 1, argv + argc);
    std::expected<duel::net::ServerConfig, std::string> cfg = duel::net::ParseArgs(args);
    if (!cfg.has_value())
    {
        std::print(stderr, "[duel-server] {}\n", cfg.error());
        PrintUsage();
        return 2;
    }

    std::print("[duel-server] Booting on port {} | {} moderator(s) | house bot {} | challenge timeout {} ms\n",
               cfg->port,
               cfg->moderators.size(),
               cfg->house_bot ? std::to_string(*cfg->house_bot) : std::string{"off"},
               cfg->challenge_timeout_ms);

    duel::net::DuelHost host(std::move(*cfg));
    try
    {
        host.Run();
    }
    catch (websocketpp::exception const& e)
    {
        std::print(stderr, "[duel-server] Network failure: {}\n", e.what());
        return 1;
    }
    return 0;
}
