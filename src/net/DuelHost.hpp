//
// DuelHost.hpp
//

#ifndef IMPERIALDUEL_DUELHOST_HPP
#define IMPERIALDUEL_DUELHOST_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <set>
#include <unordered_map>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "../core/Registry.hpp"
#include "../core/RandomDuelist.hpp"
#include "../debug/MatchLogger.hpp"
#include "Identities.hpp"
#include "ServerConfig.hpp"
#include "codec.hpp"

namespace duel::net
{
    // Authoritative host for any number of contexts. All handlers run on the asio thread.
    class DuelHost
    {
    public:
        using WsServer = websocketpp::server<websocketpp::config::asio>;
        using Hdl = websocketpp::connection_hdl;

        explicit DuelHost(ServerConfig cfg);

        DuelHost(DuelHost const&) = delete;
        auto operator=(DuelHost const&) -> DuelHost& = delete;

        // Blocks until Stop()
        auto Run() -> void;
        auto Stop() -> void;

    private:
        auto OnOpen(Hdl hdl) -> void;
        auto OnClose(Hdl hdl) -> void;
        auto OnMessage(Hdl hdl, WsServer::message_ptr msg) -> void;

        auto HandleChallenge(Hdl hdl, core::ParticipantId me, core::net::DecodedCommand const& cmd,
                             core::net::ChallengeCmd const& c) -> void;
        auto HandleAction(Hdl hdl, core::ParticipantId me, core::net::DecodedCommand const& cmd,
                          core::MatchAction const& a) -> void;
        auto HandleModifier(Hdl hdl, core::ParticipantId me, core::net::DecodedCommand const& cmd,
                            core::net::SetModifierCmd const& m) -> void;
        auto HandleForceEnd(Hdl hdl, core::ParticipantId me, core::net::DecodedCommand const& cmd) -> void;
        auto HandleStatus(Hdl hdl, core::ParticipantId me, core::net::DecodedCommand const& cmd) -> void;

        // Ack/Violation to the sender, then round results and snapshots to everyone watching.
        auto Publish(Hdl hdl, std::uint64_t msg_id, core::MatchRegistry::MatchPtr const& match,
                     std::optional<core::SeatT> actor, core::MatchAction const& a,
                     core::ActionResult const& r, std::size_t history_before) -> void;
        auto BroadcastSnapshots(core::MatchImpl const& match) -> void;

        auto DriveHouseBot(core::MatchRegistry::MatchPtr const& match) -> void;
        auto ArmChallengeTimer(core::MatchRegistry::MatchPtr const& match) -> void;

        auto OpenTranscript(core::MatchImpl const& match) -> void;
        auto Transcript(core::ContextKey key) -> core::debug::MatchLogger*;

        auto Send(Hdl hdl, flatbuffers::DetachedBuffer const& buf) -> void;
        auto SendTo(core::ParticipantId id, flatbuffers::DetachedBuffer const& buf) -> void;
        auto Reject(Hdl hdl, std::uint64_t msg_id, core::error::RuleViolation const& v) -> void;

    private:
        ServerConfig cfg_;
        WsServer server_;
        core::MatchRegistry registry_;
        std::mt19937_64 seeds_;

        IdentityTable identities_;
        std::unordered_map<core::ContextKey, std::set<core::ParticipantId>> watchers_;
        std::unordered_map<core::ContextKey, std::unique_ptr<core::debug::MatchLogger>> transcripts_;

        std::optional<core::RandomDuelist> bot_;
    };
}

#endif //IMPERIALDUEL_DUELHOST_HPP
