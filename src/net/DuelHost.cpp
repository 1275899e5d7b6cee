//
// DuelHost.cpp
//

#include "DuelHost.hpp"

#include <cstdio>
#include <format>
#include <print>
#include <span>
#include <string>
#include <utility>

using namespace duel::core;

namespace duel::net
{
    DuelHost::DuelHost(ServerConfig cfg) :
        cfg_(std::move(cfg)),
        seeds_(cfg_.seed)
    {
        if (cfg_.house_bot)
        {
            bot_.emplace(cfg_.seed ^ *cfg_.house_bot);
        }

        server_.clear_access_channels(websocketpp::log::alevel::all);
        server_.set_access_channels(websocketpp::log::alevel::connect |
            websocketpp::log::alevel::disconnect);
        server_.init_asio();
        server_.set_reuse_addr(true);

        server_.set_open_handler([this](Hdl hdl) { OnOpen(std::move(hdl)); });
        server_.set_close_handler([this](Hdl hdl) { OnClose(std::move(hdl)); });
        server_.set_message_handler([this](Hdl hdl, WsServer::message_ptr msg)
        {
            OnMessage(std::move(hdl), std::move(msg));
        });
    }

    auto DuelHost::Run() -> void
    {
        server_.listen(cfg_.port);
        server_.start_accept();
        std::print("[duel-server] Listening on port {}\n", cfg_.port);
        server_.run();
    }

    auto DuelHost::Stop() -> void
    {
        websocketpp::lib::error_code ec;
        server_.stop_listening(ec);
        if (ec)
        {
            std::print("[duel-server] stop_listening: {}\n", ec.message());
        }
        server_.stop();
    }

    auto DuelHost::OnOpen(Hdl const hdl) -> void
    {
        (void)hdl;
        std::print("[duel-server] Connection opened, waiting for Hello\n");
    }

    auto DuelHost::OnClose(Hdl const hdl) -> void
    {
        if (std::optional<ParticipantId> const id = identities_.Unbind(hdl))
        {
            std::print("[duel-server] Participant {} disconnected\n", *id);
        }
    }

    auto DuelHost::OnMessage(Hdl const hdl, WsServer::message_ptr const msg) -> void
    {
        // Only binary frames are valid
        if (msg->get_opcode() != websocketpp::frame::opcode::binary)
        {
            std::print("[duel-server] Ignoring non-binary frame from client\n");
            return;
        }

        std::string const& payload = msg->get_payload();
        std::span<std::byte const> const bytes{
            reinterpret_cast<std::byte const*>(payload.data()),
            payload.size()
        };

        std::expected<core::net::DecodedCommand, core::net::ParseError> const parsed = core::net::DecodeCommand(bytes);
        if (!parsed.has_value())
        {
            std::print("[duel-server] Parse error: {}\n", parsed.error().message);
            return;
        }
        core::net::DecodedCommand const& cmd = *parsed;

        if (auto const* hello = std::get_if<core::net::HelloCmd>(&cmd.body))
        {
            // The house bot has no connection, so its id is never up for grabs
            std::expected<void, core::error::RuleViolation> bound = std::unexpected(core::error::RuleViolation{
                .code = core::error::RuleViolationCode::Actor_IdentityTaken
            });
            if (cfg_.house_bot != hello->participant)
            {
                bound = identities_.Bind(hdl, hello->participant);
            }
            if (!bound.has_value())
            {
                std::print("[duel-server] Refused Hello for participant {}: {}\n", hello->participant,
                           core::error::to_string(bound.error().code));
                Reject(hdl, cmd.msg_id, bound.error());
                return;
            }
            std::print("[duel-server] Connection bound to participant {}\n", hello->participant);
            Send(hdl, core::net::BuildAck(MoveOutcome::Applied, cmd.msg_id));
            return;
        }

        std::optional<ParticipantId> const who = identities_.Lookup(hdl);
        if (!who)
        {
            Reject(hdl, cmd.msg_id, core::error::RuleViolation{.code = core::error::RuleViolationCode::Actor_Missing});
            return;
        }
        ParticipantId const me = *who;

        try
        {
            std::visit([&]<typename T0>(T0 const& body)
            {
                using T = std::decay_t<T0>;

                if constexpr (std::is_same_v<T, core::net::ChallengeCmd>)
                    HandleChallenge(hdl, me, cmd, body);
                else if constexpr (std::is_same_v<T, core::net::SetModifierCmd>)
                    HandleModifier(hdl, me, cmd, body);
                else if constexpr (std::is_same_v<T, core::net::ForceEndCmd>)
                    HandleForceEnd(hdl, me, cmd);
                else if constexpr (std::is_same_v<T, core::net::StatusCmd>)
                    HandleStatus(hdl, me, cmd);
                else if constexpr (std::is_same_v<T, MatchAction>)
                    HandleAction(hdl, me, cmd, body);
                else
                    static_assert(std::is_same_v<T, core::net::HelloCmd>, "unhandled command");
            }, cmd.body);
        }
        catch (TracedException<core::error::Code> const& e)
        {
            // Engine misuse is a bug; report it and keep the other contexts running
            std::print("[duel-server] {}\n", e);
        }
    }

    auto DuelHost::HandleChallenge(Hdl const hdl, ParticipantId const me, core::net::DecodedCommand const& cmd,
                                   core::net::ChallengeCmd const& c) -> void
    {
        MatchConfig config = c.config;
        config.seed = seeds_();

        MatchRegistry::CreateResult const created = registry_.CreateMatch(cmd.context, me, c.opponent, config);
        if (!created.has_value())
        {
            Reject(hdl, cmd.msg_id, created.error());
            return;
        }
        MatchRegistry::MatchPtr const& match = *created;

        watchers_[cmd.context] = {me, c.opponent};
        OpenTranscript(*match);

        std::print("[duel-server] Context {}: {} challenges {} (best of {})\n",
                   cmd.context, me, c.opponent, static_cast<int>(config.best_of));

        Send(hdl, core::net::BuildAck(MoveOutcome::Applied, cmd.msg_id));
        BroadcastSnapshots(*match);
        ArmChallengeTimer(match);
        DriveHouseBot(match);
    }

    auto DuelHost::HandleAction(Hdl const hdl, ParticipantId const me, core::net::DecodedCommand const& cmd,
                                MatchAction const& a) -> void
    {
        MatchRegistry::CreateResult const found = registry_.Require(cmd.context);
        if (!found.has_value())
        {
            Reject(hdl, cmd.msg_id, found.error());
            return;
        }
        MatchRegistry::MatchPtr const& match = *found;

        std::size_t const before = match->HistorySize();
        ActionResult const r = match->SubmitAs(me, a);
        Publish(hdl, cmd.msg_id, match, match->SeatOf(me), a, r, before);
        if (r.has_value())
        {
            DriveHouseBot(match);
        }
    }

    auto DuelHost::HandleModifier(Hdl const hdl, ParticipantId const me, core::net::DecodedCommand const& cmd,
                                  core::net::SetModifierCmd const& m) -> void
    {
        if (!cfg_.IsModerator(me))
        {
            Reject(hdl, cmd.msg_id, core::error::RuleViolation{.code = core::error::RuleViolationCode::Actor_NotModerator});
            return;
        }

        MatchRegistry::CreateResult const found = registry_.Require(cmd.context);
        if (!found.has_value())
        {
            Reject(hdl, cmd.msg_id, found.error());
            return;
        }
        MatchRegistry::MatchPtr const& match = *found;

        std::size_t const before = match->HistorySize();
        ActionResult const r = match->SetModifier(m.target, m.scope, m.value);
        SetModifierAction const logged{
            .target = match->SeatOf(m.target).value_or(NoSeat),
            .scope = m.scope,
            .value = m.value
        };
        Publish(hdl, cmd.msg_id, match, std::nullopt, logged, r, before);
    }

    auto DuelHost::HandleForceEnd(Hdl const hdl, ParticipantId const me, core::net::DecodedCommand const& cmd) -> void
    {
        if (!cfg_.IsModerator(me))
        {
            Reject(hdl, cmd.msg_id, core::error::RuleViolation{.code = core::error::RuleViolationCode::Actor_NotModerator});
            return;
        }

        MatchRegistry::CreateResult const found = registry_.Require(cmd.context);
        if (!found.has_value())
        {
            Reject(hdl, cmd.msg_id, found.error());
            return;
        }

        std::size_t const before = (*found)->HistorySize();
        ActionResult const r = (*found)->Cancel();
        std::print("[duel-server] Context {}: force-ended by moderator {}\n", cmd.context, me);
        Publish(hdl, cmd.msg_id, *found, std::nullopt, CancelAction{}, r, before);
    }

    auto DuelHost::HandleStatus(Hdl const hdl, ParticipantId const me, core::net::DecodedCommand const& cmd) -> void
    {
        MatchRegistry::CreateResult const found = registry_.Require(cmd.context);
        if (!found.has_value())
        {
            Reject(hdl, cmd.msg_id, found.error());
            return;
        }
        // Observers keep receiving updates for this context from now on
        watchers_[cmd.context].insert(me);
        Send(hdl, core::net::BuildSnapshot(*(*found)->StatusFor(me), cmd.msg_id));
    }

    auto DuelHost::Publish(Hdl const hdl, std::uint64_t const msg_id, MatchRegistry::MatchPtr const& match,
                           std::optional<SeatT> const actor, MatchAction const& a,
                           ActionResult const& r, std::size_t const history_before) -> void
    {
        ContextKey const key = match->Key();
        core::debug::MatchLogger* const log = Transcript(key);
        if (log)
        {
            log->action(actor, a);
            log->outcome(r);
        }

        if (!r.has_value())
        {
            std::print("[duel-server] Context {}: rejected {} ({})\n", key, core::debug::DescribeAction(a),
                       core::error::describe(r.error()));
            Reject(hdl, msg_id, r.error());
            return;
        }

        Send(hdl, core::net::BuildAck(*r, msg_id));

        // History is public, so the observer view carries every new result
        std::shared_ptr<MatchSnapshot const> const snap = match->SnapshotFor(std::nullopt);
        for (std::size_t i = history_before; i < snap->history.size(); ++i)
        {
            RoundResult const& rr = snap->history[i];
            flatbuffers::DetachedBuffer const buf = core::net::BuildRoundResult(key, rr);
            for (ParticipantId const id : watchers_[key])
            {
                SendTo(id, buf);
            }
            if (log) log->round(rr);
            std::print("[duel-server] Context {}: {}\n", key, core::debug::DescribeRound(rr));
        }

        if (*r != MoveOutcome::Applied)
        {
            std::print("[duel-server] Context {}: {}\n", key, core::error::to_string(*r));
        }
        BroadcastSnapshots(*match);

        if (IsTerminal(snap->state) && log)
        {
            log->end(*match);
            transcripts_.erase(key);
        }
    }

    auto DuelHost::BroadcastSnapshots(MatchImpl const& match) -> void
    {
        // Each watcher gets its own filtered view
        for (ParticipantId const id : watchers_[match.Key()])
        {
            SendTo(id, core::net::BuildSnapshot(*match.StatusFor(id), 0));
        }
    }

    auto DuelHost::DriveHouseBot(MatchRegistry::MatchPtr const& match) -> void
    {
        if (!bot_ || !cfg_.house_bot) return;
        std::optional<SeatT> const seat = match->SeatOf(*cfg_.house_bot);
        if (!seat) return;

        // Every accepted action moves the match forward, so this ends once the bot is not pending
        while (true)
        {
            std::optional<MatchAction> const action = bot_->Decide(match->SnapshotFor(*seat));
            if (!action) return;

            std::size_t const before = match->HistorySize();
            ActionResult const r = match->SubmitAs(*cfg_.house_bot, *action);
            Publish(Hdl{}, 0, match, seat, *action, r, before);
            if (!r.has_value()) return;
        }
    }

    auto DuelHost::ArmChallengeTimer(MatchRegistry::MatchPtr const& match) -> void
    {
        if (cfg_.challenge_timeout_ms == 0) return;

        std::weak_ptr<MatchImpl> const weak = match;
        server_.set_timer(static_cast<long>(cfg_.challenge_timeout_ms),
                          [this, weak](websocketpp::lib::error_code const& ec)
        {
            if (ec) return;
            MatchRegistry::MatchPtr const m = weak.lock();
            if (!m || m->StateNow() != MatchState::PendingChallenge) return;

            std::print("[duel-server] Context {}: challenge expired\n", m->Key());
            std::size_t const before = m->HistorySize();
            ActionResult const r = m->Cancel();
            Publish(Hdl{}, 0, m, std::nullopt, CancelAction{}, r, before);
        });
    }

    auto DuelHost::OpenTranscript(MatchImpl const& match) -> void
    {
        transcripts_.erase(match.Key());
        if (!cfg_.transcripts) return;

        std::string path = std::format("{}/match_{}_{}.log", *cfg_.transcripts, match.Key(), match.Config().seed);
        auto log = std::make_unique<core::debug::MatchLogger>(path);
        if (!log->is_open())
        {
            std::print("[duel-server] Cannot open transcript {}\n", path);
            return;
        }
        log->start(match);
        transcripts_[match.Key()] = std::move(log);
    }

    auto DuelHost::Transcript(ContextKey const key) -> core::debug::MatchLogger*
    {
        auto const it = transcripts_.find(key);
        return it == transcripts_.end() ? nullptr : it->second.get();
    }

    auto DuelHost::Send(Hdl const hdl, flatbuffers::DetachedBuffer const& buf) -> void
    {
        // House bot and timers act without a connection
        if (hdl.expired()) return;

        websocketpp::lib::error_code ec;
        server_.send(hdl, buf.data(), buf.size(), websocketpp::frame::opcode::binary, ec);
        if (ec)
        {
            std::print("[duel-server] send() error: {}\n", ec.message());
        }
    }

    auto DuelHost::SendTo(ParticipantId const id, flatbuffers::DetachedBuffer const& buf) -> void
    {
        if (std::optional<Hdl> const route = identities_.RouteTo(id))
        {
            Send(*route, buf);
        }
    }

    auto DuelHost::Reject(Hdl const hdl, std::uint64_t const msg_id, core::error::RuleViolation const& v) -> void
    {
        Send(hdl, core::net::BuildViolation(v, msg_id));
    }
}
