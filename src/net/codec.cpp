//
// codec.cpp
//
#include "codec.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace fb = duel::gen::net;

namespace duel::core::net
{
    auto ToFbStance(Stance const s) noexcept -> fb::Stance
    {
        switch (s)
        {
        case Stance::Bagr: return fb::Stance::Bagr;
        case Stance::Radae: return fb::Stance::Radae;
        case Stance::Darda: return fb::Stance::Darda;
        case Stance::Tigr: return fb::Stance::Tigr;
        case Stance::Riposje: return fb::Stance::Riposje;
        case Stance::Tortad: return fb::Stance::Tortad;
        }
        return fb::Stance::Bagr;
    }

    auto FromFbStance(uint8_t const raw) noexcept -> std::optional<Stance>
    {
        switch (static_cast<fb::Stance>(raw))
        {
        case fb::Stance::Bagr: return Stance::Bagr;
        case fb::Stance::Radae: return Stance::Radae;
        case fb::Stance::Darda: return Stance::Darda;
        case fb::Stance::Tigr: return Stance::Tigr;
        case fb::Stance::Riposje: return Stance::Riposje;
        case fb::Stance::Tortad: return Stance::Tortad;
        }
        return std::nullopt;
    }

    auto ToFbState(MatchState const s) noexcept -> fb::MatchState
    {
        switch (s)
        {
        case MatchState::PendingChallenge: return fb::MatchState::PendingChallenge;
        case MatchState::Active: return fb::MatchState::Active;
        case MatchState::Completed: return fb::MatchState::Completed;
        case MatchState::Cancelled: return fb::MatchState::Cancelled;
        }
        return fb::MatchState::PendingChallenge;
    }

    auto ToFbPhase(RoundPhase const p) noexcept -> fb::RoundPhase
    {
        switch (p)
        {
        case RoundPhase::Declaring: return fb::RoundPhase::Declaring;
        case RoundPhase::Switching: return fb::RoundPhase::Switching;
        case RoundPhase::Picking: return fb::RoundPhase::Picking;
        case RoundPhase::Resolved: return fb::RoundPhase::Resolved;
        }
        return fb::RoundPhase::Declaring;
    }

    auto ToFbRelationship(Relationship const r) noexcept -> fb::Relationship
    {
        return static_cast<fb::Relationship>(std::to_underlying(r));
    }

    auto ToFbAdjacency(Adjacency const a) noexcept -> fb::Adjacency
    {
        return static_cast<fb::Adjacency>(std::to_underlying(a));
    }

    auto ToFbScope(ModifierScope const s) noexcept -> fb::ModifierScope
    {
        return s == ModifierScope::Round ? fb::ModifierScope::Round : fb::ModifierScope::Match;
    }

    auto FromFbScope(fb::ModifierScope const s) noexcept -> std::optional<ModifierScope>
    {
        switch (s)
        {
        case fb::ModifierScope::Round: return ModifierScope::Round;
        case fb::ModifierScope::Match: return ModifierScope::Match;
        }
        return std::nullopt;
    }

    auto ToFbTiePolicy(TiePolicy const t) noexcept -> fb::TiePolicy
    {
        return t == TiePolicy::Repick ? fb::TiePolicy::Repick : fb::TiePolicy::ChallengerWins;
    }

    auto FromFbTiePolicy(fb::TiePolicy const t) noexcept -> std::optional<TiePolicy>
    {
        switch (t)
        {
        case fb::TiePolicy::Repick: return TiePolicy::Repick;
        case fb::TiePolicy::ChallengerWins: return TiePolicy::ChallengerWins;
        }
        return std::nullopt;
    }

    auto ToFbOutcome(MoveOutcome const o) noexcept -> fb::Outcome
    {
        return static_cast<fb::Outcome>(std::to_underlying(o));
    }
}

namespace
{
    // Verify enum layouts (one value per enum is sufficient to catch drift)
    static_assert((int)duel::core::Relationship::Neutral == (int)fb::Relationship::Neutral);
    static_assert((int)duel::core::Adjacency::Other == (int)fb::Adjacency::Other);
    static_assert((int)duel::core::MoveOutcome::Unchanged == (int)fb::Outcome::Unchanged);
    static_assert((int)duel::core::MoveOutcome::MatchStarted == (int)fb::Outcome::MatchStarted);

    inline auto seat_or_none(std::optional<duel::core::SeatT> const s) -> int8_t
    {
        return s ? static_cast<int8_t>(*s) : int8_t{-1};
    }

    inline auto stance_bytes(std::span<duel::core::Stance const> stances) -> std::vector<uint8_t>
    {
        std::vector<uint8_t> out;
        out.reserve(stances.size());
        for (duel::core::Stance const s : stances)
        {
            out.push_back(std::to_underlying(duel::core::net::ToFbStance(s)));
        }
        return out;
    }

    auto make_round(flatbuffers::FlatBufferBuilder& fbb, duel::core::RoundResult const& r)
        -> flatbuffers::Offset<fb::RoundResultView>
    {
        using namespace duel::core::net;

        std::vector<flatbuffers::Offset<fb::SideView>> sides;
        sides.reserve(r.sides.size());
        for (duel::core::SideResult const& s : r.sides)
        {
            std::vector<uint8_t> dice(s.roll.dice.begin(), s.roll.dice.begin() + s.roll.count);
            auto const roll = fb::CreateDiceView(
                fbb,
                ToFbRelationship(s.roll.profile),
                fbb.CreateVector(dice),
                s.roll.kept,
                s.roll.discarded_index ? static_cast<int8_t>(*s.roll.discarded_index) : int8_t{-1});

            sides.push_back(fb::CreateSideView(
                fbb,
                ToFbStance(s.stance),
                ToFbRelationship(s.relationship),
                roll,
                static_cast<int8_t>(s.adjacency_mod),
                static_cast<int8_t>(s.round_mod),
                static_cast<int8_t>(s.match_mod),
                static_cast<int8_t>(s.raw_total),
                s.final_value));
        }
        auto const sides_vec = fbb.CreateVector(sides);
        auto const score_vec = fbb.CreateVector(std::vector<uint8_t>(r.score.begin(), r.score.end()));

        return fb::CreateRoundResultView(
            fbb,
            /*round*/ r.round,
            /*sides*/ sides_vec,
            /*adjacency*/ ToFbAdjacency(r.adjacency),
            /*tie*/ r.tie,
            /*winner*/ seat_or_none(r.winner),
            /*tie_awarded*/ r.tie_awarded,
            /*score*/ score_vec);
    }

    // CommandMsg wrapped in an Envelope
    template <class T>
    auto finish_command(flatbuffers::FlatBufferBuilder& fbb, std::uint64_t const msg_id,
                        duel::core::ContextKey const context, fb::Command const type,
                        flatbuffers::Offset<T> const body) -> flatbuffers::DetachedBuffer
    {
        auto const m = fb::CreateCommandMsg(fbb, msg_id, context, type, body.Union());
        auto const e = fb::CreateEnvelope(fbb, fb::Message::CommandMsg, m.Union());
        fbb.Finish(e);
        return fbb.Release();
    }
} // anonymous

namespace duel::core::net
{
    // ---------- Snapshot (server → client) ----------

    auto BuildSnapshot(MatchSnapshot const& snap, std::uint64_t const msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;

        std::vector<flatbuffers::Offset<fb::SeatView>> seats;
        seats.reserve(snap.seats.size());
        for (SeatView const& sv : snap.seats)
        {
            std::vector<uint8_t> declared;
            if (sv.declared)
            {
                declared = stance_bytes(*sv.declared);
            }
            auto const declared_vec = fbb.CreateVector(declared);
            auto const mods = fb::CreateModifierView(
                fbb,
                static_cast<int8_t>(sv.modifiers.round),
                static_cast<int8_t>(sv.modifiers.match),
                sv.modifiers.round_set,
                sv.modifiers.match_set);

            seats.push_back(fb::CreateSeatView(
                fbb,
                /*participant*/ sv.participant,
                /*score*/ sv.score,
                /*has_declared*/ sv.has_declared,
                /*declared*/ declared_vec,
                /*switch_done*/ sv.switch_done,
                /*switched*/ sv.switched,
                /*has_picked*/ sv.has_picked,
                /*has_pick*/ sv.picked.has_value(),
                /*picked*/ ToFbStance(sv.picked.value_or(Stance::Bagr)),
                /*has_last_used*/ sv.last_used.has_value(),
                /*last_used*/ ToFbStance(sv.last_used.value_or(Stance::Bagr)),
                /*modifiers*/ mods));
        }
        auto const seats_vec = fbb.CreateVector(seats);
        auto const pending_vec = fbb.CreateVector(std::vector<uint8_t>(snap.pending.begin(), snap.pending.end()));

        std::vector<flatbuffers::Offset<fb::RoundResultView>> history;
        history.reserve(snap.history.size());
        for (RoundResult const& r : snap.history)
        {
            history.push_back(make_round(fbb, r));
        }
        auto const history_vec = fbb.CreateVector(history);

        auto const cfg = fb::CreateConfigView(
            fbb,
            snap.config.best_of,
            snap.config.no_repeat,
            snap.config.adjacency_mod,
            snap.config.bait_switch,
            ToFbTiePolicy(snap.config.tie_policy));

        auto const view = fb::CreateStatusView(
            fbb,
            /*context*/ snap.context,
            /*viewer*/ seat_or_none(snap.viewer),
            /*config*/ cfg,
            /*win_threshold*/ snap.win_threshold,
            /*state*/ ToFbState(snap.state),
            /*phase*/ ToFbPhase(snap.phase),
            /*round*/ snap.round,
            /*seats*/ seats_vec,
            /*pending*/ pending_vec,
            /*winner*/ seat_or_none(snap.winner),
            /*history*/ history_vec);

        auto const sm = fb::CreateSnapshotMsg(fbb, msg_id, view);
        auto const env = fb::CreateEnvelope(fbb, fb::Message::SnapshotMsg, sm.Union());
        fbb.Finish(env);
        return fbb.Release();
    }

    auto BuildRoundResult(ContextKey const context, RoundResult const& r)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const view = make_round(fbb, r);
        auto const rm = fb::CreateRoundResultMsg(fbb, context, view);
        auto const env = fb::CreateEnvelope(fbb, fb::Message::RoundResultMsg, rm.Union());
        fbb.Finish(env);
        return fbb.Release();
    }

    // ---------- Violation / Ack (server → client) ----------

    auto BuildViolation(error::RuleViolation const& v, std::uint64_t const msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const txt = fbb.CreateString(error::describe(v));
        auto const vio = fb::CreateViolation(
            fbb, msg_id, static_cast<int16_t>(v.code), std::to_underlying(v.kind()), txt);
        auto const env = fb::CreateEnvelope(fbb, fb::Message::Violation, vio.Union());
        fbb.Finish(env);
        return fbb.Release();
    }

    auto BuildAck(MoveOutcome const outcome, std::uint64_t const msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const ack = fb::CreateAck(fbb, msg_id, ToFbOutcome(outcome));
        auto const env = fb::CreateEnvelope(fbb, fb::Message::Ack, ack.Union());
        fbb.Finish(env);
        return fbb.Release();
    }

    // ---------- Builders (client → server) ----------

    auto BuildHello(ParticipantId const participant, std::uint64_t const msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const h = fb::CreateCmd_Hello(fbb, participant);
        return finish_command(fbb, msg_id, ContextKey{}, fb::Command::Cmd_Hello, h);
    }

    auto BuildChallenge(ContextKey const context, ParticipantId const opponent, MatchConfig const& config,
                        std::uint64_t const msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const c = fb::CreateCmd_Challenge(
            fbb,
            opponent,
            config.best_of,
            config.no_repeat,
            config.adjacency_mod,
            config.bait_switch,
            ToFbTiePolicy(config.tie_policy));
        return finish_command(fbb, msg_id, context, fb::Command::Cmd_Challenge, c);
    }

    auto BuildAccept(ContextKey const context, std::uint64_t const msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const a = fb::CreateCmd_Accept(fbb);
        return finish_command(fbb, msg_id, context, fb::Command::Cmd_Accept, a);
    }

    auto BuildDeclare(ContextKey const context, std::span<Stance const> stances,
                      std::uint64_t const msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const vec = fbb.CreateVector(stance_bytes(stances));
        auto const d = fb::CreateCmd_Declare(fbb, vec);
        return finish_command(fbb, msg_id, context, fb::Command::Cmd_Declare, d);
    }

    auto BuildSwitch(ContextKey const context, Stance const old_stance, Stance const new_stance,
                     std::uint64_t const msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const s = fb::CreateCmd_Switch(fbb, ToFbStance(old_stance), ToFbStance(new_stance));
        return finish_command(fbb, msg_id, context, fb::Command::Cmd_Switch, s);
    }

    auto BuildPassSwitch(ContextKey const context, std::uint64_t const msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const p = fb::CreateCmd_PassSwitch(fbb);
        return finish_command(fbb, msg_id, context, fb::Command::Cmd_PassSwitch, p);
    }

    auto BuildPick(ContextKey const context, Stance const stance, std::uint64_t const msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const p = fb::CreateCmd_Pick(fbb, ToFbStance(stance));
        return finish_command(fbb, msg_id, context, fb::Command::Cmd_Pick, p);
    }

    auto BuildSetModifier(ContextKey const context, ParticipantId const target, ModifierScope const scope,
                          int const value, std::uint64_t const msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        // Out-of-range values still travel so the host can report them
        auto const wire_value = static_cast<int8_t>(std::clamp(value, -128, 127));
        auto const m = fb::CreateCmd_SetModifier(fbb, target, ToFbScope(scope), wire_value);
        return finish_command(fbb, msg_id, context, fb::Command::Cmd_SetModifier, m);
    }

    auto BuildCancel(ContextKey const context, std::uint64_t const msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const c = fb::CreateCmd_Cancel(fbb);
        return finish_command(fbb, msg_id, context, fb::Command::Cmd_Cancel, c);
    }

    auto BuildForceEnd(ContextKey const context, std::uint64_t const msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const f = fb::CreateCmd_ForceEnd(fbb);
        return finish_command(fbb, msg_id, context, fb::Command::Cmd_ForceEnd, f);
    }

    auto BuildStatus(ContextKey const context, std::uint64_t const msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const s = fb::CreateCmd_Status(fbb);
        return finish_command(fbb, msg_id, context, fb::Command::Cmd_Status, s);
    }

    auto BuildAction(ContextKey const context, MatchAction const& a, std::uint64_t const msg_id)
        -> std::expected<flatbuffers::DetachedBuffer, ParseError>
    {
        return std::visit(
            [&]<typename T0>(T0 const& act) -> std::expected<flatbuffers::DetachedBuffer, ParseError>
            {
                using T = std::decay_t<T0>;

                if constexpr (std::is_same_v<T, AcceptAction>)
                    return BuildAccept(context, msg_id);
                else if constexpr (std::is_same_v<T, DeclareAction>)
                    return BuildDeclare(context, act.stances, msg_id);
                else if constexpr (std::is_same_v<T, SwitchAction>)
                    return BuildSwitch(context, act.from, act.to, msg_id);
                else if constexpr (std::is_same_v<T, PassSwitchAction>)
                    return BuildPassSwitch(context, msg_id);
                else if constexpr (std::is_same_v<T, PickAction>)
                    return BuildPick(context, act.stance, msg_id);
                else if constexpr (std::is_same_v<T, SetModifierAction>)
                    return std::unexpected(ParseError{"modifiers are addressed by participant, use BuildSetModifier"});
                else
                    return BuildCancel(context, msg_id);
            },
            a);
    }

    // ---------- Decode (server ← inbound wire) ----------

    auto VerifyEnvelope(std::span<std::byte const> bytes)
        -> std::expected<fb::Envelope const*, ParseError>
    {
        if (bytes.size() < sizeof(flatbuffers::uoffset_t))
            return std::unexpected(ParseError{"buffer too small"});

        auto const* data = reinterpret_cast<uint8_t const*>(bytes.data());
        flatbuffers::Verifier verifier(data, bytes.size());
        if (!fb::VerifyEnvelopeBuffer(verifier))
            return std::unexpected(ParseError{"verification failed"});

        auto const* env = fb::GetEnvelope(data);
        if (!env)
            return std::unexpected(ParseError{"bad root"});
        return env;
    }

    auto DecodeCommand(std::span<std::byte const> bytes)
        -> std::expected<DecodedCommand, ParseError>
    {
        auto const env = VerifyEnvelope(bytes);
        if (!env)
            return std::unexpected(env.error());

        if ((*env)->message_type() != fb::Message::CommandMsg)
            return std::unexpected(ParseError{"not a CommandMsg"});

        // Union values are optional on the wire and pass verification when absent
        auto const* cm = (*env)->message_as_CommandMsg();
        if (!cm)
            return std::unexpected(ParseError{"missing command body"});

        DecodedCommand out{};
        out.msg_id = cm->msg_id();
        out.context = cm->context();

        switch (cm->command_type())
        {
        case fb::Command::Cmd_Hello:
        {
            auto const* h = cm->command_as_Cmd_Hello();
            if (!h)
                return std::unexpected(ParseError{"missing command body"});
            out.body = HelloCmd{h->participant()};
            return out;
        }

        case fb::Command::Cmd_Challenge:
        {
            auto const* c = cm->command_as_Cmd_Challenge();
            if (!c)
                return std::unexpected(ParseError{"missing command body"});
            auto const ties = FromFbTiePolicy(c->tie_policy());
            if (!ties)
                return std::unexpected(ParseError{"unknown tie policy"});

            ChallengeCmd cc{};
            cc.opponent = c->opponent();
            cc.config.best_of = c->best_of();
            cc.config.no_repeat = c->no_repeat();
            cc.config.adjacency_mod = c->adjacency_mod();
            cc.config.bait_switch = c->bait_switch();
            cc.config.tie_policy = *ties;
            out.body = cc;
            return out;
        }

        case fb::Command::Cmd_Accept:
            out.body = MatchAction{AcceptAction{}};
            return out;

        case fb::Command::Cmd_Declare:
        {
            auto const* d = cm->command_as_Cmd_Declare();
            if (!d)
                return std::unexpected(ParseError{"missing command body"});
            // Count is the rules' business; only the values are checked here
            std::vector<Stance> stances;
            if (auto const* v = d->stances())
            {
                stances.reserve(v->size());
                for (flatbuffers::uoffset_t i{}; i < v->size(); ++i)
                {
                    auto const s = FromFbStance(static_cast<uint8_t>(v->Get(i)));
                    if (!s)
                        return std::unexpected(ParseError{"stance out of range"});
                    stances.push_back(*s);
                }
            }
            out.body = MatchAction{DeclareAction{std::move(stances)}};
            return out;
        }

        case fb::Command::Cmd_Switch:
        {
            auto const* s = cm->command_as_Cmd_Switch();
            if (!s)
                return std::unexpected(ParseError{"missing command body"});
            auto const from = FromFbStance(std::to_underlying(s->old_stance()));
            auto const to = FromFbStance(std::to_underlying(s->new_stance()));
            if (!from || !to)
                return std::unexpected(ParseError{"stance out of range"});
            out.body = MatchAction{SwitchAction{.from = *from, .to = *to}};
            return out;
        }

        case fb::Command::Cmd_PassSwitch:
            out.body = MatchAction{PassSwitchAction{}};
            return out;

        case fb::Command::Cmd_Pick:
        {
            auto const* p = cm->command_as_Cmd_Pick();
            if (!p)
                return std::unexpected(ParseError{"missing command body"});
            auto const s = FromFbStance(std::to_underlying(p->stance()));
            if (!s)
                return std::unexpected(ParseError{"stance out of range"});
            out.body = MatchAction{PickAction{*s}};
            return out;
        }

        case fb::Command::Cmd_SetModifier:
        {
            auto const* m = cm->command_as_Cmd_SetModifier();
            if (!m)
                return std::unexpected(ParseError{"missing command body"});
            auto const scope = FromFbScope(m->scope());
            if (!scope)
                return std::unexpected(ParseError{"unknown modifier scope"});
            out.body = SetModifierCmd{.target = m->target(), .scope = *scope, .value = m->value()};
            return out;
        }

        case fb::Command::Cmd_Cancel:
            out.body = MatchAction{CancelAction{}};
            return out;

        case fb::Command::Cmd_ForceEnd:
            out.body = ForceEndCmd{};
            return out;

        case fb::Command::Cmd_Status:
            out.body = StatusCmd{};
            return out;

        default:
            return std::unexpected(ParseError{"unknown command variant"});
        }
    }
} // namespace duel::core::net
