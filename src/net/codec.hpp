//
// codec.hpp
//

#ifndef IMPERIALDUEL_CODEC_HPP
#define IMPERIALDUEL_CODEC_HPP

#include <cstddef>   // std::byte
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <flatbuffers/flatbuffers.h>

#include "../core/Types.hpp"
#include "../core/Actions.hpp"
#include "../core/State.hpp"
#include "../core/Resolver.hpp"
#include "../core/Exception.hpp"

#include "generated/flatbuffers/duel_net_generated.h"

namespace duel::core::net
{
    struct ParseError
    {
        std::string message;
    };

    // Host-level commands that are not match actions
    struct HelloCmd
    {
        ParticipantId participant{};
    };

    struct ChallengeCmd
    {
        ParticipantId opponent{};
        MatchConfig config{}; // seed is chosen by the host
    };

    // By participant identity, resolved to a seat by the match
    struct SetModifierCmd
    {
        ParticipantId target{};
        ModifierScope scope{ModifierScope::Round};
        int value{};
    };

    struct ForceEndCmd {};
    struct StatusCmd {};

    // Accept, Declare, Switch, PassSwitch, Pick and Cancel decode straight into MatchAction
    using CommandBody = std::variant<HelloCmd, ChallengeCmd, SetModifierCmd, ForceEndCmd, StatusCmd, MatchAction>;

    struct DecodedCommand
    {
        std::uint64_t msg_id{};
        ContextKey context{};
        CommandBody body{};
    };

    auto ToFbStance(Stance s) noexcept -> duel::gen::net::Stance;
    auto ToFbState(MatchState s) noexcept -> duel::gen::net::MatchState;
    auto ToFbPhase(RoundPhase p) noexcept -> duel::gen::net::RoundPhase;
    auto ToFbRelationship(Relationship r) noexcept -> duel::gen::net::Relationship;
    auto ToFbAdjacency(Adjacency a) noexcept -> duel::gen::net::Adjacency;
    auto ToFbScope(ModifierScope s) noexcept -> duel::gen::net::ModifierScope;
    auto ToFbTiePolicy(TiePolicy t) noexcept -> duel::gen::net::TiePolicy;
    auto ToFbOutcome(MoveOutcome o) noexcept -> duel::gen::net::Outcome;

    // nullopt for values outside the enum (untrusted input)
    auto FromFbStance(uint8_t raw) noexcept -> std::optional<Stance>;
    auto FromFbScope(duel::gen::net::ModifierScope s) noexcept -> std::optional<ModifierScope>;
    auto FromFbTiePolicy(duel::gen::net::TiePolicy t) noexcept -> std::optional<TiePolicy>;

    // --- Outbound builders (server -> client) ---

    auto BuildSnapshot(MatchSnapshot const& snap, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto BuildRoundResult(ContextKey context, RoundResult const& r)
        -> flatbuffers::DetachedBuffer;

    auto BuildViolation(error::RuleViolation const& v, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto BuildAck(MoveOutcome outcome, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    // --- Outbound builders (client -> server) ---

    auto BuildHello(ParticipantId participant, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    auto BuildChallenge(ContextKey context, ParticipantId opponent, MatchConfig const& config,
                        std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    auto BuildAccept(ContextKey context, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    auto BuildDeclare(ContextKey context, std::span<Stance const> stances,
                      std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    auto BuildSwitch(ContextKey context, Stance old_stance, Stance new_stance,
                     std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    auto BuildPassSwitch(ContextKey context, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    auto BuildPick(ContextKey context, Stance stance, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    auto BuildSetModifier(ContextKey context, ParticipantId target, ModifierScope scope, int value,
                          std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    auto BuildCancel(ContextKey context, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;
    auto BuildForceEnd(ContextKey context, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;
    auto BuildStatus(ContextKey context, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    // Builds the client -> server frame for an in-process MatchAction (house bot, tests).
    // SetModifierAction has no wire form by seat and is rejected.
    auto BuildAction(ContextKey context, MatchAction const& a, std::uint64_t msg_id)
        -> std::expected<flatbuffers::DetachedBuffer, ParseError>;

    // --- Inbound decode ---

    // Verifies the buffer, then decodes an Envelope::CommandMsg.
    auto DecodeCommand(std::span<std::byte const> bytes)
        -> std::expected<DecodedCommand, ParseError>;

    // Verifies the buffer and returns the root for server -> client messages.
    auto VerifyEnvelope(std::span<std::byte const> bytes)
        -> std::expected<duel::gen::net::Envelope const*, ParseError>;
} // namespace duel::core::net


#endif //IMPERIALDUEL_CODEC_HPP
