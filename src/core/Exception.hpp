//
// Exception.hpp
//

#ifndef IMPERIALDUEL_EXCEPTION_HPP
#define IMPERIALDUEL_EXCEPTION_HPP

#include "TracedException.hpp"

#include <expected>
#include <format>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include "Types.hpp"
#include "Actions.hpp"
#include "StanceTable.hpp"

namespace duel::core::error
{
    // Engine misuse. Ordinary invalid input is a RuleViolation, never one of these.
    enum class Code : unsigned
    {
        Unknown,
        Rules, // rules engine misuse
        State, // match state corrupted or used out of order by the caller
        Network, // transport failure
        Serialization, // FlatBuffers verification/build errors
        Assertion // internal assertion failed
    };

    struct UnknownError : public TracedException<Code>
    {
        using TracedException<Code>::TracedException;
    };

    struct RulesError : public TracedException<Code>
    {
        using TracedException<Code>::TracedException;
    };

    struct StateError : public TracedException<Code>
    {
        using TracedException<Code>::TracedException;
    };

    struct NetworkError : public TracedException<Code>
    {
        using TracedException<Code>::TracedException;
    };

    struct SerializationError : public TracedException<Code>
    {
        using TracedException<Code>::TracedException;
    };

    struct AssertionError : public TracedException<Code>
    {
        using TracedException<Code>::TracedException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg,
                     std::source_location const& loc = std::source_location::current()) -> void
    {
        switch (c)
        {
        case Code::Unknown: throw UnknownError(std::move(msg), c, loc);
        case Code::Rules: throw RulesError(std::move(msg), c, loc);
        case Code::State: throw StateError(std::move(msg), c, loc);
        case Code::Network: throw NetworkError(std::move(msg), c, loc);
        case Code::Serialization: throw SerializationError(std::move(msg), c, loc);
        case Code::Assertion: throw AssertionError(std::move(msg), c, loc);
        }
        throw std::runtime_error(msg);
    }

#define DUEL_THROW(code_enum, msg) ::duel::core::error::fail((code_enum), (msg))
#define DUEL_ASSERT(cond, msg) do { if(!(cond)) ::duel::core::error::fail(::duel::core::error::Code::Assertion, (msg)); } while(0)

    // Coarse taxonomy surfaced to bindings.
    enum class ErrorKind : uint8_t
    {
        InvalidDeclaration,
        InvalidSwitch,
        InvalidPick,
        ModifierTimingError,
        ModifierRangeError,
        DuplicateMatchError,
        IllegalTransition,
        NotParticipant,
        InvalidConfig,
        NoSuchMatch
    };

    // Fine-grained reasons; grouped by action type.
    enum class RuleViolationCode : std::uint16_t
    {
        // Generic/flow
        Match_Terminal,
        WrongState_PendingRequired,
        WrongState_ActiveRequired,
        WrongPhase_DeclaringRequired,
        WrongPhase_SwitchingRequired,
        WrongPhase_PickingRequired,
        WrongActor_OpponentRequired,
        Actor_Missing,
        Actor_NotParticipant,
        Actor_NotModerator,
        Actor_IdentityTaken,

        // Declare
        Declare_WrongCount,
        Declare_DuplicateStance,
        Declare_NoRepeat,
        Declare_AlreadyDeclared,

        // Switch
        Switch_VariantDisabled,
        Switch_AlreadyUsed,
        Switch_StanceNotDeclared,
        Switch_TargetAlreadyDeclared,
        Switch_NoRepeat,

        // Pick
        Pick_NotDeclared,
        Pick_AlreadyPicked,

        // Modifiers
        Modifier_OutOfRange,
        Modifier_BeforeDeclarations,
        Modifier_InvalidTarget,

        // Registry / creation
        Registry_DuplicateMatch,
        Registry_NoSuchMatch,
        Config_BestOfInvalid,
        Config_SelfChallenge,

        // Safety net
        Internal_Unreachable
    };

    inline constexpr auto KindOf(RuleViolationCode const c) noexcept -> ErrorKind
    {
        using E = RuleViolationCode;
        switch (c)
        {
        case E::Match_Terminal:
        case E::WrongState_PendingRequired:
        case E::WrongState_ActiveRequired:
        case E::WrongPhase_DeclaringRequired:
        case E::WrongPhase_SwitchingRequired:
        case E::WrongPhase_PickingRequired:
        case E::WrongActor_OpponentRequired:
        case E::Internal_Unreachable:
            return ErrorKind::IllegalTransition;

        case E::Actor_Missing:
        case E::Actor_NotParticipant:
        case E::Actor_NotModerator:
        case E::Actor_IdentityTaken:
        case E::Modifier_InvalidTarget:
            return ErrorKind::NotParticipant;

        case E::Declare_WrongCount:
        case E::Declare_DuplicateStance:
        case E::Declare_NoRepeat:
        case E::Declare_AlreadyDeclared:
            return ErrorKind::InvalidDeclaration;

        case E::Switch_VariantDisabled:
        case E::Switch_AlreadyUsed:
        case E::Switch_StanceNotDeclared:
        case E::Switch_TargetAlreadyDeclared:
        case E::Switch_NoRepeat:
            return ErrorKind::InvalidSwitch;

        case E::Pick_NotDeclared:
        case E::Pick_AlreadyPicked:
            return ErrorKind::InvalidPick;

        case E::Modifier_OutOfRange:
            return ErrorKind::ModifierRangeError;
        case E::Modifier_BeforeDeclarations:
            return ErrorKind::ModifierTimingError;

        case E::Registry_DuplicateMatch:
            return ErrorKind::DuplicateMatchError;
        case E::Registry_NoSuchMatch:
            return ErrorKind::NoSuchMatch;
        case E::Config_BestOfInvalid:
        case E::Config_SelfChallenge:
            return ErrorKind::InvalidConfig;
        }
        return ErrorKind::IllegalTransition;
    }

    // Compact, optional context carried with the violation.
    struct RuleViolation
    {
        RuleViolationCode code{};
        std::optional<MatchState> state{};
        std::optional<RoundPhase> phase{};
        std::optional<SeatT> actor{};

        std::optional<Stance> stance{};     // offending stance
        std::optional<Stance> last_used{};  // previous pick for no-repeat
        std::optional<int> value{};         // modifier value
        std::optional<uint8_t> attempted_count{};
        std::optional<uint8_t> best_of{};

        [[nodiscard]]
        auto kind() const noexcept -> ErrorKind { return KindOf(code); }

        auto with_state(MatchState s) -> RuleViolation&
        {
            state = s;
            return *this;
        }

        auto with_phase(RoundPhase p) -> RuleViolation&
        {
            phase = p;
            return *this;
        }

        auto with_actor(SeatT s) -> RuleViolation&
        {
            actor = s;
            return *this;
        }

        auto with_stance(Stance s) -> RuleViolation&
        {
            stance = s;
            return *this;
        }

        auto with_last_used(Stance s) -> RuleViolation&
        {
            last_used = s;
            return *this;
        }

        auto with_value(int v) -> RuleViolation&
        {
            value = v;
            return *this;
        }

        auto with_attempted(uint8_t v) -> RuleViolation&
        {
            attempted_count = v;
            return *this;
        }

        auto with_best_of(uint8_t v) -> RuleViolation&
        {
            best_of = v;
            return *this;
        }
    };

    inline auto to_string(ErrorKind k) -> std::string_view
    {
        switch (k)
        {
        case ErrorKind::InvalidDeclaration: return "InvalidDeclaration";
        case ErrorKind::InvalidSwitch: return "InvalidSwitch";
        case ErrorKind::InvalidPick: return "InvalidPick";
        case ErrorKind::ModifierTimingError: return "ModifierTimingError";
        case ErrorKind::ModifierRangeError: return "ModifierRangeError";
        case ErrorKind::DuplicateMatchError: return "DuplicateMatchError";
        case ErrorKind::IllegalTransition: return "IllegalTransition";
        case ErrorKind::NotParticipant: return "NotParticipant";
        case ErrorKind::InvalidConfig: return "InvalidConfig";
        case ErrorKind::NoSuchMatch: return "NoSuchMatch";
        }
        return "Unknown";
    }

    inline auto to_string(RuleViolationCode c) -> std::string_view
    {
        using E = RuleViolationCode;
        switch (c)
        {
        // Flow
        case E::Match_Terminal: return "Match already ended";
        case E::WrongState_PendingRequired: return "Wrong state (pending challenge required)";
        case E::WrongState_ActiveRequired: return "Wrong state (active match required)";
        case E::WrongPhase_DeclaringRequired: return "Wrong phase (declaring required)";
        case E::WrongPhase_SwitchingRequired: return "Wrong phase (switching required)";
        case E::WrongPhase_PickingRequired: return "Wrong phase (picking required)";
        case E::WrongActor_OpponentRequired: return "Wrong actor (only the challenged participant may accept)";
        case E::Actor_Missing: return "Action requires an acting participant";
        case E::Actor_NotParticipant: return "Not a participant of this match";
        case E::Actor_NotModerator: return "Only a moderator may do this";
        case E::Actor_IdentityTaken: return "Participant is already bound to another connection";

        // Declare
        case E::Declare_WrongCount: return "Declare: exactly two stances required";
        case E::Declare_DuplicateStance: return "Declare: the two stances must differ";
        case E::Declare_NoRepeat: return "Declare: stance used last round (no-repeat)";
        case E::Declare_AlreadyDeclared: return "Declare: already declared this round";

        // Switch
        case E::Switch_VariantDisabled: return "Switch: bait-switch is not enabled";
        case E::Switch_AlreadyUsed: return "Switch: already switched or passed this round";
        case E::Switch_StanceNotDeclared: return "Switch: stance is not currently declared";
        case E::Switch_TargetAlreadyDeclared: return "Switch: new stance already declared";
        case E::Switch_NoRepeat: return "Switch: stance used last round (no-repeat)";

        // Pick
        case E::Pick_NotDeclared: return "Pick: stance is not one of the declared pair";
        case E::Pick_AlreadyPicked: return "Pick: already picked this round";

        // Modifiers
        case E::Modifier_OutOfRange: return "Modifier: value outside [-3, 3]";
        case E::Modifier_BeforeDeclarations: return "Modifier: both participants must declare first";
        case E::Modifier_InvalidTarget: return "Modifier: target is not a participant";

        // Registry
        case E::Registry_DuplicateMatch: return "Registry: context already has an active match";
        case E::Registry_NoSuchMatch: return "Registry: no match in this context";
        case E::Config_BestOfInvalid: return "Config: best-of must be 3, 5 or 7";
        case E::Config_SelfChallenge: return "Config: a participant cannot challenge themself";

        case E::Internal_Unreachable: return "Internal: unreachable";
        }
        return "Unknown";
    }

    inline auto to_string(MatchState s) -> std::string_view
    {
        switch (s)
        {
        case MatchState::PendingChallenge: return "PendingChallenge";
        case MatchState::Active: return "Active";
        case MatchState::Completed: return "Completed";
        case MatchState::Cancelled: return "Cancelled";
        }
        return "?";
    }

    inline auto to_string(RoundPhase p) -> std::string_view
    {
        switch (p)
        {
        case RoundPhase::Declaring: return "Declaring";
        case RoundPhase::Switching: return "Switching";
        case RoundPhase::Picking: return "Picking";
        case RoundPhase::Resolved: return "Resolved";
        }
        return "?";
    }

    inline auto to_string(MoveOutcome o) -> std::string_view
    {
        switch (o)
        {
        case MoveOutcome::Applied: return "Applied";
        case MoveOutcome::MatchStarted: return "MatchStarted";
        case MoveOutcome::PhaseAdvanced: return "PhaseAdvanced";
        case MoveOutcome::RoundResolved: return "RoundResolved";
        case MoveOutcome::RoundTied: return "RoundTied";
        case MoveOutcome::MatchCompleted: return "MatchCompleted";
        case MoveOutcome::MatchCancelled: return "MatchCancelled";
        case MoveOutcome::Unchanged: return "Unchanged";
        }
        return "?";
    }

    inline auto describe(RuleViolation const& v) -> std::string
    {
        // Compact, reproducible message for logs/tests.
        auto s = std::format("{}: {}", to_string(v.kind()), to_string(v.code));
        if (v.state) s += std::format(" | state={}", to_string(*v.state));
        if (v.phase) s += std::format(" | phase={}", to_string(*v.phase));
        if (v.actor) s += std::format(" | actor=P{}", static_cast<int>(*v.actor));
        if (v.stance) s += std::format(" | stance={}", ToString(*v.stance));
        if (v.last_used) s += std::format(" | last={}", ToString(*v.last_used));
        if (v.value) s += std::format(" | value={:+}", *v.value);
        if (v.attempted_count) s += std::format(" | attempted={}", *v.attempted_count);
        if (v.best_of) s += std::format(" | best_of={}", *v.best_of);
        return s;
    }

    inline auto describe(MatchTrace const& t) -> std::string
    {
        auto s = std::format("context={} | round={} | state={} | phase={}", t.context, t.round,
                             to_string(t.state), to_string(t.phase));
        if (t.actor) s += std::format(" | actor=P{}", static_cast<int>(*t.actor));
        return s;
    }

    using ValidateResult = std::expected<void, RuleViolation>;
}

// Lets engine faults go straight into std::print
template <>
struct std::formatter<duel::core::TracedException<duel::core::error::Code>> : std::formatter<std::string_view>
{
    template <class FormatContext>
    auto format(duel::core::TracedException<duel::core::error::Code> const& e, FormatContext& ctx) const
    {
        std::string s = std::format("Failed with code ({}): {}\n", static_cast<int>(e.code()), e.what());
        if (e.match()) s += std::format("in match {}\n", duel::core::error::describe(*e.match()));
        s += e.to_str();
        return std::formatter<std::string_view>::format(s, ctx);
    }
};

#endif //IMPERIALDUEL_EXCEPTION_HPP
