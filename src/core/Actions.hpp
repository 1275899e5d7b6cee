//
// Actions.hpp
//

#ifndef IMPERIALDUEL_ACTIONS_HPP
#define IMPERIALDUEL_ACTIONS_HPP

#include <variant>
#include <vector>
#include "Types.hpp"

namespace duel::core
{
    // Participant actions carry the acting seat separately (see MatchImpl::Submit).
    struct AcceptAction     {};
    // Vector so that a wrong count can be reported instead of being unrepresentable
    struct DeclareAction    { std::vector<Stance> stances; };
    struct SwitchAction     { Stance from; Stance to; };
    struct PassSwitchAction {};
    struct PickAction       { Stance stance; };

    // Moderator/binding actions, no acting seat.
    struct SetModifierAction
    {
        SeatT target{};
        ModifierScope scope{ModifierScope::Round};
        int value{};
    };
    struct CancelAction     {};

    using MatchAction = std::variant<
        AcceptAction, DeclareAction, SwitchAction, PassSwitchAction, PickAction,
        SetModifierAction, CancelAction>;

    enum class MatchState : uint8_t
    {
        PendingChallenge,
        Active,
        Completed,
        Cancelled
    };

    enum class RoundPhase : uint8_t
    {
        Declaring,
        Switching,
        Picking,
        Resolved
    };

    enum class MoveOutcome : uint8_t
    {
        Applied,        // accepted, no visible transition for others
        MatchStarted,   // challenge accepted, round 1 declaring
        PhaseAdvanced,  // both seats done with Declaring/Switching
        RoundResolved,
        RoundTied,
        MatchCompleted,
        MatchCancelled,
        Unchanged       // cancel on an already terminal match
    };

    inline constexpr auto IsTerminal(MatchState const s) noexcept -> bool
    {
        return s == MatchState::Completed || s == MatchState::Cancelled;
    }
} // namespace duel::core

#endif //IMPERIALDUEL_ACTIONS_HPP
