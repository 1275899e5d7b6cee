//
// State.hpp
//

#ifndef IMPERIALDUEL_STATE_HPP
#define IMPERIALDUEL_STATE_HPP

#include <array>
#include <optional>
#include <vector>
#include "Types.hpp"
#include "Actions.hpp"
#include "Modifiers.hpp"
#include "Resolver.hpp"

namespace duel::core
{
    // nullopt = observer (sees only public information)
    using Viewer = std::optional<SeatT>;

    struct SeatView
    {
        ParticipantId participant{};
        uint8_t score{};

        bool has_declared{false};
        // Own pair always; the other pair only once both have declared.
        std::optional<std::array<Stance, constants::DeclaredPerRound>> declared{};
        bool switch_done{false};
        bool switched{false};

        bool has_picked{false};
        // Own pick only. Never present for the other seat.
        std::optional<Stance> picked{};

        std::optional<Stance> last_used{};
        ActiveModifiers modifiers{};
    };

    // Read-only, viewer-filtered copy of a match. Holds no references into the match.
    struct MatchSnapshot
    {
        ContextKey context{};
        Viewer viewer{};
        MatchConfig config{};
        uint8_t win_threshold{};

        MatchState state{MatchState::PendingChallenge};
        RoundPhase phase{RoundPhase::Declaring};
        uint16_t round{1};

        std::array<SeatView, constants::SeatCount> seats{};
        std::vector<SeatT> pending; // seats whose action the match is waiting for
        std::optional<SeatT> winner{};
        std::vector<RoundResult> history;
    };

} // namespace duel::core

#endif //IMPERIALDUEL_STATE_HPP
