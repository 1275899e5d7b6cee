//
// Inspector.hpp
//

#ifndef IMPERIALDUEL_INSPECTOR_HPP
#define IMPERIALDUEL_INSPECTOR_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "../core/Types.hpp"
#include "../core/Match.hpp"

namespace duel::core::debug
{
    // Unfiltered view of a match for tests. Not synchronised: call it between actions.
    struct Inspector
    {
        struct SnapshotAll
        {
            MatchState state{};
            RoundPhase phase{};
            uint16_t round{};
            uint8_t threshold{};
            MatchConfig config{};
            std::optional<SeatT> winner{};

            std::array<Participant, constants::SeatCount> seats{};
            std::array<ActiveModifiers, constants::SeatCount> modifiers{};
            std::vector<RoundResult> history;
        };

        static inline auto Gather(MatchImpl const& m) -> SnapshotAll
        {
            SnapshotAll ret{};
            ret.state = m.state_;
            ret.phase = m.phase_;
            ret.round = m.round_;
            ret.threshold = m.Threshold();
            ret.config = m.cfg_;
            ret.winner = m.winner_;
            ret.seats = m.seats_;
            ret.history = m.history_;

            for (SeatT s{}; s < constants::SeatCount; ++s)
            {
                ret.modifiers[s] = m.modifiers_.GetActive(s);
            }
            return ret;
        }
    };
}

#endif //IMPERIALDUEL_INSPECTOR_HPP
