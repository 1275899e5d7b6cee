//
// Invariants.hpp
//

#ifndef IMPERIALDUEL_INVARIANTS_HPP
#define IMPERIALDUEL_INVARIANTS_HPP

#include "../core/Match.hpp"
#include "Inspector.hpp"
#include <algorithm>
#include <cassert>
#include <ranges>

namespace duel::core::debug
{
    // Structural checks run after every step of self-play.
    inline auto CheckInvariants(MatchImpl const& m) -> void
    {
#if DUEL_ENABLE_TEST_HOOKS == false
        (void)m;
#else
    Inspector::SnapshotAll const s = Inspector::Gather(m);

    // 1) Score never exceeds the threshold, winner exists exactly when Completed
    for (Participant const& p : s.seats)
    {
        assert(p.wins <= s.threshold && "Score above win threshold");
    }
    assert((s.state == MatchState::Completed) == s.winner.has_value());
    if (s.winner)
    {
        assert(s.seats[*s.winner].wins == s.threshold && "Winner without threshold wins");
        assert(s.seats[OtherSeat(*s.winner)].wins < s.threshold && "Both seats at threshold");
    }

    // 2) Declarations: none or exactly two distinct
    for (Participant const& p : s.seats)
    {
        assert(p.declared.empty() || p.declared.size() == constants::DeclaredPerRound);
        if (p.declared.size() == constants::DeclaredPerRound)
        {
            assert(p.declared[0] != p.declared[1] && "Duplicate declared stance");
        }
        // 3) A pick is always one of the declared pair
        if (p.picked)
        {
            assert(std::ranges::contains(p.declared, *p.picked) && "Pick outside declared pair");
        }
        assert(!p.switched || p.switch_done);
    }

    // 4) Phase-dependent shape of the round in progress
    if (s.state == MatchState::Active)
    {
        for (Participant const& p : s.seats)
        {
            if (s.phase == RoundPhase::Switching || s.phase == RoundPhase::Picking)
            {
                assert(!p.declared.empty() && "Past declaring without a declaration");
            }
            if (s.phase != RoundPhase::Picking)
            {
                assert(!p.picked && "Pick outside picking phase");
            }
            if (s.phase == RoundPhase::Picking && s.config.bait_switch)
            {
                assert(p.switch_done && "Picking before switch/pass");
            }
        }
    }
    else if (s.state != MatchState::Completed)
    {
        for (Participant const& p : s.seats)
        {
            assert(p.declared.empty() && !p.picked);
        }
    }

    // 5) History: final values clamped, score monotonic and consistent with winners
    {
        std::array<uint8_t, constants::SeatCount> score{};
        for (RoundResult const& r : s.history)
        {
            for (SideResult const& side : r.sides)
            {
                assert(side.final_value >= constants::DieMin && side.final_value <= constants::DieMax);
            }
            assert(r.tie == (r.sides[0].final_value == r.sides[1].final_value));
            assert(!r.tie || !r.winner || r.tie_awarded);
            if (r.winner) ++score[*r.winner];
            assert(score == r.score && "History score out of step");
        }
        for (SeatT i{}; i < constants::SeatCount; ++i)
        {
            assert(score[i] == s.seats[i].wins && "Wins differ from history");
        }
    }

    // 6) No-repeat: consecutive decisive rounds never reuse a seat's pick
    if (s.config.no_repeat)
    {
        RoundResult const* prev = nullptr;
        for (RoundResult const& r : s.history)
        {
            if (!r.winner) continue;
            if (prev)
            {
                for (SeatT i{}; i < constants::SeatCount; ++i)
                {
                    assert(prev->sides[i].stance != r.sides[i].stance && "No-repeat violated");
                }
            }
            prev = &r;
        }
    }

    // 7) Modifiers within range
    for (ActiveModifiers const& mod : s.modifiers)
    {
        assert(mod.round >= constants::ModifierMin && mod.round <= constants::ModifierMax);
        assert(mod.match >= constants::ModifierMin && mod.match <= constants::ModifierMax);
    }
#endif // DUEL_ENABLE_TEST_HOOKS == true
    }
}
#endif //IMPERIALDUEL_INVARIANTS_HPP
