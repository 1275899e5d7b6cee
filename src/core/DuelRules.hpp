//
// DuelRules.hpp
//

#ifndef IMPERIALDUEL_DUELRULES_HPP
#define IMPERIALDUEL_DUELRULES_HPP
#include "Rules.hpp"

namespace duel::core
{
    class DuelRules final : public Rules
    {
    public:
        auto Validate(MatchImpl const& match, std::optional<SeatT> actor,
                      MatchAction const& a) const -> CheckResult override;
        auto Apply(MatchImpl& match, std::optional<SeatT> actor, MatchAction const& a) -> void override;
        auto Advance(MatchImpl& match) -> MoveOutcome override;

    private:
        // Terminal, missing actor, not yet accepted: shared by every seated action.
        static auto CheckSeatedActive(MatchImpl const& match, std::optional<SeatT> actor) -> CheckResult;
        static auto ResolveRound(MatchImpl& match) -> MoveOutcome;
    };
}

#endif //IMPERIALDUEL_DUELRULES_HPP
