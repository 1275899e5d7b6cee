//
// Rules.hpp
//

#ifndef IMPERIALDUEL_RULES_HPP
#define IMPERIALDUEL_RULES_HPP

#include <optional>
#include "Actions.hpp"
#include "Types.hpp"
#include "Exception.hpp"

namespace duel::core
{
    //forward declaration
    class MatchImpl;

    class Rules
    {
    public:
        using CheckResult = error::ValidateResult;

        virtual ~Rules() = default;

        // Returns unexpected(reason) for ordinary rule violations (NOT exceptions).
        // Throw only for engine misuse / broken invariants.
        virtual auto Validate(MatchImpl const& match, std::optional<SeatT> actor,
                              MatchAction const& a) const -> CheckResult = 0;

        // Only called after Validate succeeded.
        virtual auto Apply(MatchImpl& match, std::optional<SeatT> actor, MatchAction const& a) -> void = 0;

        // Phase/round/match transitions following an applied action, including round resolution.
        virtual auto Advance(MatchImpl& match) -> MoveOutcome = 0;
    };
}

#endif //IMPERIALDUEL_RULES_HPP
