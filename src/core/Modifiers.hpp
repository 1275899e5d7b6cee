//
// Modifiers.hpp
//

#ifndef IMPERIALDUEL_MODIFIERS_HPP
#define IMPERIALDUEL_MODIFIERS_HPP

#include <array>
#include <optional>
#include "Types.hpp"
#include "Exception.hpp"

namespace duel::core
{
    struct ActiveModifiers
    {
        int round{};
        int match{};
        int total{};
        // "never set" and "set to 0" both contribute 0; kept apart for display only
        bool round_set{false};
        bool match_set{false};
    };

    // Per-match moderator adjustments, one entry per seat and scope.
    // Timing rules live in DuelRules; this only enforces the value range.
    class ModifierRegistry
    {
    public:
        static auto CheckRange(int value) -> error::ValidateResult;

        auto SetRoundModifier(SeatT seat, int value) -> void;
        auto SetMatchModifier(SeatT seat, int value) -> void;
        auto Set(SeatT seat, ModifierScope scope, int value) -> void;

        [[nodiscard]]
        auto GetActive(SeatT seat) const -> ActiveModifiers;

        auto ClearRoundModifiers() noexcept -> void;
        auto ClearAll() noexcept -> void;

    private:
        using Slot = std::optional<int>;

        static auto Store(Slot& slot, int value) -> void;

        std::array<Slot, constants::SeatCount> round_{};
        std::array<Slot, constants::SeatCount> match_{};
    };
}

#endif //IMPERIALDUEL_MODIFIERS_HPP
