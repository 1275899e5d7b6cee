//
// Modifiers.cpp
//

#include "Modifiers.hpp"

namespace duel::core
{
    auto ModifierRegistry::CheckRange(int const value) -> error::ValidateResult
    {
        if (value < constants::ModifierMin || value > constants::ModifierMax)
        {
            return std::unexpected(error::RuleViolation{.code = error::RuleViolationCode::Modifier_OutOfRange}
                                       .with_value(value));
        }
        return {};
    }

    auto ModifierRegistry::Store(Slot& slot, int const value) -> void
    {
        DUEL_ASSERT(CheckRange(value).has_value(), "Modifier stored without range validation");
        // 0 removes the entry
        if (value == 0)
        {
            slot.reset();
            return;
        }
        slot = value;
    }

    auto ModifierRegistry::SetRoundModifier(SeatT const seat, int const value) -> void
    {
        Store(round_.at(seat), value);
    }

    auto ModifierRegistry::SetMatchModifier(SeatT const seat, int const value) -> void
    {
        Store(match_.at(seat), value);
    }

    auto ModifierRegistry::Set(SeatT const seat, ModifierScope const scope, int const value) -> void
    {
        if (scope == ModifierScope::Round)
        {
            SetRoundModifier(seat, value);
        }
        else
        {
            SetMatchModifier(seat, value);
        }
    }

    auto ModifierRegistry::GetActive(SeatT const seat) const -> ActiveModifiers
    {
        ActiveModifiers out{};
        Slot const& r = round_.at(seat);
        Slot const& m = match_.at(seat);
        out.round = r.value_or(0);
        out.match = m.value_or(0);
        out.total = out.round + out.match;
        out.round_set = r.has_value();
        out.match_set = m.has_value();
        return out;
    }

    auto ModifierRegistry::ClearRoundModifiers() noexcept -> void
    {
        for (Slot& s : round_) s.reset();
    }

    auto ModifierRegistry::ClearAll() noexcept -> void
    {
        ClearRoundModifiers();
        for (Slot& s : match_) s.reset();
    }
}
