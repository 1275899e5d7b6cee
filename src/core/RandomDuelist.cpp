//
// RandomDuelist.cpp
//

#include "RandomDuelist.hpp"

#include <algorithm>
#include <ranges>

#include "Exception.hpp"

namespace duel::core
{
    RandomDuelist::RandomDuelist(uint64_t const rng_seed):
        rng_(static_cast<std::mt19937::result_type>(rng_seed)) {}

    // Stances allowed this round under no-repeat
    static auto Allowed(MatchSnapshot const& s, SeatView const& me) -> std::vector<Stance>
    {
        return std::ranges::to<std::vector<Stance>>(AllStances | std::views::filter([&](Stance const st)
        {
            return !(s.config.no_repeat && me.last_used == st);
        }));
    }

    auto RandomDuelist::Decide(std::shared_ptr<MatchSnapshot const> snapshot) -> std::optional<MatchAction>
    {
        DUEL_ASSERT(snapshot != nullptr, "Duelist asked to decide without a snapshot");
        MatchSnapshot const& s = *snapshot;
        if (!s.viewer || !std::ranges::contains(s.pending, *s.viewer))
        {
            return std::nullopt;
        }

        SeatView const& me = s.seats[*s.viewer];
        if (s.state == MatchState::PendingChallenge)
        {
            return AcceptAction{};
        }

        switch (s.phase)
        {
        case RoundPhase::Declaring: return DeclareMove(s, me);
        case RoundPhase::Switching: return SwitchMove(s, me);
        case RoundPhase::Picking: return PickMove(me);
        case RoundPhase::Resolved: break;
        }
        return std::nullopt;
    }

    auto RandomDuelist::DeclareMove(MatchSnapshot const& s, SeatView const& me) -> MatchAction
    {
        std::vector<Stance> pool = Allowed(s, me);
        DUEL_ASSERT(pool.size() >= constants::DeclaredPerRound, "Not enough stances to declare");

        Stance const first = pool[pick(pool)];
        std::erase(pool, first);
        Stance const second = pool[pick(pool)];
        return DeclareAction{{first, second}};
    }

    auto RandomDuelist::SwitchMove(MatchSnapshot const& s, SeatView const& me) -> MatchAction
    {
        DUEL_ASSERT(me.declared.has_value(), "Own declaration must be visible while switching");
        auto const& declared = *me.declared;

        // Half of the time keep the declared pair
        if (std::bernoulli_distribution{0.5}(rng_)) return PassSwitchAction{};

        std::vector<Stance> targets = Allowed(s, me);
        std::erase_if(targets, [&](Stance const st) { return std::ranges::contains(declared, st); });
        if (targets.empty()) return PassSwitchAction{};

        return SwitchAction{.from = declared[pick(declared)], .to = targets[pick(targets)]};
    }

    auto RandomDuelist::PickMove(SeatView const& me) -> MatchAction
    {
        DUEL_ASSERT(me.declared.has_value(), "Own declaration must be visible while picking");
        auto const& declared = *me.declared;
        return PickAction{declared[pick(declared)]};
    }
}
