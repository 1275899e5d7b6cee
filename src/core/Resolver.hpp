//
// Resolver.hpp
//

#ifndef IMPERIALDUEL_RESOLVER_HPP
#define IMPERIALDUEL_RESOLVER_HPP

#include <array>
#include <optional>
#include "Types.hpp"
#include "StanceTable.hpp"
#include "Dice.hpp"
#include "Modifiers.hpp"

namespace duel::core
{
    struct ResolveInput
    {
        std::array<Stance, constants::SeatCount> picks{};
        bool adjacency_mod{false};
        std::array<ActiveModifiers, constants::SeatCount> modifiers{};
    };

    struct SideResult
    {
        Stance stance{};
        Relationship relationship{Relationship::Neutral}; // this side vs the other side
        DiceRoll roll{};
        int adjacency_mod{};
        int round_mod{};
        int match_mod{};
        int raw_total{};   // before clamping
        uint8_t final_value{};
    };

    // Immutable once appended to a match's history.
    struct RoundResult
    {
        uint16_t round{};
        std::array<SideResult, constants::SeatCount> sides{};
        Adjacency adjacency{Adjacency::Other};
        bool tie{false};
        std::optional<SeatT> winner{};
        bool tie_awarded{false}; // tie settled by TiePolicy::ChallengerWins
        std::array<uint8_t, constants::SeatCount> score{}; // cumulative, after this round
    };

    // Pure apart from the die source: no score bookkeeping, no match state.
    class RoundResolver
    {
    public:
        [[nodiscard]]
        static auto Resolve(ResolveInput const& in, DieSource& dice) -> RoundResult;

        [[nodiscard]]
        static auto AdjacencyModifier(Adjacency a) noexcept -> int;

        [[nodiscard]]
        static auto Clamp(int raw) noexcept -> uint8_t;
    };
}

#endif //IMPERIALDUEL_RESOLVER_HPP
