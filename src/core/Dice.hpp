//
// Dice.hpp
//

#ifndef IMPERIALDUEL_DICE_HPP
#define IMPERIALDUEL_DICE_HPP

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include "Types.hpp"
#include "StanceTable.hpp"

namespace duel::core
{
    // Source of independent uniform integers in [1, 6].
    class DieSource
    {
    public:
        virtual ~DieSource() = default;

        virtual auto RollD6() -> uint8_t = 0;
    };

    class SeededDice final : public DieSource
    {
    public:
        explicit SeededDice(uint64_t seed) : rng_{seed} {}

        auto RollD6() -> uint8_t override
        {
            return static_cast<uint8_t>(
                std::uniform_int_distribution<int>{constants::DieMin, constants::DieMax}(rng_));
        }

    private:
        std::mt19937_64 rng_;
    };

    // Neutral = 1d6, Advantage = 2d6 keep higher, Disadvantage = 2d6 keep lower.
    using RollProfile = Relationship;

    struct DiceRoll
    {
        RollProfile profile{RollProfile::Neutral};
        std::array<uint8_t, 2> dice{};
        uint8_t count{};
        uint8_t kept{};
        std::optional<uint8_t> discarded_index{}; // index into dice, only for two-dice profiles
    };

    auto Roll(RollProfile profile, DieSource& src) -> DiceRoll;

    auto MakeSeededDice(uint64_t seed) -> std::unique_ptr<DieSource>;
}

#endif //IMPERIALDUEL_DICE_HPP
