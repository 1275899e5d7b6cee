//
// Dice.cpp
//

#include "Dice.hpp"

#include "Exception.hpp"

namespace duel::core
{
    static auto Checked(uint8_t const face) -> uint8_t
    {
        DUEL_ASSERT(face >= constants::DieMin && face <= constants::DieMax, "Die source produced a face outside [1,6]");
        return face;
    }

    auto Roll(RollProfile const profile, DieSource& src) -> DiceRoll
    {
        DiceRoll out{};
        out.profile = profile;

        if (profile == RollProfile::Neutral)
        {
            out.dice[0] = Checked(src.RollD6());
            out.count = 1;
            out.kept = out.dice[0];
            return out;
        }

        out.dice[0] = Checked(src.RollD6());
        out.dice[1] = Checked(src.RollD6());
        out.count = 2;

        bool const keep_first = (profile == RollProfile::Advantage)
                                    ? out.dice[0] >= out.dice[1]
                                    : out.dice[0] <= out.dice[1];
        out.kept = keep_first ? out.dice[0] : out.dice[1];
        out.discarded_index = keep_first ? uint8_t{1} : uint8_t{0};
        return out;
    }

    auto MakeSeededDice(uint64_t const seed) -> std::unique_ptr<DieSource>
    {
        return std::make_unique<SeededDice>(seed);
    }
}
