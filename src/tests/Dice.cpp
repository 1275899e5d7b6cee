#include <gtest/gtest.h>

#include "../core/Dice.hpp"
#include "../core/Exception.hpp"
#include "../debug/ScriptedDice.hpp"

using namespace duel::core;

namespace
{
    auto mean_of(RollProfile const p, DieSource& src, int const n) -> double
    {
        long sum = 0;
        for (int i = 0; i < n; ++i)
        {
            DiceRoll const r = Roll(p, src);
            EXPECT_GE(r.kept, constants::DieMin);
            EXPECT_LE(r.kept, constants::DieMax);
            sum += r.kept;
        }
        return static_cast<double>(sum) / n;
    }
}

TEST(Dice, Neutral_Rolls_One_Die)
{
    debug::ScriptedDice src{4};
    DiceRoll const r = Roll(RollProfile::Neutral, src);
    EXPECT_EQ(r.count, 1);
    EXPECT_EQ(r.kept, 4);
    EXPECT_FALSE(r.discarded_index.has_value());
    EXPECT_EQ(src.Remaining(), 0u);
}

TEST(Dice, Advantage_Keeps_Higher_Disadvantage_Keeps_Lower)
{
    debug::ScriptedDice src{2, 5, 2, 5};
    DiceRoll const adv = Roll(RollProfile::Advantage, src);
    EXPECT_EQ(adv.count, 2);
    EXPECT_EQ(adv.kept, 5);
    EXPECT_EQ(adv.discarded_index, 0);

    DiceRoll const dis = Roll(RollProfile::Disadvantage, src);
    EXPECT_EQ(dis.kept, 2);
    EXPECT_EQ(dis.discarded_index, 1);
    EXPECT_EQ(dis.dice[0], 2);
    EXPECT_EQ(dis.dice[1], 5);
}

TEST(Dice, Equal_Dice_Keep_First)
{
    debug::ScriptedDice src{3, 3};
    DiceRoll const r = Roll(RollProfile::Advantage, src);
    EXPECT_EQ(r.kept, 3);
    EXPECT_EQ(r.discarded_index, 1);
}

TEST(Dice, Bad_Face_From_Source_Throws)
{
    debug::ScriptedDice src{7};
    EXPECT_THROW((void)Roll(RollProfile::Neutral, src), error::AssertionError);

    debug::ScriptedDice empty{};
    EXPECT_THROW((void)Roll(RollProfile::Neutral, empty), error::StateError);
}

TEST(Dice, Profiles_Ordered_Statistically)
{
    constexpr int N = 20000;
    SeededDice src{42};
    double const adv = mean_of(RollProfile::Advantage, src, N);
    double const neu = mean_of(RollProfile::Neutral, src, N);
    double const dis = mean_of(RollProfile::Disadvantage, src, N);

    // 161/36, 7/2, 91/36
    EXPECT_NEAR(adv, 4.47, 0.1);
    EXPECT_NEAR(neu, 3.50, 0.1);
    EXPECT_NEAR(dis, 2.53, 0.1);
    EXPECT_GT(adv, neu);
    EXPECT_GT(neu, dis);
}

TEST(Dice, Same_Seed_Same_Sequence)
{
    SeededDice a{99};
    SeededDice b{99};
    for (int i = 0; i < 100; ++i)
    {
        EXPECT_EQ(a.RollD6(), b.RollD6());
    }
}
