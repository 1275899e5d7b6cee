#include <gtest/gtest.h>
#include <memory>
#include <vector>

#include "../core/Registry.hpp"
#include "../debug/ScriptedDice.hpp"

using namespace duel::core;
using RVC = duel::core::error::RuleViolationCode;

namespace
{
    constexpr ParticipantId Alice = 1001;
    constexpr ParticipantId Bob = 2002;
    constexpr ParticipantId Carol = 3003;

    // Every context gets the same short script: one decisive round for the challenger
    auto scripted_registry() -> MatchRegistry
    {
        return MatchRegistry([](ContextKey, MatchConfig const&) -> std::unique_ptr<DieSource>
        {
            return std::make_unique<debug::ScriptedDice>(std::vector<uint8_t>{6, 6, 1, 1, 6, 6, 1, 1});
        });
    }

    auto win_round(MatchImpl& m) -> ActionResult
    {
        EXPECT_EQ(m.Declare(Alice, Stance::Bagr, Stance::Tigr), MoveOutcome::Applied);
        EXPECT_EQ(m.Declare(Bob, Stance::Radae, Stance::Riposje), MoveOutcome::PhaseAdvanced);
        EXPECT_EQ(m.Pick(Alice, Stance::Bagr), MoveOutcome::Applied);
        return m.Pick(Bob, Stance::Radae);
    }
}

TEST(Registry, Create_Find_Require)
{
    MatchRegistry reg;
    EXPECT_EQ(reg.Find(5), nullptr);

    auto const missing = reg.Require(5);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, RVC::Registry_NoSuchMatch);
    EXPECT_EQ(missing.error().kind(), error::ErrorKind::NoSuchMatch);

    auto const made = reg.CreateMatch(5, Alice, Bob, MatchConfig{});
    ASSERT_TRUE(made.has_value());
    EXPECT_EQ((*made)->Key(), 5u);
    EXPECT_EQ((*made)->StateNow(), MatchState::PendingChallenge);
    EXPECT_EQ((*made)->ParticipantAt(ChallengerSeat), Alice);
    EXPECT_EQ((*made)->ParticipantAt(OpponentSeat), Bob);

    EXPECT_EQ(reg.Find(5), *made);
    ASSERT_TRUE(reg.Require(5).has_value());
    EXPECT_EQ(reg.Size(), 1u);
}

TEST(Registry, Rejects_Invalid_Config)
{
    MatchRegistry reg;
    MatchConfig cfg{};
    cfg.best_of = 6;

    auto const bad = reg.CreateMatch(1, Alice, Bob, cfg);
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().code, RVC::Config_BestOfInvalid);
    EXPECT_EQ(bad.error().best_of, 6);

    auto const self = reg.CreateMatch(1, Carol, Carol, MatchConfig{});
    ASSERT_FALSE(self.has_value());
    EXPECT_EQ(self.error().code, RVC::Config_SelfChallenge);
    EXPECT_EQ(reg.Size(), 0u);
}

TEST(Registry, One_Live_Match_Per_Context)
{
    MatchRegistry reg = scripted_registry();
    auto const first = reg.CreateMatch(9, Alice, Bob, MatchConfig{});
    ASSERT_TRUE(first.has_value());

    // Pending blocks a second challenge, whoever issues it
    auto const dup = reg.CreateMatch(9, Carol, Alice, MatchConfig{});
    ASSERT_FALSE(dup.has_value());
    EXPECT_EQ(dup.error().code, RVC::Registry_DuplicateMatch);
    EXPECT_EQ(dup.error().kind(), error::ErrorKind::DuplicateMatchError);

    ASSERT_EQ((*first)->Accept(Bob), MoveOutcome::MatchStarted);
    EXPECT_FALSE(reg.CreateMatch(9, Alice, Bob, MatchConfig{}).has_value());

    // A different context is unaffected
    EXPECT_TRUE(reg.CreateMatch(10, Alice, Bob, MatchConfig{}).has_value());
    EXPECT_EQ(reg.Keys(), (std::vector<ContextKey>{9, 10}));
}

TEST(Registry, Terminal_Match_Is_Replaced)
{
    MatchRegistry reg = scripted_registry();
    MatchRegistry::MatchPtr const old = *reg.CreateMatch(3, Alice, Bob, MatchConfig{});
    ASSERT_EQ(old->Accept(Bob), MoveOutcome::MatchStarted);
    ASSERT_EQ(win_round(*old), MoveOutcome::RoundResolved);
    ASSERT_EQ(win_round(*old), MoveOutcome::MatchCompleted);

    auto const next = reg.CreateMatch(3, Bob, Carol, MatchConfig{});
    ASSERT_TRUE(next.has_value());
    EXPECT_NE(*next, old);
    EXPECT_EQ(reg.Find(3), *next);
    EXPECT_EQ(reg.Size(), 1u);

    // The old handle stays readable after replacement
    EXPECT_EQ(old->Winner(), SeatT{0});
    EXPECT_EQ(old->HistorySize(), 2u);
}

TEST(Registry, Contexts_Are_Independent)
{
    MatchRegistry reg = scripted_registry();
    MatchRegistry::MatchPtr const a = *reg.CreateMatch(1, Alice, Bob, MatchConfig{});
    MatchRegistry::MatchPtr const b = *reg.CreateMatch(2, Alice, Bob, MatchConfig{});

    ASSERT_EQ(a->Accept(Bob), MoveOutcome::MatchStarted);
    ASSERT_EQ(win_round(*a), MoveOutcome::RoundResolved);

    EXPECT_EQ(b->StateNow(), MatchState::PendingChallenge);
    EXPECT_EQ(b->HistorySize(), 0u);
    EXPECT_EQ(a->Cancel(), MoveOutcome::MatchCancelled);
    EXPECT_EQ(b->StateNow(), MatchState::PendingChallenge);
}

TEST(Registry, Destroy_And_Reap)
{
    MatchRegistry reg;
    MatchRegistry::MatchPtr const a = *reg.CreateMatch(1, Alice, Bob, MatchConfig{});
    MatchRegistry::MatchPtr const b = *reg.CreateMatch(2, Alice, Carol, MatchConfig{});
    MatchRegistry::MatchPtr const c = *reg.CreateMatch(3, Bob, Carol, MatchConfig{});

    ASSERT_EQ(a->Cancel(), MoveOutcome::MatchCancelled);
    ASSERT_EQ(c->Cancel(), MoveOutcome::MatchCancelled);
    EXPECT_EQ(reg.ReapTerminal(), 2u);
    EXPECT_EQ(reg.Keys(), (std::vector<ContextKey>{2}));

    EXPECT_TRUE(reg.Destroy(2));
    EXPECT_FALSE(reg.Destroy(2));
    EXPECT_EQ(reg.Size(), 0u);
    EXPECT_EQ(b->StateNow(), MatchState::PendingChallenge);
}
