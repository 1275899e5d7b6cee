#include <gtest/gtest.h>
#include <array>
#include <filesystem>
#include <format>
#include <print>
#include <random>

#include "../core/Match.hpp"
#include "../core/DuelRules.hpp"
#include "../core/RandomDuelist.hpp"
#include "../debug/MatchLogger.hpp"
#include "../debug/Invariants.hpp"

using namespace duel::core;

namespace
{
constexpr ParticipantId Alice = 1001;
constexpr ParticipantId Bob = 2002;

auto make_config(std::uint64_t seed) -> MatchConfig
{
    // Walk through the variant combinations with the seed
    MatchConfig cfg{
        .best_of       = static_cast<uint8_t>(3 + 2 * (seed % 3)),
        .no_repeat     = (seed & 1) != 0,
        .adjacency_mod = (seed & 2) != 0,
        .bait_switch   = (seed & 4) != 0,
        .tie_policy    = (seed & 8) != 0 ? TiePolicy::ChallengerWins : TiePolicy::Repick,
        .seed          = seed
    };
    return cfg;
}

auto make_match(std::uint64_t seed) -> MatchImpl
{
    MatchConfig const cfg = make_config(seed);
    return MatchImpl(seed, Alice, Bob, cfg, std::make_unique<DuelRules>(), MakeSeededDice(cfg.seed));
}

} // anonymous namespace

TEST(SelfPlay, Transcripts_And_End)
{
    namespace fs = std::filesystem;
    fs::create_directories("_artifacts");
    try
    {
        for (std::uint64_t seed : {111ull, 222ull, 333ull, 444ull, 555ull, 666ull, 777ull, 888ull})
        {
            auto match = make_match(seed);
            std::array<RandomDuelist, constants::SeatCount> duelists{RandomDuelist(seed + 1), RandomDuelist(seed + 2)};
            std::mt19937 moderator(static_cast<std::mt19937::result_type>(seed));

            std::string const path = std::format("_artifacts/match_{}.log", seed);
            duel::core::debug::MatchLogger log(path);
            ASSERT_TRUE(log.is_open());
            log.start(match);

            std::size_t seen = 0;
            int steps = 0;
            while (!IsTerminal(match.StateNow()))
            {
                ASSERT_LT(++steps, 10000) << "Self-play did not terminate, seed " << seed;

                for (SeatT seat{}; seat < constants::SeatCount; ++seat)
                {
                    auto const snap = match.SnapshotFor(seat);
                    std::optional<MatchAction> const act = duelists[seat].Decide(snap);
                    if (!act) continue;

                    log.action(seat, *act);
                    ActionResult const r = match.Submit(seat, *act);
                    log.outcome(r);
                    ASSERT_TRUE(r.has_value()) << error::describe(r.error());
                    duel::core::debug::CheckInvariants(match);
                    break;
                }

                // Occasional moderator nudge once both sides have declared
                if (match.StateNow() == MatchState::Active && match.PhaseNow() != RoundPhase::Declaring
                    && std::uniform_int_distribution<int>{0, 9}(moderator) == 0)
                {
                    SetModifierAction const nudge{
                        .target = static_cast<SeatT>(std::uniform_int_distribution<int>{0, 1}(moderator)),
                        .scope = std::uniform_int_distribution<int>{0, 1}(moderator) == 0
                                     ? ModifierScope::Round : ModifierScope::Match,
                        .value = std::uniform_int_distribution<int>{constants::ModifierMin, constants::ModifierMax}(moderator)
                    };
                    log.action(std::nullopt, nudge);
                    ActionResult const r = match.Submit(std::nullopt, nudge);
                    log.outcome(r);
                    ASSERT_TRUE(r.has_value()) << error::describe(r.error());
                }

                for (; seen < match.HistorySize(); ++seen)
                {
                    log.round(duel::core::debug::Inspector::Gather(match).history.at(seen));
                }
            }
            log.end(match);
            log.flush();

            EXPECT_EQ(match.StateNow(), MatchState::Completed);
            ASSERT_TRUE(match.Winner().has_value());
            EXPECT_EQ(match.LastResult()->score[*match.Winner()], match.Threshold());

            ASSERT_TRUE(fs::exists(path));
            ASSERT_GT(fs::file_size(path), 0u);
        }
    }
    catch (duel::core::TracedException<duel::core::error::Code> const& e)
    {
        std::print("{}", e.to_str());
        FAIL() << e.what();
    }
}
