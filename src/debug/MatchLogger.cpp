#include "MatchLogger.hpp"

#include <format>
#include <string_view>
#include <variant>

using namespace duel::core;

namespace
{

auto s_scope(ModifierScope const s) -> std::string_view
{
    return s == ModifierScope::Round ? "round" : "match";
}

auto s_tie(TiePolicy const t) -> std::string_view
{
    return t == TiePolicy::Repick ? "repick" : "challenger";
}

auto s_side(SideResult const& s) -> std::string
{
    std::string dice = std::format("{}", s.roll.dice[0]);
    if (s.roll.count == 2)
    {
        dice = std::format("{},{}", s.roll.dice[0], s.roll.dice[1]);
    }
    return std::format("{} {} [{}] kept={} adj={:+} rmod={:+} mmod={:+} raw={} final={}",
                       ToString(s.stance), ToString(s.relationship), dice,
                       s.roll.kept, s.adjacency_mod, s.round_mod, s.match_mod,
                       s.raw_total, s.final_value);
}

} // anonymous namespace

namespace duel::core::debug
{

auto DescribeAction(MatchAction const& a) -> std::string
{
    return std::visit(
        [&]<typename T0>(T0 const& act) -> std::string
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, AcceptAction>)
            {
                return "Accept";
            }
            else if constexpr (std::is_same_v<T, DeclareAction>)
            {
                std::string body;
                for (size_t i{}; i < act.stances.size(); ++i)
                {
                    body += (i ? "," : "");
                    body += ToString(act.stances[i]);
                }
                return std::format("Declare[{}]", body);
            }
            else if constexpr (std::is_same_v<T, SwitchAction>)
            {
                return std::format("Switch({}->{})", ToString(act.from), ToString(act.to));
            }
            else if constexpr (std::is_same_v<T, PassSwitchAction>)
            {
                return "PassSwitch";
            }
            else if constexpr (std::is_same_v<T, PickAction>)
            {
                return std::format("Pick({})", ToString(act.stance));
            }
            else if constexpr (std::is_same_v<T, SetModifierAction>)
            {
                return std::format("SetModifier(P{} {} {:+})", static_cast<int>(act.target),
                                   s_scope(act.scope), act.value);
            }
            else
            {
                return "Cancel";
            }
        },
        a
    );
}

auto DescribeRound(RoundResult const& r) -> std::string
{
    std::string winner = "none";
    if (r.winner)
    {
        winner = std::format("P{}{}", static_cast<int>(*r.winner), r.tie_awarded ? " (tie to challenger)" : "");
    }
    return std::format("Round {} {}\n  P0: {}\n  P1: {}\n  tie={} winner={} score={}-{}",
                       r.round, ToString(r.adjacency),
                       s_side(r.sides[0]), s_side(r.sides[1]),
                       r.tie, winner, r.score[0], r.score[1]);
}

MatchLogger::MatchLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

MatchLogger::~MatchLogger() = default;

auto MatchLogger::start(MatchImpl const& match) -> void
{
    MatchConfig const& c = match.Config();
    out_ << std::format("Context={}\n", match.Key());
    out_ << std::format("Challenger={} Opponent={}\n",
                        match.ParticipantAt(ChallengerSeat), match.ParticipantAt(OpponentSeat));
    out_ << std::format("BestOf={} NoRepeat={} Adjacency={} BaitSwitch={} Ties={} Seed={}\n",
                        c.best_of, c.no_repeat, c.adjacency_mod, c.bait_switch, s_tie(c.tie_policy), c.seed);
    out_.flush();
}

auto MatchLogger::action(std::optional<SeatT> const actor, MatchAction const& a) -> void
{
    if (actor)
    {
        out_ << std::format("Action P{}: {}\n", static_cast<int>(*actor), DescribeAction(a));
        return;
    }
    out_ << std::format("Action host: {}\n", DescribeAction(a));
}

auto MatchLogger::outcome(ActionResult const& r) -> void
{
    if (r.has_value())
    {
        out_ << std::format("Outcome: {}\n", error::to_string(*r));
        return;
    }
    out_ << std::format("Rejected: {}\n", error::describe(r.error()));
}

auto MatchLogger::round(RoundResult const& r) -> void
{
    out_ << DescribeRound(r) << '\n';
}

auto MatchLogger::end(MatchImpl const& match) -> void
{
    std::optional<SeatT> const w = match.Winner();
    out_ << std::format("State={} Winner={}\n", error::to_string(match.StateNow()),
                        w ? static_cast<int>(*w) : -1);
    out_.flush();
}

auto MatchLogger::flush() -> void
{
    out_.flush();
}

} // namespace duel::core::debug
