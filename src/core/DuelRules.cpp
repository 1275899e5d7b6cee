//
// DuelRules.cpp
//

#include "DuelRules.hpp"

#include "Match.hpp"
#include <algorithm>
#include <ranges>

namespace
{
    inline auto Viol(duel::core::error::RuleViolationCode code) -> duel::core::error::RuleViolation
    {
        return duel::core::error::RuleViolation{ .code = code };
    }

    template <class Range>
    auto Contains(Range const& r, duel::core::Stance const s) -> bool
    {
        return std::ranges::find(r, s) != std::ranges::end(r);
    }
}

namespace duel::core
{
    using RVC = ::duel::core::error::RuleViolationCode;

auto DuelRules::CheckSeatedActive(MatchImpl const& m, std::optional<SeatT> const actor) -> CheckResult
{
    if (IsTerminal(m.state_))
        return std::unexpected(Viol(RVC::Match_Terminal).with_state(m.state_));
    if (!actor || *actor >= constants::SeatCount)
        return std::unexpected(Viol(RVC::Actor_Missing).with_state(m.state_));
    if (m.state_ != MatchState::Active)
        return std::unexpected(Viol(RVC::WrongState_ActiveRequired)
                               .with_state(m.state_).with_actor(*actor));
    return {};
}

auto DuelRules::Validate(MatchImpl const& m, std::optional<SeatT> const actor,
                         MatchAction const& a) const -> CheckResult
{
    return std::visit([&]<typename T0>(T0 const& act) -> CheckResult
    {
        using T = std::decay_t<T0>;

        if constexpr (std::is_same_v<T, AcceptAction>)
        {
            if (IsTerminal(m.state_))
                return std::unexpected(Viol(RVC::Match_Terminal).with_state(m.state_));
            if (m.state_ != MatchState::PendingChallenge)
                return std::unexpected(Viol(RVC::WrongState_PendingRequired).with_state(m.state_));
            if (!actor)
                return std::unexpected(Viol(RVC::Actor_Missing).with_state(m.state_));
            if (*actor != OpponentSeat)
                return std::unexpected(Viol(RVC::WrongActor_OpponentRequired).with_actor(*actor));
            return {};
        }
        else if constexpr (std::is_same_v<T, DeclareAction>)
        {
            if (auto const ok = CheckSeatedActive(m, actor); !ok) return ok;
            SeatT const seat = *actor;
            Participant const& p = m.seats_[seat];

            if (m.phase_ != RoundPhase::Declaring)
                return std::unexpected(Viol(RVC::WrongPhase_DeclaringRequired)
                                       .with_phase(m.phase_).with_actor(seat));

            if (!p.declared.empty())
                return std::unexpected(Viol(RVC::Declare_AlreadyDeclared).with_actor(seat));

            if (act.stances.size() != constants::DeclaredPerRound)
                return std::unexpected(Viol(RVC::Declare_WrongCount)
                                       .with_actor(seat)
                                       .with_attempted(static_cast<uint8_t>(std::min<std::size_t>(act.stances.size(), 0xFF))));

            if (act.stances[0] == act.stances[1])
                return std::unexpected(Viol(RVC::Declare_DuplicateStance)
                                       .with_actor(seat).with_stance(act.stances[0]));

            if (m.cfg_.no_repeat && p.last_used && Contains(act.stances, *p.last_used))
                return std::unexpected(Viol(RVC::Declare_NoRepeat)
                                       .with_actor(seat).with_stance(*p.last_used).with_last_used(*p.last_used));
            return {};
        }
        else if constexpr (std::is_same_v<T, SwitchAction> || std::is_same_v<T, PassSwitchAction>)
        {
            if (IsTerminal(m.state_))
                return std::unexpected(Viol(RVC::Match_Terminal).with_state(m.state_));
            if (!m.cfg_.bait_switch)
                return std::unexpected(Viol(RVC::Switch_VariantDisabled).with_state(m.state_));
            if (auto const ok = CheckSeatedActive(m, actor); !ok) return ok;
            SeatT const seat = *actor;
            Participant const& p = m.seats_[seat];

            if (m.phase_ != RoundPhase::Switching)
                return std::unexpected(Viol(RVC::WrongPhase_SwitchingRequired)
                                       .with_phase(m.phase_).with_actor(seat));

            if (p.switch_done)
                return std::unexpected(Viol(RVC::Switch_AlreadyUsed).with_actor(seat));

            if constexpr (std::is_same_v<T, SwitchAction>)
            {
                if (!Contains(p.declared, act.from))
                    return std::unexpected(Viol(RVC::Switch_StanceNotDeclared)
                                           .with_actor(seat).with_stance(act.from));

                if (Contains(p.declared, act.to))
                    return std::unexpected(Viol(RVC::Switch_TargetAlreadyDeclared)
                                           .with_actor(seat).with_stance(act.to));

                if (m.cfg_.no_repeat && p.last_used && act.to == *p.last_used)
                    return std::unexpected(Viol(RVC::Switch_NoRepeat)
                                           .with_actor(seat).with_stance(act.to).with_last_used(*p.last_used));
            }
            return {};
        }
        else if constexpr (std::is_same_v<T, PickAction>)
        {
            if (auto const ok = CheckSeatedActive(m, actor); !ok) return ok;
            SeatT const seat = *actor;
            Participant const& p = m.seats_[seat];

            if (m.phase_ != RoundPhase::Picking)
                return std::unexpected(Viol(RVC::WrongPhase_PickingRequired)
                                       .with_phase(m.phase_).with_actor(seat));

            if (p.picked)
                return std::unexpected(Viol(RVC::Pick_AlreadyPicked).with_actor(seat));

            if (!Contains(p.declared, act.stance))
                return std::unexpected(Viol(RVC::Pick_NotDeclared)
                                       .with_actor(seat).with_stance(act.stance));
            return {};
        }
        else if constexpr (std::is_same_v<T, SetModifierAction>)
        {
            if (IsTerminal(m.state_))
                return std::unexpected(Viol(RVC::Match_Terminal).with_state(m.state_));

            if (act.target >= constants::SeatCount)
                return std::unexpected(Viol(RVC::Modifier_InvalidTarget).with_state(m.state_));

            if (auto const ok = ModifierRegistry::CheckRange(act.value); !ok)
            {
                error::RuleViolation v = ok.error();
                return std::unexpected(v.with_actor(act.target));
            }

            // Not before both participants have declared in the current round
            if (m.state_ != MatchState::Active || m.phase_ == RoundPhase::Declaring)
                return std::unexpected(Viol(RVC::Modifier_BeforeDeclarations)
                                       .with_state(m.state_).with_phase(m.phase_)
                                       .with_actor(act.target).with_value(act.value));
            return {};
        }
        else
        {
            // CancelAction: valid from every non-terminal state, terminal handled by MatchImpl
            if (IsTerminal(m.state_))
                return std::unexpected(Viol(RVC::Internal_Unreachable).with_state(m.state_));
            return {};
        }
    }, a);
}

auto DuelRules::Apply(MatchImpl& m, std::optional<SeatT> const actor, MatchAction const& a) -> void
{
    std::visit([&]<typename T0>(T0 const& act)
    {
        using T = std::decay_t<T0>;

        if constexpr (std::is_same_v<T, AcceptAction>)
        {
            m.state_ = MatchState::Active;
            m.phase_ = RoundPhase::Declaring;
            m.round_ = 1;
        }
        else if constexpr (std::is_same_v<T, DeclareAction>)
        {
            DUEL_ASSERT(actor.has_value(), "Declare applied without actor");
            m.seats_[*actor].declared = act.stances;
        }
        else if constexpr (std::is_same_v<T, SwitchAction>)
        {
            DUEL_ASSERT(actor.has_value(), "Switch applied without actor");
            Participant& p = m.seats_[*actor];
            auto const it = std::ranges::find(p.declared, act.from);
            DUEL_ASSERT(it != std::end(p.declared), "Switched stance not declared");
            *it = act.to;
            p.switched = true;
            p.switch_done = true;
        }
        else if constexpr (std::is_same_v<T, PassSwitchAction>)
        {
            DUEL_ASSERT(actor.has_value(), "Pass applied without actor");
            m.seats_[*actor].switch_done = true;
        }
        else if constexpr (std::is_same_v<T, PickAction>)
        {
            DUEL_ASSERT(actor.has_value(), "Pick applied without actor");
            m.seats_[*actor].picked = act.stance;
        }
        else if constexpr (std::is_same_v<T, SetModifierAction>)
        {
            m.modifiers_.Set(act.target, act.scope, act.value);
        }
        else
        {
            // Cancel: drop the round in progress, keep the appended history
            m.state_ = MatchState::Cancelled;
            for (Participant& p : m.seats_) p.ResetRound();
            m.modifiers_.ClearAll();
        }
    }, a);
}

auto DuelRules::Advance(MatchImpl& m) -> MoveOutcome
{
    switch (m.state_)
    {
    case MatchState::Cancelled: return MoveOutcome::MatchCancelled;
    case MatchState::Completed: return MoveOutcome::MatchCompleted;
    case MatchState::PendingChallenge: return MoveOutcome::Applied;
    case MatchState::Active: break;
    }

    switch (m.phase_)
    {
    case RoundPhase::Declaring:
        // Nobody has declared only straight after the accept
        if (std::ranges::none_of(m.seats_, [](Participant const& p) { return !p.declared.empty(); }))
            return MoveOutcome::MatchStarted;
        if (!m.BothDeclared()) return MoveOutcome::Applied;
        m.phase_ = m.cfg_.bait_switch ? RoundPhase::Switching : RoundPhase::Picking;
        return MoveOutcome::PhaseAdvanced;

    case RoundPhase::Switching:
        if (!std::ranges::all_of(m.seats_, [](Participant const& p) { return p.switch_done; }))
            return MoveOutcome::Applied;
        m.phase_ = RoundPhase::Picking;
        return MoveOutcome::PhaseAdvanced;

    case RoundPhase::Picking:
        // The second pick resolves immediately
        if (!std::ranges::all_of(m.seats_, [](Participant const& p) { return p.picked.has_value(); }))
            return MoveOutcome::Applied;
        return ResolveRound(m);

    case RoundPhase::Resolved:
        break;
    }
    DUEL_THROW(error::Code::State, "Advance on an active match in Resolved phase");
}

auto DuelRules::ResolveRound(MatchImpl& m) -> MoveOutcome
{
    ResolveInput in{};
    in.adjacency_mod = m.cfg_.adjacency_mod;
    for (SeatT s{}; s < constants::SeatCount; ++s)
    {
        DUEL_ASSERT(m.seats_[s].picked.has_value(), "Resolving without both picks");
        in.picks[s] = *m.seats_[s].picked;
        in.modifiers[s] = m.modifiers_.GetActive(s);
    }

    // The die source may throw; nothing of the match is touched before this point
    RoundResult result = RoundResolver::Resolve(in, *m.dice_);
    result.round = m.round_;
    m.phase_ = RoundPhase::Resolved;

    if (result.tie && m.cfg_.tie_policy == TiePolicy::ChallengerWins)
    {
        result.winner = ChallengerSeat;
        result.tie_awarded = true;
    }

    if (result.winner)
    {
        ++m.seats_[*result.winner].wins;
    }
    for (SeatT s{}; s < constants::SeatCount; ++s)
    {
        result.score[s] = m.seats_[s].wins;
    }
    m.history_.push_back(result);

    if (!result.winner)
    {
        // Tie under Repick: same round, same declarations and modifiers, pick again
        for (Participant& p : m.seats_) p.picked.reset();
        m.phase_ = RoundPhase::Picking;
        return MoveOutcome::RoundTied;
    }

    for (Participant& p : m.seats_)
    {
        p.last_used = p.picked;
        p.ResetRound();
    }
    m.modifiers_.ClearRoundModifiers();

    if (m.seats_[*result.winner].wins >= m.Threshold())
    {
        m.state_ = MatchState::Completed;
        m.winner_ = result.winner;
        return MoveOutcome::MatchCompleted;
    }

    ++m.round_;
    m.phase_ = RoundPhase::Declaring;
    return MoveOutcome::RoundResolved;
}
}
