//
// Match.cpp
//

#include "Match.hpp"

#include <algorithm>
#include <ranges>
#include <utility>

namespace duel::core
{
    MatchImpl::MatchImpl(ContextKey const key,
                         ParticipantId const challenger,
                         ParticipantId const opponent,
                         MatchConfig const& config,
                         std::unique_ptr<Rules> rules,
                         std::unique_ptr<DieSource> dice) :
        key_(key),
        cfg_(config),
        rules_(std::move(rules)),
        dice_(std::move(dice))
    {
        DUEL_ASSERT(rules_ != nullptr, "Match constructed without rules");
        DUEL_ASSERT(dice_ != nullptr, "Match constructed without a die source");
        if (auto const ok = ValidateConfig(challenger, opponent, config); !ok.has_value())
        {
            DUEL_THROW(error::Code::Rules, error::describe(ok.error()));
        }
        seats_[ChallengerSeat].id = challenger;
        seats_[OpponentSeat].id = opponent;
    }

    auto MatchImpl::ValidateConfig(ParticipantId const challenger, ParticipantId const opponent,
                                   MatchConfig const& config) -> error::ValidateResult
    {
        using RVC = error::RuleViolationCode;
        if (!IsValidBestOf(config.best_of))
            return std::unexpected(error::RuleViolation{.code = RVC::Config_BestOfInvalid}
                                       .with_best_of(config.best_of));
        if (challenger == opponent)
            return std::unexpected(error::RuleViolation{.code = RVC::Config_SelfChallenge});
        return {};
    }

    auto MatchImpl::SeatOf(ParticipantId const who) const noexcept -> std::optional<SeatT>
    {
        for (SeatT s{}; s < constants::SeatCount; ++s)
        {
            if (seats_[s].id == who) return s;
        }
        return std::nullopt;
    }

    auto MatchImpl::Submit(std::optional<SeatT> const actor, MatchAction const& action) -> ActionResult
    {
        std::lock_guard<std::mutex> lock(mtx_);
        return SubmitLocked(actor, action);
    }

    auto MatchImpl::SubmitLocked(std::optional<SeatT> const actor, MatchAction const& action) -> ActionResult
    {
        // cancel is idempotent once terminal
        if (IsTerminal(state_) && std::holds_alternative<CancelAction>(action))
        {
            return MoveOutcome::Unchanged;
        }

        if (auto const ok = rules_->Validate(*this, actor, action); !ok.has_value())
        {
            return std::unexpected(ok.error());
        }

        Checkpoint const saved = Save();
        try
        {
            rules_->Apply(*this, actor, action);
            return rules_->Advance(*this);
        }
        catch (TracedException<error::Code>& e)
        {
            Restore(saved);
            e.attach(TraceOf(actor));
            throw;
        }
        catch (...)
        {
            Restore(saved);
            throw;
        }
    }

    auto MatchImpl::Save() const -> Checkpoint
    {
        return Checkpoint{
            .seats = seats_,
            .modifiers = modifiers_,
            .history_size = history_.size(),
            .state = state_,
            .phase = phase_,
            .round = round_,
            .winner = winner_
        };
    }

    auto MatchImpl::Restore(Checkpoint const& c) -> void
    {
        seats_ = c.seats;
        modifiers_ = c.modifiers;
        history_.erase(history_.begin() + static_cast<std::ptrdiff_t>(c.history_size), history_.end());
        state_ = c.state;
        phase_ = c.phase;
        round_ = c.round;
        winner_ = c.winner;
    }

    auto MatchImpl::TraceOf(std::optional<SeatT> const actor) const -> MatchTrace
    {
        return MatchTrace{
            .context = key_,
            .state = state_,
            .phase = phase_,
            .round = round_,
            .actor = actor
        };
    }

    auto MatchImpl::SubmitAs(ParticipantId const who, MatchAction const& action) -> ActionResult
    {
        std::lock_guard<std::mutex> lock(mtx_);
        std::optional<SeatT> const seat = SeatOf(who);
        if (!seat)
        {
            return std::unexpected(error::RuleViolation{.code = error::RuleViolationCode::Actor_NotParticipant}
                                       .with_state(state_));
        }
        return SubmitLocked(seat, action);
    }

    auto MatchImpl::Accept(ParticipantId const who) -> ActionResult
    {
        return SubmitAs(who, AcceptAction{});
    }

    auto MatchImpl::Declare(ParticipantId const who, Stance const first, Stance const second) -> ActionResult
    {
        return SubmitAs(who, DeclareAction{{first, second}});
    }

    auto MatchImpl::Declare(ParticipantId const who, std::vector<Stance> stances) -> ActionResult
    {
        return SubmitAs(who, DeclareAction{std::move(stances)});
    }

    auto MatchImpl::SwitchStance(ParticipantId const who, Stance const old_stance, Stance const new_stance)
        -> ActionResult
    {
        return SubmitAs(who, SwitchAction{.from = old_stance, .to = new_stance});
    }

    auto MatchImpl::PassSwitch(ParticipantId const who) -> ActionResult
    {
        return SubmitAs(who, PassSwitchAction{});
    }

    auto MatchImpl::Pick(ParticipantId const who, Stance const stance) -> ActionResult
    {
        return SubmitAs(who, PickAction{stance});
    }

    auto MatchImpl::SetModifier(ParticipantId const target, ModifierScope const scope, int const value)
        -> ActionResult
    {
        std::lock_guard<std::mutex> lock(mtx_);
        SetModifierAction const act{
            .target = SeatOf(target).value_or(NoSeat),
            .scope = scope,
            .value = value
        };
        return SubmitLocked(std::nullopt, act);
    }

    auto MatchImpl::Cancel() -> ActionResult
    {
        return Submit(std::nullopt, CancelAction{});
    }

    auto MatchImpl::BothDeclared() const noexcept -> bool
    {
        return std::ranges::all_of(seats_, [](Participant const& p) { return !p.declared.empty(); });
    }

    auto MatchImpl::PendingSeats() const -> std::vector<SeatT>
    {
        std::vector<SeatT> out;
        switch (state_)
        {
        case MatchState::PendingChallenge:
            out.push_back(OpponentSeat);
            return out;
        case MatchState::Completed:
        case MatchState::Cancelled:
            return out;
        case MatchState::Active:
            break;
        }

        for (SeatT s{}; s < constants::SeatCount; ++s)
        {
            Participant const& p = seats_[s];
            bool waiting = false;
            switch (phase_)
            {
            case RoundPhase::Declaring: waiting = p.declared.empty(); break;
            case RoundPhase::Switching: waiting = !p.switch_done; break;
            case RoundPhase::Picking: waiting = !p.picked.has_value(); break;
            case RoundPhase::Resolved: waiting = false; break;
            }
            if (waiting) out.push_back(s);
        }
        return out;
    }

    auto MatchImpl::SnapshotFor(Viewer const viewer) const -> std::shared_ptr<MatchSnapshot const>
    {
        std::lock_guard<std::mutex> lock(mtx_);

        std::shared_ptr<MatchSnapshot> snap = std::make_shared<MatchSnapshot>();
        snap->context = key_;
        snap->viewer = viewer;
        snap->config = cfg_;
        snap->win_threshold = Threshold();
        snap->state = state_;
        snap->phase = phase_;
        snap->round = round_;
        snap->winner = winner_;
        snap->pending = PendingSeats();
        snap->history = history_;

        bool const reveal_declarations = BothDeclared();
        for (SeatT s{}; s < constants::SeatCount; ++s)
        {
            Participant const& p = seats_[s];
            SeatView& v = snap->seats[s];
            bool const own = viewer.has_value() && *viewer == s;

            v.participant = p.id;
            v.score = p.wins;
            v.has_declared = !p.declared.empty();
            if (v.has_declared && (own || reveal_declarations))
            {
                v.declared = std::array<Stance, constants::DeclaredPerRound>{p.declared[0], p.declared[1]};
            }
            v.switch_done = p.switch_done;
            v.switched = p.switched;
            v.has_picked = p.picked.has_value();
            if (own)
            {
                v.picked = p.picked;
            }
            v.last_used = p.last_used;
            v.modifiers = modifiers_.GetActive(s);
        }
        return snap;
    }

    auto MatchImpl::StatusFor(ParticipantId const who) const -> std::shared_ptr<MatchSnapshot const>
    {
        // seats_ ids are immutable after construction
        return SnapshotFor(SeatOf(who));
    }

    auto MatchImpl::StateNow() const -> MatchState
    {
        std::lock_guard<std::mutex> lock(mtx_);
        return state_;
    }

    auto MatchImpl::PhaseNow() const -> RoundPhase
    {
        std::lock_guard<std::mutex> lock(mtx_);
        return phase_;
    }

    auto MatchImpl::RoundNow() const -> uint16_t
    {
        std::lock_guard<std::mutex> lock(mtx_);
        return round_;
    }

    auto MatchImpl::Winner() const -> std::optional<SeatT>
    {
        std::lock_guard<std::mutex> lock(mtx_);
        return winner_;
    }

    auto MatchImpl::HistorySize() const -> std::size_t
    {
        std::lock_guard<std::mutex> lock(mtx_);
        return history_.size();
    }

    auto MatchImpl::LastResult() const -> std::optional<RoundResult>
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (history_.empty()) return std::nullopt;
        return history_.back();
    }
}
