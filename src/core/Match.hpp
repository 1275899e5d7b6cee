//
// Match.hpp
//

#ifndef IMPERIALDUEL_MATCH_HPP
#define IMPERIALDUEL_MATCH_HPP

#include <array>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>
#include "Types.hpp"
#include "Actions.hpp"
#include "Dice.hpp"
#include "Exception.hpp"
#include "Modifiers.hpp"
#include "Resolver.hpp"
#include "Rules.hpp"
#include "State.hpp"

namespace duel::core::debug {struct Inspector;}
namespace duel::core
{
    using ActionResult = std::expected<MoveOutcome, error::RuleViolation>;

    // Authoritative per-seat state
    struct Participant
    {
        ParticipantId id{};
        uint8_t wins{};
        std::optional<Stance> last_used{}; // previous round's pick, for no-repeat
        std::vector<Stance> declared;       // empty or exactly two
        std::optional<Stance> picked{};
        bool switch_done{false};            // switched once or passed
        bool switched{false};

        auto ResetRound() noexcept -> void
        {
            declared.clear();
            picked.reset();
            switch_done = false;
            switched = false;
        }
    };

    // One match in one context. Every public entry point is serialised on an internal
    // mutex, so two picks arriving together resolve the round exactly once.
    class MatchImpl
    {
    public:
        MatchImpl() = delete;
        MatchImpl(ContextKey key,
                  ParticipantId challenger,
                  ParticipantId opponent,
                  MatchConfig const& config,
                  std::unique_ptr<Rules> rules,
                  std::unique_ptr<DieSource> dice);

        MatchImpl(MatchImpl const&) = delete;
        auto operator=(MatchImpl const&) -> MatchImpl& = delete;

        static auto ValidateConfig(ParticipantId challenger, ParticipantId opponent,
                                   MatchConfig const& config) -> error::ValidateResult;

        // Validate, apply, advance. All-or-nothing: a violation leaves the match untouched, and an
        // engine fault (a failing die source ...) is rethrown with the match rolled back.
        auto Submit(std::optional<SeatT> actor, MatchAction const& action) -> ActionResult;

        // Identity based entry points for bindings. Unknown identities get Actor_NotParticipant.
        auto SubmitAs(ParticipantId who, MatchAction const& action) -> ActionResult;
        auto Accept(ParticipantId who) -> ActionResult;
        auto Declare(ParticipantId who, Stance first, Stance second) -> ActionResult;
        auto Declare(ParticipantId who, std::vector<Stance> stances) -> ActionResult;
        auto SwitchStance(ParticipantId who, Stance old_stance, Stance new_stance) -> ActionResult;
        auto PassSwitch(ParticipantId who) -> ActionResult;
        auto Pick(ParticipantId who, Stance stance) -> ActionResult;
        auto SetModifier(ParticipantId target, ModifierScope scope, int value) -> ActionResult;
        auto Cancel() -> ActionResult;

        auto SnapshotFor(Viewer viewer) const -> std::shared_ptr<MatchSnapshot const>;
        // Seat view for participants, observer view for anyone else.
        auto StatusFor(ParticipantId who) const -> std::shared_ptr<MatchSnapshot const>;

        auto SeatOf(ParticipantId who) const noexcept -> std::optional<SeatT>;
        auto ParticipantAt(SeatT seat) const -> ParticipantId { return seats_.at(seat).id; }

        auto Key() const noexcept -> ContextKey { return key_; }
        auto Config() const noexcept -> MatchConfig const& { return cfg_; }
        auto Threshold() const noexcept -> uint8_t { return WinThreshold(cfg_.best_of); }

        auto StateNow() const -> MatchState;
        auto PhaseNow() const -> RoundPhase;
        auto RoundNow() const -> uint16_t;
        auto Winner() const -> std::optional<SeatT>;
        auto HistorySize() const -> std::size_t;
        auto LastResult() const -> std::optional<RoundResult>;

        //allows class to directly access private data on an instance
        friend class DuelRules;
        friend struct debug::Inspector;

    private:
        // Everything Apply/Advance may write
        struct Checkpoint
        {
            std::array<Participant, constants::SeatCount> seats;
            ModifierRegistry modifiers;
            std::size_t history_size;
            MatchState state;
            RoundPhase phase;
            uint16_t round;
            std::optional<SeatT> winner;
        };

        auto Save() const -> Checkpoint;
        auto Restore(Checkpoint const& c) -> void;
        auto TraceOf(std::optional<SeatT> actor) const -> MatchTrace;

        auto SubmitLocked(std::optional<SeatT> actor, MatchAction const& action) -> ActionResult;
        auto PendingSeats() const -> std::vector<SeatT>;
        auto BothDeclared() const noexcept -> bool;

    private:
        ContextKey key_;
        MatchConfig cfg_;
        std::unique_ptr<Rules> rules_;
        std::unique_ptr<DieSource> dice_;

        // Authoritative state
        std::array<Participant, constants::SeatCount> seats_{};
        ModifierRegistry modifiers_{};
        std::vector<RoundResult> history_;   // append-only

        MatchState state_{MatchState::PendingChallenge};
        RoundPhase phase_{RoundPhase::Declaring};
        uint16_t   round_{1};
        std::optional<SeatT> winner_{};

        mutable std::mutex mtx_;
    };
}
#endif //IMPERIALDUEL_MATCH_HPP
