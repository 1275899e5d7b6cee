//
// Registry.hpp
//

#ifndef IMPERIALDUEL_REGISTRY_HPP
#define IMPERIALDUEL_REGISTRY_HPP

#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>
#include "Match.hpp"

namespace duel::core
{
    // At most one non-terminal match per context. Independent contexts never share state.
    class MatchRegistry
    {
    public:
        using DiceFactory = std::function<std::unique_ptr<DieSource>(ContextKey, MatchConfig const&)>;
        using MatchPtr = std::shared_ptr<MatchImpl>;
        using CreateResult = std::expected<MatchPtr, error::RuleViolation>;

        // Default dice: SeededDice(config.seed)
        MatchRegistry();
        explicit MatchRegistry(DiceFactory dice_factory);

        // A terminal match in the same context is replaced; an active or pending one is not.
        auto CreateMatch(ContextKey key, ParticipantId challenger, ParticipantId opponent,
                         MatchConfig const& config) -> CreateResult;

        [[nodiscard]]
        auto Find(ContextKey key) const -> MatchPtr;
        auto Require(ContextKey key) const -> CreateResult;

        auto Destroy(ContextKey key) -> bool;
        // Drops every Completed/Cancelled match, returns how many went.
        auto ReapTerminal() -> std::size_t;

        [[nodiscard]]
        auto Size() const -> std::size_t;
        [[nodiscard]]
        auto Keys() const -> std::vector<ContextKey>;

    private:
        DiceFactory dice_factory_;
        std::unordered_map<ContextKey, MatchPtr> matches_;
        mutable std::mutex mtx_;
    };
}

#endif //IMPERIALDUEL_REGISTRY_HPP
