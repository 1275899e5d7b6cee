//
// Registry.cpp
//

#include "Registry.hpp"

#include <algorithm>
#include <utility>
#include "DuelRules.hpp"

namespace duel::core
{
    using RVC = error::RuleViolationCode;

    MatchRegistry::MatchRegistry() :
        MatchRegistry([](ContextKey, MatchConfig const& cfg) { return MakeSeededDice(cfg.seed); })
    {
    }

    MatchRegistry::MatchRegistry(DiceFactory dice_factory) :
        dice_factory_(std::move(dice_factory))
    {
        DUEL_ASSERT(static_cast<bool>(dice_factory_), "Registry needs a dice factory");
    }

    auto MatchRegistry::CreateMatch(ContextKey const key, ParticipantId const challenger,
                                    ParticipantId const opponent, MatchConfig const& config) -> CreateResult
    {
        if (auto const ok = MatchImpl::ValidateConfig(challenger, opponent, config); !ok.has_value())
        {
            return std::unexpected(ok.error());
        }

        std::lock_guard<std::mutex> lock(mtx_);
        if (auto const it = matches_.find(key); it != matches_.end() && !IsTerminal(it->second->StateNow()))
        {
            return std::unexpected(error::RuleViolation{.code = RVC::Registry_DuplicateMatch}
                                       .with_state(it->second->StateNow()));
        }

        MatchPtr match = std::make_shared<MatchImpl>(key, challenger, opponent, config,
                                                     std::make_unique<DuelRules>(),
                                                     dice_factory_(key, config));
        matches_[key] = match;
        return match;
    }

    auto MatchRegistry::Find(ContextKey const key) const -> MatchPtr
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto const it = matches_.find(key);
        return it == matches_.end() ? nullptr : it->second;
    }

    auto MatchRegistry::Require(ContextKey const key) const -> CreateResult
    {
        if (MatchPtr m = Find(key)) return m;
        return std::unexpected(error::RuleViolation{.code = RVC::Registry_NoSuchMatch});
    }

    auto MatchRegistry::Destroy(ContextKey const key) -> bool
    {
        std::lock_guard<std::mutex> lock(mtx_);
        return matches_.erase(key) > 0;
    }

    auto MatchRegistry::ReapTerminal() -> std::size_t
    {
        std::lock_guard<std::mutex> lock(mtx_);
        return std::erase_if(matches_, [](auto const& kv) { return IsTerminal(kv.second->StateNow()); });
    }

    auto MatchRegistry::Size() const -> std::size_t
    {
        std::lock_guard<std::mutex> lock(mtx_);
        return matches_.size();
    }

    auto MatchRegistry::Keys() const -> std::vector<ContextKey>
    {
        std::lock_guard<std::mutex> lock(mtx_);
        std::vector<ContextKey> out;
        out.reserve(matches_.size());
        for (auto const& [k, _] : matches_) out.push_back(k);
        std::ranges::sort(out);
        return out;
    }
}
