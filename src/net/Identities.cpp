//
// Identities.cpp
//

#include "Identities.hpp"

namespace duel::net
{
    namespace
    {
        auto SameOwner(IdentityTable::Hdl const& a, IdentityTable::Hdl const& b) -> bool
        {
            return !a.owner_before(b) && !b.owner_before(a);
        }
    }

    auto IdentityTable::Bind(Hdl const& hdl, core::ParticipantId const id)
        -> std::expected<void, core::error::RuleViolation>
    {
        if (auto const r = routes_.find(id); r != routes_.end() && !SameOwner(r->second, hdl))
        {
            if (!r->second.expired())
            {
                return std::unexpected(core::error::RuleViolation{
                    .code = core::error::RuleViolationCode::Actor_IdentityTaken
                });
            }
            // Stale route whose close never reached us
            identities_.erase(r->second);
            routes_.erase(r);
        }

        if (auto const it = identities_.find(hdl); it != identities_.end())
        {
            if (it->second == id) return {};
            DropRoute(it->second, hdl);
            it->second = id;
        }
        else
        {
            identities_.emplace(hdl, id);
        }
        routes_[id] = hdl;
        return {};
    }

    auto IdentityTable::Unbind(Hdl const& hdl) -> std::optional<core::ParticipantId>
    {
        auto const it = identities_.find(hdl);
        if (it == identities_.end()) return std::nullopt;

        core::ParticipantId const id = it->second;
        identities_.erase(it);
        DropRoute(id, hdl);
        return id;
    }

    auto IdentityTable::Lookup(Hdl const& hdl) const -> std::optional<core::ParticipantId>
    {
        auto const it = identities_.find(hdl);
        if (it == identities_.end()) return std::nullopt;
        return it->second;
    }

    auto IdentityTable::RouteTo(core::ParticipantId const id) const -> std::optional<Hdl>
    {
        auto const it = routes_.find(id);
        if (it == routes_.end()) return std::nullopt;
        return it->second;
    }

    // Only forget the route if it still points at this connection
    auto IdentityTable::DropRoute(core::ParticipantId const id, Hdl const& hdl) -> void
    {
        if (auto const r = routes_.find(id); r != routes_.end() && SameOwner(r->second, hdl))
        {
            routes_.erase(r);
        }
    }
}
