//
// Identities.hpp
//

#ifndef IMPERIALDUEL_IDENTITIES_HPP
#define IMPERIALDUEL_IDENTITIES_HPP

#include <expected>
#include <map>
#include <memory>
#include <optional>
#include <unordered_map>

#include "../core/Exception.hpp"
#include "../core/Types.hpp"

namespace duel::net
{
    // Connection <-> participant binding. Handles are weak owners, so this works
    // with websocketpp::connection_hdl without pulling in the transport.
    class IdentityTable
    {
    public:
        using Hdl = std::weak_ptr<void>;

        // First come first served: an id routed to another live connection is refused.
        // Rebinding a connection to a new id drops its old route.
        [[nodiscard]]
        auto Bind(Hdl const& hdl, core::ParticipantId id) -> std::expected<void, core::error::RuleViolation>;

        // Forgets the connection; returns the id it was bound to
        auto Unbind(Hdl const& hdl) -> std::optional<core::ParticipantId>;

        [[nodiscard]]
        auto Lookup(Hdl const& hdl) const -> std::optional<core::ParticipantId>;

        [[nodiscard]]
        auto RouteTo(core::ParticipantId id) const -> std::optional<Hdl>;

        [[nodiscard]]
        auto Size() const noexcept -> std::size_t { return identities_.size(); }

    private:
        auto DropRoute(core::ParticipantId id, Hdl const& hdl) -> void;

        std::map<Hdl, core::ParticipantId, std::owner_less<Hdl>> identities_;
        std::unordered_map<core::ParticipantId, Hdl> routes_;
    };
}

#endif //IMPERIALDUEL_IDENTITIES_HPP
