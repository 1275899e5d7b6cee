//
// ServerConfig.hpp
//

#ifndef IMPERIALDUEL_SERVERCONFIG_HPP
#define IMPERIALDUEL_SERVERCONFIG_HPP

#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "../core/Types.hpp"

namespace duel::net
{
    struct ServerConfig
    {
        std::uint16_t port{9002};
        // 0 disables expiry
        std::uint32_t challenge_timeout_ms{60000};
        std::vector<core::ParticipantId> moderators;
        std::optional<core::ParticipantId> house_bot{};
        std::uint64_t seed{12345ULL};
        std::optional<std::string> transcripts{}; // directory for per-match logs

        [[nodiscard]]
        auto IsModerator(core::ParticipantId id) const -> bool;
    };

    // args excludes argv[0]. Unknown flags and malformed numbers are errors.
    auto ParseArgs(std::span<char const* const> args) -> std::expected<ServerConfig, std::string>;
}

#endif //IMPERIALDUEL_SERVERCONFIG_HPP
