//
// ServerConfig.cpp
//

#include "ServerConfig.hpp"

#include <algorithm>
#include <charconv>
#include <format>
#include <string_view>
#include <system_error>

namespace duel::net
{
    auto ServerConfig::IsModerator(core::ParticipantId const id) const -> bool
    {
        return std::ranges::contains(moderators, id);
    }

    template <class T>
    static auto ReadNumber(std::string_view const flag, std::string_view const text) -> std::expected<T, std::string>
    {
        T value{};
        auto const [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc{} || end != text.data() + text.size())
        {
            return std::unexpected(std::format("{}: '{}' is not a valid number", flag, text));
        }
        return value;
    }

    auto ParseArgs(std::span<char const* const> args) -> std::expected<ServerConfig, std::string>
    {
        ServerConfig c{};
        for (std::size_t i = 0; i < args.size(); ++i)
        {
            std::string_view const key = args[i];
            auto next = [&]() -> std::expected<std::string_view, std::string>
            {
                if (i + 1 >= args.size())
                {
                    return std::unexpected(std::format("{}: missing value", key));
                }
                return std::string_view{args[++i]};
            };

            if (key == "--port" || key == "--challenge-timeout-ms" || key == "--moderator" ||
                key == "--house-bot" || key == "--seed")
            {
                auto const text = next();
                if (!text) return std::unexpected(text.error());

                if (key == "--port")
                {
                    auto const v = ReadNumber<std::uint16_t>(key, *text);
                    if (!v) return std::unexpected(v.error());
                    c.port = *v;
                }
                else if (key == "--challenge-timeout-ms")
                {
                    auto const v = ReadNumber<std::uint32_t>(key, *text);
                    if (!v) return std::unexpected(v.error());
                    c.challenge_timeout_ms = *v;
                }
                else
                {
                    auto const v = ReadNumber<std::uint64_t>(key, *text);
                    if (!v) return std::unexpected(v.error());
                    if (key == "--moderator") c.moderators.push_back(*v);
                    else if (key == "--house-bot") c.house_bot = *v;
                    else c.seed = *v;
                }
            }
            else if (key == "--transcripts")
            {
                auto const text = next();
                if (!text) return std::unexpected(text.error());
                c.transcripts = std::string{*text};
            }
            else
            {
                return std::unexpected(std::format("unknown option '{}'", key));
            }
        }
        return c;
    }
}
