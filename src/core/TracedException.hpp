//
// TracedException.hpp
//

#ifndef IMPERIALDUEL_TRACEDEXCEPTION_HPP
#define IMPERIALDUEL_TRACEDEXCEPTION_HPP

#include <cstdint>
#include <format>
#include <optional>
#include <source_location>
#include <stacktrace>
#include <string>
#include <utility>
#include "Actions.hpp"
#include "Types.hpp"

namespace duel::core
{
    // The match an engine fault escaped from, as it stood before the failing action.
    struct MatchTrace
    {
        ContextKey context{};
        MatchState state{MatchState::PendingChallenge};
        RoundPhase phase{RoundPhase::Declaring};
        uint16_t round{};
        std::optional<SeatT> actor{}; // nullopt = moderator/host
    };

    // Engine fault with its origin and call stack. Code is a small enum; the match
    // trace is attached on the way out of MatchImpl, never by the thrower.
    template <typename Code>
    class TracedException
    {
    public:
        TracedException(std::string message,
                        Code code,
                        std::source_location const& origin = std::source_location::current(),
                        std::stacktrace stack = std::stacktrace::current()) :
            message_{std::move(message)},
            code_{code},
            origin_{origin},
            stack_{std::move(stack)}
        {
        }

        [[nodiscard]]
        auto what() const noexcept -> std::string const& { return message_; }

        [[nodiscard]]
        auto code() const noexcept -> Code { return code_; }

        [[nodiscard]]
        auto where() const noexcept -> std::source_location const& { return origin_; }

        [[nodiscard]]
        auto stack() const noexcept -> std::stacktrace const& { return stack_; }

        [[nodiscard]]
        auto match() const noexcept -> std::optional<MatchTrace> const& { return match_; }

        // First attachment wins: a registry rethrowing a match fault keeps the match's trace
        auto attach(MatchTrace const& trace) -> void
        {
            if (!match_) match_ = trace;
        }

        // Origin line followed by one line per frame
        [[nodiscard]]
        auto to_str() const -> std::string
        {
            std::string s = std::format("at {}:{} in `{}`\n", origin_.file_name(), origin_.line(),
                                        origin_.function_name());
            for (std::stacktrace_entry const& frame : stack_)
            {
                if (frame.source_file().empty()) continue;
                s += std::format("  {}:{} {}\n", frame.source_file(), frame.source_line(), frame.description());
            }
            return s;
        }

    private:
        std::string message_;
        Code code_;
        std::source_location origin_;
        std::stacktrace stack_;
        std::optional<MatchTrace> match_{};
    };
}

#endif //IMPERIALDUEL_TRACEDEXCEPTION_HPP
