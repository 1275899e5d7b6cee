//
// MatchLogger.hpp
//

#ifndef IMPERIALDUEL_MATCHLOGGER_HPP
#define IMPERIALDUEL_MATCHLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <optional>
#include <string>

#include "../core/Match.hpp"
#include "../core/State.hpp"
#include "../core/Actions.hpp"
#include "../core/Types.hpp"

namespace duel::core::debug
{
    // Plain-text transcript of one match
    class MatchLogger
    {
    public:
        explicit MatchLogger(std::string path);
        ~MatchLogger();

        MatchLogger(MatchLogger const&) = delete;
        auto operator=(MatchLogger const&) -> MatchLogger& = delete;

        MatchLogger(MatchLogger&&) noexcept = default;
        auto operator=(MatchLogger&&) noexcept -> MatchLogger& = default;

        [[nodiscard]]
        auto is_open() const -> bool { return out_.is_open(); }

        // Header: context, participants, config
        auto start(MatchImpl const& match) -> void;

        // Submitted action with actor (nullopt = moderator/host)
        auto action(std::optional<SeatT> actor, MatchAction const& a) -> void;

        auto outcome(ActionResult const& r) -> void;

        // Full breakdown of one history entry
        auto round(RoundResult const& r) -> void;

        // Footer with terminal state and winner
        auto end(MatchImpl const& match) -> void;

        auto flush() -> void;

    private:
        std::ofstream out_;
    };

    auto DescribeAction(MatchAction const& a) -> std::string;
    auto DescribeRound(RoundResult const& r) -> std::string;
}

#endif //IMPERIALDUEL_MATCHLOGGER_HPP
