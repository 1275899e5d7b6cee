//
// Types.hpp
//

#ifndef IMPERIALDUEL_TYPES_HPP
#define IMPERIALDUEL_TYPES_HPP

#define DUEL_ENABLE_TEST_HOOKS true

#include <array>
#include <cstdint>
#include <random>

namespace duel::core::constants
{
    inline constexpr std::size_t StanceCount = 6;
    inline constexpr std::size_t SeatCount = 2;
    inline constexpr int DieMin = 1;
    inline constexpr int DieMax = 6;
    inline constexpr int ModifierMin = -3;
    inline constexpr int ModifierMax = 3;
    inline constexpr std::size_t DeclaredPerRound = 2;
}

namespace duel::core
{
    // Clockwise order on the hexagon; the index is the position on the cycle.
    enum class Stance : uint8_t
    {
        Bagr = 0,
        Radae,
        Darda,
        Tigr,
        Riposje,
        Tortad
    };

    inline constexpr std::array<Stance, constants::StanceCount> AllStances{
        Stance::Bagr, Stance::Radae, Stance::Darda,
        Stance::Tigr, Stance::Riposje, Stance::Tortad
    };

    // Opaque platform identity (user id, connection id ...)
    using ParticipantId = uint64_t;
    // Uniqueness key for matches (channel id ...)
    using ContextKey = uint64_t;
    // 0 = challenger, 1 = challenged
    using SeatT = uint8_t;

    inline constexpr SeatT ChallengerSeat = 0;
    inline constexpr SeatT OpponentSeat = 1;
    // Stands in for an identity that is not seated in the match
    inline constexpr SeatT NoSeat = 0xFF;

    inline constexpr auto OtherSeat(SeatT const s) noexcept -> SeatT
    {
        return static_cast<SeatT>(1 - s);
    }

    enum class TiePolicy : uint8_t
    {
        Repick,        // no score, same round, both participants pick again
        ChallengerWins // seat 0 takes the round
    };

    enum class ModifierScope : uint8_t
    {
        Round,
        Match
    };

    struct MatchConfig
    {
        uint8_t   best_of{3};
        bool      no_repeat{false};
        bool      adjacency_mod{false};
        bool      bait_switch{false};
        TiePolicy tie_policy{TiePolicy::Repick};
        uint64_t  seed{std::random_device{}()};
    };

    inline constexpr auto WinThreshold(uint8_t const best_of) noexcept -> uint8_t
    {
        return static_cast<uint8_t>((best_of + 1) / 2);
    }

    inline constexpr auto IsValidBestOf(uint8_t const best_of) noexcept -> bool
    {
        return best_of == 3 || best_of == 5 || best_of == 7;
    }
}

#endif //IMPERIALDUEL_TYPES_HPP
