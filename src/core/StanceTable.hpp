//
// StanceTable.hpp
//

#ifndef IMPERIALDUEL_STANCETABLE_HPP
#define IMPERIALDUEL_STANCETABLE_HPP

#include <optional>
#include <string_view>
#include <utility>
#include <vector>
#include "Types.hpp"

namespace duel::core
{
    enum class Relationship : uint8_t
    {
        Advantage,
        Disadvantage,
        Neutral
    };

    enum class Adjacency : uint8_t
    {
        Adjacent,
        Opposite,
        Other
    };

    inline constexpr auto IndexOf(Stance const s) noexcept -> std::size_t
    {
        return static_cast<std::size_t>(std::to_underlying(s));
    }

    // Clockwise steps from a to b, in [0, 6).
    inline constexpr auto CyclicDistance(Stance const a, Stance const b) noexcept -> std::size_t
    {
        return (IndexOf(b) + constants::StanceCount - IndexOf(a)) % constants::StanceCount;
    }

    // From the attacker's point of view. Total over all 36 pairs; the diagonal is Neutral.
    inline constexpr auto RelationshipOf(Stance const attacker, Stance const defender) noexcept -> Relationship
    {
        switch (CyclicDistance(attacker, defender))
        {
        case 1:
        case 2:
            return Relationship::Advantage;
        case 4:
        case 5:
            return Relationship::Disadvantage;
        default:
            return Relationship::Neutral;
        }
    }

    inline constexpr auto AdjacencyOf(Stance const a, Stance const b) noexcept -> Adjacency
    {
        switch (CyclicDistance(a, b))
        {
        case 1:
        case 5:
            return Adjacency::Adjacent;
        case 3:
            return Adjacency::Opposite;
        default:
            return Adjacency::Other;
        }
    }

    inline constexpr auto Mirror(Relationship const r) noexcept -> Relationship
    {
        switch (r)
        {
        case Relationship::Advantage: return Relationship::Disadvantage;
        case Relationship::Disadvantage: return Relationship::Advantage;
        case Relationship::Neutral: return Relationship::Neutral;
        }
        return Relationship::Neutral;
    }

    auto ToString(Stance s) noexcept -> std::string_view;
    auto ToString(Relationship r) noexcept -> std::string_view;
    auto ToString(Adjacency a) noexcept -> std::string_view;

    // Case-insensitive, exact name. nullopt for anything else.
    auto ParseStance(std::string_view name) -> std::optional<Stance>;

    // Stances whose name contains the fragment (case-insensitive), in cycle order.
    auto CompleteStance(std::string_view fragment) -> std::vector<Stance>;

    // The two stances this one has Advantage over.
    auto BeatenBy(Stance s) noexcept -> std::pair<Stance, Stance>;
}

#endif //IMPERIALDUEL_STANCETABLE_HPP
