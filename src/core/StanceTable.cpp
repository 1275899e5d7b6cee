//
// StanceTable.cpp
//

#include "StanceTable.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <ranges>

namespace
{
    constexpr std::array<std::string_view, duel::core::constants::StanceCount> StanceNames{
        "Bagr", "Radae", "Darda", "Tigr", "Riposje", "Tortad"
    };

    auto lower(char const c) -> char
    {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    auto iequals(std::string_view a, std::string_view b) -> bool
    {
        return a.size() == b.size() &&
            std::ranges::equal(a, b, [](char x, char y) { return lower(x) == lower(y); });
    }

    auto icontains(std::string_view hay, std::string_view needle) -> bool
    {
        if (needle.empty()) return true;
        auto const found = std::ranges::search(hay, needle,
                                               [](char x, char y) { return lower(x) == lower(y); });
        return !found.empty();
    }
}

namespace duel::core
{
    auto ToString(Stance const s) noexcept -> std::string_view
    {
        return StanceNames[IndexOf(s)];
    }

    auto ToString(Relationship const r) noexcept -> std::string_view
    {
        switch (r)
        {
        case Relationship::Advantage: return "Advantage";
        case Relationship::Disadvantage: return "Disadvantage";
        case Relationship::Neutral: return "Neutral";
        }
        return "?";
    }

    auto ToString(Adjacency const a) noexcept -> std::string_view
    {
        switch (a)
        {
        case Adjacency::Adjacent: return "Adjacent";
        case Adjacency::Opposite: return "Opposite";
        case Adjacency::Other: return "Other";
        }
        return "?";
    }

    auto ParseStance(std::string_view const name) -> std::optional<Stance>
    {
        for (Stance const s : AllStances)
        {
            if (iequals(name, ToString(s))) return s;
        }
        return std::nullopt;
    }

    auto CompleteStance(std::string_view const fragment) -> std::vector<Stance>
    {
        auto matches = AllStances | std::views::filter([fragment](Stance const s)
        {
            return icontains(ToString(s), fragment);
        });
        return std::ranges::to<std::vector<Stance>>(matches);
    }

    auto BeatenBy(Stance const s) noexcept -> std::pair<Stance, Stance>
    {
        std::size_t const i = IndexOf(s);
        return {
            AllStances[(i + 1) % constants::StanceCount],
            AllStances[(i + 2) % constants::StanceCount]
        };
    }
}
