//
// Resolver.cpp
//

#include "Resolver.hpp"

#include <algorithm>

namespace duel::core
{
    auto RoundResolver::AdjacencyModifier(Adjacency const a) noexcept -> int
    {
        switch (a)
        {
        case Adjacency::Adjacent: return 1;
        case Adjacency::Opposite: return -1;
        case Adjacency::Other: return 0;
        }
        return 0;
    }

    auto RoundResolver::Clamp(int const raw) noexcept -> uint8_t
    {
        return static_cast<uint8_t>(std::clamp(raw, constants::DieMin, constants::DieMax));
    }

    auto RoundResolver::Resolve(ResolveInput const& in, DieSource& dice) -> RoundResult
    {
        RoundResult out{};

        Relationship const rel0 = RelationshipOf(in.picks[0], in.picks[1]);
        out.adjacency = AdjacencyOf(in.picks[0], in.picks[1]);

        // Symmetric: reflects positioning, not who holds the advantage
        int const adj = in.adjacency_mod ? AdjacencyModifier(out.adjacency) : 0;

        for (SeatT seat{}; seat < constants::SeatCount; ++seat)
        {
            SideResult& side = out.sides[seat];
            side.stance = in.picks[seat];
            side.relationship = (seat == 0) ? rel0 : Mirror(rel0);
            side.roll = Roll(side.relationship, dice);
            side.adjacency_mod = adj;
            side.round_mod = in.modifiers[seat].round;
            side.match_mod = in.modifiers[seat].match;
            side.raw_total = side.roll.kept + side.adjacency_mod + side.round_mod + side.match_mod;
            side.final_value = Clamp(side.raw_total);
        }

        uint8_t const v0 = out.sides[0].final_value;
        uint8_t const v1 = out.sides[1].final_value;
        if (v0 == v1)
        {
            out.tie = true;
        }
        else
        {
            out.winner = (v0 > v1) ? SeatT{0} : SeatT{1};
        }
        return out;
    }
}
