//
// RandomDuelist.hpp
//

#ifndef IMPERIALDUEL_RANDOMDUELIST_HPP
#define IMPERIALDUEL_RANDOMDUELIST_HPP

#include <random>
#include <vector>
#include "Duelist.hpp"
#include "Types.hpp"

namespace duel::core
{
    class RandomDuelist final : public Duelist
    {
    public:
        explicit RandomDuelist(uint64_t rng_seed);

        auto Decide(std::shared_ptr<MatchSnapshot const> snapshot) -> std::optional<MatchAction> override;

    private:
        template <class Vec>
        auto pick(Vec const& v) -> size_t
        {
            return std::uniform_int_distribution<size_t>{0, v.size() - 1}(rng_);
        }

        auto DeclareMove(MatchSnapshot const&, SeatView const&) -> MatchAction;
        auto SwitchMove(MatchSnapshot const&, SeatView const&) -> MatchAction;
        auto PickMove(SeatView const&) -> MatchAction;

    private:
        std::mt19937 rng_;
    };
}

#endif //IMPERIALDUEL_RANDOMDUELIST_HPP
