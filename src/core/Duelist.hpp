//
// Duelist.hpp
//

#ifndef IMPERIALDUEL_DUELIST_HPP
#define IMPERIALDUEL_DUELIST_HPP

#include <memory>
#include <optional>
#include "Actions.hpp"
#include "State.hpp"

namespace duel::core
{
    class Duelist
    {
    public:
        virtual ~Duelist() = default;

        // Called with the duelist's own seat view. nullopt when the match is not waiting on this seat.
        virtual auto Decide(std::shared_ptr<MatchSnapshot const> snapshot) -> std::optional<MatchAction> = 0;
    };
}
#endif //IMPERIALDUEL_DUELIST_HPP
