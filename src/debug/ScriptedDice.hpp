//
// ScriptedDice.hpp
//

#ifndef IMPERIALDUEL_SCRIPTEDDICE_HPP
#define IMPERIALDUEL_SCRIPTEDDICE_HPP

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <vector>

#include "../core/Dice.hpp"
#include "../core/Exception.hpp"

namespace duel::core::debug
{
    // Replays a fixed sequence of faces. Running dry is a test bug and throws.
    class ScriptedDice final : public DieSource
    {
    public:
        ScriptedDice(std::initializer_list<uint8_t> faces) : faces_(faces) {}
        explicit ScriptedDice(std::vector<uint8_t> faces) : faces_(std::move(faces)) {}

        auto RollD6() -> uint8_t override
        {
            if (next_ >= faces_.size())
            {
                DUEL_THROW(error::Code::State, "ScriptedDice exhausted");
            }
            return faces_[next_++];
        }

        // Queue more faces after construction (the match owns the source)
        auto Push(uint8_t const face) -> void { faces_.push_back(face); }

        [[nodiscard]]
        auto Consumed() const noexcept -> std::size_t { return next_; }
        [[nodiscard]]
        auto Remaining() const noexcept -> std::size_t { return faces_.size() - next_; }

    private:
        std::vector<uint8_t> faces_;
        std::size_t next_{};
    };
}

#endif //IMPERIALDUEL_SCRIPTEDDICE_HPP
