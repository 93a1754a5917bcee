//
// RandomBot.hpp
//

#ifndef MEMORYSCRAMBLE_RANDOMBOT_HPP
#define MEMORYSCRAMBLE_RANDOMBOT_HPP

#include <cstdint>
#include <map>
#include <random>
#include <utility>
#include "Player.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace memo::core
{
    // Flips random face-down cards, but completes a pair when it has already
    // seen where the partner of its held card lies. With nothing left face-down
    // it reaches for a partner held by someone else, which gives up its turn.
    class RandomBot final : public memo::core::Player
    {
    public:
        explicit RandomBot(std::uint64_t rng_seed);

        auto Choose(BoardView const& view,
                    std::chrono::steady_clock::time_point deadline) -> std::optional<Coord> override;

    private:
        template <class Vec>
        auto pick(Vec const& v) -> std::size_t
        {
            return std::uniform_int_distribution<std::size_t>{0, v.size() - 1}(rng_);
        }

        auto Remember(BoardView const& view) -> void;

    private:
        std::mt19937 rng_;
        std::map<std::pair<int, int>, CardId> seen_; // (x, y) -> card last seen face-up
    };
}

#endif //MEMORYSCRAMBLE_RANDOMBOT_HPP
