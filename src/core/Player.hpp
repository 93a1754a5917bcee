//
// Player.hpp
//

#ifndef MEMORYSCRAMBLE_PLAYER_HPP
#define MEMORYSCRAMBLE_PLAYER_HPP

#include <chrono>
#include <optional>
#include "State.hpp"
#include "Types.hpp"

namespace memo::core
{
    class Player
    {
    public:
        virtual ~Player() = default;

        // Picks the next cell to flip given the player's current view, or nullopt
        // when nothing is flippable. Called by local drivers and the bot client.
        virtual auto Choose(BoardView const& view,
                            std::chrono::steady_clock::time_point deadline) -> std::optional<Coord> = 0;
    };
}
#endif //MEMORYSCRAMBLE_PLAYER_HPP
