//
// Board.hpp
//

#ifndef MEMORYSCRAMBLE_BOARD_HPP
#define MEMORYSCRAMBLE_BOARD_HPP

#include <cstdint>
#include <functional>
#include <random>
#include <span>
#include <string>
#include <vector>
#include "Types.hpp"

namespace memo::core::debug {struct Inspector;}
namespace memo::core
{
    // Width x height grid of spaces, row-major. Every card still on the board
    // occurs exactly twice; a controlled space is always face-up; an empty
    // space is face-down and uncontrolled.
    //
    // Not synchronised. The owning Session serialises all mutators.
    class Board
    {
    public:
        Board() = delete;

        // Duplicates each card, shuffles with rng and fills row-major, all face-down.
        // Throws InvalidDimensionsError / InvalidCardSetError on bad input.
        Board(std::uint32_t width, std::uint32_t height,
              std::span<CardId const> cards, std::mt19937_64& rng);

        // Throws InvalidDimensionsError unless 1..MaxSide per side with an even
        // number of spaces. Cheap; call it before building a card set for a size.
        static auto ValidateDimensions(std::uint32_t width, std::uint32_t height) -> void;

        auto Width() const noexcept -> int { return width_; }
        auto Height() const noexcept -> int { return height_; }
        auto InBounds(int x, int y) const noexcept -> bool;

        // Throws OutOfBoundsError.
        auto Get(int x, int y) const -> Space;
        auto Cells() const noexcept -> std::span<Space const> { return cells_; }

        // Toggles face-up/face-down. Turning a card face-down drops its controller.
        auto Flip(int x, int y) -> void;
        auto SetControl(int x, int y, PlayerId const& player) -> void;
        auto ClearControl(int x, int y) -> void;

        // Empties a face-up space. Does NOT check the rep: removing one half of a
        // pair is transiently invalid, so the caller removes both then calls CheckRep().
        auto Remove(int x, int y) -> void;

        // Rewrites every card value through fn. Throws InvariantViolationError
        // (board unchanged) if the result would break pairing.
        auto Relabel(std::function<CardId(CardId const&)> const& fn) -> void;

        auto RemainingPairs() const -> std::size_t;
        auto RemovedCount() const -> std::size_t;

        // Throws InvariantViolationError describing the first broken invariant.
        auto CheckRep() const -> void;

        friend struct debug::Inspector;

    private:
        auto Index(int x, int y) const -> std::size_t;
        auto CheckedAt(int x, int y) -> Space&;

    private:
        int width_;
        int height_;
        std::vector<Space> cells_;
    };
}

#endif //MEMORYSCRAMBLE_BOARD_HPP
