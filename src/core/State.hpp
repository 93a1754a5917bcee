//
// State.hpp
//

#ifndef MEMORYSCRAMBLE_STATE_HPP
#define MEMORYSCRAMBLE_STATE_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>
#include "Board.hpp"
#include "Types.hpp"

namespace memo::core
{
    // Published after every committed mutation. Immutable once shared, so
    // readers never take the session lock.
    struct GameSnapshot
    {
        std::uint64_t version{};
        Board board;
        ScoreTable scores{};
    };

    enum class CellState : std::uint8_t
    {
        None = 0, // removed
        Down,
        Up,       // face-up, held by someone else or by nobody
        Mine      // face-up, held by the viewer
    };

    struct CellView
    {
        std::optional<CardId> card{}; // only for face-up cards
        bool face_up{false};
        std::optional<PlayerId> controller{};
        CellState state{CellState::Down};
    };

    // What one player may see of the game.
    struct BoardView
    {
        int width{};
        int height{};
        std::vector<CellView> cells{}; // row-major
        ScoreTable scores{};
        std::uint64_t version{};
        bool finished{false};

        auto At(int x, int y) const -> CellView const&
        {
            return cells.at(static_cast<std::size_t>(y) * static_cast<std::size_t>(width) + static_cast<std::size_t>(x));
        }
    };

    inline auto ProjectFor(GameSnapshot const& snap, PlayerId const& viewer) -> BoardView
    {
        BoardView view{};
        view.width = snap.board.Width();
        view.height = snap.board.Height();
        view.scores = snap.scores;
        view.version = snap.version;
        view.finished = snap.board.RemainingPairs() == 0;

        view.cells.reserve(snap.board.Cells().size());
        for (Space const& sp : snap.board.Cells())
        {
            CellView cv{};
            cv.face_up = sp.face_up;
            cv.controller = sp.controller;
            if (sp.Empty())
            {
                cv.state = CellState::None;
            }
            else if (!sp.face_up)
            {
                cv.state = CellState::Down;
            }
            else
            {
                cv.card = sp.card;
                cv.state = (sp.controller && *sp.controller == viewer) ? CellState::Mine : CellState::Up;
            }
            view.cells.push_back(std::move(cv));
        }
        return view;
    }
}

#endif //MEMORYSCRAMBLE_STATE_HPP
