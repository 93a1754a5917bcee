//
// RandomBot.cpp
//

#include "RandomBot.hpp"
#include <algorithm>
#include <vector>

namespace memo::core
{
    RandomBot::RandomBot(std::uint64_t rng_seed):
        rng_(static_cast<std::mt19937::result_type>(rng_seed)) {}

    auto RandomBot::Remember(BoardView const& view) -> void
    {
        for (int y{}; y < view.height; ++y)
        {
            for (int x{}; x < view.width; ++x)
            {
                CellView const& c = view.At(x, y);
                if (c.state == CellState::None)
                    seen_.erase({x, y});
                else if (c.card)
                    seen_[{x, y}] = *c.card;
            }
        }
    }

    auto RandomBot::Choose(BoardView const& view, std::chrono::steady_clock::time_point deadline)
        -> std::optional<Coord>
    {
        (void)deadline;
        Remember(view);

        std::vector<Coord> down;
        std::optional<std::pair<Coord, CardId>> mine;
        std::optional<Coord> held_partner; // face-up in someone else's hand
        for (int y{}; y < view.height; ++y)
        {
            for (int x{}; x < view.width; ++x)
            {
                CellView const& c = view.At(x, y);
                if (c.state == CellState::Down) down.push_back({x, y});
                if (c.state == CellState::Mine && c.card) mine = {{x, y}, *c.card};
            }
        }

        if (mine)
        {
            auto const partner = std::ranges::find_if(seen_, [&](auto const& kv)
            {
                Coord const at{kv.first.first, kv.first.second};
                return kv.second == mine->second && !(at == mine->first) &&
                       view.At(at.x, at.y).state == CellState::Down;
            });
            if (partner != seen_.end())
                return Coord{partner->first.first, partner->first.second};

            for (std::size_t i{}; i < view.cells.size() && !held_partner; ++i)
            {
                CellView const& c = view.cells[i];
                if (c.state == CellState::Up && c.card == mine->second)
                    held_partner = Coord{static_cast<int>(i % static_cast<std::size_t>(view.width)),
                                         static_cast<int>(i / static_cast<std::size_t>(view.width))};
            }
        }

        if (down.empty())
        {
            // Nothing left to uncover: give up the turn by reaching for the held partner.
            return held_partner;
        }
        return down[pick(down)];
    }
}
