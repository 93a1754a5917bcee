//
// Invariants.hpp
//

#ifndef MEMORYSCRAMBLE_INVARIANTS_HPP
#define MEMORYSCRAMBLE_INVARIANTS_HPP

#include <cstddef>
#include <format>
#include <numeric>

#include "../core/Exception.hpp"
#include "../core/Session.hpp"
#include "../core/Util.hpp"
#include "Inspector.hpp"

namespace memo::core::debug
{
    // Cross-structure checks the board alone cannot see. Throws AssertionError.
    inline auto CheckInvariants(Session const& session) -> void
    {
#if MEM_ENABLE_TEST_HOOKS == false
        (void)session;
#else
        Inspector::SnapshotAll const s = Inspector::Gather(session);

        // 1) Grid shape
        MEM_ASSERT(s.cells.size() == static_cast<std::size_t>(s.width) * static_cast<std::size_t>(s.height),
                   "Grid size does not match dimensions");

        // 2) Cards occur 0 or 2 times; controlled implies face-up; removed implies down/uncontrolled
        for (auto const& [card, count] : util::CountCards(s.cells))
        {
            MEM_ASSERT(count == 2, std::format("Card '{}' occurs {} times", card, count));
        }
        std::size_t removed{};
        std::size_t controlled{};
        for (Space const& sp : s.cells)
        {
            if (sp.controller) MEM_ASSERT(sp.face_up, "Controlled card is face-down");
            if (sp.Empty())
            {
                ++removed;
                MEM_ASSERT(!sp.face_up && !sp.controller, "Removed space is face-up or controlled");
            }
            if (sp.controller) ++controlled;
        }

        // 3) Pending selections are exactly the controlled cards, held by their owner
        std::size_t pending_total{};
        for (auto const& [player, cards] : s.pending)
        {
            MEM_ASSERT(cards.size() < constants::MaxPending, "Unresolved pair left pending");
            for (PendingCard const& pc : cards)
            {
                Space const& sp = s.cells.at(static_cast<std::size_t>(pc.at.y) * static_cast<std::size_t>(s.width) +
                                             static_cast<std::size_t>(pc.at.x));
                MEM_ASSERT(sp.face_up && sp.controller && *sp.controller == player,
                           std::format("Pending card of {} is not held by them", player));
                MEM_ASSERT(sp.card && *sp.card == pc.card, "Pending card value is stale");
            }
            pending_total += cards.size();
        }
        MEM_ASSERT(pending_total == controlled, "Controlled card without a pending selection");

        // 4) Every removed pair was scored exactly once
        std::size_t const points = std::accumulate(s.scores.begin(), s.scores.end(), std::size_t{0},
                                                   [](std::size_t acc, auto const& kv) { return acc + kv.second; });
        MEM_ASSERT(removed == points * 2, std::format("{} removed spaces but {} points scored", removed, points));

        // 5) Readers see the latest commit
        MEM_ASSERT(s.published_version == s.version, "Published snapshot lags behind the board");
#endif // MEM_ENABLE_TEST_HOOKS == true
    }
}
#endif //MEMORYSCRAMBLE_INVARIANTS_HPP
