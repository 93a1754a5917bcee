//
// Inspector.hpp
//

#ifndef MEMORYSCRAMBLE_INSPECTOR_HPP
#define MEMORYSCRAMBLE_INSPECTOR_HPP

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

#include "../core/Board.hpp"
#include "../core/Session.hpp"
#include "../core/Types.hpp"

namespace memo::core::debug
{
    struct Inspector
    {
        struct SnapshotAll
        {
            std::vector<Space> cells;
            int width{};
            int height{};
            ScoreTable scores;
            std::unordered_map<PlayerId, std::vector<PendingCard>> pending;
            std::uint64_t version{};
            std::uint64_t published_version{};
            bool shutdown{false};
            std::size_t generations{}; // players with a pending cancellation record
            std::size_t blocked{};     // players with a call blocked in Flip/Watch
        };

        // Consistent copy of a session's private state, taken under its lock.
        static inline auto Gather(Session const& s) -> SnapshotAll
        {
            std::lock_guard<std::mutex> lock(s.mtx_);
            SnapshotAll ret{};
            ret.cells.assign(s.board_.cells_.begin(), s.board_.cells_.end());
            ret.width = s.board_.width_;
            ret.height = s.board_.height_;
            ret.scores = s.scores_;
            ret.pending = s.pending_;
            ret.version = s.version_;
            ret.published_version = s.published_.load()->version;
            ret.shutdown = s.shutdown_;
            ret.generations = s.generations_.size();
            ret.blocked = s.blocked_.size();
            return ret;
        }

        // Test hook: overwrite one space without any checks.
        static inline auto Poke(Board& b, int x, int y, Space sp) -> void
        {
            b.cells_.at(static_cast<std::size_t>(y) * static_cast<std::size_t>(b.width_) + static_cast<std::size_t>(x)) =
                std::move(sp);
        }
    };
}

#endif //MEMORYSCRAMBLE_INSPECTOR_HPP
