//
// Session.hpp
//

#ifndef MEMORYSCRAMBLE_SESSION_HPP
#define MEMORYSCRAMBLE_SESSION_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>
#include "Board.hpp"
#include "Exception.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace memo::core::debug {struct Inspector;}
namespace memo::core
{
    using Deadline = std::optional<std::chrono::steady_clock::time_point>;

    struct PendingCard
    {
        Coord at{};
        CardId card{};
    };

    struct FlipOutcome
    {
        CardId card{};
        Coord at{};
        // Set only when this flip was the player's second card and resolved the turn.
        std::optional<bool> matched{};
        std::uint32_t score{};
    };

    using FlipResult = std::expected<FlipOutcome, error::Refusal>;
    using ViewResult = std::expected<BoardView, error::Refusal>;

    // One game: the board plus per-player scores and pending selections.
    //
    // Every mutation is staged on a copy of the board, rep-checked and then
    // committed under mtx_, so a failed check leaves the game untouched. After
    // each commit a new GameSnapshot is published and all waiters are woken;
    // Look() reads the published snapshot and never takes the lock.
    class Session
    {
    public:
        Session() = delete;
        explicit Session(Board board, SessionConfig cfg = {});

        Session(Session const&) = delete;
        auto operator=(Session const&) -> Session& = delete;

        auto Look(PlayerId const& player) const -> BoardView;

        // Turns (x, y) face-up under the player's control. On the player's second
        // card the turn resolves: a match retires both cards and scores a point, a
        // mismatch turns both face-down. A card held by someone else either blocks
        // until released (ContentionPolicy::Wait, first card only) or is refused.
        // Refusing a second card ends the turn and turns the first face-down.
        auto Flip(PlayerId const& player, int x, int y, Deadline deadline = std::nullopt) -> FlipResult;

        // Blocks until the next committed change, then returns the new view.
        auto Watch(PlayerId const& player, Deadline deadline = std::nullopt) -> ViewResult;

        // Rewrites every card through fn in one step. fn is called once per
        // distinct card without the session lock held, so it may call back into
        // the session; it must depend only on its argument. Throws
        // InvariantViolationError (nothing applied) when fn would break pairing.
        auto Map(PlayerId const& player, std::function<CardId(CardId const&)> const& fn) -> BoardView;

        // Drops the player's held cards face-down and cancels their blocked calls.
        auto Leave(PlayerId const& player) -> void;

        // Cancels every blocked call; later flips are refused.
        auto Shutdown() -> void;

        auto Snapshot() const -> std::shared_ptr<GameSnapshot const> { return published_.load(); }
        auto Pending(PlayerId const& player) const -> std::vector<PendingCard>;
        auto Config() const noexcept -> SessionConfig const& { return cfg_; }

        friend struct debug::Inspector;

    private:
        // Requires mtx_ held. Rep-checks next and makes it current.
        auto CommitLocked(Board next, ScoreTable scores) -> void;
        auto PublishLocked() -> void;
        // Turns the player's held cards face-down and clears their selection.
        auto ForfeitLocked(PlayerId const& player) -> void;
        auto CancelledLocked(PlayerId const& player, std::uint64_t generation) const -> bool;
        auto GenerationLocked(PlayerId const& player) const -> std::uint64_t;

        enum class Wake : std::uint8_t { Changed, Cancelled, TimedOut };
        // Requires lk on mtx_. Blocks until the next commit, a cancellation or the deadline.
        auto WaitLocked(std::unique_lock<std::mutex>& lk, PlayerId const& player,
                        std::uint64_t generation, Deadline deadline) -> Wake;

    private:
        SessionConfig cfg_;

        mutable std::mutex mtx_;
        std::condition_variable changed_;

        Board board_;
        ScoreTable scores_;
        std::unordered_map<PlayerId, std::vector<PendingCard>> pending_; // never holds an empty selection
        // Entries exist only while a player has blocked calls; Leave() moves them on.
        std::unordered_map<PlayerId, std::uint64_t> generations_;
        std::unordered_map<PlayerId, std::uint32_t> blocked_;
        std::uint64_t leaves_{0};
        std::uint64_t version_{0};
        bool shutdown_{false};

        std::atomic<std::shared_ptr<GameSnapshot const>> published_;
    };
}

#endif //MEMORYSCRAMBLE_SESSION_HPP
