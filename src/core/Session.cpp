//
// Session.cpp
//
#include "Session.hpp"

#include <algorithm>
#include <print>
#include <utility>

#include "Util.hpp"

namespace memo::core
{
    Session::Session(Board board, SessionConfig cfg) :
        cfg_{cfg},
        board_{std::move(board)}
    {
        board_.CheckRep();
        std::lock_guard<std::mutex> lock(mtx_);
        PublishLocked();
    }

    auto Session::PublishLocked() -> void
    {
        published_.store(std::make_shared<GameSnapshot const>(GameSnapshot{version_, board_, scores_}));
    }

    auto Session::CommitLocked(Board next, ScoreTable scores) -> void
    {
        next.CheckRep();
        board_ = std::move(next);
        scores_ = std::move(scores);
        ++version_;
        PublishLocked();
    }

    auto Session::CancelledLocked(PlayerId const& player, std::uint64_t generation) const -> bool
    {
        if (shutdown_) return true;
        auto const it = generations_.find(player);
        return it != generations_.end() && it->second != generation;
    }

    auto Session::GenerationLocked(PlayerId const& player) const -> std::uint64_t
    {
        auto const it = generations_.find(player);
        return it != generations_.end() ? it->second : 0;
    }

    auto Session::WaitLocked(std::unique_lock<std::mutex>& lk, PlayerId const& player,
                             std::uint64_t generation, Deadline deadline) -> Wake
    {
        std::uint64_t const seen = version_;
        auto const woke = [&] { return version_ != seen || CancelledLocked(player, generation); };

        ++blocked_[player];
        bool in_time = true;
        if (deadline)
        {
            in_time = changed_.wait_until(lk, *deadline, woke);
        }
        else
        {
            changed_.wait(lk, woke);
        }
        Wake const wake = CancelledLocked(player, generation) ? Wake::Cancelled
                        : !in_time                           ? Wake::TimedOut
                                                             : Wake::Changed;

        // Last blocked call for this player: nobody holds its generation any more.
        auto const it = blocked_.find(player);
        if (--it->second == 0)
        {
            blocked_.erase(it);
            generations_.erase(player);
        }
        return wake;
    }

    auto Session::Look(PlayerId const& player) const -> BoardView
    {
        std::shared_ptr<GameSnapshot const> const snap = published_.load();
        return ProjectFor(*snap, player);
    }

    auto Session::Flip(PlayerId const& player, int x, int y, Deadline deadline) -> FlipResult
    {
        using error::Refusal;
        using error::Rejection;

        if (!util::IsValidIdentifier(player))
            return std::unexpected(Refusal{Rejection::InvalidPlayer});

        std::unique_lock<std::mutex> lk(mtx_);
        if (!board_.InBounds(x, y))
            return std::unexpected(
                Refusal{Rejection::OutOfBounds}.with_at({x, y}).with_bounds(board_.Width(), board_.Height()));

        std::uint64_t const generation = GenerationLocked(player);
        auto const holding = [&] { return pending_.contains(player); };
        Space target{};
        for (;;)
        {
            if (shutdown_)
                return std::unexpected(Refusal{Rejection::Cancelled}.with_at({x, y}));

            target = board_.Get(x, y);
            if (target.Empty())
                return std::unexpected(Refusal{Rejection::NoCard}.with_at({x, y}));
            if (target.controller && *target.controller == player)
                return std::unexpected(Refusal{Rejection::AlreadyHeld}.with_at({x, y}));
            if (!target.controller)
                break;

            // Held by someone else. Waiting while already holding a card could
            // deadlock two players on each other's cards, so only a first card
            // waits. A refused second card ends the turn: the first goes face-down.
            Refusal contested = Refusal{Rejection::Contested}.with_at({x, y}).with_holder(*target.controller);
            if (holding())
            {
                ForfeitLocked(player);
                lk.unlock();
                changed_.notify_all();
                return std::unexpected(std::move(contested));
            }
            if (cfg_.policy == ContentionPolicy::Reject)
                return std::unexpected(std::move(contested));

            switch (WaitLocked(lk, player, generation, deadline))
            {
                case Wake::Cancelled: return std::unexpected(Refusal{Rejection::Cancelled}.with_at({x, y}));
                case Wake::TimedOut:  return std::unexpected(Refusal{Rejection::TimedOut}.with_at({x, y}));
                case Wake::Changed:   break;
            }
            // Re-evaluate from scratch: the card may now be hidden, removed or taken again.
        }

        Board next = board_;
        if (!target.face_up) next.Flip(x, y);
        next.SetControl(x, y, player);

        auto const mine = pending_.find(player);
        std::vector<PendingCard> held = mine != pending_.end() ? mine->second : std::vector<PendingCard>{};
        held.push_back(PendingCard{{x, y}, *target.card});

        ScoreTable scores = scores_;
        scores.try_emplace(player, 0U);

        FlipOutcome out{.card = *target.card, .at = {x, y}};
        if (held.size() == constants::MaxPending)
        {
            PendingCard const& a = held[0];
            PendingCard const& b = held[1];
            if (a.card == b.card)
            {
                next.ClearControl(a.at.x, a.at.y);
                next.ClearControl(b.at.x, b.at.y);
                next.Remove(a.at.x, a.at.y);
                next.Remove(b.at.x, b.at.y);
                ++scores[player];
                out.matched = true;
                if (cfg_.verbose) std::print("[Session] {} matched {}\n", player, a.card);
            }
            else
            {
                next.Flip(a.at.x, a.at.y);
                next.Flip(b.at.x, b.at.y);
                out.matched = false;
                if (cfg_.verbose) std::print("[Session] {} didn't match: {} vs {}\n", player, a.card, b.card);
            }
            held.clear();
        }

        CommitLocked(std::move(next), std::move(scores));
        if (held.empty()) pending_.erase(player);
        else pending_[player] = std::move(held);
        out.score = scores_.at(player);
        if (cfg_.verbose) std::print("[Session] {} flipped {} at ({}, {})\n", player, out.card, x, y);

        lk.unlock();
        changed_.notify_all();
        return out;
    }

    auto Session::Watch(PlayerId const& player, Deadline deadline) -> ViewResult
    {
        using error::Refusal;
        using error::Rejection;

        std::unique_lock<std::mutex> lk(mtx_);
        if (shutdown_) return std::unexpected(Refusal{Rejection::Cancelled});

        switch (WaitLocked(lk, player, GenerationLocked(player), deadline))
        {
            case Wake::Cancelled: return std::unexpected(Refusal{Rejection::Cancelled});
            case Wake::TimedOut:  return std::unexpected(Refusal{Rejection::TimedOut});
            case Wake::Changed:   break;
        }

        std::shared_ptr<GameSnapshot const> const snap = published_.load();
        lk.unlock();
        return ProjectFor(*snap, player);
    }

    auto Session::Map(PlayerId const& player, std::function<CardId(CardId const&)> const& fn) -> BoardView
    {
        std::unordered_map<CardId, CardId> table;
        for (;;)
        {
            // fn runs unlocked, against the latest published board.
            std::shared_ptr<GameSnapshot const> const seen = published_.load();
            for (Space const& sp : seen->board.Cells())
            {
                if (sp.card && !table.contains(*sp.card)) table.emplace(*sp.card, fn(*sp.card));
            }

            std::unique_lock<std::mutex> lk(mtx_);
            bool const covered = std::ranges::all_of(board_.Cells(), [&](Space const& sp)
            {
                return !sp.card || table.contains(*sp.card);
            });
            if (!covered) continue; // relabelled meanwhile; map the new values too

            Board next = board_;
            next.Relabel([&](CardId const& c) { return table.at(c); });

            // Pending selections follow their cells.
            std::unordered_map<PlayerId, std::vector<PendingCard>> pending = pending_;
            for (auto& [who, cards] : pending)
            {
                for (PendingCard& pc : cards)
                {
                    pc.card = *next.Get(pc.at.x, pc.at.y).card;
                }
            }

            CommitLocked(std::move(next), scores_);
            pending_ = std::move(pending);
            if (cfg_.verbose) std::print("[Session] {} relabelled the board\n", player);

            std::shared_ptr<GameSnapshot const> const snap = published_.load();
            lk.unlock();
            changed_.notify_all();
            return ProjectFor(*snap, player);
        }
    }

    auto Session::ForfeitLocked(PlayerId const& player) -> void
    {
        auto const it = pending_.find(player);
        if (it == pending_.end() || it->second.empty()) return;

        Board next = board_;
        for (PendingCard const& pc : it->second)
        {
            Space const sp = next.Get(pc.at.x, pc.at.y);
            if (sp.face_up && sp.controller && *sp.controller == player)
                next.Flip(pc.at.x, pc.at.y);
        }
        CommitLocked(std::move(next), scores_);
        pending_.erase(it);
    }

    auto Session::Leave(PlayerId const& player) -> void
    {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            // Only blocked calls can observe the new generation.
            if (blocked_.contains(player)) generations_[player] = ++leaves_;
            ForfeitLocked(player);
            if (cfg_.verbose) std::print("[Session] {} left\n", player);
        }
        changed_.notify_all();
    }

    auto Session::Shutdown() -> void
    {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            shutdown_ = true;
        }
        changed_.notify_all();
    }

    auto Session::Pending(PlayerId const& player) const -> std::vector<PendingCard>
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto const it = pending_.find(player);
        return it != pending_.end() ? it->second : std::vector<PendingCard>{};
    }
}
