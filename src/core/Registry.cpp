//
// Registry.cpp
//
#include "Registry.hpp"

#include <random>
#include <utility>

namespace memo::core
{
    GameRegistry::~GameRegistry()
    {
        std::lock_guard<std::mutex> lock(mtx_);
        for (auto& [id, session] : games_)
        {
            session->Shutdown();
        }
    }

    auto GameRegistry::Create(GameId const& id, Board board, SessionConfig cfg) -> std::shared_ptr<Session>
    {
        std::shared_ptr<Session> fresh = std::make_shared<Session>(std::move(board), cfg);
        std::shared_ptr<Session> old;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            std::shared_ptr<Session>& slot = games_[id];
            old = std::exchange(slot, fresh);
        }
        if (old) old->Shutdown();
        return fresh;
    }

    auto GameRegistry::Create(GameId const& id, GameConfig const& game, SessionConfig cfg) -> std::shared_ptr<Session>
    {
        std::mt19937_64 rng{game.seed};
        return Create(id, Board{game.width, game.height, game.cards, rng}, cfg);
    }

    auto GameRegistry::Find(GameId const& id) const -> std::shared_ptr<Session>
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto const it = games_.find(id);
        return it != games_.end() ? it->second : nullptr;
    }

    auto GameRegistry::Remove(GameId const& id) -> bool
    {
        std::shared_ptr<Session> old;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            auto const it = games_.find(id);
            if (it == games_.end()) return false;
            old = std::move(it->second);
            games_.erase(it);
        }
        old->Shutdown();
        return true;
    }

    auto GameRegistry::Size() const -> std::size_t
    {
        std::lock_guard<std::mutex> lock(mtx_);
        return games_.size();
    }

    auto GameRegistry::Ids() const -> std::vector<GameId>
    {
        std::lock_guard<std::mutex> lock(mtx_);
        std::vector<GameId> out;
        out.reserve(games_.size());
        for (auto const& [id, session] : games_) out.push_back(id);
        return out;
    }
}
