//
// Registry.hpp
//

#ifndef MEMORYSCRAMBLE_REGISTRY_HPP
#define MEMORYSCRAMBLE_REGISTRY_HPP

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "Board.hpp"
#include "Session.hpp"
#include "Types.hpp"

namespace memo::core
{
    using GameId = std::string;

    // Owns the live sessions, one per game id. Callers get a shared handle so an
    // in-flight request keeps its session alive while a new game replaces it.
    class GameRegistry
    {
    public:
        GameRegistry() = default;
        GameRegistry(GameRegistry const&) = delete;
        auto operator=(GameRegistry const&) -> GameRegistry& = delete;
        ~GameRegistry();

        // Replaces (and shuts down) any existing session under id.
        auto Create(GameId const& id, Board board, SessionConfig cfg = {}) -> std::shared_ptr<Session>;
        auto Create(GameId const& id, GameConfig const& game, SessionConfig cfg = {}) -> std::shared_ptr<Session>;

        // nullptr when there is no such game.
        auto Find(GameId const& id) const -> std::shared_ptr<Session>;
        auto Remove(GameId const& id) -> bool;

        auto Size() const -> std::size_t;
        auto Ids() const -> std::vector<GameId>;

    private:
        mutable std::mutex mtx_;
        std::map<GameId, std::shared_ptr<Session>> games_;
    };
}

#endif //MEMORYSCRAMBLE_REGISTRY_HPP
