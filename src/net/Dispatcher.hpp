//
// Dispatcher.hpp
//

#ifndef MEMORYSCRAMBLE_DISPATCHER_HPP
#define MEMORYSCRAMBLE_DISPATCHER_HPP

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <unordered_map>
#include <utility>
#include <flatbuffers/flatbuffers.h>

#include "codec.hpp"
#include "../core/Registry.hpp"
#include "../core/Session.hpp"
#include "../core/Types.hpp"

namespace memo::core::debug {class AuditLogger;}
namespace memo::core::net
{
    struct DispatcherOptions
    {
        // Applied when a request carries timeout_ms = 0. Zero here means no deadline.
        std::chrono::milliseconds flip_timeout{10000};
        std::chrono::milliseconds watch_timeout{30000};
        // Used for games created over the wire; the request picks the policy.
        SessionConfig session{};
        debug::AuditLogger* audit{nullptr};
    };

    using ConnectionId = std::uint64_t;

    // (game id, player) a connection has acted as.
    using Seat = std::pair<std::string, PlayerId>;
    using Seats = std::set<Seat>;

    // Seat a request speaks for, if any. Game ids are resolved.
    auto SeatOf(Request const& req) -> std::optional<Seat>;

    // Turns decoded requests into calls on the registry's sessions and builds the
    // reply frame. Handle() may block (Wait-policy flips, watches), so the
    // server calls it off the network thread.
    class Dispatcher
    {
    public:
        explicit Dispatcher(GameRegistry& registry, DispatcherOptions opts = {});

        auto Handle(DecodedRequest const& req) -> flatbuffers::DetachedBuffer;

        // Decodes and handles one frame. A malformed frame gets a BadRequest reply.
        auto HandleFrame(std::span<std::byte const> bytes) -> flatbuffers::DetachedBuffer;

        // Connection went away: release what the player holds in that game.
        auto Leave(std::string const& game_id, PlayerId const& player) -> void;

        // Connection-scoped variant of Handle(). Seats used by the request are
        // recorded against conn. Once conn is disconnected every request is
        // refused with Cancelled, and a flip that completes after the disconnect
        // is undone.
        auto Connect(ConnectionId conn) -> void;
        auto Handle(ConnectionId conn, DecodedRequest const& req) -> flatbuffers::DetachedBuffer;
        // Releases every seat conn used.
        auto Disconnect(ConnectionId conn) -> void;

    private:
        auto OnLook(LookCmd const& cmd, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;
        auto OnWatch(WatchCmd const& cmd, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;
        auto OnFlip(FlipCmd const& cmd, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;
        auto OnNewGame(NewGameCmd const& cmd, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;
        auto OnReplace(ReplaceCmd const& cmd, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;
        auto OnHealth(HealthCmd const& cmd, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

        auto DeadlineFor(std::uint32_t timeout_ms, std::chrono::milliseconds fallback) const -> Deadline;

    private:
        GameRegistry& registry_;
        DispatcherOptions opts_;

        std::mutex conns_mx_;
        std::unordered_map<ConnectionId, Seats> conns_; // open connections only
    };

    // Empty ids address the single default game.
    inline auto ResolveGameId(std::string const& id) -> std::string
    {
        return id.empty() ? std::string{constants::DefaultGameId} : id;
    }
}

#endif //MEMORYSCRAMBLE_DISPATCHER_HPP
