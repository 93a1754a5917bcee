//
// Dispatcher.cpp
//
#include "Dispatcher.hpp"

#include <exception>
#include <format>
#include <print>
#include <random>
#include <type_traits>
#include <utility>
#include <variant>

#include "../core/Board.hpp"
#include "../core/Exception.hpp"
#include "../core/Util.hpp"
#include "../debug/AuditLogger.hpp"

namespace memo::core::net
{
    namespace
    {
        auto refused_board(error::Refusal const& r, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
        {
            return BuildBoardReply(BoardReplyVal{.ok = false, .status = StatusOf(r.code),
                                                 .message = error::describe(r)}, msg_id);
        }

        auto failed_board(Status s, std::string message, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
        {
            return BuildBoardReply(BoardReplyVal{.ok = false, .status = s, .message = std::move(message)}, msg_id);
        }

        auto no_game(std::string const& id, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
        {
            return failed_board(Status::NoGame, std::format("No such game: {}", id), msg_id);
        }

        auto ok_board(BoardView view, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
        {
            return BuildBoardReply(BoardReplyVal{.ok = true, .status = Status::Ok, .board = std::move(view)}, msg_id);
        }

        // Failure reply shaped for the request: FlipReply for flips, BoardReply otherwise.
        auto failed_reply(DecodedRequest const& req, Status s, std::string message) -> flatbuffers::DetachedBuffer
        {
            if (std::holds_alternative<FlipCmd>(req.request))
            {
                return BuildFlipReply(FlipReplyVal{.ok = false, .status = s, .message = std::move(message)},
                                      req.msg_id);
            }
            return failed_board(s, std::move(message), req.msg_id);
        }

        // Card set for a NewGame request that did not name one.
        auto generated_cards(std::uint32_t width, std::uint32_t height) -> std::vector<CardId>
        {
            std::size_t const pairs = static_cast<std::size_t>(width) * height / 2;
            std::vector<CardId> emoji = util::DefaultEmojiCards();
            if (pairs == emoji.size()) return emoji;
            return util::NumberedCards(pairs);
        }
    }

    Dispatcher::Dispatcher(GameRegistry& registry, DispatcherOptions opts) :
        registry_{registry},
        opts_{opts}
    {
    }

    auto Dispatcher::DeadlineFor(std::uint32_t timeout_ms, std::chrono::milliseconds fallback) const -> Deadline
    {
        std::chrono::milliseconds const wait = timeout_ms != 0 ? std::chrono::milliseconds{timeout_ms} : fallback;
        if (wait.count() == 0) return std::nullopt;
        return std::chrono::steady_clock::now() + wait;
    }

    auto Dispatcher::HandleFrame(std::span<std::byte const> bytes) -> flatbuffers::DetachedBuffer
    {
        std::expected<DecodedRequest, ParseError> const req = DecodeRequest(bytes);
        if (!req.has_value())
        {
            std::print("[Server] Parse error: {}\n", req.error().message);
            return failed_board(Status::BadRequest, req.error().message, 0);
        }
        return Handle(req.value());
    }

    auto Dispatcher::Handle(DecodedRequest const& req) -> flatbuffers::DetachedBuffer
    {
        try
        {
            return std::visit([&](auto const& cmd) -> flatbuffers::DetachedBuffer
            {
                using T = std::decay_t<decltype(cmd)>;
                if constexpr (std::is_same_v<T, LookCmd>) return OnLook(cmd, req.msg_id);
                else if constexpr (std::is_same_v<T, WatchCmd>) return OnWatch(cmd, req.msg_id);
                else if constexpr (std::is_same_v<T, FlipCmd>) return OnFlip(cmd, req.msg_id);
                else if constexpr (std::is_same_v<T, NewGameCmd>) return OnNewGame(cmd, req.msg_id);
                else if constexpr (std::is_same_v<T, ReplaceCmd>) return OnReplace(cmd, req.msg_id);
                else return OnHealth(cmd, req.msg_id);
            }, req.request);
        }
        catch (OmegaException<error::Code> const& e)
        {
            std::print("[Server] Internal error: {}", e.to_str());
        }
        catch (std::exception const& e)
        {
            std::print("[Server] Internal error: {}\n", e.what());
        }
        // Details stay in the server log.
        return failed_reply(req, Status::Internal, "internal error");
    }

    auto SeatOf(Request const& req) -> std::optional<Seat>
    {
        std::optional<Seat> seat;
        if (auto const* f = std::get_if<FlipCmd>(&req)) seat = Seat{ResolveGameId(f->game_id), f->player};
        else if (auto const* l = std::get_if<LookCmd>(&req)) seat = Seat{ResolveGameId(l->game_id), l->player};
        else if (auto const* w = std::get_if<WatchCmd>(&req)) seat = Seat{ResolveGameId(w->game_id), w->player};
        if (seat && !util::IsValidIdentifier(seat->second)) seat.reset();
        return seat;
    }

    auto Dispatcher::Connect(ConnectionId conn) -> void
    {
        std::lock_guard<std::mutex> lock(conns_mx_);
        conns_[conn];
    }

    auto Dispatcher::Handle(ConnectionId conn, DecodedRequest const& req) -> flatbuffers::DetachedBuffer
    {
        std::optional<Seat> const seat = SeatOf(req.request);
        bool open = false;
        {
            std::lock_guard<std::mutex> lock(conns_mx_);
            auto const it = conns_.find(conn);
            if (it != conns_.end())
            {
                open = true;
                if (seat) it->second.insert(*seat);
            }
        }
        if (!open) return failed_reply(req, Status::Cancelled, "Connection closed");

        flatbuffers::DetachedBuffer reply = Handle(req);

        if (seat && std::holds_alternative<FlipCmd>(req.request))
        {
            bool closed = false;
            {
                std::lock_guard<std::mutex> lock(conns_mx_);
                closed = !conns_.contains(conn);
            }
            // Disconnect() ran while this flip was in progress and may have missed it.
            if (closed) Leave(seat->first, seat->second);
        }
        return reply;
    }

    auto Dispatcher::Disconnect(ConnectionId conn) -> void
    {
        Seats seats;
        {
            std::lock_guard<std::mutex> lock(conns_mx_);
            auto const it = conns_.find(conn);
            if (it == conns_.end()) return;
            seats = std::move(it->second);
            conns_.erase(it);
        }
        for (auto const& [game_id, player] : seats)
        {
            Leave(game_id, player);
            std::print("[Server] {} left game '{}'\n", player, game_id);
        }
        if (opts_.audit && !seats.empty()) opts_.audit->flush();
    }

    auto Dispatcher::Leave(std::string const& game_id, PlayerId const& player) -> void
    {
        std::shared_ptr<Session> const session = registry_.Find(ResolveGameId(game_id));
        if (!session) return;
        session->Leave(player);
        if (opts_.audit) opts_.audit->note(std::format("Leave player={}", player));
    }

    auto Dispatcher::OnLook(LookCmd const& cmd, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        std::string const id = ResolveGameId(cmd.game_id);
        std::shared_ptr<Session> const session = registry_.Find(id);
        if (!session) return no_game(id, msg_id);
        if (!util::IsValidIdentifier(cmd.player))
            return refused_board(error::Refusal{error::Rejection::InvalidPlayer}, msg_id);

        return ok_board(session->Look(cmd.player), msg_id);
    }

    auto Dispatcher::OnWatch(WatchCmd const& cmd, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        std::string const id = ResolveGameId(cmd.game_id);
        std::shared_ptr<Session> const session = registry_.Find(id);
        if (!session) return no_game(id, msg_id);
        if (!util::IsValidIdentifier(cmd.player))
            return refused_board(error::Refusal{error::Rejection::InvalidPlayer}, msg_id);

        ViewResult view = session->Watch(cmd.player, DeadlineFor(cmd.timeout_ms, opts_.watch_timeout));
        if (!view.has_value()) return refused_board(view.error(), msg_id);
        return ok_board(std::move(view.value()), msg_id);
    }

    auto Dispatcher::OnFlip(FlipCmd const& cmd, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        std::string const id = ResolveGameId(cmd.game_id);
        std::shared_ptr<Session> const session = registry_.Find(id);
        if (!session)
        {
            return BuildFlipReply(FlipReplyVal{.ok = false, .status = Status::NoGame,
                                               .message = std::format("No such game: {}", id)}, msg_id);
        }

        FlipResult const res = session->Flip(cmd.player, cmd.x, cmd.y, DeadlineFor(cmd.timeout_ms, opts_.flip_timeout));
        if (opts_.audit) opts_.audit->flip(cmd.player, Coord{cmd.x, cmd.y}, res);

        if (!res.has_value())
        {
            return BuildFlipReply(FlipReplyVal{.ok = false, .status = StatusOf(res.error().code),
                                               .message = error::describe(res.error())}, msg_id);
        }

        FlipOutcome const& o = res.value();
        return BuildFlipReply(FlipReplyVal{.ok = true, .status = Status::Ok, .card = o.card, .matched = o.matched,
                                           .score = o.score}, msg_id);
    }

    auto Dispatcher::OnNewGame(NewGameCmd const& cmd, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        std::string const id = ResolveGameId(cmd.game_id);

        GameConfig game{};
        game.width = cmd.width;
        game.height = cmd.height;
        if (cmd.seed != 0) game.seed = cmd.seed;

        SessionConfig cfg = opts_.session;
        cfg.policy = cmd.policy;

        std::shared_ptr<Session> const previous = registry_.Find(id);
        std::shared_ptr<Session> session;
        try
        {
            // Size first: the generated card set grows with the board.
            Board::ValidateDimensions(cmd.width, cmd.height);
            game.cards = cmd.cards.empty() ? generated_cards(cmd.width, cmd.height) : cmd.cards;
            session = registry_.Create(id, game, cfg);
        }
        catch (error::InvalidDimensionsError const& e)
        {
            return failed_board(Status::BadRequest, e.what(), msg_id);
        }
        catch (error::InvalidCardSetError const& e)
        {
            return failed_board(Status::BadRequest, e.what(), msg_id);
        }

        std::print("[Server] New game '{}' {}x{} seed={}\n", id, game.width, game.height, game.seed);
        if (opts_.audit)
        {
            if (previous) opts_.audit->end(*previous);
            opts_.audit->start(*session, game.seed);
        }
        return ok_board(session->Look(PlayerId{}), msg_id);
    }

    auto Dispatcher::OnReplace(ReplaceCmd const& cmd, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        std::string const id = ResolveGameId(cmd.game_id);
        std::shared_ptr<Session> const session = registry_.Find(id);
        if (!session) return no_game(id, msg_id);
        if (!util::IsValidIdentifier(cmd.player))
            return refused_board(error::Refusal{error::Rejection::InvalidPlayer}, msg_id);
        if (!util::IsValidIdentifier(cmd.from) || !util::IsValidIdentifier(cmd.to))
            return failed_board(Status::BadRequest, "Card identifiers must not be blank", msg_id);

        CardId const from = cmd.from;
        CardId const to = cmd.to;
        try
        {
            BoardView view = session->Map(cmd.player, [&](CardId const& c) { return c == from ? to : c; });
            if (opts_.audit) opts_.audit->note(std::format("Replace player={} {} -> {}", cmd.player, from, to));
            return ok_board(std::move(view), msg_id);
        }
        catch (error::InvariantViolationError const& e)
        {
            return failed_board(Status::BadRequest, e.what(), msg_id);
        }
    }

    auto Dispatcher::OnHealth(HealthCmd const&, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        return BuildHealthReply(HealthReplyVal{.ok = true, .games = static_cast<std::uint32_t>(registry_.Size())},
                                msg_id);
    }
}
