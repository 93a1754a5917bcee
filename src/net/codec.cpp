//
// codec.cpp
//
#include "codec.hpp"

#include <utility>
#include <vector>

namespace fb = memo::gen::net;

namespace memo::core::net
{
    auto StatusOf(error::Rejection r) noexcept -> Status
    {
        using error::Rejection;
        switch (r)
        {
        case Rejection::OutOfBounds: return Status::OutOfBounds;
        case Rejection::NoCard: return Status::NoCard;
        case Rejection::Contested: return Status::Contested;
        case Rejection::AlreadyHeld: return Status::AlreadyHeld;
        case Rejection::InvalidPlayer: return Status::InvalidPlayer;
        case Rejection::TimedOut: return Status::TimedOut;
        case Rejection::Cancelled: return Status::Cancelled;
        }
        return Status::Internal;
    }

    auto to_string(Status s) noexcept -> std::string_view
    {
        switch (s)
        {
        case Status::Ok: return "Ok";
        case Status::OutOfBounds: return "OutOfBounds";
        case Status::NoCard: return "NoCard";
        case Status::Contested: return "Contested";
        case Status::AlreadyHeld: return "AlreadyHeld";
        case Status::InvalidPlayer: return "InvalidPlayer";
        case Status::TimedOut: return "TimedOut";
        case Status::Cancelled: return "Cancelled";
        case Status::NoGame: return "NoGame";
        case Status::BadRequest: return "BadRequest";
        case Status::Internal: return "Internal";
        }
        return "Unknown";
    }

    auto ToFbStatus(Status s) noexcept -> fb::Status
    {
        switch (s)
        {
        case Status::Ok: return fb::Status::Ok;
        case Status::OutOfBounds: return fb::Status::OutOfBounds;
        case Status::NoCard: return fb::Status::NoCard;
        case Status::Contested: return fb::Status::Contested;
        case Status::AlreadyHeld: return fb::Status::AlreadyHeld;
        case Status::InvalidPlayer: return fb::Status::InvalidPlayer;
        case Status::TimedOut: return fb::Status::TimedOut;
        case Status::Cancelled: return fb::Status::Cancelled;
        case Status::NoGame: return fb::Status::NoGame;
        case Status::BadRequest: return fb::Status::BadRequest;
        case Status::Internal: return fb::Status::Internal;
        }
        return fb::Status::Internal;
    }

    auto FromFbStatus(fb::Status s) noexcept -> Status
    {
        switch (s)
        {
        case fb::Status::Ok: return Status::Ok;
        case fb::Status::OutOfBounds: return Status::OutOfBounds;
        case fb::Status::NoCard: return Status::NoCard;
        case fb::Status::Contested: return Status::Contested;
        case fb::Status::AlreadyHeld: return Status::AlreadyHeld;
        case fb::Status::InvalidPlayer: return Status::InvalidPlayer;
        case fb::Status::TimedOut: return Status::TimedOut;
        case fb::Status::Cancelled: return Status::Cancelled;
        case fb::Status::NoGame: return Status::NoGame;
        case fb::Status::BadRequest: return Status::BadRequest;
        case fb::Status::Internal: return Status::Internal;
        }
        return Status::Internal;
    }

    auto ToFbCellState(CellState s) noexcept -> fb::CellState
    {
        switch (s)
        {
        case CellState::None: return fb::CellState::None;
        case CellState::Down: return fb::CellState::Down;
        case CellState::Up: return fb::CellState::Up;
        case CellState::Mine: return fb::CellState::Mine;
        }
        return fb::CellState::Down;
    }

    auto FromFbCellState(fb::CellState s) noexcept -> CellState
    {
        switch (s)
        {
        case fb::CellState::None: return CellState::None;
        case fb::CellState::Down: return CellState::Down;
        case fb::CellState::Up: return CellState::Up;
        case fb::CellState::Mine: return CellState::Mine;
        }
        return CellState::Down;
    }

    auto ToFbPolicy(ContentionPolicy p) noexcept -> fb::Policy
    {
        return p == ContentionPolicy::Reject ? fb::Policy::Reject : fb::Policy::Wait;
    }

    auto FromFbPolicy(fb::Policy p) noexcept -> ContentionPolicy
    {
        return p == fb::Policy::Reject ? ContentionPolicy::Reject : ContentionPolicy::Wait;
    }
}

namespace
{
    // Verify enum layouts (one value per enum is sufficient to catch drift)
    static_assert((int)memo::core::net::Status::Ok == (int)fb::Status::Ok);
    static_assert((int)memo::core::CellState::None == (int)fb::CellState::None);
    static_assert((int)memo::core::ContentionPolicy::Wait == (int)fb::Policy::Wait);

    inline auto str_or_empty(flatbuffers::String const* s) -> std::string
    {
        return s ? s->str() : std::string{};
    }

    inline auto opt_str(flatbuffers::String const* s) -> std::optional<std::string>
    {
        return s ? std::optional<std::string>{s->str()} : std::nullopt;
    }

    inline auto finish(flatbuffers::FlatBufferBuilder& fbb, std::uint64_t msg_id,
                       fb::Message type, flatbuffers::Offset<void> body) -> flatbuffers::DetachedBuffer
    {
        auto const env = fb::CreateEnvelope(fbb, msg_id, type, body);
        fbb.Finish(env);
        return fbb.Release();
    }

    auto verified_envelope(std::span<std::byte const> bytes)
        -> std::expected<fb::Envelope const*, memo::core::net::ParseError>
    {
        using memo::core::net::ParseError;
        if (bytes.size() < sizeof(flatbuffers::uoffset_t))
            return std::unexpected(ParseError{"buffer too small"});

        auto const* data = reinterpret_cast<std::uint8_t const*>(bytes.data());
        flatbuffers::Verifier verifier(data, bytes.size());
        if (!fb::VerifyEnvelopeBuffer(verifier))
            return std::unexpected(ParseError{"verification failed"});

        auto const* env = fb::GetEnvelope(data);
        if (!env || !env->message())
            return std::unexpected(ParseError{"empty envelope"});
        return env;
    }
} // anonymous

namespace memo::core::net
{
    static auto ToFbBoardView(flatbuffers::FlatBufferBuilder& fbb, BoardView const& v)
        -> flatbuffers::Offset<fb::BoardView>
    {
        std::vector<flatbuffers::Offset<fb::Cell>> cells;
        cells.reserve(v.cells.size());
        for (CellView const& c : v.cells)
        {
            flatbuffers::Offset<flatbuffers::String> card{};
            if (c.card) card = fbb.CreateString(*c.card);
            flatbuffers::Offset<flatbuffers::String> ctrl{};
            if (c.controller) ctrl = fbb.CreateString(*c.controller);
            cells.push_back(fb::CreateCell(fbb, card, c.face_up, ctrl, ToFbCellState(c.state)));
        }
        auto const cell_vec = fbb.CreateVector(cells);

        std::vector<flatbuffers::Offset<fb::Score>> scores;
        scores.reserve(v.scores.size());
        for (auto const& [player, points] : v.scores)
        {
            scores.push_back(fb::CreateScore(fbb, fbb.CreateString(player), points));
        }
        auto const score_vec = fbb.CreateVectorOfSortedTables(&scores);

        return fb::CreateBoardView(fbb,
                                   /*width*/ static_cast<std::uint32_t>(v.width),
                                   /*height*/ static_cast<std::uint32_t>(v.height),
                                   /*cells*/ cell_vec,
                                   /*scores*/ score_vec,
                                   /*version*/ v.version,
                                   /*finished*/ v.finished);
    }

    static auto FromFbBoardView(fb::BoardView const* bv) -> std::expected<BoardView, ParseError>
    {
        BoardView out{};
        out.width = static_cast<int>(bv->width());
        out.height = static_cast<int>(bv->height());
        out.version = bv->version();
        out.finished = bv->finished();

        std::size_t const expected = static_cast<std::size_t>(bv->width()) * bv->height();
        std::size_t const got = bv->cells() ? bv->cells()->size() : 0;
        if (got != expected)
            return std::unexpected(ParseError{"cell count does not match dimensions"});

        out.cells.reserve(got);
        if (auto const* cells = bv->cells())
        {
            for (auto const* c : *cells)
            {
                out.cells.push_back(CellView{
                    .card = opt_str(c->card()),
                    .face_up = c->face_up(),
                    .controller = opt_str(c->controlled_by()),
                    .state = FromFbCellState(c->state())
                });
            }
        }
        if (auto const* scores = bv->scores())
        {
            for (auto const* s : *scores)
            {
                out.scores[str_or_empty(s->player())] = s->points();
            }
        }
        return out;
    }

    // ---------- Builders (client -> server) ----------

    auto BuildLook(LookCmd const& cmd, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const body = fb::CreateLookRequest(fbb, fbb.CreateString(cmd.game_id), fbb.CreateString(cmd.player));
        return finish(fbb, msg_id, fb::Message::LookRequest, body.Union());
    }

    auto BuildWatch(WatchCmd const& cmd, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const body = fb::CreateWatchRequest(fbb, fbb.CreateString(cmd.game_id), fbb.CreateString(cmd.player),
                                                 cmd.timeout_ms);
        return finish(fbb, msg_id, fb::Message::WatchRequest, body.Union());
    }

    auto BuildFlip(FlipCmd const& cmd, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const body = fb::CreateFlipRequest(fbb, fbb.CreateString(cmd.game_id), fbb.CreateString(cmd.player),
                                                cmd.x, cmd.y, cmd.timeout_ms);
        return finish(fbb, msg_id, fb::Message::FlipRequest, body.Union());
    }

    auto BuildNewGame(NewGameCmd const& cmd, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const id = fbb.CreateString(cmd.game_id);
        auto const cards = fbb.CreateVectorOfStrings(cmd.cards);
        auto const body = fb::CreateNewGameRequest(fbb, id, cmd.width, cmd.height, cards, cmd.seed,
                                                   ToFbPolicy(cmd.policy));
        return finish(fbb, msg_id, fb::Message::NewGameRequest, body.Union());
    }

    auto BuildReplace(ReplaceCmd const& cmd, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const body = fb::CreateReplaceRequest(fbb, fbb.CreateString(cmd.game_id), fbb.CreateString(cmd.player),
                                                   fbb.CreateString(cmd.from), fbb.CreateString(cmd.to));
        return finish(fbb, msg_id, fb::Message::ReplaceRequest, body.Union());
    }

    auto BuildHealth(std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const body = fb::CreateHealthRequest(fbb);
        return finish(fbb, msg_id, fb::Message::HealthRequest, body.Union());
    }

    // ---------- Builders (server -> client) ----------

    auto BuildBoardReply(BoardReplyVal const& r, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        flatbuffers::Offset<fb::BoardView> board{};
        if (r.board) board = ToFbBoardView(fbb, *r.board);
        auto const msg = fbb.CreateString(r.message);
        auto const body = fb::CreateBoardReply(fbb, r.ok, ToFbStatus(r.status), msg, board);
        return finish(fbb, msg_id, fb::Message::BoardReply, body.Union());
    }

    auto BuildFlipReply(FlipReplyVal const& r, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const msg = fbb.CreateString(r.message);
        flatbuffers::Offset<flatbuffers::String> card{};
        if (r.card) card = fbb.CreateString(*r.card);

        fb::FlipReplyBuilder b(fbb);
        b.add_ok(r.ok);
        b.add_status(ToFbStatus(r.status));
        b.add_message(msg);
        if (r.card) b.add_card(card);
        if (r.matched) b.add_matched(*r.matched);
        b.add_score(r.score);
        auto const body = b.Finish();
        return finish(fbb, msg_id, fb::Message::FlipReply, body.Union());
    }

    auto BuildHealthReply(HealthReplyVal const& r, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const body = fb::CreateHealthReply(fbb, r.ok, r.games);
        return finish(fbb, msg_id, fb::Message::HealthReply, body.Union());
    }

    // ---------- Decode ----------

    auto DecodeRequest(std::span<std::byte const> bytes) -> std::expected<DecodedRequest, ParseError>
    {
        auto const env = verified_envelope(bytes);
        if (!env.has_value())
            return std::unexpected(env.error());

        fb::Envelope const* e = env.value();
        DecodedRequest out{};
        out.msg_id = e->msg_id();

        switch (e->message_type())
        {
        case fb::Message::LookRequest:
        {
            auto const* m = e->message_as_LookRequest();
            out.request = LookCmd{str_or_empty(m->game_id()), str_or_empty(m->player())};
            return out;
        }
        case fb::Message::WatchRequest:
        {
            auto const* m = e->message_as_WatchRequest();
            out.request = WatchCmd{str_or_empty(m->game_id()), str_or_empty(m->player()), m->timeout_ms()};
            return out;
        }
        case fb::Message::FlipRequest:
        {
            auto const* m = e->message_as_FlipRequest();
            out.request = FlipCmd{str_or_empty(m->game_id()), str_or_empty(m->player()), m->x(), m->y(),
                                  m->timeout_ms()};
            return out;
        }
        case fb::Message::NewGameRequest:
        {
            auto const* m = e->message_as_NewGameRequest();
            NewGameCmd cmd{};
            cmd.game_id = str_or_empty(m->game_id());
            cmd.width = m->width();
            cmd.height = m->height();
            if (auto const* cards = m->cards())
            {
                cmd.cards.reserve(cards->size());
                for (auto const* c : *cards) cmd.cards.push_back(c->str());
            }
            cmd.seed = m->seed();
            cmd.policy = FromFbPolicy(m->policy());
            out.request = std::move(cmd);
            return out;
        }
        case fb::Message::ReplaceRequest:
        {
            auto const* m = e->message_as_ReplaceRequest();
            out.request = ReplaceCmd{str_or_empty(m->game_id()), str_or_empty(m->player()),
                                     str_or_empty(m->from()), str_or_empty(m->to())};
            return out;
        }
        case fb::Message::HealthRequest:
            out.request = HealthCmd{};
            return out;

        default:
            return std::unexpected(ParseError{"not a request message"});
        }
    }

    auto DecodeReply(std::span<std::byte const> bytes) -> std::expected<DecodedReply, ParseError>
    {
        auto const env = verified_envelope(bytes);
        if (!env.has_value())
            return std::unexpected(env.error());

        fb::Envelope const* e = env.value();
        DecodedReply out{};
        out.msg_id = e->msg_id();

        switch (e->message_type())
        {
        case fb::Message::BoardReply:
        {
            auto const* m = e->message_as_BoardReply();
            BoardReplyVal r{};
            r.ok = m->ok();
            r.status = FromFbStatus(m->status());
            r.message = str_or_empty(m->message());
            if (m->board())
            {
                auto view = FromFbBoardView(m->board());
                if (!view.has_value())
                    return std::unexpected(view.error());
                r.board = std::move(view.value());
            }
            out.reply = std::move(r);
            return out;
        }
        case fb::Message::FlipReply:
        {
            auto const* m = e->message_as_FlipReply();
            FlipReplyVal r{};
            r.ok = m->ok();
            r.status = FromFbStatus(m->status());
            r.message = str_or_empty(m->message());
            r.card = opt_str(m->card());
            if (m->matched().has_value()) r.matched = m->matched().value();
            r.score = m->score();
            out.reply = std::move(r);
            return out;
        }
        case fb::Message::HealthReply:
        {
            auto const* m = e->message_as_HealthReply();
            out.reply = HealthReplyVal{m->ok(), m->games()};
            return out;
        }
        default:
            return std::unexpected(ParseError{"not a reply message"});
        }
    }
} // namespace memo::core::net
