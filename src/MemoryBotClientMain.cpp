//
// MemoryBotClientMain.cpp
//
// Headless client that plays one memory game through RandomBot. Strictly
// request/reply: Look, pick a cell, Flip, repeat. When nothing is flippable
// it watches for the next change instead of polling.
//

#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <expected>
#include <format>
#include <memory>
#include <optional>
#include <print>
#include <span>
#include <string>
#include <variant>

#include <websocketpp/config/asio_no_tls_client.hpp>
#include <websocketpp/client.hpp>

#include "core/RandomBot.hpp"
#include "core/State.hpp"
#include "core/Types.hpp"
#include "net/codec.hpp"

namespace
{
    using WsClient = websocketpp::client<websocketpp::config::asio_client>;

    struct CmdLine
    {
        std::string host{"127.0.0.1"};
        std::uint16_t port{9002};
        std::string game{};
        std::string player{};
        std::uint32_t moves{0}; // 0 = until the board is cleared
        std::uint64_t seed{424242ULL};
    };

    auto ParseArgs(int argc, char** argv) -> CmdLine
    {
        CmdLine c{};
        for (int i = 1; i < argc; ++i)
        {
            std::string k = argv[i];
            auto next_uint = [&](std::uint64_t& out)
            {
                if (i + 1 >= argc) { return false; }
                char const* s = argv[++i];
                auto res = std::from_chars(s, s + std::strlen(s), out);
                return res.ec == std::errc{};
            };

            if (k == "--host" && i + 1 < argc)
            {
                c.host = argv[++i];
            }
            else if (k == "--port")
            {
                std::uint64_t v{};
                if (next_uint(v)) { c.port = static_cast<std::uint16_t>(v); }
            }
            else if (k == "--game" && i + 1 < argc)
            {
                c.game = argv[++i];
            }
            else if (k == "--player" && i + 1 < argc)
            {
                c.player = argv[++i];
            }
            else if (k == "--moves")
            {
                std::uint64_t v{};
                if (next_uint(v)) { c.moves = static_cast<std::uint32_t>(v); }
            }
            else if (k == "--seed")
            {
                std::uint64_t v{};
                if (next_uint(v)) { c.seed = v; }
            }
        }
        if (c.player.empty())
        {
            c.player = std::format("bot-{}", c.seed);
        }
        return c;
    }
}

int main(int argc, char** argv)
{
    using namespace memo::core;

    CmdLine const cfg = ParseArgs(argc, argv);
    std::string const url = std::format("ws://{}:{}", cfg.host, cfg.port);
    std::print("[Bot] Connecting to {} as {} | seed={}\n", url, cfg.player, cfg.seed);

    WsClient c;
    c.clear_access_channels(websocketpp::log::alevel::all);
    c.clear_error_channels(websocketpp::log::elevel::all);
    c.init_asio();

    websocketpp::connection_hdl server_hdl;
    RandomBot bot(cfg.seed);
    std::uint64_t next_msg_id{1};
    std::uint32_t flips{0};
    std::uint32_t score{0};

    auto send = [&](flatbuffers::DetachedBuffer const& buf)
    {
        websocketpp::lib::error_code ec;
        c.send(server_hdl, buf.data(), buf.size(), websocketpp::frame::opcode::binary, ec);
        if (ec)
        {
            std::print("[Bot] send() failed: {}\n", ec.message());
        }
    };

    auto finish = [&](std::string const& why)
    {
        std::print("[Bot] {} after {} flip(s), score {}\n", why, flips, score);
        websocketpp::lib::error_code ec;
        c.close(server_hdl, websocketpp::close::status::normal, why, ec);
    };

    auto send_look = [&]
    {
        send(net::BuildLook(net::LookCmd{cfg.game, cfg.player}, next_msg_id++));
    };

    auto on_board = [&](net::BoardReplyVal const& r)
    {
        if (!r.ok || !r.board)
        {
            // A watch that timed out just means nothing happened; look again.
            if (r.status == net::Status::TimedOut)
            {
                send_look();
                return;
            }
            finish(std::format("Server refused: {} ({})", net::to_string(r.status), r.message));
            return;
        }

        BoardView const& view = *r.board;
        if (view.finished)
        {
            finish("Board cleared");
            return;
        }
        if (cfg.moves != 0 && flips >= cfg.moves)
        {
            finish("Move budget spent");
            return;
        }

        auto const deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(800);
        std::optional<Coord> const pick = bot.Choose(view, deadline);
        if (!pick)
        {
            send(net::BuildWatch(net::WatchCmd{cfg.game, cfg.player, 0}, next_msg_id++));
            return;
        }
        send(net::BuildFlip(net::FlipCmd{cfg.game, cfg.player, pick->x, pick->y, 0}, next_msg_id++));
    };

    auto on_flip = [&](net::FlipReplyVal const& r)
    {
        ++flips;
        if (r.ok)
        {
            score = r.score;
            if (r.matched.has_value())
            {
                std::print("[Bot] {} {} (score {})\n", *r.matched ? "Matched" : "Missed", r.card.value_or("?"), score);
            }
        }
        else if (r.status == net::Status::NoGame || r.status == net::Status::Cancelled)
        {
            finish(std::format("Game gone: {}", r.message));
            return;
        }
        send_look();
    };

    c.set_message_handler([&](websocketpp::connection_hdl, WsClient::message_ptr msg)
    {
        if (msg->get_opcode() != websocketpp::frame::opcode::binary)
        {
            std::print("[Bot] Ignoring non-binary frame\n");
            return;
        }

        std::string const& pl = msg->get_payload();
        std::span<std::byte const> bytes{reinterpret_cast<std::byte const*>(pl.data()), pl.size()};

        std::expected<net::DecodedReply, net::ParseError> const reply = net::DecodeReply(bytes);
        if (!reply.has_value())
        {
            std::print("[Bot] Bad reply: {}\n", reply.error().message);
            return;
        }

        if (auto const* b = std::get_if<net::BoardReplyVal>(&reply->reply))
        {
            on_board(*b);
        }
        else if (auto const* f = std::get_if<net::FlipReplyVal>(&reply->reply))
        {
            on_flip(*f);
        }
    });

    c.set_open_handler([&](websocketpp::connection_hdl hdl)
    {
        server_hdl = hdl;
        std::print("[Bot] Connected.\n");
        send_look();
    });

    c.set_close_handler([&](websocketpp::connection_hdl)
    {
        std::print("[Bot] Connection closed.\n");
    });

    websocketpp::lib::error_code ec;
    WsClient::connection_ptr con = c.get_connection(url, ec);
    if (ec)
    {
        std::print("[Bot] get_connection error: {}\n", ec.message());
        return 2;
    }

    c.connect(con);
    c.run();

    return 0;
}
