//
// MemoryServerMain.cpp
//
// Memory game server: WebSocket++ (no TLS) over standalone Asio.
// Every binary frame is one request Envelope. Each connection has one worker
// thread that handles its frames in order, so a blocked flip or watch never
// stalls the network loop.
//

#include <atomic>
#include <charconv>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <deque>
#include <expected>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <print>
#include <random>
#include <span>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "core/BoardFile.hpp"
#include "core/Exception.hpp"
#include "core/Registry.hpp"
#include "core/Util.hpp"
#include "debug/AuditLogger.hpp"
#include "net/Dispatcher.hpp"
#include "net/codec.hpp"

namespace
{
    using WsServer = websocketpp::server<websocketpp::config::asio>;
    using Hdl      = websocketpp::connection_hdl;

    struct ServerConfig
    {
        std::uint16_t port{9002};
        std::optional<std::string> board_path{};
        std::uint32_t width{4};
        std::uint32_t height{4};
        std::optional<std::uint64_t> seed{};
        memo::core::ContentionPolicy policy{memo::core::ContentionPolicy::Wait};
        std::chrono::milliseconds flip_timeout{std::chrono::seconds(10)};
        std::chrono::milliseconds watch_timeout{std::chrono::seconds(30)};
        std::optional<std::string> audit_path{};
        bool verbose{false};
    };

    auto ParseArgs(int argc, char** argv) -> ServerConfig
    {
        ServerConfig cfg{};

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            auto next_uint = [&](std::uint64_t& out)
            {
                if (i + 1 >= argc) { return false; }
                char const* s = argv[++i];
                auto res = std::from_chars(s, s + std::strlen(s), out);
                return res.ec == std::errc{};
            };
            auto next_str = [&](std::optional<std::string>& out)
            {
                if (i + 1 < argc) { out = argv[++i]; }
            };

            if (arg == "--port")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.port = static_cast<std::uint16_t>(v); }
            }
            else if (arg == "--board")
            {
                next_str(cfg.board_path);
            }
            else if (arg == "--width")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.width = static_cast<std::uint32_t>(v); }
            }
            else if (arg == "--height")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.height = static_cast<std::uint32_t>(v); }
            }
            else if (arg == "--seed")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.seed = v; }
            }
            else if (arg == "--policy")
            {
                std::optional<std::string> v;
                next_str(v);
                if (v == "reject") { cfg.policy = memo::core::ContentionPolicy::Reject; }
                else if (v == "wait") { cfg.policy = memo::core::ContentionPolicy::Wait; }
                else { std::print("[Server] Unknown policy '{}', using wait\n", v.value_or("")); }
            }
            else if (arg == "--flip-timeout-ms")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.flip_timeout = std::chrono::milliseconds(v); }
            }
            else if (arg == "--watch-timeout-ms")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.watch_timeout = std::chrono::milliseconds(v); }
            }
            else if (arg == "--audit")
            {
                next_str(cfg.audit_path);
            }
            else if (arg == "--verbose")
            {
                cfg.verbose = true;
            }
            else
            {
                std::print("[Server] Ignoring unknown argument {}\n", arg);
            }
        }
        return cfg;
    }

    // Board for the default game: from --board if given, otherwise a generated one.
    auto MakeInitialBoard(ServerConfig const& sc, std::uint64_t seed) -> std::optional<memo::core::Board>
    {
        using namespace memo::core;

        std::mt19937_64 rng{seed};
        try
        {
            if (sc.board_path)
            {
                std::expected<BoardSource, LoadError> const src = LoadBoardFile(*sc.board_path);
                if (!src.has_value())
                {
                    std::print("[Server] {}\n", src.error().message);
                    return std::nullopt;
                }
                return MakeBoard(src.value(), rng);
            }

            Board::ValidateDimensions(sc.width, sc.height);
            std::size_t const pairs = static_cast<std::size_t>(sc.width) * sc.height / 2;
            std::vector<CardId> cards = util::DefaultEmojiCards();
            if (cards.size() != pairs) cards = util::NumberedCards(pairs);
            return Board{sc.width, sc.height, cards, rng};
        }
        catch (OmegaException<error::Code> const& e)
        {
            std::print("[Server] Cannot build board: {}\n", e.what());
            return std::nullopt;
        }
    }

    // Frames a client may have queued before it is disconnected.
    constexpr std::size_t MaxQueuedFrames = 64;

    struct Connection
    {
        memo::core::net::ConnectionId id{};
        Hdl hdl;
        std::mutex mx;
        std::condition_variable cv;
        std::deque<std::string> frames;
        bool closed{false};
    };

    auto CloseConnection(Connection& conn) -> void
    {
        {
            std::lock_guard<std::mutex> lock(conn.mx);
            conn.closed = true;
            conn.frames.clear();
        }
        conn.cv.notify_all();
    }
}

int main(int argc, char** argv)
{
    using namespace memo;
    using namespace memo::core;

    ServerConfig const sc = ParseArgs(argc, argv);
    std::uint64_t const seed = sc.seed.value_or(std::random_device{}());

    std::optional<Board> board = MakeInitialBoard(sc, seed);
    if (!board)
    {
        return 1;
    }

    std::unique_ptr<debug::AuditLogger> audit;
    if (sc.audit_path)
    {
        audit = std::make_unique<debug::AuditLogger>(*sc.audit_path);
        if (!audit->is_open())
        {
            std::print("[Server] Cannot open audit log {}\n", *sc.audit_path);
            return 1;
        }
    }

    SessionConfig const session_cfg{.policy = sc.policy, .verbose = sc.verbose};
    GameRegistry registry;
    std::shared_ptr<Session> const game = registry.Create(std::string{constants::DefaultGameId}, std::move(*board),
                                                          session_cfg);
    if (audit) audit->start(*game, seed);

    net::Dispatcher dispatcher(registry, net::DispatcherOptions{
        .flip_timeout = sc.flip_timeout,
        .watch_timeout = sc.watch_timeout,
        .session = session_cfg,
        .audit = audit.get()
    });

    std::print("[Server] Listening on port {} | {}x{} board | seed={} | policy={}\n",
               sc.port, game->Snapshot()->board.Width(), game->Snapshot()->board.Height(), seed,
               sc.policy == ContentionPolicy::Wait ? "wait" : "reject");

    auto ep = std::make_shared<WsServer>();
    ep->clear_access_channels(websocketpp::log::alevel::all);
    ep->set_access_channels(websocketpp::log::alevel::connect | websocketpp::log::alevel::disconnect);
    ep->clear_error_channels(websocketpp::log::elevel::all);

    ep->init_asio();
    ep->set_reuse_addr(true);

    std::mutex conns_mx;
    std::map<void*, std::shared_ptr<Connection>> conns;
    net::ConnectionId next_id{0};
    std::atomic<std::size_t> workers{0};

    // Handles one connection's frames in arrival order until it closes.
    auto work = [&](std::shared_ptr<Connection> conn)
    {
        for (;;)
        {
            std::string payload;
            {
                std::unique_lock<std::mutex> lk(conn->mx);
                conn->cv.wait(lk, [&] { return conn->closed || !conn->frames.empty(); });
                if (conn->closed) break;
                payload = std::move(conn->frames.front());
                conn->frames.pop_front();
            }

            std::span<std::byte const> bytes{reinterpret_cast<std::byte const*>(payload.data()), payload.size()};
            std::expected<net::DecodedRequest, net::ParseError> const req = net::DecodeRequest(bytes);
            flatbuffers::DetachedBuffer const reply = req.has_value()
                ? dispatcher.Handle(conn->id, req.value())
                : dispatcher.HandleFrame(bytes);

            websocketpp::lib::error_code ec;
            ep->send(conn->hdl, reply.data(), reply.size(), websocketpp::frame::opcode::binary, ec);
            if (ec && sc.verbose)
            {
                std::print("[Server] send() error: {}\n", ec.message());
            }
        }
        --workers;
    };

    ep->set_open_handler([&](Hdl hdl)
    {
        auto conn = std::make_shared<Connection>();
        conn->hdl = hdl;
        std::size_t open{};
        {
            std::lock_guard<std::mutex> lock(conns_mx);
            conn->id = ++next_id;
            conns[ep->get_con_from_hdl(hdl).get()] = conn;
            open = conns.size();
        }
        dispatcher.Connect(conn->id);
        ++workers;
        std::thread(work, conn).detach();
        if (sc.verbose) std::print("[Server] Client connected ({} open)\n", open);
    });

    ep->set_close_handler([&](Hdl hdl)
    {
        std::shared_ptr<Connection> conn;
        {
            std::lock_guard<std::mutex> lock(conns_mx);
            auto it = conns.find(ep->get_con_from_hdl(hdl).get());
            if (it == conns.end()) return;
            conn = std::move(it->second);
            conns.erase(it);
        }
        CloseConnection(*conn);
        dispatcher.Disconnect(conn->id);
    });

    ep->set_message_handler([&](Hdl hdl, WsServer::message_ptr msg)
    {
        if (msg->get_opcode() != websocketpp::frame::opcode::binary)
        {
            std::print("[Server] Ignoring non-binary frame from client\n");
            return;
        }

        std::shared_ptr<Connection> conn;
        {
            std::lock_guard<std::mutex> lock(conns_mx);
            auto it = conns.find(ep->get_con_from_hdl(hdl).get());
            if (it == conns.end()) return;
            conn = it->second;
        }

        bool overflow = false;
        {
            std::lock_guard<std::mutex> lock(conn->mx);
            if (conn->frames.size() >= MaxQueuedFrames) overflow = true;
            else conn->frames.push_back(msg->get_payload());
        }
        if (overflow)
        {
            std::print("[Server] Connection {} has {} frames queued, closing it\n", conn->id, MaxQueuedFrames);
            websocketpp::lib::error_code ec;
            ep->close(hdl, websocketpp::close::status::policy_violation, "too many queued requests", ec);
            return;
        }
        conn->cv.notify_one();
    });

    asio::signal_set signals(ep->get_io_service(), SIGINT, SIGTERM);
    signals.async_wait([&](asio::error_code const&, int sig)
    {
        std::print("[Server] Signal {}, shutting down\n", sig);
        websocketpp::lib::error_code ec;
        ep->stop_listening(ec);
        // Wakes every blocked flip/watch so the workers drain.
        for (std::string const& id : registry.Ids())
        {
            if (std::shared_ptr<Session> s = registry.Find(id)) s->Shutdown();
        }
        ep->stop();
    });

    ep->listen(sc.port);
    ep->start_accept();
    ep->run();

    std::map<void*, std::shared_ptr<Connection>> remaining;
    {
        std::lock_guard<std::mutex> lock(conns_mx);
        remaining.swap(conns);
    }
    for (auto const& [key, conn] : remaining)
    {
        CloseConnection(*conn);
        dispatcher.Disconnect(conn->id);
    }
    while (workers.load() != 0)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    if (audit)
    {
        // NewGame requests may have replaced the startup session.
        for (std::string const& id : registry.Ids())
        {
            if (std::shared_ptr<Session> const s = registry.Find(id)) audit->end(*s);
        }
    }
    std::print("[Server] Stopped\n");
    return 0;
}
