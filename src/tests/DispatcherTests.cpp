#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <sstream>
#include <thread>
#include <variant>

#include "TestBoards.hpp"
#include "../core/Registry.hpp"
#include "../debug/AuditLogger.hpp"
#include "../net/Dispatcher.hpp"
#include "../net/codec.hpp"

using namespace memo::core;
using namespace memo::core::net;
using namespace std::chrono_literals;

namespace
{
class DispatcherTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        registry.Create("default", memo::test::Layout(2, 2, {"A", "A", "B", "B"}));
    }

    // Full wire trip: encode request, dispatch, decode reply.
    auto Send(flatbuffers::DetachedBuffer const& req) -> DecodedReply
    {
        flatbuffers::DetachedBuffer const out = dispatcher.HandleFrame(AsBytes(req));
        auto rep = DecodeReply(AsBytes(out));
        EXPECT_TRUE(rep.has_value());
        return rep.value_or(DecodedReply{});
    }

    auto BoardOf(flatbuffers::DetachedBuffer const& req) -> BoardReplyVal
    {
        DecodedReply const r = Send(req);
        EXPECT_TRUE(std::holds_alternative<BoardReplyVal>(r.reply));
        return std::holds_alternative<BoardReplyVal>(r.reply) ? std::get<BoardReplyVal>(r.reply) : BoardReplyVal{};
    }

    auto Flip(std::string player, int x, int y, std::uint32_t timeout_ms = 0) -> FlipReplyVal
    {
        DecodedReply const r = Send(BuildFlip(FlipCmd{"", std::move(player), x, y, timeout_ms}, ++msg_id));
        EXPECT_TRUE(std::holds_alternative<FlipReplyVal>(r.reply));
        return std::holds_alternative<FlipReplyVal>(r.reply) ? std::get<FlipReplyVal>(r.reply) : FlipReplyVal{};
    }

    // Same trip, but through a connection.
    auto FlipOn(ConnectionId conn, std::string player, int x, int y, std::uint32_t timeout_ms = 0) -> FlipReplyVal
    {
        flatbuffers::DetachedBuffer const req = BuildFlip(FlipCmd{"", std::move(player), x, y, timeout_ms}, ++msg_id);
        auto decoded = DecodeRequest(AsBytes(req));
        EXPECT_TRUE(decoded.has_value());
        if (!decoded.has_value()) return FlipReplyVal{};
        flatbuffers::DetachedBuffer const out = dispatcher.Handle(conn, decoded.value());
        auto rep = DecodeReply(AsBytes(out));
        EXPECT_TRUE(rep.has_value() && std::holds_alternative<FlipReplyVal>(rep->reply));
        return rep.has_value() && std::holds_alternative<FlipReplyVal>(rep->reply)
            ? std::get<FlipReplyVal>(rep->reply) : FlipReplyVal{};
    }

    GameRegistry registry;
    Dispatcher dispatcher{registry, DispatcherOptions{.flip_timeout = 2000ms, .watch_timeout = 2000ms}};
    std::uint64_t msg_id{0};
};
}

TEST_F(DispatcherTest, LookReturnsProjectedBoard)
{
    BoardReplyVal const r = BoardOf(BuildLook(LookCmd{"", "alice"}, 5));
    EXPECT_TRUE(r.ok);
    EXPECT_EQ(r.status, Status::Ok);
    ASSERT_TRUE(r.board.has_value());
    EXPECT_EQ(r.board->cells.size(), 4u);
    EXPECT_FALSE(r.board->finished);
}

TEST_F(DispatcherTest, ReplyEchoesMessageId)
{
    DecodedReply const r = Send(BuildLook(LookCmd{"default", "alice"}, 12345));
    EXPECT_EQ(r.msg_id, 12345u);
}

TEST_F(DispatcherTest, FlipThenMatch)
{
    FlipReplyVal const a = Flip("alice", 0, 0);
    EXPECT_TRUE(a.ok);
    EXPECT_EQ(a.card, "A");
    EXPECT_FALSE(a.matched.has_value());

    FlipReplyVal const b = Flip("alice", 1, 0);
    EXPECT_TRUE(b.ok);
    EXPECT_EQ(b.matched, true);
    EXPECT_EQ(b.score, 1u);

    BoardReplyVal const v = BoardOf(BuildLook(LookCmd{"", "bob"}, 1));
    ASSERT_TRUE(v.board.has_value());
    EXPECT_EQ(v.board->scores.at("alice"), 1u);
    EXPECT_EQ(v.board->At(0, 0).state, CellState::None);
}

TEST_F(DispatcherTest, RefusalsBecomeStatuses)
{
    FlipReplyVal const oob = Flip("alice", 7, 7);
    EXPECT_FALSE(oob.ok);
    EXPECT_EQ(oob.status, Status::OutOfBounds);
    EXPECT_FALSE(oob.message.empty());

    FlipReplyVal const anon = Flip("", 0, 0);
    EXPECT_EQ(anon.status, Status::InvalidPlayer);

    ASSERT_TRUE(Flip("alice", 0, 0).ok);
    EXPECT_EQ(Flip("alice", 0, 0).status, Status::AlreadyHeld);
    EXPECT_EQ(Flip("bob", 0, 0, 30).status, Status::TimedOut);
}

TEST_F(DispatcherTest, UnknownGame)
{
    BoardReplyVal const r = BoardOf(BuildLook(LookCmd{"nope", "alice"}, 1));
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.status, Status::NoGame);

    DecodedReply const f = Send(BuildFlip(FlipCmd{"nope", "alice", 0, 0, 0}, 2));
    ASSERT_TRUE(std::holds_alternative<FlipReplyVal>(f.reply));
    EXPECT_EQ(std::get<FlipReplyVal>(f.reply).status, Status::NoGame);
}

TEST_F(DispatcherTest, WatchWakesOnFlip)
{
    std::future<BoardReplyVal> w = std::async(std::launch::async, [this]
    {
        flatbuffers::DetachedBuffer const out =
            dispatcher.HandleFrame(AsBytes(BuildWatch(WatchCmd{"", "bob", 2000}, 99)));
        auto rep = DecodeReply(AsBytes(out));
        return rep.has_value() ? std::get<BoardReplyVal>(rep->reply) : BoardReplyVal{};
    });
    std::this_thread::sleep_for(50ms);
    ASSERT_TRUE(Flip("alice", 1, 1).ok);

    BoardReplyVal const r = w.get();
    EXPECT_TRUE(r.ok);
    ASSERT_TRUE(r.board.has_value());
    EXPECT_EQ(r.board->At(1, 1).card, "B");
}

TEST_F(DispatcherTest, WatchTimesOut)
{
    BoardReplyVal const r = BoardOf(BuildWatch(WatchCmd{"", "bob", 20}, 1));
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.status, Status::TimedOut);
}

TEST_F(DispatcherTest, NewGameReplacesBoard)
{
    NewGameCmd cmd{};
    cmd.width = 4;
    cmd.height = 4;
    cmd.seed = 11;
    cmd.policy = ContentionPolicy::Reject;
    BoardReplyVal const r = BoardOf(BuildNewGame(cmd, 1));
    ASSERT_TRUE(r.ok) << r.message;
    ASSERT_TRUE(r.board.has_value());
    EXPECT_EQ(r.board->width, 4);
    EXPECT_EQ(r.board->version, 0u);
    EXPECT_EQ(registry.Find("default")->Config().policy, ContentionPolicy::Reject);

    ASSERT_TRUE(Flip("alice", 0, 0).ok);
    EXPECT_EQ(Flip("bob", 0, 0).status, Status::Contested);
}

TEST_F(DispatcherTest, NewGameWithBadShapeIsBadRequest)
{
    NewGameCmd cmd{};
    cmd.game_id = "odd";
    cmd.width = 3;
    cmd.height = 3;
    BoardReplyVal const r = BoardOf(BuildNewGame(cmd, 1));
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.status, Status::BadRequest);
    EXPECT_EQ(registry.Find("odd"), nullptr);

    cmd.width = 2;
    cmd.height = 2;
    cmd.cards = {"X", "X"};
    EXPECT_EQ(BoardOf(BuildNewGame(cmd, 2)).status, Status::BadRequest);
}

TEST_F(DispatcherTest, NewGameTooLargeIsRefusedUpFront)
{
    NewGameCmd cmd{};
    cmd.width = 60000;
    cmd.height = 60000;
    auto const started = std::chrono::steady_clock::now();
    BoardReplyVal const r = BoardOf(BuildNewGame(cmd, 1));
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.status, Status::BadRequest);
    EXPECT_NE(r.message.find("exceed"), std::string::npos) << r.message;
    EXPECT_LT(std::chrono::steady_clock::now() - started, 1s);

    // The running game is untouched.
    EXPECT_EQ(registry.Find("default")->Snapshot()->board.Width(), 2);
}

TEST_F(DispatcherTest, NewGameClosesPreviousTranscript)
{
    namespace fs = std::filesystem;
    fs::create_directories("_artifacts");
    std::string const path = "_artifacts/dispatcher_newgame.log";
    {
        memo::core::debug::AuditLogger audit(path);
        Dispatcher d{registry, DispatcherOptions{.audit = &audit}};
        ASSERT_TRUE(Flip("alice", 0, 0).ok);

        NewGameCmd cmd{};
        cmd.width = 4;
        cmd.height = 4;
        cmd.seed = 5;
        flatbuffers::DetachedBuffer const out = d.HandleFrame(AsBytes(BuildNewGame(cmd, 1)));
        ASSERT_TRUE(DecodeReply(AsBytes(out)).has_value());
    }

    std::ifstream in{path};
    std::stringstream text;
    text << in.rdbuf();
    std::string const log = text.str();
    // Footer for the replaced 2x2 game, then the header of the new one.
    std::size_t const footer = log.find("Scores=[alice:0]");
    ASSERT_NE(footer, std::string::npos) << log;
    EXPECT_NE(log.find("Board=4x4", footer), std::string::npos) << log;
}

TEST_F(DispatcherTest, ReplaceRelabels)
{
    ASSERT_TRUE(Flip("alice", 0, 0).ok);
    BoardReplyVal const r = BoardOf(BuildReplace(ReplaceCmd{"", "alice", "A", "Q"}, 1));
    ASSERT_TRUE(r.ok) << r.message;
    EXPECT_EQ(r.board->At(0, 0).card, "Q");

    BoardReplyVal const clash = BoardOf(BuildReplace(ReplaceCmd{"", "alice", "Q", "B"}, 2));
    EXPECT_FALSE(clash.ok);
    EXPECT_EQ(clash.status, Status::BadRequest);

    BoardReplyVal const blank = BoardOf(BuildReplace(ReplaceCmd{"", "alice", "Q", " "}, 3));
    EXPECT_EQ(blank.status, Status::BadRequest);
}

TEST_F(DispatcherTest, HealthCountsGames)
{
    registry.Create("second", memo::test::Layout(2, 2, {"A", "B", "A", "B"}));
    DecodedReply const r = Send(BuildHealth(1));
    ASSERT_TRUE(std::holds_alternative<HealthReplyVal>(r.reply));
    EXPECT_EQ(std::get<HealthReplyVal>(r.reply).games, 2u);
}

TEST_F(DispatcherTest, LeaveReleasesCards)
{
    ASSERT_TRUE(Flip("alice", 0, 0).ok);
    dispatcher.Leave("", "alice");
    BoardReplyVal const v = BoardOf(BuildLook(LookCmd{"", "bob"}, 1));
    ASSERT_TRUE(v.board.has_value());
    EXPECT_EQ(v.board->At(0, 0).state, CellState::Down);
    EXPECT_TRUE(Flip("bob", 0, 0).ok);
}

TEST_F(DispatcherTest, MalformedFrameIsBadRequest)
{
    std::vector<std::byte> junk(16, std::byte{0xFF});
    flatbuffers::DetachedBuffer const out = dispatcher.HandleFrame(junk);
    auto const rep = DecodeReply(AsBytes(out));
    ASSERT_TRUE(rep.has_value());
    ASSERT_TRUE(std::holds_alternative<BoardReplyVal>(rep->reply));
    EXPECT_EQ(std::get<BoardReplyVal>(rep->reply).status, Status::BadRequest);
}

TEST_F(DispatcherTest, FlipAfterDisconnectIsRefused)
{
    dispatcher.Connect(1);
    ASSERT_TRUE(FlipOn(1, "bob", 0, 0).ok);

    dispatcher.Disconnect(1);
    BoardReplyVal v = BoardOf(BuildLook(LookCmd{"", "alice"}, 1));
    ASSERT_TRUE(v.board.has_value());
    EXPECT_EQ(v.board->At(0, 0).state, CellState::Down);

    // A frame still queued for the closed connection must not take the card again.
    FlipReplyVal const late = FlipOn(1, "bob", 0, 0);
    EXPECT_FALSE(late.ok);
    EXPECT_EQ(late.status, Status::Cancelled);

    v = BoardOf(BuildLook(LookCmd{"", "alice"}, 2));
    ASSERT_TRUE(v.board.has_value());
    EXPECT_EQ(v.board->At(0, 0).state, CellState::Down);
    EXPECT_TRUE(Flip("alice", 0, 0, 100).ok);
}

TEST_F(DispatcherTest, DisconnectCancelsBlockedFlip)
{
    dispatcher.Connect(1);
    dispatcher.Connect(2);
    ASSERT_TRUE(FlipOn(2, "alice", 0, 0).ok);

    std::future<FlipReplyVal> blocked = std::async(std::launch::async, [this]
    {
        return FlipOn(1, "bob", 0, 0, 2000);
    });
    std::this_thread::sleep_for(50ms);
    dispatcher.Disconnect(1);

    FlipReplyVal const r = blocked.get();
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.status, Status::Cancelled);

    // alice's connection is unaffected.
    BoardReplyVal const v = BoardOf(BuildLook(LookCmd{"", "alice"}, 1));
    ASSERT_TRUE(v.board.has_value());
    EXPECT_EQ(v.board->At(0, 0).state, CellState::Mine);
    EXPECT_TRUE(FlipOn(2, "alice", 1, 0).ok);
}

TEST(DispatcherSeats, SeatOfResolvesGameAndSkipsBlankPlayers)
{
    std::optional<Seat> const flip = SeatOf(Request{FlipCmd{"", "bob", 0, 0, 0}});
    ASSERT_TRUE(flip.has_value());
    EXPECT_EQ(flip->first, "default");
    EXPECT_EQ(flip->second, "bob");

    EXPECT_FALSE(SeatOf(Request{LookCmd{"g", " "}}).has_value());
    EXPECT_FALSE(SeatOf(Request{HealthCmd{}}).has_value());
}
