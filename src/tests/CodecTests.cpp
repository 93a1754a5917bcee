#include <gtest/gtest.h>

#include <cstddef>
#include <variant>
#include <vector>

#include "TestBoards.hpp"
#include "../core/Session.hpp"
#include "../net/codec.hpp"

using namespace memo::core;
using namespace memo::core::net;

TEST(Codec, FlipRequestSurvivesTheWire)
{
    auto const buf = BuildFlip(FlipCmd{.game_id = "g1", .player = "alice", .x = 3, .y = -1, .timeout_ms = 250}, 42);
    auto const req = DecodeRequest(AsBytes(buf));
    ASSERT_TRUE(req.has_value()) << req.error().message;
    EXPECT_EQ(req->msg_id, 42u);

    auto const* flip = std::get_if<FlipCmd>(&req->request);
    ASSERT_NE(flip, nullptr);
    EXPECT_EQ(flip->game_id, "g1");
    EXPECT_EQ(flip->player, "alice");
    EXPECT_EQ(flip->x, 3);
    EXPECT_EQ(flip->y, -1);
    EXPECT_EQ(flip->timeout_ms, 250u);
}

TEST(Codec, NewGameCarriesCardsAndPolicy)
{
    NewGameCmd cmd{};
    cmd.game_id = "big";
    cmd.width = 4;
    cmd.height = 2;
    cmd.cards = {"w", "x", "y", "z"};
    cmd.seed = 9;
    cmd.policy = ContentionPolicy::Reject;

    auto const buf = BuildNewGame(cmd, 1);
    auto const req = DecodeRequest(AsBytes(buf));
    ASSERT_TRUE(req.has_value());
    auto const* ng = std::get_if<NewGameCmd>(&req->request);
    ASSERT_NE(ng, nullptr);
    EXPECT_EQ(ng->cards, cmd.cards);
    EXPECT_EQ(ng->seed, 9u);
    EXPECT_EQ(ng->policy, ContentionPolicy::Reject);
}

TEST(Codec, BoardReplyHidesNothingItWasNotGiven)
{
    Session s{memo::test::Layout(2, 2, {"A", "A", "B", "B"})};
    ASSERT_TRUE(s.Flip("alice", 0, 0).has_value());
    ASSERT_TRUE(s.Flip("bob", 1, 1).has_value());

    BoardView const view = s.Look("alice");
    auto const buf = BuildBoardReply(BoardReplyVal{.ok = true, .status = Status::Ok, .board = view}, 7);
    auto const rep = DecodeReply(AsBytes(buf));
    ASSERT_TRUE(rep.has_value()) << rep.error().message;

    auto const* br = std::get_if<BoardReplyVal>(&rep->reply);
    ASSERT_NE(br, nullptr);
    ASSERT_TRUE(br->board.has_value());
    BoardView const& got = *br->board;
    EXPECT_EQ(got.width, 2);
    EXPECT_EQ(got.height, 2);
    EXPECT_EQ(got.version, view.version);
    EXPECT_EQ(got.scores, view.scores);

    EXPECT_EQ(got.At(0, 0).state, CellState::Mine);
    EXPECT_EQ(got.At(0, 0).card, "A");
    EXPECT_EQ(got.At(1, 1).state, CellState::Up);
    EXPECT_EQ(got.At(1, 1).controller, "bob");
    EXPECT_EQ(got.At(1, 0).state, CellState::Down);
    EXPECT_FALSE(got.At(1, 0).card.has_value());
    EXPECT_FALSE(got.At(1, 0).controller.has_value());
}

TEST(Codec, FlipReplyMatchedIsOptional)
{
    auto const first = BuildFlipReply(FlipReplyVal{.ok = true, .status = Status::Ok, .card = "A", .score = 0}, 1);
    auto const a = DecodeReply(AsBytes(first));
    ASSERT_TRUE(a.has_value());
    auto const* fa = std::get_if<FlipReplyVal>(&a->reply);
    ASSERT_NE(fa, nullptr);
    EXPECT_EQ(fa->card, "A");
    EXPECT_FALSE(fa->matched.has_value());

    auto const miss = BuildFlipReply(FlipReplyVal{.ok = true, .status = Status::Ok, .card = "B", .matched = false}, 2);
    auto const b = DecodeReply(AsBytes(miss));
    ASSERT_TRUE(b.has_value());
    auto const* fb = std::get_if<FlipReplyVal>(&b->reply);
    ASSERT_NE(fb, nullptr);
    ASSERT_TRUE(fb->matched.has_value());
    EXPECT_FALSE(*fb->matched);
}

TEST(Codec, RefusalStatusesMapOneToOne)
{
    using error::Rejection;
    EXPECT_EQ(StatusOf(Rejection::OutOfBounds), Status::OutOfBounds);
    EXPECT_EQ(StatusOf(Rejection::NoCard), Status::NoCard);
    EXPECT_EQ(StatusOf(Rejection::Contested), Status::Contested);
    EXPECT_EQ(StatusOf(Rejection::AlreadyHeld), Status::AlreadyHeld);
    EXPECT_EQ(StatusOf(Rejection::InvalidPlayer), Status::InvalidPlayer);
    EXPECT_EQ(StatusOf(Rejection::TimedOut), Status::TimedOut);
    EXPECT_EQ(StatusOf(Rejection::Cancelled), Status::Cancelled);
    EXPECT_EQ(to_string(Status::NoGame), "NoGame");
}

TEST(Codec, GarbageIsRejected)
{
    std::vector<std::byte> junk(64, std::byte{0xAB});
    EXPECT_FALSE(DecodeRequest(junk).has_value());
    EXPECT_FALSE(DecodeReply(junk).has_value());
    EXPECT_FALSE(DecodeRequest(std::span<std::byte const>{}).has_value());
}

TEST(Codec, RequestAndReplyAreNotInterchangeable)
{
    auto const look = BuildLook(LookCmd{.game_id = "", .player = "alice"}, 3);
    EXPECT_FALSE(DecodeReply(AsBytes(look)).has_value());

    auto const health = BuildHealthReply(HealthReplyVal{.ok = true, .games = 2}, 4);
    EXPECT_FALSE(DecodeRequest(AsBytes(health)).has_value());
    auto const rep = DecodeReply(AsBytes(health));
    ASSERT_TRUE(rep.has_value());
    EXPECT_EQ(std::get<HealthReplyVal>(rep->reply).games, 2u);
}
