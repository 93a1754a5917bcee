#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <future>
#include <thread>

#include "TestBoards.hpp"
#include "../core/Registry.hpp"
#include "../core/Util.hpp"

using namespace memo::core;
using namespace std::chrono_literals;

TEST(Registry, CreateFindRemove)
{
    GameRegistry reg;
    EXPECT_EQ(reg.Size(), 0u);
    EXPECT_EQ(reg.Find("default"), nullptr);

    std::shared_ptr<Session> const a = reg.Create("default", memo::test::Layout(2, 2, {"A", "A", "B", "B"}));
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(reg.Find("default"), a);
    EXPECT_EQ(reg.Size(), 1u);

    GameConfig cfg{};
    cfg.width = 2;
    cfg.height = 3;
    cfg.cards = util::NumberedCards(3);
    cfg.seed = 5;
    std::shared_ptr<Session> const b = reg.Create("other", cfg, SessionConfig{.policy = ContentionPolicy::Reject});
    EXPECT_EQ(b->Config().policy, ContentionPolicy::Reject);
    EXPECT_EQ(b->Look("x").width, 2);
    EXPECT_EQ(b->Look("x").height, 3);
    EXPECT_EQ(reg.Ids(), (std::vector<GameId>{"default", "other"}));

    EXPECT_TRUE(reg.Remove("other"));
    EXPECT_FALSE(reg.Remove("other"));
    EXPECT_EQ(reg.Size(), 1u);
}

TEST(Registry, SameSeedSameGame)
{
    GameRegistry reg;
    GameConfig cfg{};
    cfg.cards = util::DefaultEmojiCards();
    cfg.seed = 77;
    auto const a = reg.Create("a", cfg);
    auto const b = reg.Create("b", cfg);
    EXPECT_TRUE(std::ranges::equal(a->Snapshot()->board.Cells(), b->Snapshot()->board.Cells()));
}

TEST(Registry, BadConfigThrowsAndKeepsOldGame)
{
    GameRegistry reg;
    auto const a = reg.Create("g", memo::test::Layout(2, 2, {"A", "A", "B", "B"}));

    GameConfig bad{};
    bad.width = 3;
    bad.height = 3;
    bad.cards = util::NumberedCards(4);
    EXPECT_THROW((void)reg.Create("g", bad), error::InvalidDimensionsError);
    EXPECT_EQ(reg.Find("g"), a);
}

TEST(Registry, ReplacingAGameCancelsItsWaiters)
{
    GameRegistry reg;
    auto const old = reg.Create("g", memo::test::Layout(2, 2, {"A", "A", "B", "B"}));
    ASSERT_TRUE(old->Flip("alice", 0, 0).has_value());

    std::future<FlipResult> bob = std::async(std::launch::async, [old] { return old->Flip("bob", 0, 0); });
    std::this_thread::sleep_for(50ms);

    auto const fresh = reg.Create("g", memo::test::Layout(2, 2, {"A", "B", "A", "B"}));
    FlipResult const r = bob.get();
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error::Rejection::Cancelled);

    EXPECT_EQ(reg.Find("g"), fresh);
    EXPECT_TRUE(fresh->Flip("bob", 0, 0).has_value());
}
