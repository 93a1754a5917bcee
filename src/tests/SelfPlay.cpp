#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <format>
#include <fstream>
#include <print>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "../core/Exception.hpp"
#include "../core/RandomBot.hpp"
#include "../core/Registry.hpp"
#include "../core/Util.hpp"
#include "../debug/AuditLogger.hpp"
#include "../debug/Invariants.hpp"
#include "../debug/Render.hpp"

using namespace memo::core;
using namespace std::chrono_literals;

namespace
{
// Plays one seat until the board is cleared or the move cap is hit.
auto play_seat(Session& s, debug::AuditLogger& log, PlayerId const& me, std::uint64_t seed) -> void
{
    RandomBot bot(seed);
    for (int move = 0; move < 2000; ++move)
    {
        BoardView const view = s.Look(me);
        if (view.finished) return;

        auto const deadline = std::chrono::steady_clock::now() + 50ms;
        std::optional<Coord> const pick = bot.Choose(view, deadline);
        if (!pick)
        {
            // Everything left is face-up in other hands; wait for them.
            (void)s.Watch(me, deadline);
            continue;
        }
        FlipResult const r = s.Flip(me, pick->x, pick->y, deadline);
        log.flip(me, *pick, r);
    }
}

auto run_game(std::uint64_t seed, int seats, ContentionPolicy policy) -> std::filesystem::path
{
    namespace fs = std::filesystem;
    fs::create_directories("_artifacts");
    fs::path const path = std::format("_artifacts/memory_{}_{}p.log", seed, seats);

    GameRegistry reg;
    GameConfig cfg{};
    cfg.width = 6;
    cfg.height = 4;
    cfg.cards = util::NumberedCards(12);
    cfg.seed = seed;
    std::shared_ptr<Session> const s = reg.Create("default", cfg, SessionConfig{.policy = policy});

    debug::AuditLogger log(path.string());
    EXPECT_TRUE(log.is_open());
    log.start(*s, seed);

    std::vector<std::thread> threads;
    for (int p = 0; p < seats; ++p)
    {
        threads.emplace_back([&, p] { play_seat(*s, log, std::format("bot{}", p), seed + static_cast<std::uint64_t>(p)); });
    }
    for (std::thread& t : threads) t.join();

    debug::CheckInvariants(*s);
    log.end(*s);

    BoardView const v = s->Look("judge");
    EXPECT_TRUE(v.finished) << debug::Render(s->Snapshot()->board);
    std::uint32_t total = 0;
    for (auto const& [who, points] : v.scores) total += points;
    EXPECT_EQ(total, 12u);
    return path;
}
}

TEST(SelfPlay, TwoBotsClearTheBoard)
{
    try
    {
        for (std::uint64_t seed : {111ull, 222ull, 333ull})
        {
            std::filesystem::path const path = run_game(seed, 2, ContentionPolicy::Wait);
            ASSERT_TRUE(std::filesystem::exists(path));
            ASSERT_GT(std::filesystem::file_size(path), 0u);
        }
    }
    catch (OmegaException<error::Code> const& e)
    {
        std::print("{}", e.to_str());
        FAIL() << e.what();
    }
}

TEST(SelfPlay, CrowdUnderRejectPolicy)
{
    try
    {
        std::filesystem::path const path = run_game(444, 5, ContentionPolicy::Reject);

        std::ifstream in{path};
        std::stringstream text;
        text << in.rdbuf();
        EXPECT_NE(text.str().find("Seed=444"), std::string::npos);
        EXPECT_NE(text.str().find("Policy=reject"), std::string::npos);
        EXPECT_NE(text.str().find("Scores=["), std::string::npos);
    }
    catch (OmegaException<error::Code> const& e)
    {
        std::print("{}", e.to_str());
        FAIL() << e.what();
    }
}

TEST(AuditLog, FlushWritesBufferedLines)
{
    std::filesystem::create_directories("_artifacts");
    std::string const path = "_artifacts/audit_flush.log";

    GameRegistry reg;
    GameConfig cfg{};
    cfg.width = 2;
    cfg.height = 2;
    cfg.cards = {"A", "B"};
    cfg.seed = 9;
    std::shared_ptr<Session> const s = reg.Create("default", cfg);

    debug::AuditLogger log(path);
    log.start(*s, cfg.seed);
    log.flip("alice", Coord{0, 0}, s->Flip("alice", 0, 0));
    log.note("Leave player=alice");
    log.flush();

    // Read while the logger is still open.
    std::ifstream in{path};
    std::stringstream text;
    text << in.rdbuf();
    EXPECT_NE(text.str().find("Flip player=alice at=(0,0) Flipped"), std::string::npos) << text.str();
    EXPECT_NE(text.str().find("Leave player=alice"), std::string::npos) << text.str();
}
