#include "AuditLogger.hpp"

#include <format>
#include <string>
#include <utility>

#include "Render.hpp"

using namespace memo::core;

namespace
{

auto s_policy(ContentionPolicy const p) -> std::string_view
{
    switch (p)
    {
        case ContentionPolicy::Wait:   return "wait";
        case ContentionPolicy::Reject: return "reject";
    }
    return "?";
}

auto s_scores(ScoreTable const& scores) -> std::string
{
    std::string body;
    bool first = true;
    for (auto const& [player, points] : scores)
    {
        body += std::format("{}{}:{}", (first ? "" : ","), player, points);
        first = false;
    }
    return body;
}

auto s_flip(FlipResult const& r) -> std::string
{
    if (!r.has_value())
    {
        return std::format("Refused: {}", error::describe(r.error()));
    }
    FlipOutcome const& o = r.value();
    if (!o.matched.has_value())
    {
        return std::format("Flipped {}", o.card);
    }
    return std::format("Flipped {} -> {} (score {})", o.card, (*o.matched ? "Match" : "Mismatch"), o.score);
}

} // anonymous namespace

namespace memo::core::debug
{

AuditLogger::AuditLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::start(Session const& session, std::uint64_t seed) -> void
{
    auto const snap = session.Snapshot();
    std::lock_guard<std::mutex> lock(mtx_);
    out_ << std::format("Seed={}\n", seed);
    out_ << std::format("Board={}x{}\n", snap->board.Width(), snap->board.Height());
    out_ << std::format("Pairs={}\n", snap->board.RemainingPairs());
    out_ << std::format("Policy={}\n", s_policy(session.Config().policy));
    out_.flush();
}

auto AuditLogger::flip(PlayerId const& player, Coord const at, FlipResult const& result) -> void
{
    std::lock_guard<std::mutex> lock(mtx_);
    out_ << std::format("Flip player={} at=({},{}) {}\n", player, at.x, at.y, s_flip(result));
}

auto AuditLogger::note(std::string_view text) -> void
{
    std::lock_guard<std::mutex> lock(mtx_);
    out_ << text << '\n';
}

auto AuditLogger::end(Session const& session) -> void
{
    auto const snap = session.Snapshot();
    std::lock_guard<std::mutex> lock(mtx_);
    out_ << std::format("Scores=[{}]\n", s_scores(snap->scores));
    out_ << Render(snap->board);
    out_.flush();
}

auto AuditLogger::flush() -> void
{
    std::lock_guard<std::mutex> lock(mtx_);
    out_.flush();
}

}
