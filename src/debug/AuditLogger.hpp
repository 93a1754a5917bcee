//
// AuditLogger.hpp
//

#ifndef MEMORYSCRAMBLE_AUDITLOGGER_HPP
#define MEMORYSCRAMBLE_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>
#include <string_view>

#include "../core/Session.hpp"
#include "../core/Types.hpp"

namespace memo::core::debug
{
    // Plain-text transcript of one game. Safe to call from several request threads.
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        // Header (seed, dimensions, contention policy)
        auto start(Session const& session, std::uint64_t seed) -> void;

        // One line per flip attempt, successful or refused
        auto flip(PlayerId const& player, Coord at, FlipResult const& result) -> void;

        // Free-form line (leave, relabel, new game)
        auto note(std::string_view text) -> void;

        // Footer: final scores and board
        auto end(Session const& session) -> void;

        auto is_open() const -> bool { return out_.is_open(); }

        // Manual flush; flip() and note() only buffer.
        auto flush() -> void;

    private:
        std::mutex mtx_;
        std::ofstream out_;
    };
}

#endif //MEMORYSCRAMBLE_AUDITLOGGER_HPP
