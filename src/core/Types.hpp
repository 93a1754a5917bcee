//
// Types.hpp
//

#ifndef MEMORYSCRAMBLE_TYPES_HPP
#define MEMORYSCRAMBLE_TYPES_HPP

#define MEM_ENABLE_TEST_HOOKS true

#include <cstdint>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace memo::core::constants
{
    inline constexpr std::string_view DefaultGameId = "default";
    inline constexpr std::uint32_t MaxPending = 2;
    inline constexpr std::uint32_t MaxSide = 1024;
}

namespace memo::core
{
    // Card identity is an opaque token; only equality matters.
    using CardId = std::string;
    using PlayerId = std::string;
    using ScoreTable = std::map<PlayerId, std::uint32_t>;

    struct Coord
    {
        int x{};
        int y{};
    };
    inline auto operator==(Coord const& a, Coord const& b) -> bool { return a.x == b.x && a.y == b.y; }

    // One grid cell. Treated as a value: mutators replace a cell wholesale.
    struct Space
    {
        std::optional<CardId> card{};
        bool face_up{false};
        std::optional<PlayerId> controller{};

        [[nodiscard]]
        auto Empty() const noexcept -> bool { return !card.has_value(); }
    };
    inline auto operator==(Space const& a, Space const& b) -> bool
    {
        return a.card == b.card && a.face_up == b.face_up && a.controller == b.controller;
    }

    enum class ContentionPolicy : std::uint8_t
    {
        Wait = 0, // suspend until the contested card is released, then re-evaluate
        Reject    // fail immediately with Contested
    };

    struct SessionConfig
    {
        ContentionPolicy policy{ContentionPolicy::Wait};
        bool verbose{false};
    };

    struct GameConfig
    {
        std::uint32_t width{4};
        std::uint32_t height{4};
        // Distinct identifiers; each is placed on the board twice.
        std::vector<CardId> cards{};
        std::uint64_t seed{std::random_device{}()};
    };
}

#endif //MEMORYSCRAMBLE_TYPES_HPP
