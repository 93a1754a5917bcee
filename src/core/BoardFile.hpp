//
// BoardFile.hpp
//

#ifndef MEMORYSCRAMBLE_BOARDFILE_HPP
#define MEMORYSCRAMBLE_BOARDFILE_HPP

#include <cstdint>
#include <expected>
#include <filesystem>
#include <istream>
#include <random>
#include <string>
#include <vector>
#include "Board.hpp"
#include "Types.hpp"

namespace memo::core
{
    // Text board format:
    //   line 1       "width height"
    //   remaining    whitespace separated card identifiers, any layout
    // There must be width*height tokens and every identifier occurs exactly twice.
    struct BoardSource
    {
        std::uint32_t width{};
        std::uint32_t height{};
        std::vector<CardId> tokens{}; // as laid out in the file, row-major
    };

    struct LoadError
    {
        std::string message;
    };

    auto LoadBoard(std::istream& in) -> std::expected<BoardSource, LoadError>;
    auto LoadBoardFile(std::filesystem::path const& path) -> std::expected<BoardSource, LoadError>;

    // Distinct identifiers in first-seen order.
    auto CardSetOf(BoardSource const& src) -> std::vector<CardId>;

    // Shuffled board holding the source's cards. Throws like Board's constructor.
    auto MakeBoard(BoardSource const& src, std::mt19937_64& rng) -> Board;

    // Writes the board in file format, one grid row per line. Fails if any
    // pair has been removed, since the format has no empty-space token.
    auto FormatBoard(Board const& board) -> std::expected<std::string, LoadError>;
}

#endif //MEMORYSCRAMBLE_BOARDFILE_HPP
