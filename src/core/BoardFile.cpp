//
// BoardFile.cpp
//
#include "BoardFile.hpp"

#include <charconv>
#include <format>
#include <fstream>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

#include "Util.hpp"

namespace memo::core
{
    static auto ParseDimension(std::string const& tok, std::uint32_t& out) -> bool
    {
        char const* first = tok.data();
        char const* last = tok.data() + tok.size();
        auto const res = std::from_chars(first, last, out);
        return res.ec == std::errc{} && res.ptr == last;
    }

    auto LoadBoard(std::istream& in) -> std::expected<BoardSource, LoadError>
    {
        std::string header;
        if (!std::getline(in, header))
            return std::unexpected(LoadError{"File must have at least 1 line with dimensions"});

        std::istringstream dims{header};
        std::vector<std::string> dim_tokens;
        for (std::string t; dims >> t;) dim_tokens.push_back(std::move(t));
        if (dim_tokens.size() != 2)
            return std::unexpected(LoadError{"First line must be 'width height' (space-separated integers)"});

        BoardSource src{};
        if (!ParseDimension(dim_tokens[0], src.width) || !ParseDimension(dim_tokens[1], src.height))
            return std::unexpected(LoadError{
                std::format("Width and height must be integers, got: '{}' '{}'", dim_tokens[0], dim_tokens[1])});
        if (src.width == 0 || src.height == 0)
            return std::unexpected(LoadError{
                std::format("Dimensions must be positive, got width={}, height={}", src.width, src.height)});

        for (std::string tok; in >> tok;)
        {
            src.tokens.push_back(std::move(tok));
        }

        std::size_t const expected = static_cast<std::size_t>(src.width) * src.height;
        if (src.tokens.size() != expected)
            return std::unexpected(LoadError{
                std::format("Expected {} cards total, got {}. (Board is {}x{})",
                            expected, src.tokens.size(), src.width, src.height)});

        std::unordered_map<CardId, std::size_t> counts;
        for (CardId const& c : src.tokens) ++counts[c];
        for (CardId const& c : src.tokens)
        {
            if (counts.at(c) != 2)
                return std::unexpected(LoadError{
                    std::format("Card '{}' appears {} times, must appear exactly 2 times", c, counts.at(c))});
        }
        return src;
    }

    auto LoadBoardFile(std::filesystem::path const& path) -> std::expected<BoardSource, LoadError>
    {
        std::ifstream in{path};
        if (!in)
            return std::unexpected(LoadError{std::format("Board file not found: {}", path.string())});
        return LoadBoard(in);
    }

    auto CardSetOf(BoardSource const& src) -> std::vector<CardId>
    {
        std::vector<CardId> out;
        std::unordered_set<CardId> seen;
        for (CardId const& c : src.tokens)
        {
            if (seen.insert(c).second) out.push_back(c);
        }
        return out;
    }

    auto MakeBoard(BoardSource const& src, std::mt19937_64& rng) -> Board
    {
        std::vector<CardId> const cards = CardSetOf(src);
        return Board{src.width, src.height, cards, rng};
    }

    auto FormatBoard(Board const& board) -> std::expected<std::string, LoadError>
    {
        if (board.RemovedCount() != 0)
            return std::unexpected(LoadError{
                std::format("Board has {} removed spaces and cannot be written", board.RemovedCount())});

        std::string out = std::format("{} {}\n", board.Width(), board.Height());
        for (int y{}; y < board.Height(); ++y)
        {
            for (int x{}; x < board.Width(); ++x)
            {
                out += (x ? " " : "");
                out += *board.Get(x, y).card;
            }
            out += '\n';
        }
        return out;
    }
}
