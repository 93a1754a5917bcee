//
// Util.hpp
//

#ifndef MEMORYSCRAMBLE_UTIL_HPP
#define MEMORYSCRAMBLE_UTIL_HPP

#include <algorithm>
#include <cctype>
#include <format>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include "Types.hpp"

namespace memo::core::util
{
    inline auto IsBlank(std::string_view s) -> bool
    {
        return std::ranges::all_of(s, [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; });
    }

    // A usable identifier is non-empty and not whitespace only.
    inline auto IsValidIdentifier(std::string_view s) -> bool
    {
        return !s.empty() && !IsBlank(s);
    }

    inline auto CountCards(std::span<Space const> cells) -> std::unordered_map<CardId, std::size_t>
    {
        std::unordered_map<CardId, std::size_t> counts;
        for (Space const& sp : cells)
        {
            if (sp.card) ++counts[*sp.card];
        }
        return counts;
    }

    inline auto DefaultEmojiCards() -> std::vector<CardId>
    {
        return {"\xF0\x9F\xA6\x84", "\xF0\x9F\x8C\x88", "\xF0\x9F\x8E\xA8", "\xE2\xAD\x90",
                "\xF0\x9F\x8E\xAA", "\xF0\x9F\x8E\xAD", "\xF0\x9F\x8E\xAC", "\xF0\x9F\x8E\xB8"};
    }

    inline auto NumberedCards(std::size_t n) -> std::vector<CardId>
    {
        std::vector<CardId> out;
        out.reserve(n);
        for (std::size_t i{}; i < n; ++i)
        {
            out.push_back(std::format("Card{}", i));
        }
        return out;
    }
}

#endif //MEMORYSCRAMBLE_UTIL_HPP
