//
// Render.hpp
//

#ifndef MEMORYSCRAMBLE_RENDER_HPP
#define MEMORYSCRAMBLE_RENDER_HPP

#include <cstddef>
#include <format>
#include <string>
#include <string_view>

#include "../core/Board.hpp"

namespace memo::core::debug
{
    // First n code points of a UTF-8 string.
    inline auto Utf8Prefix(std::string_view s, std::size_t n) -> std::string
    {
        std::size_t end = 0;
        for (std::size_t points = 0; end < s.size(); ++end)
        {
            bool const lead = (static_cast<unsigned char>(s[end]) & 0xC0) != 0x80;
            if (lead && points++ == n) break;
        }
        return std::string{s.substr(0, end)};
    }

    // One line per row:  [???] hidden, [  A ] face-up, [  A*] controlled, [   ] removed.
    // Long identifiers are cut to their first three code points.
    inline auto Render(Board const& b) -> std::string
    {
        std::string out = std::format("Board({}x{}):\n", b.Width(), b.Height());
        for (int y{}; y < b.Height(); ++y)
        {
            out += "  ";
            for (int x{}; x < b.Width(); ++x)
            {
                Space const sp = b.Get(x, y);
                if (sp.Empty())
                {
                    out += "[   ] ";
                }
                else if (!sp.face_up)
                {
                    out += "[???] ";
                }
                else
                {
                    std::string const shown = Utf8Prefix(*sp.card, 3);
                    out += std::format("[{:>3}{}] ", shown, sp.controller ? "*" : " ");
                }
            }
            out += '\n';
        }
        return out;
    }
}

#endif //MEMORYSCRAMBLE_RENDER_HPP
