//
// Board.cpp
//
#include "Board.hpp"

#include <algorithm>
#include <format>
#include <limits>
#include <unordered_set>
#include <utility>

#include "Exception.hpp"
#include "Util.hpp"

namespace memo::core
{
    auto Board::ValidateDimensions(std::uint32_t width, std::uint32_t height) -> void
    {
        using error::Code;
        constexpr std::uint32_t max_side = constants::MaxSide;
        if (width == 0 || height == 0)
            MEM_THROW(Code::InvalidDimensions, std::format("Dimensions must be positive, got {}x{}", width, height));
        if (width > max_side || height > max_side)
            MEM_THROW(Code::InvalidDimensions, std::format("Dimensions {}x{} exceed {}", width, height, max_side));
        if ((static_cast<std::uint64_t>(width) * height) % 2 != 0)
            MEM_THROW(Code::InvalidDimensions, std::format("A {}x{} board has an odd number of spaces", width, height));
    }

    static auto ValidateCards(std::uint32_t width, std::uint32_t height, std::span<CardId const> cards) -> void
    {
        using error::Code;
        std::size_t const spaces = static_cast<std::size_t>(width) * height;
        if (cards.size() * 2 != spaces)
            MEM_THROW(Code::InvalidCardSet,
                      std::format("Must have exactly {} spaces but got {} cards", spaces, cards.size() * 2));

        std::unordered_set<std::string_view> seen;
        seen.reserve(cards.size());
        for (CardId const& c : cards)
        {
            if (!util::IsValidIdentifier(c))
                MEM_THROW(Code::InvalidCardSet, "Card identifiers must be non-empty and not whitespace only");
            if (!seen.insert(c).second)
                MEM_THROW(Code::InvalidCardSet, std::format("Card '{}' listed more than once", c));
        }
    }

    Board::Board(std::uint32_t width, std::uint32_t height,
                 std::span<CardId const> cards, std::mt19937_64& rng) :
        width_{0},
        height_{0}
    {
        ValidateDimensions(width, height);
        ValidateCards(width, height, cards);
        width_ = static_cast<int>(width);
        height_ = static_cast<int>(height);

        std::vector<CardId> deck;
        deck.reserve(cards.size() * 2);
        for (CardId const& c : cards)
        {
            deck.push_back(c);
            deck.push_back(c);
        }
        std::ranges::shuffle(deck, rng);

        cells_.reserve(deck.size());
        for (CardId& c : deck)
        {
            cells_.push_back(Space{.card = std::move(c), .face_up = false, .controller = std::nullopt});
        }
        CheckRep();
    }

    auto Board::InBounds(int x, int y) const noexcept -> bool
    {
        return x >= 0 && x < width_ && y >= 0 && y < height_;
    }

    auto Board::Index(int x, int y) const -> std::size_t
    {
        if (!InBounds(x, y))
            MEM_THROW(error::Code::OutOfBounds,
                      std::format("Position ({}, {}) out of bounds ({}x{})", x, y, width_, height_));
        return static_cast<std::size_t>(y) * static_cast<std::size_t>(width_) + static_cast<std::size_t>(x);
    }

    auto Board::CheckedAt(int x, int y) -> Space&
    {
        Space& sp = cells_[Index(x, y)];
        if (sp.Empty())
            MEM_THROW(error::Code::NoCard, std::format("No card at ({}, {})", x, y));
        return sp;
    }

    auto Board::Get(int x, int y) const -> Space
    {
        return cells_[Index(x, y)];
    }

    auto Board::Flip(int x, int y) -> void
    {
        Space const& old = CheckedAt(x, y);
        bool const up = !old.face_up;
        Space next{.card = old.card, .face_up = up, .controller = up ? old.controller : std::nullopt};
        cells_[Index(x, y)] = std::move(next);
        CheckRep();
    }

    auto Board::SetControl(int x, int y, PlayerId const& player) -> void
    {
        if (!util::IsValidIdentifier(player))
            MEM_THROW(error::Code::InvalidPlayer, "Player id must be non-empty");

        Space const& old = CheckedAt(x, y);
        if (!old.face_up)
            MEM_THROW(error::Code::NotFaceUp, std::format("Card at ({}, {}) must be face-up to control", x, y));

        cells_[Index(x, y)] = Space{.card = old.card, .face_up = true, .controller = player};
        CheckRep();
    }

    auto Board::ClearControl(int x, int y) -> void
    {
        Space const& old = CheckedAt(x, y);
        cells_[Index(x, y)] = Space{.card = old.card, .face_up = old.face_up, .controller = std::nullopt};
        CheckRep();
    }

    auto Board::Remove(int x, int y) -> void
    {
        Space const& old = CheckedAt(x, y);
        if (!old.face_up)
            MEM_THROW(error::Code::NotFaceUp, std::format("Card at ({}, {}) must be face-up to remove", x, y));

        cells_[Index(x, y)] = Space{};
    }

    auto Board::Relabel(std::function<CardId(CardId const&)> const& fn) -> void
    {
        // Map each distinct value once so both halves of a pair stay identical.
        std::unordered_map<CardId, CardId> mapping;
        for (Space const& sp : cells_)
        {
            if (sp.card && !mapping.contains(*sp.card))
                mapping.emplace(*sp.card, fn(*sp.card));
        }

        std::vector<Space> next = cells_;
        for (Space& sp : next)
        {
            if (sp.card) sp.card = mapping.at(*sp.card);
        }

        std::swap(cells_, next);
        try
        {
            CheckRep();
        }
        catch (error::InvariantViolationError const&)
        {
            std::swap(cells_, next);
            throw;
        }
    }

    auto Board::RemainingPairs() const -> std::size_t
    {
        return static_cast<std::size_t>(std::ranges::count_if(cells_, [](Space const& sp) { return !sp.Empty(); })) / 2;
    }

    auto Board::RemovedCount() const -> std::size_t
    {
        return static_cast<std::size_t>(std::ranges::count_if(cells_, [](Space const& sp) { return sp.Empty(); }));
    }

    auto Board::CheckRep() const -> void
    {
        using error::Code;
        if (width_ <= 0 || height_ <= 0 ||
            cells_.size() != static_cast<std::size_t>(width_) * static_cast<std::size_t>(height_))
            MEM_THROW(Code::InvariantViolation,
                      std::format("Grid holds {} spaces, expected {}x{}", cells_.size(), width_, height_));

        for (std::size_t i{}; i < cells_.size(); ++i)
        {
            Space const& sp = cells_[i];
            int const x = static_cast<int>(i % static_cast<std::size_t>(width_));
            int const y = static_cast<int>(i / static_cast<std::size_t>(width_));

            if (sp.Empty())
            {
                if (sp.face_up || sp.controller)
                    MEM_THROW(Code::InvariantViolation,
                              std::format("Removed space at ({}, {}) must be face-down and uncontrolled", x, y));
                continue;
            }
            if (!util::IsValidIdentifier(*sp.card))
                MEM_THROW(Code::InvariantViolation, std::format("Card at ({}, {}) has a blank identifier", x, y));
            if (sp.controller)
            {
                if (!sp.face_up)
                    MEM_THROW(Code::InvariantViolation, std::format("Space ({}, {}) controlled but face-down", x, y));
                if (!util::IsValidIdentifier(*sp.controller))
                    MEM_THROW(Code::InvariantViolation, std::format("Space ({}, {}) has a blank controller", x, y));
            }
        }

        for (auto const& [card, count] : util::CountCards(cells_))
        {
            if (count != 2)
                MEM_THROW(Code::InvariantViolation,
                          std::format("Card '{}' appears {} times on board, must appear exactly 2 times", card, count));
        }
    }
}
