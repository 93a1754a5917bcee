//
// Exception.hpp
//

#ifndef MEMORYSCRAMBLE_EXCEPTION_HPP
#define MEMORYSCRAMBLE_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <expected>
#include <format>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include "Types.hpp"

namespace memo::core::error
{
    enum class Code : unsigned
    {
        Unknown, // unknown error
        InvalidDimensions, // board construction: non-positive or mismatched size
        InvalidCardSet, // board construction: duplicate/blank identifiers or wrong count
        OutOfBounds, // coordinates outside the grid
        NoCard, // operation needs a card but the cell is empty
        NotFaceUp, // operation needs a face-up card
        InvalidPlayer, // empty player identifier
        InvariantViolation, // board rep check failed after a mutation
        Serialization, // FlatBuffers verification/build errors
        Assertion // internal assertion failed
    };

    struct UnknownError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct InvalidDimensionsError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct InvalidCardSetError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct OutOfBoundsError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct NoCardError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct NotFaceUpError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct InvalidPlayerError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct InvariantViolationError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct SerializationError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg,
                     std::source_location const& loc = std::source_location::current()) -> void
    {
        switch (c)
        {
        case Code::Unknown: throw UnknownError(std::move(msg), c, loc);
        case Code::InvalidDimensions: throw InvalidDimensionsError(std::move(msg), c, loc);
        case Code::InvalidCardSet: throw InvalidCardSetError(std::move(msg), c, loc);
        case Code::OutOfBounds: throw OutOfBoundsError(std::move(msg), c, loc);
        case Code::NoCard: throw NoCardError(std::move(msg), c, loc);
        case Code::NotFaceUp: throw NotFaceUpError(std::move(msg), c, loc);
        case Code::InvalidPlayer: throw InvalidPlayerError(std::move(msg), c, loc);
        case Code::InvariantViolation: throw InvariantViolationError(std::move(msg), c, loc);
        case Code::Serialization: throw SerializationError(std::move(msg), c, loc);
        case Code::Assertion: throw AssertionError(std::move(msg), c, loc);
        }
        throw std::runtime_error(msg);
    }

#define MEM_THROW(code_enum, msg) ::memo::core::error::fail((code_enum), (msg))
#define MEM_ASSERT(cond, msg) do { if(!(cond)) ::memo::core::error::fail(::memo::core::error::Code::Assertion, (msg)); } while(0)

    // Why a flip or watch did not go through. These are ordinary outcomes, not exceptions.
    enum class Rejection : std::uint8_t
    {
        OutOfBounds,
        NoCard,
        Contested,
        AlreadyHeld,
        InvalidPlayer,
        TimedOut,
        Cancelled
    };

    struct Refusal
    {
        Rejection code{};
        std::optional<Coord> at{};
        std::optional<PlayerId> holder{}; // who controls the contested card
        std::optional<Coord> bounds{}; // width/height, for OutOfBounds

        auto with_at(Coord c) -> Refusal&
        {
            at = c;
            return *this;
        }

        auto with_holder(PlayerId p) -> Refusal&
        {
            holder = std::move(p);
            return *this;
        }

        auto with_bounds(int w, int h) -> Refusal&
        {
            bounds = Coord{w, h};
            return *this;
        }
    };

    inline auto to_string(Rejection r) -> std::string_view
    {
        using E = Rejection;
        switch (r)
        {
        case E::OutOfBounds: return "Position out of bounds";
        case E::NoCard: return "No card at position";
        case E::Contested: return "Card is controlled by another player";
        case E::AlreadyHeld: return "Card is already held by you";
        case E::InvalidPlayer: return "Player id must be non-empty";
        case E::TimedOut: return "Timed out waiting";
        case E::Cancelled: return "Wait cancelled";
        }
        return "Unknown";
    }

    // Human-readable message; never includes other players' hidden cards.
    inline auto describe(Refusal const& r) -> std::string
    {
        auto s = std::string{to_string(r.code)};
        if (r.at) s += std::format(" ({}, {})", r.at->x, r.at->y);
        if (r.bounds) s += std::format(" on {}x{} board", r.bounds->x, r.bounds->y);
        if (r.holder) s += std::format(" [held by {}]", *r.holder);
        return s;
    }
}

#endif //MEMORYSCRAMBLE_EXCEPTION_HPP
