#ifndef MEMORYSCRAMBLE_CODEC_HPP
#define MEMORYSCRAMBLE_CODEC_HPP

#include <cstddef>   // std::byte
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>
#include <flatbuffers/flatbuffers.h>

#include "../core/Exception.hpp"
#include "../core/State.hpp"
#include "../core/Types.hpp"

#include "generated/flatbuffers/memory_net_generated.h"

namespace memo::core::net
{
    struct ParseError
    {
        std::string message;
    };

    // Wire-level outcome; a superset of error::Rejection.
    enum class Status : std::uint8_t
    {
        Ok = 0,
        OutOfBounds,
        NoCard,
        Contested,
        AlreadyHeld,
        InvalidPlayer,
        TimedOut,
        Cancelled,
        NoGame,
        BadRequest,
        Internal
    };

    auto StatusOf(error::Rejection r) noexcept -> Status;
    auto to_string(Status s) noexcept -> std::string_view;

    // ----- Requests (client -> server) -----
    struct LookCmd
    {
        std::string game_id;
        PlayerId player;
    };

    struct WatchCmd
    {
        std::string game_id;
        PlayerId player;
        std::uint32_t timeout_ms{};
    };

    struct FlipCmd
    {
        std::string game_id;
        PlayerId player;
        int x{};
        int y{};
        std::uint32_t timeout_ms{};
    };

    struct NewGameCmd
    {
        std::string game_id;
        std::uint32_t width{};
        std::uint32_t height{};
        std::vector<CardId> cards;
        std::uint64_t seed{};
        ContentionPolicy policy{ContentionPolicy::Wait};
    };

    struct ReplaceCmd
    {
        std::string game_id;
        PlayerId player;
        CardId from;
        CardId to;
    };

    struct HealthCmd {};

    using Request = std::variant<LookCmd, WatchCmd, FlipCmd, NewGameCmd, ReplaceCmd, HealthCmd>;

    struct DecodedRequest
    {
        std::uint64_t msg_id{};
        Request request{};
    };

    // ----- Replies (server -> client) -----
    struct BoardReplyVal
    {
        bool ok{false};
        Status status{Status::Ok};
        std::string message;
        std::optional<BoardView> board;
    };

    struct FlipReplyVal
    {
        bool ok{false};
        Status status{Status::Ok};
        std::string message;
        std::optional<CardId> card;
        std::optional<bool> matched;
        std::uint32_t score{};
    };

    struct HealthReplyVal
    {
        bool ok{true};
        std::uint32_t games{};
    };

    using Reply = std::variant<BoardReplyVal, FlipReplyVal, HealthReplyVal>;

    struct DecodedReply
    {
        std::uint64_t msg_id{};
        Reply reply{};
    };

    auto ToFbStatus(Status s) noexcept -> memo::gen::net::Status;
    auto FromFbStatus(memo::gen::net::Status s) noexcept -> Status;
    auto ToFbCellState(CellState s) noexcept -> memo::gen::net::CellState;
    auto FromFbCellState(memo::gen::net::CellState s) noexcept -> CellState;
    auto ToFbPolicy(ContentionPolicy p) noexcept -> memo::gen::net::Policy;
    auto FromFbPolicy(memo::gen::net::Policy p) noexcept -> ContentionPolicy;

    // --- Outbound builders (client -> server) ---
    auto BuildLook(LookCmd const& cmd, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;
    auto BuildWatch(WatchCmd const& cmd, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;
    auto BuildFlip(FlipCmd const& cmd, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;
    auto BuildNewGame(NewGameCmd const& cmd, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;
    auto BuildReplace(ReplaceCmd const& cmd, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;
    auto BuildHealth(std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    // --- Outbound builders (server -> client) ---
    auto BuildBoardReply(BoardReplyVal const& r, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;
    auto BuildFlipReply(FlipReplyVal const& r, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;
    auto BuildHealthReply(HealthReplyVal const& r, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    // --- Inbound decode (verified) ---
    auto DecodeRequest(std::span<std::byte const> bytes) -> std::expected<DecodedRequest, ParseError>;
    auto DecodeReply(std::span<std::byte const> bytes) -> std::expected<DecodedReply, ParseError>;

    inline auto AsBytes(flatbuffers::DetachedBuffer const& buf) -> std::span<std::byte const>
    {
        return {reinterpret_cast<std::byte const*>(buf.data()), buf.size()};
    }
} // namespace memo::core::net


#endif //MEMORYSCRAMBLE_CODEC_HPP
