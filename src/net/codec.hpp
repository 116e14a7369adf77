//
// codec.hpp
//

#ifndef BINGO_CODEC_HPP
#define BINGO_CODEC_HPP

#include <cstddef>   // std::byte
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <flatbuffers/flatbuffers.h>

#include "../core/Types.hpp"

#include "generated/flatbuffers/bingo_net_generated.h"

namespace bingo::net
{
    struct ParseError
    {
        std::string message;
    };

    enum class RequestKind : std::uint8_t
    {
        Command,
        Callback
    };

    // One inbound user action as the transport saw it.
    struct Request
    {
        core::UserId user{};
        core::ChatId chat{};
        std::string display_name;
        RequestKind kind{RequestKind::Command};
        std::string data;
    };

    enum class DeliveryOp : std::uint8_t
    {
        Send,
        Edit,
        Notice
    };

    struct Delivery
    {
        core::ChatId chat{};
        core::MessageId message{};
        DeliveryOp op{DeliveryOp::Send};
        std::string text;
        core::Keyboard keyboard;
    };

    // --- Outbound builders ---

    // client → server
    auto BuildRequest(Request const& req, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    // server → client
    auto BuildDelivery(Delivery const& d, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    // --- Inbound decode (verified) ---

    auto DecodeRequest(std::span<std::byte const> bytes) -> std::expected<Request, ParseError>;

    auto DecodeDelivery(std::span<std::byte const> bytes) -> std::expected<Delivery, ParseError>;
} // namespace bingo::net


#endif //BINGO_CODEC_HPP
