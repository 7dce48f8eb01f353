#pragma once
#include <variant>
#include <span>
#include <format>

#include "tftp/datagram.hpp"

namespace tftp
{

using Message = std::variant<ReadRequest, WriteRequest, Data, Ack, Error>;

[[nodiscard]] Opcode opcode_of(const Message& m);
[[nodiscard]] payload_t serialize(const Message& m);

/**
 * Dispatch a split payload to the parser for its opcode.
 * Parser errors are returned unchanged; opcodes outside 1..5 give unknown_opcode.
 */
[[nodiscard]] result<Message> make_message(uint16_t opcode, std::span<const std::byte> payload);

// split_opcode + make_message
[[nodiscard]] result<Message> decode(std::span<const std::byte> datagram);

} // namespace tftp

template<>
struct std::formatter<tftp::Message>
{
    constexpr auto parse(std::format_parse_context& fpc)
    {
        return fpc.begin();
    }

    auto format(const tftp::Message& m, std::format_context& fc) const
    {
        return std::visit([&fc](const auto& v){ return std::format_to(fc.out(), "{}", v); }, m);
    }
};
