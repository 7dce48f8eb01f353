#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

#include "tftp/message.hpp"

// Argument handling behind the tftp_wire tool. Failures carry the diagnostic to print.
namespace wire_cli
{

std::optional<uint16_t> parse_u16(std::string_view sv);

// "data <block> <text>" or "ack <block>"
std::expected<tftp::Message, std::string> encode_block(std::string_view cmd,
                                                       std::string_view block_arg,
                                                       std::optional<std::string_view> text);

std::expected<tftp::Message, std::string> encode_error(std::string_view code_arg,
                                                       std::optional<std::string> message);

// One hex-encoded datagram to its printable form
std::expected<std::string, std::string> decode_hex(std::string_view hex);

} // namespace wire_cli
