#include "wire_commands.hpp"
#include "fundamentals/bytes.hpp"

#include <charconv>
#include <format>
#include <utility>

namespace wire_cli
{

std::optional<uint16_t> parse_u16(std::string_view sv)
{
    uint16_t val = 0;
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), val);
    if (sv.empty() || ec != std::errc{} || ptr != sv.data() + sv.size())
    {
        return std::nullopt;
    }
    return val;
}

std::expected<tftp::Message, std::string> encode_block(std::string_view cmd,
                                                       std::string_view block_arg,
                                                       std::optional<std::string_view> text)
{
    auto block = parse_u16(block_arg);
    if (!block)
    {
        return std::unexpected(std::format("Invalid block number: {}", block_arg));
    }

    if (cmd == "ack")
    {
        return tftp::Ack(*block);
    }
    return tftp::Data(*block, bytes::to_bytes(text.value_or("")));
}

std::expected<tftp::Message, std::string> encode_error(std::string_view code_arg,
                                                       std::optional<std::string> message)
{
    auto code = parse_u16(code_arg);
    if (!code)
    {
        return std::unexpected(std::format("Invalid error code: {}", code_arg));
    }

    auto err = tftp::Error::from_code(*code, std::move(message));
    if (!err)
    {
        return std::unexpected(std::format("{}", err.error()));
    }
    return std::move(*err);
}

std::expected<std::string, std::string> decode_hex(std::string_view hex)
{
    auto raw = bytes::from_hex(hex);
    if (!raw)
    {
        return std::unexpected(std::format("{}: {}", hex, raw.error()));
    }

    auto m = tftp::decode(*raw);
    if (!m)
    {
        return std::unexpected(std::format("{}: {}", hex, m.error()));
    }
    return std::format("{}", *m);
}

} // namespace wire_cli
