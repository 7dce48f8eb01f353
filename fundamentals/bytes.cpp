#include "fundamentals/bytes.hpp"
#include <cctype>
#include <format>

namespace bytes
{

namespace {

int hex_value(char ch)
{
    if (ch >= '0' && ch <= '9') return ch - '0';
    if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
    if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
    return -1;
}

} // namespace

std::string to_hex(std::span<const std::byte> sp)
{
    static constexpr char digits[] = "0123456789abcdef";

    std::string ret;
    ret.reserve(sp.size() * 2);
    for (auto b : sp)
    {
        auto v = std::to_integer<uint8_t>(b);
        ret.push_back(digits[v >> 4]);
        ret.push_back(digits[v & 0x0F]);
    }
    return ret;
}

// Whitespace is allowed between byte pairs, not inside one
std::expected<buffer_t, std::string> from_hex(std::string_view hex)
{
    buffer_t ret;
    ret.reserve(hex.size() / 2);

    size_t i = 0;
    while (i < hex.size())
    {
        if (std::isspace(static_cast<unsigned char>(hex[i])))
        {
            ++i;
            continue;
        }
        if (i + 1 >= hex.size())
        {
            return std::unexpected("Odd number of hex digits");
        }

        int hi = hex_value(hex[i]);
        int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0)
        {
            return std::unexpected(std::format("Invalid hex digit at offset {}", hi < 0 ? i : i + 1));
        }

        ret.push_back(int2byte(static_cast<uint8_t>((hi << 4) | lo)));
        i += 2;
    }
    return ret;
}

} // namespace bytes
