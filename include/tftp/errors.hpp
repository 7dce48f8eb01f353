#pragma once
#include <cstdint>
#include <expected>
#include <format>
#include <optional>
#include <string_view>

namespace tftp
{

enum class errc : uint8_t
{
    malformed_header = 1,   // Fewer than 2 bytes, no opcode
    unknown_opcode = 2,
    truncated_field = 3,
    trailing_data = 4,      // ACK only
    field_count = 5,        // RRQ/WRQ without filename and mode
    invalid_error_code = 6,
};

/**
 * Decode/construct failure.
 * value carries the offending opcode (unknown_opcode) or error code
 * (invalid_error_code) and is empty for every other kind.
 */
struct WireError
{
    errc kind;
    std::optional<uint16_t> value;

    bool operator==(const WireError&) const = default;
};

template<class Ty>
using result = std::expected<Ty, WireError>;

constexpr std::string_view describe(errc e)
{
    switch (e)
    {
        case errc::malformed_header:   return "malformed header";
        case errc::unknown_opcode:     return "unknown opcode";
        case errc::truncated_field:    return "truncated field";
        case errc::trailing_data:      return "trailing data";
        case errc::field_count:        return "not enough fields";
        case errc::invalid_error_code: return "invalid error code";
    }
    return "unknown wire error";
}

inline std::unexpected<WireError> fail(errc kind, std::optional<uint16_t> value = std::nullopt)
{
    return std::unexpected(WireError{kind, value});
}

} // namespace tftp

template<>
struct std::formatter<tftp::WireError>
{
    constexpr auto parse(std::format_parse_context& fpc)
    {
        return fpc.begin();
    }

    auto format(const tftp::WireError& err, std::format_context& fc) const
    {
        if (err.value)
        {
            return std::format_to(fc.out(), "{} ({})", tftp::describe(err.kind), *err.value);
        }
        return std::format_to(fc.out(), "{}", tftp::describe(err.kind));
    }
};
