#include "tftp/error_codes.hpp"
#include <array>

namespace tftp
{

namespace {

constexpr std::array<std::string_view, 8> default_messages
{
    "",
    "File not found",
    "Access violation",
    "Disk full or allocation exceeded",
    "Illegal TFTP operation",
    "Unknown transfer ID",
    "File already exists",
    "No such user",
};

} // namespace

bool is_known_error_code(uint16_t code)
{
    return code < default_messages.size();
}

std::optional<std::string_view> default_message(uint16_t code)
{
    if (!is_known_error_code(code))
    {
        return std::nullopt;
    }
    return default_messages[code];
}

} // namespace tftp
