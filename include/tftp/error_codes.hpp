#pragma once
#include <cstdint>
#include <optional>
#include <string_view>

namespace tftp
{

// RFC 1350 error codes
enum class ErrorCode : uint16_t
{
    NotDefined = 0,
    FileNotFound = 1,
    AccessViolation = 2,
    DiskFull = 3,
    IllegalOperation = 4,
    UnknownTransferId = 5,
    FileAlreadyExists = 6,
    NoSuchUser = 7,
};

[[nodiscard]] bool is_known_error_code(uint16_t code);

/**
 * Default text for a registered code, nullopt otherwise.
 * NotDefined maps to an empty string.
 */
[[nodiscard]] std::optional<std::string_view> default_message(uint16_t code);

inline std::optional<std::string_view> default_message(ErrorCode code)
{
    return default_message(static_cast<uint16_t>(code));
}

} // namespace tftp
