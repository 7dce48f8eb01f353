#include "tftp/datagram.hpp"
#include <algorithm>
#include <ranges>
#include <utility>

namespace tftp
{

using namespace bytes;

result<Error> Error::from_code(uint16_t code, std::optional<std::string> message)
{
    auto dflt = default_message(code);
    if (!dflt)
    {
        return fail(errc::invalid_error_code, code);
    }

    return Error(code, message ? std::move(*message) : std::string(*dflt));
}

result<Error> Error::from_code(ErrorCode code, std::optional<std::string> message)
{
    return from_code(std::to_underlying(code), std::move(message));
}

// Lenient: an empty text is replaced by the default for the code
result<Error> Error::parse(std::span<const std::byte> payload)
{
    if (payload.size() < 2)
    {
        return fail(errc::truncated_field);
    }

    uint16_t code = to_int<uint16_t>(payload);
    auto dflt = default_message(code);
    if (!dflt)
    {
        return fail(errc::invalid_error_code, code);
    }

    auto text = payload.subspan(2);
    auto text_end = std::ranges::find(text, std::byte{0});
    std::string message = to_string(std::span(text.begin(), text_end));
    if (message.empty())
    {
        message = *dflt;
    }

    return Error(code, std::move(message));
}

payload_t Error::serialize() const
{
    payload_t ret;
    ret.reserve(5 + msg.size());

    append_int(ret, std::to_underlying(opcode));
    append_int(ret, cd);
    append(ret, msg);
    ret.push_back(std::byte{0});
    return ret;
}

} // namespace tftp
