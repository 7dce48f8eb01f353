#include "tftp/datagram.hpp"
#include <ranges>
#include <utility>
#include <algorithm>
#include <iterator>

namespace tftp
{

using namespace bytes;

result<SplitDatagram> split_opcode(std::span<const std::byte> datagram)
{
    if (datagram.size() < 2)
    {
        return fail(errc::malformed_header);
    }

    return SplitDatagram{.opcode = to_int<uint16_t>(datagram),
                         .payload = datagram.subspan(2)};
}

result<Data> Data::parse(std::span<const std::byte> payload)
{
    if (payload.size() < 2)
    {
        return fail(errc::truncated_field);
    }

    return Data(to_int<uint16_t>(payload), payload.subspan(2) | std::ranges::to<payload_t>());
}

payload_t Data::serialize() const
{
    payload_t ret;
    ret.reserve(4 + buf.size());

    append_int(ret, std::to_underlying(opcode));
    append_int(ret, blk);
    std::ranges::copy(buf, std::back_inserter(ret));
    return ret;
}

result<Ack> Ack::parse(std::span<const std::byte> payload)
{
    if (payload.size() < 2)
    {
        return fail(errc::truncated_field);
    }
    if (payload.size() > 2)
    {
        return fail(errc::trailing_data);
    }

    return Ack(to_int<uint16_t>(payload));
}

payload_t Ack::serialize() const
{
    payload_t ret;
    ret.reserve(4);

    append_int(ret, std::to_underlying(opcode));
    append_int(ret, blk);
    return ret;
}

} // namespace tftp
