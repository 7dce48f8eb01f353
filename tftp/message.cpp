#include "tftp/message.hpp"
#include <type_traits>
#include <utility>

namespace tftp
{

namespace {

template<class Ty>
result<Message> parse_as(std::span<const std::byte> payload)
{
    return Ty::parse(payload).transform([](Ty&& v){ return Message(std::move(v)); });
}

} // namespace

Opcode opcode_of(const Message& m)
{
    return std::visit([](const auto& v){ return std::remove_cvref_t<decltype(v)>::opcode; }, m);
}

payload_t serialize(const Message& m)
{
    return std::visit([](const auto& v){ return v.serialize(); }, m);
}

result<Message> make_message(uint16_t opcode, std::span<const std::byte> payload)
{
    switch (static_cast<Opcode>(opcode))
    {
        case Opcode::rrq:   return parse_as<ReadRequest>(payload);
        case Opcode::wrq:   return parse_as<WriteRequest>(payload);
        case Opcode::data:  return parse_as<Data>(payload);
        case Opcode::ack:   return parse_as<Ack>(payload);
        case Opcode::error: return parse_as<Error>(payload);
    }
    return fail(errc::unknown_opcode, opcode);
}

result<Message> decode(std::span<const std::byte> datagram)
{
    return split_opcode(datagram).and_then([](const SplitDatagram& sd)
    {
        return make_message(sd.opcode, sd.payload);
    });
}

} // namespace tftp
