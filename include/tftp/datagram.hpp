#pragma once
#include <cstdint>
#include <cstddef>
#include <format>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "fundamentals/bytes.hpp"
#include "tftp/errors.hpp"
#include "tftp/error_codes.hpp"

namespace tftp
{

using payload_t = bytes::buffer_t;

enum class Opcode : uint16_t
{
    rrq = 1,
    wrq = 2,
    data = 3,
    ack = 4,
    error = 5,
};

constexpr std::string_view opcode_name(Opcode op)
{
    switch (op)
    {
        case Opcode::rrq:   return "RRQ";
        case Opcode::wrq:   return "WRQ";
        case Opcode::data:  return "DATA";
        case Opcode::ack:   return "ACK";
        case Opcode::error: return "ERROR";
    }
    return "?";
}

struct SplitDatagram
{
    uint16_t opcode;
    std::span<const std::byte> payload; // View into the split buffer
};

// First 2 bytes as big-endian opcode, the rest is payload (possibly empty)
[[nodiscard]] result<SplitDatagram> split_opcode(std::span<const std::byte> datagram);

/**
 * RRQ/WRQ: op(2) | filename | 0 | mode | 0
 *
 * Fields after mode are tolerated and dropped, and the mode does not need
 * its terminating NUL. Mode is stored lower-cased.
 */
template<Opcode Op>
class Request
{
public:
    static constexpr Opcode opcode = Op;

    Request(std::string filename, std::string_view mode);

    [[nodiscard]] static result<Request> parse(std::span<const std::byte> payload);
    [[nodiscard]] payload_t serialize() const;

    [[nodiscard]] const std::string& filename() const { return fname; }
    [[nodiscard]] const std::string& mode() const { return md; }

    bool operator==(const Request&) const = default;

private:
    std::string fname;
    std::string md;
};

using ReadRequest = Request<Opcode::rrq>;
using WriteRequest = Request<Opcode::wrq>;

extern template class Request<Opcode::rrq>;
extern template class Request<Opcode::wrq>;

// DATA: op(2) | block(2) | data(N). N is not bounded here.
class Data
{
public:
    static constexpr Opcode opcode = Opcode::data;

    Data(uint16_t block, payload_t data) : blk(block), buf(std::move(data)) {}

    [[nodiscard]] static result<Data> parse(std::span<const std::byte> payload);
    [[nodiscard]] payload_t serialize() const;

    [[nodiscard]] uint16_t block() const { return blk; }
    [[nodiscard]] const payload_t& data() const { return buf; }

    bool operator==(const Data&) const = default;

private:
    uint16_t blk;
    payload_t buf;
};

// ACK: op(2) | block(2), nothing may follow
class Ack
{
public:
    static constexpr Opcode opcode = Opcode::ack;

    explicit Ack(uint16_t block) : blk(block) {}

    [[nodiscard]] static result<Ack> parse(std::span<const std::byte> payload);
    [[nodiscard]] payload_t serialize() const;

    [[nodiscard]] uint16_t block() const { return blk; }

    bool operator==(const Ack&) const = default;

private:
    uint16_t blk;
};

/**
 * ERROR: op(2) | code(2) | message | 0
 *
 * Only registered codes can be held. An empty message on the wire is
 * replaced by the code's default text.
 */
class Error
{
public:
    static constexpr Opcode opcode = Opcode::error;

    [[nodiscard]] static result<Error> from_code(uint16_t code, std::optional<std::string> message = std::nullopt);
    [[nodiscard]] static result<Error> from_code(ErrorCode code, std::optional<std::string> message = std::nullopt);

    [[nodiscard]] static result<Error> parse(std::span<const std::byte> payload);
    [[nodiscard]] payload_t serialize() const;

    [[nodiscard]] uint16_t code() const { return cd; }
    [[nodiscard]] const std::string& message() const { return msg; }

    bool operator==(const Error&) const = default;

private:
    Error(uint16_t code, std::string message) : cd(code), msg(std::move(message)) {}

    uint16_t cd;
    std::string msg;
};

} // namespace tftp

template<tftp::Opcode Op>
struct std::formatter<tftp::Request<Op>>
{
    constexpr auto parse(std::format_parse_context& fpc)
    {
        return fpc.begin();
    }

    auto format(const tftp::Request<Op>& rq, std::format_context& fc) const
    {
        return std::format_to(fc.out(), "{}(filename={}, mode={})",
                              tftp::opcode_name(Op), rq.filename(), rq.mode());
    }
};

template<>
struct std::formatter<tftp::Data>
{
    constexpr auto parse(std::format_parse_context& fpc)
    {
        return fpc.begin();
    }

    auto format(const tftp::Data& d, std::format_context& fc) const
    {
        return std::format_to(fc.out(), "DATA(block={}, {} bytes of data)", d.block(), d.data().size());
    }
};

template<>
struct std::formatter<tftp::Ack>
{
    constexpr auto parse(std::format_parse_context& fpc)
    {
        return fpc.begin();
    }

    auto format(const tftp::Ack& a, std::format_context& fc) const
    {
        return std::format_to(fc.out(), "ACK(block={})", a.block());
    }
};

template<>
struct std::formatter<tftp::Error>
{
    constexpr auto parse(std::format_parse_context& fpc)
    {
        return fpc.begin();
    }

    auto format(const tftp::Error& e, std::format_context& fc) const
    {
        return std::format_to(fc.out(), "ERROR(code={}, message={})", e.code(), e.message());
    }
};
