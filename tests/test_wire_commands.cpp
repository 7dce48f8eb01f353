#include <catch2/catch_test_macros.hpp>

#include "wire_commands.hpp"
#include "fundamentals/bytes.hpp"

#include <format>
#include <string>
#include <variant>

using namespace wire_cli;
using namespace bytes;

TEST_CASE("parse_u16 accepts the full 16-bit range only")
{
    CHECK(parse_u16("0") == uint16_t{0});
    CHECK(parse_u16("65535") == uint16_t{65535});
    CHECK(!parse_u16("65536").has_value());
    CHECK(!parse_u16("-1").has_value());
    CHECK(!parse_u16("12ab").has_value());
    CHECK(!parse_u16("").has_value());
}

TEST_CASE("encode_block builds DATA and ACK")
{
    auto data = encode_block("data", "3", "hi");
    REQUIRE(data.has_value());
    CHECK(tftp::serialize(*data) == "\x00\x03\x00\x03" "hi"_b);

    auto ack = encode_block("ack", "10", std::nullopt);
    REQUIRE(ack.has_value());
    REQUIRE(std::holds_alternative<tftp::Ack>(*ack));
    CHECK(tftp::serialize(*ack) == "\x00\x04\x00\x0a"_b);
}

TEST_CASE("encode_block rejects invalid block numbers")
{
    auto too_big = encode_block("ack", "70000", std::nullopt);
    REQUIRE(!too_big.has_value());
    CHECK(too_big.error() == "Invalid block number: 70000");

    auto not_number = encode_block("data", "one", "x");
    REQUIRE(!not_number.has_value());
    CHECK(not_number.error() == "Invalid block number: one");
}

TEST_CASE("encode_error builds ERROR with default or custom text")
{
    auto dflt = encode_error("1", std::nullopt);
    REQUIRE(dflt.has_value());
    CHECK(std::format("{}", *dflt) == "ERROR(code=1, message=File not found)");

    auto custom = encode_error("3", "custom");
    REQUIRE(custom.has_value());
    CHECK(tftp::serialize(*custom) == "\x00\x05\x00\x03" "custom\0"_b);
}

TEST_CASE("encode_error rejects unparsable and unregistered codes")
{
    auto bad = encode_error("x1", std::nullopt);
    REQUIRE(!bad.has_value());
    CHECK(bad.error() == "Invalid error code: x1");

    auto unknown = encode_error("13", std::nullopt);
    REQUIRE(!unknown.has_value());
    CHECK(unknown.error() == "invalid error code (13)");
}

TEST_CASE("decode_hex prints decoded datagrams and reports failures")
{
    auto ok = decode_hex("0004 0007");
    REQUIRE(ok.has_value());
    CHECK(*ok == "ACK(block=7)");

    auto odd = decode_hex("000");
    REQUIRE(!odd.has_value());
    CHECK(odd.error() == "000: Odd number of hex digits");

    auto unknown = decode_hex("0011");
    REQUIRE(!unknown.has_value());
    CHECK(unknown.error() == "0011: unknown opcode (17)");
}
