#include <catch2/catch_test_macros.hpp>

#include "config.hpp"

#include <fstream>
#include <filesystem>

namespace fs = std::filesystem;

namespace {

void write_file(const char* path, const char* content)
{
    std::ofstream f(path);
    f << content;
}

} // namespace

TEST_CASE("Config::load_defaults returns valid config with defaults")
{
    auto cfg = Config::load_defaults();

    CHECK(cfg.inspector().port == 6969);
    CHECK(cfg.inspector().bind_address == "0.0.0.0");
    CHECK(cfg.inspector().max_datagram_size == Config::max_udp_payload);
    CHECK(cfg.inspector().hexdump_limit == 32);
    CHECK(cfg.logging().level == "info");
    CHECK(cfg.logging().max_size_mb == 100);
    CHECK(cfg.logging().enable_console == true);
}

TEST_CASE("Config::load_defaults applies CLI port")
{
    auto cfg = Config::load_defaults(1069);

    CHECK(cfg.inspector().port == 1069);
}

TEST_CASE("Config::load parses valid JSON file")
{
    const char* test_file = "/tmp/tftpwire_config_valid.json";

    write_file(test_file, R"({
        "inspector": {
            "port": 6900,
            "bind_address": "127.0.0.1",
            "max_datagram_size": 1024,
            "hexdump_limit": 0
        },
        "logging": {
            "level": "debug",
            "file": "/var/log/tftp_inspectd.log",
            "max_size_mb": 50,
            "enable_console": false
        }
    })");

    auto result = Config::load(test_file);

    REQUIRE(result.has_value());
    CHECK(result->inspector().port == 6900);
    CHECK(result->inspector().bind_address == "127.0.0.1");
    CHECK(result->inspector().max_datagram_size == 1024);
    CHECK(result->inspector().hexdump_limit == 0);
    CHECK(result->logging().level == "debug");
    CHECK(result->logging().file == "/var/log/tftp_inspectd.log");
    CHECK(result->logging().max_size_mb == 50);
    CHECK(result->logging().enable_console == false);

    fs::remove(test_file);
}

TEST_CASE("Config::load CLI port overrides file port")
{
    const char* test_file = "/tmp/tftpwire_config_cli_port.json";

    write_file(test_file, R"({"inspector": {"port": 6900}})");

    auto result = Config::load(test_file, 1069);

    REQUIRE(result.has_value());
    CHECK(result->inspector().port == 1069);

    fs::remove(test_file);
}

TEST_CASE("Config::load returns error for missing file")
{
    auto result = Config::load("/nonexistent/path/config.json");

    REQUIRE(!result.has_value());
}

TEST_CASE("Config::load returns error for invalid JSON")
{
    const char* test_file = "/tmp/tftpwire_config_invalid.json";

    write_file(test_file, "{ invalid json }");

    auto result = Config::load(test_file);

    REQUIRE(!result.has_value());

    fs::remove(test_file);
}

TEST_CASE("Config::load returns error for non-object root")
{
    const char* test_file = "/tmp/tftpwire_config_array.json";

    write_file(test_file, "[1, 2, 3]");

    auto result = Config::load(test_file);

    REQUIRE(!result.has_value());

    fs::remove(test_file);
}

TEST_CASE("Config::load returns error for port out of range")
{
    const char* test_file = "/tmp/tftpwire_config_bad_port.json";

    write_file(test_file, R"({"inspector": {"port": 99999}})");

    auto result = Config::load(test_file);

    REQUIRE(!result.has_value());
    CHECK(result.error().find("port") != std::string::npos);

    fs::remove(test_file);
}

TEST_CASE("Config::load rejects oversized and negative datagram limits")
{
    const char* test_file = "/tmp/tftpwire_config_bad_dgram.json";

    write_file(test_file, R"({"inspector": {"max_datagram_size": 70000}})");
    CHECK(!Config::load(test_file).has_value());

    write_file(test_file, R"({"inspector": {"hexdump_limit": -1}})");
    CHECK(!Config::load(test_file).has_value());

    write_file(test_file, R"({"inspector": {"max_datagram_size": "big"}})");
    CHECK(!Config::load(test_file).has_value());

    fs::remove(test_file);
}

TEST_CASE("Config::load_or_defaults uses defaults when file missing")
{
    auto cfg = Config::load_or_defaults("/nonexistent/config.json");

    CHECK(cfg.inspector().port == 6969);
    CHECK(cfg.logging().level == "info");
}

TEST_CASE("Config::load applies defaults for missing sections")
{
    const char* test_file = "/tmp/tftpwire_config_partial.json";

    write_file(test_file, R"({"inspector": {"port": 6000}})");

    auto result = Config::load(test_file);

    REQUIRE(result.has_value());
    CHECK(result->inspector().port == 6000);
    CHECK(result->inspector().bind_address == "0.0.0.0");
    CHECK(result->inspector().hexdump_limit == 32);
    CHECK(result->logging().level == "info");

    fs::remove(test_file);
}

TEST_CASE("Config::load handles empty JSON object")
{
    const char* test_file = "/tmp/tftpwire_config_empty.json";

    write_file(test_file, "{}");

    auto result = Config::load(test_file);

    REQUIRE(result.has_value());
    CHECK(result->inspector().port == 6969);
    CHECK(result->logging().enable_console == true);

    fs::remove(test_file);
}

TEST_CASE("Config::load keeps hexdump_limit within max_datagram_size")
{
    const char* test_file = "/tmp/tftpwire_config_hexdump.json";

    write_file(test_file, R"({"inspector": {"max_datagram_size": 16, "hexdump_limit": 64}})");
    auto too_long = Config::load(test_file);
    REQUIRE(!too_long.has_value());
    CHECK(too_long.error().find("hexdump_limit") != std::string::npos);

    write_file(test_file, R"({"inspector": {"max_datagram_size": 16}})");
    auto clamped = Config::load(test_file);
    REQUIRE(clamped.has_value());
    CHECK(clamped->inspector().hexdump_limit == 16);

    fs::remove(test_file);
}

TEST_CASE("Config::load rejects a bind_address that is not an IP address")
{
    const char* test_file = "/tmp/tftpwire_config_bind.json";

    write_file(test_file, R"({"inspector": {"bind_address": "not-an-address"}})");
    auto bad = Config::load(test_file);
    REQUIRE(!bad.has_value());
    CHECK(bad.error().find("bind_address") != std::string::npos);

    write_file(test_file, R"({"inspector": {"bind_address": "::1"}})");
    auto v6 = Config::load(test_file);
    REQUIRE(v6.has_value());
    CHECK(v6->inspector().bind_address == "::1");

    fs::remove(test_file);
}
