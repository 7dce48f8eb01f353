#pragma once

#include <boost/json.hpp>
#include <string>
#include <expected>
#include <optional>
#include <cstdint>

namespace json = boost::json;

/**
 * Inspector configuration loaded from JSON file.
 * Load-once at startup, immutable thereafter.
 */
class Config
{
public:
    // Largest UDP payload over IPv4
    static constexpr size_t max_udp_payload = 65507;

    struct InspectorCfg
    {
        uint16_t port = 6969;
        std::string bind_address = "0.0.0.0";
        size_t max_datagram_size = max_udp_payload;
        size_t hexdump_limit = 32;
    };

    struct LoggingCfg
    {
        std::string level = "info";
        std::string file = "";
        size_t max_size_mb = 100;
        bool enable_console = true;
    };

    [[nodiscard]] static std::expected<Config, std::string> load(const std::string& filepath, std::optional<uint16_t> cli_port = std::nullopt);
    [[nodiscard]] static Config load_defaults(std::optional<uint16_t> cli_port = std::nullopt);
    [[nodiscard]] static Config load_or_defaults(const std::string& filepath, std::optional<uint16_t> cli_port = std::nullopt);

    [[nodiscard]] const InspectorCfg& inspector() const { return insp; }
    [[nodiscard]] const LoggingCfg& logging() const { return log; }

private:
    InspectorCfg insp;
    LoggingCfg log;

    [[nodiscard]] static std::expected<Config, std::string> parse(const json::value& jv);
};
