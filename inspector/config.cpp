#include "config.hpp"

#include <algorithm>
#include <concepts>
#include <boost/asio/ip/address.hpp>
#include <fstream>
#include <sstream>
#include <format>

namespace net = boost::asio;

namespace {

template<std::unsigned_integral Ty>
std::expected<Ty, std::string> get_uint(const json::object& obj, std::string_view key,
                                        Ty min_val, Ty max_val, Ty default_val)
{
    auto it = obj.find(key);
    if (it == obj.end())
    {
        return default_val;
    }
    if (!it->value().is_int64() && !it->value().is_uint64())
    {
        return std::unexpected(std::format("'{}' must be an integer", key));
    }
    if (it->value().is_int64() && it->value().as_int64() < 0)
    {
        return std::unexpected(std::format("'{}' must be between {} and {}",
                                           key, min_val, max_val));
    }
    auto val = it->value().to_number<uint64_t>();
    if (val < static_cast<uint64_t>(min_val) || val > static_cast<uint64_t>(max_val))
    {
        return std::unexpected(std::format("'{}' must be between {} and {}",
                                           key, min_val, max_val));
    }
    return static_cast<Ty>(val);
}

std::string get_string(const json::object& obj, std::string_view key, std::string_view default_val)
{
    auto it = obj.find(key);
    if (it == obj.end() || !it->value().is_string())
    {
        return std::string(default_val);
    }
    return std::string(it->value().as_string());
}

bool get_bool(const json::object& obj, std::string_view key, bool default_val)
{
    auto it = obj.find(key);
    if (it == obj.end() || !it->value().is_bool())
    {
        return default_val;
    }
    return it->value().as_bool();
}

// Missing or non-object sections read as empty, so every key takes its default
const json::object& section(const json::object& root, std::string_view name)
{
    static const json::object empty;
    auto it = root.find(name);
    if (it == root.end() || !it->value().is_object())
    {
        return empty;
    }
    return it->value().as_object();
}

std::expected<void, std::string> read_inspector(const json::object& obj, Config::InspectorCfg& cfg)
{
    auto port = get_uint<uint16_t>(obj, "port", 1, 65535, 6969);
    if (!port)
    {
        return std::unexpected(port.error());
    }
    cfg.port = *port;

    cfg.bind_address = get_string(obj, "bind_address", "0.0.0.0");
    boost::system::error_code ec;
    net::ip::make_address(cfg.bind_address, ec);
    if (ec)
    {
        return std::unexpected(std::format("'bind_address' is not an IP address: {}", cfg.bind_address));
    }

    auto max_dgram = get_uint<size_t>(obj, "max_datagram_size", 4, Config::max_udp_payload, Config::max_udp_payload);
    if (!max_dgram)
    {
        return std::unexpected(max_dgram.error());
    }
    cfg.max_datagram_size = *max_dgram;

    // Nothing longer than the receive buffer can be dumped
    auto hexdump = get_uint<size_t>(obj, "hexdump_limit", 0, cfg.max_datagram_size,
                                    std::min<size_t>(32, cfg.max_datagram_size));
    if (!hexdump)
    {
        return std::unexpected(hexdump.error());
    }
    cfg.hexdump_limit = *hexdump;
    return {};
}

std::expected<void, std::string> read_logging(const json::object& obj, Config::LoggingCfg& cfg)
{
    cfg.level = get_string(obj, "level", "info");
    cfg.file = get_string(obj, "file", "");
    auto max_size = get_uint<size_t>(obj, "max_size_mb", 1, 10000, 100);
    if (!max_size)
    {
        return std::unexpected(max_size.error());
    }
    cfg.max_size_mb = *max_size;
    cfg.enable_console = get_bool(obj, "enable_console", true);
    return {};
}

} // namespace

std::expected<Config, std::string> Config::load(const std::string& filepath, std::optional<uint16_t> cli_port)
{
    std::ifstream file(filepath);
    if (!file.is_open())
    {
        return std::unexpected(std::format("Failed to open config file: {}", filepath));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    json::value jv;
    try
    {
        jv = json::parse(buffer.str());
    }
    catch (const std::exception& e)
    {
        return std::unexpected(std::format("JSON parse error: {}", e.what()));
    }
    auto result = parse(jv);
    if (result && cli_port.has_value())
    {
        result->insp.port = *cli_port;
    }
    return result;
}

Config Config::load_defaults(std::optional<uint16_t> cli_port)
{
    Config cfg{};
    if (cli_port.has_value())
    {
        cfg.insp.port = *cli_port;
    }
    return cfg;
}

Config Config::load_or_defaults(const std::string& filepath, std::optional<uint16_t> cli_port)
{
    auto result = load(filepath, cli_port);
    if (result)
    {
        return *result;
    }
    return load_defaults(cli_port);
}

std::expected<Config, std::string> Config::parse(const json::value& jv)
{
    if (!jv.is_object())
    {
        return std::unexpected("Config root must be a JSON object");
    }
    const auto& root = jv.as_object();
    Config config;
    if (auto res = read_inspector(section(root, "inspector"), config.insp); !res)
    {
        return std::unexpected(res.error());
    }
    if (auto res = read_logging(section(root, "logging"), config.log); !res)
    {
        return std::unexpected(res.error());
    }
    return config;
}
