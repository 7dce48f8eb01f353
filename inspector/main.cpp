#include "inspector.hpp"
#include "config.hpp"
#include "logger.hpp"

#include <print>
#include <cstring>
#include <charconv>
#include <optional>

int main(int argc, char** argv)
{
    std::optional<uint16_t> cli_port;
    if (argc > 1)
    {
        uint16_t port = 0;
        if (auto [ptr, ec] = std::from_chars(argv[1], argv[1] + strlen(argv[1]), port); ec == std::errc{} && port > 0)
        {
            cli_port = port;
        }
        else
        {
            std::println(stderr, "Ignoring invalid port argument: {}", argv[1]);
        }
    }

    auto loaded = Config::load("inspector_config.json", cli_port);
    auto config = loaded ? *loaded : Config::load_defaults(cli_port);

    auto log_cfg = config.logging();
    if (auto result = Logger::init(log_cfg.level, log_cfg.file, log_cfg.max_size_mb, log_cfg.enable_console);
        !result)
    {
        std::println(stderr, "Failed to initialize logger: {}", result.error());
        return 1;
    }

    if (!loaded)
    {
        LOG_INFO("Using default configuration ({})", loaded.error());
    }

    try
    {
        net::io_context ic;
        Inspector insp(ic, config);

        insp.start();
        ic.run();
    }
    catch (const std::exception& e)
    {
        LOG_ERROR("Fatal: {}", e.what());
        Logger::shutdown();
        return 1;
    }

    LOG_INFO("Inspector exiting...");
    Logger::shutdown();
    return 0;
}
