#include <catch2/catch_test_macros.hpp>

#include "logger.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace {

std::string slurp(const fs::path& p)
{
    std::ifstream f(p);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

} // namespace

TEST_CASE("Logger::init fails for unwritable file")
{
    auto result = Logger::init("info", "/nonexistent/dir/tftpwire.log", 1, false);

    REQUIRE(!result.has_value());
    CHECK(result.error().find("/nonexistent/dir/tftpwire.log") != std::string::npos);
    Logger::shutdown();
}

TEST_CASE("Logger writes formatted lines at or above the configured level")
{
    const fs::path log_file = "/tmp/tftpwire_logger_level.log";
    fs::remove(log_file);

    REQUIRE(Logger::init("warn", log_file.string(), 1, false).has_value());
    CHECK(!Logger::enabled(Logger::Level::Info));
    CHECK(Logger::enabled(Logger::Level::Error));

    LOG_INFO("dropped {}", 1);
    LOG_WARN("kept {} {}", "block", 42);
    Logger::shutdown();

    auto content = slurp(log_file);
    CHECK(content.find("dropped") == std::string::npos);
    CHECK(content.find("[WARN] kept block 42") != std::string::npos);

    fs::remove(log_file);
}

TEST_CASE("Logger rotates the file once it exceeds max size")
{
    const fs::path log_file = "/tmp/tftpwire_logger_rotate.log";
    const fs::path rotated = "/tmp/tftpwire_logger_rotate.log.1";
    fs::remove(log_file);
    fs::remove(rotated);

    REQUIRE(Logger::init("debug", log_file.string(), 1, false).has_value());

    const std::string filler(1000, 'x');
    for (int i = 0; i < 1100; ++i)
    {
        LOG_DEBUG("{} {}", i, filler);
    }
    Logger::shutdown();

    CHECK(fs::exists(rotated));
    CHECK(fs::file_size(log_file) < 1024 * 1024);
    CHECK(fs::file_size(rotated) <= 1024 * 1024);

    fs::remove(log_file);
    fs::remove(rotated);
}

TEST_CASE("Logger level can change while other threads log")
{
    const fs::path log_file = "/tmp/tftpwire_logger_reinit.log";
    fs::remove(log_file);

    REQUIRE(Logger::init("debug", log_file.string(), 1, false).has_value());

    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t)
    {
        workers.emplace_back([t]
        {
            for (int i = 0; i < 200; ++i)
            {
                LOG_DEBUG("worker {} line {}", t, i);
            }
        });
    }
    for (int i = 0; i < 50; ++i)
    {
        REQUIRE(Logger::init(i % 2 ? "debug" : "error", log_file.string(), 1, false).has_value());
    }
    for (auto& w : workers)
    {
        w.join();
    }

    REQUIRE(Logger::init("error", log_file.string(), 1, false).has_value());
    CHECK(!Logger::enabled(Logger::Level::Warn));
    CHECK(Logger::enabled(Logger::Level::Error));
    Logger::shutdown();

    fs::remove(log_file);
}
