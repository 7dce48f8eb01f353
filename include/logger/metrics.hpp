#pragma once
#include <array>
#include <atomic>
#include <chrono>
#include <algorithm>
#include <ranges>
#include <format>
#include <string>
#include <vector>
#include <utility>

#include "tftp/message.hpp"

struct InspectorMetrics
{
    static constexpr size_t opcode_slots = 5;
    static constexpr size_t errc_slots = 6;

    std::atomic<uint64_t> datagrams_received{0};
    std::atomic<uint64_t> bytes_received{0};
    std::array<std::atomic<uint64_t>, opcode_slots> decoded{};
    std::array<std::atomic<uint64_t>, errc_slots> rejected{};

    std::chrono::steady_clock::time_point start_time{std::chrono::steady_clock::now()};

    InspectorMetrics() = default;

    void record(const tftp::Message& m)
    {
        decoded[std::to_underlying(tftp::opcode_of(m)) - 1]++;
    }

    void record(const tftp::WireError& err)
    {
        rejected[std::to_underlying(err.kind) - 1]++;
    }

    [[nodiscard]] uint64_t decoded_count(tftp::Opcode op) const
    {
        return decoded[std::to_underlying(op) - 1].load();
    }

    [[nodiscard]] uint64_t rejected_count(tftp::errc e) const
    {
        return rejected[std::to_underlying(e) - 1].load();
    }

    [[nodiscard]] uint64_t total_decoded() const
    {
        uint64_t n = 0;
        for (const auto& c : decoded) n += c.load();
        return n;
    }

    [[nodiscard]] uint64_t total_rejected() const
    {
        uint64_t n = 0;
        for (const auto& c : rejected) n += c.load();
        return n;
    }

    void reset()
    {
        start_time = std::chrono::steady_clock::now();
        datagrams_received = 0;
        bytes_received = 0;
        for (auto& c : decoded) c = 0;
        for (auto& c : rejected) c = 0;
    }
};

template<>
struct std::formatter<InspectorMetrics>
{
    constexpr auto parse(std::format_parse_context& fpc)
    {
        return fpc.begin();
    }

    auto format(const InspectorMetrics& s, std::format_context& fc) const
    {
        auto now = std::chrono::steady_clock::now();
        auto uptime = std::chrono::duration_cast<std::chrono::seconds>(now - s.start_time).count();

        uint64_t dgrams = s.datagrams_received.load();
        uint64_t bytes_recv = s.bytes_received.load();

        constexpr double KB = 1024.0;

        std::vector<std::string> lines;

        lines.push_back(std::format(""));
        lines.push_back(std::format("============================================================"));
        lines.push_back(std::format("INSPECTOR METRICS REPORT"));
        lines.push_back(std::format("============================================================"));
        lines.push_back(std::format("Uptime: {}s ({:.2f}h)", uptime, uptime / 3600.0));
        lines.push_back(std::format(""));
        lines.push_back(std::format("--- TRAFFIC ---"));
        lines.push_back(std::format("  Datagrams:       {}", dgrams));
        lines.push_back(std::format("  Received:        {:.2f} KB", bytes_recv / KB));
        lines.push_back(std::format("  Rate:            {:.1f}/sec", static_cast<double>(dgrams) / std::max<decltype(uptime)>(uptime, 1)));
        lines.push_back(std::format(""));
        lines.push_back(std::format("--- DECODED ({}) ---", s.total_decoded()));
        for (auto op : {tftp::Opcode::rrq, tftp::Opcode::wrq, tftp::Opcode::data, tftp::Opcode::ack, tftp::Opcode::error})
        {
            lines.push_back(std::format("  {:<17}{}", std::format("{}:", tftp::opcode_name(op)), s.decoded_count(op)));
        }
        lines.push_back(std::format(""));
        lines.push_back(std::format("--- REJECTED ({}) ---", s.total_rejected()));
        for (auto e : {tftp::errc::malformed_header, tftp::errc::unknown_opcode, tftp::errc::truncated_field,
                       tftp::errc::trailing_data, tftp::errc::field_count, tftp::errc::invalid_error_code})
        {
            lines.push_back(std::format("  {:<21}{}", std::format("{}:", tftp::describe(e)), s.rejected_count(e)));
        }
        lines.push_back(std::format("============================================================"));

        return std::ranges::copy(lines | std::views::join_with('\n'), fc.out()).out;
    }
};
