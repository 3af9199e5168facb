#pragma once
#include <atomic>
#include <chrono>
#include <algorithm>
#include <ranges>
#include <format>
#include <string>
#include <vector>

struct GatewayMetrics
{
    std::atomic<uint64_t> handshakes_started{0};
    std::atomic<uint64_t> handshakes_completed{0};
    std::atomic<uint64_t> handshakes_failed{0};
    std::atomic<uint64_t> handshakes_expired{0};
    std::atomic<uint64_t> negotiation_failures{0};
    std::atomic<uint64_t> integrity_failures{0};
    std::atomic<uint64_t> order_violations{0};
    std::atomic<uint64_t> sessions_created{0};
    std::atomic<uint64_t> sessions_invalidated{0};
    std::atomic<uint64_t> sessions_swept{0};
    std::atomic<uint64_t> key_rotations{0};
    std::atomic<uint64_t> key_backups{0};
    std::atomic<uint64_t> key_restores{0};

    std::chrono::steady_clock::time_point start_time{std::chrono::steady_clock::now()};

    GatewayMetrics() = default;

    void reset()
    {
        start_time = std::chrono::steady_clock::now();
        handshakes_started = 0;
        handshakes_completed = 0;
        handshakes_failed = 0;
        handshakes_expired = 0;
        negotiation_failures = 0;
        integrity_failures = 0;
        order_violations = 0;
        sessions_created = 0;
        sessions_invalidated = 0;
        sessions_swept = 0;
        key_rotations = 0;
        key_backups = 0;
        key_restores = 0;
    }
};

template<>
struct std::formatter<GatewayMetrics>
{
    constexpr auto parse(std::format_parse_context& fpc)
    {
        return fpc.begin();
    }

    auto format(const GatewayMetrics& m, std::format_context& fc) const
    {
        auto now = std::chrono::steady_clock::now();
        auto uptime = std::chrono::duration_cast<std::chrono::seconds>(now - m.start_time).count();

        uint64_t hs_started = m.handshakes_started.load();
        uint64_t hs_completed = m.handshakes_completed.load();
        uint64_t hs_failed = m.handshakes_failed.load();

        std::vector<std::string> lines;

        lines.push_back(std::format(""));
        lines.push_back(std::format("============================================================"));
        lines.push_back(std::format("GATEWAY METRICS REPORT"));
        lines.push_back(std::format("============================================================"));
        lines.push_back(std::format("Uptime: {}s ({:.2f}h)", uptime, uptime / 3600.0));
        lines.push_back(std::format(""));
        lines.push_back(std::format("--- HANDSHAKES ---"));
        lines.push_back(std::format("  Started:         {}", hs_started));
        lines.push_back(std::format("  Completed:       {}", hs_completed));
        lines.push_back(std::format("  Failed:          {}", hs_failed));
        lines.push_back(std::format("  Expired:         {}", m.handshakes_expired.load()));
        lines.push_back(std::format("  Success Rate:    {:.1f}%", hs_completed + hs_failed > 0 ?
                    (hs_completed * 100.0 / (hs_completed + hs_failed)) : 0.0));
        lines.push_back(std::format("  Rate:            {:.1f}/min", hs_started * 60.0 / std::max<int64_t>(uptime, 1)));
        lines.push_back(std::format(""));
        lines.push_back(std::format("--- PROTOCOL FAILURES ---"));
        lines.push_back(std::format("  Negotiation:     {}", m.negotiation_failures.load()));
        lines.push_back(std::format("  Integrity:       {}", m.integrity_failures.load()));
        lines.push_back(std::format("  Out of order:    {}", m.order_violations.load()));
        lines.push_back(std::format(""));
        lines.push_back(std::format("--- SESSIONS ---"));
        lines.push_back(std::format("  Created:         {}", m.sessions_created.load()));
        lines.push_back(std::format("  Invalidated:     {}", m.sessions_invalidated.load()));
        lines.push_back(std::format("  Swept:           {}", m.sessions_swept.load()));
        lines.push_back(std::format(""));
        lines.push_back(std::format("--- KEYS ---"));
        lines.push_back(std::format("  Rotations:       {}", m.key_rotations.load()));
        lines.push_back(std::format("  Backups:         {}", m.key_backups.load()));
        lines.push_back(std::format("  Restores:        {}", m.key_restores.load()));
        lines.push_back(std::format("============================================================"));

        return std::ranges::copy(lines | std::views::join_with('\n'), fc.out()).out;
    }
};
