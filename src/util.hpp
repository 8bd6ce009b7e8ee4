#pragma once

#include <cstdint>
#include <string>

#include <fmt/format.h>

// 0 quiet, 1 summary, 2 search progress, 3 every place/remove
// defined in config.cpp
extern unsigned g_verbose;

inline std::string display(double s) {
    if (s == 0.0)
        return "0s";
    if (s < 0.0)
        return "-" + display(-s);
    if (s < 1e-9)
        return fmt::format("<1ns");
    if (s < 1e-6)
        return fmt::format("{:.1f}ns", s / 1e-9);
    if (s < 1e-3)
        return fmt::format("{:.1f}us", s / 1e-6);
    if (s < 1.0)
        return fmt::format("{:.1f}ms", s / 1e-3);
    if (s < 100.0)
        return fmt::format("{:.2f}s", s);
    if (s < 600.0)
        return fmt::format("{}m{}s", (uint64_t)(s) / 60, (uint64_t)(s) % 60);
    if (s < 3600.0)
        return fmt::format("{:.1f}m", s / 60);
    if (s < 100 * 3600.0)
        return fmt::format("{}h{}m", (uint64_t)(s) / 3600, (uint64_t)(s) / 60 % 60);
    if (s < 100 * 86400.0)
        return fmt::format("{}d{}h", (uint64_t)(s) / 86400, (uint64_t)(s) / 3600 % 24);
    return fmt::format("{}d", (uint64_t)(s) / 86400);
}
