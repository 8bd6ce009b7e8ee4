#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <utility>

#include <fmt/format.h>

#include "Edge.hpp"

using coords_t = std::pair<int, int>; // Y, X

// lens from logical to storage coordinates:
// Swap first (transpose), then FlipX (mirror columns), then FlipY (mirror rows)
//
// bit 0 = FlipX, bit 1 = FlipY, bit 2 = Swap
enum class Orientation : uint8_t {
    Identity = 0b000u,
    FlipX    = 0b001u,
    FlipY    = 0b010u,
    Rot180   = 0b011u,
    FlipP    = 0b100u, // flip primary
    Rot90CCW = 0b101u,
    Rot90CW  = 0b110u,
    FlipS    = 0b111u, // flip secondary
};

constexpr inline std::array<Orientation, 8> all_orientations{
    Orientation::Identity, Orientation::FlipX,
    Orientation::FlipY,    Orientation::Rot180,
    Orientation::FlipP,    Orientation::Rot90CCW,
    Orientation::Rot90CW,  Orientation::FlipS,
};

constexpr inline bool flips_x(Orientation o) {
    return static_cast<uint8_t>(o) & 0b001u;
}

constexpr inline bool flips_y(Orientation o) {
    return static_cast<uint8_t>(o) & 0b010u;
}

constexpr inline bool swaps_axes(Orientation o) {
    return static_cast<uint8_t>(o) & 0b100u;
}

// lens of inverse(o) applied after the lens of o is the identity
constexpr inline Orientation inverse(Orientation o) {
    if (swaps_axes(o) && flips_x(o) != flips_y(o))
        return static_cast<Orientation>(static_cast<uint8_t>(o) ^ 0b011u);
    return o;
}

// logical (rows, cols) of a rows x cols storage viewed through o
constexpr inline std::pair<size_t, size_t> oriented_size(Orientation o, size_t rows, size_t cols) {
    if (swaps_axes(o))
        return { cols, rows };
    return { rows, cols };
}

// logical coordinates -> storage coordinates of a rows x cols storage
constexpr inline coords_t apply(Orientation o, coords_t pos, size_t rows, size_t cols) {
    auto [y, x] = pos;
    if (swaps_axes(o))
        std::swap(y, x);
    if (flips_x(o))
        x = static_cast<int>(cols) - 1 - x;
    if (flips_y(o))
        y = static_cast<int>(rows) - 1 - y;
    return { y, x };
}

// the canonical edge that ends up on a side once o is applied
struct EdgeSource {
    Side side;
    bool reversed;

    constexpr bool operator==(const EdgeSource &other) const = default;
};

//           no swap                     swap
// Top     FlipY ? Bottom : Top, ~FlipX  FlipX ? Right : Left, ~FlipY
// Bottom  FlipY ? Top : Bottom, ~FlipX  FlipX ? Left : Right, ~FlipY
// Left    FlipX ? Right : Left, ~FlipY  FlipY ? Bottom : Top, ~FlipX
// Right   FlipX ? Left : Right, ~FlipY  FlipY ? Top : Bottom, ~FlipX
constexpr inline EdgeSource edge_source(Orientation o, Side s) {
    auto fx = flips_x(o), fy = flips_y(o);
    if (!swaps_axes(o)) {
        switch (s) {
            case Side::Top: return { fy ? Side::Bottom : Side::Top, fx };
            case Side::Bottom: return { fy ? Side::Top : Side::Bottom, fx };
            case Side::Left: return { fx ? Side::Right : Side::Left, fy };
            case Side::Right: return { fx ? Side::Left : Side::Right, fy };
        }
    }
    switch (s) {
        case Side::Top: return { fx ? Side::Right : Side::Left, fy };
        case Side::Bottom: return { fx ? Side::Left : Side::Right, fy };
        case Side::Left: return { fy ? Side::Bottom : Side::Top, fx };
        case Side::Right: return { fy ? Side::Top : Side::Bottom, fx };
    }
    return { s, false };
}

template <>
struct fmt::formatter<Orientation> : formatter<string_view> {
    auto format(Orientation c, format_context &ctx) const
        -> format_context::iterator;
};
