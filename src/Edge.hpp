#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <boost/integer.hpp>

// one side of a tile, first cell read is the MSB
// top/bottom: read left to right
// left/right: read top to bottom
constexpr inline size_t EDGE_LEN = 10;
using edge_t = boost::uint_t<EDGE_LEN>::least;

constexpr inline edge_t EDGE_MASK = static_cast<edge_t>((1u << EDGE_LEN) - 1u);

enum class Side : uint8_t { Top, Left, Right, Bottom };

constexpr inline std::array<Side, 4> all_sides{
    Side::Top, Side::Left, Side::Right, Side::Bottom,
};

constexpr inline Side opposite(Side s) {
    switch (s) {
        case Side::Top: return Side::Bottom;
        case Side::Left: return Side::Right;
        case Side::Right: return Side::Left;
        case Side::Bottom: return Side::Top;
    }
    return s;
}

[[nodiscard]] constexpr inline edge_t reversed(edge_t e) {
    edge_t r{};
    for (auto i = 0zu; i < EDGE_LEN; i++, e >>= 1u)
        r = static_cast<edge_t>(r << 1u | (e & 1u));
    return r;
}

static_assert(reversed(0b1000000000u) == 0b0000000001u);
static_assert(reversed(0b1100000010u) == 0b0100000011u);
static_assert(reversed(EDGE_MASK) == EDGE_MASK);
