#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <vector>

#include <boost/container/flat_set.hpp>
#include <boost/unordered_map.hpp>
#include <fmt/format.h>

#include "Orientation.hpp"
#include "Tile.hpp"

// where the candidate sits relative to the reference tile
enum class Relationship : uint8_t { Above, Below, LeftOf, RightOf };

constexpr inline std::array<Relationship, 4> all_relationships{
    Relationship::Above, Relationship::Below,
    Relationship::LeftOf, Relationship::RightOf,
};

// the side of the reference tile that touches the candidate;
// the candidate touches with opposite(facing_side(r))
constexpr inline Side facing_side(Relationship r) {
    switch (r) {
        case Relationship::Above: return Side::Top;
        case Relationship::Below: return Side::Bottom;
        case Relationship::LeftOf: return Side::Left;
        case Relationship::RightOf: return Side::Right;
    }
    return Side::Top;
}

struct OrientedTile {
    tile_id_t tile_id;
    Orientation orientation;

    constexpr auto operator<=>(const OrientedTile &other) const = default;
};

using oriented_set_t = boost::container::flat_set<OrientedTile>;

// NOT to be mutated after construction
class AllowedOrientedTiles {
    struct entry_key {
        tile_id_t tile_id;
        Orientation orientation;
        Relationship relationship;

        bool operator==(const entry_key &other) const = default;
    };

    struct hasher {
        size_t operator()(const entry_key &k) const;
    };

    boost::unordered_map<entry_key, oriented_set_t, hasher> neighbours;
    oriented_set_t none;

public:
    // O(T^2 * 8^2 * 4) edge comparisons
    explicit AllowedOrientedTiles(const std::vector<Tile> &tiles);

    // total: an unknown key yields the empty set
    [[nodiscard]] const oriented_set_t &get(tile_id_t id, Orientation o, Relationship r) const;

    [[nodiscard]] size_t size() const { return neighbours.size(); }
};

template <>
struct fmt::formatter<OrientedTile> : formatter<string_view> {
    auto format(OrientedTile c, format_context &ctx) const
        -> format_context::iterator;
};
