#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "Edge.hpp"
#include "Image.hpp"
#include "Orientation.hpp"

using tile_id_t = uint64_t;

struct Tile {
    tile_id_t id;

    std::array<edge_t, 4> edges; // canonical, indexed by Side

    Image content; // without the border

    // EDGE_LEN rows of EDGE_LEN '#'/'.' cells
    static Tile from_rows(tile_id_t id, const std::vector<std::string> &rows);

    [[nodiscard]] edge_t edge(Side s) const {
        return edges[static_cast<size_t>(s)];
    }

    [[nodiscard]] edge_t edge(Side s, Orientation o) const {
        auto [side, rev] = edge_source(o, s);
        return rev ? reversed(edge(side)) : edge(side);
    }

    bool operator==(const Tile &other) const {
        return id == other.id;
    }
};
