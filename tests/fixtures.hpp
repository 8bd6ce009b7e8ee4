#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "input.hpp"
#include "Tile.hpp"

inline std::string data_path(const char *name) {
    return std::string{ JIGSAW_DATA_DIR } + "/" + name;
}

inline const std::vector<Tile> &example_tiles() {
    static const auto tiles = load_tiles(data_path("example.txt"));
    return tiles;
}

inline const Tile &example_tile(tile_id_t id) {
    for (auto &t : example_tiles())
        if (t.id == id)
            return t;
    throw std::runtime_error{ "no such example tile" };
}
