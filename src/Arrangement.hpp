#pragma once

#include <cstddef>
#include <expected>
#include <optional>
#include <vector>

#include <boost/container/flat_map.hpp>
#include <boost/container/flat_set.hpp>
#include <fmt/format.h>

#include "compat.hpp"
#include "Image.hpp"
#include "Tile.hpp"

// placed tiles that, together, leave no way to complete the grid
using Conflict = boost::container::flat_set<tile_id_t>;

// NOT thread-safe at all!
// the tiles must outlive the Arrangement
class Arrangement {
    int rows, cols;
    std::vector<std::optional<OrientedTile>> slots; // row-major
    boost::container::flat_map<tile_id_t, const Tile *> catalog; // every tile
    boost::container::flat_set<tile_id_t> pool; // not placed yet

    // empty positions next to at least one placed tile
    boost::container::flat_set<coords_t> frontier;

    [[nodiscard]] std::optional<OrientedTile> &slot(coords_t pos) {
        return slots[pos.first * cols + pos.second];
    }
    [[nodiscard]] const std::optional<OrientedTile> &slot(coords_t pos) const {
        return slots[pos.first * cols + pos.second];
    }

    [[nodiscard]] bool has_placed_neighbour(coords_t pos) const;

    // placed neighbours in probing order, stopping after upto
    [[nodiscard]] Conflict neighbour_ids(coords_t pos, std::optional<tile_id_t> upto = {}) const;

public:
    Arrangement(int h, int w, const std::vector<Tile> &tiles);

    [[nodiscard]] int height() const { return rows; }
    [[nodiscard]] int width() const { return cols; }

    [[nodiscard]] bool valid(coords_t pos) const {
        return 0 <= pos.first && pos.first < rows
            && 0 <= pos.second && pos.second < cols;
    }

    // empty when out of bounds
    [[nodiscard]] std::optional<OrientedTile> at(coords_t pos) const {
        if (!valid(pos))
            return {};
        return slot(pos);
    }

    [[nodiscard]] std::optional<tile_id_t> tile_id_at(coords_t pos) const {
        if (auto ot = at(pos))
            return ot->tile_id;
        return {};
    }

    [[nodiscard]] const auto &available() const { return pool; }
    [[nodiscard]] const auto &next_positions() const { return frontier; }

    [[nodiscard]] bool complete() const;

    // tile_id must be available and pos empty
    void place(coords_t pos, Orientation o, tile_id_t tile_id);

    // pos must be occupied; undoes place
    void remove(coords_t pos);

    // intersection over the placed neighbours of pos (at least one)
    // error: the neighbour that left nothing
    [[nodiscard]] std::expected<oriented_set_t, tile_id_t> possible_orientations(
            coords_t pos, const AllowedOrientedTiles &allowed) const;

    // fills the frontier depth-first, with conflict-directed backjumping
    // on failure *this is unchanged
    std::expected<void, Conflict> try_arrange(const AllowedOrientedTiles &allowed);

    // interiors of every tile, row-major; must be complete()
    [[nodiscard]] Image image() const;

    bool operator==(const Arrangement &other) const = default;
};

// every tile in every orientation as the anchor at (0, 0)
[[nodiscard]] std::optional<Arrangement> arrange_tiles(int h, int w, const std::vector<Tile> &tiles);

// square grid
[[nodiscard]] std::optional<Arrangement> arrange_tiles(const std::vector<Tile> &tiles);

template <>
struct fmt::formatter<Arrangement> : formatter<string_view> {
    auto format(const Arrangement &c, format_context &ctx) const
        -> format_context::iterator;
};
