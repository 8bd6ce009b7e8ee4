#include "compat.hpp"

#include <chrono>

#include <boost/container_hash/hash.hpp>

#include "util.hpp"

size_t AllowedOrientedTiles::hasher::operator()(const entry_key &k) const {
    size_t h{};
    boost::hash_combine(h, k.tile_id);
    boost::hash_combine(h, static_cast<uint8_t>(k.orientation));
    boost::hash_combine(h, static_cast<uint8_t>(k.relationship));
    return h;
}

AllowedOrientedTiles::AllowedOrientedTiles(const std::vector<Tile> &tiles) {
    auto t1 = std::chrono::steady_clock::now();

    // oriented[i][o][s]
    std::vector<std::array<std::array<edge_t, 4>, 8>> oriented(tiles.size());
    for (auto i = 0zu; i < tiles.size(); i++)
        for (auto o : all_orientations)
            for (auto s : all_sides)
                oriented[i][static_cast<size_t>(o)][static_cast<size_t>(s)] = tiles[i].edge(s, o);
    auto edge_of = [&](size_t i, Orientation o, Side s) {
        return oriented[i][static_cast<size_t>(o)][static_cast<size_t>(s)];
    };

    neighbours.reserve(tiles.size() * all_orientations.size() * all_relationships.size());
    for (auto i = 0zu; i < tiles.size(); i++) {
        for (auto o : all_orientations) {
            for (auto r : all_relationships) {
                auto mine = edge_of(i, o, facing_side(r));
                auto theirs = opposite(facing_side(r));
                std::vector<OrientedTile> found;
                for (auto j = 0zu; j < tiles.size(); j++) {
                    if (tiles[j].id == tiles[i].id)
                        continue;
                    for (auto co : all_orientations)
                        if (edge_of(j, co, theirs) == mine)
                            found.push_back({ tiles[j].id, co });
                }
                neighbours.emplace(entry_key{ tiles[i].id, o, r },
                        oriented_set_t(found.begin(), found.end()));
            }
        }
    }

    auto t2 = std::chrono::steady_clock::now();
    if (g_verbose >= 1)
        fmt::print(stderr, "compatibility index: {} entries for {} tiles in {}\n",
                neighbours.size(), tiles.size(),
                display(std::chrono::duration<double>(t2 - t1).count()));
}

const oriented_set_t &AllowedOrientedTiles::get(tile_id_t id, Orientation o, Relationship r) const {
    auto it = neighbours.find(entry_key{ id, o, r });
    if (it == neighbours.end())
        return none;
    return it->second;
}

auto fmt::formatter<OrientedTile>::format(OrientedTile c, format_context &ctx) const
    -> format_context::iterator {
    return formatter<string_view>::format(
            fmt::format("{}/{}", c.tile_id, c.orientation), ctx);
}
