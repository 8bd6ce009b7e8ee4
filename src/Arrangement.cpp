#include "Arrangement.hpp"

#include <algorithm>
#include <chrono>
#include <iterator>
#include <stdexcept>
#include <string>

#include "util.hpp"

// offset of a neighbour, and where pos sits relative to it
static constexpr std::array<std::pair<coords_t, Relationship>, 4> probes{ {
    { { 0, -1 }, Relationship::RightOf }, // left
    { { -1, 0 }, Relationship::Below },   // up
    { { 0, +1 }, Relationship::LeftOf },  // right
    { { +1, 0 }, Relationship::Above },   // down
} };

static constexpr coords_t shift(coords_t pos, coords_t d) {
    return { pos.first + d.first, pos.second + d.second };
}

static size_t grid_size(int h, int w) {
    if (h <= 0 || w <= 0)
        throw std::runtime_error{ fmt::format("invalid grid size {}x{}", h, w) };
    return static_cast<size_t>(h) * static_cast<size_t>(w);
}

Arrangement::Arrangement(int h, int w, const std::vector<Tile> &tiles)
    : rows{ h }, cols{ w }, slots(grid_size(h, w)) {
    for (auto &t : tiles) {
        if (!catalog.emplace(t.id, &t).second)
            throw std::runtime_error{ fmt::format("duplicate tile {}", t.id) };
        pool.insert(t.id);
    }
}

bool Arrangement::has_placed_neighbour(coords_t pos) const {
    return std::ranges::any_of(probes, [&](auto &&probe) {
        auto n = shift(pos, probe.first);
        return valid(n) && slot(n);
    });
}

Conflict Arrangement::neighbour_ids(coords_t pos, std::optional<tile_id_t> upto) const {
    Conflict ids;
    for (auto &&[d, r] : probes) {
        auto n = shift(pos, d);
        if (!valid(n) || !slot(n))
            continue;
        ids.insert(slot(n)->tile_id);
        if (upto && slot(n)->tile_id == *upto)
            break;
    }
    return ids;
}

bool Arrangement::complete() const {
    return pool.empty() && std::ranges::all_of(slots,
            [](auto &&s) { return s.has_value(); });
}

void Arrangement::place(coords_t pos, Orientation o, tile_id_t tile_id) {
    if (!valid(pos))
        throw std::runtime_error{ fmt::format(
                "cannot place tile {} at ({}, {}): out of bounds", tile_id, pos.first, pos.second) };
    auto &s = slot(pos);
    if (s)
        throw std::runtime_error{ fmt::format(
                "cannot place tile {} at ({}, {}): occupied by {}",
                tile_id, pos.first, pos.second, s->tile_id) };
    if (!pool.erase(tile_id))
        throw std::runtime_error{ fmt::format(
                "trying to place unavailable tile {}", tile_id) };
    s = OrientedTile{ tile_id, o };
    frontier.erase(pos);
    for (auto &&[d, r] : probes) {
        auto n = shift(pos, d);
        if (valid(n) && !slot(n))
            frontier.insert(n);
    }
    if (g_verbose >= 3)
        fmt::print(stderr, "place {} {} at ({}, {})\n{}\n",
                tile_id, o, pos.first, pos.second, *this);
}

void Arrangement::remove(coords_t pos) {
    if (!valid(pos) || !slot(pos))
        throw std::runtime_error{ fmt::format(
                "cannot remove from ({}, {}): no tile placed", pos.first, pos.second) };
    auto tile_id = slot(pos)->tile_id;
    slot(pos).reset();
    pool.insert(tile_id);
    for (auto &&[d, r] : probes) {
        auto n = shift(pos, d);
        if (valid(n) && !slot(n) && !has_placed_neighbour(n))
            frontier.erase(n);
    }
    if (has_placed_neighbour(pos))
        frontier.insert(pos);
    if (g_verbose >= 3)
        fmt::print(stderr, "remove {} from ({}, {})\n{}\n",
                tile_id, pos.first, pos.second, *this);
}

std::expected<oriented_set_t, tile_id_t> Arrangement::possible_orientations(
        coords_t pos, const AllowedOrientedTiles &allowed) const {
    std::optional<oriented_set_t> possible; // unrestricted until the first neighbour
    for (auto &&[d, r] : probes) {
        auto n = shift(pos, d);
        if (!valid(n) || !slot(n))
            continue;
        auto [id, o] = *slot(n);
        auto &compatible = allowed.get(id, o, r);
        if (!possible) {
            possible = compatible;
        } else {
            oriented_set_t::sequence_type both;
            std::set_intersection(possible->begin(), possible->end(),
                    compatible.begin(), compatible.end(), std::back_inserter(both));
            possible->adopt_sequence(boost::container::ordered_unique_range, std::move(both));
        }
        if (possible->empty())
            return std::unexpected{ id };
    }
    if (!possible)
        throw std::runtime_error{ fmt::format(
                "tried to place a tile with no neighbours at ({}, {})", pos.first, pos.second) };
    return std::move(*possible);
}

std::expected<void, Conflict> Arrangement::try_arrange(const AllowedOrientedTiles &allowed) {
    if (frontier.empty())
        return {};

    auto pos = *frontier.begin();
    auto candidates = possible_orientations(pos, allowed);
    if (!candidates)
        return std::unexpected{ neighbour_ids(pos, candidates.error()) };

    auto conflict = neighbour_ids(pos);
    for (auto ot : *candidates) {
        if (!pool.count(ot.tile_id)) {
            conflict.insert(ot.tile_id); // already placed elsewhere
            continue;
        }
        place(pos, ot.orientation, ot.tile_id);
        auto res = try_arrange(allowed);
        if (res)
            return res;
        remove(pos);
        auto &deeper = res.error();
        // nothing tried here can help: jump back to a shallower placement
        if (!deeper.count(ot.tile_id))
            return res;
        deeper.erase(ot.tile_id);
        conflict.insert(deeper.begin(), deeper.end());
    }
    return std::unexpected{ std::move(conflict) };
}

Image Arrangement::image() const {
    if (!complete())
        throw std::runtime_error{ "can't generate image until tiles are arranged" };
    std::vector<std::string> lines;
    for (auto ty = 0; ty < rows; ty++) {
        auto first = lines.size();
        for (auto tx = 0; tx < cols; tx++) {
            auto [id, o] = *slot({ ty, tx });
            auto &content = catalog.at(id)->content;
            auto [h, w] = oriented_size(o, content.height(), content.width());
            if (!tx)
                lines.resize(first + h);
            else if (lines.size() != first + h)
                throw std::runtime_error{ fmt::format(
                        "tile {} interior has {} rows, expected {}", id, h, lines.size() - first) };
            for (auto y = 0zu; y < h; y++)
                for (auto x = 0zu; x < w; x++)
                    lines[first + y].push_back(content.at(
                            { static_cast<int>(y), static_cast<int>(x) }, o));
        }
    }
    return Image{ std::move(lines) };
}

std::optional<Arrangement> arrange_tiles(int h, int w, const std::vector<Tile> &tiles) {
    if (tiles.empty() || static_cast<size_t>(h) * w != tiles.size())
        throw std::runtime_error{ fmt::format(
                "{} tiles cannot fill a {}x{} grid", tiles.size(), h, w) };

    AllowedOrientedTiles allowed{ tiles };
    auto t1 = std::chrono::steady_clock::now();
    for (auto &t : tiles) {
        for (auto o : all_orientations) {
            if (g_verbose >= 2)
                fmt::print(stderr, "trying {} {} in start position\n", t.id, o);
            Arrangement arrangement{ h, w, tiles };
            arrangement.place({ 0, 0 }, o, t.id);
            if (!arrangement.try_arrange(allowed))
                continue;
            auto t2 = std::chrono::steady_clock::now();
            if (g_verbose >= 1)
                fmt::print(stderr, "arranged {}x{} tiles in {}\n", h, w,
                        display(std::chrono::duration<double>(t2 - t1).count()));
            return arrangement;
        }
    }
    if (g_verbose >= 1)
        fmt::print(stderr, "no arrangement of {} tiles exists\n", tiles.size());
    return std::nullopt;
}

std::optional<Arrangement> arrange_tiles(const std::vector<Tile> &tiles) {
    auto side = 0zu;
    while ((side + 1) * (side + 1) <= tiles.size())
        side++;
    if (side * side != tiles.size())
        throw std::runtime_error{ fmt::format(
                "{} tiles cannot form a square", tiles.size()) };
    return arrange_tiles(static_cast<int>(side), static_cast<int>(side), tiles);
}

auto fmt::formatter<Arrangement>::format(const Arrangement &c, format_context &ctx) const
    -> format_context::iterator {
    std::string txt;
    for (auto y = 0; y < c.height(); y++) {
        for (auto x = 0; x < c.width(); x++)
            if (auto id = c.tile_id_at({ y, x }))
                txt += fmt::format("{:4} ", *id);
            else
                txt += "---- ";
        txt.push_back('\n');
    }
    return formatter<string_view>::format(txt, ctx);
}
