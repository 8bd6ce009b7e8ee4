#include "Tile.hpp"

#include <stdexcept>

#include <fmt/format.h>

static edge_t decode(const std::vector<std::string> &rows, coords_t from, coords_t step) {
    edge_t e{};
    auto [y, x] = from;
    for (auto i = 0zu; i < EDGE_LEN; i++, y += step.first, x += step.second)
        e = static_cast<edge_t>(e << 1u | (rows[y][x] == Image::FILLED));
    return e;
}

Tile Tile::from_rows(tile_id_t id, const std::vector<std::string> &rows) {
    if (rows.size() != EDGE_LEN)
        throw std::runtime_error{ fmt::format(
                "tile {} has {} rows, expected {}", id, rows.size(), EDGE_LEN) };
    for (auto &row : rows) {
        if (row.size() != EDGE_LEN)
            throw std::runtime_error{ fmt::format(
                    "tile {} has a row of {} cells, expected {}", id, row.size(), EDGE_LEN) };
        for (auto ch : row)
            if (ch != Image::FILLED && ch != Image::EMPTY)
                throw std::runtime_error{ fmt::format(
                        "tile {} has invalid cell '{}'", id, ch) };
    }

    constexpr auto last = static_cast<int>(EDGE_LEN) - 1;
    Tile t{ id, {}, {} };
    t.edges[static_cast<size_t>(Side::Top)] = decode(rows, { 0, 0 }, { 0, 1 });
    t.edges[static_cast<size_t>(Side::Left)] = decode(rows, { 0, 0 }, { 1, 0 });
    t.edges[static_cast<size_t>(Side::Right)] = decode(rows, { 0, last }, { 1, 0 });
    t.edges[static_cast<size_t>(Side::Bottom)] = decode(rows, { last, 0 }, { 0, 1 });

    std::vector<std::string> inner;
    for (auto row = 1zu; row + 1 < rows.size(); row++)
        inner.push_back(rows[row].substr(1, EDGE_LEN - 2));
    t.content = Image{ std::move(inner) };
    return t;
}
