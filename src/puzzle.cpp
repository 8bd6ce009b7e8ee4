#include "puzzle.hpp"

#include <stdexcept>

#include <boost/container/flat_set.hpp>

#include "util.hpp"

uint64_t corner_product(const Arrangement &arrangement) {
    auto bottom = arrangement.height() - 1;
    auto right = arrangement.width() - 1;
    boost::container::flat_set<coords_t> corners{
        { 0, 0 }, { 0, right }, { bottom, 0 }, { bottom, right },
    };
    uint64_t product = 1;
    for (auto pos : corners) {
        auto id = arrangement.tile_id_at(pos);
        if (!id)
            throw std::runtime_error{ fmt::format(
                    "no tile at corner ({}, {})", pos.first, pos.second) };
        if (__builtin_mul_overflow(product, *id, &product))
            throw std::runtime_error{ fmt::format(
                    "corner product overflows at tile {}", *id) };
    }
    return product;
}

MonsterReport water_roughness(const Arrangement &arrangement, const Image &pattern) {
    auto image = arrangement.image();
    if (g_verbose >= 1)
        fmt::print(stderr, "image: {}x{}, {} filled\n",
                image.height(), image.width(), image.count(Image::FILLED));
    auto report = image.find_monsters(pattern);
    if (g_verbose >= 2 && report.orientation)
        fmt::print(stderr, "{} monster(s) in {}:\n{}", report.monsters, *report.orientation, image);
    return report;
}
