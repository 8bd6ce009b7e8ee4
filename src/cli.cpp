#include "cli.hpp"

#include <chrono>
#include <cstdio>
#include <exception>

#include <fmt/format.h>

#include "config.hpp"
#include "input.hpp"
#include "puzzle.hpp"
#include "util.hpp"

int run(int argc, char *argv[]) {
    if (argc < 2) {
        fmt::print(stderr, "usage: {} <tiles-file>\n"
                "  env V=0..3       verbosity (default 1)\n"
                "  env MONSTER=file pattern to search instead of the sea monster\n",
                argc ? argv[0] : "jigsaw");
        return 1;
    }

    try {
        auto cfg = Config::load(argv[1]);
        g_verbose = cfg.verbose;

        auto tiles = load_tiles(cfg.input);
        auto pattern = cfg.pattern ? load_pattern(*cfg.pattern) : Image::from_string(SEA_MONSTER);

        auto t1 = std::chrono::steady_clock::now();
        auto arrangement = arrange_tiles(tiles);
        if (!arrangement) {
            fmt::print(stderr, "########### ERROR: no arrangement of {} tiles found\n", tiles.size());
            return 2;
        }
        if (g_verbose >= 1)
            fmt::print(stderr, "{}", *arrangement);
        fmt::print("part 1 {}\n", corner_product(*arrangement));

        auto report = water_roughness(*arrangement, pattern);
        if (g_verbose >= 1)
            fmt::print(stderr, "{} monster(s) found\n", report.monsters);
        fmt::print("part 2 {}\n", report.roughness);

        auto t2 = std::chrono::steady_clock::now();
        if (g_verbose >= 1)
            fmt::print(stderr, "  => completed in {}\n",
                    display(std::chrono::duration<double>(t2 - t1).count()));
    } catch (const std::exception &e) {
        fmt::print(stderr, "error: {}\n", e.what());
        return 1;
    }
    return 0;
}
