#include "config.hpp"

#include <charconv>
#include <cstdlib>
#include <stdexcept>
#include <string_view>

#include <fmt/format.h>

#include "util.hpp"

unsigned g_verbose;

Config Config::load(const char *input) {
    Config cfg;
    cfg.input = input;
    if (auto v = ::getenv("V"); v && *v) {
        std::string_view sv{ v };
        auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), cfg.verbose);
        if (ec != std::errc{} || ptr != sv.data() + sv.size())
            throw std::runtime_error{ fmt::format("V must be a number, got \"{}\"", sv) };
    }
    if (auto m = ::getenv("MONSTER"); m && *m)
        cfg.pattern = m;
    return cfg;
}
