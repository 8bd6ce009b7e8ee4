#include "Image.hpp"

#include <algorithm>
#include <ranges>
#include <stdexcept>

#include "util.hpp"

Image::Image(std::vector<std::string> rs) : cells{ std::move(rs) } {
    if (cells.empty() || cells.front().empty())
        throw std::runtime_error{ "image must not be empty" };
    rows = cells.size();
    cols = cells.front().size();
    for (auto row = 0zu; row < rows; row++)
        if (cells[row].size() != cols)
            throw std::runtime_error{ fmt::format(
                    "image row {} has {} cells, expected {}", row, cells[row].size(), cols) };
}

Image Image::from_string(std::string_view sv) {
    std::vector<std::string> lines;
    for (auto &&part : sv | std::views::split('\n')) {
        std::string line(part.begin(), part.end());
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        lines.push_back(std::move(line));
    }
    while (!lines.empty() && lines.back().empty())
        lines.pop_back();
    if (lines.empty())
        throw std::runtime_error{ "image must not be empty" };
    auto w = std::ranges::max(lines, {}, [](const std::string &l) { return l.size(); }).size();
    for (auto &line : lines)
        line.resize(w, ' ');
    return Image{ std::move(lines) };
}

size_t Image::count(char ch) const {
    auto n = 0zu;
    for (auto &row : cells)
        n += std::ranges::count(row, ch);
    return n;
}

bool Image::fits_at(coords_t origin, const Image &pattern) const {
    auto [oy, ox] = origin;
    return oy >= 0 && ox >= 0
        && static_cast<size_t>(oy) + pattern.height() <= height()
        && static_cast<size_t>(ox) + pattern.width() <= width();
}

bool Image::matches_at(coords_t origin, const Image &pattern) const {
    if (!fits_at(origin, pattern))
        return false;
    auto [oy, ox] = origin;
    for (auto y = 0zu; y < pattern.height(); y++)
        for (auto x = 0zu; x < pattern.width(); x++) {
            coords_t p{ static_cast<int>(y), static_cast<int>(x) };
            if (pattern.at(p) != FILLED)
                continue;
            if (!filled({ oy + p.first, ox + p.second }))
                return false;
        }
    return true;
}

void Image::mark_at(coords_t origin, const Image &pattern) {
    if (!fits_at(origin, pattern))
        throw std::runtime_error{ fmt::format("{}x{} pattern does not fit at ({}, {}) in {}x{} image",
                pattern.height(), pattern.width(), origin.first, origin.second, height(), width()) };
    auto [oy, ox] = origin;
    for (auto y = 0zu; y < pattern.height(); y++)
        for (auto x = 0zu; x < pattern.width(); x++) {
            coords_t p{ static_cast<int>(y), static_cast<int>(x) };
            if (pattern.at(p) == FILLED)
                at({ oy + p.first, ox + p.second }) = MARKED;
        }
}

size_t Image::mark_matches(const Image &pattern) {
    if (pattern.height() > height() || pattern.width() > width())
        return 0;
    auto n = 0zu;
    for (auto y = 0zu; y + pattern.height() <= height(); y++)
        for (auto x = 0zu; x + pattern.width() <= width(); x++) {
            coords_t origin{ static_cast<int>(y), static_cast<int>(x) };
            if (!matches_at(origin, pattern))
                continue;
            mark_at(origin, pattern);
            n++;
        }
    return n;
}

MonsterReport Image::find_monsters(const Image &pattern) {
    if (!pattern.count(FILLED))
        throw std::runtime_error{ "pattern has no required cell" };
    auto original = orient;
    for (auto o : all_orientations) {
        reorient(o);
        auto n = mark_matches(pattern);
        if (g_verbose >= 2)
            fmt::print(stderr, "monsters: {} match(es) in {}\n", n, o);
        if (n)
            return MonsterReport{ o, n, count(FILLED) };
    }
    reorient(original);
    return MonsterReport{ std::nullopt, 0, count(FILLED) };
}

std::string Image::to_string() const {
    std::string txt;
    txt.reserve((width() + 1) * height());
    for (auto y = 0zu; y < height(); y++) {
        for (auto x = 0zu; x < width(); x++)
            txt.push_back(at({ static_cast<int>(y), static_cast<int>(x) }));
        txt.push_back('\n');
    }
    return txt;
}

auto fmt::formatter<Image>::format(const Image &c, format_context &ctx) const
    -> format_context::iterator {
    return formatter<string_view>::format(c.to_string(), ctx);
}
