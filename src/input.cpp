#include "input.hpp"

#include <charconv>
#include <fstream>
#include <ranges>
#include <sstream>
#include <stdexcept>
#include <string>

#include <boost/container/flat_set.hpp>
#include <fmt/format.h>

#include "util.hpp"

static std::string read_file(const std::filesystem::path &path) {
    std::ifstream fin(path);
    if (!fin)
        throw std::runtime_error{ fmt::format("cannot open {}", path.string()) };
    std::stringstream buffer;
    buffer << fin.rdbuf();
    return buffer.str();
}

static tile_id_t parse_header(std::string_view line, size_t lineno) {
    constexpr std::string_view prefix = "Tile ";
    auto bad = [&] {
        return std::runtime_error{ fmt::format(
                "line {}: expected \"Tile <id>:\", got \"{}\"", lineno, line) };
    };
    if (!line.starts_with(prefix) || !line.ends_with(':'))
        throw bad();
    auto digits = line.substr(prefix.size(), line.size() - prefix.size() - 1);
    tile_id_t id{};
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), id);
    if (digits.empty() || ec != std::errc{} || ptr != digits.data() + digits.size() || !id)
        throw bad();
    return id;
}

std::vector<Tile> parse_tiles(std::string_view sv) {
    std::vector<std::string> lines;
    for (auto &&part : sv | std::views::split('\n')) {
        std::string line(part.begin(), part.end());
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        lines.push_back(std::move(line));
    }

    std::vector<Tile> tiles;
    boost::container::flat_set<tile_id_t> seen;
    for (auto i = 0zu; i < lines.size();) {
        if (lines[i].empty()) {
            i++;
            continue;
        }
        auto header = i + 1;
        auto id = parse_header(lines[i++], header);
        if (!seen.insert(id).second)
            throw std::runtime_error{ fmt::format("line {}: duplicate tile {}", header, id) };

        std::vector<std::string> rows;
        for (; i < lines.size() && !lines[i].empty(); i++) {
            for (auto ch : lines[i])
                if (ch != Image::FILLED && ch != Image::EMPTY)
                    throw std::runtime_error{ fmt::format(
                            "line {}: invalid cell '{}' in tile {}", i + 1, ch, id) };
            if (lines[i].size() != EDGE_LEN)
                throw std::runtime_error{ fmt::format(
                        "line {}: tile {} row has {} cells, expected {}",
                        i + 1, id, lines[i].size(), EDGE_LEN) };
            rows.push_back(lines[i]);
        }
        if (rows.size() != EDGE_LEN)
            throw std::runtime_error{ fmt::format(
                    "line {}: tile {} has {} rows, expected {}", header, id, rows.size(), EDGE_LEN) };
        tiles.push_back(Tile::from_rows(id, rows));
    }
    if (tiles.empty())
        throw std::runtime_error{ "no tile found" };
    return tiles;
}

std::vector<Tile> load_tiles(const std::filesystem::path &path) {
    auto tiles = parse_tiles(read_file(path));
    if (g_verbose >= 1)
        fmt::print(stderr, "loaded {} tiles from {}\n", tiles.size(), path.string());
    return tiles;
}

Image load_pattern(const std::filesystem::path &path) {
    auto pattern = Image::from_string(read_file(path));
    if (!pattern.count(Image::FILLED))
        throw std::runtime_error{ fmt::format("pattern {} has no required cell", path.string()) };
    return pattern;
}
