#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include "Orientation.hpp"

struct MonsterReport {
    std::optional<Orientation> orientation; // the first one with a match
    size_t monsters;
    size_t roughness; // FILLED cells not covered by any match
};

// a character grid seen through an orientation
// the orientation is a lens: storage is never copied when it changes
class Image {
public:
    static constexpr char FILLED = '#';
    static constexpr char EMPTY = '.';
    static constexpr char MARKED = 'O';

private:
    std::vector<std::string> cells; // storage, row-major
    size_t rows{}, cols{};
    Orientation orient{ Orientation::Identity };

public:
    Image() = default;

    // rows must be non-empty and of equal length
    explicit Image(std::vector<std::string> rs);

    // lines of text, shorter lines padded with spaces
    static Image from_string(std::string_view sv);

    [[nodiscard]] Orientation orientation() const { return orient; }
    void reorient(Orientation o) { orient = o; }

    [[nodiscard]] size_t height() const {
        return oriented_size(orient, rows, cols).first;
    }
    [[nodiscard]] size_t width() const {
        return oriented_size(orient, rows, cols).second;
    }
    [[nodiscard]] bool empty() const { return cells.empty(); }

    [[nodiscard]] char at(coords_t pos) const {
        auto [y, x] = apply(orient, pos, rows, cols);
        return cells[y][x];
    }
    [[nodiscard]] char &at(coords_t pos) {
        auto [y, x] = apply(orient, pos, rows, cols);
        return cells[y][x];
    }

    // through an explicit lens, ignoring orientation()
    [[nodiscard]] char at(coords_t pos, Orientation o) const {
        auto [y, x] = apply(o, pos, rows, cols);
        return cells[y][x];
    }

    [[nodiscard]] bool filled(coords_t pos) const {
        auto ch = at(pos);
        return ch == FILLED || ch == MARKED;
    }

    [[nodiscard]] size_t count(char ch) const;

    // pattern placed at origin lies entirely inside the image
    [[nodiscard]] bool fits_at(coords_t origin, const Image &pattern) const;

    // every FILLED cell of pattern lands on a filled cell of *this
    // false when the pattern does not fit
    [[nodiscard]] bool matches_at(coords_t origin, const Image &pattern) const;

    // the pattern must fit
    void mark_at(coords_t origin, const Image &pattern);

    // all matches in the current orientation, each one marked
    size_t mark_matches(const Image &pattern);

    // tries all orientations, stays in the first one that matched
    MonsterReport find_monsters(const Image &pattern);

    // logical view, one line per row
    [[nodiscard]] std::string to_string() const;
};

template <>
struct fmt::formatter<Image> : formatter<string_view> {
    auto format(const Image &c, format_context &ctx) const
        -> format_context::iterator;
};
