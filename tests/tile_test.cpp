#include "Tile.hpp"
#include "input.hpp"
#include "fixtures.hpp"

#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

static std::string tile_text(tile_id_t id, size_t rows = EDGE_LEN, size_t cols = EDGE_LEN) {
    std::string txt = "Tile " + std::to_string(id) + ":\n";
    for (auto r = 0zu; r < rows; r++)
        txt += std::string(cols, r % 2 ? '#' : '.') + "\n";
    return txt;
}

TEST(tile, parsesTheExample) {
    auto &tiles = example_tiles();
    ASSERT_EQ(tiles.size(), 9u);

    auto &t = tiles.front();
    EXPECT_EQ(t.id, 2311u);
    EXPECT_EQ(t.edge(Side::Top), 0x0d2);
    EXPECT_EQ(t.edge(Side::Bottom), 0x0e7);
    EXPECT_EQ(t.edge(Side::Left), 0x1f2);
    EXPECT_EQ(t.edge(Side::Right), 0x059);

    ASSERT_EQ(t.content.height(), EDGE_LEN - 2);
    ASSERT_EQ(t.content.width(), EDGE_LEN - 2);
    EXPECT_EQ(t.content.to_string(),
            "#..#....\n"
            "...##..#\n"
            "###.#...\n"
            "#.##.###\n"
            "#...#.##\n"
            "#.#.#..#\n"
            ".#....#.\n"
            "##...#.#\n");
}

TEST(tile, equalityIsById) {
    EXPECT_EQ(example_tile(1951), example_tile(1951));
    EXPECT_FALSE(example_tile(1951) == example_tile(2311));
}

TEST(tile, acceptsCrlfAndExtraBlankLines) {
    std::string txt = "\r\n\r\n" + tile_text(7) + "\n\n\n" + tile_text(8);
    for (auto pos = txt.find('\n', 4); pos != std::string::npos; pos = txt.find('\n', pos + 2))
        txt.insert(pos, "\r");
    auto tiles = parse_tiles(txt);
    ASSERT_EQ(tiles.size(), 2u);
    EXPECT_EQ(tiles[0].id, 7u);
    EXPECT_EQ(tiles[1].id, 8u);
    EXPECT_EQ(tiles[0].edge(Side::Top), 0);
    EXPECT_EQ(tiles[0].edge(Side::Bottom), EDGE_MASK);
    EXPECT_EQ(tiles[0].edge(Side::Left), 0b0101010101);
}

TEST(tile, rejectsMalformedInput) {
    EXPECT_THROW((void)parse_tiles(""), std::runtime_error);
    EXPECT_THROW((void)parse_tiles("..........\n"), std::runtime_error);
    EXPECT_THROW((void)parse_tiles("Tile x:\n"), std::runtime_error);
    EXPECT_THROW((void)parse_tiles("Tile 0:\n"), std::runtime_error);
    EXPECT_THROW((void)parse_tiles("Tile 12\n"), std::runtime_error);
    EXPECT_THROW((void)parse_tiles(tile_text(1, EDGE_LEN - 1)), std::runtime_error);
    EXPECT_THROW((void)parse_tiles(tile_text(1, EDGE_LEN + 1)), std::runtime_error);
    EXPECT_THROW((void)parse_tiles(tile_text(1, EDGE_LEN, EDGE_LEN + 1)), std::runtime_error);
    EXPECT_THROW((void)parse_tiles(tile_text(1) + "\n" + tile_text(1)), std::runtime_error);

    auto bad = tile_text(1);
    bad[bad.find('.')] = 'x';
    EXPECT_THROW((void)parse_tiles(bad), std::runtime_error);
}

TEST(tile, errorsNameTheLine) {
    try {
        (void)parse_tiles(tile_text(1) + "\nTile 2\n");
        FAIL() << "expected a parse error";
    } catch (const std::runtime_error &e) {
        EXPECT_NE(std::string{ e.what() }.find("line 13"), std::string::npos) << e.what();
    }
}

TEST(tile, fromRowsValidates) {
    std::vector<std::string> rows(EDGE_LEN, std::string(EDGE_LEN, '.'));
    EXPECT_NO_THROW((void)Tile::from_rows(1, rows));
    rows.back().push_back('.');
    EXPECT_THROW((void)Tile::from_rows(1, rows), std::runtime_error);
    rows.pop_back();
    EXPECT_THROW((void)Tile::from_rows(1, rows), std::runtime_error);
}

TEST(tile, loadReportsMissingFiles) {
    EXPECT_THROW((void)load_tiles(data_path("does-not-exist.txt")), std::runtime_error);
}
