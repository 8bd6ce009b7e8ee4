#include "compat.hpp"
#include "fixtures.hpp"

#include <fmt/format.h>
#include <gtest/gtest.h>

TEST(compat, agreesWithDirectComparison) {
    auto &tiles = example_tiles();
    AllowedOrientedTiles allowed{ tiles };
    EXPECT_EQ(allowed.size(), tiles.size() * 8 * 4);

    for (auto &a : tiles)
        for (auto oa : all_orientations)
            for (auto r : all_relationships) {
                auto &set = allowed.get(a.id, oa, r);
                auto mine = a.edge(facing_side(r), oa);
                for (auto &b : tiles)
                    for (auto ob : all_orientations) {
                        auto expected = a.id != b.id
                            && b.edge(opposite(facing_side(r)), ob) == mine;
                        EXPECT_EQ(set.count(OrientedTile{ b.id, ob }) == 1, expected)
                            << fmt::format("{} {} -> {} {}", a.id, oa, b.id, ob);
                    }
            }
}

TEST(compat, rightOfMatchesLeftEdges) {
    auto &tiles = example_tiles();
    AllowedOrientedTiles allowed{ tiles };
    for (auto &a : tiles)
        for (auto oa : all_orientations)
            for (auto ot : allowed.get(a.id, oa, Relationship::RightOf))
                EXPECT_EQ(example_tile(ot.tile_id).edge(Side::Left, ot.orientation),
                        a.edge(Side::Right, oa));
}

TEST(compat, knownNeighboursOfTheExample) {
    AllowedOrientedTiles allowed{ example_tiles() };
    auto y = Orientation::FlipY;
    EXPECT_TRUE(allowed.get(1951, y, Relationship::Below).count({ 2729, y }));
    EXPECT_TRUE(allowed.get(1951, y, Relationship::RightOf).count({ 2311, y }));
    EXPECT_TRUE(allowed.get(2729, y, Relationship::Below).count({ 2971, y }));
    EXPECT_TRUE(allowed.get(2311, y, Relationship::RightOf).count({ 3079, Orientation::Identity }));
    EXPECT_EQ(allowed.get(1951, y, Relationship::Below).size(), 1u);
}

TEST(compat, unknownTileYieldsEmptySet) {
    AllowedOrientedTiles allowed{ example_tiles() };
    EXPECT_TRUE(allowed.get(42, Orientation::Identity, Relationship::Above).empty());
}

TEST(compat, formatsOrientedTiles) {
    EXPECT_EQ(fmt::format("{}", OrientedTile{ 1951, Orientation::FlipY }), "1951/FlipY");
}
