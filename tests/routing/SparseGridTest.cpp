#include <gtest/gtest.h>
#include <topomap/routing/SparseGrid.h>

#include <string>
#include <vector>

using namespace topomap;

TEST(SparseGridTest, MissingCellIsEmpty) {
    SparseGrid<bool> grid;

    EXPECT_FALSE(grid.get({0, 0}).has_value());
    EXPECT_FALSE(grid.contains({0, 0}));
    EXPECT_EQ(grid.find({0, 0}), nullptr);
    EXPECT_TRUE(grid.empty());
}

TEST(SparseGridTest, SetGetRemove) {
    SparseGrid<std::string> grid;
    grid.set({-100, 250}, "core");

    ASSERT_TRUE(grid.contains({-100, 250}));
    EXPECT_EQ(*grid.get({-100, 250}), "core");
    EXPECT_EQ(grid.size(), 1u);

    grid.set({-100, 250}, "edge");
    EXPECT_EQ(*grid.find({-100, 250}), "edge");
    EXPECT_EQ(grid.size(), 1u);

    grid.remove({-100, 250});
    EXPECT_FALSE(grid.contains({-100, 250}));
    grid.remove({1, 1});  // No-op
    EXPECT_TRUE(grid.empty());
}

TEST(SparseGridTest, AppendUniqueKeepsOrder) {
    SparseGrid<std::vector<std::string>> grid;

    EXPECT_TRUE(grid.appendUnique({1, 1}, std::string("b")));
    EXPECT_TRUE(grid.appendUnique({1, 1}, std::string("a")));
    EXPECT_FALSE(grid.appendUnique({1, 1}, std::string("b")));

    std::vector<std::string> expected{"b", "a"};
    EXPECT_EQ(*grid.get({1, 1}), expected);
}

TEST(SparseGridTest, RemoveValueDropsEmptyCell) {
    SparseGrid<std::vector<std::string>> grid;
    grid.appendUnique({0, 0}, std::string("x"));
    grid.appendUnique({0, 0}, std::string("y"));

    grid.removeValue({0, 0}, std::string("x"));
    ASSERT_TRUE(grid.contains({0, 0}));
    EXPECT_EQ(grid.find({0, 0})->size(), 1u);

    grid.removeValue({0, 0}, std::string("y"));
    EXPECT_FALSE(grid.contains({0, 0}));

    // Removing from an empty cell leaves the grid empty
    grid.removeValue({5, 5}, std::string("x"));
    EXPECT_TRUE(grid.empty());
}
