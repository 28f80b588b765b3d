#include <gtest/gtest.h>
#include <topomap/core/Direction.h>

using namespace topomap;

// ============================================================================
// Parsing
// ============================================================================

TEST(DirectionTest, FromString_ShortForms) {
    EXPECT_EQ(directionFromString("n"), Direction::N);
    EXPECT_EQ(directionFromString("ne"), Direction::NE);
    EXPECT_EQ(directionFromString("e"), Direction::E);
    EXPECT_EQ(directionFromString("se"), Direction::SE);
    EXPECT_EQ(directionFromString("s"), Direction::S);
    EXPECT_EQ(directionFromString("sw"), Direction::SW);
    EXPECT_EQ(directionFromString("w"), Direction::W);
    EXPECT_EQ(directionFromString("nw"), Direction::NW);
}

TEST(DirectionTest, FromString_LongFormsIgnoreCase) {
    EXPECT_EQ(directionFromString("North"), Direction::N);
    EXPECT_EQ(directionFromString("south-west"), Direction::SW);
    EXPECT_EQ(directionFromString("NORTHEAST"), Direction::NE);
}

TEST(DirectionTest, FromString_UnknownIsNone) {
    EXPECT_EQ(directionFromString(""), Direction::None);
    EXPECT_EQ(directionFromString("c"), Direction::None);
    EXPECT_EQ(directionFromString("up"), Direction::None);
}

TEST(DirectionTest, ToString_ParsesBack) {
    for (Direction dir : kCompassDirections) {
        EXPECT_EQ(directionFromString(directionToString(dir)), dir);
    }
    EXPECT_EQ(directionToString(Direction::None), "");
}

// ============================================================================
// Offsets
// ============================================================================

TEST(DirectionTest, Offset_SouthGrowsY) {
    EXPECT_EQ(directionOffset(Direction::N), GridPos(0, -1));
    EXPECT_EQ(directionOffset(Direction::S), GridPos(0, 1));
    EXPECT_EQ(directionOffset(Direction::E), GridPos(1, 0));
    EXPECT_EQ(directionOffset(Direction::NW), GridPos(-1, -1));
    EXPECT_EQ(directionOffset(Direction::None), GridPos(0, 0));
}

TEST(DirectionTest, Opposite_CancelsOffset) {
    for (Direction dir : kCompassDirections) {
        EXPECT_EQ(opposite(opposite(dir)), dir);
        EXPECT_EQ(directionOffset(dir) + directionOffset(opposite(dir)), GridPos(0, 0));
    }
}

TEST(DirectionTest, MoveGridPos) {
    EXPECT_EQ(moveGridPos({3, 3}, Direction::SE), GridPos(4, 4));
    EXPECT_EQ(moveGridPos({3, 3}, Direction::None), GridPos(3, 3));
}

TEST(DirectionTest, IsCardinal) {
    int cardinal = 0;
    for (Direction dir : kCompassDirections) {
        if (isCardinal(dir)) ++cardinal;
    }
    EXPECT_EQ(cardinal, 4);
    EXPECT_FALSE(isCardinal(Direction::NE));
    EXPECT_FALSE(isCardinal(Direction::None));
}
