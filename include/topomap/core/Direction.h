#pragma once

#include "Types.h"

#include <array>
#include <string>

namespace topomap {

/// Compass direction on the grid. Y grows towards the south.
enum class Direction {
    None,
    N,
    NE,
    E,
    SE,
    S,
    SW,
    W,
    NW
};

/// The eight real directions in clockwise order starting at north
constexpr std::array<Direction, 8> kCompassDirections = {
    Direction::N, Direction::NE, Direction::E, Direction::SE,
    Direction::S, Direction::SW, Direction::W, Direction::NW};

/// Parse "n", "north", "ne", "north-east", "northeast", ... (case-insensitive).
/// Unknown strings map to Direction::None.
Direction directionFromString(const std::string& str);

/// Short form ("n", "ne", ...), empty for Direction::None
std::string directionToString(Direction dir);

Direction opposite(Direction dir);

/// Unit step for the direction, {0, 0} for Direction::None
GridPos directionOffset(Direction dir);

inline GridPos moveGridPos(const GridPos& pos, Direction dir) {
    return pos + directionOffset(dir);
}

inline bool isCardinal(Direction dir) {
    return dir == Direction::N || dir == Direction::E ||
           dir == Direction::S || dir == Direction::W;
}

}  // namespace topomap
