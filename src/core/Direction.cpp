#include "topomap/core/Direction.h"

#include <algorithm>
#include <cctype>

namespace topomap {

Direction directionFromString(const std::string& str) {
    std::string s = str;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (s == "n" || s == "north") return Direction::N;
    if (s == "ne" || s == "northeast" || s == "north-east") return Direction::NE;
    if (s == "e" || s == "east") return Direction::E;
    if (s == "se" || s == "southeast" || s == "south-east") return Direction::SE;
    if (s == "s" || s == "south") return Direction::S;
    if (s == "sw" || s == "southwest" || s == "south-west") return Direction::SW;
    if (s == "w" || s == "west") return Direction::W;
    if (s == "nw" || s == "northwest" || s == "north-west") return Direction::NW;
    return Direction::None;
}

std::string directionToString(Direction dir) {
    switch (dir) {
        case Direction::N:  return "n";
        case Direction::NE: return "ne";
        case Direction::E:  return "e";
        case Direction::SE: return "se";
        case Direction::S:  return "s";
        case Direction::SW: return "sw";
        case Direction::W:  return "w";
        case Direction::NW: return "nw";
        case Direction::None: break;
    }
    return "";
}

Direction opposite(Direction dir) {
    switch (dir) {
        case Direction::N:  return Direction::S;
        case Direction::NE: return Direction::SW;
        case Direction::E:  return Direction::W;
        case Direction::SE: return Direction::NW;
        case Direction::S:  return Direction::N;
        case Direction::SW: return Direction::NE;
        case Direction::W:  return Direction::E;
        case Direction::NW: return Direction::SE;
        case Direction::None: break;
    }
    return Direction::None;
}

GridPos directionOffset(Direction dir) {
    switch (dir) {
        case Direction::N:  return {0, -1};
        case Direction::NE: return {1, -1};
        case Direction::E:  return {1, 0};
        case Direction::SE: return {1, 1};
        case Direction::S:  return {0, 1};
        case Direction::SW: return {-1, 1};
        case Direction::W:  return {-1, 0};
        case Direction::NW: return {-1, -1};
        case Direction::None: break;
    }
    return {0, 0};
}

}  // namespace topomap
