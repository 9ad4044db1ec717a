#include "lattice/Direction.h"

const char* directionName(Direction d) {
    switch (d) {
        case Direction::East:  return "east";
        case Direction::North: return "north";
        case Direction::West:  return "west";
        case Direction::South: return "south";
    }
    return "unknown";
}
