#ifndef DIRECTION_H
#define DIRECTION_H

#include <array>
#include <cstddef>
#include <cstdint>

// ---------- Lattice Site ----------
struct Site {
    int x = 0;
    int y = 0;

    bool operator==(const Site& other) const {
        return x == other.x && y == other.y;
    }
    bool operator!=(const Site& other) const {
        return !(*this == other);
    }
};

// Hash functor for unordered containers keyed by lattice site
struct SiteHash {
    std::size_t operator()(const Site& s) const {
        // Pack both coordinates into 64 bits, then mix
        std::uint64_t combined = (static_cast<std::uint64_t>(static_cast<std::uint32_t>(s.x)) << 32) |
                                  static_cast<std::uint64_t>(static_cast<std::uint32_t>(s.y));
        combined ^= (combined >> 33);
        combined *= 0xff51afd7ed558ccdULL;
        combined ^= (combined >> 33);
        combined *= 0xc4ceb9fe1a85ec53ULL;
        combined ^= (combined >> 33);
        return static_cast<std::size_t>(combined);
    }
};

// ---------- Lattice Moves ----------
// Index order matches the angle encoding (0 = +x, 1 = +y, 2 = -x, 3 = -y)
enum class Direction : std::uint8_t {
    East = 0,
    North = 1,
    West = 2,
    South = 3
};

constexpr int kNumDirections = 4;

constexpr std::array<Direction, kNumDirections> kAllDirections = {
    Direction::East, Direction::North, Direction::West, Direction::South
};

struct Delta {
    int dx;
    int dy;
};

constexpr std::array<Delta, kNumDirections> kDirectionDeltas = {{
    {1, 0},   // East
    {0, 1},   // North
    {-1, 0},  // West
    {0, -1}   // South
}};

inline Delta delta(Direction d) {
    return kDirectionDeltas[static_cast<std::size_t>(d)];
}

inline Site step(const Site& from, Direction d) {
    const Delta dd = delta(d);
    return Site{from.x + dd.dx, from.y + dd.dy};
}

// Reverse move: step(step(s, d), opposite(d)) == s
inline Direction opposite(Direction d) {
    return static_cast<Direction>((static_cast<int>(d) + 2) % kNumDirections);
}

const char* directionName(Direction d);

#endif
