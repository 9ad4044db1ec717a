#ifndef LINK_H
#define LINK_H

#include "lattice/Direction.h"

/**
 * Single lattice bond.
 *
 * A link is created either as a free proposal (direction only) or placed at a
 * start site. The end site is always derived from start + delta(direction).
 */
class Link {
public:
    explicit Link(Direction direction);
    Link(Direction direction, const Site& start);

    void placeAt(const Site& start);

    Direction direction() const { return direction_; }
    bool placed() const { return placed_; }

    // Both throw InvalidStateError when the link has not been placed
    const Site& start() const;
    Site end() const;

private:
    Direction direction_;
    Site start_{};
    bool placed_ = false;
};

#endif
