#ifndef CONFLICT_H
#define CONFLICT_H

#include <vector>
#include "lattice/Direction.h"
#include "lattice/Link.h"
#include "polymer/Chain.h"

// True if appending `candidate` would break self-avoidance:
//   - its end site is already occupied,
//   - it does not start at one of the two anchors,
//   - it closes a loop onto the start anchor.
// The candidate must be placed (InvalidStateError otherwise).
bool conflict(const Chain& chain, const Link& candidate);

// Candidate built from the given anchor; does not touch the chain
bool conflict(const Chain& chain, Anchor from, Direction direction);

// Directions that can be appended at `from`, in East, North, West, South order
std::vector<Direction> validDirections(const Chain& chain, Anchor from);

#endif
