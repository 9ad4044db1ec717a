#include "polymer/Conflict.h"

bool conflict(const Chain& chain, const Link& candidate) {
    const Site& start = candidate.start();
    const Site end = candidate.end();

    const bool cross = chain.occupies(end);
    const bool detached = (start != chain.startAnchor()) && (start != chain.endAnchor());
    const bool closesLoop = (end == chain.startAnchor());

    return cross || detached || closesLoop;
}

bool conflict(const Chain& chain, Anchor from, Direction direction) {
    return conflict(chain, Link(direction, chain.anchor(from)));
}

std::vector<Direction> validDirections(const Chain& chain, Anchor from) {
    std::vector<Direction> options;
    options.reserve(kNumDirections);
    const Site& origin = chain.anchor(from);
    for (Direction d : kAllDirections) {
        if (!conflict(chain, Link(d, origin))) {
            options.push_back(d);
        }
    }
    return options;
}
