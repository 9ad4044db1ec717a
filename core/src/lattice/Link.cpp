#include "lattice/Link.h"
#include "lattice/Errors.h"

Link::Link(Direction direction) : direction_(direction) {}

Link::Link(Direction direction, const Site& start)
    : direction_(direction), start_(start), placed_(true) {}

void Link::placeAt(const Site& start) {
    start_ = start;
    placed_ = true;
}

const Site& Link::start() const {
    if (!placed_) {
        throw InvalidStateError("link start requested before the link was placed");
    }
    return start_;
}

Site Link::end() const {
    if (!placed_) {
        throw InvalidStateError("link end requested before a start site exists");
    }
    return step(start_, direction_);
}
