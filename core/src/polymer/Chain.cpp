#include "polymer/Chain.h"
#include "polymer/Conflict.h"
#include "lattice/Errors.h"
#include <stdexcept>

Anchor parseAnchor(const std::string& name) {
    if (name == "start") return Anchor::Start;
    if (name == "end") return Anchor::End;
    throw std::invalid_argument("anchor must be 'start' or 'end' (got '" + name + "')");
}

const char* anchorName(Anchor anchor) {
    return anchor == Anchor::Start ? "start" : "end";
}

Chain::Chain(const Site& origin, Direction seed) : origin_(origin) {
    Link first(seed, origin);
    const Site end = first.end();

    links_.push_back(first);
    nodes_.push_back(origin);
    nodes_.push_back(end);
    occupied_.insert(origin);
    occupied_.insert(end);

    branchingFactors_.push_back(kSeedBranchingFactor);
    weights_.push_back(static_cast<double>(kSeedBranchingFactor));
}

const Site& Chain::anchor(Anchor which) const {
    switch (which) {
        case Anchor::Start: return startAnchor();
        case Anchor::End:   return endAnchor();
    }
    throw std::invalid_argument("growth anchor must be Anchor::Start or Anchor::End (got " +
                                std::to_string(static_cast<int>(which)) + ")");
}

std::vector<Direction> Chain::directions() const {
    std::vector<Direction> out;
    out.reserve(links_.size());
    for (const auto& link : links_) {
        out.push_back(link.direction());
    }
    return out;
}

int Chain::append(Direction direction, Anchor at) {
    if (pruned_) {
        throw InvalidStateError("cannot append to a pruned chain");
    }

    Link link(direction, anchor(at));
    if (conflict(*this, link)) {
        const Site end = link.end();
        throw SelfIntersectionError("move " + std::string(directionName(direction)) + " from " +
                                    anchorName(at) + " anchor to (" + std::to_string(end.x) + "," +
                                    std::to_string(end.y) + ") conflicts with the chain");
    }

    // Valid moves from this anchor before committing (includes `direction`)
    const int m = static_cast<int>(validDirections(*this, at).size());
    const Site end = link.end();
    const double weight = weights_.back() * m;

    if (at == Anchor::Start) {
        // Stored reversed so the new first link runs into the old start
        links_.push_front(Link(opposite(direction), end));
        nodes_.push_front(end);
    } else {
        links_.push_back(link);
        nodes_.push_back(end);
    }
    occupied_.insert(end);
    branchingFactors_.push_back(m);
    weights_.push_back(weight);
    return m;
}

void Chain::markDeadEnd() {
    deadEnd_ = true;
    pruned_ = true;
}

void Chain::setLastWeight(double weight) {
    if (pruned_) {
        throw InvalidStateError("weight correction on a pruned chain");
    }
    weights_.back() = weight;
}

void Chain::scaleLastWeight(double factor) {
    setLastWeight(weights_.back() * factor);
}
