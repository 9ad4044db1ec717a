#ifndef CHAIN_H
#define CHAIN_H

#include <deque>
#include <string>
#include <unordered_set>
#include <vector>
#include "lattice/Direction.h"
#include "lattice/Link.h"

// Growth-capable chain end
enum class Anchor {
    Start,
    End
};

// Throws std::invalid_argument for anything other than "start" or "end"
Anchor parseAnchor(const std::string& name);
const char* anchorName(Anchor anchor);

// Branching factor recorded for the seed link (all four moves are free)
constexpr int kSeedBranchingFactor = 4;

/**
 * Self-avoiding lattice chain.
 *
 * Holds the ordered links, the visited sites, the per-link branching factors
 * and the running Rosenbluth weights. Chains are plain values: copying one
 * produces a fully independent chain (used for PERM enrichment).
 *
 * Links are kept in path order: links()[i].end() == links()[i + 1].start().
 * Branching factors and weights are kept in growth order.
 *
 * Invariant: links, branching factors and weights all have length() entries.
 */
class Chain {
public:
    Chain(const Site& origin, Direction seed);

    // Structure
    int length() const { return static_cast<int>(links_.size()); }
    const std::deque<Link>& links() const { return links_; }
    std::vector<Direction> directions() const;
    const Site& origin() const { return origin_; }
    const Site& startAnchor() const { return nodes_.front(); }
    const Site& endAnchor() const { return nodes_.back(); }
    const Site& anchor(Anchor which) const;

    // Node coordinates in path order, start anchor first
    const std::deque<Site>& nodes() const { return nodes_; }

    bool occupies(const Site& site) const { return occupied_.count(site) != 0; }
    const std::unordered_set<Site, SiteHash>& occupiedSites() const { return occupied_; }

    // Rosenbluth bookkeeping
    const std::vector<int>& branchingFactors() const { return branchingFactors_; }
    const std::vector<double>& weights() const { return weights_; }
    double lastWeight() const { return weights_.back(); }

    bool pruned() const { return pruned_; }
    bool deadEnd() const { return deadEnd_; }

    // Append a link at the chosen anchor. Records the number of valid moves
    // from that anchor as the branching factor and extends the weights.
    // Throws SelfIntersectionError on a conflicting move and InvalidStateError
    // on a pruned chain; in both cases nothing changes.
    int append(Direction direction, Anchor at = Anchor::End);

    void markPruned() { pruned_ = true; }
    void markDeadEnd();

    // PERM corrections: overwrite the stored last weight directly
    void setLastWeight(double weight);
    void scaleLastWeight(double factor);

private:
    Site origin_;
    std::deque<Link> links_;
    std::deque<Site> nodes_;
    std::unordered_set<Site, SiteHash> occupied_;
    std::vector<int> branchingFactors_;
    std::vector<double> weights_;
    bool pruned_ = false;
    bool deadEnd_ = false;
};

#endif
