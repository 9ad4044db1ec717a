#ifndef OBSERVABLES_H
#define OBSERVABLES_H

#include <deque>
#include <vector>
#include "lattice/Direction.h"

class Chain;

/**
 * Per-step chain observables.
 *
 * Index i describes the chain after i+1 links (nodes 0..i+1):
 *   endToEnd[i] = squared distance between node 0 and node i+1
 *   gyration[i] = mean squared distance of nodes 0..i+1 from their centre of mass
 */
struct Observables {
    std::vector<double> endToEnd;
    std::vector<double> gyration;
};

Observables computeObservables(const Chain& chain);
Observables computeObservables(const std::vector<Site>& nodes);
Observables computeObservables(const std::deque<Site>& nodes);

// Squared radius of gyration of the first `count` nodes (0 for a single node)
double gyrationOf(const std::vector<Site>& nodes, std::size_t count);

// weight[i] = product of factors[0..i]
std::vector<double> rosenbluthWeights(const std::vector<int>& branchingFactors);

struct CentreOfMass {
    double x = 0.0;
    double y = 0.0;
};

// Centre of mass of the first `count` nodes
CentreOfMass centreOfMass(const std::vector<Site>& nodes, std::size_t count);

#endif
