#ifndef GROWTH_H
#define GROWTH_H

#include <random>
#include <vector>
#include "lattice/Direction.h"
#include "polymer/Chain.h"

/**
 * Rosenbluth chain growth.
 *
 * Every stochastic choice draws from the caller's engine so that a fixed seed
 * reproduces the same chains.
 */

// Single-link chain at `origin` with a uniformly random seed direction
Chain newChain(const Site& origin, std::mt19937_64& rng);

// One growth attempt at `from`. Returns the branching factor m (0..4).
// m > 0: a uniformly chosen valid move is appended.
// m == 0: nothing is appended and the chain is marked as a pruned dead end.
// Pruned chains are left alone and report 0 without consuming randomness.
int growStep(Chain& chain, Anchor from, std::mt19937_64& rng);

// Grow at the end anchor until `targetLength` links or a dead end.
// Returns the achieved length (may be short of the target).
int growTo(Chain& chain, int targetLength, std::mt19937_64& rng);

// Free (non-self-avoiding) random walk of `length` links, origin first
std::vector<Site> freeWalk(const Site& origin, int length, std::mt19937_64& rng);

#endif
