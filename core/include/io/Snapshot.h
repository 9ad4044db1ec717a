#ifndef ENSEMBLE_SNAPSHOT_H
#define ENSEMBLE_SNAPSHOT_H

#include "polymer/Chain.h"
#include "polymer/Perm.h"
#include "polymer/Statistics.h"
#include <string>
#include <iosfwd>
#include <vector>

// JSON export of a single chain (nodes, directions, factors, weights)
std::string chainToJson(const Chain& chain, bool includeNodes = true);

// CSV of PERM round statistics, one line per round (with header)
void logRoundStats(const std::vector<RoundStats>& rounds, std::ostream& out);

// CSV of weighted averages per chain length (with header)
void logAverages(const WeightedAverage& endToEnd, const WeightedAverage& gyration, std::ostream& out);

#endif
