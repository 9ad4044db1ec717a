#ifndef PERM_H
#define PERM_H

#include <cstddef>
#include <random>
#include <vector>
#include "polymer/Chain.h"

// ---------- Configuration ----------
struct PermConfig {
    double biasFactor = 10.0;      // c_plus: enrichment threshold W+ = c_plus * W~
    double thresholdRatio = 10.0;  // c_plus / c_minus (Grassberger's choice)
    bool verbose = false;          // one [PERM] line per round on std::cerr
};

enum class PermStatus {
    Completed,
    PopulationExhausted  // every chain pruned before the target length
};

const char* permStatusName(PermStatus status);

// Bookkeeping for one synchronous growth round
struct RoundStats {
    int round = 0;                 // 1-based
    int chainLength = 0;           // length reached by chains that grew
    std::size_t population = 0;    // active chains at round start
    std::size_t grown = 0;
    std::size_t deadEnds = 0;
    std::size_t discarded = 0;
    std::size_t doubled = 0;
    std::size_t enriched = 0;
    double meanWeight = 0.0;       // W~
    double lowerThreshold = 0.0;   // W-
    double upperThreshold = 0.0;   // W+
};

struct PermResult {
    PermStatus status = PermStatus::Completed;
    int achievedLength = 0;
    int roundsRun = 0;
};

/**
 * Pruned-Enriched Rosenbluth population control.
 *
 * Each round grows every live chain by one link at its end anchor, then
 * compares each grown chain's weight with the population mean W~:
 *   w < W-  : discarded with probability 1/2, otherwise weight doubled
 *   w > W+  : weight halved and a deep clone appended to the population
 * Corrections overwrite the last stored weight, so they carry into all
 * later weights of that chain. The population at most doubles per round.
 */
class PopulationController {
public:
    explicit PopulationController(const PermConfig& cfg);

    // One round over `active`. Discarded chains move to `discarded`,
    // clones are appended to `active`. A round in which no chain grew
    // reports grown == 0 and changes nothing else.
    RoundStats runRound(std::vector<Chain>& active,
                        std::vector<Chain>& discarded,
                        std::mt19937_64& rng);

    // Rounds until chains reach `targetLength` or the population is exhausted
    PermResult run(std::vector<Chain>& active,
                   std::vector<Chain>& discarded,
                   int targetLength,
                   std::mt19937_64& rng);

    const std::vector<RoundStats>& history() const { return history_; }
    double upperFactor() const { return cfg_.biasFactor; }
    double lowerFactor() const { return cfg_.biasFactor / cfg_.thresholdRatio; }

private:
    PermConfig cfg_;
    std::vector<RoundStats> history_;

    void logRound(const RoundStats& s) const;
};

#endif
