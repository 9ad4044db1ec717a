#ifndef ENSEMBLE_H
#define ENSEMBLE_H

#include <cstdint>
#include <random>
#include <vector>
#include "lattice/Direction.h"
#include "polymer/Chain.h"
#include "polymer/Perm.h"
#include "polymer/Statistics.h"

// ---------- Configuration ----------
struct EnsembleConfig {
    Site origin{0, 0};             // seed site of every chain
    Site dimensions{1000, 1000};   // lattice extent, kept for reference; growth is unbounded
    std::uint64_t seed = 42;
    bool verbose = false;          // progress and PERM round lines on std::cerr
};

// ---------- Ensemble ----------
// Owns the sampled chains and the random engine that produced them.
// Every generator replaces the previous contents of the ensemble.
class Ensemble {
public:
    explicit Ensemble(const EnsembleConfig& cfg);

    void reset(const EnsembleConfig& cfg);

    // Plain Rosenbluth sampling: `count` independent chains grown towards
    // `length`; short (dead-ended) chains are kept and zero-padded
    EnsembleMatrices generatePlain(int count, int length);

    // Keep sampling until `count` chains reach `length`. Every attempt is kept.
    // Stops after `maxAttempts` chains (0 = 1000 * count) with a warning.
    EnsembleMatrices generateComplete(int count, int length, int maxAttempts = 0);

    // 1000 * count, saturating at INT_MAX
    static int defaultAttemptBudget(int count);

    // PERM run seeded with `initialCount` single-link chains.
    // Rows: active chains first, then discarded chains.
    EnsembleMatrices runPerm(int initialCount, double biasFactor, int length);

    // Free random walk baseline (not self-avoiding, unit weights).
    // Does not touch the stored chains.
    EnsembleMatrices generateFreeWalks(int count, int length);

    // Matrices over the stored chains, `length` columns
    EnsembleMatrices assemble(int length) const;

    // Access
    const std::vector<Chain>& activeChains() const { return active_; }
    const std::vector<Chain>& discardedChains() const { return discarded_; }
    std::size_t size() const { return active_.size() + discarded_.size(); }
    const Chain& chainAt(std::size_t row) const;  // row order of assemble()
    const EnsembleConfig& config() const { return cfg_; }

    const PermResult& lastPermResult() const { return last_perm_; }
    const std::vector<RoundStats>& roundHistory() const { return round_history_; }

    struct Metrics {
        std::size_t totalChains = 0;
        std::size_t activeChains = 0;
        std::size_t discardedChains = 0;
        std::size_t prunedChains = 0;
        std::size_t deadEnds = 0;
        double meanLength = 0.0;
        int maxLength = 0;
    };
    Metrics computeMetrics() const;

private:
    void clearChains();
    static void checkCountAndLength(int count, int length);

    EnsembleConfig cfg_;
    std::vector<Chain> active_;
    std::vector<Chain> discarded_;
    std::mt19937_64 rng_;
    PermResult last_perm_;
    std::vector<RoundStats> round_history_;
};

#endif
