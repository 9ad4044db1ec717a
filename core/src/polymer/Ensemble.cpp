#include "polymer/Ensemble.h"
#include "polymer/Growth.h"
#include "polymer/Observables.h"
#include <algorithm>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <omp.h>

namespace {

void fillRow(const std::vector<double>& weights,
             const Observables& obs,
             std::size_t row,
             EnsembleMatrices& out) {
    const std::size_t cols = out.weight.cols;
    const std::size_t n = std::min(cols, std::min(weights.size(), obs.endToEnd.size()));
    for (std::size_t c = 0; c < n; ++c) {
        out.weight.at(row, c) = weights[c];
        out.endToEnd.at(row, c) = obs.endToEnd[c];
        out.gyration.at(row, c) = obs.gyration[c];
    }
}

}  // namespace

Ensemble::Ensemble(const EnsembleConfig& cfg) : cfg_(cfg), rng_(cfg.seed) {
    reset(cfg);
}

void Ensemble::reset(const EnsembleConfig& cfg) {
    if (cfg.dimensions.x <= 0 || cfg.dimensions.y <= 0) {
        throw std::invalid_argument("lattice dimensions must be > 0 (got " +
                                    std::to_string(cfg.dimensions.x) + "x" +
                                    std::to_string(cfg.dimensions.y) + ")");
    }
    cfg_ = cfg;
    rng_.seed(cfg.seed);
    clearChains();
}

void Ensemble::clearChains() {
    active_.clear();
    discarded_.clear();
    last_perm_ = PermResult{};
    round_history_.clear();
}

void Ensemble::checkCountAndLength(int count, int length) {
    if (count <= 0) {
        throw std::invalid_argument("chain count must be > 0 (got " + std::to_string(count) + ")");
    }
    if (length < 1) {
        throw std::invalid_argument("chain length must be >= 1 (got " + std::to_string(length) + ")");
    }
}

EnsembleMatrices Ensemble::generatePlain(int count, int length) {
    checkCountAndLength(count, length);
    clearChains();
    active_.reserve(count);

    int complete = 0;
    for (int i = 0; i < count; ++i) {
        Chain chain = newChain(cfg_.origin, rng_);
        if (growTo(chain, length, rng_) == length) {
            ++complete;
        }
        active_.push_back(std::move(chain));
    }

    if (cfg_.verbose) {
        std::cerr << "[ENSEMBLE] plain: " << count << " chains, " << complete
                  << " reached length " << length << "\n";
    }
    return assemble(length);
}

int Ensemble::defaultAttemptBudget(int count) {
    const long long budget = 1000LL * std::max(count, 0);
    return static_cast<int>(std::min<long long>(budget, std::numeric_limits<int>::max()));
}

EnsembleMatrices Ensemble::generateComplete(int count, int length, int maxAttempts) {
    checkCountAndLength(count, length);
    if (maxAttempts <= 0) {
        maxAttempts = defaultAttemptBudget(count);
    }
    clearChains();

    int complete = 0;
    int attempts = 0;
    while (complete < count && attempts < maxAttempts) {
        Chain chain = newChain(cfg_.origin, rng_);
        ++attempts;
        if (growTo(chain, length, rng_) == length) {
            ++complete;
        }
        active_.push_back(std::move(chain));
    }

    if (complete < count) {
        std::cerr << "Warning: only " << complete << "/" << count << " chains reached length "
                  << length << " after " << attempts << " attempts\n";
    } else if (cfg_.verbose) {
        std::cerr << "[ENSEMBLE] complete: " << count << " chains of length " << length
                  << " in " << attempts << " attempts\n";
    }
    return assemble(length);
}

EnsembleMatrices Ensemble::runPerm(int initialCount, double biasFactor, int length) {
    checkCountAndLength(initialCount, length);

    PermConfig pcfg;
    pcfg.biasFactor = biasFactor;
    pcfg.verbose = cfg_.verbose;
    PopulationController controller(pcfg);

    clearChains();
    active_.reserve(initialCount);
    for (int i = 0; i < initialCount; ++i) {
        active_.push_back(newChain(cfg_.origin, rng_));
    }

    last_perm_ = controller.run(active_, discarded_, length, rng_);
    round_history_ = controller.history();

    if (cfg_.verbose) {
        std::cerr << "[ENSEMBLE] PERM " << permStatusName(last_perm_.status)
                  << ": length " << last_perm_.achievedLength << "/" << length
                  << ", " << active_.size() << " active, " << discarded_.size()
                  << " discarded\n";
    }
    return assemble(length);
}

EnsembleMatrices Ensemble::generateFreeWalks(int count, int length) {
    checkCountAndLength(count, length);

    const std::size_t rows = static_cast<std::size_t>(count);
    const std::size_t cols = static_cast<std::size_t>(length);
    EnsembleMatrices out{Matrix(rows, cols), Matrix(rows, cols), Matrix(rows, cols)};
    const std::vector<double> unitWeights(cols, 1.0);

    for (std::size_t r = 0; r < rows; ++r) {
        const auto nodes = freeWalk(cfg_.origin, length, rng_);
        fillRow(unitWeights, computeObservables(nodes), r, out);
    }
    return out;
}

const Chain& Ensemble::chainAt(std::size_t row) const {
    if (row < active_.size()) {
        return active_[row];
    }
    if (row < size()) {
        return discarded_[row - active_.size()];
    }
    throw std::out_of_range("chain row " + std::to_string(row) + " out of range (ensemble has " +
                            std::to_string(size()) + " chains)");
}

EnsembleMatrices Ensemble::assemble(int length) const {
    const std::size_t rows = size();
    const std::size_t cols = static_cast<std::size_t>(std::max(length, 0));
    EnsembleMatrices out{Matrix(rows, cols), Matrix(rows, cols), Matrix(rows, cols)};

    // Read-only per-row work; each iteration writes its own row
    #pragma omp parallel for schedule(dynamic)
    for (std::size_t r = 0; r < rows; ++r) {
        const Chain& chain = chainAt(r);
        fillRow(chain.weights(), computeObservables(chain), r, out);
    }
    return out;
}

Ensemble::Metrics Ensemble::computeMetrics() const {
    Metrics m;
    m.activeChains = active_.size();
    m.discardedChains = discarded_.size();
    m.totalChains = size();

    long long lengthSum = 0;
    auto visit = [&](const Chain& c) {
        if (c.pruned()) ++m.prunedChains;
        if (c.deadEnd()) ++m.deadEnds;
        lengthSum += c.length();
        m.maxLength = std::max(m.maxLength, c.length());
    };
    for (const auto& c : active_) visit(c);
    for (const auto& c : discarded_) visit(c);

    if (m.totalChains > 0) {
        m.meanLength = static_cast<double>(lengthSum) / static_cast<double>(m.totalChains);
    }
    return m;
}
