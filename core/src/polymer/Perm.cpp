#include "polymer/Perm.h"
#include "polymer/Growth.h"
#include "utils/Validation.h"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

const char* permStatusName(PermStatus status) {
    return status == PermStatus::Completed ? "completed" : "population-exhausted";
}

PopulationController::PopulationController(const PermConfig& cfg) : cfg_(cfg) {
    if (!(cfg.biasFactor > 0.0)) {
        throw std::invalid_argument("biasFactor must be > 0 (got " +
                                    std::to_string(cfg.biasFactor) + ")");
    }
    if (!(cfg.thresholdRatio > 0.0)) {
        throw std::invalid_argument("thresholdRatio must be > 0 (got " +
                                    std::to_string(cfg.thresholdRatio) + ")");
    }
}

RoundStats PopulationController::runRound(std::vector<Chain>& active,
                                          std::vector<Chain>& discarded,
                                          std::mt19937_64& rng) {
    RoundStats s;
    s.round = static_cast<int>(history_.size()) + 1;
    s.population = active.size();

    // 1. Synchronous growth
    std::vector<std::size_t> grown;
    grown.reserve(active.size());
    double weightSum = 0.0;
    for (std::size_t i = 0; i < active.size(); ++i) {
        Chain& chain = active[i];
        if (chain.pruned()) continue;

        if (growStep(chain, Anchor::End, rng) == 0) {
            ++s.deadEnds;
            continue;
        }
        grown.push_back(i);
        weightSum += chain.lastWeight();
        s.chainLength = std::max(s.chainLength, chain.length());
    }
    s.grown = grown.size();

    if (grown.empty()) {
        history_.push_back(s);
        if (cfg_.verbose) logRound(s);
        return s;
    }

    // 2-3. Population mean and thresholds
    s.meanWeight = weightSum / static_cast<double>(grown.size());
    s.upperThreshold = upperFactor() * s.meanWeight;
    s.lowerThreshold = lowerFactor() * s.meanWeight;
    validation::checkFinite(s.meanWeight, "PERM mean weight");
    validation::checkNonNegative(s.meanWeight, "PERM mean weight");

    // 4. Prune / enrich
    std::bernoulli_distribution coin(0.5);
    std::vector<char> drop(active.size(), 0);
    std::vector<Chain> clones;

    for (std::size_t idx : grown) {
        Chain& chain = active[idx];
        const double w = chain.lastWeight();

        if (w < s.lowerThreshold) {
            if (coin(rng)) {
                chain.setLastWeight(0.0);
                chain.markPruned();
                drop[idx] = 1;
                ++s.discarded;
            } else {
                chain.scaleLastWeight(2.0);
                ++s.doubled;
            }
        } else if (w > s.upperThreshold) {
            chain.scaleLastWeight(0.5);
            clones.push_back(chain);
            ++s.enriched;
        }
    }

    if (s.discarded > 0 || !clones.empty()) {
        std::vector<Chain> next;
        next.reserve(active.size() - s.discarded + clones.size());
        for (std::size_t i = 0; i < active.size(); ++i) {
            if (drop[i]) {
                discarded.push_back(std::move(active[i]));
            } else {
                next.push_back(std::move(active[i]));
            }
        }
        for (auto& clone : clones) {
            next.push_back(std::move(clone));
        }
        active.swap(next);
    }

    history_.push_back(s);
    if (cfg_.verbose) logRound(s);
    return s;
}

PermResult PopulationController::run(std::vector<Chain>& active,
                                     std::vector<Chain>& discarded,
                                     int targetLength,
                                     std::mt19937_64& rng) {
    history_.clear();

    PermResult result;
    for (const auto& chain : active) {
        result.achievedLength = std::max(result.achievedLength, chain.length());
    }

    for (int r = 0; r < targetLength - 1; ++r) {
        const RoundStats s = runRound(active, discarded, rng);
        if (s.grown == 0) {
            result.status = PermStatus::PopulationExhausted;
            break;
        }
        result.achievedLength = s.chainLength;
        ++result.roundsRun;
    }
    return result;
}

void PopulationController::logRound(const RoundStats& s) const {
    std::cerr << "[PERM] round " << s.round
              << " length=" << s.chainLength
              << " population=" << s.population
              << " grown=" << s.grown
              << " deadEnds=" << s.deadEnds
              << std::scientific << std::setprecision(3)
              << " W~=" << s.meanWeight
              << std::defaultfloat << std::setprecision(6)
              << " discarded=" << s.discarded
              << " doubled=" << s.doubled
              << " enriched=" << s.enriched << "\n";
}
