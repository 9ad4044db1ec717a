#include <gtest/gtest.h>
#include "polymer/Growth.h"
#include "polymer/Perm.h"
#include <random>
#include <stdexcept>

namespace {

std::vector<Chain> seedPopulation(int n, std::mt19937_64& rng) {
    std::vector<Chain> chains;
    for (int i = 0; i < n; ++i) {
        chains.push_back(newChain(Site{0, 0}, rng));
    }
    return chains;
}

}  // namespace

TEST(PermTest, RejectsNonPositiveBiasFactor) {
    PermConfig cfg;
    cfg.biasFactor = 0.0;
    EXPECT_THROW(PopulationController{cfg}, std::invalid_argument);

    cfg.biasFactor = 10.0;
    PopulationController controller(cfg);
    EXPECT_DOUBLE_EQ(controller.upperFactor(), 10.0);
    EXPECT_DOUBLE_EQ(controller.lowerFactor(), 1.0);
}

// One heavy chain among light ones: the heavy one is halved and cloned,
// the light ones are either discarded (weight 0) or doubled
TEST(PermTest, PruneAndEnrichOneRound) {
    std::vector<Chain> active;
    for (int i = 0; i < 5; ++i) {
        active.emplace_back(Site{0, 0}, Direction::East);
    }
    active[0].setLastWeight(1000.0);

    PermConfig cfg;
    cfg.biasFactor = 2.0;  // W+ = 2 W~, W- = 0.2 W~
    PopulationController controller(cfg);
    std::vector<Chain> discarded;
    std::mt19937_64 rng(8);

    const RoundStats s = controller.runRound(active, discarded, rng);

    // Second link always has three options
    EXPECT_EQ(s.grown, 5u);
    EXPECT_DOUBLE_EQ(s.meanWeight, (3000.0 + 4 * 12.0) / 5.0);
    EXPECT_EQ(s.enriched, 1u);
    EXPECT_EQ(s.discarded + s.doubled, 4u);
    EXPECT_EQ(discarded.size(), s.discarded);
    EXPECT_EQ(active.size(), 5u - s.discarded + 1u);

    EXPECT_DOUBLE_EQ(active.front().lastWeight(), 1500.0);
    const Chain& clone = active.back();
    EXPECT_DOUBLE_EQ(clone.lastWeight(), 1500.0);
    EXPECT_EQ(clone.directions(), active.front().directions());

    for (const auto& c : discarded) {
        EXPECT_TRUE(c.pruned());
        EXPECT_DOUBLE_EQ(c.lastWeight(), 0.0);
    }
    for (std::size_t i = 1; i + 1 < active.size(); ++i) {
        EXPECT_DOUBLE_EQ(active[i].lastWeight(), 24.0);
    }
}

// Growing the clone must not touch the original
TEST(PermTest, CloneEvolvesIndependently) {
    std::vector<Chain> active;
    active.emplace_back(Site{0, 0}, Direction::East);
    active.emplace_back(Site{0, 0}, Direction::East);
    active[0].setLastWeight(400.0);

    PermConfig cfg;
    cfg.biasFactor = 1.5;
    PopulationController controller(cfg);
    std::vector<Chain> discarded;
    std::mt19937_64 rng(21);

    controller.runRound(active, discarded, rng);
    ASSERT_GE(active.size(), 2u);
    const Chain& original = active.front();
    Chain& clone = active.back();
    const auto originalSites = original.occupiedSites();
    const auto originalWeights = original.weights();

    growTo(clone, 12, rng);
    EXPECT_EQ(original.occupiedSites(), originalSites);
    EXPECT_EQ(original.weights(), originalWeights);
    EXPECT_EQ(original.length(), 2);
}

// Only trapped chains: nothing grows, run ends with PopulationExhausted
TEST(PermTest, ExhaustionIsAResultNotAnError) {
    Chain chain(Site{0, 0}, Direction::North);
    for (Direction d : {Direction::North, Direction::East, Direction::East, Direction::South,
                        Direction::South, Direction::West, Direction::North}) {
        chain.append(d);
    }
    std::vector<Chain> active{chain};
    std::vector<Chain> discarded;
    PopulationController controller(PermConfig{});
    std::mt19937_64 rng(4);

    PermResult result;
    EXPECT_NO_THROW(result = controller.run(active, discarded, 20, rng));
    EXPECT_EQ(result.status, PermStatus::PopulationExhausted);
    EXPECT_EQ(result.achievedLength, 8);
    EXPECT_EQ(result.roundsRun, 0);
    ASSERT_EQ(active.size(), 1u);
    EXPECT_TRUE(active[0].deadEnd());
    ASSERT_EQ(controller.history().size(), 1u);
    EXPECT_EQ(controller.history()[0].deadEnds, 1u);
}

// Population changes by at most a factor two per round; every chain ever
// created is either active or discarded
TEST(PermTest, PopulationGrowthIsBounded) {
    std::mt19937_64 rng(77);
    std::vector<Chain> active = seedPopulation(50, rng);
    std::vector<Chain> discarded;

    PermConfig cfg;
    cfg.biasFactor = 1.2;
    PopulationController controller(cfg);
    const PermResult result = controller.run(active, discarded, 30, rng);

    const auto& history = controller.history();
    std::size_t enriched = 0;
    for (std::size_t r = 0; r < history.size(); ++r) {
        enriched += history[r].enriched;
        EXPECT_LE(history[r].enriched, history[r].grown);
        if (r + 1 < history.size()) {
            EXPECT_LE(history[r + 1].population, 2 * history[r].population);
        }
    }
    EXPECT_EQ(active.size() + discarded.size(), 50u + enriched);

    if (result.status == PermStatus::Completed) {
        EXPECT_EQ(result.achievedLength, 30);
        for (const auto& c : active) {
            if (!c.pruned()) EXPECT_EQ(c.length(), 30);
        }
    }
}

TEST(PermTest, SameSeedSameRun) {
    auto runOnce = [](std::uint64_t seed) {
        std::mt19937_64 rng(seed);
        std::vector<Chain> active = seedPopulation(20, rng);
        std::vector<Chain> discarded;
        PopulationController controller(PermConfig{});
        controller.run(active, discarded, 25, rng);
        std::vector<std::vector<double>> weights;
        for (const auto& c : active) weights.push_back(c.weights());
        for (const auto& c : discarded) weights.push_back(c.weights());
        return weights;
    };
    EXPECT_EQ(runOnce(123), runOnce(123));
}
