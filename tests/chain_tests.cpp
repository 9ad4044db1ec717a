#include <gtest/gtest.h>
#include "lattice/Errors.h"
#include "polymer/Chain.h"
#include "polymer/Conflict.h"
#include <stdexcept>

// Seed chain: one link, four branching options recorded
TEST(ChainTest, SeedState) {
    Chain chain(Site{10, 10}, Direction::East);

    EXPECT_EQ(chain.length(), 1);
    EXPECT_EQ(chain.startAnchor(), (Site{10, 10}));
    EXPECT_EQ(chain.endAnchor(), (Site{11, 10}));
    EXPECT_EQ(chain.occupiedSites().size(), 2u);
    ASSERT_EQ(chain.branchingFactors().size(), 1u);
    EXPECT_EQ(chain.branchingFactors()[0], kSeedBranchingFactor);
    EXPECT_DOUBLE_EQ(chain.lastWeight(), 4.0);
    EXPECT_FALSE(chain.pruned());
}

TEST(ChainTest, AppendRecordsBranchingFactor) {
    Chain chain(Site{0, 0}, Direction::North);

    // From (0,1): (0,0) is taken, three moves left
    EXPECT_EQ(chain.append(Direction::East), 3);
    EXPECT_EQ(chain.endAnchor(), (Site{1, 1}));
    EXPECT_EQ(chain.length(), 2);
    EXPECT_DOUBLE_EQ(chain.lastWeight(), 12.0);
    EXPECT_EQ(chain.weights().size(), chain.branchingFactors().size());
    EXPECT_EQ(chain.links().size(), chain.branchingFactors().size());
}

// Rejected append leaves the chain exactly as it was
TEST(ChainTest, SelfIntersectionRejectedAtomically) {
    Chain chain(Site{0, 0}, Direction::East);
    chain.append(Direction::North);  // (1,1)
    chain.append(Direction::West);   // (0,1)

    const auto lengthBefore = chain.length();
    const auto weightsBefore = chain.weights();
    const auto sitesBefore = chain.occupiedSites();

    EXPECT_THROW(chain.append(Direction::South), SelfIntersectionError);  // back onto origin

    EXPECT_EQ(chain.length(), lengthBefore);
    EXPECT_EQ(chain.weights(), weightsBefore);
    EXPECT_EQ(chain.occupiedSites(), sitesBefore);
    EXPECT_EQ(chain.endAnchor(), (Site{0, 1}));
}

TEST(ChainTest, AppendAtStartAnchor) {
    Chain chain(Site{0, 0}, Direction::East);
    chain.append(Direction::West, Anchor::Start);

    EXPECT_EQ(chain.startAnchor(), (Site{-1, 0}));
    EXPECT_EQ(chain.endAnchor(), (Site{1, 0}));
    ASSERT_EQ(chain.nodes().size(), 3u);
    EXPECT_EQ(chain.nodes()[1], (Site{0, 0}));
}

TEST(ChainTest, AnchorArguments) {
    EXPECT_EQ(parseAnchor("start"), Anchor::Start);
    EXPECT_EQ(parseAnchor("end"), Anchor::End);
    EXPECT_THROW(parseAnchor("middle"), std::invalid_argument);

    Chain chain(Site{0, 0}, Direction::East);
    EXPECT_THROW(chain.anchor(static_cast<Anchor>(7)), std::invalid_argument);
}

// Conflict rules: occupied end, detached start, loop closure
TEST(ConflictTest, Rules) {
    Chain chain(Site{0, 0}, Direction::East);
    chain.append(Direction::North);  // (1,1)

    EXPECT_FALSE(conflict(chain, Link(Direction::North, Site{1, 1})));
    EXPECT_TRUE(conflict(chain, Link(Direction::South, Site{1, 1})));   // (1,0) occupied
    EXPECT_TRUE(conflict(chain, Link(Direction::North, Site{5, 5})));   // not at an anchor
    EXPECT_TRUE(conflict(chain, Link(Direction::North, Site{1, 0})));   // interior node
    EXPECT_TRUE(conflict(chain, Link(Direction::West, Site{1, 0})));    // closes onto start
    EXPECT_THROW(conflict(chain, Link(Direction::North)), InvalidStateError);

    // Candidate checks never mutate the chain
    EXPECT_EQ(chain.length(), 2);
    EXPECT_EQ(validDirections(chain, Anchor::End).size(), 3u);
    EXPECT_TRUE(conflict(chain, Anchor::End, Direction::South));
}

// Copies share nothing with the original
TEST(ChainTest, CopyIsIndependent) {
    Chain original(Site{0, 0}, Direction::East);
    original.append(Direction::East);

    Chain copy = original;
    copy.append(Direction::North);
    copy.scaleLastWeight(0.5);

    EXPECT_EQ(original.length(), 2);
    EXPECT_EQ(copy.length(), 3);
    EXPECT_FALSE(original.occupies(Site{2, 1}));
    EXPECT_TRUE(copy.occupies(Site{2, 1}));
    EXPECT_DOUBLE_EQ(original.lastWeight(), 12.0);
}

// Corrections overwrite the last weight and carry into later weights
TEST(ChainTest, WeightCorrectionCarriesForward) {
    Chain chain(Site{0, 0}, Direction::East);
    chain.scaleLastWeight(2.0);
    EXPECT_DOUBLE_EQ(chain.lastWeight(), 8.0);
    EXPECT_EQ(chain.branchingFactors()[0], 4);

    const int m = chain.append(Direction::East);
    EXPECT_DOUBLE_EQ(chain.lastWeight(), 8.0 * m);
}

TEST(ChainTest, PrunedChainIsFrozen) {
    Chain chain(Site{0, 0}, Direction::East);
    chain.markPruned();

    EXPECT_THROW(chain.append(Direction::East), InvalidStateError);
    EXPECT_THROW(chain.setLastWeight(1.0), InvalidStateError);
    EXPECT_EQ(chain.length(), 1);
}
