// Ticket: 0002_collision_detector

#include <gtest/gtest.h>

#include <cmath>

#include "ric-sim/src/Contact/CollisionDetector.hpp"
#include "ric-sim/src/Contact/SegmentDistance.hpp"
#include "ric-sim/test/Helpers/RodScenario.hpp"

using namespace ric_sim;

namespace
{

constexpr double kContactLength{0.1};
constexpr double kCollisionLimit{0.01};

CollisionDetector makeDetector(size_t numNodes,
                               double collisionLimit = kCollisionLimit)
{
  return CollisionDetector{
    EdgePairIndex{numNodes - 1}, collisionLimit, kContactLength};
}

}  // namespace

// ============================================================================
// Two parallel edges
// ============================================================================

TEST(CollisionDetector, CloseParallelEdges_ActivePair)
{
  auto detector = makeDetector(5);
  const auto result = detector.detect(test::parallelEdgeRod(0.08));

  ASSERT_EQ(result.activePairs.size(), 1u);
  EXPECT_EQ(result.activePairs[0], (EdgePair{0, 3}));
  ASSERT_EQ(result.activeDistances.size(), 1u);
  EXPECT_NEAR(result.activeDistances[0], 0.08, 1e-14);
  EXPECT_NEAR(result.globalMinDistance, 0.08, 1e-14);
  EXPECT_TRUE(result.hasContacts());
}

TEST(CollisionDetector, DistantParallelEdges_NoContactButGlobalMinimum)
{
  auto detector = makeDetector(5);
  const auto result = detector.detect(test::parallelEdgeRod(0.2));

  EXPECT_FALSE(result.hasContacts());
  EXPECT_TRUE(result.activeDistances.empty());
  EXPECT_NEAR(result.globalMinDistance, 0.2, 1e-14);
}

TEST(CollisionDetector, ThresholdIsStrict)
{
  // distance - h == limit is not active
  auto detector = makeDetector(5, 0.0);
  const auto result = detector.detect(test::parallelEdgeRod(kContactLength));
  EXPECT_FALSE(result.hasContacts());
}

// ============================================================================
// Helix with many contacts
// ============================================================================

TEST(CollisionDetector, Helix_ActiveSetMatchesThreshold)
{
  constexpr size_t kNumNodes{60};
  const auto positions = test::helixRod(kNumNodes, 1.0, 0.12, 20);
  auto detector = makeDetector(kNumNodes, 0.05);

  const auto result = detector.detect(positions);
  ASSERT_TRUE(result.hasContacts());

  const auto& index = detector.getIndex();
  const auto all = segment_distance::minimumDistances(
    gatherPairs(positions, index.pairs()));
  ASSERT_EQ(detector.getLastDistances().size(), all.size());
  EXPECT_TRUE(detector.getLastDistances().isApprox(all));
  EXPECT_DOUBLE_EQ(result.globalMinDistance, all.minCoeff());

  size_t expectedActive = 0;
  for (Eigen::Index p = 0; p < all.size(); ++p)
  {
    if (all[p] - kContactLength < 0.05)
    {
      ++expectedActive;
    }
  }
  EXPECT_EQ(result.activePairs.size(), expectedActive);

  for (size_t k = 0; k < result.activePairs.size(); ++k)
  {
    EXPECT_LT(result.activeDistances[k] - kContactLength, 0.05);
    EXPECT_GT(result.activePairs[k].second - result.activePairs[k].first, 2u);
  }
}

TEST(CollisionDetector, Deterministic)
{
  const auto positions = test::helixRod(80, 1.0, 0.11, 16);
  auto first = makeDetector(80, 0.05);
  auto second = makeDetector(80, 0.05);

  const auto a = first.detect(positions);
  const auto b = second.detect(positions);
  const auto c = first.detect(positions);

  EXPECT_EQ(a.activePairs, b.activePairs);
  EXPECT_EQ(a.activePairs, c.activePairs);
  EXPECT_EQ(a.activeDistances, b.activeDistances);
  EXPECT_EQ(a.globalMinDistance, c.globalMinDistance);
}

// ============================================================================
// Edge cases
// ============================================================================

TEST(CollisionDetector, TooFewEdges_InfiniteGlobalMinimum)
{
  auto detector = makeDetector(3);
  Eigen::VectorXd positions(9);
  positions << 0, 0, 0, 1, 0, 0, 2, 0, 0;

  const auto result = detector.detect(positions);
  EXPECT_FALSE(result.hasContacts());
  EXPECT_TRUE(std::isinf(result.globalMinDistance));
}

TEST(CollisionDetector, WrongPositionCount_Throws)
{
  auto detector = makeDetector(5);
  Eigen::VectorXd positions = Eigen::VectorXd::Zero(12);
  EXPECT_THROW(static_cast<void>(detector.detect(positions)),
               std::invalid_argument);
}

TEST(CollisionDetector, InvalidParameters_Throw)
{
  EXPECT_THROW((CollisionDetector{EdgePairIndex{4}, -0.1, kContactLength}),
               std::invalid_argument);
  EXPECT_THROW((CollisionDetector{EdgePairIndex{4}, 0.01, 0.0}),
               std::invalid_argument);
}
