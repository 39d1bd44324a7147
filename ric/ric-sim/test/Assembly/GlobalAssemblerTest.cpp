// Ticket: 0006_global_contact_assembly

#include <gtest/gtest.h>

#include <vector>

#include "ric-sim/src/Assembly/GlobalAssembler.hpp"
#include "ric-sim/src/Server/ContactBuffers.hpp"

using namespace ric_sim;

namespace
{

PairMatrix rampForces(size_t numPairs)
{
  PairMatrix local(static_cast<Eigen::Index>(numPairs), kPairDof);
  for (Eigen::Index p = 0; p < local.rows(); ++p)
  {
    for (Eigen::Index c = 0; c < kPairDof; ++c)
    {
      local(p, c) = static_cast<double>(100 * p + c + 1);
    }
  }
  return local;
}

}  // namespace

// ============================================================================
// Forces
// ============================================================================

TEST(GlobalAssembler, ScatterForces_PlacesEdgeBlocks)
{
  LocalBuffers local{6};
  auto& buffers = local.view();
  const std::vector<EdgePair> pairs{{0, 3}};

  GlobalAssembler::scatterForces(rampForces(1), pairs, buffers.forces);

  for (Eigen::Index c = 0; c < kEdgeDof; ++c)
  {
    EXPECT_DOUBLE_EQ(buffers.forces[c], static_cast<double>(c + 1));
    EXPECT_DOUBLE_EQ(buffers.forces[9 + c], static_cast<double>(c + 7));
  }
  EXPECT_DOUBLE_EQ(buffers.forces.segment<3>(6).norm(), 0.0);
  EXPECT_DOUBLE_EQ(buffers.forces.tail<3>().norm(), 0.0);
}

TEST(GlobalAssembler, ScatterForces_AccumulatesSharedEdges)
{
  LocalBuffers local{6};
  auto& buffers = local.view();
  const std::vector<EdgePair> pairs{{0, 3}, {0, 4}};

  GlobalAssembler::scatterForces(rampForces(2), pairs, buffers.forces);

  // Edge 0 receives the head block of both pairs
  EXPECT_DOUBLE_EQ(buffers.forces[0], 1.0 + 101.0);
  EXPECT_DOUBLE_EQ(buffers.forces[5], 6.0 + 106.0);
  // Node 4 is shared by edge 3 (end) and edge 4 (start)
  EXPECT_DOUBLE_EQ(buffers.forces[12], 10.0 + 107.0);
}

TEST(GlobalAssembler, ScatterForces_PairOutOfRange_Throws)
{
  LocalBuffers local{4};
  const std::vector<EdgePair> pairs{{0, 3}};
  EXPECT_THROW(
    GlobalAssembler::scatterForces(rampForces(1), pairs, local.view().forces),
    std::out_of_range);
}

TEST(GlobalAssembler, ScatterForces_CountMismatch_Throws)
{
  LocalBuffers local{6};
  const std::vector<EdgePair> pairs{{0, 3}};
  EXPECT_THROW(
    GlobalAssembler::scatterForces(rampForces(2), pairs, local.view().forces),
    std::invalid_argument);
}

// ============================================================================
// Hessians
// ============================================================================

TEST(GlobalAssembler, ScatterHessians_PlacesFourBlocks)
{
  LocalBuffers local{6};
  auto& buffers = local.view();
  const std::vector<EdgePair> pairs{{0, 2}};

  PairHessian h;
  for (Eigen::Index r = 0; r < kPairDof; ++r)
  {
    for (Eigen::Index c = 0; c < kPairDof; ++c)
    {
      h(r, c) = static_cast<double>(kPairDof * r + c);
    }
  }

  GlobalAssembler::scatterHessians({h}, pairs, buffers.hessian);

  EXPECT_TRUE(buffers.hessian.block(0, 0, 6, 6).isApprox(h.topLeftCorner(6, 6)));
  EXPECT_TRUE(buffers.hessian.block(0, 6, 6, 6).isApprox(h.topRightCorner(6, 6)));
  EXPECT_TRUE(
    buffers.hessian.block(6, 0, 6, 6).isApprox(h.bottomLeftCorner(6, 6)));
  EXPECT_TRUE(
    buffers.hessian.block(6, 6, 6, 6).isApprox(h.bottomRightCorner(6, 6)));
  EXPECT_DOUBLE_EQ(buffers.hessian.rightCols(6).norm(), 0.0);
  EXPECT_DOUBLE_EQ(buffers.hessian.bottomRows(6).norm(), 0.0);
}

TEST(GlobalAssembler, ScatterHessians_AccumulatesOverlap)
{
  LocalBuffers local{6};
  auto& buffers = local.view();
  const std::vector<EdgePair> pairs{{0, 3}, {1, 4}};
  const std::vector<PairHessian> hessians{PairHessian::Identity(),
                                          PairHessian::Identity()};

  GlobalAssembler::scatterHessians(hessians, pairs, buffers.hessian);

  // Edge 0 covers nodes 0-1 and edge 1 nodes 1-2; node 1 overlaps
  EXPECT_DOUBLE_EQ(buffers.hessian(0, 0), 1.0);
  EXPECT_DOUBLE_EQ(buffers.hessian(3, 3), 2.0);
  EXPECT_DOUBLE_EQ(buffers.hessian(6, 6), 1.0);
  EXPECT_DOUBLE_EQ(buffers.hessian(12, 12), 2.0);
}

// ============================================================================
// Zeroing and stiffness
// ============================================================================

TEST(GlobalAssembler, Zero_HessianOnlyWhenRequested)
{
  LocalBuffers local{3};
  auto& buffers = local.view();
  buffers.forces.setConstant(1.0);
  buffers.hessian.setConstant(2.0);

  GlobalAssembler::zero(buffers, false);
  EXPECT_DOUBLE_EQ(buffers.forces.norm(), 0.0);
  EXPECT_DOUBLE_EQ(buffers.hessian(0, 0), 2.0);

  GlobalAssembler::zero(buffers, true);
  EXPECT_DOUBLE_EQ(buffers.hessian.norm(), 0.0);
}

TEST(GlobalAssembler, ApplyStiffness_ScalesOutputs)
{
  LocalBuffers local{3};
  auto& buffers = local.view();
  buffers.forces.setConstant(2.0);
  buffers.hessian.setConstant(3.0);

  GlobalAssembler::applyStiffness(10.0, buffers, false);
  EXPECT_DOUBLE_EQ(buffers.forces[4], 20.0);
  EXPECT_DOUBLE_EQ(buffers.hessian(1, 2), 3.0);

  GlobalAssembler::applyStiffness(10.0, buffers, true);
  EXPECT_DOUBLE_EQ(buffers.forces[4], 200.0);
  EXPECT_DOUBLE_EQ(buffers.hessian(1, 2), 30.0);
}
