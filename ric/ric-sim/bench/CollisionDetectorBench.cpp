// Ticket: 0002_collision_detector

#include <benchmark/benchmark.h>

#include "ric-sim/src/Contact/CollisionDetector.hpp"
#include "ric-sim/src/Contact/EdgePairIndex.hpp"
#include "ric-sim/test/Helpers/RodScenario.hpp"

using namespace ric_sim;

namespace
{

constexpr double kContactLength{0.1};
constexpr double kCollisionLimit{0.01};
constexpr double kHelixRadius{1.0};
constexpr double kPitch{0.09};  // Adjacent turns inside the contact length
constexpr size_t kNodesPerTurn{20};

}  // namespace

// ============================================================================
// Detection
// ============================================================================

/**
 * @brief Full detection pass over every eligible pair of a coiled rod
 *
 * Cost is dominated by the O(N^2) pair table; the active set grows linearly
 * with the number of turns.
 *
 * @ticket 0002_collision_detector
 */
static void BM_CollisionDetector_Helix(benchmark::State& state)
{
  const auto numNodes = static_cast<size_t>(state.range(0));
  const auto positions =
    test::helixRod(numNodes, kHelixRadius, kPitch, kNodesPerTurn);
  CollisionDetector detector{
    EdgePairIndex{numNodes - 1}, kCollisionLimit, kContactLength};

  for (auto _ : state)
  {
    auto result = detector.detect(positions);
    benchmark::DoNotOptimize(result);
  }

  state.SetComplexityN(static_cast<long long>(numNodes));
  state.counters["pairs"] = static_cast<double>(detector.getIndex().size());
}
BENCHMARK(BM_CollisionDetector_Helix)
  ->Arg(50)
  ->Arg(100)
  ->Arg(200)
  ->Arg(400)
  ->Complexity(benchmark::oNSquared);

static void BM_EdgePairIndex_Construct(benchmark::State& state)
{
  const auto numEdges = static_cast<size_t>(state.range(0));
  for (auto _ : state)
  {
    EdgePairIndex index{numEdges};
    benchmark::DoNotOptimize(index.size());
  }
}
BENCHMARK(BM_EdgePairIndex_Construct)->Arg(100)->Arg(400);
