// Ticket: 0003_contact_energy_model

#include <benchmark/benchmark.h>

#include "ric-sim/src/Contact/CollisionDetector.hpp"
#include "ric-sim/src/Contact/EdgePairIndex.hpp"
#include "ric-sim/src/Energy/ContactEnergyModel.hpp"
#include "ric-sim/src/Energy/SmoothedContactEnergy.hpp"
#include "ric-sim/test/Helpers/RodScenario.hpp"

using namespace ric_sim;

namespace
{

constexpr double kContactLength{0.1};
constexpr double kSharpness{50.0};
constexpr double kFriction{0.3};

struct HelixContacts
{
  Eigen::VectorXd positions;
  DetectionResult detection;
};

HelixContacts detectHelix(size_t numNodes)
{
  HelixContacts contacts;
  contacts.positions = test::helixRod(numNodes, 1.0, 0.09, 20);
  CollisionDetector detector{EdgePairIndex{numNodes - 1}, 0.01, kContactLength};
  contacts.detection = detector.detect(contacts.positions);
  return contacts;
}

}  // namespace

// ============================================================================
// Per-request evaluation of a fixed active set
// ============================================================================

static void BM_ContactEnergyModel_Forces(benchmark::State& state)
{
  const auto contacts = detectHelix(static_cast<size_t>(state.range(0)));
  const auto& pairs = contacts.detection.activePairs;
  ContactEnergyModel model{makeEnergyModel(kSharpness, kContactLength), kFriction};
  const PairMatrix velocities = PairMatrix::Zero(
    static_cast<Eigen::Index>(pairs.size()), kPairDof);

  for (auto _ : state)
  {
    const auto batch = model.prepare(contacts.positions, velocities, pairs);
    auto result = model.computeForces(batch, true);
    benchmark::DoNotOptimize(result.forces.data());
  }

  state.counters["contacts"] = static_cast<double>(pairs.size());
}
BENCHMARK(BM_ContactEnergyModel_Forces)->Arg(100)->Arg(400);

/**
 * @brief Forces and Hessians with friction, the most expensive request
 *
 * @ticket 0003_contact_energy_model
 */
static void BM_ContactEnergyModel_ForcesAndHessians(benchmark::State& state)
{
  const auto contacts = detectHelix(static_cast<size_t>(state.range(0)));
  const auto& pairs = contacts.detection.activePairs;
  ContactEnergyModel model{makeEnergyModel(kSharpness, kContactLength), kFriction};
  const PairMatrix velocities = PairMatrix::Constant(
    static_cast<Eigen::Index>(pairs.size()), kPairDof, 0.1);

  for (auto _ : state)
  {
    const auto batch = model.prepare(contacts.positions, velocities, pairs);
    auto result = model.computeForcesAndHessians(batch, true);
    benchmark::DoNotOptimize(result.hessians.data());
  }

  state.counters["contacts"] = static_cast<double>(pairs.size());
}
BENCHMARK(BM_ContactEnergyModel_ForcesAndHessians)->Arg(100)->Arg(400);
