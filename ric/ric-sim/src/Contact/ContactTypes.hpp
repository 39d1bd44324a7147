// Ticket: 0001_edge_pair_contact_geometry

#ifndef RIC_SIM_CONTACT_CONTACT_TYPES_HPP
#define RIC_SIM_CONTACT_CONTACT_TYPES_HPP

#include <Eigen/Dense>
#include <cstdint>
#include <limits>
#include <span>
#include <vector>

namespace ric_sim
{

/// Coordinates of one edge pair: [x1s, x1e, x2s, x2e]
constexpr Eigen::Index kPairDof{12};
/// Coordinates of one edge: [xs, xe]
constexpr Eigen::Index kEdgeDof{6};
/// Rows of the constant linear jacobian: d1, d2, d12
constexpr Eigen::Index kNumLinearParameters{9};
/// Scalar invariants: D1, D2, R, S1, S2, den
constexpr Eigen::Index kNumInvariants{6};
/// Derived parameters per pair: [d1, d2, d12, D1, D2, R, S1, S2, den]
constexpr Eigen::Index kNumDerivedParameters{
  kNumLinearParameters + kNumInvariants};
/// Friction jacobian input per pair: coordinates, velocities, energy gradient,
/// friction coefficient
constexpr Eigen::Index kFrictionInputSize{3 * kPairDof + 1};

/**
 * @brief Per-pair data in structure-of-arrays layout
 *
 * One row per edge pair. Column-major storage keeps each of the twelve
 * coordinates contiguous across the batch.
 */
using PairMatrix = Eigen::Matrix<double, Eigen::Dynamic, kPairDof>;
using PairVector = Eigen::Matrix<double, 1, kPairDof>;
using PairHessian = Eigen::Matrix<double, kPairDof, kPairDof>;
using DerivedMatrix = Eigen::Matrix<double, Eigen::Dynamic, kNumDerivedParameters>;
using EdgeMatrix = Eigen::Matrix<double, Eigen::Dynamic, kEdgeDof>;

/**
 * @brief Unordered pair of non-adjacent edges, stored with first < second
 */
struct EdgePair
{
  uint32_t first{0};
  uint32_t second{0};

  bool operator==(const EdgePair&) const = default;
};

/**
 * @brief How one closest-point parameter was obtained by the clamped scan
 *
 * - Interior: t from the unconstrained formula (S1*D2 - S2*R) / den
 * - Clamped: parameter fixed at a constant (0, 1 or the parallel fallback)
 * - Projected: parameter recomputed from the other one
 *   (u = (t*R - S2) / D2, or t = (u*R + S1) / D1)
 */
enum class ParameterMode : uint8_t
{
  Interior,
  Clamped,
  Projected
};

/**
 * @brief Closest-point parametrization and the branch that produced it
 *
 * Closest points are x1s + t*d1 and x2s + u*d2. Derivatives of the distance
 * follow the branch, so the branch is carried alongside the values.
 */
struct ClosestPointBranch
{
  double t{0.0};
  double u{0.0};
  ParameterMode tMode{ParameterMode::Clamped};
  ParameterMode uMode{ParameterMode::Projected};
};

/**
 * @brief Batched derived parameters for P edge pairs
 *
 * values is P x 15: [d1(3), d2(3), d12(3), D1, D2, R, S1, S2, den].
 */
struct DerivedParameters
{
  DerivedMatrix values;
  std::vector<ClosestPointBranch> branches;
  Eigen::VectorXd distances;

  [[nodiscard]] Eigen::Index size() const
  {
    return values.rows();
  }
};

/**
 * @brief Gather per-pair 12-vectors from a flat nodal array
 *
 * Edge e spans nodes e and e+1, i.e. entries [3e, 3e+6).
 *
 * @param nodal Flat 3N array of nodal quantities
 * @param pairs Edge pairs to gather
 * @return P x 12 matrix, row p = [edge first, edge second]
 * @throws std::out_of_range if an edge exceeds the nodal array
 */
PairMatrix gatherPairs(const Eigen::Ref<const Eigen::VectorXd>& nodal,
                       std::span<const EdgePair> pairs);

}  // namespace ric_sim

#endif  // RIC_SIM_CONTACT_CONTACT_TYPES_HPP
