// Ticket: 0001_edge_pair_contact_geometry

#ifndef RIC_SIM_CONTACT_SEGMENT_DISTANCE_HPP
#define RIC_SIM_CONTACT_SEGMENT_DISTANCE_HPP

#include <Eigen/Dense>

#include "ric-sim/src/Contact/ContactTypes.hpp"

namespace ric_sim
{

/**
 * @brief Segment-segment distance via the clamped Lumelsky scan
 *
 * Edge pair coordinates are laid out as [x1s, x1e, x2s, x2e]. The closest
 * points are x1s + t*d1 and x2s + u*d2 with t, u in [0, 1]:
 *
 * 1. t = (S1*D2 - S2*R) / den, clamped; t = 0 when the segments are parallel
 * 2. u = (t*R - S2) / D2
 * 3. if u leaves [0, 1]: clamp u, then t = clamp((u*R + S1) / D1)
 *
 * The result is symmetric under swapping the two edges.
 *
 * @ticket 0001_edge_pair_contact_geometry
 */
namespace segment_distance
{

/// den below this fraction of D1*D2 is treated as parallel
constexpr double kParallelTolerance{1e-12};

/**
 * @brief Scalar invariants and difference vectors of one edge pair
 */
struct PairInvariants
{
  Eigen::Vector3d d1;   // x1e - x1s
  Eigen::Vector3d d2;   // x2e - x2s
  Eigen::Vector3d d12;  // x2s - x1s
  double D1{0.0};       // d1 . d1
  double D2{0.0};       // d2 . d2
  double R{0.0};        // d1 . d2
  double S1{0.0};       // d1 . d12
  double S2{0.0};       // d2 . d12
  double den{0.0};      // D1*D2 - R^2
};

[[nodiscard]] PairInvariants computeInvariants(const PairVector& coordinates);

/**
 * @brief Closest-point parameters and the branch taken to reach them
 *
 * @throws std::invalid_argument if either edge has zero length
 */
[[nodiscard]] ClosestPointBranch closestPointParameters(
  const PairInvariants& invariants);

/**
 * @brief Distance between the closest points of a given parametrization
 */
[[nodiscard]] double distanceAt(const PairInvariants& invariants,
                                const ClosestPointBranch& branch);

/**
 * @brief Minimum distance between the two segments of one edge pair
 */
[[nodiscard]] double minimumDistance(const PairVector& coordinates);

/**
 * @brief Minimum distance for every row of a batch
 * @return P-vector of distances
 */
[[nodiscard]] Eigen::VectorXd minimumDistances(const PairMatrix& coordinates);

/**
 * @brief Derived parameters, branches and distances for every row of a batch
 */
[[nodiscard]] DerivedParameters computeDerivedParameters(
  const PairMatrix& coordinates);

}  // namespace segment_distance

}  // namespace ric_sim

#endif  // RIC_SIM_CONTACT_SEGMENT_DISTANCE_HPP
