// Ticket: 0001_edge_pair_contact_geometry

#include "ric-sim/src/Contact/SegmentDistance.hpp"

#include <algorithm>
#include <stdexcept>

namespace ric_sim::segment_distance
{

namespace
{

double clampUnit(double value)
{
  return std::clamp(value, 0.0, 1.0);
}

}  // namespace

PairInvariants computeInvariants(const PairVector& coordinates)
{
  const Eigen::Vector3d x1s = coordinates.segment<3>(0).transpose();
  const Eigen::Vector3d x1e = coordinates.segment<3>(3).transpose();
  const Eigen::Vector3d x2s = coordinates.segment<3>(6).transpose();
  const Eigen::Vector3d x2e = coordinates.segment<3>(9).transpose();

  PairInvariants inv;
  inv.d1 = x1e - x1s;
  inv.d2 = x2e - x2s;
  inv.d12 = x2s - x1s;
  inv.D1 = inv.d1.dot(inv.d1);
  inv.D2 = inv.d2.dot(inv.d2);
  inv.R = inv.d1.dot(inv.d2);
  inv.S1 = inv.d1.dot(inv.d12);
  inv.S2 = inv.d2.dot(inv.d12);
  inv.den = inv.D1 * inv.D2 - inv.R * inv.R;
  return inv;
}

ClosestPointBranch closestPointParameters(const PairInvariants& inv)
{
  if (inv.D1 <= 0.0 || inv.D2 <= 0.0)
  {
    throw std::invalid_argument(
      "closestPointParameters: degenerate edge with zero length");
  }

  ClosestPointBranch branch;

  if (inv.den > kParallelTolerance * inv.D1 * inv.D2)
  {
    const double tRaw = (inv.S1 * inv.D2 - inv.S2 * inv.R) / inv.den;
    branch.t = clampUnit(tRaw);
    branch.tMode =
      (branch.t == tRaw) ? ParameterMode::Interior : ParameterMode::Clamped;
  }

  const double uRaw = (branch.t * inv.R - inv.S2) / inv.D2;
  branch.u = clampUnit(uRaw);
  if (branch.u == uRaw)
  {
    branch.uMode = ParameterMode::Projected;
    return branch;
  }

  branch.uMode = ParameterMode::Clamped;
  const double tRaw = (branch.u * inv.R + inv.S1) / inv.D1;
  branch.t = clampUnit(tRaw);
  branch.tMode =
    (branch.t == tRaw) ? ParameterMode::Projected : ParameterMode::Clamped;
  return branch;
}

double distanceAt(const PairInvariants& inv, const ClosestPointBranch& branch)
{
  return (branch.t * inv.d1 - branch.u * inv.d2 - inv.d12).norm();
}

double minimumDistance(const PairVector& coordinates)
{
  const auto inv = computeInvariants(coordinates);
  return distanceAt(inv, closestPointParameters(inv));
}

Eigen::VectorXd minimumDistances(const PairMatrix& coordinates)
{
  Eigen::VectorXd distances(coordinates.rows());
  for (Eigen::Index p = 0; p < coordinates.rows(); ++p)
  {
    distances[p] = minimumDistance(coordinates.row(p));
  }
  return distances;
}

DerivedParameters computeDerivedParameters(const PairMatrix& coordinates)
{
  const Eigen::Index numPairs = coordinates.rows();

  DerivedParameters derived;
  derived.values.resize(numPairs, kNumDerivedParameters);
  derived.distances.resize(numPairs);
  derived.branches.reserve(static_cast<size_t>(numPairs));

  for (Eigen::Index p = 0; p < numPairs; ++p)
  {
    const auto inv = computeInvariants(coordinates.row(p));
    const auto branch = closestPointParameters(inv);

    auto row = derived.values.row(p);
    row.segment<3>(0) = inv.d1.transpose();
    row.segment<3>(3) = inv.d2.transpose();
    row.segment<3>(6) = inv.d12.transpose();
    row(9) = inv.D1;
    row(10) = inv.D2;
    row(11) = inv.R;
    row(12) = inv.S1;
    row(13) = inv.S2;
    row(14) = inv.den;

    derived.distances[p] = distanceAt(inv, branch);
    derived.branches.push_back(branch);
  }

  return derived;
}

}  // namespace ric_sim::segment_distance
