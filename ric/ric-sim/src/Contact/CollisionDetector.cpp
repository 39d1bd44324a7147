// Ticket: 0002_collision_detector

#include "ric-sim/src/Contact/CollisionDetector.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "ric-sim/src/Contact/SegmentDistance.hpp"

namespace ric_sim
{

CollisionDetector::CollisionDetector(EdgePairIndex index,
                                     double collisionLimit,
                                     double contactLength)
  : index_{std::move(index)},
    collisionLimit_{collisionLimit},
    contactLength_{contactLength}
{
  if (collisionLimit_ < 0.0)
  {
    throw std::invalid_argument(
      "CollisionDetector: collision limit must be non-negative (got " +
      std::to_string(collisionLimit_) + ")");
  }
  if (contactLength_ <= 0.0)
  {
    throw std::invalid_argument(
      "CollisionDetector: contact length must be positive (got " +
      std::to_string(contactLength_) + ")");
  }

  edges_.resize(static_cast<Eigen::Index>(index_.numEdges()), kEdgeDof);
  combinations_.resize(static_cast<Eigen::Index>(index_.size()), kPairDof);
}

DetectionResult CollisionDetector::detect(
  const Eigen::Ref<const Eigen::VectorXd>& positions)
{
  const auto expected =
    static_cast<Eigen::Index>(3 * (index_.numEdges() + 1));
  if (positions.size() != expected)
  {
    throw std::invalid_argument(
      "CollisionDetector: expected " + std::to_string(expected) +
      " position entries (got " + std::to_string(positions.size()) + ")");
  }

  DetectionResult result;
  if (index_.empty())
  {
    distances_.resize(0);
    return result;
  }

  materializeEdges(positions);
  combineEdges();
  distances_ = segment_distance::minimumDistances(combinations_);

  result.globalMinDistance = distances_.minCoeff();

  const Eigen::Array<bool, Eigen::Dynamic, 1> active =
    (distances_.array() - contactLength_) < collisionLimit_;
  const auto numActive = static_cast<size_t>(active.count());
  result.activePairs.reserve(numActive);
  result.activeDistances.reserve(numActive);

  for (Eigen::Index p = 0; p < distances_.size(); ++p)
  {
    if (active[p])
    {
      result.activePairs.push_back(index_[static_cast<size_t>(p)]);
      result.activeDistances.push_back(distances_[p]);
    }
  }

  return result;
}

void CollisionDetector::materializeEdges(
  const Eigen::Ref<const Eigen::VectorXd>& positions)
{
  for (Eigen::Index e = 0; e < edges_.rows(); ++e)
  {
    edges_.row(e) = positions.segment<kEdgeDof>(3 * e).transpose();
  }
}

void CollisionDetector::combineEdges()
{
  // Pair table rows are grouped by first edge, so each group is one
  // broadcast of edge i against a contiguous run of later edges.
  Eigen::Index row = 0;
  for (size_t i = 0; i < index_.numEdges(); ++i)
  {
    const auto count = static_cast<Eigen::Index>(index_.pairsForEdge(i));
    if (count == 0)
    {
      continue;
    }

    const auto edge = static_cast<Eigen::Index>(i);
    const auto firstPartner =
      static_cast<Eigen::Index>(i + index_.ignoreAdjacent() + 1);

    combinations_.block(row, 0, count, kEdgeDof).rowwise() = edges_.row(edge);
    combinations_.block(row, kEdgeDof, count, kEdgeDof) =
      edges_.middleRows(firstPartner, count);
    row += count;
  }
}

}  // namespace ric_sim
