// Ticket: 0002_collision_detector

#ifndef RIC_SIM_CONTACT_COLLISION_DETECTOR_HPP
#define RIC_SIM_CONTACT_COLLISION_DETECTOR_HPP

#include <Eigen/Dense>
#include <limits>
#include <vector>

#include "ric-sim/src/Contact/ContactTypes.hpp"
#include "ric-sim/src/Contact/EdgePairIndex.hpp"

namespace ric_sim
{

/**
 * @brief Result of one broad detection pass
 *
 * activeDistances[i] is the distance of activePairs[i] at detection time.
 * globalMinDistance is taken over every eligible pair, active or not, and is
 * +infinity when the pair table is empty.
 */
struct DetectionResult
{
  std::vector<EdgePair> activePairs;
  std::vector<double> activeDistances;
  double globalMinDistance{std::numeric_limits<double>::infinity()};

  [[nodiscard]] bool hasContacts() const
  {
    return !activePairs.empty();
  }
};

/**
 * @brief Finds edge pairs close enough to interact
 *
 * A pair is active when distance - contactLength < collisionLimit. All
 * eligible pairs are evaluated in one batched pass over a structure-of-arrays
 * matrix of combined edge coordinates. The output order follows the pair
 * table, so detection is deterministic for identical input.
 *
 * The combined-edge matrix is kept as a workspace and reused between calls.
 *
 * Thread safety: Not thread-safe (mutable workspace)
 *
 * @ticket 0002_collision_detector
 */
class CollisionDetector
{
public:
  /**
   * @brief Construct a detector over a static pair table
   * @param index Eligible edge pairs
   * @param collisionLimit Activation margin beyond the contact length
   * @param contactLength Contact distance (twice the rod radius, normalized)
   * @throws std::invalid_argument if collisionLimit < 0 or contactLength <= 0
   */
  CollisionDetector(EdgePairIndex index,
                    double collisionLimit,
                    double contactLength);

  /**
   * @brief Evaluate every eligible pair and select the active ones
   * @param positions Flat 3N nodal positions, N = numEdges + 1
   * @return Active pairs, their distances and the global minimum
   * @throws std::invalid_argument if positions does not match the edge count
   */
  [[nodiscard]] DetectionResult detect(
    const Eigen::Ref<const Eigen::VectorXd>& positions);

  [[nodiscard]] const EdgePairIndex& getIndex() const
  {
    return index_;
  }

  [[nodiscard]] double getCollisionLimit() const
  {
    return collisionLimit_;
  }

  [[nodiscard]] double getContactLength() const
  {
    return contactLength_;
  }

  /**
   * @brief Distances of every eligible pair from the last detect() call
   */
  [[nodiscard]] const Eigen::VectorXd& getLastDistances() const
  {
    return distances_;
  }

private:
  void materializeEdges(const Eigen::Ref<const Eigen::VectorXd>& positions);
  void combineEdges();

  EdgePairIndex index_;
  double collisionLimit_;
  double contactLength_;

  EdgeMatrix edges_;          // numEdges x 6
  PairMatrix combinations_;   // numPairs x 12, pair table order
  Eigen::VectorXd distances_;
};

}  // namespace ric_sim

#endif  // RIC_SIM_CONTACT_COLLISION_DETECTOR_HPP
