// Ticket: 0002_collision_detector

#ifndef RIC_SIM_TEST_HELPERS_ROD_SCENARIO_HPP
#define RIC_SIM_TEST_HELPERS_ROD_SCENARIO_HPP

#include <Eigen/Dense>
#include <cstddef>

#include "ric-sim/src/Contact/ContactTypes.hpp"

namespace ric_sim::test
{

/**
 * @brief Five-node rod whose first and last edges are parallel
 *
 * Edge 0 runs from (0,0,0) to (1,0,0) and edge 3 from (0,s,0) to (1,s,0),
 * s = separation, both in +x. Edges 1 and 2 close the loop through a node
 * far away. With the default adjacency exclusion, (0, 3) is the only
 * eligible pair.
 */
[[nodiscard]] Eigen::VectorXd parallelEdgeRod(double separation);

/**
 * @brief Helix with the given number of nodes
 *
 * Adjacent turns are pitch apart along z, so pitch close to the contact
 * length produces many simultaneous contacts.
 */
[[nodiscard]] Eigen::VectorXd helixRod(size_t numNodes,
                                       double helixRadius,
                                       double pitch,
                                       size_t nodesPerTurn);

/**
 * @brief Crossing edge pair whose closest points are interior to both
 * segments (generic, non-parallel)
 */
[[nodiscard]] PairVector skewCrossingPair(double separation);

}  // namespace ric_sim::test

#endif  // RIC_SIM_TEST_HELPERS_ROD_SCENARIO_HPP
