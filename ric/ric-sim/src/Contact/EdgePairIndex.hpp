// Ticket: 0001_edge_pair_contact_geometry

#ifndef RIC_SIM_CONTACT_EDGE_PAIR_INDEX_HPP
#define RIC_SIM_CONTACT_EDGE_PAIR_INDEX_HPP

#include <cstddef>
#include <span>
#include <vector>

#include "ric-sim/src/Contact/ContactTypes.hpp"

namespace ric_sim
{

/**
 * @brief Static table of edge pairs eligible for contact
 *
 * Lists every pair (i, j) with j - i > ignoreAdjacent, grouped by i ascending
 * and then j ascending. Edges sharing a node, or separated by fewer than
 * ignoreAdjacent edges along the rod, never appear.
 *
 * The table depends only on the edge count and is built once at startup.
 *
 * Thread safety: Immutable after construction (thread-safe reads)
 *
 * @ticket 0001_edge_pair_contact_geometry
 */
class EdgePairIndex
{
public:
  /// Edges closer than this along the rod are never paired
  static constexpr size_t kDefaultIgnoreAdjacent{2};

  /**
   * @brief Build the pair table
   * @param numEdges Number of edges (node count minus one)
   * @param ignoreAdjacent Minimum index gap minus one between paired edges
   */
  explicit EdgePairIndex(size_t numEdges,
                         size_t ignoreAdjacent = kDefaultIgnoreAdjacent);

  /**
   * @brief Number of pairs the table holds for the given sizes
   *
   * Sum over i of max(0, numEdges - i - (ignoreAdjacent + 1)).
   */
  [[nodiscard]] static size_t countPairs(size_t numEdges,
                                         size_t ignoreAdjacent);

  /**
   * @brief Number of pairs whose first edge is the given edge
   */
  [[nodiscard]] size_t pairsForEdge(size_t edge) const;

  [[nodiscard]] size_t size() const
  {
    return pairs_.size();
  }

  [[nodiscard]] bool empty() const
  {
    return pairs_.empty();
  }

  [[nodiscard]] const EdgePair& operator[](size_t i) const
  {
    return pairs_[i];
  }

  [[nodiscard]] std::span<const EdgePair> pairs() const
  {
    return pairs_;
  }

  [[nodiscard]] size_t numEdges() const
  {
    return numEdges_;
  }

  [[nodiscard]] size_t ignoreAdjacent() const
  {
    return ignoreAdjacent_;
  }

  [[nodiscard]] auto begin() const
  {
    return pairs_.begin();
  }

  [[nodiscard]] auto end() const
  {
    return pairs_.end();
  }

private:
  size_t numEdges_;
  size_t ignoreAdjacent_;
  std::vector<EdgePair> pairs_;
};

}  // namespace ric_sim

#endif  // RIC_SIM_CONTACT_EDGE_PAIR_INDEX_HPP
