// Ticket: 0001_edge_pair_contact_geometry

#include "ric-sim/src/Contact/EdgePairIndex.hpp"

namespace ric_sim
{

EdgePairIndex::EdgePairIndex(size_t numEdges, size_t ignoreAdjacent)
  : numEdges_{numEdges}, ignoreAdjacent_{ignoreAdjacent}
{
  pairs_.reserve(countPairs(numEdges, ignoreAdjacent));

  for (size_t i = 0; i < numEdges; ++i)
  {
    for (size_t j = i + ignoreAdjacent + 1; j < numEdges; ++j)
    {
      pairs_.push_back(
        EdgePair{static_cast<uint32_t>(i), static_cast<uint32_t>(j)});
    }
  }
}

size_t EdgePairIndex::countPairs(size_t numEdges, size_t ignoreAdjacent)
{
  size_t count = 0;
  for (size_t i = 0; i < numEdges; ++i)
  {
    count += (numEdges > i + ignoreAdjacent + 1)
               ? numEdges - i - (ignoreAdjacent + 1)
               : 0;
  }
  return count;
}

size_t EdgePairIndex::pairsForEdge(size_t edge) const
{
  if (edge >= numEdges_ || numEdges_ <= edge + ignoreAdjacent_ + 1)
  {
    return 0;
  }
  return numEdges_ - edge - (ignoreAdjacent_ + 1);
}

}  // namespace ric_sim
