// Ticket: 0001_edge_pair_contact_geometry

#include "ric-sim/src/Contact/ContactTypes.hpp"

#include <stdexcept>
#include <string>

namespace ric_sim
{

PairMatrix gatherPairs(const Eigen::Ref<const Eigen::VectorXd>& nodal,
                       std::span<const EdgePair> pairs)
{
  PairMatrix gathered(static_cast<Eigen::Index>(pairs.size()), kPairDof);

  for (Eigen::Index p = 0; p < gathered.rows(); ++p)
  {
    const auto& pair = pairs[static_cast<size_t>(p)];
    const Eigen::Index firstOffset = 3 * static_cast<Eigen::Index>(pair.first);
    const Eigen::Index secondOffset =
      3 * static_cast<Eigen::Index>(pair.second);

    if (firstOffset + kEdgeDof > nodal.size() ||
        secondOffset + kEdgeDof > nodal.size())
    {
      throw std::out_of_range(
        "gatherPairs: edge pair (" + std::to_string(pair.first) + ", " +
        std::to_string(pair.second) + ") exceeds nodal array of size " +
        std::to_string(nodal.size()));
    }

    gathered.row(p).head<kEdgeDof>() =
      nodal.segment<kEdgeDof>(firstOffset).transpose();
    gathered.row(p).tail<kEdgeDof>() =
      nodal.segment<kEdgeDof>(secondOffset).transpose();
  }

  return gathered;
}

}  // namespace ric_sim
