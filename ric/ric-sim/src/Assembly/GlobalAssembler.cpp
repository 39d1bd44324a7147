// Ticket: 0006_global_contact_assembly

#include "ric-sim/src/Assembly/GlobalAssembler.hpp"

#include <stdexcept>
#include <string>

namespace ric_sim
{

namespace
{

void checkPair(const EdgePair& pair, Eigen::Index size)
{
  const auto last = 3 * static_cast<Eigen::Index>(pair.second) + kEdgeDof;
  if (pair.first >= pair.second || last > size)
  {
    throw std::out_of_range("GlobalAssembler: edge pair (" +
                            std::to_string(pair.first) + ", " +
                            std::to_string(pair.second) +
                            ") does not fit buffers of size " +
                            std::to_string(size));
  }
}

void checkCount(size_t local, size_t pairs)
{
  if (local != pairs)
  {
    throw std::invalid_argument("GlobalAssembler: " + std::to_string(local) +
                                " contributions for " + std::to_string(pairs) +
                                " pairs");
  }
}

}  // namespace

void GlobalAssembler::zero(ContactBuffers& buffers, bool hessianRequested)
{
  buffers.forces.setZero();
  if (hessianRequested)
  {
    buffers.hessian.setZero();
  }
}

void GlobalAssembler::scatterForces(const PairMatrix& local,
                                    std::span<const EdgePair> pairs,
                                    NodalMap& forces)
{
  checkCount(static_cast<size_t>(local.rows()), pairs.size());

  for (size_t p = 0; p < pairs.size(); ++p)
  {
    const auto& pair = pairs[p];
    checkPair(pair, forces.size());

    const auto row = static_cast<Eigen::Index>(p);
    forces.segment<kEdgeDof>(3 * static_cast<Eigen::Index>(pair.first)) +=
      local.row(row).head<kEdgeDof>().transpose();
    forces.segment<kEdgeDof>(3 * static_cast<Eigen::Index>(pair.second)) +=
      local.row(row).tail<kEdgeDof>().transpose();
  }
}

void GlobalAssembler::scatterHessians(const std::vector<PairHessian>& local,
                                      std::span<const EdgePair> pairs,
                                      HessianMap& hessian)
{
  checkCount(local.size(), pairs.size());

  for (size_t p = 0; p < pairs.size(); ++p)
  {
    const auto& pair = pairs[p];
    checkPair(pair, hessian.rows());

    const auto i = 3 * static_cast<Eigen::Index>(pair.first);
    const auto j = 3 * static_cast<Eigen::Index>(pair.second);
    const auto& h = local[p];

    hessian.block<kEdgeDof, kEdgeDof>(i, i) +=
      h.topLeftCorner<kEdgeDof, kEdgeDof>();
    hessian.block<kEdgeDof, kEdgeDof>(i, j) +=
      h.topRightCorner<kEdgeDof, kEdgeDof>();
    hessian.block<kEdgeDof, kEdgeDof>(j, i) +=
      h.bottomLeftCorner<kEdgeDof, kEdgeDof>();
    hessian.block<kEdgeDof, kEdgeDof>(j, j) +=
      h.bottomRightCorner<kEdgeDof, kEdgeDof>();
  }
}

void GlobalAssembler::applyStiffness(double stiffness,
                                     ContactBuffers& buffers,
                                     bool hessianRequested)
{
  buffers.forces *= stiffness;
  if (hessianRequested)
  {
    buffers.hessian *= stiffness;
  }
}

}  // namespace ric_sim
