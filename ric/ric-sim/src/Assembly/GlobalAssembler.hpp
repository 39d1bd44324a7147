// Ticket: 0006_global_contact_assembly

#ifndef RIC_SIM_ASSEMBLY_GLOBAL_ASSEMBLER_HPP
#define RIC_SIM_ASSEMBLY_GLOBAL_ASSEMBLER_HPP

#include <span>
#include <vector>

#include "ric-sim/src/Contact/ContactTypes.hpp"
#include "ric-sim/src/Server/ContactBuffers.hpp"

namespace ric_sim
{

/**
 * @brief Scatters per-pair contributions into the global buffers
 *
 * Pair (i, j) owns coordinates [3i, 3i+6) and [3j, 3j+6). Forces are added
 * row by row; each pair Hessian is split into four 6 x 6 blocks at
 * (3i, 3i), (3i, 3j), (3j, 3i), (3j, 3j). Pairs sharing an edge overlap, so
 * accumulation is serial.
 *
 * @ticket 0006_global_contact_assembly
 */
class GlobalAssembler
{
public:
  /**
   * @brief Zero the outputs for a new request
   *
   * Forces are always zeroed; the Hessian only when requested.
   */
  static void zero(ContactBuffers& buffers, bool hessianRequested);

  /**
   * @throws std::out_of_range if a pair exceeds the force array
   */
  static void scatterForces(const PairMatrix& local,
                            std::span<const EdgePair> pairs,
                            NodalMap& forces);

  /**
   * @throws std::out_of_range if a pair exceeds the Hessian
   */
  static void scatterHessians(const std::vector<PairHessian>& local,
                              std::span<const EdgePair> pairs,
                              HessianMap& hessian);

  /**
   * @brief Multiply forces (and the Hessian when requested) by the gain
   */
  static void applyStiffness(double stiffness,
                             ContactBuffers& buffers,
                             bool hessianRequested);
};

}  // namespace ric_sim

#endif  // RIC_SIM_ASSEMBLY_GLOBAL_ASSEMBLER_HPP
