// Ticket: 0007_step_synchronizer

#ifndef RIC_SIM_SERVER_STEP_SUMMARY_HPP
#define RIC_SIM_SERVER_STEP_SUMMARY_HPP

#include <cstddef>
#include <cstdint>
#include <limits>

#include "ric-transfer/src/ContactStepRecord.hpp"

namespace ric_sim
{

/**
 * @brief Outcome of one serviced request
 *
 * minDistance is in client units (divided by the normalization scale).
 *
 * @ticket 0007_step_synchronizer
 */
struct StepSummary
{
  double simulationTime{0.0};
  int iteration{0};
  bool firstIteration{false};
  bool frictionEnabled{false};
  bool hessianRequested{false};
  size_t numContacts{0};
  double minDistance{std::numeric_limits<double>::quiet_NaN()};
  double stiffness{0.0};
  size_t hessianFallbacks{0};

  /**
   * @brief Convert to a transfer record referencing the given frame
   * @ticket 0008_contact_diagnostics_recording
   */
  [[nodiscard]] ric_transfer::ContactStepRecord toRecord(uint32_t frameId) const;
};

}  // namespace ric_sim

#endif  // RIC_SIM_SERVER_STEP_SUMMARY_HPP
