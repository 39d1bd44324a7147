// Ticket: 0008_contact_diagnostics_recording

#include "ric-sim/src/Server/StepSummary.hpp"

namespace ric_sim
{

ric_transfer::ContactStepRecord StepSummary::toRecord(uint32_t frameId) const
{
  ric_transfer::ContactStepRecord record{};
  record.num_contacts = static_cast<uint32_t>(numContacts);
  record.min_distance = minDistance;
  record.contact_stiffness = stiffness;
  record.friction_enabled = frictionEnabled ? 1 : 0;
  record.hessian_requested = hessianRequested ? 1 : 0;
  record.hessian_fallbacks = static_cast<uint32_t>(hessianFallbacks);
  record.frame.id = frameId;
  return record;
}

}  // namespace ric_sim
