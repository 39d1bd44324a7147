// Ticket: 0008_contact_diagnostics_recording
// Per-timestep contact summary

#ifndef RIC_TRANSFER_CONTACT_STEP_RECORD_HPP
#define RIC_TRANSFER_CONTACT_STEP_RECORD_HPP

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBForeignKey.hpp>
#include <cstdint>
#include <limits>

#include "ric-transfer/src/StepFrameRecord.hpp"

namespace ric_transfer
{

/**
 * @brief Contact state at the start of a timestep
 *
 * @ticket 0008_contact_diagnostics_recording
 */
struct ContactStepRecord : public cpp_sqlite::BaseTransferObject
{
  uint32_t num_contacts{0};
  double min_distance{std::numeric_limits<double>::quiet_NaN()};  // Scaled back to client units
  double contact_stiffness{0.0};
  uint32_t friction_enabled{0};   // Boolean as uint32_t for SQLite
  uint32_t hessian_requested{0};  // Boolean as uint32_t for SQLite
  uint32_t hessian_fallbacks{0};

  cpp_sqlite::ForeignKey<StepFrameRecord> frame;
};

// Register with Boost.Describe for cpp_sqlite ORM
BOOST_DESCRIBE_STRUCT(ContactStepRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (num_contacts,
                       min_distance,
                       contact_stiffness,
                       friction_enabled,
                       hessian_requested,
                       hessian_fallbacks,
                       frame));

}  // namespace ric_transfer

#endif  // RIC_TRANSFER_CONTACT_STEP_RECORD_HPP
