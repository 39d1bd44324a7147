// Ticket: 0008_contact_diagnostics_recording

#ifndef RIC_TRANSFER_STEP_FRAME_RECORD_HPP
#define RIC_TRANSFER_STEP_FRAME_RECORD_HPP

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>
#include <cstdint>

namespace ric_transfer
{

/**
 * @brief Database record for one recorded contact request
 *
 * One frame is written per first-iteration request. Per-step records
 * (ContactStepRecord, ContactPairRecord) reference it via
 * ForeignKey<StepFrameRecord>.
 *
 * @ticket 0008_contact_diagnostics_recording
 */
struct StepFrameRecord : public cpp_sqlite::BaseTransferObject
{
  double simulation_time{0.0};  // Client simulation time [s]
  uint32_t iteration{0};        // Client iteration counter
  double wall_clock_time{0.0};  // Wall clock time [seconds since epoch]
};

// Register with Boost.Describe for cpp_sqlite ORM
BOOST_DESCRIBE_STRUCT(StepFrameRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (simulation_time, iteration, wall_clock_time));

}  // namespace ric_transfer

#endif  // RIC_TRANSFER_STEP_FRAME_RECORD_HPP
