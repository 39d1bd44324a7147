// Ticket: 0008_contact_diagnostics_recording

#ifndef RIC_TRANSFER_CONTACT_PAIR_RECORD_HPP
#define RIC_TRANSFER_CONTACT_PAIR_RECORD_HPP

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBForeignKey.hpp>
#include <cstdint>

#include "ric-transfer/src/StepFrameRecord.hpp"

namespace ric_transfer
{

/**
 * @brief One active edge pair selected by detection
 *
 * @ticket 0008_contact_diagnostics_recording
 */
struct ContactPairRecord : public cpp_sqlite::BaseTransferObject
{
  uint32_t edge_a{0};
  uint32_t edge_b{0};
  double distance{0.0};  // Client units

  cpp_sqlite::ForeignKey<StepFrameRecord> frame;
};

// Register with Boost.Describe for cpp_sqlite ORM
BOOST_DESCRIBE_STRUCT(ContactPairRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (edge_a, edge_b, distance, frame));

}  // namespace ric_transfer

#endif  // RIC_TRANSFER_CONTACT_PAIR_RECORD_HPP
