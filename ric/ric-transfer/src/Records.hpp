#ifndef RIC_TRANSFER_RECORDS_HPP
#define RIC_TRANSFER_RECORDS_HPP

/**
 * @file Records.hpp
 * @brief Convenience header including all diagnostics transfer objects
 */

#include "ric-transfer/src/ContactPairRecord.hpp"
#include "ric-transfer/src/ContactStepRecord.hpp"
#include "ric-transfer/src/StepFrameRecord.hpp"

#endif  // RIC_TRANSFER_RECORDS_HPP
