// Ticket: 0008_contact_diagnostics_recording

#ifndef RIC_SIM_DATA_RECORDER_HPP
#define RIC_SIM_DATA_RECORDER_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <span>
#include <stop_token>
#include <string>
#include <thread>

#include <cpp_sqlite/src/cpp_sqlite/DBDataAccessObject.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBDatabase.hpp>

#include "ric-sim/src/Contact/ContactTypes.hpp"

namespace ric_sim
{

struct StepSummary;

/**
 * @brief Background recording of contact diagnostics to SQLite
 *
 * The server thread buffers records through cpp_sqlite's double-buffered
 * DAOs; a dedicated thread flushes them in a transaction every
 * flushInterval. The destructor performs a final flush.
 *
 * Architecture:
 * - recordFrame() creates the frame every per-step record references
 * - recordStep() and recordContactPairs() buffer the step's records
 * - The recorder thread flushes all DAOs periodically
 *
 * @ticket 0008_contact_diagnostics_recording
 */
class DataRecorder
{
public:
  struct Config
  {
    std::chrono::milliseconds flushInterval{100};
    std::string databasePath;
  };

  /**
   * @brief Open the database and start the recorder thread
   * @throws std::runtime_error if the database cannot be opened
   */
  explicit DataRecorder(const Config& config);

  /**
   * @brief Stops the recorder thread, which flushes before exiting
   */
  ~DataRecorder();

  DataRecorder(const DataRecorder&) = delete;
  DataRecorder& operator=(const DataRecorder&) = delete;
  DataRecorder(DataRecorder&&) = delete;
  DataRecorder& operator=(DataRecorder&&) = delete;

  /**
   * @brief Create a new frame with a pre-assigned id
   *
   * Thread-safe: atomic id assignment, mutex-protected addToBuffer().
   *
   * @return Frame id for FK references
   */
  uint32_t recordFrame(double simulationTime, uint32_t iteration);

  void recordStep(uint32_t frameId, const StepSummary& summary);

  /**
   * @param distances Distance per pair in client units
   * @throws std::invalid_argument if the spans differ in length
   */
  void recordContactPairs(uint32_t frameId,
                          std::span<const EdgePair> pairs,
                          std::span<const double> distances);

  template <typename T>
  cpp_sqlite::DataAccessObject<T>& getDAO();

  /**
   * @brief Flush all pending records in one transaction
   */
  void flush();

  [[nodiscard]] const cpp_sqlite::Database& getDatabase() const;

private:
  void recorderThreadMain(std::stop_token stopToken);

  std::unique_ptr<cpp_sqlite::Database> database_;
  std::chrono::milliseconds flushInterval_;
  std::mutex flushMutex_;
  std::atomic<uint32_t> nextFrameId_{1};
  // Declared last: started after and joined before the other members
  std::jthread recorderThread_;
};

}  // namespace ric_sim

#endif  // RIC_SIM_DATA_RECORDER_HPP
