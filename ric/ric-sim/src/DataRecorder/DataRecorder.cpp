// Ticket: 0008_contact_diagnostics_recording

#include "ric-sim/src/DataRecorder/DataRecorder.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

#include "ric-sim/src/Server/StepSummary.hpp"
#include "ric-transfer/src/ContactPairRecord.hpp"
#include "ric-transfer/src/ContactStepRecord.hpp"
#include "ric-transfer/src/StepFrameRecord.hpp"

namespace ric_sim
{

DataRecorder::DataRecorder(const Config& config)
  : flushInterval_{config.flushInterval}
{
  database_ = std::make_unique<cpp_sqlite::Database>(config.databasePath, true);

  // All DAOs exist before the recorder thread iterates them; the frame DAO
  // comes first for FK integrity
  database_->getDAO<ric_transfer::StepFrameRecord>();
  database_->getDAO<ric_transfer::ContactStepRecord>();
  database_->getDAO<ric_transfer::ContactPairRecord>();

  recorderThread_ = std::jthread{[this](std::stop_token st)
                                 { recorderThreadMain(std::move(st)); }};
}

DataRecorder::~DataRecorder()
{
  recorderThread_.request_stop();
}

uint32_t DataRecorder::recordFrame(double simulationTime, uint32_t iteration)
{
  const uint32_t frameId = nextFrameId_.fetch_add(1);

  ric_transfer::StepFrameRecord record{};
  record.id = frameId;
  record.simulation_time = simulationTime;
  record.iteration = iteration;

  const auto now = std::chrono::system_clock::now().time_since_epoch();
  record.wall_clock_time =
    std::chrono::duration_cast<std::chrono::duration<double>>(now).count();

  database_->getDAO<ric_transfer::StepFrameRecord>().addToBuffer(record);
  return frameId;
}

void DataRecorder::recordStep(uint32_t frameId, const StepSummary& summary)
{
  getDAO<ric_transfer::ContactStepRecord>().addToBuffer(
    summary.toRecord(frameId));
}

void DataRecorder::recordContactPairs(uint32_t frameId,
                                      std::span<const EdgePair> pairs,
                                      std::span<const double> distances)
{
  if (pairs.size() != distances.size())
  {
    throw std::invalid_argument(
      "DataRecorder: " + std::to_string(distances.size()) +
      " distances for " + std::to_string(pairs.size()) + " pairs");
  }

  auto& pairDAO = getDAO<ric_transfer::ContactPairRecord>();
  for (size_t i = 0; i < pairs.size(); ++i)
  {
    ric_transfer::ContactPairRecord record{};
    record.edge_a = pairs[i].first;
    record.edge_b = pairs[i].second;
    record.distance = distances[i];
    record.frame.id = frameId;
    pairDAO.addToBuffer(record);
  }
}

void DataRecorder::flush()
{
  std::scoped_lock lock{flushMutex_};
  database_->withTransaction([this]() { database_->flushAllDAOs(); });
}

void DataRecorder::recorderThreadMain(std::stop_token stopToken)
{
  // Sleep in small chunks for responsive shutdown
  constexpr auto kSleepChunk = std::chrono::milliseconds{10};

  while (!stopToken.stop_requested())
  {
    auto remaining = flushInterval_;
    while (remaining > std::chrono::milliseconds{0} &&
           !stopToken.stop_requested())
    {
      const auto sleepTime = std::min(remaining, kSleepChunk);
      std::this_thread::sleep_for(sleepTime);
      remaining -= sleepTime;
    }

    if (stopToken.stop_requested())
    {
      break;
    }

    flush();
  }

  // Final flush before the thread exits
  flush();
}

const cpp_sqlite::Database& DataRecorder::getDatabase() const
{
  return *database_;
}

template <typename T>
cpp_sqlite::DataAccessObject<T>& DataRecorder::getDAO()
{
  return database_->getDAO<T>();
}

template cpp_sqlite::DataAccessObject<ric_transfer::StepFrameRecord>&
DataRecorder::getDAO<ric_transfer::StepFrameRecord>();

template cpp_sqlite::DataAccessObject<ric_transfer::ContactStepRecord>&
DataRecorder::getDAO<ric_transfer::ContactStepRecord>();

template cpp_sqlite::DataAccessObject<ric_transfer::ContactPairRecord>&
DataRecorder::getDAO<ric_transfer::ContactPairRecord>();

}  // namespace ric_sim
