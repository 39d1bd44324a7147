// Ticket: 0007_step_synchronizer

#include "ric-sim/src/Server/StepSynchronizer.hpp"

#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>

#include "ric-sim/src/Assembly/GlobalAssembler.hpp"
#include "ric-sim/src/DataRecorder/DataRecorder.hpp"

namespace ric_sim
{

StepSynchronizer::StepSynchronizer(ContactBuffers& buffers,
                                   CollisionDetector detector,
                                   ContactEnergyModel energyModel,
                                   StiffnessController stiffness,
                                   double scale)
  : buffers_{buffers},
    detector_{std::move(detector)},
    energyModel_{std::move(energyModel)},
    stiffness_{std::move(stiffness)},
    scale_{scale}
{
  if (!(scale_ > 0.0))
  {
    throw std::invalid_argument(
      "StepSynchronizer: scale must be positive (got " +
      std::to_string(scale_) + ")");
  }
  if (detector_.getIndex().numEdges() + 1 != buffers_.getNumNodes())
  {
    throw std::invalid_argument(
      "StepSynchronizer: detector covers " +
      std::to_string(detector_.getIndex().numEdges()) + " edges but buffers hold " +
      std::to_string(buffers_.getNumNodes()) + " nodes");
  }

  velocitySnapshot_.resize(0, kPairDof);
}

void StepSynchronizer::setRecorder(DataRecorder* recorder)
{
  recorder_ = recorder;
}

StepSummary StepSynchronizer::onRequest()
{
  if (state_ != State::WaitRequest)
  {
    throw std::logic_error("StepSynchronizer: request received in state " +
                           toString(state_));
  }
  state_ = State::Compute;

  StepSummary summary;
  summary.simulationTime = buffers_.getSimulationTime();
  summary.iteration = buffers_.getIterationCount();
  summary.firstIteration = buffers_.isFirstIteration();
  summary.frictionEnabled = buffers_.isFrictionEnabled();
  summary.hessianRequested = buffers_.isHessianRequested();

  scaledPositions_ = buffers_.positions * scale_;
  if (summary.firstIteration)
  {
    beginTimestep();
  }

  GlobalAssembler::zero(buffers_, summary.hessianRequested);

  if (!activePairs_.empty())
  {
    const ContactBatch batch =
      energyModel_.prepare(scaledPositions_, velocitySnapshot_, activePairs_);
    minDistance_ = batch.minDistance();

    const ContactContributions contributions =
      summary.hessianRequested
        ? energyModel_.computeForcesAndHessians(batch, summary.frictionEnabled)
        : energyModel_.computeForces(batch, summary.frictionEnabled);

    GlobalAssembler::scatterForces(
      contributions.forces, activePairs_, buffers_.forces);
    if (summary.hessianRequested)
    {
      GlobalAssembler::scatterHessians(
        contributions.hessians, activePairs_, buffers_.hessian);
    }
    GlobalAssembler::applyStiffness(
      stiffness_.getStiffness(), buffers_, summary.hessianRequested);

    summary.hessianFallbacks = contributions.hessianFallbacks;
  }

  buffers_.setMinDistance(minDistance_ / scale_);

  summary.numContacts = activePairs_.size();
  summary.minDistance = minDistance_ / scale_;
  summary.stiffness = stiffness_.getStiffness();

  state_ = State::Reply;
  return summary;
}

void StepSynchronizer::onReplySent()
{
  if (state_ != State::Reply)
  {
    throw std::logic_error("StepSynchronizer: reply sent in state " +
                           toString(state_));
  }
  state_ = State::WaitRequest;
}

StepSummary StepSynchronizer::step(RequestChannel& channel)
{
  if (state_ != State::WaitRequest)
  {
    throw std::logic_error("StepSynchronizer: cannot wait for a request in state " +
                           toString(state_));
  }

  channel.waitForRequest();
  const StepSummary summary = onRequest();
  channel.sendReply();
  onReplySent();

  if (summary.firstIteration)
  {
    log(summary);
    record(summary);
  }
  else
  {
    spdlog::debug("StepSynchronizer: sub-iteration {} with {} contacts",
                  summary.iteration,
                  summary.numContacts);
  }

  return summary;
}

void StepSynchronizer::run(RequestChannel& channel)
{
  while (true)
  {
    step(channel);
  }
}

std::string StepSynchronizer::toString(State state)
{
  switch (state)
  {
    case State::WaitRequest:
      return "WaitRequest";
    case State::Compute:
      return "Compute";
    case State::Reply:
      return "Reply";
  }
  return "Unknown";
}

void StepSynchronizer::beginTimestep()
{
  scaledVelocities_ = buffers_.velocities * scale_;

  auto detection = detector_.detect(scaledPositions_);
  activePairs_ = std::move(detection.activePairs);
  activeDistances_ = std::move(detection.activeDistances);
  velocitySnapshot_ = gatherPairs(scaledVelocities_, activePairs_);
  minDistance_ = detection.globalMinDistance;

  // Stiffness for this step reacts to the change since the previous step
  if (previousMinDistance_)
  {
    stiffness_.update(minDistance_, *previousMinDistance_);
  }
  previousMinDistance_ = minDistance_;
}

void StepSynchronizer::record(const StepSummary& summary)
{
  if (recorder_ == nullptr)
  {
    return;
  }

  const uint32_t frameId = recorder_->recordFrame(
    summary.simulationTime, static_cast<uint32_t>(summary.iteration));
  recorder_->recordStep(frameId, summary);

  std::vector<double> distances;
  distances.reserve(activeDistances_.size());
  for (const double d : activeDistances_)
  {
    distances.push_back(d / scale_);
  }
  recorder_->recordContactPairs(frameId, activePairs_, distances);
}

void StepSynchronizer::log(const StepSummary& summary)
{
  spdlog::info(
    "time: {:.4f} | iters: {} | con: {:03d} | min_dist: {:.6f} | k: {:.3e} | "
    "fric: {}",
    summary.simulationTime,
    summary.iteration,
    summary.numContacts,
    summary.minDistance,
    summary.stiffness,
    summary.frictionEnabled);
}

}  // namespace ric_sim
