// Ticket: 0007_step_synchronizer

#ifndef RIC_SIM_SERVER_STEP_SYNCHRONIZER_HPP
#define RIC_SIM_SERVER_STEP_SYNCHRONIZER_HPP

#include <Eigen/Dense>
#include <optional>
#include <string>
#include <vector>

#include "ric-sim/src/Contact/CollisionDetector.hpp"
#include "ric-sim/src/Contact/ContactTypes.hpp"
#include "ric-sim/src/Control/StiffnessController.hpp"
#include "ric-sim/src/Energy/ContactEnergyModel.hpp"
#include "ric-sim/src/Server/ContactBuffers.hpp"
#include "ric-sim/src/Server/RequestChannel.hpp"
#include "ric-sim/src/Server/StepSummary.hpp"

namespace ric_sim
{

class DataRecorder;

/**
 * @brief Services contact requests from the simulation client
 *
 * Each request is one state cycle:
 *
 *   WaitRequest -> Compute -> Reply -> WaitRequest
 *
 * Compute reads the control flags, scales a local copy of the positions by
 * the normalization scale and, on the first iteration of a timestep:
 * - scales the velocities and runs detection over every eligible pair
 * - snapshots per-pair velocities for the timestep's friction evaluations
 * - updates the stiffness from the previous step's minimum distance
 *
 * Every request then zeroes the outputs, re-evaluates the held active set at
 * the current positions, assembles forces (and the Hessian when requested),
 * scales them by the stiffness and writes the minimum distance divided by
 * the scale.
 *
 * The active set is fixed for the timestep; sub-iterations never re-detect.
 *
 * Error handling: a request or reply out of order throws std::logic_error;
 * model and buffer errors propagate.
 *
 * Thread safety: Not thread-safe (single server thread)
 *
 * @ticket 0007_step_synchronizer
 */
class StepSynchronizer
{
public:
  enum class State
  {
    WaitRequest,
    Compute,
    Reply
  };

  /**
   * @param buffers Shared buffers; must outlive the synchronizer
   * @param scale Normalization scale applied to positions and velocities
   * @throws std::invalid_argument if scale is not positive, or the buffers
   *         and detector disagree on the node count
   */
  StepSynchronizer(ContactBuffers& buffers,
                   CollisionDetector detector,
                   ContactEnergyModel energyModel,
                   StiffnessController stiffness,
                   double scale);

  /**
   * @brief Record first-iteration diagnostics to the given recorder
   * @param recorder Non-owning, may be null to disable recording
   */
  void setRecorder(DataRecorder* recorder);

  /**
   * @brief Compute phase for a request already received
   * @throws std::logic_error unless waiting for a request
   */
  StepSummary onRequest();

  /**
   * @brief Mark the reply as sent
   * @throws std::logic_error unless a reply is pending
   */
  void onReplySent();

  /**
   * @brief Wait for one request, service it and reply
   */
  StepSummary step(RequestChannel& channel);

  /**
   * @brief Service requests until the channel or the model throws
   */
  void run(RequestChannel& channel);

  [[nodiscard]] State getState() const
  {
    return state_;
  }

  [[nodiscard]] const std::vector<EdgePair>& getActivePairs() const
  {
    return activePairs_;
  }

  [[nodiscard]] const StiffnessController& getStiffnessController() const
  {
    return stiffness_;
  }

  [[nodiscard]] const CollisionDetector& getDetector() const
  {
    return detector_;
  }

  [[nodiscard]] std::optional<double> getPreviousMinDistance() const
  {
    return previousMinDistance_;
  }

  [[nodiscard]] static std::string toString(State state);

private:
  void beginTimestep();
  void record(const StepSummary& summary);
  static void log(const StepSummary& summary);

  ContactBuffers& buffers_;
  CollisionDetector detector_;
  ContactEnergyModel energyModel_;
  StiffnessController stiffness_;
  double scale_;
  DataRecorder* recorder_{nullptr};

  State state_{State::WaitRequest};

  std::vector<EdgePair> activePairs_;
  std::vector<double> activeDistances_;  // normalized units, at detection
  PairMatrix velocitySnapshot_;
  Eigen::VectorXd scaledPositions_;
  Eigen::VectorXd scaledVelocities_;

  double minDistance_{0.0};  // normalized units
  std::optional<double> previousMinDistance_;
};

}  // namespace ric_sim

#endif  // RIC_SIM_SERVER_STEP_SYNCHRONIZER_HPP
