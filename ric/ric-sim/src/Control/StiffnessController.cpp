// Ticket: 0004_adaptive_contact_stiffness

#include "ric-sim/src/Control/StiffnessController.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <stdexcept>
#include <string>

namespace ric_sim
{

namespace
{

struct PenetrationBand
{
  double depth;   // band applies below h - depth
  double factor;
};

// Deepest band first
constexpr std::array<PenetrationBand, 4> kPenetrationBands{{{0.004, 1.01},
                                                            {0.002, 1.005},
                                                            {0.001, 1.003},
                                                            {0.0, 1.001}}};

}  // namespace

StiffnessController::StiffnessController(double initialStiffness,
                                         double contactLength,
                                         StiffnessLimits limits)
  : stiffness_{initialStiffness},
    contactLength_{contactLength},
    limits_{limits}
{
  if (!(stiffness_ > 0.0))
  {
    throw std::invalid_argument(
      "StiffnessController: initial stiffness must be positive (got " +
      std::to_string(stiffness_) + ")");
  }
  if (!(contactLength_ > 0.0))
  {
    throw std::invalid_argument(
      "StiffnessController: contact length must be positive (got " +
      std::to_string(contactLength_) + ")");
  }
  if (limits_.floor && limits_.ceiling && *limits_.floor > *limits_.ceiling)
  {
    throw std::invalid_argument(
      "StiffnessController: stiffness floor " + std::to_string(*limits_.floor) +
      " exceeds ceiling " + std::to_string(*limits_.ceiling));
  }
}

double StiffnessController::scheduleFactor(double current,
                                           double previous,
                                           double contactLength)
{
  if (current > contactLength + kRelaxMargin && current > previous)
  {
    return kRelaxFactor;
  }

  if (current < previous)
  {
    for (const auto& band : kPenetrationBands)
    {
      if (current < contactLength - band.depth)
      {
        return band.factor;
      }
    }
  }

  return 1.0;
}

double StiffnessController::update(double current, double previous)
{
  if (!std::isfinite(current) || !std::isfinite(previous))
  {
    return stiffness_;
  }

  stiffness_ *= scheduleFactor(current, previous, contactLength_);

  if (limits_.floor)
  {
    stiffness_ = std::max(stiffness_, *limits_.floor);
  }
  if (limits_.ceiling)
  {
    stiffness_ = std::min(stiffness_, *limits_.ceiling);
  }
  return stiffness_;
}

}  // namespace ric_sim
