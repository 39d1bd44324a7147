// Ticket: 0004_adaptive_contact_stiffness

#ifndef RIC_SIM_CONTROL_STIFFNESS_CONTROLLER_HPP
#define RIC_SIM_CONTROL_STIFFNESS_CONTROLLER_HPP

#include <optional>

namespace ric_sim
{

/**
 * @brief Optional bounds on the adapted contact stiffness
 *
 * Both bounds are absent by default, leaving the gain unclamped.
 */
struct StiffnessLimits
{
  std::optional<double> floor;
  std::optional<double> ceiling;
};

/**
 * @brief Hysteretic contact stiffness schedule
 *
 * Once per timestep the controller compares the current minimum pair
 * distance with the previous step's and multiplies the gain by a factor:
 *
 * | Condition (h = contact length)                        | Factor |
 * |-------------------------------------------------------|--------|
 * | current > h + 0.005 and current > previous            | 0.999  |
 * | current < previous, current < h - 0.004               | 1.01   |
 * | current < previous, h - 0.004 <= current < h - 0.002  | 1.005  |
 * | current < previous, h - 0.002 <= current < h - 0.001  | 1.003  |
 * | current < previous, h - 0.001 <= current < h          | 1.001  |
 * | otherwise                                             | 1.0    |
 *
 * The first rule takes precedence when both could apply.
 *
 * @ticket 0004_adaptive_contact_stiffness
 */
class StiffnessController
{
public:
  /**
   * @param initialStiffness Starting gain k
   * @param contactLength Contact length h in normalized units
   * @param limits Optional floor and ceiling for k
   * @throws std::invalid_argument if initialStiffness <= 0, contactLength <= 0
   *         or the limits are inconsistent
   */
  StiffnessController(double initialStiffness,
                      double contactLength,
                      StiffnessLimits limits = {});

  /**
   * @brief Multiplicative factor for one step of the schedule
   */
  [[nodiscard]] static double scheduleFactor(double current,
                                             double previous,
                                             double contactLength);

  /**
   * @brief Apply one step of the schedule
   *
   * Non-finite distances leave the gain unchanged.
   *
   * @return Updated stiffness
   */
  double update(double current, double previous);

  [[nodiscard]] double getStiffness() const
  {
    return stiffness_;
  }

  [[nodiscard]] double getContactLength() const
  {
    return contactLength_;
  }

  [[nodiscard]] const StiffnessLimits& getLimits() const
  {
    return limits_;
  }

private:
  static constexpr double kRelaxFactor{0.999};
  static constexpr double kRelaxMargin{0.005};

  double stiffness_;
  double contactLength_;
  StiffnessLimits limits_;
};

}  // namespace ric_sim

#endif  // RIC_SIM_CONTROL_STIFFNESS_CONTROLLER_HPP
