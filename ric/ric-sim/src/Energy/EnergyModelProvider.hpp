// Ticket: 0003_contact_energy_model

#ifndef RIC_SIM_ENERGY_ENERGY_MODEL_PROVIDER_HPP
#define RIC_SIM_ENERGY_ENERGY_MODEL_PROVIDER_HPP

#include <Eigen/Dense>
#include <string>
#include <vector>

#include "ric-sim/src/Contact/ContactTypes.hpp"

namespace ric_sim
{

/**
 * @brief Derivative building blocks of a pairwise contact energy
 *
 * The energy of an edge pair is a composition of two layers:
 *
 *   Layer 1: x (12 coordinates) -> [d1, d2, d12] (linear) and the six scalar
 *            invariants [D1, D2, R, S1, S2, den]
 *   Layer 2: the 15 derived parameters -> E
 *
 * Providers evaluate each layer's derivatives in batch over P pairs. The
 * consumer (ContactEnergyModel) chains them together and checks every
 * returned shape, so outputs use dynamic Eigen types.
 *
 * | Operation                    | Output                  |
 * |------------------------------|-------------------------|
 * | linearJacobian               | 9 x 12                  |
 * | firstLayerGradients          | 6 matrices of P x 12    |
 * | firstLayerConstantHessians   | 5 matrices of 12 x 12   |
 * | firstLayerVariableHessians   | P matrices of 12 x 12   |
 * | secondLayerGradients         | P x 15                  |
 * | secondLayerHessians          | P matrices of 15 x 15   |
 * | frictionJacobians            | P matrices of 6 x 24    |
 *
 * Thread safety: Implementations must be const-callable from one thread
 *
 * @ticket 0003_contact_energy_model
 */
class EnergyModelProvider
{
public:
  virtual ~EnergyModelProvider() = default;

  /**
   * @brief Constant jacobian of [d1, d2, d12] with respect to x
   */
  [[nodiscard]] virtual Eigen::MatrixXd linearJacobian() const = 0;

  /**
   * @brief Gradients of D1, D2, R, S1, S2, den with respect to x
   * @param coordinates P x 12 pair coordinates
   * @return Six P x 12 matrices, one per invariant
   */
  [[nodiscard]] virtual std::vector<Eigen::MatrixXd> firstLayerGradients(
    const PairMatrix& coordinates) const = 0;

  /**
   * @brief Hessians of D1, D2, R, S1, S2 (constant in x)
   */
  [[nodiscard]] virtual std::vector<Eigen::MatrixXd>
  firstLayerConstantHessians() const = 0;

  /**
   * @brief Hessian of den for every pair
   */
  [[nodiscard]] virtual std::vector<Eigen::MatrixXd> firstLayerVariableHessians(
    const PairMatrix& coordinates) const = 0;

  /**
   * @brief Gradient of E with respect to the 15 derived parameters
   * @return P x 15
   */
  [[nodiscard]] virtual Eigen::MatrixXd secondLayerGradients(
    const DerivedParameters& derived) const = 0;

  /**
   * @brief Hessian of E with respect to the 15 derived parameters
   * @return P matrices of 15 x 15
   */
  [[nodiscard]] virtual std::vector<Eigen::MatrixXd> secondLayerHessians(
    const DerivedParameters& derived) const = 0;

  /**
   * @brief Jacobian of the per-node friction force
   *
   * Input row: [coordinates(12), velocities(12), energy gradient(12), mu].
   * Output rows 0-2 are the force on the first edge's nodes, rows 3-5 the
   * force on the second edge's nodes. Columns 0-11 differentiate by
   * coordinates, columns 12-23 by energy gradient.
   *
   * @param inputs P x 37
   */
  [[nodiscard]] virtual std::vector<Eigen::MatrixXd> frictionJacobians(
    const Eigen::MatrixXd& inputs) const = 0;

  [[nodiscard]] virtual std::string getName() const = 0;

protected:
  EnergyModelProvider() = default;
  EnergyModelProvider(const EnergyModelProvider&) = default;
  EnergyModelProvider& operator=(const EnergyModelProvider&) = default;
  EnergyModelProvider(EnergyModelProvider&&) noexcept = default;
  EnergyModelProvider& operator=(EnergyModelProvider&&) noexcept = default;
};

}  // namespace ric_sim

#endif  // RIC_SIM_ENERGY_ENERGY_MODEL_PROVIDER_HPP
