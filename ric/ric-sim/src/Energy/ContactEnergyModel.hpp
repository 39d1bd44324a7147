// Ticket: 0003_contact_energy_model

#ifndef RIC_SIM_ENERGY_CONTACT_ENERGY_MODEL_HPP
#define RIC_SIM_ENERGY_CONTACT_ENERGY_MODEL_HPP

#include <Eigen/Dense>
#include <limits>
#include <memory>
#include <span>
#include <vector>

#include "ric-sim/src/Contact/ContactTypes.hpp"
#include "ric-sim/src/Energy/EnergyModelProvider.hpp"

namespace ric_sim
{

/**
 * @brief Active contact set gathered for one evaluation
 *
 * coordinates and velocities are P x 12 in pair order. velocities are the
 * snapshot taken at the start of the timestep.
 */
struct ContactBatch
{
  std::vector<EdgePair> pairs;
  PairMatrix coordinates;
  PairMatrix velocities;
  DerivedParameters derived;

  [[nodiscard]] size_t size() const
  {
    return pairs.size();
  }

  /**
   * @brief Smallest distance in the batch, +infinity when empty
   */
  [[nodiscard]] double minDistance() const
  {
    return derived.distances.size() > 0
             ? derived.distances.minCoeff()
             : std::numeric_limits<double>::infinity();
  }
};

/**
 * @brief Per-pair contact forces and optional Hessians
 *
 * forces is P x 12 and holds dE/dx for each pair (plus the friction term when
 * enabled). hessians is empty unless requested.
 */
struct ContactContributions
{
  PairMatrix forces;
  std::vector<PairHessian> hessians;
  size_t hessianFallbacks{0};
};

/**
 * @brief Chains the provider's layer derivatives into per-pair forces and
 * Hessians
 *
 * Forces:
 *   dE/dx = s_grad[0:9] * dd + sum_k s_grad[9+k] * f_grad[k]
 *
 * Hessians, with G = [dd; f_grad rows] (15 x 12):
 *   d2E/dx2 = G^T * s_hess * G + sum_{k<5} s_grad[9+k] * H_k
 *             + s_grad[14] * H_den
 *
 * With friction enabled, each endpoint additionally receives a Coulomb
 * force of magnitude mu * |f1s + f1e| / 4 along the other edge's tangent,
 * and the Hessian receives the friction jacobian chained through the
 * conservative Hessian.
 *
 * Error handling:
 * - Provider outputs with the wrong shape throw std::runtime_error
 * - Non-finite forces throw NumericalFailure
 * - A non-finite Hessian discards the friction term for that pair and is
 *   counted; a non-finite conservative Hessian throws NumericalFailure
 *
 * Thread safety: Not thread-safe (single-threaded use per timestep)
 *
 * @ticket 0003_contact_energy_model
 */
class ContactEnergyModel
{
public:
  /**
   * @param provider Layer derivative provider
   * @param frictionCoefficient Coulomb coefficient mu
   * @throws std::invalid_argument if provider is null or mu is negative
   * @throws std::runtime_error if the provider's constant blocks have the
   *         wrong shape
   */
  ContactEnergyModel(std::shared_ptr<const EnergyModelProvider> provider,
                     double frictionCoefficient);

  /**
   * @brief Gather the batch for the given active pairs
   * @param positions Flat 3N scaled positions
   * @param velocities P x 12 velocity snapshot, rows matching pairs
   * @param pairs Active pairs
   * @throws std::invalid_argument if velocities does not match pairs
   */
  [[nodiscard]] ContactBatch prepare(
    const Eigen::Ref<const Eigen::VectorXd>& positions,
    const PairMatrix& velocities,
    std::span<const EdgePair> pairs) const;

  /**
   * @brief Per-pair forces for the batch
   * @throws NumericalFailure if any force is non-finite
   */
  [[nodiscard]] ContactContributions computeForces(const ContactBatch& batch,
                                                   bool frictionEnabled) const;

  /**
   * @brief Per-pair forces and Hessians for the batch
   * @throws NumericalFailure if any force is non-finite
   */
  [[nodiscard]] ContactContributions computeForcesAndHessians(
    const ContactBatch& batch,
    bool frictionEnabled) const;

  /**
   * @brief Coulomb friction forces for the batch
   * @param conservative P x 12 conservative forces (dE/dx)
   * @return P x 12 friction forces
   */
  [[nodiscard]] PairMatrix frictionForces(const ContactBatch& batch,
                                          const PairMatrix& conservative) const;

  [[nodiscard]] double getFrictionCoefficient() const
  {
    return frictionCoefficient_;
  }

  [[nodiscard]] const EnergyModelProvider& getProvider() const
  {
    return *provider_;
  }

private:
  struct LayerGradients
  {
    std::vector<Eigen::MatrixXd> first;  // 6 x (P x 12)
    Eigen::MatrixXd second;              // P x 15
  };

  [[nodiscard]] LayerGradients evaluateGradients(
    const ContactBatch& batch) const;

  [[nodiscard]] PairMatrix conservativeForces(
    const LayerGradients& gradients) const;

  [[nodiscard]] std::vector<PairHessian> conservativeHessians(
    const ContactBatch& batch,
    const LayerGradients& gradients) const;

  /**
   * @brief Add the friction jacobian to each Hessian
   * @return Number of pairs that fell back to the conservative Hessian
   */
  size_t addFrictionJacobians(const ContactBatch& batch,
                              const PairMatrix& conservative,
                              std::vector<PairHessian>& hessians) const;

  static void checkFinite(const PairMatrix& forces);

  std::shared_ptr<const EnergyModelProvider> provider_;
  double frictionCoefficient_;
  Eigen::MatrixXd linearJacobian_;                // 9 x 12
  std::vector<Eigen::MatrixXd> constantHessians_;  // 5 x (12 x 12)
};

}  // namespace ric_sim

#endif  // RIC_SIM_ENERGY_CONTACT_ENERGY_MODEL_HPP
