// Ticket: 0003_contact_energy_model

#ifndef RIC_SIM_ENERGY_SMOOTHED_CONTACT_ENERGY_HPP
#define RIC_SIM_ENERGY_SMOOTHED_CONTACT_ENERGY_HPP

#include <Eigen/Dense>
#include <memory>
#include <string>
#include <vector>

#include "ric-sim/src/Contact/ContactTypes.hpp"
#include "ric-sim/src/Energy/EnergyModelProvider.hpp"

namespace ric_sim
{

/**
 * @brief Smoothed-penalty contact energy with analytic derivatives
 *
 * E(dist) = ( (1/K) * log(1 + exp(K * (h - dist))) )^2
 *
 * K is the sharpness (energy-model selector key) and h the contact length.
 * The softplus is evaluated in its overflow-free form. dist is the clamped
 * segment-segment distance, differentiated along the branch recorded by the
 * closest-point scan.
 *
 * Parallel pairs use t = 0 and are differentiated along that branch.
 *
 * Thread safety: Immutable after construction (thread-safe)
 *
 * @ticket 0003_contact_energy_model
 */
class SmoothedContactEnergy : public EnergyModelProvider
{
public:
  using InvariantVector = Eigen::Matrix<double, kNumInvariants, 1>;
  using InvariantMatrix = Eigen::Matrix<double, kNumInvariants, kNumInvariants>;
  using DerivedVector = Eigen::Matrix<double, kNumDerivedParameters, 1>;
  using DerivedHessian =
    Eigen::Matrix<double, kNumDerivedParameters, kNumDerivedParameters>;

  /**
   * @brief Value and derivatives of a scalar with respect to the six
   * invariants [D1, D2, R, S1, S2, den]
   */
  struct InvariantDerivatives
  {
    double value{0.0};
    InvariantVector gradient{InvariantVector::Zero()};
    InvariantMatrix hessian{InvariantMatrix::Zero()};
  };

  /**
   * @brief Value and derivatives of the distance with respect to the 15
   * derived parameters
   */
  struct DistanceDerivatives
  {
    double value{0.0};
    DerivedVector gradient{DerivedVector::Zero()};
    DerivedHessian hessian{DerivedHessian::Zero()};
  };

  /**
   * @param sharpness Softplus sharpness K
   * @param contactLength Contact length h
   * @throws std::invalid_argument if either is non-positive or non-finite
   */
  SmoothedContactEnergy(double sharpness, double contactLength);

  ~SmoothedContactEnergy() override = default;

  SmoothedContactEnergy(const SmoothedContactEnergy&) = default;
  SmoothedContactEnergy& operator=(const SmoothedContactEnergy&) = default;
  SmoothedContactEnergy(SmoothedContactEnergy&&) noexcept = default;
  SmoothedContactEnergy& operator=(SmoothedContactEnergy&&) noexcept = default;

  [[nodiscard]] Eigen::MatrixXd linearJacobian() const override;

  [[nodiscard]] std::vector<Eigen::MatrixXd> firstLayerGradients(
    const PairMatrix& coordinates) const override;

  [[nodiscard]] std::vector<Eigen::MatrixXd> firstLayerConstantHessians()
    const override;

  [[nodiscard]] std::vector<Eigen::MatrixXd> firstLayerVariableHessians(
    const PairMatrix& coordinates) const override;

  [[nodiscard]] Eigen::MatrixXd secondLayerGradients(
    const DerivedParameters& derived) const override;

  [[nodiscard]] std::vector<Eigen::MatrixXd> secondLayerHessians(
    const DerivedParameters& derived) const override;

  [[nodiscard]] std::vector<Eigen::MatrixXd> frictionJacobians(
    const Eigen::MatrixXd& inputs) const override;

  [[nodiscard]] std::string getName() const override;

  /**
   * @brief Contact energy at a given distance
   */
  [[nodiscard]] double energy(double distance) const;

  /**
   * @brief dE/d(dist) and d2E/d(dist)2 at a given distance
   */
  [[nodiscard]] Eigen::Vector2d energyDistanceDerivatives(double distance) const;

  /**
   * @brief Closest-point parameter t along its branch
   * @param invariants [D1, D2, R, S1, S2, den]
   */
  [[nodiscard]] static InvariantDerivatives parameterT(
    const InvariantVector& invariants,
    const ClosestPointBranch& branch);

  /**
   * @brief Closest-point parameter u along its branch
   * @param t Derivatives of t, used when u is projected from t
   */
  [[nodiscard]] static InvariantDerivatives parameterU(
    const InvariantVector& invariants,
    const ClosestPointBranch& branch,
    const InvariantDerivatives& t);

  /**
   * @brief Distance and its derivatives for one row of derived parameters
   */
  [[nodiscard]] static DistanceDerivatives distanceDerivatives(
    const DerivedVector& parameters,
    const ClosestPointBranch& branch);

  [[nodiscard]] double getSharpness() const
  {
    return sharpness_;
  }

  [[nodiscard]] double getContactLength() const
  {
    return contactLength_;
  }

private:
  double sharpness_;
  double contactLength_;
};

/**
 * @brief Build the energy model selected at startup
 *
 * @param selectorKey Energy-model selector (softplus sharpness)
 * @param contactLength Contact length in normalized units
 * @throws std::invalid_argument for a non-positive or non-finite key
 */
[[nodiscard]] std::shared_ptr<const EnergyModelProvider> makeEnergyModel(
  double selectorKey,
  double contactLength);

}  // namespace ric_sim

#endif  // RIC_SIM_ENERGY_SMOOTHED_CONTACT_ENERGY_HPP
