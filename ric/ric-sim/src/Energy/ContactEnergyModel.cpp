// Ticket: 0003_contact_energy_model

#include "ric-sim/src/Energy/ContactEnergyModel.hpp"

#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <utility>

#include "ric-sim/src/Contact/SegmentDistance.hpp"
#include "ric-sim/src/Energy/NumericalFailure.hpp"

namespace ric_sim
{

namespace
{

constexpr size_t kNumConstantHessians{5};
constexpr Eigen::Index kFrictionJacobianRows{6};
constexpr Eigen::Index kFrictionJacobianCols{2 * kPairDof};

std::string shapeString(Eigen::Index rows, Eigen::Index cols)
{
  return std::to_string(rows) + "x" + std::to_string(cols);
}

void checkShape(const Eigen::MatrixXd& m,
                Eigen::Index rows,
                Eigen::Index cols,
                const std::string& what)
{
  if (m.rows() != rows || m.cols() != cols)
  {
    throw std::runtime_error("ContactEnergyModel: " + what + " must be " +
                             shapeString(rows, cols) + " (got " +
                             shapeString(m.rows(), m.cols()) + ")");
  }
}

void checkShapes(const std::vector<Eigen::MatrixXd>& ms,
                 size_t count,
                 Eigen::Index rows,
                 Eigen::Index cols,
                 const std::string& what)
{
  if (ms.size() != count)
  {
    throw std::runtime_error("ContactEnergyModel: expected " +
                             std::to_string(count) + " " + what +
                             " (got " + std::to_string(ms.size()) + ")");
  }
  for (const auto& m : ms)
  {
    checkShape(m, rows, cols, what);
  }
}

double direction(double value)
{
  return static_cast<double>((0.0 < value) - (value < 0.0));
}

}  // namespace

ContactEnergyModel::ContactEnergyModel(
  std::shared_ptr<const EnergyModelProvider> provider,
  double frictionCoefficient)
  : provider_{std::move(provider)}, frictionCoefficient_{frictionCoefficient}
{
  if (!provider_)
  {
    throw std::invalid_argument("ContactEnergyModel: provider must not be null");
  }
  if (frictionCoefficient_ < 0.0)
  {
    throw std::invalid_argument(
      "ContactEnergyModel: friction coefficient must be non-negative (got " +
      std::to_string(frictionCoefficient_) + ")");
  }

  // Constant blocks are fetched once and validated up front
  linearJacobian_ = provider_->linearJacobian();
  checkShape(linearJacobian_, kNumLinearParameters, kPairDof,
             "linear jacobian");

  constantHessians_ = provider_->firstLayerConstantHessians();
  checkShapes(constantHessians_, kNumConstantHessians, kPairDof, kPairDof,
              "constant first-layer Hessians");
}

ContactBatch ContactEnergyModel::prepare(
  const Eigen::Ref<const Eigen::VectorXd>& positions,
  const PairMatrix& velocities,
  std::span<const EdgePair> pairs) const
{
  if (static_cast<size_t>(velocities.rows()) != pairs.size())
  {
    throw std::invalid_argument(
      "ContactEnergyModel: velocity snapshot has " +
      std::to_string(velocities.rows()) + " rows for " +
      std::to_string(pairs.size()) + " pairs");
  }

  ContactBatch batch;
  batch.pairs.assign(pairs.begin(), pairs.end());
  batch.coordinates = gatherPairs(positions, pairs);
  batch.velocities = velocities;
  batch.derived = segment_distance::computeDerivedParameters(batch.coordinates);
  return batch;
}

ContactContributions ContactEnergyModel::computeForces(
  const ContactBatch& batch,
  bool frictionEnabled) const
{
  ContactContributions contributions;
  if (batch.size() == 0)
  {
    contributions.forces.resize(0, kPairDof);
    return contributions;
  }

  const auto gradients = evaluateGradients(batch);
  contributions.forces = conservativeForces(gradients);
  if (frictionEnabled)
  {
    contributions.forces += frictionForces(batch, contributions.forces);
  }

  checkFinite(contributions.forces);
  return contributions;
}

ContactContributions ContactEnergyModel::computeForcesAndHessians(
  const ContactBatch& batch,
  bool frictionEnabled) const
{
  ContactContributions contributions;
  if (batch.size() == 0)
  {
    contributions.forces.resize(0, kPairDof);
    return contributions;
  }

  const auto gradients = evaluateGradients(batch);
  const PairMatrix conservative = conservativeForces(gradients);

  contributions.forces = conservative;
  if (frictionEnabled)
  {
    contributions.forces += frictionForces(batch, conservative);
  }
  checkFinite(contributions.forces);

  contributions.hessians = conservativeHessians(batch, gradients);
  for (const auto& h : contributions.hessians)
  {
    if (!h.allFinite())
    {
      throw NumericalFailure(
        "ContactEnergyModel: non-finite conservative contact Hessian");
    }
  }

  if (frictionEnabled)
  {
    contributions.hessianFallbacks =
      addFrictionJacobians(batch, conservative, contributions.hessians);
    if (contributions.hessianFallbacks > 0)
    {
      spdlog::warn(
        "ContactEnergyModel: friction jacobian non-finite for {} of {} pairs, "
        "using conservative Hessian",
        contributions.hessianFallbacks,
        batch.size());
    }
  }

  return contributions;
}

PairMatrix ContactEnergyModel::frictionForces(
  const ContactBatch& batch,
  const PairMatrix& conservative) const
{
  PairMatrix friction = PairMatrix::Zero(conservative.rows(), kPairDof);

  for (Eigen::Index p = 0; p < conservative.rows(); ++p)
  {
    const PairVector x = batch.coordinates.row(p);
    const PairVector v = batch.velocities.row(p);
    const PairVector f = conservative.row(p);

    // Edge 1 slides along edge 2's tangent and vice versa
    const Eigen::Vector3d tangent1 =
      (x.segment<3>(9) - x.segment<3>(6)).transpose().normalized();
    const Eigen::Vector3d tangent2 =
      (x.segment<3>(3) - x.segment<3>(0)).transpose().normalized();

    const double magnitude =
      frictionCoefficient_ * (f.segment<3>(0) + f.segment<3>(3)).norm();

    const Eigen::Vector3d relativeVelocity =
      0.5 * (v.segment<3>(0) + v.segment<3>(3)).transpose() -
      0.5 * (v.segment<3>(6) + v.segment<3>(9)).transpose();

    const double dir1 = direction(relativeVelocity.dot(tangent1));
    const double dir2 = direction(-relativeVelocity.dot(tangent2));

    const Eigen::Vector3d nodeForce =
      0.25 * magnitude * (dir1 * tangent1 - dir2 * tangent2);

    friction.row(p).segment<3>(0) = nodeForce.transpose();
    friction.row(p).segment<3>(3) = nodeForce.transpose();
    friction.row(p).segment<3>(6) = -nodeForce.transpose();
    friction.row(p).segment<3>(9) = -nodeForce.transpose();
  }

  return friction;
}

ContactEnergyModel::LayerGradients ContactEnergyModel::evaluateGradients(
  const ContactBatch& batch) const
{
  const auto numPairs = static_cast<Eigen::Index>(batch.size());

  LayerGradients gradients;
  gradients.first = provider_->firstLayerGradients(batch.coordinates);
  checkShapes(gradients.first, static_cast<size_t>(kNumInvariants), numPairs,
              kPairDof, "first-layer gradients");

  gradients.second = provider_->secondLayerGradients(batch.derived);
  checkShape(gradients.second, numPairs, kNumDerivedParameters,
             "second-layer gradients");

  return gradients;
}

PairMatrix ContactEnergyModel::conservativeForces(
  const LayerGradients& gradients) const
{
  PairMatrix forces =
    gradients.second.leftCols(kNumLinearParameters) * linearJacobian_;

  for (Eigen::Index k = 0; k < kNumInvariants; ++k)
  {
    forces.array() +=
      gradients.first[static_cast<size_t>(k)].array().colwise() *
      gradients.second.col(kNumLinearParameters + k).array();
  }

  return forces;
}

std::vector<PairHessian> ContactEnergyModel::conservativeHessians(
  const ContactBatch& batch,
  const LayerGradients& gradients) const
{
  const auto numPairs = static_cast<Eigen::Index>(batch.size());

  const auto secondHessians = provider_->secondLayerHessians(batch.derived);
  checkShapes(secondHessians, batch.size(), kNumDerivedParameters,
              kNumDerivedParameters, "second-layer Hessians");

  const auto variableHessians =
    provider_->firstLayerVariableHessians(batch.coordinates);
  checkShapes(variableHessians, batch.size(), kPairDof, kPairDof,
              "variable first-layer Hessians");

  std::vector<PairHessian> hessians;
  hessians.reserve(batch.size());

  Eigen::Matrix<double, kNumDerivedParameters, kPairDof> jacobian;
  jacobian.topRows<kNumLinearParameters>() = linearJacobian_;

  for (Eigen::Index p = 0; p < numPairs; ++p)
  {
    const auto idx = static_cast<size_t>(p);
    for (Eigen::Index k = 0; k < kNumInvariants; ++k)
    {
      jacobian.row(kNumLinearParameters + k) =
        gradients.first[static_cast<size_t>(k)].row(p);
    }

    PairHessian h = jacobian.transpose() * secondHessians[idx] * jacobian;
    for (size_t k = 0; k < kNumConstantHessians; ++k)
    {
      h += gradients.second(p, kNumLinearParameters +
                                 static_cast<Eigen::Index>(k)) *
           constantHessians_[k];
    }
    h += gradients.second(p, kNumDerivedParameters - 1) * variableHessians[idx];

    hessians.push_back(h);
  }

  return hessians;
}

size_t ContactEnergyModel::addFrictionJacobians(
  const ContactBatch& batch,
  const PairMatrix& conservative,
  std::vector<PairHessian>& hessians) const
{
  const auto numPairs = static_cast<Eigen::Index>(batch.size());

  Eigen::MatrixXd inputs(numPairs, kFrictionInputSize);
  inputs << batch.coordinates, batch.velocities, conservative,
    Eigen::VectorXd::Constant(numPairs, frictionCoefficient_);

  const auto jacobians = provider_->frictionJacobians(inputs);
  checkShapes(jacobians, batch.size(), kFrictionJacobianRows,
              kFrictionJacobianCols, "friction jacobians");

  size_t fallbacks = 0;
  for (size_t p = 0; p < batch.size(); ++p)
  {
    const auto& a = jacobians[p];
    const PairHessian& conservativeHessian = hessians[p];

    // The friction force depends on x directly and through dE/dx
    const Eigen::Matrix<double, 3, kPairDof> edge1 =
      a.block(0, 0, 3, kPairDof) +
      a.block(0, kPairDof, 3, kPairDof) * conservativeHessian;
    const Eigen::Matrix<double, 3, kPairDof> edge2 =
      a.block(3, 0, 3, kPairDof) +
      a.block(3, kPairDof, 3, kPairDof) * conservativeHessian;

    PairHessian friction;
    friction.middleRows<3>(0) = edge1;
    friction.middleRows<3>(3) = edge1;
    friction.middleRows<3>(6) = edge2;
    friction.middleRows<3>(9) = edge2;

    const PairHessian total = conservativeHessian + friction;
    if (total.allFinite())
    {
      hessians[p] = total;
    }
    else
    {
      ++fallbacks;
    }
  }

  return fallbacks;
}

void ContactEnergyModel::checkFinite(const PairMatrix& forces)
{
  if (!forces.allFinite())
  {
    throw NumericalFailure("ContactEnergyModel: non-finite contact force");
  }
}

}  // namespace ric_sim
