// Ticket: 0003_contact_energy_model

#include "ric-sim/src/Energy/SmoothedContactEnergy.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace ric_sim
{

namespace
{

using Selector = Eigen::Matrix<double, 3, kPairDof>;
using InvariantVector = SmoothedContactEnergy::InvariantVector;
using InvariantMatrix = SmoothedContactEnergy::InvariantMatrix;
using InvariantDerivatives = SmoothedContactEnergy::InvariantDerivatives;

// Positions within [D1, D2, R, S1, S2, den]
constexpr Eigen::Index kD1{0};
constexpr Eigen::Index kD2{1};
constexpr Eigen::Index kR{2};
constexpr Eigen::Index kS1{3};
constexpr Eigen::Index kS2{4};
constexpr Eigen::Index kDen{5};

// d1 = x1e - x1s
Selector selectD1()
{
  Selector s = Selector::Zero();
  s.block<3, 3>(0, 0) = -Eigen::Matrix3d::Identity();
  s.block<3, 3>(0, 3) = Eigen::Matrix3d::Identity();
  return s;
}

// d2 = x2e - x2s
Selector selectD2()
{
  Selector s = Selector::Zero();
  s.block<3, 3>(0, 6) = -Eigen::Matrix3d::Identity();
  s.block<3, 3>(0, 9) = Eigen::Matrix3d::Identity();
  return s;
}

// d12 = x2s - x1s
Selector selectD12()
{
  Selector s = Selector::Zero();
  s.block<3, 3>(0, 0) = -Eigen::Matrix3d::Identity();
  s.block<3, 3>(0, 6) = Eigen::Matrix3d::Identity();
  return s;
}

// Hessian of (A x) . (B x)
PairHessian bilinearHessian(const Selector& a, const Selector& b)
{
  return a.transpose() * b + b.transpose() * a;
}

double softplus(double s)
{
  return s > 0.0 ? s + std::log1p(std::exp(-s)) : std::log1p(std::exp(s));
}

double sigmoid(double s)
{
  if (s >= 0.0)
  {
    return 1.0 / (1.0 + std::exp(-s));
  }
  const double e = std::exp(s);
  return e / (1.0 + e);
}

double sign(double value)
{
  return static_cast<double>((0.0 < value) - (value < 0.0));
}

InvariantVector unit(Eigen::Index i)
{
  return InvariantVector::Unit(i);
}

// q = N / M where M is the invariant at denominatorIndex
InvariantDerivatives quotient(double numerator,
                              const InvariantVector& numeratorGradient,
                              const InvariantMatrix& numeratorHessian,
                              Eigen::Index denominatorIndex,
                              double denominator)
{
  const InvariantVector e = unit(denominatorIndex);

  InvariantDerivatives q;
  q.value = numerator / denominator;
  q.gradient = (numeratorGradient - q.value * e) / denominator;
  q.hessian = (numeratorHessian - q.gradient * e.transpose() -
               e * q.gradient.transpose()) /
              denominator;
  return q;
}

}  // namespace

SmoothedContactEnergy::SmoothedContactEnergy(double sharpness,
                                             double contactLength)
  : sharpness_{sharpness}, contactLength_{contactLength}
{
  if (!std::isfinite(sharpness_) || sharpness_ <= 0.0)
  {
    throw std::invalid_argument(
      "SmoothedContactEnergy: sharpness must be positive and finite (got " +
      std::to_string(sharpness_) + ")");
  }
  if (!std::isfinite(contactLength_) || contactLength_ <= 0.0)
  {
    throw std::invalid_argument(
      "SmoothedContactEnergy: contact length must be positive and finite "
      "(got " +
      std::to_string(contactLength_) + ")");
  }
}

std::string SmoothedContactEnergy::getName() const
{
  return "SmoothedContactEnergy(K=" + std::to_string(sharpness_) +
         ", h=" + std::to_string(contactLength_) + ")";
}

// ========== Layer 1 ==========

Eigen::MatrixXd SmoothedContactEnergy::linearJacobian() const
{
  Eigen::MatrixXd dd(kNumLinearParameters, kPairDof);
  dd << selectD1(), selectD2(), selectD12();
  return dd;
}

std::vector<Eigen::MatrixXd> SmoothedContactEnergy::firstLayerGradients(
  const PairMatrix& coordinates) const
{
  const Selector l1 = selectD1();
  const Selector l2 = selectD2();
  const Selector l12 = selectD12();

  // P x 3 each
  const Eigen::MatrixXd d1 = coordinates * l1.transpose();
  const Eigen::MatrixXd d2 = coordinates * l2.transpose();
  const Eigen::MatrixXd d12 = coordinates * l12.transpose();

  const Eigen::ArrayXd D1 = d1.rowwise().squaredNorm().array();
  const Eigen::ArrayXd D2 = d2.rowwise().squaredNorm().array();
  const Eigen::ArrayXd R = (d1.array() * d2.array()).rowwise().sum();

  // grad (A x).(B x) = (B x)^T A + (A x)^T B, row by row
  std::vector<Eigen::MatrixXd> gradients(kNumInvariants);
  gradients[kD1] = 2.0 * d1 * l1;
  gradients[kD2] = 2.0 * d2 * l2;
  gradients[kR] = d2 * l1 + d1 * l2;
  gradients[kS1] = d12 * l1 + d1 * l12;
  gradients[kS2] = d12 * l2 + d2 * l12;

  gradients[kDen] =
    (gradients[kD1].array().colwise() * D2 +
     gradients[kD2].array().colwise() * D1 -
     2.0 * (gradients[kR].array().colwise() * R))
      .matrix();

  return gradients;
}

std::vector<Eigen::MatrixXd> SmoothedContactEnergy::firstLayerConstantHessians()
  const
{
  const Selector l1 = selectD1();
  const Selector l2 = selectD2();
  const Selector l12 = selectD12();

  return {bilinearHessian(l1, l1),
          bilinearHessian(l2, l2),
          bilinearHessian(l1, l2),
          bilinearHessian(l1, l12),
          bilinearHessian(l2, l12)};
}

std::vector<Eigen::MatrixXd> SmoothedContactEnergy::firstLayerVariableHessians(
  const PairMatrix& coordinates) const
{
  const auto gradients = firstLayerGradients(coordinates);
  const auto constant = firstLayerConstantHessians();

  std::vector<Eigen::MatrixXd> hessians;
  hessians.reserve(static_cast<size_t>(coordinates.rows()));

  for (Eigen::Index p = 0; p < coordinates.rows(); ++p)
  {
    const PairVector row = coordinates.row(p);
    const Eigen::Vector3d d1 = selectD1() * row.transpose();
    const Eigen::Vector3d d2 = selectD2() * row.transpose();
    const double D1 = d1.squaredNorm();
    const double D2 = d2.squaredNorm();
    const double R = d1.dot(d2);

    const PairVector gD1 = gradients[kD1].row(p);
    const PairVector gD2 = gradients[kD2].row(p);
    const PairVector gR = gradients[kR].row(p);

    // den = D1*D2 - R^2
    PairHessian h = D2 * constant[kD1] + D1 * constant[kD2] +
                    gD1.transpose() * gD2 + gD2.transpose() * gD1 -
                    2.0 * (gR.transpose() * gR + R * constant[kR]);
    hessians.emplace_back(h);
  }

  return hessians;
}

// ========== Layer 2 ==========

SmoothedContactEnergy::InvariantDerivatives SmoothedContactEnergy::parameterT(
  const InvariantVector& b,
  const ClosestPointBranch& branch)
{
  switch (branch.tMode)
  {
    case ParameterMode::Clamped:
    {
      InvariantDerivatives t;
      t.value = branch.t;
      return t;
    }
    case ParameterMode::Interior:
    {
      // t = (S1*D2 - S2*R) / den
      InvariantVector gradN = InvariantVector::Zero();
      gradN[kD2] = b[kS1];
      gradN[kR] = -b[kS2];
      gradN[kS1] = b[kD2];
      gradN[kS2] = -b[kR];

      InvariantMatrix hessN = InvariantMatrix::Zero();
      hessN(kD2, kS1) = hessN(kS1, kD2) = 1.0;
      hessN(kR, kS2) = hessN(kS2, kR) = -1.0;

      return quotient(b[kS1] * b[kD2] - b[kS2] * b[kR], gradN, hessN, kDen,
                      b[kDen]);
    }
    case ParameterMode::Projected:
    {
      if (branch.uMode != ParameterMode::Clamped)
      {
        throw std::logic_error(
          "SmoothedContactEnergy: t projected from an unclamped u");
      }
      // t = (u*R + S1) / D1 with u constant
      InvariantVector gradN = InvariantVector::Zero();
      gradN[kR] = branch.u;
      gradN[kS1] = 1.0;
      return quotient(branch.u * b[kR] + b[kS1], gradN,
                      InvariantMatrix::Zero(), kD1, b[kD1]);
    }
  }
  throw std::logic_error("SmoothedContactEnergy: unknown t branch");
}

SmoothedContactEnergy::InvariantDerivatives SmoothedContactEnergy::parameterU(
  const InvariantVector& b,
  const ClosestPointBranch& branch,
  const InvariantDerivatives& t)
{
  switch (branch.uMode)
  {
    case ParameterMode::Clamped:
    {
      InvariantDerivatives u;
      u.value = branch.u;
      return u;
    }
    case ParameterMode::Projected:
    {
      // u = (t*R - S2) / D2
      const InvariantVector eR = unit(kR);
      const InvariantVector gradN =
        b[kR] * t.gradient + t.value * eR - unit(kS2);
      const InvariantMatrix hessN = b[kR] * t.hessian +
                                    t.gradient * eR.transpose() +
                                    eR * t.gradient.transpose();
      return quotient(t.value * b[kR] - b[kS2], gradN, hessN, kD2, b[kD2]);
    }
    case ParameterMode::Interior:
      break;
  }
  throw std::logic_error("SmoothedContactEnergy: u has no interior branch");
}

SmoothedContactEnergy::DistanceDerivatives
SmoothedContactEnergy::distanceDerivatives(const DerivedVector& parameters,
                                           const ClosestPointBranch& branch)
{
  const Eigen::Vector3d d1 = parameters.segment<3>(0);
  const Eigen::Vector3d d2 = parameters.segment<3>(3);
  const Eigen::Vector3d d12 = parameters.segment<3>(6);
  const InvariantVector b = parameters.tail<kNumInvariants>();

  const auto t = parameterT(b, branch);
  const auto u = parameterU(b, branch, t);

  // w = t*d1 - u*d2 - d12, dist = |w|
  const Eigen::Vector3d w = t.value * d1 - u.value * d2 - d12;

  DistanceDerivatives dist;
  dist.value = w.norm();
  const Eigen::Vector3d n = w / dist.value;

  Eigen::Matrix<double, 3, kNumDerivedParameters> jw;
  jw.block<3, 3>(0, 0) = t.value * Eigen::Matrix3d::Identity();
  jw.block<3, 3>(0, 3) = -u.value * Eigen::Matrix3d::Identity();
  jw.block<3, 3>(0, 6) = -Eigen::Matrix3d::Identity();
  jw.block<3, kNumInvariants>(0, 9) =
    d1 * t.gradient.transpose() - d2 * u.gradient.transpose();

  dist.gradient = jw.transpose() * n;

  const Eigen::Matrix3d projector =
    Eigen::Matrix3d::Identity() - n * n.transpose();
  dist.hessian = jw.transpose() * projector * jw / dist.value;

  // n . (second derivatives of w)
  const Eigen::Matrix<double, 3, kNumInvariants> nt = n * t.gradient.transpose();
  const Eigen::Matrix<double, 3, kNumInvariants> nu = n * u.gradient.transpose();
  dist.hessian.block<3, kNumInvariants>(0, 9) += nt;
  dist.hessian.block<kNumInvariants, 3>(9, 0) += nt.transpose();
  dist.hessian.block<3, kNumInvariants>(3, 9) -= nu;
  dist.hessian.block<kNumInvariants, 3>(9, 3) -= nu.transpose();
  dist.hessian.block<kNumInvariants, kNumInvariants>(9, 9) +=
    n.dot(d1) * t.hessian - n.dot(d2) * u.hessian;

  return dist;
}

double SmoothedContactEnergy::energy(double distance) const
{
  const double l = softplus(sharpness_ * (contactLength_ - distance));
  const double scaled = l / sharpness_;
  return scaled * scaled;
}

Eigen::Vector2d SmoothedContactEnergy::energyDistanceDerivatives(
  double distance) const
{
  const double s = sharpness_ * (contactLength_ - distance);
  const double l = softplus(s);
  const double sig = sigmoid(s);

  return Eigen::Vector2d{-2.0 * l * sig / sharpness_,
                         2.0 * sig * (sig + l * (1.0 - sig))};
}

Eigen::MatrixXd SmoothedContactEnergy::secondLayerGradients(
  const DerivedParameters& derived) const
{
  if (derived.branches.size() != static_cast<size_t>(derived.size()))
  {
    throw std::invalid_argument(
      "SmoothedContactEnergy: branch count does not match parameter rows");
  }

  Eigen::MatrixXd gradients(derived.size(), kNumDerivedParameters);
  for (Eigen::Index p = 0; p < derived.size(); ++p)
  {
    const auto dist = distanceDerivatives(
      derived.values.row(p).transpose(),
      derived.branches[static_cast<size_t>(p)]);
    const double dEdDist = energyDistanceDerivatives(dist.value)[0];
    gradients.row(p) = dEdDist * dist.gradient.transpose();
  }
  return gradients;
}

std::vector<Eigen::MatrixXd> SmoothedContactEnergy::secondLayerHessians(
  const DerivedParameters& derived) const
{
  if (derived.branches.size() != static_cast<size_t>(derived.size()))
  {
    throw std::invalid_argument(
      "SmoothedContactEnergy: branch count does not match parameter rows");
  }

  std::vector<Eigen::MatrixXd> hessians;
  hessians.reserve(static_cast<size_t>(derived.size()));
  for (Eigen::Index p = 0; p < derived.size(); ++p)
  {
    const auto dist = distanceDerivatives(
      derived.values.row(p).transpose(),
      derived.branches[static_cast<size_t>(p)]);
    const Eigen::Vector2d g = energyDistanceDerivatives(dist.value);

    DerivedHessian h =
      g[1] * dist.gradient * dist.gradient.transpose() + g[0] * dist.hessian;
    hessians.emplace_back(h);
  }
  return hessians;
}

// ========== Friction ==========

std::vector<Eigen::MatrixXd> SmoothedContactEnergy::frictionJacobians(
  const Eigen::MatrixXd& inputs) const
{
  if (inputs.cols() != kFrictionInputSize)
  {
    throw std::invalid_argument(
      "SmoothedContactEnergy: friction input must have " +
      std::to_string(kFrictionInputSize) + " columns (got " +
      std::to_string(inputs.cols()) + ")");
  }

  std::vector<Eigen::MatrixXd> jacobians;
  jacobians.reserve(static_cast<size_t>(inputs.rows()));

  for (Eigen::Index p = 0; p < inputs.rows(); ++p)
  {
    const auto row = inputs.row(p);
    const Eigen::Vector3d x1s = row.segment<3>(0).transpose();
    const Eigen::Vector3d x1e = row.segment<3>(3).transpose();
    const Eigen::Vector3d x2s = row.segment<3>(6).transpose();
    const Eigen::Vector3d x2e = row.segment<3>(9).transpose();
    const Eigen::Vector3d v1s = row.segment<3>(12).transpose();
    const Eigen::Vector3d v1e = row.segment<3>(15).transpose();
    const Eigen::Vector3d v2s = row.segment<3>(18).transpose();
    const Eigen::Vector3d v2e = row.segment<3>(21).transpose();
    const Eigen::Vector3d f1s = row.segment<3>(24).transpose();
    const Eigen::Vector3d f1e = row.segment<3>(27).transpose();
    const double mu = row(36);

    // Friction on edge 1 acts along edge 2 and vice versa
    const Eigen::Vector3d e1 = x1e - x1s;
    const Eigen::Vector3d e2 = x2e - x2s;
    const double l1 = e1.norm();
    const double l2 = e2.norm();
    const Eigen::Vector3d tangent1 = e2 / l2;
    const Eigen::Vector3d tangent2 = e1 / l1;

    const Eigen::Vector3d normalForce = f1s + f1e;
    const double fn = normalForce.norm();
    const Eigen::Vector3d normalDirection = normalForce / fn;

    const Eigen::Vector3d relativeVelocity =
      0.5 * (v1s + v1e) - 0.5 * (v2s + v2e);
    const double dir1 = sign(relativeVelocity.dot(tangent1));
    const double dir2 = sign(-relativeVelocity.dot(tangent2));

    const Eigen::Matrix3d dTangent1 =
      (Eigen::Matrix3d::Identity() - tangent1 * tangent1.transpose()) / l2;
    const Eigen::Matrix3d dTangent2 =
      (Eigen::Matrix3d::Identity() - tangent2 * tangent2.transpose()) / l1;

    // Node force on edge 1 is 0.25 * (ffr1 - ffr2), ffr_k = dir_k*mu*fn*T_k
    const double scale1 = 0.25 * dir1 * mu * fn;
    const double scale2 = 0.25 * dir2 * mu * fn;

    Eigen::MatrixXd jac = Eigen::MatrixXd::Zero(6, 2 * kPairDof);
    jac.block<3, 3>(0, 0) = scale2 * dTangent2;
    jac.block<3, 3>(0, 3) = -scale2 * dTangent2;
    jac.block<3, 3>(0, 6) = -scale1 * dTangent1;
    jac.block<3, 3>(0, 9) = scale1 * dTangent1;

    const Eigen::Matrix3d dForce =
      0.25 * mu * (dir1 * tangent1 - dir2 * tangent2) *
      normalDirection.transpose();
    jac.block<3, 3>(0, kPairDof) = dForce;
    jac.block<3, 3>(0, kPairDof + 3) = dForce;

    jac.bottomRows<3>() = -jac.topRows<3>();
    jacobians.emplace_back(std::move(jac));
  }

  return jacobians;
}

std::shared_ptr<const EnergyModelProvider> makeEnergyModel(double selectorKey,
                                                           double contactLength)
{
  if (!std::isfinite(selectorKey) || selectorKey <= 0.0)
  {
    throw std::invalid_argument(
      "makeEnergyModel: energy-model key must be positive and finite (got " +
      std::to_string(selectorKey) + ")");
  }
  return std::make_shared<const SmoothedContactEnergy>(selectorKey,
                                                       contactLength);
}

}  // namespace ric_sim
