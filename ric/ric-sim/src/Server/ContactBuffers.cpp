// Ticket: 0005_contact_server_buffers

#include "ric-sim/src/Server/ContactBuffers.hpp"

#include <stdexcept>

namespace ric_sim
{

namespace
{

Eigen::Index dof(size_t numNodes)
{
  return static_cast<Eigen::Index>(3 * numNodes);
}

// Flags are written as doubles; the integer part carries the value
bool flag(double value)
{
  return static_cast<int>(value) != 0;
}

}  // namespace

ContactBuffers::ContactBuffers(double* positionsData,
                               double* velocitiesData,
                               double* forcesData,
                               double* hessianData,
                               double* controlData,
                               size_t numNodes)
  : positions{positionsData, dof(numNodes)},
    velocities{velocitiesData, dof(numNodes)},
    forces{forcesData, dof(numNodes)},
    hessian{hessianData, dof(numNodes), dof(numNodes)},
    control{controlData},
    numNodes_{numNodes}
{
  if (positionsData == nullptr || velocitiesData == nullptr ||
      forcesData == nullptr || hessianData == nullptr ||
      controlData == nullptr)
  {
    throw std::invalid_argument("ContactBuffers: null buffer");
  }
}

bool ContactBuffers::isFirstIteration() const
{
  return flag(control[ControlIndex::FirstIteration]);
}

bool ContactBuffers::isFrictionEnabled() const
{
  return flag(control[ControlIndex::Friction]);
}

bool ContactBuffers::isHessianRequested() const
{
  return flag(control[ControlIndex::HessianRequested]);
}

double ContactBuffers::getSimulationTime() const
{
  return control[ControlIndex::SimulationTime];
}

int ContactBuffers::getIterationCount() const
{
  return static_cast<int>(control[ControlIndex::IterationCount]);
}

void ContactBuffers::setMinDistance(double distance)
{
  control[ControlIndex::MinDistance] = distance;
}

LocalBuffers::LocalBuffers(size_t numNodes)
  : positions_(3 * numNodes, 0.0),
    velocities_(3 * numNodes, 0.0),
    forces_(3 * numNodes, 0.0),
    hessian_(9 * numNodes * numNodes, 0.0),
    control_(kControlSize, 0.0),
    view_{positions_.data(),
          velocities_.data(),
          forces_.data(),
          hessian_.data(),
          control_.data(),
          numNodes}
{
}

}  // namespace ric_sim
