// Ticket: 0005_contact_server_buffers

#ifndef RIC_SIM_SERVER_CONTACT_BUFFERS_HPP
#define RIC_SIM_SERVER_CONTACT_BUFFERS_HPP

#include <Eigen/Dense>
#include <cstddef>
#include <vector>

namespace ric_sim
{

/**
 * @brief Slots of the six-entry control array
 *
 * Written by the client: FirstIteration, Friction, SimulationTime,
 * IterationCount, HessianRequested. Written by the server: MinDistance.
 */
namespace ControlIndex
{
constexpr Eigen::Index FirstIteration{0};
constexpr Eigen::Index Friction{1};
constexpr Eigen::Index SimulationTime{2};
constexpr Eigen::Index IterationCount{3};
constexpr Eigen::Index MinDistance{4};
constexpr Eigen::Index HessianRequested{5};
}  // namespace ControlIndex

constexpr Eigen::Index kControlSize{6};

using NodalMap = Eigen::Map<Eigen::VectorXd>;
using HessianMap =
  Eigen::Map<Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>>;
using ControlMap = Eigen::Map<Eigen::Matrix<double, kControlSize, 1>>;

/**
 * @brief Non-owning views of the buffers shared with the client
 *
 * positions, velocities and forces are flat 3N arrays; the Hessian is a
 * row-major 3N x 3N matrix. Storage is owned elsewhere (shared memory
 * segments or LocalBuffers) and must outlive the view.
 *
 * Thread safety: Not thread-safe; the request/reply protocol serializes
 * access with the client.
 *
 * @ticket 0005_contact_server_buffers
 */
class ContactBuffers
{
public:
  /**
   * @param numNodes Node count N
   */
  ContactBuffers(double* positions,
                 double* velocities,
                 double* forces,
                 double* hessian,
                 double* control,
                 size_t numNodes);

  ContactBuffers(const ContactBuffers&) = delete;
  ContactBuffers& operator=(const ContactBuffers&) = delete;
  ContactBuffers(ContactBuffers&&) = delete;
  ContactBuffers& operator=(ContactBuffers&&) = delete;
  ~ContactBuffers() = default;

  [[nodiscard]] size_t getNumNodes() const
  {
    return numNodes_;
  }

  [[nodiscard]] bool isFirstIteration() const;
  [[nodiscard]] bool isFrictionEnabled() const;
  [[nodiscard]] bool isHessianRequested() const;
  [[nodiscard]] double getSimulationTime() const;
  [[nodiscard]] int getIterationCount() const;

  void setMinDistance(double distance);

  NodalMap positions;
  NodalMap velocities;
  NodalMap forces;
  HessianMap hessian;
  ControlMap control;

private:
  size_t numNodes_;
};

/**
 * @brief Heap-backed buffers exposing the same view as shared memory
 */
class LocalBuffers
{
public:
  explicit LocalBuffers(size_t numNodes);

  LocalBuffers(const LocalBuffers&) = delete;
  LocalBuffers& operator=(const LocalBuffers&) = delete;
  LocalBuffers(LocalBuffers&&) = delete;
  LocalBuffers& operator=(LocalBuffers&&) = delete;
  ~LocalBuffers() = default;

  [[nodiscard]] ContactBuffers& view()
  {
    return view_;
  }

  [[nodiscard]] const ContactBuffers& view() const
  {
    return view_;
  }

private:
  std::vector<double> positions_;
  std::vector<double> velocities_;
  std::vector<double> forces_;
  std::vector<double> hessian_;
  std::vector<double> control_;
  ContactBuffers view_;
};

}  // namespace ric_sim

#endif  // RIC_SIM_SERVER_CONTACT_BUFFERS_HPP
