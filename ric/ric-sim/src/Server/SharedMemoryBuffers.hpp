// Ticket: 0005_contact_server_buffers

#ifndef RIC_SIM_SERVER_SHARED_MEMORY_BUFFERS_HPP
#define RIC_SIM_SERVER_SHARED_MEMORY_BUFFERS_HPP

#include <cstddef>
#include <memory>
#include <string>

#include "ric-sim/src/Server/ContactBuffers.hpp"

namespace ric_sim
{

/**
 * @brief One named POSIX shared memory segment mapped read-write
 *
 * Opens the segment, creating it if absent, and grows it to the requested
 * size when it is smaller. The mapping is released on destruction; the name
 * is unlinked only when requested.
 *
 * Error handling: POSIX failures throw std::system_error carrying errno.
 *
 * @ticket 0005_contact_server_buffers
 */
class SharedMemorySegment
{
public:
  /**
   * @param name Segment name without the leading '/'
   * @param bytes Mapped size
   * @param unlinkOnDestroy Remove the name when this object is destroyed
   */
  SharedMemorySegment(std::string name, size_t bytes, bool unlinkOnDestroy);

  ~SharedMemorySegment();

  SharedMemorySegment(const SharedMemorySegment&) = delete;
  SharedMemorySegment& operator=(const SharedMemorySegment&) = delete;
  SharedMemorySegment(SharedMemorySegment&& other) noexcept;
  SharedMemorySegment& operator=(SharedMemorySegment&& other) noexcept;

  [[nodiscard]] double* data() const
  {
    return static_cast<double*>(address_);
  }

  [[nodiscard]] size_t size() const
  {
    return bytes_;
  }

  [[nodiscard]] const std::string& getName() const
  {
    return name_;
  }

private:
  void release() noexcept;

  std::string name_;
  size_t bytes_{0};
  void* address_{nullptr};
  bool unlinkOnDestroy_{false};
};

/**
 * @brief The five contact buffers backed by named shared memory
 *
 * Segment names carry the session identifier as a suffix:
 * node_coordinates<id>, velocities<id>, contact_forces<id>,
 * contact_hessian<id>, meta_data<id>.
 *
 * @ticket 0005_contact_server_buffers
 */
class SharedMemoryBuffers
{
public:
  /**
   * @param session Session identifier appended to every segment name
   * @param numNodes Node count N
   * @param unlinkOnDestroy Remove segment names on destruction
   * @throws std::system_error if a segment cannot be opened or mapped
   */
  SharedMemoryBuffers(const std::string& session,
                      size_t numNodes,
                      bool unlinkOnDestroy = false);

  SharedMemoryBuffers(const SharedMemoryBuffers&) = delete;
  SharedMemoryBuffers& operator=(const SharedMemoryBuffers&) = delete;
  SharedMemoryBuffers(SharedMemoryBuffers&&) = delete;
  SharedMemoryBuffers& operator=(SharedMemoryBuffers&&) = delete;
  ~SharedMemoryBuffers() = default;

  [[nodiscard]] ContactBuffers& view()
  {
    return *view_;
  }

  [[nodiscard]] static std::string positionsName(const std::string& session);
  [[nodiscard]] static std::string velocitiesName(const std::string& session);
  [[nodiscard]] static std::string forcesName(const std::string& session);
  [[nodiscard]] static std::string hessianName(const std::string& session);
  [[nodiscard]] static std::string controlName(const std::string& session);

private:
  SharedMemorySegment positions_;
  SharedMemorySegment velocities_;
  SharedMemorySegment forces_;
  SharedMemorySegment hessian_;
  SharedMemorySegment control_;
  std::unique_ptr<ContactBuffers> view_;
};

}  // namespace ric_sim

#endif  // RIC_SIM_SERVER_SHARED_MEMORY_BUFFERS_HPP
