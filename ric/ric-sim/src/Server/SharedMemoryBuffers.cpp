// Ticket: 0005_contact_server_buffers

#include "ric-sim/src/Server/SharedMemoryBuffers.hpp"

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <system_error>
#include <utility>

namespace ric_sim
{

namespace
{

[[noreturn]] void throwErrno(const std::string& what)
{
  throw std::system_error(errno, std::generic_category(), what);
}

// Closes the descriptor once the mapping has been established
class FileDescriptor
{
public:
  explicit FileDescriptor(int fd) : fd_{fd}
  {
  }

  ~FileDescriptor()
  {
    if (fd_ >= 0)
    {
      ::close(fd_);
    }
  }

  FileDescriptor(const FileDescriptor&) = delete;
  FileDescriptor& operator=(const FileDescriptor&) = delete;
  FileDescriptor(FileDescriptor&&) = delete;
  FileDescriptor& operator=(FileDescriptor&&) = delete;

  [[nodiscard]] int get() const
  {
    return fd_;
  }

private:
  int fd_;
};

}  // namespace

// ========== SharedMemorySegment ==========

SharedMemorySegment::SharedMemorySegment(std::string name,
                                         size_t bytes,
                                         bool unlinkOnDestroy)
  : name_{std::move(name)}, bytes_{bytes}, unlinkOnDestroy_{unlinkOnDestroy}
{
  const std::string path = "/" + name_;

  FileDescriptor fd{::shm_open(path.c_str(), O_CREAT | O_RDWR, 0600)};
  if (fd.get() < 0)
  {
    throwErrno("SharedMemorySegment: shm_open " + path);
  }

  struct stat info{};
  if (::fstat(fd.get(), &info) != 0)
  {
    throwErrno("SharedMemorySegment: fstat " + path);
  }
  if (static_cast<size_t>(info.st_size) < bytes_ &&
      ::ftruncate(fd.get(), static_cast<off_t>(bytes_)) != 0)
  {
    throwErrno("SharedMemorySegment: ftruncate " + path);
  }

  address_ = ::mmap(
    nullptr, bytes_, PROT_READ | PROT_WRITE, MAP_SHARED, fd.get(), 0);
  if (address_ == MAP_FAILED)
  {
    address_ = nullptr;
    throwErrno("SharedMemorySegment: mmap " + path);
  }
}

SharedMemorySegment::~SharedMemorySegment()
{
  release();
}

SharedMemorySegment::SharedMemorySegment(SharedMemorySegment&& other) noexcept
  : name_{std::move(other.name_)},
    bytes_{std::exchange(other.bytes_, 0)},
    address_{std::exchange(other.address_, nullptr)},
    unlinkOnDestroy_{std::exchange(other.unlinkOnDestroy_, false)}
{
}

SharedMemorySegment& SharedMemorySegment::operator=(
  SharedMemorySegment&& other) noexcept
{
  if (this != &other)
  {
    release();
    name_ = std::move(other.name_);
    bytes_ = std::exchange(other.bytes_, 0);
    address_ = std::exchange(other.address_, nullptr);
    unlinkOnDestroy_ = std::exchange(other.unlinkOnDestroy_, false);
  }
  return *this;
}

void SharedMemorySegment::release() noexcept
{
  if (address_ != nullptr)
  {
    ::munmap(address_, bytes_);
    address_ = nullptr;
  }
  if (unlinkOnDestroy_)
  {
    ::shm_unlink(("/" + name_).c_str());
    unlinkOnDestroy_ = false;
  }
}

// ========== SharedMemoryBuffers ==========

SharedMemoryBuffers::SharedMemoryBuffers(const std::string& session,
                                         size_t numNodes,
                                         bool unlinkOnDestroy)
  : positions_{positionsName(session),
               3 * numNodes * sizeof(double),
               unlinkOnDestroy},
    velocities_{velocitiesName(session),
                3 * numNodes * sizeof(double),
                unlinkOnDestroy},
    forces_{forcesName(session), 3 * numNodes * sizeof(double), unlinkOnDestroy},
    hessian_{hessianName(session),
             9 * numNodes * numNodes * sizeof(double),
             unlinkOnDestroy},
    control_{controlName(session),
             static_cast<size_t>(kControlSize) * sizeof(double),
             unlinkOnDestroy},
    view_{std::make_unique<ContactBuffers>(positions_.data(),
                                           velocities_.data(),
                                           forces_.data(),
                                           hessian_.data(),
                                           control_.data(),
                                           numNodes)}
{
}

std::string SharedMemoryBuffers::positionsName(const std::string& session)
{
  return "node_coordinates" + session;
}

std::string SharedMemoryBuffers::velocitiesName(const std::string& session)
{
  return "velocities" + session;
}

std::string SharedMemoryBuffers::forcesName(const std::string& session)
{
  return "contact_forces" + session;
}

std::string SharedMemoryBuffers::hessianName(const std::string& session)
{
  return "contact_hessian" + session;
}

std::string SharedMemoryBuffers::controlName(const std::string& session)
{
  return "meta_data" + session;
}

}  // namespace ric_sim
