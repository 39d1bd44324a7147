// Ticket: 0007_step_synchronizer

#ifndef RIC_SIM_SERVER_REQUEST_CHANNEL_HPP
#define RIC_SIM_SERVER_REQUEST_CHANNEL_HPP

namespace ric_sim
{

/**
 * @brief Strict request/reply rendezvous with the simulation client
 *
 * Messages carry no payload; all data travels through the shared buffers.
 * Each waitForRequest() must be followed by exactly one sendReply().
 *
 * @ticket 0007_step_synchronizer
 */
class RequestChannel
{
public:
  virtual ~RequestChannel() = default;

  /**
   * @brief Block until the client signals that the buffers are ready
   */
  virtual void waitForRequest() = 0;

  /**
   * @brief Signal the client that outputs are written
   */
  virtual void sendReply() = 0;

protected:
  RequestChannel() = default;
  RequestChannel(const RequestChannel&) = default;
  RequestChannel& operator=(const RequestChannel&) = default;
  RequestChannel(RequestChannel&&) noexcept = default;
  RequestChannel& operator=(RequestChannel&&) noexcept = default;
};

}  // namespace ric_sim

#endif  // RIC_SIM_SERVER_REQUEST_CHANNEL_HPP
