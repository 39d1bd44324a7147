// Ticket: 0007_step_synchronizer

#ifndef RIC_SIM_SERVER_ZMQ_REPLY_CHANNEL_HPP
#define RIC_SIM_SERVER_ZMQ_REPLY_CHANNEL_HPP

#include <chrono>
#include <optional>
#include <string>
#include <zmq.hpp>

#include "ric-sim/src/Server/RequestChannel.hpp"

namespace ric_sim
{

/**
 * @brief ZeroMQ REP socket bound to tcp://*:<port>
 *
 * Receives empty requests and answers with empty replies. The REP socket
 * itself enforces strict alternation; out-of-order calls surface as
 * zmq::error_t.
 *
 * Error handling: a configured receive timeout that expires throws
 * std::runtime_error.
 *
 * @ticket 0007_step_synchronizer
 */
class ZmqReplyChannel : public RequestChannel
{
public:
  /**
   * @param port TCP port (also the session identifier), or "*" for any
   * @param receiveTimeout Maximum wait for a request, unbounded if absent
   * @throws zmq::error_t if the socket cannot be bound
   */
  explicit ZmqReplyChannel(
    const std::string& port,
    std::optional<std::chrono::milliseconds> receiveTimeout = std::nullopt);

  ~ZmqReplyChannel() override = default;

  ZmqReplyChannel(const ZmqReplyChannel&) = delete;
  ZmqReplyChannel& operator=(const ZmqReplyChannel&) = delete;
  ZmqReplyChannel(ZmqReplyChannel&&) = delete;
  ZmqReplyChannel& operator=(ZmqReplyChannel&&) = delete;

  void waitForRequest() override;
  void sendReply() override;

  /**
   * @brief Bound endpoint with the resolved port
   */
  [[nodiscard]] const std::string& getEndpoint() const
  {
    return endpoint_;
  }

private:
  zmq::context_t context_;
  zmq::socket_t socket_;
  std::string endpoint_;
};

}  // namespace ric_sim

#endif  // RIC_SIM_SERVER_ZMQ_REPLY_CHANNEL_HPP
