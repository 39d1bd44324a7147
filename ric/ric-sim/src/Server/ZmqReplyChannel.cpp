// Ticket: 0007_step_synchronizer

#include "ric-sim/src/Server/ZmqReplyChannel.hpp"

#include <stdexcept>

namespace ric_sim
{

ZmqReplyChannel::ZmqReplyChannel(
  const std::string& port,
  std::optional<std::chrono::milliseconds> receiveTimeout)
  : context_{1},
    socket_{context_, zmq::socket_type::rep},
    endpoint_{"tcp://*:" + port}
{
  if (receiveTimeout)
  {
    socket_.set(zmq::sockopt::rcvtimeo,
                static_cast<int>(receiveTimeout->count()));
  }
  socket_.bind(endpoint_);

  // Resolves a wildcard port to the one actually bound
  endpoint_ = socket_.get(zmq::sockopt::last_endpoint);
}

void ZmqReplyChannel::waitForRequest()
{
  zmq::message_t request;
  const auto received = socket_.recv(request, zmq::recv_flags::none);
  if (!received)
  {
    throw std::runtime_error("ZmqReplyChannel: timed out waiting for request on " +
                             endpoint_);
  }
}

void ZmqReplyChannel::sendReply()
{
  zmq::message_t reply{};
  const auto sent = socket_.send(reply, zmq::send_flags::none);
  if (!sent)
  {
    throw std::runtime_error("ZmqReplyChannel: reply not sent on " + endpoint_);
  }
}

}  // namespace ric_sim
