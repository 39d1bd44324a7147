// Ticket: 0007_step_synchronizer

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <zmq.hpp>

#include "ric-sim/src/Server/ZmqReplyChannel.hpp"

using namespace ric_sim;

namespace
{

// tcp://0.0.0.0:<port> -> tcp://127.0.0.1:<port>
std::string loopback(const std::string& endpoint)
{
  return "tcp://127.0.0.1" + endpoint.substr(endpoint.rfind(':'));
}

}  // namespace

TEST(ZmqReplyChannel, WildcardPort_ResolvesEndpoint)
{
  ZmqReplyChannel channel{"*"};
  EXPECT_EQ(channel.getEndpoint().rfind("tcp://", 0), 0u);
  EXPECT_EQ(channel.getEndpoint().find('*'), std::string::npos);
}

TEST(ZmqReplyChannel, RequestReply_RoundTrip)
{
  ZmqReplyChannel channel{"*", std::chrono::milliseconds{2000}};

  zmq::context_t context{1};
  zmq::socket_t client{context, zmq::socket_type::req};
  client.set(zmq::sockopt::rcvtimeo, 2000);
  client.connect(loopback(channel.getEndpoint()));

  for (int i = 0; i < 3; ++i)
  {
    ASSERT_TRUE(client.send(zmq::message_t{}, zmq::send_flags::none).has_value());
    channel.waitForRequest();
    channel.sendReply();

    zmq::message_t reply;
    ASSERT_TRUE(client.recv(reply, zmq::recv_flags::none).has_value());
    EXPECT_EQ(reply.size(), 0u);
  }
}

TEST(ZmqReplyChannel, ReceiveTimeout_Throws)
{
  ZmqReplyChannel channel{"*", std::chrono::milliseconds{50}};
  EXPECT_THROW(channel.waitForRequest(), std::runtime_error);
}
