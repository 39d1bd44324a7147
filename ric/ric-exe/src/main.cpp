// Ticket: 0009_contact_server_executable

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <exception>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "ric-sim/src/Config/ContactConfig.hpp"
#include "ric-sim/src/Contact/CollisionDetector.hpp"
#include "ric-sim/src/Contact/EdgePairIndex.hpp"
#include "ric-sim/src/Control/StiffnessController.hpp"
#include "ric-sim/src/DataRecorder/DataRecorder.hpp"
#include "ric-sim/src/Energy/ContactEnergyModel.hpp"
#include "ric-sim/src/Energy/SmoothedContactEnergy.hpp"
#include "ric-sim/src/Server/SharedMemoryBuffers.hpp"
#include "ric-sim/src/Server/StepSynchronizer.hpp"
#include "ric-sim/src/Server/ZmqReplyChannel.hpp"

int main(int argc, char* argv[])
{
  using namespace ric_sim;

  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

  try
  {
    const std::vector<std::string> args(argv + 1, argv + argc);
    const auto config = ContactConfig::fromArguments(args);

    SharedMemoryBuffers shared{config.session, config.numNodes};

    const auto provider =
      makeEnergyModel(config.energyModelKey, config.contactLength());

    EdgePairIndex index{config.numEdges()};
    spdlog::info("Contact server session {}: {} nodes, {} eligible edge pairs",
                 config.session,
                 config.numNodes,
                 index.size());
    spdlog::info("Energy model: {}", provider->getName());

    StepSynchronizer synchronizer{
      shared.view(),
      CollisionDetector{std::move(index), config.collisionLimit,
                        config.contactLength()},
      ContactEnergyModel{provider, config.frictionCoefficient},
      StiffnessController{config.contactStiffness, config.contactLength()},
      config.scale};

    std::unique_ptr<DataRecorder> recorder;
    if (config.recordingPath)
    {
      DataRecorder::Config recorderConfig;
      recorderConfig.databasePath = *config.recordingPath;
      recorder = std::make_unique<DataRecorder>(recorderConfig);
      synchronizer.setRecorder(recorder.get());
      spdlog::info("Recording contact diagnostics to {}", *config.recordingPath);
    }

    ZmqReplyChannel channel{config.session};
    spdlog::info("Connected to contact server on {}", channel.getEndpoint());

    synchronizer.run(channel);
  }
  catch (const std::exception& e)
  {
    spdlog::critical("Contact server terminated: {}", e.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
