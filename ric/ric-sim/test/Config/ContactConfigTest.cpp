// Ticket: 0009_contact_server_executable

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "ric-sim/src/Config/ContactConfig.hpp"

using namespace ric_sim;

namespace
{

std::vector<std::string> validArguments()
{
  return {"7", "0.001", "1e5", "50", "0.3", "0.0025", "101", "20"};
}

}  // namespace

TEST(ContactConfig, FromArguments_ParsesPositionalFields)
{
  const auto config = ContactConfig::fromArguments(validArguments());

  EXPECT_EQ(config.session, "7");
  EXPECT_DOUBLE_EQ(config.collisionLimit, 0.001);
  EXPECT_DOUBLE_EQ(config.contactStiffness, 1e5);
  EXPECT_DOUBLE_EQ(config.energyModelKey, 50.0);
  EXPECT_DOUBLE_EQ(config.frictionCoefficient, 0.3);
  EXPECT_DOUBLE_EQ(config.radius, 0.0025);
  EXPECT_EQ(config.numNodes, 101u);
  EXPECT_DOUBLE_EQ(config.scale, 20.0);
  EXPECT_FALSE(config.recordingPath.has_value());

  EXPECT_EQ(config.numEdges(), 100u);
  EXPECT_DOUBLE_EQ(config.contactLength(), 2.0 * 0.0025 * 20.0);
}

TEST(ContactConfig, FromArguments_OptionalRecordingPath)
{
  auto args = validArguments();
  args.emplace_back("/tmp/contact.db");

  const auto config = ContactConfig::fromArguments(args);
  ASSERT_TRUE(config.recordingPath.has_value());
  EXPECT_EQ(*config.recordingPath, "/tmp/contact.db");
}

TEST(ContactConfig, FromArguments_WrongCount_Throws)
{
  auto args = validArguments();
  args.pop_back();
  EXPECT_THROW(static_cast<void>(ContactConfig::fromArguments(args)),
               std::invalid_argument);

  args = validArguments();
  args.emplace_back("a.db");
  args.emplace_back("extra");
  EXPECT_THROW(static_cast<void>(ContactConfig::fromArguments(args)),
               std::invalid_argument);
}

TEST(ContactConfig, FromArguments_MalformedNumbers_Throw)
{
  for (size_t field = 1; field < ContactConfig::kRequiredArguments; ++field)
  {
    auto args = validArguments();
    args[field] = "abc";
    EXPECT_THROW(static_cast<void>(ContactConfig::fromArguments(args)),
                 std::invalid_argument)
      << "field " << field;

    args[field] = "1.5x";
    EXPECT_THROW(static_cast<void>(ContactConfig::fromArguments(args)),
                 std::invalid_argument)
      << "field " << field;
  }
}

TEST(ContactConfig, FromArguments_NodeCountMustBeInteger)
{
  auto args = validArguments();
  args[6] = "10.5";
  EXPECT_THROW(static_cast<void>(ContactConfig::fromArguments(args)),
               std::invalid_argument);

  args[6] = "-4";
  EXPECT_THROW(static_cast<void>(ContactConfig::fromArguments(args)),
               std::invalid_argument);
}

TEST(ContactConfig, FromArguments_NodeCountRejectsSignAndWhitespace)
{
  auto args = validArguments();
  for (const std::string text : {" -3", "+5", " 5", ""})
  {
    args[6] = text;
    EXPECT_THROW(static_cast<void>(ContactConfig::fromArguments(args)),
                 std::invalid_argument)
      << "node count '" << text << "'";
  }

  args[6] = "7";
  EXPECT_EQ(ContactConfig::fromArguments(args).numNodes, 7u);
}

TEST(ContactConfig, FromArguments_NonFinite_Throws)
{
  auto args = validArguments();
  args[2] = "inf";
  EXPECT_THROW(static_cast<void>(ContactConfig::fromArguments(args)),
               std::invalid_argument);

  args = validArguments();
  args[7] = "nan";
  EXPECT_THROW(static_cast<void>(ContactConfig::fromArguments(args)),
               std::invalid_argument);
}

TEST(ContactConfig, Validate_RangeConstraints)
{
  const auto base = ContactConfig::fromArguments(validArguments());
  EXPECT_NO_THROW(base.validate());

  auto config = base;
  config.session.clear();
  EXPECT_THROW(config.validate(), std::invalid_argument);

  config = base;
  config.collisionLimit = -0.1;
  EXPECT_THROW(config.validate(), std::invalid_argument);

  config = base;
  config.collisionLimit = 0.0;
  EXPECT_NO_THROW(config.validate());

  config = base;
  config.contactStiffness = 0.0;
  EXPECT_THROW(config.validate(), std::invalid_argument);

  config = base;
  config.energyModelKey = -1.0;
  EXPECT_THROW(config.validate(), std::invalid_argument);

  config = base;
  config.frictionCoefficient = -0.01;
  EXPECT_THROW(config.validate(), std::invalid_argument);

  config = base;
  config.frictionCoefficient = 0.0;
  EXPECT_NO_THROW(config.validate());

  config = base;
  config.radius = 0.0;
  EXPECT_THROW(config.validate(), std::invalid_argument);

  config = base;
  config.numNodes = 1;
  EXPECT_THROW(config.validate(), std::invalid_argument);

  config = base;
  config.scale = 0.0;
  EXPECT_THROW(config.validate(), std::invalid_argument);

  config = base;
  config.recordingPath = "";
  EXPECT_THROW(config.validate(), std::invalid_argument);
}

TEST(ContactConfig, Usage_NamesEveryArgument)
{
  const auto usage = ContactConfig::usage();
  for (const auto* name : {"session", "collision_limit", "contact_stiffness",
                           "energy_model_key", "friction_coefficient", "radius",
                           "num_nodes", "scale", "recording_db"})
  {
    EXPECT_NE(usage.find(name), std::string::npos) << name;
  }
}
