// Ticket: 0009_contact_server_executable

#include "ric-sim/src/Config/ContactConfig.hpp"

#include <cctype>
#include <cmath>
#include <stdexcept>

namespace ric_sim
{

namespace
{

double parseDouble(const std::string& text, const std::string& field)
{
  size_t consumed = 0;
  double value = 0.0;
  try
  {
    value = std::stod(text, &consumed);
  }
  catch (const std::logic_error&)
  {
    throw std::invalid_argument("ContactConfig: " + field +
                                " is not a number (got '" + text + "')");
  }
  if (consumed != text.size() || !std::isfinite(value))
  {
    throw std::invalid_argument("ContactConfig: " + field +
                                " is not a finite number (got '" + text + "')");
  }
  return value;
}

size_t parseCount(const std::string& text, const std::string& field)
{
  // std::stoull skips leading whitespace and accepts a sign
  if (text.empty() || !std::isdigit(static_cast<unsigned char>(text.front())))
  {
    throw std::invalid_argument("ContactConfig: " + field +
                                " is not a non-negative integer (got '" +
                                text + "')");
  }

  size_t consumed = 0;
  unsigned long long value = 0;
  try
  {
    value = std::stoull(text, &consumed);
  }
  catch (const std::logic_error&)
  {
    throw std::invalid_argument("ContactConfig: " + field +
                                " is not an integer (got '" + text + "')");
  }
  if (consumed != text.size())
  {
    throw std::invalid_argument("ContactConfig: " + field +
                                " is not a non-negative integer (got '" +
                                text + "')");
  }
  return static_cast<size_t>(value);
}

}  // namespace

ContactConfig ContactConfig::fromArguments(std::span<const std::string> args)
{
  if (args.size() < kRequiredArguments || args.size() > kRequiredArguments + 1)
  {
    throw std::invalid_argument("ContactConfig: expected " +
                                std::to_string(kRequiredArguments) + " or " +
                                std::to_string(kRequiredArguments + 1) +
                                " arguments (got " +
                                std::to_string(args.size()) + ")\n" + usage());
  }

  ContactConfig config;
  config.session = args[0];
  config.collisionLimit = parseDouble(args[1], "collision limit");
  config.contactStiffness = parseDouble(args[2], "contact stiffness");
  config.energyModelKey = parseDouble(args[3], "energy-model key");
  config.frictionCoefficient = parseDouble(args[4], "friction coefficient");
  config.radius = parseDouble(args[5], "radius");
  config.numNodes = parseCount(args[6], "node count");
  config.scale = parseDouble(args[7], "scale");
  if (args.size() > kRequiredArguments)
  {
    config.recordingPath = args[kRequiredArguments];
  }

  config.validate();
  return config;
}

void ContactConfig::validate() const
{
  if (session.empty())
  {
    throw std::invalid_argument("ContactConfig: session must not be empty");
  }
  if (collisionLimit < 0.0)
  {
    throw std::invalid_argument(
      "ContactConfig: collision limit must be non-negative (got " +
      std::to_string(collisionLimit) + ")");
  }
  if (contactStiffness <= 0.0)
  {
    throw std::invalid_argument(
      "ContactConfig: contact stiffness must be positive (got " +
      std::to_string(contactStiffness) + ")");
  }
  if (energyModelKey <= 0.0)
  {
    throw std::invalid_argument(
      "ContactConfig: energy-model key must be positive (got " +
      std::to_string(energyModelKey) + ")");
  }
  if (frictionCoefficient < 0.0)
  {
    throw std::invalid_argument(
      "ContactConfig: friction coefficient must be non-negative (got " +
      std::to_string(frictionCoefficient) + ")");
  }
  if (radius <= 0.0)
  {
    throw std::invalid_argument("ContactConfig: radius must be positive (got " +
                                std::to_string(radius) + ")");
  }
  if (numNodes < 2)
  {
    throw std::invalid_argument("ContactConfig: node count must be at least 2 (got " +
                                std::to_string(numNodes) + ")");
  }
  if (scale <= 0.0)
  {
    throw std::invalid_argument("ContactConfig: scale must be positive (got " +
                                std::to_string(scale) + ")");
  }
  if (recordingPath && recordingPath->empty())
  {
    throw std::invalid_argument("ContactConfig: recording path must not be empty");
  }
}

std::string ContactConfig::usage()
{
  return "usage: ric_contact_server <session> <collision_limit> "
         "<contact_stiffness> <energy_model_key> <friction_coefficient> "
         "<radius> <num_nodes> <scale> [recording_db]";
}

}  // namespace ric_sim
