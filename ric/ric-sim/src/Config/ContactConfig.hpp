// Ticket: 0009_contact_server_executable

#ifndef RIC_SIM_CONFIG_CONTACT_CONFIG_HPP
#define RIC_SIM_CONFIG_CONTACT_CONFIG_HPP

#include <cstddef>
#include <optional>
#include <span>
#include <string>

namespace ric_sim
{

/**
 * @brief Startup parameters of the contact server
 *
 * Positional arguments, in order:
 *
 * | # | Field                 | Constraint        |
 * |---|-----------------------|-------------------|
 * | 1 | session               | non-empty         |
 * | 2 | collisionLimit        | >= 0              |
 * | 3 | contactStiffness      | > 0               |
 * | 4 | energyModelKey        | > 0               |
 * | 5 | frictionCoefficient   | >= 0              |
 * | 6 | radius                | > 0               |
 * | 7 | numNodes              | integer >= 2      |
 * | 8 | scale                 | > 0               |
 * | 9 | recordingPath         | optional          |
 *
 * The radius is given in client units; contactLength() is in normalized
 * units (multiplied by scale).
 *
 * @ticket 0009_contact_server_executable
 */
struct ContactConfig
{
  static constexpr size_t kRequiredArguments{8};

  std::string session;
  double collisionLimit{0.0};
  double contactStiffness{0.0};
  double energyModelKey{0.0};
  double frictionCoefficient{0.0};
  double radius{0.0};
  size_t numNodes{0};
  double scale{1.0};
  std::optional<std::string> recordingPath;

  /**
   * @brief Parse and validate positional arguments (program name excluded)
   * @throws std::invalid_argument for missing, malformed or out-of-range
   *         values
   */
  [[nodiscard]] static ContactConfig fromArguments(
    std::span<const std::string> args);

  /**
   * @throws std::invalid_argument naming the first violated constraint
   */
  void validate() const;

  [[nodiscard]] double contactLength() const
  {
    return 2.0 * radius * scale;
  }

  [[nodiscard]] size_t numEdges() const
  {
    return numNodes > 0 ? numNodes - 1 : 0;
  }

  [[nodiscard]] static std::string usage();
};

}  // namespace ric_sim

#endif  // RIC_SIM_CONFIG_CONTACT_CONFIG_HPP
