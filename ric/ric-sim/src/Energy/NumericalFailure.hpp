// Ticket: 0003_contact_energy_model

#ifndef RIC_SIM_ENERGY_NUMERICAL_FAILURE_HPP
#define RIC_SIM_ENERGY_NUMERICAL_FAILURE_HPP

#include <stdexcept>
#include <string>

namespace ric_sim
{

/**
 * @brief Non-finite values in contact forces or in a Hessian with no
 * remaining fallback
 *
 * Fatal: the server cannot produce a usable reply.
 */
class NumericalFailure : public std::runtime_error
{
public:
  explicit NumericalFailure(const std::string& what)
    : std::runtime_error{what}
  {
  }
};

}  // namespace ric_sim

#endif  // RIC_SIM_ENERGY_NUMERICAL_FAILURE_HPP
