#pragma once
#include <stdexcept>
#include <string>

namespace sanidate::execution {

/// Schema mistake detected before any field runs: an unknown constraint
/// name, or arguments a constraint cannot be built from.
struct configuration_error final : public std::runtime_error {
  configuration_error(std::string field_,
                      std::string constraint_,
                      const std::string& message)
      : std::runtime_error{message},
        field{std::move(field_)},
        constraint{std::move(constraint_)} {}

  std::string field;
  std::string constraint;
};

}  // namespace sanidate::execution
