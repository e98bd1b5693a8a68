#pragma once

#include <stdexcept>
#include <string>

#include "balancer/core/types.hpp"

namespace balancer::core {

struct TypeError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct ValueError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct RuntimeError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Raised when the inputs and outputs of a design request do not carry the
// same total flow. Nothing is built when this is thrown.
class InfeasibleFlowError : public ValueError {
public:
  InfeasibleFlowError(Flow input_total, Flow output_total);

  [[nodiscard]] Flow input_total() const noexcept { return input_total_; }
  [[nodiscard]] Flow output_total() const noexcept { return output_total_; }

private:
  Flow input_total_ {0};
  Flow output_total_ {0};
};

} // namespace balancer::core
