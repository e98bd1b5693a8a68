#include "balancer/core/error.hpp"

#include <fmt/format.h>

namespace balancer::core {

InfeasibleFlowError::InfeasibleFlowError(Flow input_total, Flow output_total)
  : ValueError(fmt::format("Total input flow {} must equal total output flow {}",
                           input_total, output_total)),
    input_total_(input_total), output_total_(output_total) {}

} // namespace balancer::core
