/* Conversion of fractional rates into integer flows. */
#pragma once

#include <span>
#include <vector>

#include "balancer/core/types.hpp"

namespace balancer::core {

// Proportionally allocate `target_total` over `rates`. Every entry but the
// last gets trunc(rate * target_total / sum(rates)); the last entry takes the
// remainder so the result sums exactly to target_total. A single rate takes
// the whole target, even a zero one. Throws std::invalid_argument for
// non-finite or negative rates, a negative target, or several rates summing to
// zero with a non-zero target.
[[nodiscard]] std::vector<Flow> quantize_flows(std::span<const double> rates, Flow target_total);

} // namespace balancer::core
