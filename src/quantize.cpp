/* quantize_flows — proportional integer allocation with exact total. */
#include "balancer/core/quantize.hpp"

#include <cmath>
#include <stdexcept>

#include <fmt/format.h>

namespace balancer::core {

std::vector<Flow> quantize_flows(std::span<const double> rates, Flow target_total) {
  if (target_total < 0) {
    throw std::invalid_argument("quantize_flows: target_total must be >= 0");
  }
  double rate_total = 0.0;
  for (std::size_t i = 0; i < rates.size(); ++i) {
    if (!std::isfinite(rates[i]) || rates[i] < 0.0) {
      throw std::invalid_argument(fmt::format("quantize_flows: rates[{}] = {} must be finite and >= 0", i, rates[i]));
    }
    rate_total += rates[i];
  }

  std::vector<Flow> out;
  if (rates.empty()) return out;
  if (rate_total <= 0.0 && target_total != 0 && rates.size() > 1) {
    throw std::invalid_argument("quantize_flows: rates sum to zero but target_total is non-zero");
  }

  out.reserve(rates.size());
  Flow remaining = target_total;
  for (std::size_t i = 0; i + 1 < rates.size(); ++i) {
    Flow allocated = 0;
    if (rate_total > 0.0) {
      allocated = static_cast<Flow>(std::trunc(rates[i] * static_cast<double>(target_total) / rate_total));
    }
    out.push_back(allocated);
    remaining -= allocated;
  }
  // The last entry absorbs rounding so the total is exact.
  out.push_back(remaining);
  return out;
}

} // namespace balancer::core
