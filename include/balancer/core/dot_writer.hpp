/* Graphviz DOT rendering of a balancer network. */
#pragma once

#include <ostream>
#include <string>

#include "balancer/core/balancer_graph.hpp"
#include "balancer/core/options.hpp"

namespace balancer::core {

void write_dot(std::ostream& os, const BalancerGraph& g, const DotOptions& opts = {});

[[nodiscard]] std::string to_dot(const BalancerGraph& g, const DotOptions& opts = {});

} // namespace balancer::core
