/* Structural and conservation checks over a finished network. */
#pragma once

#include <string>
#include <vector>

#include "balancer/core/balancer_graph.hpp"

namespace balancer::core {

// Returns one message per violation; empty when the network is valid.
// Checks: inputs emit their rate, outputs receive their rate, devices conserve
// flow, splitters are 1-in/2..3-out, mergers are 2..3-in/1-out, and every edge
// carries positive flow.
[[nodiscard]] std::vector<std::string> audit_network(const BalancerGraph& g);

} // namespace balancer::core
