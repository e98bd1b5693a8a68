/* Balancer network design: the public entry point. */
#pragma once

#include <span>

#include "balancer/core/balancer_graph.hpp"
#include "balancer/core/options.hpp"
#include "balancer/core/types.hpp"

namespace balancer::core {

// Design a splitter/merger network that redistributes `inputs` into exactly
// `outputs`. Input i becomes node I<i>, output j node O<j>; devices are
// numbered S<n>/M<n> from one counter. Identical arguments always produce an
// identical graph.
//
// Throws InfeasibleFlowError when the totals differ, before any node exists.
[[nodiscard]] BalancerGraph design_balancer(std::span<const Flow> inputs,
                                            std::span<const Flow> outputs,
                                            const DesignOptions& opts = {});

} // namespace balancer::core
