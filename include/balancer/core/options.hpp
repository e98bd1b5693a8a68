/* Option structs passed to the public entry points. */
#pragma once

#include <string>

#include "balancer/core/constants.hpp"
#include "balancer/core/types.hpp"

namespace balancer::core {

struct DesignOptions {
  ZeroFlowPolicy zero_flow { ZeroFlowPolicy::Omit };
};

// Rendering options for to_dot/write_dot. Defaults reproduce the classic
// left-to-right layout: green inputs, blue outputs, yellow splitters, coral mergers.
struct DotOptions {
  std::string graph_name {};
  std::string rankdir { "LR" };
  std::string input_color { kInputColor };
  std::string output_color { kOutputColor };
  std::string splitter_color { kSplitterColor };
  std::string merger_color { kMergerColor };
  // Prepended to every edge label, e.g. "Iron Ore\n" when several material
  // fragments share one diagram.
  std::string edge_label_prefix {};
};

} // namespace balancer::core
