/* Splicing a balancer network into a larger host diagram. */
#pragma once

#include <string>
#include <vector>

#include "balancer/core/balancer_graph.hpp"

namespace balancer::core {

// How fragment ids map into the host.
// - input_ids[i] / output_ids[j] replace I<i> / O<j>. Empty lists keep the
//   fragment's ids. A host node that already has the id is reused and its
//   rate grows by the fragment endpoint's rate.
// - Every device id is prefixed with device_prefix.
struct EmbedMapping {
  std::string device_prefix;
  std::vector<std::string> input_ids;
  std::vector<std::string> output_ids;
};

// Copy `fragment` into `host`. Throws std::invalid_argument when a non-empty
// id list does not match the fragment's input/output count or holds an empty
// id, and ValueError when a prefixed device id is taken, an endpoint id is
// taken by a node of another kind, or a shared rate overflows. On throw the
// host is unchanged.
void splice(GraphBuilder& host, const BalancerGraph& fragment, const EmbedMapping& mapping);

} // namespace balancer::core
