/*
  splice — copy a balancer fragment into a host diagram.

  The fragment's Input/Output nodes stand for host entities (machines, belts)
  and are mapped onto host ids, reusing host nodes that already exist. A reused
  endpoint accumulates the fragment's rate, so a machine fed by several
  materials ends up with its total rate. Devices are private to the fragment
  and get a prefix so several fragments (one per material) can share one host
  without collisions.

  Every id is resolved and checked before the host is touched; a rejected
  fragment leaves the host unchanged.
*/
#include "balancer/core/embedding.hpp"
#include "balancer/core/error.hpp"

#include <limits>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace balancer::core {

namespace {

void check_id_list(const std::vector<std::string>& ids, std::int32_t expected, const char* what) {
  if (!ids.empty() && static_cast<std::int32_t>(ids.size()) != expected) {
    throw std::invalid_argument(fmt::format("splice: {} has {} ids, fragment has {}", what, ids.size(), expected));
  }
}

// Kind and accumulated rate a host id will have once the fragment is spliced.
struct PlannedEndpoint {
  NodeKind kind;
  Flow rate;
};

} // namespace

void splice(GraphBuilder& host, const BalancerGraph& fragment, const EmbedMapping& mapping) {
  check_id_list(mapping.input_ids, fragment.num_inputs(), "input_ids");
  check_id_list(mapping.output_ids, fragment.num_outputs(), "output_ids");

  // (fragment node, host id) for every endpoint, inputs first.
  std::vector<std::pair<NodeId, std::string>> endpoints;
  endpoints.reserve(static_cast<std::size_t>(fragment.num_inputs() + fragment.num_outputs()));
  for (InputIndex i = 0; i < fragment.num_inputs(); ++i) {
    const NodeId n = fragment.input_node(i);
    endpoints.emplace_back(n, mapping.input_ids.empty() ? fragment.node(n).id
                                                        : mapping.input_ids[static_cast<std::size_t>(i)]);
  }
  for (OutputIndex j = 0; j < fragment.num_outputs(); ++j) {
    const NodeId n = fragment.output_node(j);
    endpoints.emplace_back(n, mapping.output_ids.empty() ? fragment.node(n).id
                                                         : mapping.output_ids[static_cast<std::size_t>(j)]);
  }

  std::unordered_map<std::string, PlannedEndpoint> planned;
  for (auto const& [n, host_id] : endpoints) {
    const Node& node = fragment.node(n);
    if (host_id.empty()) {
      throw std::invalid_argument(fmt::format("splice: fragment node {} maps to an empty id", node.id));
    }
    auto it = planned.find(host_id);
    if (it == planned.end()) {
      PlannedEndpoint p {node.kind, 0};
      if (auto existing = host.find(host_id)) {
        const Node& h = host.node(*existing);
        p = PlannedEndpoint {h.kind, h.rate};
      }
      it = planned.emplace(host_id, p).first;
    }
    if (it->second.kind != node.kind) {
      throw ValueError(fmt::format("splice: '{}' is already used by a node of another kind", host_id));
    }
    if (node.rate > std::numeric_limits<Flow>::max() - it->second.rate) {
      throw ValueError(fmt::format("splice: rate of '{}' overflows", host_id));
    }
    it->second.rate += node.rate;
  }
  for (const auto& node : fragment.nodes()) {
    if (!is_device(node.kind)) continue;
    const std::string id = mapping.device_prefix + node.id;
    if (host.find(id) || planned.count(id) != 0) {
      throw ValueError(fmt::format("splice: device id '{}' already exists in the host", id));
    }
  }

  // Nothing below throws for a fragment that passed the checks above.
  std::vector<NodeId> remap(static_cast<std::size_t>(fragment.num_nodes()), -1);
  for (auto const& [n, host_id] : endpoints) {
    const Node& node = fragment.node(n);
    NodeId target;
    if (auto existing = host.find(host_id)) {
      target = *existing;
      host.add_rate(target, node.rate);
    } else {
      target = host.add_node(host_id, node.kind, node.label, node.rate);
    }
    remap[static_cast<std::size_t>(n)] = target;
  }
  for (NodeId n = 0; n < fragment.num_nodes(); ++n) {
    const Node& node = fragment.node(n);
    if (!is_device(node.kind)) continue;
    remap[static_cast<std::size_t>(n)] = host.add_node(mapping.device_prefix + node.id, node.kind, node.label);
  }

  for (const auto& e : fragment.edges()) {
    host.add_edge(remap[static_cast<std::size_t>(e.src)], remap[static_cast<std::size_t>(e.dst)], e.flow);
  }
}

} // namespace balancer::core
