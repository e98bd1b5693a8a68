/*
  audit_network — validates a finished balancer network.

  Endpoint nodes must carry exactly their declared rate; devices must conserve
  flow and respect their port counts. Messages name node ids so failures are
  readable in test output.
*/
#include "balancer/core/audit.hpp"
#include "balancer/core/constants.hpp"

#include <fmt/format.h>

namespace balancer::core {

namespace {

bool within(std::size_t v, std::size_t lo, std::size_t hi) noexcept { return v >= lo && v <= hi; }

} // namespace

std::vector<std::string> audit_network(const BalancerGraph& g) {
  std::vector<std::string> problems;

  for (EdgeId e = 0; e < g.num_edges(); ++e) {
    const auto& edge = g.edge(e);
    if (edge.flow <= 0) {
      problems.push_back(fmt::format("edge {} -> {} carries non-positive flow {}",
                                     g.node(edge.src).id, g.node(edge.dst).id, edge.flow));
    }
  }

  for (NodeId n = 0; n < g.num_nodes(); ++n) {
    const Node& node = g.node(n);
    const Flow in = g.inflow(n);
    const Flow out = g.outflow(n);
    const auto in_deg = g.in_edges(n).size();
    const auto out_deg = g.out_edges(n).size();
    switch (node.kind) {
      case NodeKind::Input:
        if (in_deg != 0) problems.push_back(fmt::format("input {} has {} incoming edges", node.id, in_deg));
        if (out != node.rate) {
          problems.push_back(fmt::format("input {} emits {} but its rate is {}", node.id, out, node.rate));
        }
        break;
      case NodeKind::Output:
        if (out_deg != 0) problems.push_back(fmt::format("output {} has {} outgoing edges", node.id, out_deg));
        if (in != node.rate) {
          problems.push_back(fmt::format("output {} receives {} but its rate is {}", node.id, in, node.rate));
        }
        break;
      case NodeKind::Splitter:
        if (in_deg != 1 || !within(out_deg, kMinGroupSize, kMaxGroupSize)) {
          problems.push_back(fmt::format("splitter {} has {} inputs and {} outputs", node.id, in_deg, out_deg));
        }
        break;
      case NodeKind::Merger:
        if (out_deg != 1 || !within(in_deg, kMinGroupSize, kMaxGroupSize)) {
          problems.push_back(fmt::format("merger {} has {} inputs and {} outputs", node.id, in_deg, out_deg));
        }
        break;
    }
    if (is_device(node.kind) && in != out) {
      problems.push_back(fmt::format("device {} receives {} but emits {}", node.id, in, out));
    }
  }
  return problems;
}

} // namespace balancer::core
