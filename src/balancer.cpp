/*
  design_balancer — assemble a splitter/merger network for one flow request.

  Steps:
    1. Validate the request (equal totals, no negative entries).
    2. Assign input flow to outputs greedily (assign_flows).
    3. Create every Input and Output node up front, used or not.
    4. Build one split tree per input that feeds anything, remembering which
       node directly feeds each (input, output) leg.
    5. Per output: one feeding leg is wired straight in; several legs are
       joined by a merge tree first.

  The device counter lives on this call's stack and is passed to both tree
  builders, so concurrent calls never share numbering.
*/
#include "balancer/core/balancer.hpp"
#include "balancer/core/device_tree.hpp"
#include "balancer/core/flow_assignment.hpp"
#include "balancer/core/logging.hpp"

#include <utility>
#include <vector>

#include <fmt/format.h>

namespace balancer::core {

BalancerGraph design_balancer(std::span<const Flow> inputs, std::span<const Flow> outputs,
                              const DesignOptions& opts) {
  const Flow total = check_feasible(inputs, outputs, opts.zero_flow);
  logger()->debug("design_balancer: {} inputs -> {} outputs, total flow {}",
                  inputs.size(), outputs.size(), total);

  const AssignmentMatrix matrix = assign_flows(inputs, outputs, opts.zero_flow);

  GraphBuilder gb;
  std::vector<NodeId> input_nodes;
  input_nodes.reserve(inputs.size());
  for (std::size_t i = 0; i < inputs.size(); ++i) {
    input_nodes.push_back(gb.add_node(fmt::format("I{}", i), NodeKind::Input,
                                      fmt::format("Input {}", i), inputs[i]));
  }
  std::vector<NodeId> output_nodes;
  output_nodes.reserve(outputs.size());
  for (std::size_t j = 0; j < outputs.size(); ++j) {
    output_nodes.push_back(gb.add_node(fmt::format("O{}", j), NodeKind::Output,
                                       fmt::format("Output {}", j), outputs[j]));
  }

  DeviceCounter counter;

  // contributions[j]: nodes feeding output j directly, in input order.
  std::vector<std::vector<Feed>> contributions(outputs.size());
  for (InputIndex i = 0; i < matrix.num_inputs(); ++i) {
    const auto& row = matrix.row(i);
    if (row.empty()) continue;
    auto feeds = build_split_tree(gb, counter, input_nodes[static_cast<std::size_t>(i)], row);
    for (auto const& [out_idx, feed] : feeds) {
      contributions[static_cast<std::size_t>(out_idx)].push_back(feed);
    }
  }

  for (std::size_t j = 0; j < outputs.size(); ++j) {
    const auto& sources = contributions[j];
    if (sources.empty()) continue;
    if (sources.size() == 1) {
      // Direct connection - no merge needed
      gb.add_edge(sources.front().node, output_nodes[j], sources.front().flow);
      continue;
    }
    const NodeId merged = build_merge_tree(gb, counter, sources);
    Flow merged_flow = 0;
    for (auto const& s : sources) merged_flow += s.flow;
    gb.add_edge(merged, output_nodes[j], merged_flow);
  }

  BalancerGraph g = std::move(gb).finish();
  logger()->debug("design_balancer: {} splitters, {} mergers, {} edges",
                  g.count(NodeKind::Splitter), g.count(NodeKind::Merger), g.num_edges());
  return g;
}

} // namespace balancer::core
