#pragma once

#include <gtest/gtest.h>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "balancer/core/balancer.hpp"
#include "balancer/core/balancer_graph.hpp"

namespace balancer::core::test {

// n copies of the same flow, e.g. repeat(30, 4) == {30, 30, 30, 30}
inline std::vector<Flow> repeat(Flow value, std::size_t n) {
  return std::vector<Flow>(n, value);
}

// Expected device count for grouping n endpoints three (or two) at a time.
inline std::int32_t optimal_devices(std::int32_t n) {
  return n <= 1 ? 0 : n / 2;  // == ceil((n - 1) / 2)
}

// Returns the flow on the first edge src -> dst (by node id), if any.
inline std::optional<Flow> edge_flow(const BalancerGraph& g, std::string_view src, std::string_view dst) {
  auto s = g.find(src);
  auto d = g.find(dst);
  if (!s || !d) return std::nullopt;
  for (auto e : g.out_edges(*s)) {
    const auto& edge = g.edge(e);
    if (edge.dst == *d) return edge.flow;
  }
  return std::nullopt;
}

inline bool has_edge(const BalancerGraph& g, std::string_view src, std::string_view dst) {
  return edge_flow(g, src, dst).has_value();
}

// Edges rendered as "src->dst:flow" in creation order.
inline std::vector<std::string> edge_strings(const BalancerGraph& g) {
  std::vector<std::string> out;
  for (const auto& e : g.edges()) {
    out.push_back(g.node(e.src).id + "->" + g.node(e.dst).id + ":" + std::to_string(e.flow));
  }
  return out;
}

// Assertion helpers
inline void expect_device_counts(const BalancerGraph& g, std::int32_t splitters, std::int32_t mergers) {
  EXPECT_EQ(g.count(NodeKind::Splitter), splitters) << "splitter count";
  EXPECT_EQ(g.count(NodeKind::Merger), mergers) << "merger count";
}

inline void expect_flow_conservation(const BalancerGraph& g) {
  for (NodeId u = 0; u < g.num_nodes(); ++u) {
    const auto& n = g.node(u);
    switch (n.kind) {
      case NodeKind::Input:
        EXPECT_EQ(g.outflow(u), n.rate) << "Input " << n.id << " does not emit its rate";
        EXPECT_EQ(g.inflow(u), 0) << "Input " << n.id << " has incoming flow";
        break;
      case NodeKind::Output:
        EXPECT_EQ(g.inflow(u), n.rate) << "Output " << n.id << " does not receive its rate";
        EXPECT_EQ(g.outflow(u), 0) << "Output " << n.id << " has outgoing flow";
        break;
      case NodeKind::Splitter:
      case NodeKind::Merger:
        EXPECT_EQ(g.inflow(u), g.outflow(u)) << "Flow not conserved at device " << n.id;
        break;
    }
  }
}

inline void expect_valid_device_ports(const BalancerGraph& g) {
  for (NodeId u = 0; u < g.num_nodes(); ++u) {
    const auto& n = g.node(u);
    const auto in_deg = g.in_edges(u).size();
    const auto out_deg = g.out_edges(u).size();
    if (n.kind == NodeKind::Splitter) {
      EXPECT_EQ(in_deg, 1u) << n.id;
      EXPECT_GE(out_deg, 2u) << n.id;
      EXPECT_LE(out_deg, 3u) << n.id;
    } else if (n.kind == NodeKind::Merger) {
      EXPECT_EQ(out_deg, 1u) << n.id;
      EXPECT_GE(in_deg, 2u) << n.id;
      EXPECT_LE(in_deg, 3u) << n.id;
    }
  }
}

} // namespace balancer::core::test
