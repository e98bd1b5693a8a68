/* Immutable balancer network with CSR and reverse CSR adjacency. */
#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "balancer/core/types.hpp"

namespace balancer::core {

// A node of the rendered network. `id` is the stable identifier (I0, O3, S7,
// M8, or a host-chosen id after splicing); `label` is the display text.
// `rate` is the declared magnitude for Input/Output nodes and 0 for devices.
struct Node {
  std::string id;
  NodeKind kind { NodeKind::Input };
  std::string label;
  Flow rate { 0 };
};

struct Edge {
  NodeId src { -1 };
  NodeId dst { -1 };
  Flow flow { 0 };
};

// Style hint for a node kind: Graphviz shape and fill color.
struct NodeStyle {
  std::string_view shape;
  std::string_view fill_color;
};

[[nodiscard]] NodeStyle default_style(NodeKind kind) noexcept;

// Notes on identifiers:
// - NodeId/EdgeId are positions in creation order. Edges are never reordered,
//   so edge order reflects construction order and is deterministic.
// - Adjacency lists preserve edge creation order per node.
class BalancerGraph {
public:
  BalancerGraph() = default;

  [[nodiscard]] std::int32_t num_nodes() const noexcept { return static_cast<std::int32_t>(nodes_.size()); }
  [[nodiscard]] std::int32_t num_edges() const noexcept { return static_cast<std::int32_t>(edges_.size()); }
  [[nodiscard]] std::int32_t num_inputs() const noexcept { return static_cast<std::int32_t>(input_ids_.size()); }
  [[nodiscard]] std::int32_t num_outputs() const noexcept { return static_cast<std::int32_t>(output_ids_.size()); }

  [[nodiscard]] std::span<const Node> nodes() const noexcept { return nodes_; }
  [[nodiscard]] std::span<const Edge> edges() const noexcept { return edges_; }

  [[nodiscard]] const Node& node(NodeId n) const;
  [[nodiscard]] const Edge& edge(EdgeId e) const;
  [[nodiscard]] std::optional<NodeId> find(std::string_view id) const;

  // Node ids of the i-th input / j-th output in the order the caller listed them.
  [[nodiscard]] NodeId input_node(InputIndex i) const;
  [[nodiscard]] NodeId output_node(OutputIndex j) const;

  // Number of nodes of the given kind.
  [[nodiscard]] std::int32_t count(NodeKind kind) const noexcept;

  // Outgoing / incoming edge ids of n, in creation order.
  [[nodiscard]] std::span<const EdgeId> out_edges(NodeId n) const;
  [[nodiscard]] std::span<const EdgeId> in_edges(NodeId n) const;

  [[nodiscard]] Flow inflow(NodeId n) const;
  [[nodiscard]] Flow outflow(NodeId n) const;

private:
  friend class GraphBuilder;

  void check_node(NodeId n) const;
  void build_adjacency();

  std::vector<Node> nodes_ {};
  std::vector<Edge> edges_ {};
  std::unordered_map<std::string, NodeId> index_ {};
  std::vector<NodeId> input_ids_ {};
  std::vector<NodeId> output_ids_ {};

  // CSR adjacency (outgoing)
  std::vector<std::int32_t> row_offsets_ {};
  std::vector<EdgeId> out_edge_index_ {};
  // Reverse CSR (incoming)
  std::vector<std::int32_t> in_row_offsets_ {};
  std::vector<EdgeId> in_edge_index_ {};
};

// GraphBuilder is the only mutating surface. Nodes and edges are appended,
// never removed; finish() hands back the immutable graph.
class GraphBuilder {
public:
  GraphBuilder() = default;

  // Appends a node. Throws ValueError if `id` is already taken.
  NodeId add_node(std::string id, NodeKind kind, std::string label = {}, Flow rate = 0);

  // Appends an edge. Throws std::out_of_range for unknown endpoints and
  // std::invalid_argument for a negative flow.
  EdgeId add_edge(NodeId src, NodeId dst, Flow flow);

  // Adds `extra` to an existing node's rate, for endpoints shared by several
  // spliced fragments. Throws std::invalid_argument for a negative amount and
  // ValueError if the rate would overflow.
  void add_rate(NodeId n, Flow extra);

  [[nodiscard]] std::optional<NodeId> find(std::string_view id) const { return g_.find(id); }
  [[nodiscard]] const Node& node(NodeId n) const { return g_.node(n); }
  [[nodiscard]] std::int32_t num_nodes() const noexcept { return g_.num_nodes(); }
  [[nodiscard]] std::int32_t num_edges() const noexcept { return g_.num_edges(); }

  // Finalizes adjacency and returns the graph. The builder is left empty.
  [[nodiscard]] BalancerGraph finish() &&;

private:
  BalancerGraph g_ {};
};

} // namespace balancer::core
