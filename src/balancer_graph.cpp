/*
  BalancerGraph — immutable network value with deterministic layout.

  GraphBuilder appends nodes and edges in creation order and validates them as
  they arrive. finish() compacts adjacency into CSR (and reverse CSR) using a
  stable counting pass, so per-node edge lists keep creation order.
*/
#include "balancer/core/balancer_graph.hpp"
#include "balancer/core/constants.hpp"
#include "balancer/core/error.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

namespace balancer::core {

NodeStyle default_style(NodeKind kind) noexcept {
  switch (kind) {
    case NodeKind::Input: return {"box", kInputColor};
    case NodeKind::Output: return {"box", kOutputColor};
    case NodeKind::Splitter: return {"diamond", kSplitterColor};
    case NodeKind::Merger: return {"diamond", kMergerColor};
  }
  return {"box", kInputColor};
}

void BalancerGraph::check_node(NodeId n) const {
  if (n < 0 || n >= num_nodes()) {
    throw std::out_of_range(fmt::format("node id {} out of range of num_nodes {}", n, num_nodes()));
  }
}

const Node& BalancerGraph::node(NodeId n) const {
  check_node(n);
  return nodes_[static_cast<std::size_t>(n)];
}

const Edge& BalancerGraph::edge(EdgeId e) const {
  if (e < 0 || e >= num_edges()) {
    throw std::out_of_range(fmt::format("edge id {} out of range of num_edges {}", e, num_edges()));
  }
  return edges_[static_cast<std::size_t>(e)];
}

std::optional<NodeId> BalancerGraph::find(std::string_view id) const {
  auto it = index_.find(std::string(id));
  if (it == index_.end()) return std::nullopt;
  return it->second;
}

NodeId BalancerGraph::input_node(InputIndex i) const {
  if (i < 0 || i >= num_inputs()) {
    throw std::out_of_range(fmt::format("input index {} out of range of num_inputs {}", i, num_inputs()));
  }
  return input_ids_[static_cast<std::size_t>(i)];
}

NodeId BalancerGraph::output_node(OutputIndex j) const {
  if (j < 0 || j >= num_outputs()) {
    throw std::out_of_range(fmt::format("output index {} out of range of num_outputs {}", j, num_outputs()));
  }
  return output_ids_[static_cast<std::size_t>(j)];
}

std::int32_t BalancerGraph::count(NodeKind kind) const noexcept {
  return static_cast<std::int32_t>(
      std::count_if(nodes_.begin(), nodes_.end(), [kind](const Node& n) { return n.kind == kind; }));
}

std::span<const EdgeId> BalancerGraph::out_edges(NodeId n) const {
  check_node(n);
  auto s = static_cast<std::size_t>(row_offsets_[static_cast<std::size_t>(n)]);
  auto e = static_cast<std::size_t>(row_offsets_[static_cast<std::size_t>(n) + 1]);
  return std::span<const EdgeId>(out_edge_index_).subspan(s, e - s);
}

std::span<const EdgeId> BalancerGraph::in_edges(NodeId n) const {
  check_node(n);
  auto s = static_cast<std::size_t>(in_row_offsets_[static_cast<std::size_t>(n)]);
  auto e = static_cast<std::size_t>(in_row_offsets_[static_cast<std::size_t>(n) + 1]);
  return std::span<const EdgeId>(in_edge_index_).subspan(s, e - s);
}

Flow BalancerGraph::inflow(NodeId n) const {
  Flow total = 0;
  for (auto e : in_edges(n)) total += edges_[static_cast<std::size_t>(e)].flow;
  return total;
}

Flow BalancerGraph::outflow(NodeId n) const {
  Flow total = 0;
  for (auto e : out_edges(n)) total += edges_[static_cast<std::size_t>(e)].flow;
  return total;
}

void BalancerGraph::build_adjacency() {
  const auto n = nodes_.size();
  const auto m = edges_.size();

  // Build CSR adjacency
  row_offsets_.assign(n + 1, 0);
  for (const auto& e : edges_) {
    row_offsets_[static_cast<std::size_t>(e.src) + 1]++;
  }
  for (std::size_t i = 1; i < row_offsets_.size(); ++i) {
    row_offsets_[i] += row_offsets_[i - 1];
  }
  out_edge_index_.resize(m);
  std::vector<std::int32_t> cursor = row_offsets_;
  for (std::size_t e = 0; e < m; ++e) {
    auto u = edges_[e].src;
    auto pos = static_cast<std::size_t>(cursor[static_cast<std::size_t>(u)]++);
    out_edge_index_[pos] = static_cast<EdgeId>(e);
  }

  // Build reverse CSR (incoming adjacency)
  in_row_offsets_.assign(n + 1, 0);
  for (const auto& e : edges_) {
    in_row_offsets_[static_cast<std::size_t>(e.dst) + 1]++;
  }
  for (std::size_t i = 1; i < in_row_offsets_.size(); ++i) {
    in_row_offsets_[i] += in_row_offsets_[i - 1];
  }
  in_edge_index_.resize(m);
  std::vector<std::int32_t> rcursor = in_row_offsets_;
  for (std::size_t e = 0; e < m; ++e) {
    auto v = edges_[e].dst;
    auto pos = static_cast<std::size_t>(rcursor[static_cast<std::size_t>(v)]++);
    in_edge_index_[pos] = static_cast<EdgeId>(e);
  }
}

NodeId GraphBuilder::add_node(std::string id, NodeKind kind, std::string label, Flow rate) {
  if (id.empty()) {
    throw std::invalid_argument("node id must be non-empty");
  }
  if (rate < 0) {
    throw std::invalid_argument(fmt::format("node {}: rate must be >= 0", id));
  }
  auto nid = static_cast<NodeId>(g_.nodes_.size());
  if (!g_.index_.emplace(id, nid).second) {
    throw ValueError(fmt::format("duplicate node id '{}'", id));
  }
  g_.nodes_.push_back(Node{std::move(id), kind, std::move(label), rate});
  if (kind == NodeKind::Input) g_.input_ids_.push_back(nid);
  if (kind == NodeKind::Output) g_.output_ids_.push_back(nid);
  return nid;
}

EdgeId GraphBuilder::add_edge(NodeId src, NodeId dst, Flow flow) {
  g_.check_node(src);
  g_.check_node(dst);
  if (flow < 0) {
    throw std::invalid_argument(fmt::format("edge {} -> {}: flow must be >= 0",
                                            g_.nodes_[static_cast<std::size_t>(src)].id,
                                            g_.nodes_[static_cast<std::size_t>(dst)].id));
  }
  auto eid = static_cast<EdgeId>(g_.edges_.size());
  g_.edges_.push_back(Edge{src, dst, flow});
  return eid;
}

void GraphBuilder::add_rate(NodeId n, Flow extra) {
  g_.check_node(n);
  Node& node = g_.nodes_[static_cast<std::size_t>(n)];
  if (extra < 0) {
    throw std::invalid_argument(fmt::format("node {}: added rate must be >= 0", node.id));
  }
  if (extra > std::numeric_limits<Flow>::max() - node.rate) {
    throw ValueError(fmt::format("node {}: rate {} + {} overflows", node.id, node.rate, extra));
  }
  node.rate += extra;
}

BalancerGraph GraphBuilder::finish() && {
  g_.build_adjacency();
  BalancerGraph out = std::move(g_);
  g_ = BalancerGraph{};
  return out;
}

} // namespace balancer::core
