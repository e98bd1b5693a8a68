/*
  DOT writer — renders a BalancerGraph as Graphviz source.

  Output layout:
    digraph {
    	rankdir=LR
    	I0 [label="Input 0" fillcolor=lightgreen shape=box style=filled]
    	S0 [label="" fillcolor=lightyellow shape=diamond style=filled]
    	I0 -> S0 [label=100]
    }
  Nodes are written in graph order, then edges in creation order.
*/
#include "balancer/core/dot_writer.hpp"

#include <cctype>
#include <sstream>
#include <string_view>

#include <fmt/format.h>

namespace balancer::core {

namespace {

bool is_plain_id(std::string_view s) noexcept {
  if (s.empty()) return false;
  if (!(std::isalpha(static_cast<unsigned char>(s.front())) || s.front() == '_')) return false;
  for (char c : s) {
    if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_')) return false;
  }
  return true;
}

std::string quoted(std::string_view s) {
  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('"');
  for (char c : s) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      default: out.push_back(c);
    }
  }
  out.push_back('"');
  return out;
}

std::string dot_id(std::string_view s) {
  return is_plain_id(s) ? std::string(s) : quoted(s);
}

const std::string& fill_color(NodeKind kind, const DotOptions& opts) noexcept {
  switch (kind) {
    case NodeKind::Input: return opts.input_color;
    case NodeKind::Output: return opts.output_color;
    case NodeKind::Splitter: return opts.splitter_color;
    case NodeKind::Merger: return opts.merger_color;
  }
  return opts.input_color;
}

} // namespace

void write_dot(std::ostream& os, const BalancerGraph& g, const DotOptions& opts) {
  os << "digraph ";
  if (!opts.graph_name.empty()) os << dot_id(opts.graph_name) << ' ';
  os << "{\n";
  if (!opts.rankdir.empty()) os << "\trankdir=" << opts.rankdir << '\n';

  for (const auto& n : g.nodes()) {
    const auto style = default_style(n.kind);
    os << fmt::format("\t{} [label={} fillcolor={} shape={} style=filled]\n",
                      dot_id(n.id), quoted(n.label), dot_id(fill_color(n.kind, opts)), style.shape);
  }
  for (const auto& e : g.edges()) {
    const auto& src = g.node(e.src);
    const auto& dst = g.node(e.dst);
    const std::string label = opts.edge_label_prefix.empty()
        ? std::to_string(e.flow)
        : quoted(opts.edge_label_prefix + std::to_string(e.flow));
    os << fmt::format("\t{} -> {} [label={}]\n", dot_id(src.id), dot_id(dst.id), label);
  }
  os << "}\n";
}

std::string to_dot(const BalancerGraph& g, const DotOptions& opts) {
  std::ostringstream os;
  write_dot(os, g, opts);
  return os.str();
}

} // namespace balancer::core
