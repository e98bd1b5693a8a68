/*
  Device trees — minimal splitter (fan-out) and merger (fan-in) trees.

  Both builders work bottom-up over a list of roots. While more than one root
  remains, the first three (two when only two remain) are grouped under a new
  device, which is appended at the end of the list. A three-way group removes
  two roots and a two-way group removes one, so n endpoints need exactly
  ceil((n-1)/2) devices.

  Split trees start from conceptual leaves: a destination is not a node of its
  own, so grouping a leaf records which splitter will feed it instead of
  drawing an edge. Merge trees start from real nodes and draw every edge.
*/
#include "balancer/core/device_tree.hpp"
#include "balancer/core/constants.hpp"
#include "balancer/core/error.hpp"

#include <algorithm>
#include <deque>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include <fmt/format.h>

namespace balancer::core {

namespace {

// A destination that has not been placed under a splitter yet.
struct Leaf {
  OutputIndex dest;
  Flow flow;
};

// A splitter already built, with the total flow of everything below it.
struct Subtree {
  NodeId node;
  Flow flow;
};

using Root = std::variant<Leaf, Subtree>;

constexpr std::size_t group_size(std::size_t remaining) noexcept {
  return remaining >= kMaxGroupSize ? kMaxGroupSize : kMinGroupSize;
}

Flow flow_of(const Root& r) noexcept {
  return std::visit([](const auto& x) { return x.flow; }, r);
}

NodeId add_device(GraphBuilder& gb, DeviceCounter& counter, NodeKind kind) {
  const char prefix = kind == NodeKind::Splitter ? 'S' : 'M';
  return gb.add_node(fmt::format("{}{}", prefix, counter.next()), kind);
}

} // namespace

std::map<OutputIndex, Feed> build_split_tree(GraphBuilder& gb, DeviceCounter& counter,
                                             NodeId source,
                                             const std::map<OutputIndex, Flow>& destinations) {
  if (destinations.empty()) {
    throw std::invalid_argument("build_split_tree: destinations must be non-empty");
  }
  if (destinations.size() == 1) {
    // Direct connection - no splitter needed
    const auto& [dest, flow] = *destinations.begin();
    return {{dest, Feed{source, flow}}};
  }

  // Largest flows first; destination index breaks ties so output is stable.
  std::vector<std::pair<OutputIndex, Flow>> sorted(destinations.begin(), destinations.end());
  std::sort(sorted.begin(), sorted.end(), [](auto const& a, auto const& b) {
    if (a.second != b.second) return a.second > b.second;
    return a.first > b.first;
  });

  std::deque<Root> roots;
  for (auto const& [dest, flow] : sorted) roots.emplace_back(Leaf{dest, flow});

  // Which splitter feeds each destination, filled as leaves get grouped.
  std::map<OutputIndex, Feed> feeds;

  while (roots.size() > 1) {
    const auto k = group_size(roots.size());
    const NodeId splitter = add_device(gb, counter, NodeKind::Splitter);
    Flow total = 0;
    for (std::size_t i = 0; i < k; ++i) {
      const Root child = roots.front();
      roots.pop_front();
      if (const auto* leaf = std::get_if<Leaf>(&child)) {
        feeds[leaf->dest] = Feed{splitter, leaf->flow};
      } else {
        const auto& sub = std::get<Subtree>(child);
        gb.add_edge(splitter, sub.node, sub.flow);
      }
      total += flow_of(child);
    }
    roots.emplace_back(Subtree{splitter, total});
  }

  // Two or more destinations always produce at least one splitter.
  const auto* root = std::get_if<Subtree>(&roots.front());
  if (root == nullptr) {
    throw RuntimeError("build_split_tree: final root is not a splitter");
  }
  gb.add_edge(source, root->node, root->flow);

  for (auto const& kv : destinations) {
    if (feeds.find(kv.first) == feeds.end()) {
      throw RuntimeError(fmt::format("build_split_tree: destination {} left unfed", kv.first));
    }
  }
  return feeds;
}

NodeId build_merge_tree(GraphBuilder& gb, DeviceCounter& counter, std::span<const Feed> sources) {
  if (sources.size() < kMinGroupSize) {
    throw RuntimeError("build_merge_tree: cannot merge a single source");
  }

  // Largest flows first; node id text breaks ties so output is stable.
  std::vector<Feed> sorted(sources.begin(), sources.end());
  std::sort(sorted.begin(), sorted.end(), [&gb](const Feed& a, const Feed& b) {
    if (a.flow != b.flow) return a.flow > b.flow;
    return gb.node(a.node).id > gb.node(b.node).id;
  });

  std::deque<Feed> streams(sorted.begin(), sorted.end());
  while (streams.size() > 1) {
    const auto k = group_size(streams.size());
    const NodeId merger = add_device(gb, counter, NodeKind::Merger);
    Flow total = 0;
    for (std::size_t i = 0; i < k; ++i) {
      const Feed s = streams.front();
      streams.pop_front();
      gb.add_edge(s.node, merger, s.flow);
      total += s.flow;
    }
    streams.push_back(Feed{merger, total});
  }
  return streams.front().node;
}

} // namespace balancer::core
