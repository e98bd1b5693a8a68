/* Splitter and merger tree construction. */
#pragma once

#include <map>
#include <span>

#include "balancer/core/balancer_graph.hpp"
#include "balancer/core/types.hpp"

namespace balancer::core {

// Hands out device numbers. One counter serves both splitters and mergers so
// S and M ids never repeat a number within a design call.
class DeviceCounter {
public:
  DeviceId next() noexcept { return next_++; }
  [[nodiscard]] DeviceId issued() const noexcept { return next_; }

private:
  DeviceId next_ {0};
};

// The node that directly feeds a destination (or is fed by a source) and the
// flow on that leg.
struct Feed {
  NodeId node { -1 };
  Flow flow { 0 };
};

// Build a splitter tree from `source` to every destination. Destinations are
// grouped three at a time (two when only two remain), lowest-level groups
// first, until one root is left; the source then feeds that root.
// Returns, per destination, the node that feeds it and the flow.
// With a single destination no device is created and the source feeds it.
[[nodiscard]] std::map<OutputIndex, Feed> build_split_tree(
    GraphBuilder& gb, DeviceCounter& counter, NodeId source,
    const std::map<OutputIndex, Flow>& destinations);

// Build a merger tree joining `sources` (at least two) into one stream and
// return the final merger. The caller connects it to the destination.
[[nodiscard]] NodeId build_merge_tree(GraphBuilder& gb, DeviceCounter& counter,
                                      std::span<const Feed> sources);

} // namespace balancer::core
