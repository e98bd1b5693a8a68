/* Core type aliases and helper enums.
 *
 * For Python developers:
 * - NodeId/EdgeId: int32 (index into the graph's node/edge lists)
 * - Flow: int64 (items per minute, always integral)
 * - std::span<T>: lightweight view over contiguous arrays (like memoryview, no copy)
 * - std::optional<T>: nullable value (like T | None)
 */
#pragma once

#include <cstdint>

namespace balancer::core {

// Node and edge identifiers are signed 32-bit indices into BalancerGraph storage.
using NodeId = std::int32_t;
using EdgeId = std::int32_t;
using Flow = std::int64_t;         // Conserved integer quantity on every edge

using InputIndex = std::int32_t;   // Position in the caller's input list
using OutputIndex = std::int32_t;  // Position in the caller's output list
using DeviceId = std::int32_t;     // Shared splitter/merger numbering within one design call

// Kind of a graph node. Inputs and outputs are the caller's endpoints; splitters
// and mergers are the devices synthesized between them.
enum class NodeKind {
  Input = 1,
  Output = 2,
  Splitter = 3,  // one incoming flow, two or three outgoing flows
  Merger = 4     // two or three incoming flows, one outgoing flow
};

// What to do with zero-magnitude entries in an input or output list.
enum class ZeroFlowPolicy {
  Omit = 1,    // Keep the endpoint node, never route a zero-flow leg to it
  Reject = 2   // Treat any zero entry as a caller error
};

[[nodiscard]] constexpr bool is_device(NodeKind k) noexcept {
  return k == NodeKind::Splitter || k == NodeKind::Merger;
}

} // namespace balancer::core
