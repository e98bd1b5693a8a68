/*
  assign_flows — greedy first-available matching of inputs to outputs.

  Inputs wait in a queue in caller order. Each output, in caller order, drains
  the queue front until satisfied; a partially used input goes back to the
  front so it continues with the next output. This keeps each input's
  destinations contiguous and limits fragmentation. No backtracking.
*/
#include "balancer/core/flow_assignment.hpp"
#include "balancer/core/error.hpp"
#include "balancer/core/logging.hpp"

#include <deque>
#include <limits>
#include <stdexcept>

#include <fmt/format.h>

namespace balancer::core {

namespace {

Flow checked_total(std::span<const Flow> flows, const char* what, ZeroFlowPolicy zero_flow) {
  Flow total = 0;
  for (std::size_t i = 0; i < flows.size(); ++i) {
    if (flows[i] < 0) {
      throw std::invalid_argument(fmt::format("{}[{}] = {}: flows must be >= 0", what, i, flows[i]));
    }
    if (flows[i] == 0 && zero_flow == ZeroFlowPolicy::Reject) {
      throw ValueError(fmt::format("{}[{}] is zero and zero-flow entries are rejected", what, i));
    }
    if (flows[i] > std::numeric_limits<Flow>::max() - total) {
      throw ValueError(fmt::format("{} total overflows at {}[{}] = {}", what, what, i, flows[i]));
    }
    total += flows[i];
  }
  return total;
}

} // namespace

AssignmentMatrix::AssignmentMatrix(std::int32_t num_inputs, std::int32_t num_outputs)
  : num_outputs_(num_outputs) {
  if (num_inputs < 0 || num_outputs < 0) {
    throw std::invalid_argument("AssignmentMatrix: dimensions must be >= 0");
  }
  rows_.resize(static_cast<std::size_t>(num_inputs));
}

Flow AssignmentMatrix::at(InputIndex i, OutputIndex j) const {
  const auto& r = row(i);
  if (j < 0 || j >= num_outputs_) {
    throw std::out_of_range(fmt::format("output index {} out of range of num_outputs {}", j, num_outputs_));
  }
  auto it = r.find(j);
  return it == r.end() ? 0 : it->second;
}

const std::map<OutputIndex, Flow>& AssignmentMatrix::row(InputIndex i) const {
  if (i < 0 || i >= num_inputs()) {
    throw std::out_of_range(fmt::format("input index {} out of range of num_inputs {}", i, num_inputs()));
  }
  return rows_[static_cast<std::size_t>(i)];
}

std::vector<std::pair<InputIndex, Flow>> AssignmentMatrix::column(OutputIndex j) const {
  if (j < 0 || j >= num_outputs_) {
    throw std::out_of_range(fmt::format("output index {} out of range of num_outputs {}", j, num_outputs_));
  }
  std::vector<std::pair<InputIndex, Flow>> out;
  for (std::size_t i = 0; i < rows_.size(); ++i) {
    auto it = rows_[i].find(j);
    if (it != rows_[i].end()) out.emplace_back(static_cast<InputIndex>(i), it->second);
  }
  return out;
}

Flow AssignmentMatrix::input_total(InputIndex i) const {
  Flow s = 0;
  for (auto const& kv : row(i)) s += kv.second;
  return s;
}

Flow AssignmentMatrix::output_total(OutputIndex j) const {
  Flow s = 0;
  for (auto const& pr : column(j)) s += pr.second;
  return s;
}

void AssignmentMatrix::record(InputIndex i, OutputIndex j, Flow amount) {
  // Each (input, output) pair is visited at most once by the greedy pass.
  if (!rows_[static_cast<std::size_t>(i)].emplace(j, amount).second) {
    throw RuntimeError(fmt::format("assign_flows: input {} assigned to output {} twice", i, j));
  }
  ++entries_;
}

Flow check_feasible(std::span<const Flow> inputs, std::span<const Flow> outputs,
                    ZeroFlowPolicy zero_flow) {
  const Flow in_total = checked_total(inputs, "inputs", zero_flow);
  const Flow out_total = checked_total(outputs, "outputs", zero_flow);
  if (in_total != out_total) {
    logger()->warn("infeasible balancer request: inputs total {}, outputs total {}", in_total, out_total);
    throw InfeasibleFlowError(in_total, out_total);
  }
  return in_total;
}

AssignmentMatrix assign_flows(std::span<const Flow> inputs, std::span<const Flow> outputs,
                              ZeroFlowPolicy zero_flow) {
  (void)check_feasible(inputs, outputs, zero_flow);

  AssignmentMatrix m(static_cast<std::int32_t>(inputs.size()), static_cast<std::int32_t>(outputs.size()));

  // Working queue of (input, remaining flow). Zero inputs never enter it, so
  // no zero-flow leg can be recorded.
  std::deque<std::pair<InputIndex, Flow>> available;
  for (std::size_t i = 0; i < inputs.size(); ++i) {
    if (inputs[i] > 0) available.emplace_back(static_cast<InputIndex>(i), inputs[i]);
  }

  for (std::size_t j = 0; j < outputs.size(); ++j) {
    const auto out_idx = static_cast<OutputIndex>(j);
    Flow remaining = outputs[j];
    while (remaining > 0) {
      if (available.empty()) {
        throw RuntimeError(fmt::format("assign_flows: inputs exhausted with {} left for output {}",
                                       remaining, out_idx));
      }
      auto [in_idx, in_flow] = available.front();
      available.pop_front();
      if (in_flow <= remaining) {
        // input fully consumed
        m.record(in_idx, out_idx, in_flow);
        remaining -= in_flow;
      } else {
        // partially consumed: the remainder feeds the next output first
        m.record(in_idx, out_idx, remaining);
        available.emplace_front(in_idx, in_flow - remaining);
        remaining = 0;
      }
    }
  }
  if (!available.empty()) {
    throw RuntimeError(fmt::format("assign_flows: input {} left with {} unassigned",
                                   available.front().first, available.front().second));
  }
  logger()->debug("assign_flows: {} inputs, {} outputs, {} assignments",
                  inputs.size(), outputs.size(), m.num_entries());
  return m;
}

} // namespace balancer::core
