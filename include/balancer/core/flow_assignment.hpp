/* Greedy first-available assignment of input flow to outputs. */
#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <span>
#include <utility>
#include <vector>

#include "balancer/core/types.hpp"

namespace balancer::core {

class AssignmentMatrix;

// Assign input flow to outputs in output order. A partially consumed input is
// returned to the front of the queue so it keeps feeding the next output before
// any later input is touched. Throws like check_feasible.
[[nodiscard]] AssignmentMatrix assign_flows(std::span<const Flow> inputs,
                                            std::span<const Flow> outputs,
                                            ZeroFlowPolicy zero_flow = ZeroFlowPolicy::Omit);

// AssignmentMatrix is a sparse (input, output) -> flow relation. Only strictly
// positive amounts are stored. Rows are ordered by output index so that
// iteration is deterministic.
class AssignmentMatrix {
public:
  AssignmentMatrix(std::int32_t num_inputs, std::int32_t num_outputs);

  [[nodiscard]] std::int32_t num_inputs() const noexcept { return static_cast<std::int32_t>(rows_.size()); }
  [[nodiscard]] std::int32_t num_outputs() const noexcept { return num_outputs_; }
  [[nodiscard]] std::size_t num_entries() const noexcept { return entries_; }

  // Flow assigned from input i to output j, 0 if none.
  [[nodiscard]] Flow at(InputIndex i, OutputIndex j) const;

  // Outputs fed by input i with their amounts.
  [[nodiscard]] const std::map<OutputIndex, Flow>& row(InputIndex i) const;

  // Inputs feeding output j with their amounts, in input order.
  [[nodiscard]] std::vector<std::pair<InputIndex, Flow>> column(OutputIndex j) const;

  [[nodiscard]] Flow input_total(InputIndex i) const;
  [[nodiscard]] Flow output_total(OutputIndex j) const;

private:
  friend AssignmentMatrix assign_flows(std::span<const Flow>, std::span<const Flow>, ZeroFlowPolicy);

  void record(InputIndex i, OutputIndex j, Flow amount);

  std::vector<std::map<OutputIndex, Flow>> rows_;
  std::int32_t num_outputs_ {0};
  std::size_t entries_ {0};
};

// Validates a flow request: every entry non-negative (std::invalid_argument),
// zero entries allowed only under ZeroFlowPolicy::Omit (ValueError), totals
// that fit in Flow (ValueError), and equal totals (InfeasibleFlowError).
// Returns the common total.
Flow check_feasible(std::span<const Flow> inputs, std::span<const Flow> outputs,
                    ZeroFlowPolicy zero_flow = ZeroFlowPolicy::Omit);

} // namespace balancer::core
