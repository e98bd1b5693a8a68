/* Numeric and styling constants shared across the engine. */
#pragma once

#include <cstddef>
#include <string_view>

namespace balancer::core {

// Device fan-out/fan-in limits. Groups of three are preferred; two is used
// only when exactly two roots remain.
inline constexpr std::size_t kMaxGroupSize = 3;
inline constexpr std::size_t kMinGroupSize = 2;

inline constexpr std::string_view kLoggerName = "balancer";

// Default node styling (Graphviz color names).
inline constexpr std::string_view kInputColor = "lightgreen";
inline constexpr std::string_view kOutputColor = "lightblue";
inline constexpr std::string_view kSplitterColor = "lightyellow";
inline constexpr std::string_view kMergerColor = "lightcoral";

} // namespace balancer::core
