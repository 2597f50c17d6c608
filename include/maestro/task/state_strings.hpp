#pragma once

#include "maestro/task/task.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <optional>
#include <string_view>
#include <utility>

namespace maestro {

namespace detail {

constexpr std::array<std::string_view, 6> kTaskStateNames = {
    "planning", "running", "paused", "completed", "failed", "cancelled",
};

constexpr std::array<std::string_view, 2> kExhaustionPolicyNames = {
    "fail",
    "skip",
};

}  // namespace detail

[[nodiscard]] inline auto task_state_name(TaskState state) noexcept
    -> const char* {
  auto idx = std::to_underlying(state);
  return idx < detail::kTaskStateNames.size()
             ? detail::kTaskStateNames[idx].data()
             : "unknown";
}

[[nodiscard]] inline auto parse_task_state(std::string_view name) noexcept
    -> std::optional<TaskState> {
  auto it = std::ranges::find(detail::kTaskStateNames, name);
  if (it != detail::kTaskStateNames.end()) {
    return static_cast<TaskState>(
        std::ranges::distance(detail::kTaskStateNames.begin(), it));
  }
  return std::nullopt;
}

[[nodiscard]] inline auto exhaustion_policy_name(ExhaustionPolicy p) noexcept
    -> const char* {
  auto idx = std::to_underlying(p);
  return idx < detail::kExhaustionPolicyNames.size()
             ? detail::kExhaustionPolicyNames[idx].data()
             : "fail";
}

[[nodiscard]] inline auto parse_exhaustion_policy(std::string_view name) noexcept
    -> std::optional<ExhaustionPolicy> {
  auto it = std::ranges::find(detail::kExhaustionPolicyNames, name);
  if (it != detail::kExhaustionPolicyNames.end()) {
    return static_cast<ExhaustionPolicy>(
        std::ranges::distance(detail::kExhaustionPolicyNames.begin(), it));
  }
  return std::nullopt;
}

}  // namespace maestro

template <>
struct std::formatter<maestro::TaskState> : std::formatter<std::string_view> {
  auto format(maestro::TaskState state, auto& ctx) const {
    return std::formatter<std::string_view>::format(
        maestro::task_state_name(state), ctx);
  }
};
