#pragma once

#include "maestro/task/task.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace maestro {

struct EngineConfig {
  std::string log_level{"info"};
  // Reactor threads; 0 means one per hardware thread.
  unsigned shards{2};
  std::size_t max_tasks{1024};
  int step_timeout_ms{30000};
  int shutdown_grace_ms{5000};
};

struct RetryConfig {
  int max_attempts{3};
  int base_delay_ms{100};
  int max_delay_ms{5000};
  ExhaustionPolicy on_exhaustion{ExhaustionPolicy::Fail};

  [[nodiscard]] auto to_policy() const -> RetryPolicy {
    return RetryPolicy{.max_attempts = max_attempts,
                       .base_delay = std::chrono::milliseconds(base_delay_ms),
                       .max_delay = std::chrono::milliseconds(max_delay_ms),
                       .on_exhaustion = on_exhaustion};
  }
};

struct AssessmentConfig {
  double strength_threshold{0.9};
  double improvement_threshold{0.7};
  bool cache_reports{false};
  // Budget used by the built-in latency assessor.
  int latency_budget_ms{1000};
  // Dimensions without an entry weigh 1.0.
  std::map<std::string, double, std::less<>> weights;

  [[nodiscard]] auto weight_of(std::string_view dimension) const -> double {
    auto it = weights.find(dimension);
    return it != weights.end() ? it->second : 1.0;
  }
};

struct SystemConfig {
  EngineConfig engine;
  RetryConfig retry;
  AssessmentConfig assessment;
};

}  // namespace maestro
