#pragma once

#include "maestro/core/error.hpp"
#include "maestro/task/task.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace maestro {

struct PlanDefinition {
  std::string objective;
  std::string description;
  Plan plan;
};

// Objective -> plan table read from YAML:
//
//   plans:
//     - objective: nightly-report
//       parallel: true
//       steps:
//         - name: fetch
//           capability: shell
//           rank: 0
//           input: { command: "curl -s http://example.com" }
//           timeout_ms: 2000
//           retry: { max_attempts: 5, on_exhaustion: skip }
//
// Retry fields a step leaves out come from the defaults passed to load.
class PlanCatalog {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path,
                                           const RetryPolicy& defaults)
      -> Result<PlanCatalog>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str,
                                             const RetryPolicy& defaults)
      -> Result<PlanCatalog>;

  auto add(PlanDefinition definition) -> void;

  [[nodiscard]] auto find(std::string_view objective) const
      -> const PlanDefinition*;
  [[nodiscard]] auto objectives() const -> std::vector<std::string>;
  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return plans_.size();
  }

private:
  std::map<std::string, PlanDefinition, std::less<>> plans_;
};

}  // namespace maestro
