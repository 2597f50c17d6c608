#pragma once

#include "maestro/config/system_config.hpp"
#include "maestro/core/error.hpp"

#include <string>
#include <string_view>

namespace maestro {

using Config = SystemConfig;

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<SystemConfig>;

  // Range and consistency checks; InvalidArgument on the first violation.
  [[nodiscard]] static auto validate(const SystemConfig& config)
      -> Result<void>;

  // Emits only the fields that differ from their defaults.
  [[nodiscard]] static auto to_string(const SystemConfig& config)
      -> std::string;
};

}  // namespace maestro
