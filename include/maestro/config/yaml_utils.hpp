#pragma once

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <string>
#include <string_view>

namespace maestro {

template <typename T>
concept YamlParsable = requires(const YAML::Node& n) {
  { n.as<T>() };
};

template <YamlParsable T>
[[nodiscard]] auto yaml_get_or(const YAML::Node& node, std::string_view key,
                               T default_val) -> T {
  auto field = node[std::string(key)];
  if (!field || (!field.IsScalar() && !field.IsSequence() && !field.IsMap())) {
    return default_val;
  }
  return field.as<T>();
}

inline void yaml_emit(YAML::Emitter& out, std::string_view key,
                      const auto& value) {
  out << YAML::Key << std::string(key) << YAML::Value << value;
}

// Converts a YAML subtree into JSON. Unquoted scalars become booleans or
// numbers when they parse as such; quoted scalars stay strings.
[[nodiscard]] auto yaml_to_json(const YAML::Node& node) -> nlohmann::json;

}  // namespace maestro
