#include "maestro/config/config.hpp"

#include "maestro/config/yaml_utils.hpp"
#include "maestro/task/state_strings.hpp"
#include "maestro/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <fstream>
#include <sstream>

namespace YAML {

template <>
struct convert<maestro::ExhaustionPolicy> {
  static bool decode(const Node& node, maestro::ExhaustionPolicy& p) {
    if (!node.IsScalar()) {
      return false;
    }
    auto parsed = maestro::parse_exhaustion_policy(node.as<std::string>());
    if (!parsed) {
      return false;
    }
    p = *parsed;
    return true;
  }
};

template <>
struct convert<maestro::EngineConfig> {
  static bool decode(const Node& node, maestro::EngineConfig& e) {
    if (!node.IsMap()) {
      return false;
    }
    e.log_level = maestro::yaml_get_or<std::string>(node, "log_level", "info");
    e.shards = maestro::yaml_get_or(node, "shards", 2u);
    e.max_tasks = maestro::yaml_get_or<std::size_t>(node, "max_tasks", 1024);
    e.step_timeout_ms = maestro::yaml_get_or(node, "step_timeout_ms", 30000);
    e.shutdown_grace_ms = maestro::yaml_get_or(node, "shutdown_grace_ms", 5000);
    return true;
  }
};

template <>
struct convert<maestro::RetryConfig> {
  static bool decode(const Node& node, maestro::RetryConfig& r) {
    if (!node.IsMap()) {
      return false;
    }
    r.max_attempts = maestro::yaml_get_or(node, "max_attempts", 3);
    r.base_delay_ms = maestro::yaml_get_or(node, "base_delay_ms", 100);
    r.max_delay_ms = maestro::yaml_get_or(node, "max_delay_ms", 5000);
    r.on_exhaustion = maestro::yaml_get_or(node, "on_exhaustion",
                                           maestro::ExhaustionPolicy::Fail);
    return true;
  }
};

template <>
struct convert<maestro::AssessmentConfig> {
  static bool decode(const Node& node, maestro::AssessmentConfig& a) {
    if (!node.IsMap()) {
      return false;
    }
    a.strength_threshold = maestro::yaml_get_or(node, "strength_threshold", 0.9);
    a.improvement_threshold =
        maestro::yaml_get_or(node, "improvement_threshold", 0.7);
    a.cache_reports = maestro::yaml_get_or(node, "cache_reports", false);
    a.latency_budget_ms = maestro::yaml_get_or(node, "latency_budget_ms", 1000);
    if (auto weights = node["weights"]) {
      if (!weights.IsMap()) {
        return false;
      }
      for (const auto& kv : weights) {
        a.weights.insert_or_assign(kv.first.as<std::string>(),
                                   kv.second.as<double>());
      }
    }
    return true;
  }
};

template <>
struct convert<maestro::SystemConfig> {
  static bool decode(const Node& node, maestro::SystemConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    if (auto engine = node["engine"]) {
      c.engine = engine.as<maestro::EngineConfig>();
    }
    if (auto retry = node["retry"]) {
      c.retry = retry.as<maestro::RetryConfig>();
    }
    if (auto assessment = node["assessment"]) {
      c.assessment = assessment.as<maestro::AssessmentConfig>();
    }
    return true;
  }
};

}  // namespace YAML

namespace maestro {

namespace {

void to_yaml(YAML::Emitter& out, const EngineConfig& e) {
  const EngineConfig defaults;
  out << YAML::BeginMap;
  if (e.log_level != defaults.log_level) {
    yaml_emit(out, "log_level", e.log_level);
  }
  if (e.shards != defaults.shards) {
    yaml_emit(out, "shards", e.shards);
  }
  if (e.max_tasks != defaults.max_tasks) {
    yaml_emit(out, "max_tasks", e.max_tasks);
  }
  if (e.step_timeout_ms != defaults.step_timeout_ms) {
    yaml_emit(out, "step_timeout_ms", e.step_timeout_ms);
  }
  if (e.shutdown_grace_ms != defaults.shutdown_grace_ms) {
    yaml_emit(out, "shutdown_grace_ms", e.shutdown_grace_ms);
  }
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const RetryConfig& r) {
  const RetryConfig defaults;
  out << YAML::BeginMap;
  if (r.max_attempts != defaults.max_attempts) {
    yaml_emit(out, "max_attempts", r.max_attempts);
  }
  if (r.base_delay_ms != defaults.base_delay_ms) {
    yaml_emit(out, "base_delay_ms", r.base_delay_ms);
  }
  if (r.max_delay_ms != defaults.max_delay_ms) {
    yaml_emit(out, "max_delay_ms", r.max_delay_ms);
  }
  if (r.on_exhaustion != defaults.on_exhaustion) {
    yaml_emit(out, "on_exhaustion",
              std::string(exhaustion_policy_name(r.on_exhaustion)));
  }
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const AssessmentConfig& a) {
  const AssessmentConfig defaults;
  out << YAML::BeginMap;
  if (a.strength_threshold != defaults.strength_threshold) {
    yaml_emit(out, "strength_threshold", a.strength_threshold);
  }
  if (a.improvement_threshold != defaults.improvement_threshold) {
    yaml_emit(out, "improvement_threshold", a.improvement_threshold);
  }
  if (a.cache_reports) {
    yaml_emit(out, "cache_reports", a.cache_reports);
  }
  if (a.latency_budget_ms != defaults.latency_budget_ms) {
    yaml_emit(out, "latency_budget_ms", a.latency_budget_ms);
  }
  if (!a.weights.empty()) {
    out << YAML::Key << "weights" << YAML::Value << YAML::BeginMap;
    for (const auto& [dimension, weight] : a.weights) {
      yaml_emit(out, dimension, weight);
    }
    out << YAML::EndMap;
  }
  out << YAML::EndMap;
}

auto in_unit_range(double v) -> bool {
  return v >= 0.0 && v <= 1.0;
}

}  // namespace

auto yaml_to_json(const YAML::Node& node) -> nlohmann::json {
  switch (node.Type()) {
    case YAML::NodeType::Map: {
      auto obj = nlohmann::json::object();
      for (const auto& kv : node) {
        obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
      }
      return obj;
    }
    case YAML::NodeType::Sequence: {
      auto arr = nlohmann::json::array();
      for (const auto& item : node) {
        arr.push_back(yaml_to_json(item));
      }
      return arr;
    }
    case YAML::NodeType::Scalar: {
      if (node.Tag() == "!") {
        return node.as<std::string>();
      }
      std::int64_t i = 0;
      if (YAML::convert<std::int64_t>::decode(node, i)) {
        return i;
      }
      double d = 0;
      if (YAML::convert<double>::decode(node, d)) {
        return d;
      }
      bool b = false;
      if (YAML::convert<bool>::decode(node, b)) {
        return b;
      }
      return node.as<std::string>();
    }
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      break;
  }
  return nullptr;
}

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  std::string path_str{path};
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open config file: {}", path);
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto ConfigLoader::load_from_string(std::string_view yaml_str)
    -> Result<SystemConfig> {
  SystemConfig config;
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsDefined() || root.IsNull()) {
      log::error("Failed to parse YAML: empty or invalid content");
      return fail(Error::ParseError);
    }
    config = root.as<SystemConfig>();
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }

  if (auto r = validate(config); !r) {
    return fail(r.error());
  }
  return ok(std::move(config));
}

auto ConfigLoader::validate(const SystemConfig& config) -> Result<void> {
  auto reject = [](std::string_view what) {
    log::error("Invalid configuration: {}", what);
    return fail(Error::InvalidArgument);
  };

  const auto& e = config.engine;
  if (e.max_tasks == 0) {
    return reject("engine.max_tasks must be at least 1");
  }
  if (e.step_timeout_ms < 0 || e.shutdown_grace_ms < 0) {
    return reject("engine timeouts must not be negative");
  }

  const auto& r = config.retry;
  if (r.max_attempts < 1) {
    return reject("retry.max_attempts must be at least 1");
  }
  if (r.base_delay_ms < 0 || r.max_delay_ms < r.base_delay_ms) {
    return reject("retry delays must satisfy 0 <= base_delay_ms <= max_delay_ms");
  }

  const auto& a = config.assessment;
  if (a.latency_budget_ms < 0) {
    return reject("assessment.latency_budget_ms must not be negative");
  }
  if (!in_unit_range(a.strength_threshold) ||
      !in_unit_range(a.improvement_threshold)) {
    return reject("assessment thresholds must lie in [0, 1]");
  }
  for (const auto& [dimension, weight] : a.weights) {
    if (!(weight > 0.0)) {
      log::error("Invalid configuration: weight for '{}' must be positive",
                 dimension);
      return fail(Error::InvalidArgument);
    }
  }
  return ok();
}

auto ConfigLoader::to_string(const SystemConfig& config) -> std::string {
  YAML::Emitter out;
  out << YAML::BeginMap;

  out << YAML::Key << "engine" << YAML::Value;
  to_yaml(out, config.engine);
  out << YAML::Key << "retry" << YAML::Value;
  to_yaml(out, config.retry);
  out << YAML::Key << "assessment" << YAML::Value;
  to_yaml(out, config.assessment);

  out << YAML::EndMap;
  return out.c_str();
}

}  // namespace maestro
