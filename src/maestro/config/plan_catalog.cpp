#include "maestro/config/plan_catalog.hpp"

#include "maestro/config/yaml_utils.hpp"
#include "maestro/task/state_strings.hpp"
#include "maestro/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <format>
#include <fstream>
#include <sstream>

namespace maestro {

namespace {

auto parse_retry(const YAML::Node& node, RetryPolicy policy)
    -> Result<RetryPolicy> {
  if (!node) {
    return policy;
  }
  if (!node.IsMap()) {
    return fail(Error::ParseError);
  }
  policy.max_attempts = yaml_get_or(node, "max_attempts", policy.max_attempts);
  policy.base_delay = std::chrono::milliseconds(yaml_get_or(
      node, "base_delay_ms", static_cast<int>(policy.base_delay.count())));
  policy.max_delay = std::chrono::milliseconds(yaml_get_or(
      node, "max_delay_ms", static_cast<int>(policy.max_delay.count())));
  if (auto v = node["on_exhaustion"]) {
    auto parsed = parse_exhaustion_policy(v.as<std::string>());
    if (!parsed) {
      log::error("Unknown on_exhaustion value '{}'", v.as<std::string>());
      return fail(Error::ParseError);
    }
    policy.on_exhaustion = *parsed;
  }
  if (policy.max_attempts < 1) {
    return fail(Error::InvalidArgument);
  }
  return policy;
}

auto parse_step(const YAML::Node& node, std::size_t index,
                const RetryPolicy& defaults) -> Result<Step> {
  if (!node.IsMap()) {
    return fail(Error::ParseError);
  }

  Step step;
  step.id.index = index;
  step.id.name =
      yaml_get_or<std::string>(node, "name", std::format("step-{}", index));
  step.capability = yaml_get_or<std::string>(node, "capability", "");
  if (step.capability.empty()) {
    log::error("Step '{}' has no capability", step.id.name);
    return fail(Error::ParseError);
  }
  step.rank = yaml_get_or(node, "rank", static_cast<int>(index));
  step.timeout = std::chrono::milliseconds(yaml_get_or(node, "timeout_ms", 0));
  step.input = node["input"] ? yaml_to_json(node["input"])
                             : nlohmann::json::object();

  auto retry = parse_retry(node["retry"], defaults);
  if (!retry) {
    return fail(retry.error());
  }
  step.retry = *retry;
  return step;
}

auto parse_plan(const YAML::Node& node, const RetryPolicy& defaults)
    -> Result<PlanDefinition> {
  if (!node.IsMap()) {
    return fail(Error::ParseError);
  }

  PlanDefinition def;
  def.objective = yaml_get_or<std::string>(node, "objective", "");
  def.description = yaml_get_or<std::string>(node, "description", "");
  def.plan.parallel = yaml_get_or(node, "parallel", false);
  if (def.objective.empty()) {
    log::error("Plan entry without objective");
    return fail(Error::ParseError);
  }

  if (auto steps = node["steps"]) {
    if (!steps.IsSequence()) {
      return fail(Error::ParseError);
    }
    for (std::size_t i = 0; i < steps.size(); ++i) {
      auto step = parse_step(steps[i], i, defaults);
      if (!step) {
        log::error("Plan '{}': invalid step {}", def.objective, i);
        return fail(step.error());
      }
      def.plan.steps.push_back(std::move(*step));
    }
  }
  return def;
}

}  // namespace

auto PlanCatalog::load_from_file(std::string_view path,
                                 const RetryPolicy& defaults)
    -> Result<PlanCatalog> {
  std::ifstream file{std::string(path)};
  if (!file.is_open()) {
    log::error("Failed to open plan catalog: {}", path);
    return fail(Error::FileNotFound);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str(), defaults);
}

auto PlanCatalog::load_from_string(std::string_view yaml_str,
                                   const RetryPolicy& defaults)
    -> Result<PlanCatalog> {
  PlanCatalog catalog;
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    auto plans = root["plans"];
    if (!plans || !plans.IsSequence()) {
      log::error("Plan catalog needs a 'plans' sequence");
      return fail(Error::ParseError);
    }
    for (const auto& node : plans) {
      auto def = parse_plan(node, defaults);
      if (!def) {
        return fail(def.error());
      }
      catalog.add(std::move(*def));
    }
  } catch (const YAML::Exception& e) {
    log::error("Plan catalog parse error: {}", e.what());
    return fail(Error::ParseError);
  }

  log::info("Loaded {} plan(s)", catalog.size());
  return ok(std::move(catalog));
}

auto PlanCatalog::add(PlanDefinition definition) -> void {
  auto key = definition.objective;
  plans_.insert_or_assign(std::move(key), std::move(definition));
}

auto PlanCatalog::find(std::string_view objective) const
    -> const PlanDefinition* {
  auto it = plans_.find(objective);
  return it != plans_.end() ? &it->second : nullptr;
}

auto PlanCatalog::objectives() const -> std::vector<std::string> {
  std::vector<std::string> out;
  out.reserve(plans_.size());
  for (const auto& [objective, _] : plans_) {
    out.push_back(objective);
  }
  return out;
}

}  // namespace maestro
