#include "maestro/app/engine.hpp"
#include "maestro/config/config.hpp"
#include "maestro/config/plan_catalog.hpp"
#include "maestro/orchestrator/planner.hpp"
#include "maestro/task/state_strings.hpp"
#include "maestro/util/log.hpp"

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <print>
#include <string>
#include <string_view>
#include <thread>

namespace {

std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int) {
  g_shutdown_requested.store(true, std::memory_order_release);
}

void print_usage(const char* prog) {
  std::println("maestro - task orchestration and assessment engine");
  std::println("Usage: {} [OPTIONS]", prog);
  std::println("");
  std::println("Options:");
  std::println("  -c, --config <file>     Engine config (YAML)");
  std::println("  -p, --plans <file>      Plan catalog (YAML)");
  std::println("  -o, --objective <name>  Objective to submit");
  std::println("  --json                  Print progress and report as JSON");
  std::println("  --pause-after <n>       Pause once n steps are done, then resume");
  std::println("  -l, --list              List catalog objectives and exit");
  std::println("  -v, --version           Show version and exit");
  std::println("  -h, --help              Show this help message");
  std::println("");
  std::println("Examples:");
  std::println("  {} -p plans.yaml -l", prog);
  std::println("  {} -c maestro.yaml -p plans.yaml -o nightly-report --json",
               prog);
}

void print_version() {
  std::println("maestro v0.1.0");
}

struct Options {
  std::string config_file;
  std::string plans_file;
  std::string objective;
  int pause_after = -1;
  bool json = false;
  bool list_objectives = false;
};

auto require_value(int& i, int argc, std::string_view flag) -> void {
  if (++i >= argc) {
    std::println(stderr, "Error: {} requires an argument", flag);
    std::exit(1);
  }
}

auto parse_args(int argc, char* argv[]) -> Options {
  Options opts;

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (arg == "-v" || arg == "--version") {
      print_version();
      std::exit(0);
    } else if (arg == "-c" || arg == "--config") {
      require_value(i, argc, arg);
      opts.config_file = argv[i];
    } else if (arg == "-p" || arg == "--plans") {
      require_value(i, argc, arg);
      opts.plans_file = argv[i];
    } else if (arg == "-o" || arg == "--objective") {
      require_value(i, argc, arg);
      opts.objective = argv[i];
    } else if (arg == "--json") {
      opts.json = true;
    } else if (arg == "--pause-after") {
      require_value(i, argc, arg);
      std::string_view value = argv[i];
      auto [ptr, ec] =
          std::from_chars(value.data(), value.data() + value.size(),
                          opts.pause_after);
      if (ec != std::errc{} || ptr != value.data() + value.size() ||
          opts.pause_after < 0) {
        std::println(stderr, "Error: --pause-after needs a non-negative number");
        std::exit(1);
      }
    } else if (arg == "-l" || arg == "--list") {
      opts.list_objectives = true;
    } else {
      std::println(stderr, "Unknown option: {}", arg);
      print_usage(argv[0]);
      std::exit(1);
    }
  }

  return opts;
}

void print_progress(const maestro::ProgressView& view, bool json) {
  if (json) {
    std::println("{}", maestro::to_json(view).dump(2));
    return;
  }
  std::println("Task {}: {} ({}/{} steps, {:.0f}%, {} attempt(s))",
               view.task_id, view.state, view.cursor, view.total_steps,
               view.percent_complete, view.attempts);
}

void print_report(const maestro::AssessmentReport& report, bool json) {
  if (json) {
    std::println("{}", maestro::to_json(report).dump(2));
    return;
  }
  std::println("Overall score: {:.3f}", report.overall_score);
  for (const auto& [dimension, score] : report.dimension_scores) {
    std::println("  {:<16} {:.3f}", dimension, score);
  }
  if (!report.strengths.empty()) {
    std::println("Strengths:");
    for (const auto& s : report.strengths) {
      std::println("  - {}", s);
    }
  }
  if (!report.improvement_opportunities.empty()) {
    std::println("Improvement opportunities:");
    for (const auto& imp : report.improvement_opportunities) {
      std::println("  - {} ({:.3f})", imp.dimension, imp.score);
      for (const auto& finding : imp.findings) {
        std::println("      {}", finding);
      }
    }
  }
  for (const auto& w : report.warnings) {
    std::println("Warning: {}", w);
  }
}

// Polls until the task settles or a signal arrives; a signal cancels it.
auto wait_settled(maestro::Engine& engine, const maestro::TaskId& id)
    -> maestro::Result<maestro::TaskState> {
  bool cancel_sent = false;
  while (true) {
    auto state = engine.wait(id, std::chrono::milliseconds(100));
    if (state || state.error() != maestro::Error::Timeout) {
      return state;
    }
    if (!cancel_sent && g_shutdown_requested.load(std::memory_order_acquire)) {
      maestro::log::info("Received shutdown signal, cancelling task {}", id);
      if (auto r = engine.cancel(id); !r) {
        maestro::log::warn("Cancel failed: {}", r.error().message());
      }
      cancel_sent = true;
    }
  }
}

auto pause_and_resume(maestro::Engine& engine, const maestro::TaskId& id,
                      std::size_t after, bool json) -> maestro::Result<void> {
  while (true) {
    auto view = engine.report(id);
    if (!view) {
      return maestro::fail(view.error());
    }
    if (maestro::is_terminal(view->state)) {
      return maestro::ok();
    }
    if (view->cursor >= after) {
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }

  if (auto r = engine.pause(id); !r) {
    return r;
  }
  auto settled = wait_settled(engine, id);
  if (!settled) {
    return maestro::fail(settled.error());
  }
  if (*settled != maestro::TaskState::Paused) {
    return maestro::ok();
  }
  if (auto view = engine.report(id)) {
    print_progress(*view, json);
  }
  maestro::log::info("Resuming task {}", id);
  return engine.resume(id);
}

auto run(const Options& opts) -> int {
  maestro::Config config;
  if (!opts.config_file.empty()) {
    if (!std::filesystem::exists(opts.config_file)) {
      std::println(stderr, "Error: Config file not found: {}",
                   opts.config_file);
      return 1;
    }
    auto loaded = maestro::ConfigLoader::load_from_file(opts.config_file);
    if (!loaded) {
      std::println(stderr, "Error: Failed to load config: {}",
                   loaded.error().message());
      return 1;
    }
    config = std::move(*loaded);
  }

  maestro::log::set_level(config.engine.log_level);
  maestro::log::start();

  if (opts.plans_file.empty()) {
    std::println(stderr, "Error: Plan catalog required. Use -p <file>");
    return 1;
  }
  auto catalog = maestro::PlanCatalog::load_from_file(
      opts.plans_file, config.retry.to_policy());
  if (!catalog) {
    std::println(stderr, "Error: Failed to load plan catalog: {}",
                 catalog.error().message());
    return 1;
  }

  if (opts.list_objectives) {
    for (const auto& objective : catalog->objectives()) {
      const auto* def = catalog->find(objective);
      std::println("{:<24} {} step(s){}  {}", objective,
                   def->plan.steps.size(),
                   def->plan.parallel ? ", parallel" : "", def->description);
    }
    return 0;
  }

  if (opts.objective.empty()) {
    std::println(stderr, "Error: No objective given. Use -o <objective>");
    return 1;
  }

  auto planner = std::make_shared<maestro::CatalogPlanner>(std::move(*catalog));
  maestro::Engine engine(std::move(config), planner);

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  engine.start();

  auto id = engine.submit_task(opts.objective);
  if (!id) {
    std::println(stderr, "Error: Failed to submit '{}': {}", opts.objective,
                 id.error().message());
    engine.stop();
    return 1;
  }
  maestro::log::info("Submitted task {} for '{}'", *id, opts.objective);

  if (opts.pause_after >= 0) {
    auto r = pause_and_resume(engine, *id,
                              static_cast<std::size_t>(opts.pause_after),
                              opts.json);
    if (!r) {
      maestro::log::warn("Pause/resume failed: {}", r.error().message());
    }
  }

  auto state = wait_settled(engine, *id);
  if (!state) {
    std::println(stderr, "Error: {}", state.error().message());
    engine.stop();
    return 1;
  }

  if (auto view = engine.report(*id)) {
    print_progress(*view, opts.json);
  }

  int code = 0;
  if (*state == maestro::TaskState::Completed) {
    auto report = engine.get_assessment(*id);
    if (report) {
      print_report(*report, opts.json);
    } else {
      maestro::log::warn("No assessment: {}", report.error().message());
    }
  } else {
    code = 2;
  }

  engine.stop();
  maestro::log::stop();
  return code;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto opts = parse_args(argc, argv);
  return run(opts);
}
