#pragma once

#include "maestro/core/error.hpp"
#include "maestro/core/runtime.hpp"
#include "maestro/task/task.hpp"
#include "maestro/util/id.hpp"
#include "maestro/util/string_map.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <coroutine>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace maestro {

// Checkpoint snapshot taken when a rank is dispatched, shared read-only by
// every attempt of its steps.
using StepContext = std::shared_ptr<const nlohmann::json>;

struct ProviderRequest {
  TaskId task_id;
  StepId step_id;
  int attempt{1};
  nlohmann::json input;
  StepContext context;
  std::chrono::milliseconds timeout{0};
};

struct ProviderResult {
  nlohmann::json output;
  std::string error;
  bool timed_out{false};

  [[nodiscard]] auto ok() const noexcept -> bool {
    return error.empty() && !timed_out;
  }

  [[nodiscard]] static auto success(nlohmann::json output) -> ProviderResult {
    return {.output = std::move(output)};
  }
  [[nodiscard]] static auto failure(std::string error) -> ProviderResult {
    return {.error = std::move(error)};
  }
};

using ProviderCallback = std::move_only_function<void(ProviderResult result)>;

// A capability provider completes each request exactly once, from any
// thread. Extra completions are ignored.
class ICapabilityProvider {
public:
  virtual ~ICapabilityProvider() = default;

  virtual auto invoke(ProviderRequest request, ProviderCallback done)
      -> void = 0;
};

class CapabilityRegistry {
public:
  auto add(std::string name, std::shared_ptr<ICapabilityProvider> provider)
      -> void;

  [[nodiscard]] auto find(std::string_view name) const
      -> std::shared_ptr<ICapabilityProvider>;
  [[nodiscard]] auto contains(std::string_view name) const -> bool;
  [[nodiscard]] auto names() const -> std::vector<std::string>;

private:
  mutable std::shared_mutex mu_;
  StringMap<std::shared_ptr<ICapabilityProvider>> providers_;
};

// Awaits one provider invocation, racing it against the request timeout.
// Whichever side settles first resumes the coroutine on the shard it was
// suspended on; a provider that beats the timeout also disarms the timer.
class ProviderAwaiter {
public:
  ProviderAwaiter(std::shared_ptr<ICapabilityProvider> provider,
                  ProviderRequest request)
      : provider_{std::move(provider)},
        request_{std::move(request)},
        state_{std::make_shared<State>()} {
  }

  ProviderAwaiter(const ProviderAwaiter&) = delete;
  ProviderAwaiter& operator=(const ProviderAwaiter&) = delete;
  ProviderAwaiter(ProviderAwaiter&&) = delete;
  ProviderAwaiter& operator=(ProviderAwaiter&&) = delete;

  [[nodiscard]] auto await_ready() const noexcept -> bool {
    return false;
  }

  auto await_suspend(std::coroutine_handle<> handle) -> void;

  [[nodiscard]] auto await_resume() -> ProviderResult {
    return std::move(state_->result);
  }

private:
  struct State : std::enable_shared_from_this<State> {
    std::atomic<bool> settled{false};
    ProviderResult result;
    std::coroutine_handle<> handle;
    Runtime* runtime{nullptr};
    shard_id home{kInvalidShard};

    // Shard whose timeout watcher is asleep, or kInvalidShard.
    std::atomic<shard_id> watcher{kInvalidShard};
    // Owned by the watcher's shard.
    timer_data* timer{nullptr};

    auto settle(ProviderResult r) -> void;
  };

  static auto watch_timeout(std::shared_ptr<State> state,
                            std::chrono::milliseconds timeout) -> spawn_task;
  static auto disarm(std::shared_ptr<State> state) -> spawn_task;

  std::shared_ptr<ICapabilityProvider> provider_;
  ProviderRequest request_;
  std::shared_ptr<State> state_;
};

[[nodiscard]] inline auto invoke_async(
    std::shared_ptr<ICapabilityProvider> provider, ProviderRequest request)
    -> ProviderAwaiter {
  return ProviderAwaiter{std::move(provider), std::move(request)};
}

}  // namespace maestro
