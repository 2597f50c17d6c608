#include "maestro/executor/provider.hpp"

#include "maestro/util/log.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <mutex>

namespace maestro {

auto CapabilityRegistry::add(std::string name,
                             std::shared_ptr<ICapabilityProvider> provider)
    -> void {
  std::unique_lock lock(mu_);
  log::debug("Registered capability '{}'", name);
  providers_.insert_or_assign(std::move(name), std::move(provider));
}

auto CapabilityRegistry::find(std::string_view name) const
    -> std::shared_ptr<ICapabilityProvider> {
  std::shared_lock lock(mu_);
  auto it = providers_.find(name);
  return it != providers_.end() ? it->second : nullptr;
}

auto CapabilityRegistry::contains(std::string_view name) const -> bool {
  std::shared_lock lock(mu_);
  return providers_.contains(name);
}

auto CapabilityRegistry::names() const -> std::vector<std::string> {
  std::vector<std::string> out;
  {
    std::shared_lock lock(mu_);
    out.reserve(providers_.size());
    for (const auto& [name, _] : providers_) {
      out.push_back(name);
    }
  }
  std::ranges::sort(out);
  return out;
}

auto ProviderAwaiter::State::settle(ProviderResult r) -> void {
  if (settled.exchange(true)) {
    return;
  }
  result = std::move(r);
  if (runtime == nullptr) {
    handle.resume();
    return;
  }
  // Pairs with the watcher publishing its shard before it checks `settled`:
  // either the watcher sees us and never sleeps, or we see it here.
  if (auto shard = watcher.load(); shard != kInvalidShard) {
    runtime->spawn_on(shard, disarm(shared_from_this()));
  }
  runtime->schedule_on(home, handle);
}

auto ProviderAwaiter::watch_timeout(std::shared_ptr<State> state,
                                    std::chrono::milliseconds timeout)
    -> spawn_task {
  state->watcher.store(detail::current_shard_id);
  if (state->settled.load()) {
    state->watcher.store(kInvalidShard);
    co_return;
  }

  sleep_awaiter sleep{timeout};
  state->timer = sleep.timer();
  co_await sleep;
  state->timer = nullptr;
  state->watcher.store(kInvalidShard);

  if (sleep.cancelled()) {
    co_return;
  }
  ProviderResult r;
  r.timed_out = true;
  r.error = std::format("timed out after {}ms", timeout.count());
  state->settle(std::move(r));
}

auto ProviderAwaiter::disarm(std::shared_ptr<State> state) -> spawn_task {
  if (state->timer != nullptr) {
    detail::current_runtime->cancel_timer(state->timer);
  }
  co_return;
}

auto ProviderAwaiter::await_suspend(std::coroutine_handle<> handle) -> void {
  // The coroutine may resume on another shard before invoke() returns, so
  // nothing below may touch this awaiter after the provider is called.
  auto state = state_;
  auto provider = provider_;
  auto timeout = request_.timeout;
  state->handle = handle;
  state->runtime = detail::current_runtime;
  state->home = detail::current_shard_id;

  if (timeout.count() > 0 && state->runtime != nullptr) {
    state->runtime->spawn_on(state->home, watch_timeout(state, timeout));
  }

  try {
    provider->invoke(std::move(request_),
                     [state](ProviderResult r) { state->settle(std::move(r)); });
  } catch (const std::exception& e) {
    log::warn("Capability provider threw: {}", e.what());
    state->settle(ProviderResult::failure(e.what()));
  }
}

}  // namespace maestro
