#pragma once

#include "maestro/executor/provider.hpp"

#include <sys/types.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_set>
#include <vector>

namespace maestro {

// Completes inline with the request input as output.
class EchoProvider : public ICapabilityProvider {
public:
  auto invoke(ProviderRequest request, ProviderCallback done) -> void override;
};

// Runs `input.command` through /bin/sh -c on a worker thread. Output is
// stdout and stderr combined; a non-zero exit status is a provider error.
class ShellProvider : public ICapabilityProvider {
public:
  ShellProvider() = default;
  ~ShellProvider() override;

  ShellProvider(const ShellProvider&) = delete;
  ShellProvider& operator=(const ShellProvider&) = delete;

  auto invoke(ProviderRequest request, ProviderCallback done) -> void override;

  // Kills every running child process group.
  auto kill_all() -> void;

private:
  auto track(pid_t pid) -> void;
  auto untrack(pid_t pid) -> void;
  auto run(ProviderRequest request, ProviderCallback done) -> void;

  struct Worker {
    std::shared_ptr<std::atomic<bool>> finished;
    std::jthread thread;
  };

  std::mutex mu_;
  std::unordered_set<pid_t> active_;
  std::vector<Worker> workers_;
};

auto register_builtin_providers(CapabilityRegistry& registry) -> void;

}  // namespace maestro
