#include "maestro/executor/builtin_providers.hpp"

#include "maestro/util/log.hpp"

#include <sys/wait.h>

#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <format>
#include <string>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>

namespace maestro {

namespace {

inline constexpr std::size_t kMaxOutputSize = 1024 * 1024;
inline constexpr std::size_t kReadBufferSize = 4096;

auto create_pipe() -> std::pair<int, int> {
  int fds[2];
  if (pipe2(fds, O_CLOEXEC) < 0) {
    return {-1, -1};
  }
  return {fds[0], fds[1]};
}

auto fork_and_exec(const std::string& cmd, const std::string& working_dir,
                   int output_fd) -> pid_t {
  pid_t pid = fork();
  if (pid < 0) {
    return -1;
  }

  if (pid == 0) {
    // Child: async-signal-safe calls only.
    setpgid(0, 0);
    dup2(output_fd, STDOUT_FILENO);
    dup2(output_fd, STDERR_FILENO);
    close(output_fd);

    if (!working_dir.empty() && chdir(working_dir.c_str()) < 0) {
      _exit(127);
    }
    execl("/bin/sh", "sh", "-c", cmd.c_str(), nullptr);
    _exit(127);
  }

  close(output_fd);
  setpgid(pid, pid);
  return pid;
}

auto exit_code_of(int status) -> int {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

// Reads until EOF or the deadline. Returns false on timeout.
auto read_output(int fd, std::chrono::steady_clock::time_point deadline,
                 bool bounded, std::string& output) -> bool {
  std::array<char, kReadBufferSize> buffer;

  while (true) {
    int wait_ms = -1;
    if (bounded) {
      auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - std::chrono::steady_clock::now());
      if (remaining.count() <= 0) {
        return false;
      }
      wait_ms = static_cast<int>(remaining.count());
    }

    pollfd pfd{.fd = fd, .events = POLLIN, .revents = 0};
    int rc = poll(&pfd, 1, wait_ms);
    if (rc < 0) {
      if (errno == EINTR)
        continue;
      return true;
    }
    if (rc == 0) {
      return false;
    }

    ssize_t n = read(fd, buffer.data(), buffer.size());
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN)
        continue;
      return true;
    }
    if (n == 0) {
      return true;
    }
    if (output.size() < kMaxOutputSize) {
      output.append(buffer.data(), static_cast<std::size_t>(n));
    }
  }
}

}  // namespace

auto EchoProvider::invoke(ProviderRequest request, ProviderCallback done)
    -> void {
  done(ProviderResult::success(std::move(request.input)));
}

ShellProvider::~ShellProvider() {
  kill_all();
  std::vector<Worker> workers;
  {
    std::lock_guard lock(mu_);
    workers.swap(workers_);
  }
  workers.clear();
}

auto ShellProvider::kill_all() -> void {
  std::lock_guard lock(mu_);
  for (pid_t pid : active_) {
    kill(-pid, SIGKILL);
  }
}

auto ShellProvider::track(pid_t pid) -> void {
  std::lock_guard lock(mu_);
  active_.insert(pid);
}

auto ShellProvider::untrack(pid_t pid) -> void {
  std::lock_guard lock(mu_);
  active_.erase(pid);
}

auto ShellProvider::invoke(ProviderRequest request, ProviderCallback done)
    -> void {
  if (!request.input.is_object() || !request.input.contains("command") ||
      !request.input["command"].is_string()) {
    done(ProviderResult::failure("shell: input.command must be a string"));
    return;
  }

  auto finished = std::make_shared<std::atomic<bool>>(false);
  std::jthread thread([this, finished, request = std::move(request),
                       done = std::move(done)]() mutable {
    run(std::move(request), std::move(done));
    finished->store(true, std::memory_order_release);
  });

  std::lock_guard lock(mu_);
  std::erase_if(workers_, [](const Worker& w) {
    return w.finished->load(std::memory_order_acquire);
  });
  workers_.push_back({std::move(finished), std::move(thread)});
}

auto ShellProvider::run(ProviderRequest request, ProviderCallback done)
    -> void {
  auto command = request.input["command"].get<std::string>();
  auto working_dir = request.input.value("working_dir", std::string{});

  auto [read_fd, write_fd] = create_pipe();
  if (read_fd < 0) {
    done(ProviderResult::failure("shell: failed to create pipe"));
    return;
  }

  pid_t pid = fork_and_exec(command, working_dir, write_fd);
  if (pid < 0) {
    close(read_fd);
    close(write_fd);
    done(ProviderResult::failure(
        std::format("shell: fork failed: {}", std::strerror(errno))));
    return;
  }
  track(pid);
  log::debug(log::Fields{.task = request.task_id.value(),
                         .step = request.step_id.name,
                         .attempt = request.attempt},
             "shell: started pid {}", pid);

  std::string output;
  bool bounded = request.timeout.count() > 0;
  auto deadline = std::chrono::steady_clock::now() + request.timeout;
  bool finished = read_output(read_fd, deadline, bounded, output);
  close(read_fd);

  if (!finished) {
    kill(-pid, SIGKILL);
  }

  int status = 0;
  int exit_code = -1;
  while (true) {
    auto rc = waitpid(pid, &status, 0);
    if (rc < 0 && errno == EINTR)
      continue;
    if (rc > 0)
      exit_code = exit_code_of(status);
    break;
  }
  untrack(pid);

  if (!finished) {
    ProviderResult r;
    r.timed_out = true;
    r.error = std::format("shell: command timed out after {}ms",
                          request.timeout.count());
    done(std::move(r));
    return;
  }
  if (exit_code != 0) {
    done(ProviderResult::failure(
        std::format("shell: exit code {}: {}", exit_code, output)));
    return;
  }
  done(ProviderResult::success(
      nlohmann::json{{"exit_code", exit_code}, {"output", output}}));
}

auto register_builtin_providers(CapabilityRegistry& registry) -> void {
  registry.add("echo", std::make_shared<EchoProvider>());
  registry.add("shell", std::make_shared<ShellProvider>());
}

}  // namespace maestro
