#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <string_view>

namespace maestro {

class CancellationToken;

// Aborts the siblings of one parallel rank. The first sibling to fail
// terminally fires the source and names itself as the cause; the others
// see the token and skip their remaining attempts.
class CancellationSource {
public:
  CancellationSource() : state_(std::make_shared<State>()) {
  }

  [[nodiscard]] auto token() const noexcept -> CancellationToken;

  // Returns true only for the call that actually fired the source.
  auto cancel(std::string cause = {}) -> bool {
    if (state_->claimed.exchange(true, std::memory_order_acq_rel)) {
      return false;
    }
    state_->cause = std::move(cause);
    state_->cancelled.store(true, std::memory_order_release);
    return true;
  }

  [[nodiscard]] auto is_cancelled() const noexcept -> bool {
    return state_->cancelled.load(std::memory_order_acquire);
  }

private:
  struct State {
    std::atomic<bool> claimed{false};
    std::atomic<bool> cancelled{false};
    // Written once, before `cancelled` is published.
    std::string cause;
  };
  std::shared_ptr<State> state_;

  friend class CancellationToken;
};

class CancellationToken {
public:
  CancellationToken() = default;

  [[nodiscard]] auto is_cancelled() const noexcept -> bool {
    return state_ && state_->cancelled.load(std::memory_order_acquire);
  }

  // Step that fired the source; empty when none was named or not cancelled.
  [[nodiscard]] auto cause() const noexcept -> std::string_view {
    return is_cancelled() ? std::string_view{state_->cause}
                          : std::string_view{};
  }

  [[nodiscard]] static auto none() noexcept -> CancellationToken {
    return {};
  }

private:
  explicit CancellationToken(std::shared_ptr<CancellationSource::State> state)
      : state_(std::move(state)) {
  }

  std::shared_ptr<CancellationSource::State> state_;

  friend class CancellationSource;
};

inline auto CancellationSource::token() const noexcept -> CancellationToken {
  return CancellationToken{state_};
}

}  // namespace maestro
