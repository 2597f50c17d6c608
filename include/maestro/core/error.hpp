#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace maestro {

// Failure kinds shared by every layer. Values are stable: they travel
// inside std::error_code and are stored in step outcomes.
enum class Error : int {
  Success,
  NotFound,
  InvalidTransition,
  AlreadyRunning,
  UnknownCapability,
  ProviderError,
  PlanningFailed,
  ResourceExhausted,
  NoAssessmentAvailable,
  Timeout,
  ShuttingDown,
  InvalidArgument,
  FileNotFound,
  ParseError,
  Unknown,
};

[[nodiscard]] constexpr auto describe(Error e) noexcept -> std::string_view {
  switch (e) {
  case Error::Success:
    return "success";
  case Error::NotFound:
    return "not found";
  case Error::InvalidTransition:
    return "invalid state transition";
  case Error::AlreadyRunning:
    return "task already has an active driver";
  case Error::UnknownCapability:
    return "unknown capability";
  case Error::ProviderError:
    return "capability provider error";
  case Error::PlanningFailed:
    return "planning failed";
  case Error::ResourceExhausted:
    return "resource exhausted";
  case Error::NoAssessmentAvailable:
    return "no assessment available";
  case Error::Timeout:
    return "timeout";
  case Error::ShuttingDown:
    return "engine is shutting down";
  case Error::InvalidArgument:
    return "invalid argument";
  case Error::FileNotFound:
    return "file not found";
  case Error::ParseError:
    return "parse error";
  case Error::Unknown:
    break;
  }
  return "unknown error";
}

class ErrorCategory final : public std::error_category {
public:
  [[nodiscard]] auto name() const noexcept -> const char* override {
    return "maestro";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    return std::string{describe(static_cast<Error>(ev))};
  }
};

inline auto error_category() -> const std::error_category& {
  static const ErrorCategory instance;
  return instance;
}

inline auto make_error_code(Error e) -> std::error_code {
  return {std::to_underlying(e), error_category()};
}

// Maps a code back to its kind; codes from other categories are Unknown.
[[nodiscard]] inline auto error_of(std::error_code ec) -> Error {
  if (!ec) {
    return Error::Success;
  }
  if (ec.category() != error_category()) {
    return Error::Unknown;
  }
  return static_cast<Error>(ec.value());
}

template <typename T>
using Result = std::expected<T, std::error_code>;

template <typename T>
[[nodiscard]] constexpr auto ok(T&& value) -> Result<std::decay_t<T>> {
  return std::forward<T>(value);
}

[[nodiscard]] constexpr auto ok() -> Result<void> {
  return {};
}

[[nodiscard]] inline auto fail(Error e) -> std::unexpected<std::error_code> {
  return std::unexpected{make_error_code(e)};
}

[[nodiscard]] inline auto fail(std::error_code ec)
    -> std::unexpected<std::error_code> {
  return std::unexpected{ec};
}

}  // namespace maestro

template <>
struct std::is_error_code_enum<maestro::Error> : std::true_type {};
