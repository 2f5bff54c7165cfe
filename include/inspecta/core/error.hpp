#pragma once

#include <cstdint>
#include <string_view>

namespace inspecta::core {

/// Image could not be obtained or is not an image; used with std::expected.
enum class InputError : std::uint8_t {
  InvalidUrl,
  NetworkError,
  NotAnImage,
};

/// Backend call failed after the client's single built-in retry.
enum class TransportError : std::uint8_t {
  Auth,
  Throttle,
  MalformedResponse,
  Network,
  Timeout,
};

/// Result store could not complete a write or read.
enum class PersistenceError : std::uint8_t {
  WriteFailed,
  NotFound,
  Unavailable,
};

/// Failure recorded on a DecisionRecord: one value per InputError / TransportError kind.
enum class FailureKind : std::uint8_t {
  InvalidUrl,
  FetchFailed,
  NotAnImage,
  AuthFailed,
  Throttled,
  MalformedResponse,
  NetworkFailed,
  TimedOut,
};

/// Coarse category of a FailureKind (input vs backend transport).
enum class FailureCategory : std::uint8_t {
  Input,
  Transport,
};

[[nodiscard]] FailureKind to_failure_kind(InputError e) noexcept;
[[nodiscard]] FailureKind to_failure_kind(TransportError e) noexcept;
[[nodiscard]] FailureCategory category_of(FailureKind k) noexcept;

[[nodiscard]] std::string_view to_string(InputError e) noexcept;
[[nodiscard]] std::string_view to_string(TransportError e) noexcept;
[[nodiscard]] std::string_view to_string(PersistenceError e) noexcept;
[[nodiscard]] std::string_view to_string(FailureKind k) noexcept;

/// Inverse of to_string(FailureKind); false if the text names no kind.
bool parse_failure_kind(std::string_view text, FailureKind& out) noexcept;

}  // namespace inspecta::core
