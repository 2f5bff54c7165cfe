#include <inspecta/core/error.hpp>
#include <array>
#include <utility>

namespace inspecta::core {

namespace {

constexpr std::array<std::pair<FailureKind, std::string_view>, 8> kFailureNames = {{
    {FailureKind::InvalidUrl, "invalid_url"},
    {FailureKind::FetchFailed, "fetch_failed"},
    {FailureKind::NotAnImage, "not_an_image"},
    {FailureKind::AuthFailed, "auth_failed"},
    {FailureKind::Throttled, "throttled"},
    {FailureKind::MalformedResponse, "malformed_response"},
    {FailureKind::NetworkFailed, "network_failed"},
    {FailureKind::TimedOut, "timed_out"},
}};

}  // namespace

FailureKind to_failure_kind(InputError e) noexcept {
  switch (e) {
    case InputError::InvalidUrl:
      return FailureKind::InvalidUrl;
    case InputError::NetworkError:
      return FailureKind::FetchFailed;
    case InputError::NotAnImage:
    default:
      return FailureKind::NotAnImage;
  }
}

FailureKind to_failure_kind(TransportError e) noexcept {
  switch (e) {
    case TransportError::Auth:
      return FailureKind::AuthFailed;
    case TransportError::Throttle:
      return FailureKind::Throttled;
    case TransportError::MalformedResponse:
      return FailureKind::MalformedResponse;
    case TransportError::Timeout:
      return FailureKind::TimedOut;
    case TransportError::Network:
    default:
      return FailureKind::NetworkFailed;
  }
}

FailureCategory category_of(FailureKind k) noexcept {
  switch (k) {
    case FailureKind::InvalidUrl:
    case FailureKind::FetchFailed:
    case FailureKind::NotAnImage:
      return FailureCategory::Input;
    default:
      return FailureCategory::Transport;
  }
}

std::string_view to_string(InputError e) noexcept {
  switch (e) {
    case InputError::InvalidUrl:
      return "InvalidUrl";
    case InputError::NetworkError:
      return "NetworkError";
    case InputError::NotAnImage:
      return "NotAnImage";
  }
  return "Unknown";
}

std::string_view to_string(TransportError e) noexcept {
  switch (e) {
    case TransportError::Auth:
      return "AuthError";
    case TransportError::Throttle:
      return "ThrottleError";
    case TransportError::MalformedResponse:
      return "MalformedResponseError";
    case TransportError::Network:
      return "NetworkError";
    case TransportError::Timeout:
      return "TimeoutError";
  }
  return "Unknown";
}

std::string_view to_string(PersistenceError e) noexcept {
  switch (e) {
    case PersistenceError::WriteFailed:
      return "WriteFailed";
    case PersistenceError::NotFound:
      return "NotFound";
    case PersistenceError::Unavailable:
      return "Unavailable";
  }
  return "Unknown";
}

std::string_view to_string(FailureKind k) noexcept {
  for (const auto& [kind, name] : kFailureNames) {
    if (kind == k) return name;
  }
  return "unknown";
}

bool parse_failure_kind(std::string_view text, FailureKind& out) noexcept {
  for (const auto& [kind, name] : kFailureNames) {
    if (name == text) {
      out = kind;
      return true;
    }
  }
  return false;
}

}  // namespace inspecta::core
