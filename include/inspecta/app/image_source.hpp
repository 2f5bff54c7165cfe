#pragma once

#include <inspecta/core/error.hpp>
#include <inspecta/core/image_sample.hpp>
#include <inspecta/model/http_transport.hpp>
#include <chrono>
#include <expected>
#include <memory>
#include <string_view>

namespace inspecta::app {

/// Obtains and decodes one image. Implementations must be safe to call concurrently.
class IImageSource {
 public:
  virtual ~IImageSource() = default;

  [[nodiscard]] virtual std::expected<core::ImageSample, core::InputError>
  fetch(std::string_view location) = 0;
};

/// http/https only. InvalidUrl for other schemes or a missing host;
/// NetworkError for transport failures and non-2xx statuses; NotAnImage for a
/// non-image content type, an empty body or bytes that do not decode.
class HttpImageSource : public IImageSource {
 public:
  /// Throws std::invalid_argument if transport is null.
  explicit HttpImageSource(std::shared_ptr<model::IHttpTransport> transport,
                           std::chrono::milliseconds timeout = std::chrono::milliseconds(15000));

  [[nodiscard]] std::expected<core::ImageSample, core::InputError>
  fetch(std::string_view url) override;

 private:
  std::shared_ptr<model::IHttpTransport> transport_;
  std::chrono::milliseconds timeout_;
};

/// Local files. NetworkError if the file is missing or unreadable, NotAnImage
/// if it does not decode.
class FileImageSource : public IImageSource {
 public:
  [[nodiscard]] std::expected<core::ImageSample, core::InputError>
  fetch(std::string_view path) override;
};

/// Scheme and host check used by HttpImageSource.
[[nodiscard]] bool is_http_url(std::string_view url) noexcept;

}  // namespace inspecta::app
