#pragma once

#include <inspecta/core/frame.hpp>
#include <inspecta/core/image_sample.hpp>
#include <inspecta/model/http_transport.hpp>
#include <inspecta/vision/image_codec.hpp>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <expected>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace inspecta::testing {

/// BGR8 frame filled with one colour.
inline core::Frame solid_bgr(std::uint32_t w, std::uint32_t h, std::uint8_t b, std::uint8_t g,
                             std::uint8_t r) {
  std::vector<std::byte> buf(static_cast<std::size_t>(w) * h * 3);
  for (std::size_t i = 0; i < buf.size(); i += 3) {
    buf[i] = std::byte{b};
    buf[i + 1] = std::byte{g};
    buf[i + 2] = std::byte{r};
  }
  return core::Frame(w, h, core::PixelFormat::BGR8, std::move(buf));
}

/// White BGR8 frame with a solid frame of `thickness` pixels in the given colour.
inline core::Frame framed_bgr(std::uint32_t w, std::uint32_t h, std::uint32_t thickness,
                              std::uint8_t b, std::uint8_t g, std::uint8_t r) {
  core::Frame f = solid_bgr(w, h, 255, 255, 255);
  auto data = f.data();
  for (std::uint32_t y = 0; y < h; ++y) {
    for (std::uint32_t x = 0; x < w; ++x) {
      const bool on_frame = x < thickness || y < thickness || x >= w - thickness || y >= h - thickness;
      if (!on_frame) continue;
      const std::size_t i = (static_cast<std::size_t>(y) * w + x) * 3;
      data[i] = std::byte{b};
      data[i + 1] = std::byte{g};
      data[i + 2] = std::byte{r};
    }
  }
  return f;
}

/// Sample carrying only a raster (the orchestrator encodes it for submission).
inline core::ImageSample raster_sample(core::Frame frame, std::string source = "test://image") {
  core::ImageSample s;
  s.raster = std::move(frame);
  s.source = std::move(source);
  return s;
}

inline std::vector<std::byte> png_bytes(const core::Frame& frame) {
  auto encoded = vision::encode_png(frame);
  return encoded ? std::move(*encoded) : std::vector<std::byte>{};
}

inline std::string to_string(const std::vector<std::byte>& bytes) {
  std::string s(bytes.size(), '\0');
  for (std::size_t i = 0; i < bytes.size(); ++i) s[i] = static_cast<char>(bytes[i]);
  return s;
}

/// Scripted transport: per-URL handlers first, then a FIFO of canned results,
/// then Network. Records every request.
class FakeHttpTransport : public model::IHttpTransport {
 public:
  using Result = std::expected<model::HttpResponse, core::TransportError>;
  using Handler = std::function<Result(const model::HttpRequest&)>;

  static Result respond(long status, std::string body,
                        std::string content_type = "application/json") {
    return model::HttpResponse{status, std::move(body), std::move(content_type)};
  }

  void on(const std::string& url, Handler handler) {
    std::lock_guard lock(mutex_);
    handlers_[url] = std::move(handler);
  }

  void enqueue(Result result) {
    std::lock_guard lock(mutex_);
    queue_.push_back(std::move(result));
  }

  Result post(const model::HttpRequest& request) override { return serve(request, posts_); }
  Result get(const model::HttpRequest& request) override { return serve(request, gets_); }

  std::vector<model::HttpRequest> posts() const {
    std::lock_guard lock(mutex_);
    return posts_;
  }
  std::vector<model::HttpRequest> gets() const {
    std::lock_guard lock(mutex_);
    return gets_;
  }

 private:
  Result serve(const model::HttpRequest& request, std::vector<model::HttpRequest>& log) {
    Handler handler;
    {
      std::lock_guard lock(mutex_);
      log.push_back(request);
      if (auto it = handlers_.find(request.url); it != handlers_.end()) {
        handler = it->second;
      } else if (!queue_.empty()) {
        Result r = std::move(queue_.front());
        queue_.pop_front();
        return r;
      } else {
        return std::unexpected(core::TransportError::Network);
      }
    }
    return handler(request);
  }

  mutable std::mutex mutex_;
  std::map<std::string, Handler> handlers_;
  std::deque<Result> queue_;
  std::vector<model::HttpRequest> posts_;
  std::vector<model::HttpRequest> gets_;
};

}  // namespace inspecta::testing
