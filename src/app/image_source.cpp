#include <inspecta/app/image_source.hpp>
#include <inspecta/vision/image_codec.hpp>
#include <inspecta/vision/load_image.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace inspecta::app {

namespace {

bool starts_with_icase(std::string_view s, std::string_view prefix) noexcept {
  if (s.size() < prefix.size()) return false;
  for (std::size_t i = 0; i < prefix.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(s[i])) !=
        std::tolower(static_cast<unsigned char>(prefix[i]))) {
      return false;
    }
  }
  return true;
}

}  // namespace

bool is_http_url(std::string_view url) noexcept {
  std::string_view rest;
  if (starts_with_icase(url, "https://")) {
    rest = url.substr(8);
  } else if (starts_with_icase(url, "http://")) {
    rest = url.substr(7);
  } else {
    return false;
  }
  const auto host_end = rest.find_first_of("/?#");
  const auto host = rest.substr(0, host_end);
  if (host.empty()) return false;
  return std::none_of(host.begin(), host.end(),
                      [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; });
}

HttpImageSource::HttpImageSource(std::shared_ptr<model::IHttpTransport> transport,
                                 std::chrono::milliseconds timeout)
    : transport_(std::move(transport)), timeout_(timeout) {
  if (!transport_) {
    throw std::invalid_argument("HttpImageSource: transport is null");
  }
}

std::expected<core::ImageSample, core::InputError> HttpImageSource::fetch(std::string_view url) {
  if (!is_http_url(url)) {
    return std::unexpected(core::InputError::InvalidUrl);
  }

  model::HttpRequest req;
  req.url = std::string(url);
  req.timeout = timeout_;
  auto response = transport_->get(req);
  if (!response || response->status < 200 || response->status >= 300) {
    return std::unexpected(core::InputError::NetworkError);
  }
  if (!starts_with_icase(response->content_type, "image/") || response->body.empty()) {
    return std::unexpected(core::InputError::NotAnImage);
  }

  core::ImageSample sample;
  sample.encoded.resize(response->body.size());
  std::transform(response->body.begin(), response->body.end(), sample.encoded.begin(),
                 [](char c) { return static_cast<std::byte>(c); });

  auto frame = vision::decode_image(sample.encoded);
  if (!frame) {
    return std::unexpected(core::InputError::NotAnImage);
  }
  sample.raster = std::move(*frame);
  sample.format = vision::sniff_format(sample.encoded);
  sample.source = std::string(url);
  return sample;
}

std::expected<core::ImageSample, core::InputError> FileImageSource::fetch(std::string_view path) {
  const std::string p(path);
  std::error_code ec;
  if (p.empty() || !std::filesystem::is_regular_file(p, ec)) {
    return std::unexpected(core::InputError::NetworkError);
  }
  auto sample = vision::load_image_sample(p);
  if (!sample) {
    return std::unexpected(core::InputError::NotAnImage);
  }
  return std::move(*sample);
}

}  // namespace inspecta::app
