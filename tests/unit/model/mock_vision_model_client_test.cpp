#include <inspecta/model/mock_vision_model_client.hpp>
#include <gtest/gtest.h>
#include <cstddef>
#include <string>
#include <vector>

namespace im = inspecta::model;
using inspecta::core::TransportError;

namespace {

const std::vector<std::byte> kImage{std::byte{1}, std::byte{2}};

}  // namespace

TEST(MockVisionModelClient, DefaultResponse) {
  im::MockVisionModelClient client;
  EXPECT_EQ(client.backend_id(), "mock");
  const auto r = client.submit(kImage, "inspect", "image/png");
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->text, "result: true\nreason: mock backend");
  EXPECT_FALSE(r->raw_body.empty());
  EXPECT_FALSE(r->used_minimal_request);
  EXPECT_EQ(client.call_count(), 1);
  EXPECT_EQ(client.last_instruction(), "inspect");
}

TEST(MockVisionModelClient, FailureThenResponse) {
  im::MockVisionModelClient client("nova");
  client.set_failure(TransportError::Throttle);
  const auto failed = client.submit(kImage, "a", "image/png");
  ASSERT_FALSE(failed.has_value());
  EXPECT_EQ(failed.error(), TransportError::Throttle);

  client.set_response("결과: false");
  const auto ok = client.submit(kImage, "b", "image/png");
  ASSERT_TRUE(ok.has_value());
  EXPECT_EQ(ok->text, "결과: false");
  EXPECT_EQ(client.call_count(), 2);
}

TEST(MockVisionModelClient, HandlerWins) {
  im::MockVisionModelClient client;
  client.set_failure(TransportError::Auth);
  client.set_handler([](std::span<const std::byte> image, std::string_view instruction)
                         -> std::expected<im::ModelResponse, TransportError> {
    im::ModelResponse r;
    r.text = std::string(instruction) + ":" + std::to_string(image.size());
    return r;
  });
  const auto r = client.submit(kImage, "size", "image/png");
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->text, "size:2");
}

TEST(MockVisionModelClient, InvalidUtf8ResponseStillSucceeds) {
  im::MockVisionModelClient client;
  client.set_response("result: true\n\xff\xfe");
  const auto r = client.submit(kImage, "inspect", "image/png");
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->text, "result: true\n\xff\xfe");
  EXPECT_FALSE(r->raw_body.empty());
  EXPECT_NE(r->raw_body.find("result: true"), std::string::npos);
}
