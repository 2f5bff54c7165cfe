#include <inspecta/model/http_vision_model_client.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "support/test_support.hpp"
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace im = inspecta::model;
using inspecta::core::TransportError;
using inspecta::testing::FakeHttpTransport;
using nlohmann::json;

namespace {

const std::vector<std::byte> kImage{std::byte{'M'}, std::byte{'a'}, std::byte{'n'}};

im::BackendConfig conversational_config() {
  im::BackendConfig c;
  c.id = "claude";
  c.family = im::BackendFamily::Conversational;
  c.endpoint = "https://models.test/claude/invoke";
  c.model = "claude-test";
  return c;
}

im::BackendConfig vision_config() {
  im::BackendConfig c;
  c.id = "nova";
  c.family = im::BackendFamily::VisionFocused;
  c.endpoint = "https://models.test/nova/invoke";
  c.max_tokens = 512;
  return c;
}

std::string content_body(const std::string& text) {
  return json{{"content", json::array({{{"type", "text"}, {"text", text}}})}}.dump();
}

std::string nested_body(const std::string& text) {
  return json{{"output", {{"message", {{"content", json::array({{{"text", text}}})}}}}}}.dump();
}

std::string header_value(const im::HttpRequest& req, const std::string& name) {
  for (const auto& [k, v] : req.headers) {
    if (k == name) return v;
  }
  return {};
}

}  // namespace

TEST(ClassifyHttpStatus, Mapping) {
  EXPECT_FALSE(im::classify_http_status(200).has_value());
  EXPECT_FALSE(im::classify_http_status(204).has_value());
  EXPECT_EQ(im::classify_http_status(401), TransportError::Auth);
  EXPECT_EQ(im::classify_http_status(403), TransportError::Auth);
  EXPECT_EQ(im::classify_http_status(429), TransportError::Throttle);
  EXPECT_EQ(im::classify_http_status(408), TransportError::Timeout);
  EXPECT_EQ(im::classify_http_status(504), TransportError::Timeout);
  EXPECT_EQ(im::classify_http_status(500), TransportError::Network);
  EXPECT_EQ(im::classify_http_status(302), TransportError::Network);
}

TEST(ConversationalModelClient, RichRequestSucceedsFirstTime) {
  auto transport = std::make_shared<FakeHttpTransport>();
  transport->enqueue(FakeHttpTransport::respond(200, content_body("결과: true")));
  im::ConversationalModelClient client(conversational_config(), transport, "secret");

  const auto r = client.submit(kImage, "check the border", "image/png");
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->text, "결과: true");
  EXPECT_EQ(r->shape, im::EnvelopeShape::ContentBlocks);
  EXPECT_FALSE(r->used_minimal_request);

  const auto posts = transport->posts();
  ASSERT_EQ(posts.size(), 1u);
  EXPECT_EQ(posts[0].url, "https://models.test/claude/invoke");
  EXPECT_EQ(header_value(posts[0], "x-api-key"), "secret");
  EXPECT_EQ(header_value(posts[0], "Content-Type"), "application/json");

  const json body = json::parse(posts[0].body);
  EXPECT_EQ(body["anthropic_version"], "bedrock-2023-05-31");
  EXPECT_EQ(body["model"], "claude-test");
  EXPECT_EQ(body["max_tokens"], 1000);
  ASSERT_TRUE(body.contains("system"));
  ASSERT_TRUE(body.contains("tools"));
  EXPECT_EQ(body["tools"][0]["name"], "image_reader");
  const json& content = body["messages"][0]["content"];
  EXPECT_EQ(body["messages"][0]["role"], "user");
  EXPECT_EQ(content[0]["type"], "image");
  EXPECT_EQ(content[0]["source"]["type"], "base64");
  EXPECT_EQ(content[0]["source"]["media_type"], "image/png");
  EXPECT_EQ(content[0]["source"]["data"], "TWFu");
  EXPECT_EQ(content[1]["text"], "check the border");
}

TEST(ConversationalModelClient, FallsBackToMinimalRequestOnce) {
  auto transport = std::make_shared<FakeHttpTransport>();
  transport->enqueue(FakeHttpTransport::respond(400, R"({"message":"tools not supported"})"));
  transport->enqueue(FakeHttpTransport::respond(200, content_body("result: false")));
  im::ConversationalModelClient client(conversational_config(), transport, "");

  const auto r = client.submit(kImage, "check", "image/jpeg");
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->text, "result: false");
  EXPECT_TRUE(r->used_minimal_request);

  const auto posts = transport->posts();
  ASSERT_EQ(posts.size(), 2u);
  EXPECT_TRUE(header_value(posts[0], "x-api-key").empty());
  const json minimal = json::parse(posts[1].body);
  EXPECT_FALSE(minimal.contains("system"));
  EXPECT_FALSE(minimal.contains("tools"));
  EXPECT_EQ(minimal["messages"][0]["content"][0]["source"]["media_type"], "image/jpeg");
}

TEST(ConversationalModelClient, SecondFailureIsReturned) {
  auto transport = std::make_shared<FakeHttpTransport>();
  transport->enqueue(FakeHttpTransport::respond(500, "{}"));
  transport->enqueue(FakeHttpTransport::respond(429, "{}"));
  transport->enqueue(FakeHttpTransport::respond(200, content_body("unused")));
  im::ConversationalModelClient client(conversational_config(), transport, "k");

  const auto r = client.submit(kImage, "check", "image/png");
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), TransportError::Throttle);
  EXPECT_EQ(transport->posts().size(), 2u);
}

TEST(ConversationalModelClient, MalformedBodyTriggersRetry) {
  auto transport = std::make_shared<FakeHttpTransport>();
  transport->enqueue(FakeHttpTransport::respond(200, "<html>oops</html>"));
  transport->enqueue(FakeHttpTransport::respond(200, "{\"content\":[]}"));
  im::ConversationalModelClient client(conversational_config(), transport, "k");

  const auto r = client.submit(kImage, "check", "image/png");
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), TransportError::MalformedResponse);
}

TEST(ConversationalModelClient, TransportErrorPropagates) {
  auto transport = std::make_shared<FakeHttpTransport>();
  transport->enqueue(std::unexpected(TransportError::Timeout));
  transport->enqueue(std::unexpected(TransportError::Timeout));
  im::ConversationalModelClient client(conversational_config(), transport, "k");

  const auto r = client.submit(kImage, "check", "image/png");
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), TransportError::Timeout);
}

TEST(VisionFocusedModelClient, RequestLayoutAndNestedResponse) {
  auto transport = std::make_shared<FakeHttpTransport>();
  transport->enqueue(FakeHttpTransport::respond(200, nested_body("결과: false\n사유: 테두리 있음")));
  im::VisionFocusedModelClient client(vision_config(), transport, "token");

  const auto r = client.submit(kImage, "inspect", "image/jpeg");
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->text, "결과: false\n사유: 테두리 있음");
  EXPECT_EQ(r->shape, im::EnvelopeShape::NestedOutput);

  const auto posts = transport->posts();
  ASSERT_EQ(posts.size(), 1u);
  EXPECT_EQ(header_value(posts[0], "Authorization"), "Bearer token");
  const json body = json::parse(posts[0].body);
  EXPECT_EQ(body["schemaVersion"], "messages-v1");
  EXPECT_EQ(body["inferenceConfig"]["max_new_tokens"], 512);
  const json& content = body["messages"][0]["content"];
  EXPECT_EQ(content[0]["image"]["format"], "jpeg");
  EXPECT_EQ(content[0]["image"]["source"]["bytes"], "TWFu");
  EXPECT_EQ(content[1]["text"], "inspect");
  EXPECT_EQ(body["system"][0]["text"], vision_config().system_prompt);
  EXPECT_EQ(body["toolConfig"]["tools"][0]["toolSpec"]["name"], "image_reader");
}

TEST(VisionFocusedModelClient, MinimalBodyHasNoToolConfig) {
  auto transport = std::make_shared<FakeHttpTransport>();
  im::VisionFocusedModelClient client(vision_config(), transport, "");
  const json body = json::parse(client.build_body("AAAA", "inspect", "image/png", false));
  EXPECT_FALSE(body.contains("toolConfig"));
  EXPECT_FALSE(body.contains("system"));
  EXPECT_EQ(body["messages"][0]["content"][0]["image"]["format"], "png");
}

TEST(VisionFocusedModelClient, AcceptsContentBlockEnvelopeToo) {
  auto transport = std::make_shared<FakeHttpTransport>();
  transport->enqueue(FakeHttpTransport::respond(200, content_body("result: true")));
  im::VisionFocusedModelClient client(vision_config(), transport, "");
  const auto r = client.submit(kImage, "inspect", "image/png");
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->shape, im::EnvelopeShape::ContentBlocks);
}

TEST(HttpVisionModelClient, ConstructorValidates) {
  auto transport = std::make_shared<FakeHttpTransport>();
  EXPECT_THROW(im::ConversationalModelClient(conversational_config(), nullptr, ""),
               std::invalid_argument);
  auto no_endpoint = conversational_config();
  no_endpoint.endpoint.clear();
  EXPECT_THROW(im::ConversationalModelClient(no_endpoint, transport, ""), std::invalid_argument);
  auto no_id = vision_config();
  no_id.id.clear();
  EXPECT_THROW(im::VisionFocusedModelClient(no_id, transport, ""), std::invalid_argument);
}

TEST(MakeVisionModelClient, SelectsFamily) {
  auto transport = std::make_shared<FakeHttpTransport>();
  auto conv = im::make_vision_model_client(conversational_config(), transport, "k");
  auto vis = im::make_vision_model_client(vision_config(), transport, "k");
  EXPECT_NE(dynamic_cast<im::ConversationalModelClient*>(conv.get()), nullptr);
  EXPECT_NE(dynamic_cast<im::VisionFocusedModelClient*>(vis.get()), nullptr);
  EXPECT_EQ(conv->backend_id(), "claude");
  EXPECT_EQ(vis->backend_id(), "nova");
}

TEST(MakeVisionModelClient, ReadsKeyFromEnvironment) {
  auto transport = std::make_shared<FakeHttpTransport>();
  transport->enqueue(FakeHttpTransport::respond(200, content_body("ok")));
  auto cfg = conversational_config();
  cfg.api_key_env = "INSPECTA_TEST_MODEL_KEY";
  ::setenv("INSPECTA_TEST_MODEL_KEY", "from-env", 1);
  auto client = im::make_vision_model_client(cfg, transport);
  ::unsetenv("INSPECTA_TEST_MODEL_KEY");
  ASSERT_TRUE(client->submit(kImage, "x", "image/png").has_value());
  EXPECT_EQ(header_value(transport->posts().at(0), "x-api-key"), "from-env");
}

TEST(MakeVisionModelClient, MissingEnvironmentKeyThrows) {
  auto cfg = vision_config();
  cfg.api_key_env = "INSPECTA_TEST_UNSET_KEY";
  ::unsetenv("INSPECTA_TEST_UNSET_KEY");
  EXPECT_THROW((void)im::make_vision_model_client(cfg, std::make_shared<FakeHttpTransport>()),
               std::runtime_error);
}

TEST(BackendFamily, Names) {
  im::BackendFamily f{};
  EXPECT_TRUE(im::parse_backend_family("vision", f));
  EXPECT_EQ(f, im::BackendFamily::VisionFocused);
  EXPECT_TRUE(im::parse_backend_family("conversational", f));
  EXPECT_EQ(f, im::BackendFamily::Conversational);
  EXPECT_FALSE(im::parse_backend_family("nova", f));
  EXPECT_EQ(im::to_string(im::BackendFamily::VisionFocused), "vision");
}
