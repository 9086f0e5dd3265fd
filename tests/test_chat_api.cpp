#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "askllm/chat_api.hpp"

using namespace askllm;
using json = nlohmann::json;

TEST(ChatApiTest, RequestCarriesSingleUserMessageAndFixedSettings) {
  auto req = make_chat_request("Hello");

  EXPECT_EQ(req.model, "deepseek-ai/DeepSeek-R1");
  ASSERT_EQ(req.messages.size(), 1u);
  EXPECT_EQ(req.messages[0].role, "user");
  EXPECT_EQ(req.messages[0].content, "Hello");
  EXPECT_FALSE(req.stream);
  EXPECT_EQ(req.max_tokens, 1024);
  EXPECT_DOUBLE_EQ(req.temperature, 0.7);
}

TEST(ChatApiTest, BodyIsByteExactInFieldOrder) {
  EXPECT_EQ(build_chat_body(make_chat_request("Hello")),
            R"({"model":"deepseek-ai/DeepSeek-R1","messages":[{"role":"user","content":"Hello"}],)"
            R"("stream":false,"max_tokens":1024,"temperature":0.7})");
}

TEST(ChatApiTest, BodyDecodesBackToTheSameRequest) {
  auto req = make_chat_request("Hello", "some/other-model");
  auto body = build_chat_body(req);

  EXPECT_EQ(parse_chat_body(body), req);
  EXPECT_EQ(build_chat_body(parse_chat_body(body)), body);
}

TEST(ChatApiTest, QueryTextIsEscapedNotInterpreted) {
  const std::string q = "say \"hi\"\nthen {\"role\":\"system\"} \\ done";
  auto parsed = json::parse(build_chat_body(make_chat_request(q)));

  ASSERT_EQ(parsed["messages"].size(), 1u);
  EXPECT_EQ(parsed["messages"][0]["content"], q);
  EXPECT_EQ(parsed["messages"][0]["role"], "user");
}

TEST(ChatApiTest, NonAsciiQuerySurvives) {
  const std::string q = "Привет, 世界 🚀";
  auto req = parse_chat_body(build_chat_body(make_chat_request(q)));
  EXPECT_EQ(req.messages.at(0).content, q);
}

TEST(ChatApiTest, InvalidUtf8IsReplacedNotRejected) {
  // Latin-1 "café": 0xE9 is a truncated UTF-8 sequence
  std::string body;
  ASSERT_NO_THROW(body = build_chat_body(make_chat_request("caf\xe9")));

  auto parsed = json::parse(body);
  EXPECT_EQ(parsed["messages"][0]["content"], "caf\xEF\xBF\xBD");
  EXPECT_EQ(parsed["messages"][0]["role"], "user");
}

TEST(ChatApiTest, RequestsDifferingInOneFieldAreNotEqual) {
  auto a = make_chat_request("Hello");
  auto b = a;
  b.temperature = 0.2;
  EXPECT_NE(a, b);
  b = a;
  b.messages[0].role = "system";
  EXPECT_NE(a, b);
}
