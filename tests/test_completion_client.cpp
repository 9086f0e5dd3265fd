#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>
#include "askllm/completion_client.hpp"

using namespace askllm;
using json = nlohmann::json;

namespace {

// Records every outbound call and answers with a canned HttpResp.
struct FakeUpstream {
  struct Call {
    std::string url;
    std::string body;
    std::vector<std::string> headers;
    int timeout_ms = 0;
  };

  HttpResp reply;
  std::vector<Call> calls;

  HttpPostFn fn() {
    return [this](const std::string& url, const std::string& body,
                  const std::vector<std::string>& headers, int timeout_ms, int) {
      calls.push_back(Call{url, body, headers, timeout_ms});
      return reply;
    };
  }
};

HttpResp ok_body(const std::string& body) {
  HttpResp r;
  r.status = 200;
  r.body = body;
  return r;
}

std::string answer_json(const std::string& content) {
  json j = {
      {"id", "chatcmpl-1"},
      {"object", "chat.completion"},
      {"created", 1738000000},
      {"model", "deepseek-ai/DeepSeek-R1"},
      {"choices", json::array({{{"index", 0},
                                {"message", {{"role", "assistant"}, {"content", content}}},
                                {"finish_reason", "stop"}}})},
      {"usage", {{"prompt_tokens", 3}, {"completion_tokens", 4}, {"total_tokens", 7}}},
  };
  return j.dump();
}

ClientConfig test_config() {
  ClientConfig cfg;
  cfg.api_key = "sk-test";
  return cfg;
}

} // namespace

TEST(CompletionClientTest, SendsExpectedRequest) {
  FakeUpstream up;
  up.reply = ok_body(answer_json("fine"));
  CompletionClient client(test_config(), up.fn());

  client.complete("Hello");

  ASSERT_EQ(up.calls.size(), 1u);
  const auto& call = up.calls[0];
  EXPECT_EQ(call.url, "https://llm.chutes.ai/v1/chat/completions");
  EXPECT_EQ(call.timeout_ms, 60000);
  ASSERT_EQ(call.headers.size(), 1u);
  EXPECT_EQ(call.headers[0], "Authorization: Bearer sk-test");

  auto body = json::parse(call.body);
  EXPECT_EQ(body["model"], "deepseek-ai/DeepSeek-R1");
  ASSERT_EQ(body["messages"].size(), 1u);
  EXPECT_EQ(body["messages"][0]["role"], "user");
  EXPECT_EQ(body["messages"][0]["content"], "Hello");
  EXPECT_EQ(body["stream"], false);
  EXPECT_EQ(body["max_tokens"], 1024);
  EXPECT_DOUBLE_EQ(body["temperature"].get<double>(), 0.7);
}

TEST(CompletionClientTest, UsesConfiguredEndpointAndModel) {
  FakeUpstream up;
  up.reply = ok_body(answer_json("fine"));
  auto cfg = test_config();
  cfg.endpoint = "http://127.0.0.1:9/v1/chat/completions";
  cfg.model = "other/model";
  cfg.timeout_ms = 1500;
  CompletionClient client(cfg, up.fn());

  client.complete("Hello");

  ASSERT_EQ(up.calls.size(), 1u);
  EXPECT_EQ(up.calls[0].url, cfg.endpoint);
  EXPECT_EQ(up.calls[0].timeout_ms, 1500);
  EXPECT_EQ(json::parse(up.calls[0].body)["model"], "other/model");
}

TEST(CompletionClientTest, ReturnsFirstChoiceVerbatim) {
  const std::string content = "  Line one\n\tLine two with \"quotes\" and unicode: 你好  ";
  FakeUpstream up;
  up.reply = ok_body(answer_json(content));
  CompletionClient client(test_config(), up.fn());

  auto r = client.complete("Hello");

  EXPECT_EQ(r.status, CompletionStatus::ok);
  EXPECT_TRUE(r.ok());
  EXPECT_EQ(r.answer, content);
  EXPECT_EQ(r.upstream_status, 200);
}

TEST(CompletionClientTest, AnyTwoHundredStatusIsSuccess) {
  FakeUpstream up;
  up.reply = ok_body(answer_json("created"));
  up.reply.status = 201;
  CompletionClient client(test_config(), up.fn());

  EXPECT_EQ(client.complete("Hello").answer, "created");
}

TEST(CompletionClientTest, EmptyChoicesYieldsFallback) {
  FakeUpstream up;
  up.reply = ok_body(R"({"id":"x","choices":[]})");
  CompletionClient client(test_config(), up.fn());

  auto r = client.complete("Hello");

  EXPECT_EQ(r.status, CompletionStatus::empty_answer);
  EXPECT_TRUE(r.ok());
  EXPECT_EQ(r.answer, kNoAnswerText);
}

TEST(CompletionClientTest, EmptyContentYieldsFallback) {
  FakeUpstream up;
  up.reply = ok_body(answer_json(""));
  CompletionClient client(test_config(), up.fn());

  auto r = client.complete("Hello");

  EXPECT_EQ(r.status, CompletionStatus::empty_answer);
  EXPECT_EQ(r.answer, kNoAnswerText);
}

TEST(CompletionClientTest, TransportErrorIsUnreachable) {
  FakeUpstream up;
  up.reply.err = "Couldn't connect to server";
  CompletionClient client(test_config(), up.fn());

  auto r = client.complete("Hello");

  EXPECT_EQ(r.status, CompletionStatus::upstream_unreachable);
  EXPECT_FALSE(r.ok());
  EXPECT_EQ(r.err, "Couldn't connect to server");
  EXPECT_EQ(up.calls.size(), 1u);
}

TEST(CompletionClientTest, ThrowingTransportIsUnreachable) {
  HttpPostFn boom = [](const std::string&, const std::string&, const std::vector<std::string>&,
                       int, int) -> HttpResp { throw std::runtime_error("curl_easy_init failed"); };
  CompletionClient client(test_config(), boom);

  auto r = client.complete("Hello");

  EXPECT_EQ(r.status, CompletionStatus::upstream_unreachable);
  EXPECT_EQ(r.err, "curl_easy_init failed");
}

TEST(CompletionClientTest, NonSuccessStatusIsUpstreamErrorWithoutRetry) {
  for (long status : {400L, 401L, 429L, 500L, 503L}) {
    FakeUpstream up;
    up.reply.status = status;
    up.reply.body = R"({"error":{"message":"secret upstream detail"}})";
    CompletionClient client(test_config(), up.fn());

    auto r = client.complete("Hello");

    EXPECT_EQ(r.status, CompletionStatus::upstream_error) << status;
    EXPECT_EQ(r.upstream_status, status);
    EXPECT_TRUE(r.answer.empty());
    EXPECT_EQ(up.calls.size(), 1u) << "no retry for " << status;
  }
}

TEST(CompletionClientTest, UnparsableBodyIsMalformed) {
  FakeUpstream up;
  up.reply = ok_body("not json at all");
  CompletionClient client(test_config(), up.fn());

  auto r = client.complete("Hello");

  EXPECT_EQ(r.status, CompletionStatus::malformed_response);
  EXPECT_FALSE(r.err.empty());
}

TEST(CompletionClientTest, WrongShapeIsMalformed) {
  FakeUpstream up;
  up.reply = ok_body(R"({"choices":{"0":"x"}})");
  CompletionClient client(test_config(), up.fn());

  EXPECT_EQ(client.complete("Hello").status, CompletionStatus::malformed_response);
}

TEST(CompletionClientTest, InvalidUtf8QueryIsSentWithReplacementChar) {
  FakeUpstream up;
  up.reply = ok_body(answer_json("Bonjour"));
  CompletionClient client(test_config(), up.fn());

  auto r = client.complete("caf\xe9");

  EXPECT_EQ(r.status, CompletionStatus::ok);
  EXPECT_EQ(r.answer, "Bonjour");
  ASSERT_EQ(up.calls.size(), 1u);
  EXPECT_EQ(json::parse(up.calls[0].body)["messages"][0]["content"], "caf\xEF\xBF\xBD");
}

TEST(CompletionClientTest, RejectsNullTransport) {
  EXPECT_THROW({ CompletionClient client(test_config(), HttpPostFn{}); }, std::invalid_argument);
}

TEST(CompletionClientTest, StatusNames) {
  EXPECT_STREQ(to_string(CompletionStatus::upstream_unreachable), "upstream_unreachable");
  EXPECT_STREQ(to_string(CompletionStatus::empty_answer), "empty_answer");
}
