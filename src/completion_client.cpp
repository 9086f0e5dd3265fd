#include "askllm/completion_client.hpp"
#include "askllm/chat_parse.hpp"
#include <spdlog/spdlog.h>
#include <exception>
#include <stdexcept>
#include <utility>

namespace askllm {

const char* to_string(CompletionStatus s) {
  switch (s) {
    case CompletionStatus::ok: return "ok";
    case CompletionStatus::empty_answer: return "empty_answer";
    case CompletionStatus::encode_failed: return "encode_failed";
    case CompletionStatus::upstream_unreachable: return "upstream_unreachable";
    case CompletionStatus::upstream_error: return "upstream_error";
    case CompletionStatus::malformed_response: return "malformed_response";
  }
  return "unknown";
}

CompletionClient::CompletionClient(ClientConfig cfg, HttpPostFn post)
    : cfg_(std::move(cfg)), post_(std::move(post)) {
  if (!post_) throw std::invalid_argument("CompletionClient: null transport");
}

CompletionResult CompletionClient::complete(const std::string& query) const {
  CompletionResult r;

  std::string body;
  try {
    body = build_chat_body(make_chat_request(query, cfg_.model));
  } catch (const std::exception& e) {
    r.status = CompletionStatus::encode_failed;
    r.err = e.what();
    spdlog::error("Error encoding completion request: {}", r.err);
    return r;
  }

  HttpResp resp;
  try {
    resp = post_(cfg_.endpoint, body, {"Authorization: Bearer " + cfg_.api_key},
                 cfg_.timeout_ms, cfg_.connect_timeout_ms);
  } catch (const std::exception& e) {
    resp.err = e.what();
  }

  if (!resp.err.empty()) {
    r.status = CompletionStatus::upstream_unreachable;
    r.err = resp.err;
    spdlog::error("Error sending request to {}: {}{}", cfg_.endpoint, resp.err,
                  resp.timed_out ? " (timed out)" : "");
    return r;
  }

  r.upstream_status = resp.status;
  if (resp.status < 200 || resp.status > 299) {
    r.status = CompletionStatus::upstream_error;
    r.err = "upstream status " + std::to_string(resp.status);
    spdlog::error("Error from upstream. Status: {}, Body: {}", resp.status, resp.body);
    return r;
  }

  auto parsed = parse_chat_completions_response(resp.body);
  if (!parsed.ok) {
    r.status = CompletionStatus::malformed_response;
    r.err = parsed.err;
    spdlog::error("Error decoding upstream response: {}", parsed.err);
    return r;
  }

  if (has_usable_answer(parsed.response)) {
    r.status = CompletionStatus::ok;
    r.answer = parsed.response.choices.front().message.content;
  } else {
    r.status = CompletionStatus::empty_answer;
    r.answer = kNoAnswerText;
    spdlog::warn("Upstream did not provide a text response (id={})", parsed.response.id);
  }

  const auto& u = parsed.response.usage;
  spdlog::debug("Usage: prompt={} completion={} total={}",
                u.prompt_tokens, u.completion_tokens, u.total_tokens);
  return r;
}

} // namespace askllm
