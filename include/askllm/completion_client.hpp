#pragma once
#include <functional>
#include <string>
#include <vector>
#include "askllm/chat_api.hpp"
#include "askllm/http.hpp"

namespace askllm {

enum class CompletionStatus {
  ok,
  empty_answer,          // upstream succeeded without usable text
  encode_failed,
  upstream_unreachable,
  upstream_error,        // non-2xx status
  malformed_response,
};

const char* to_string(CompletionStatus s);

struct CompletionResult {
  CompletionStatus status = CompletionStatus::ok;
  std::string answer;    // answer text, or the fallback for empty_answer
  std::string err;       // server-side diagnostic, never sent to callers
  long upstream_status = 0;

  bool ok() const {
    return status == CompletionStatus::ok || status == CompletionStatus::empty_answer;
  }
};

inline constexpr const char* kNoAnswerText =
    "DeepSeek LLM could not generate a response to your query.";

// What the front door depends on.
class Completer {
public:
  virtual ~Completer() = default;
  virtual CompletionResult complete(const std::string& query) const = 0;
};

struct ClientConfig {
  std::string api_key;
  std::string endpoint = kDefaultEndpoint;
  std::string model = kDefaultModel;
  int timeout_ms = 60000;
  int connect_timeout_ms = 10000;
};

using HttpPostFn = std::function<HttpResp(const std::string& url,
                                          const std::string& json_body,
                                          const std::vector<std::string>& extra_headers,
                                          int timeout_ms,
                                          int connect_timeout_ms)>;

// Stateless after construction; one instance serves all requests.
class CompletionClient : public Completer {
public:
  explicit CompletionClient(ClientConfig cfg, HttpPostFn post = http_post_json);

  CompletionResult complete(const std::string& query) const override;

private:
  ClientConfig cfg_;
  HttpPostFn post_;
};

} // namespace askllm
