#include "askllm/chat_parse.hpp"
#include <exception>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace askllm {

ChatParseResult parse_chat_completions_response(const std::string& json_text) {
  ChatParseResult r;
  try {
    auto j = json::parse(json_text);
    r.response = j.get<CompletionResponse>();
    r.ok = true;
    return r;
  } catch (const std::exception& e) {
    r.ok = false;
    r.err = e.what();
    return r;
  }
}

bool has_usable_answer(const CompletionResponse& resp) {
  return !resp.choices.empty() && !resp.choices.front().message.content.empty();
}

} // namespace askllm
