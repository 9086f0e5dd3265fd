#pragma once
#include <string>
#include "askllm/chat_api.hpp"

namespace askllm {

struct ChatParseResult {
  CompletionResponse response;
  bool ok = false;
  std::string err;
};

ChatParseResult parse_chat_completions_response(const std::string& json_text);

// True when choices[0] exists and carries non-empty content.
bool has_usable_answer(const CompletionResponse& resp);

} // namespace askllm
