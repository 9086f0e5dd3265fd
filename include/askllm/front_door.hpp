#pragma once
#include <optional>
#include <string>
#include "askllm/completion_client.hpp"

namespace askllm {

inline constexpr const char* kMissingQueryText =
    "Please provide a query with the 'q' parameter. Example: /?q=Hello";
inline constexpr const char* kInternalErrorText = "Internal server error.";
inline constexpr const char* kUnreachableText =
    "Failed to contact DeepSeek LLM. Please try again later.";
inline constexpr const char* kUpstreamErrorText =
    "Error from DeepSeek LLM. Please try again later.";
inline constexpr const char* kMalformedText =
    "Internal server error: invalid response format from DeepSeek LLM.";

struct Reply {
  unsigned status = 200;
  std::string body;
};

// Caller-visible text for a failed completion.
const char* failure_text(CompletionStatus s);

Reply handle_query(const std::optional<std::string>& q, const Completer& completer);

} // namespace askllm
