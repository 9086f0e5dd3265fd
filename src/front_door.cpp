#include "askllm/front_door.hpp"
#include <spdlog/spdlog.h>
#include <utility>

namespace askllm {

const char* failure_text(CompletionStatus s) {
  switch (s) {
    case CompletionStatus::upstream_unreachable: return kUnreachableText;
    case CompletionStatus::upstream_error: return kUpstreamErrorText;
    case CompletionStatus::malformed_response: return kMalformedText;
    case CompletionStatus::encode_failed: return kInternalErrorText;
    case CompletionStatus::ok:
    case CompletionStatus::empty_answer: break;
  }
  return kInternalErrorText;
}

Reply handle_query(const std::optional<std::string>& q, const Completer& completer) {
  if (!q || q->empty()) {
    return Reply{400, kMissingQueryText};
  }

  spdlog::info("Received query: {}", *q);

  CompletionResult r = completer.complete(*q);
  if (!r.ok()) {
    spdlog::error("Completion failed ({}): {}", to_string(r.status), r.err);
    return Reply{500, failure_text(r.status)};
  }

  spdlog::info("LLM response: {}", r.answer);
  return Reply{200, std::move(r.answer)};
}

} // namespace askllm
