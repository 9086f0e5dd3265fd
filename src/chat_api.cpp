#include "askllm/chat_api.hpp"
#include <cstdint>
#include <limits>
#include <stdexcept>

namespace {

using json = nlohmann::json;

// null decodes to a default-valued struct; any other non-object throws.
bool object_present(const json& j, const char* what) {
  if (j.is_null()) return false;
  if (!j.is_object()) {
    throw std::runtime_error(std::string(what) + ": expected object, got " + j.type_name());
  }
  return true;
}

template <typename T>
void read_field(const json& j, const char* key, T& out) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) return;
  it->get_to(out);
}

// Integers must be integral JSON numbers that fit; no truncation, no wrap.
template <typename Int>
void read_int(const json& j, const char* key, Int& out) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) return;
  if (!it->is_number_integer()) {
    throw std::runtime_error(std::string(key) + ": expected integer, got " + it->dump());
  }
  bool in_range = false;
  if (it->is_number_unsigned()) {
    auto v = it->template get<std::uint64_t>();
    in_range = v <= static_cast<std::uint64_t>(std::numeric_limits<Int>::max());
  } else {
    auto v = it->template get<std::int64_t>();
    in_range = v >= std::numeric_limits<Int>::min() && v <= std::numeric_limits<Int>::max();
  }
  if (!in_range) {
    throw std::runtime_error(std::string(key) + ": integer out of range: " + it->dump());
  }
  out = it->template get<Int>();
}

void read_field(const json& j, const char* key, int& out) {
  read_int(j, key, out);
}

void read_field(const json& j, const char* key, std::int64_t& out) {
  read_int(j, key, out);
}

} // namespace

namespace askllm {

bool operator==(const ChatMessage& a, const ChatMessage& b) {
  return a.role == b.role && a.content == b.content;
}

bool operator!=(const ChatMessage& a, const ChatMessage& b) {
  return !(a == b);
}

bool operator==(const CompletionRequest& a, const CompletionRequest& b) {
  return a.model == b.model &&
         a.messages == b.messages &&
         a.stream == b.stream &&
         a.max_tokens == b.max_tokens &&
         a.temperature == b.temperature;
}

bool operator!=(const CompletionRequest& a, const CompletionRequest& b) {
  return !(a == b);
}

void to_json(nlohmann::ordered_json& j, const ChatMessage& m) {
  j = nlohmann::ordered_json{{"role", m.role}, {"content", m.content}};
}

void to_json(nlohmann::ordered_json& j, const CompletionRequest& r) {
  j = nlohmann::ordered_json{
      {"model", r.model},
      {"messages", r.messages},
      {"stream", r.stream},
      {"max_tokens", r.max_tokens},
      {"temperature", r.temperature},
  };
}

void from_json(const json& j, ChatMessage& m) {
  if (!object_present(j, "message")) return;
  read_field(j, "role", m.role);
  read_field(j, "content", m.content);
}

void from_json(const json& j, CompletionRequest& r) {
  if (!object_present(j, "request")) return;
  read_field(j, "model", r.model);
  read_field(j, "messages", r.messages);
  read_field(j, "stream", r.stream);
  read_field(j, "max_tokens", r.max_tokens);
  read_field(j, "temperature", r.temperature);
}

void from_json(const json& j, CompletionChoice& c) {
  if (!object_present(j, "choice")) return;
  read_field(j, "index", c.index);
  read_field(j, "message", c.message);
  read_field(j, "finish_reason", c.finish_reason);
}

void from_json(const json& j, Usage& u) {
  if (!object_present(j, "usage")) return;
  read_field(j, "prompt_tokens", u.prompt_tokens);
  read_field(j, "completion_tokens", u.completion_tokens);
  read_field(j, "total_tokens", u.total_tokens);
}

void from_json(const json& j, CompletionResponse& r) {
  if (!object_present(j, "response")) return;
  read_field(j, "id", r.id);
  read_field(j, "object", r.object);
  read_field(j, "created", r.created);
  read_field(j, "model", r.model);
  read_field(j, "choices", r.choices);
  read_field(j, "usage", r.usage);
}

CompletionRequest make_chat_request(const std::string& user_text, const std::string& model) {
  CompletionRequest req;
  req.model = model;
  req.messages.push_back(ChatMessage{"user", user_text});
  req.stream = false;
  req.max_tokens = kMaxTokens;
  req.temperature = kTemperature;
  return req;
}

std::string build_chat_body(const CompletionRequest& req) {
  nlohmann::ordered_json j = req;
  // invalid UTF-8 becomes U+FFFD rather than failing the request
  return j.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

CompletionRequest parse_chat_body(const std::string& json_text) {
  return json::parse(json_text).get<CompletionRequest>();
}

} // namespace askllm
