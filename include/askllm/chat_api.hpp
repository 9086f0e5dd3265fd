#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace askllm {

inline constexpr const char* kDefaultEndpoint = "https://llm.chutes.ai/v1/chat/completions";
inline constexpr const char* kDefaultModel = "deepseek-ai/DeepSeek-R1";
inline constexpr int kMaxTokens = 1024;
inline constexpr double kTemperature = 0.7;

struct ChatMessage {
  std::string role;
  std::string content;
};

struct CompletionRequest {
  std::string model;
  std::vector<ChatMessage> messages;
  bool stream = false;
  int max_tokens = kMaxTokens;
  double temperature = kTemperature;
};

struct CompletionChoice {
  int index = 0;
  ChatMessage message;
  std::string finish_reason;
};

struct Usage {
  int prompt_tokens = 0;
  int completion_tokens = 0;
  int total_tokens = 0;
};

struct CompletionResponse {
  std::string id;
  std::string object;
  std::int64_t created = 0; // unix seconds
  std::string model;
  std::vector<CompletionChoice> choices;
  Usage usage;
};

bool operator==(const ChatMessage& a, const ChatMessage& b);
bool operator!=(const ChatMessage& a, const ChatMessage& b);
bool operator==(const CompletionRequest& a, const CompletionRequest& b);
bool operator!=(const CompletionRequest& a, const CompletionRequest& b);

// Request fields serialize in declaration order.
void to_json(nlohmann::ordered_json& j, const ChatMessage& m);
void to_json(nlohmann::ordered_json& j, const CompletionRequest& r);

// Decoders accept missing or null keys and null objects (defaults are
// kept) and throw on keys holding the wrong JSON type. Integer fields
// reject fractional and out-of-range numbers.
void from_json(const nlohmann::json& j, ChatMessage& m);
void from_json(const nlohmann::json& j, CompletionRequest& r);
void from_json(const nlohmann::json& j, CompletionChoice& c);
void from_json(const nlohmann::json& j, Usage& u);
void from_json(const nlohmann::json& j, CompletionResponse& r);

// One user-role message carrying user_text, fixed sampling settings.
CompletionRequest make_chat_request(const std::string& user_text,
                                    const std::string& model = kDefaultModel);

// Invalid UTF-8 in any string is replaced with U+FFFD.
std::string build_chat_body(const CompletionRequest& req);

// Inverse of build_chat_body. Throws on malformed input.
CompletionRequest parse_chat_body(const std::string& json_text);

} // namespace askllm
