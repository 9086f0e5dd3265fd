#pragma once
#include <functional>
#include <optional>
#include <string>
#include "askllm/completion_client.hpp"
#include "askllm/server.hpp"

namespace askllm {

inline constexpr const char* kTokenEnv = "CHUTES_API_TOKEN";

struct Config {
  ClientConfig client;
  ServerOptions server;
  std::string log_level = "info";
};

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Reads the process environment.
std::optional<std::string> process_env(const std::string& name);

// Builds the configuration from the environment, then applies command-line
// flags (--host, --port, --workers, --log-level). Throws std::runtime_error
// when the token is missing or a value does not parse.
Config load_config(const EnvLookup& env, int argc = 0, const char* const* argv = nullptr);

} // namespace askllm
