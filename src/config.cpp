#include "askllm/config.hpp"
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string_view>
#include <spdlog/common.h>

namespace {

// Plain decimal digits only: no sign, no surrounding whitespace.
long parse_long(const std::string& name, const std::string& value, long lo, long hi) {
  size_t used = 0;
  long v = 0;
  if (!value.empty() && value[0] >= '0' && value[0] <= '9') {
    try {
      v = std::stol(value, &used);
    } catch (const std::exception&) {
      used = 0;
    }
  }
  if (used == 0 || used != value.size() || v < lo || v > hi) {
    throw std::runtime_error("invalid value for " + name + ": '" + value + "'");
  }
  return v;
}

std::string check_level(const std::string& name, const std::string& value) {
  auto lvl = spdlog::level::from_str(value);
  // from_str maps unknown names to off
  if (lvl == spdlog::level::off && value != "off") {
    throw std::runtime_error("invalid value for " + name + ": '" + value + "'");
  }
  return value;
}

} // namespace

namespace askllm {

std::optional<std::string> process_env(const std::string& name) {
  const char* v = std::getenv(name.c_str());
  if (!v) return std::nullopt;
  return std::string(v);
}

Config load_config(const EnvLookup& env, int argc, const char* const* argv) {
  Config cfg;

  auto token = env(kTokenEnv);
  if (!token || token->empty()) {
    throw std::runtime_error(std::string(kTokenEnv) + " environment variable is not set.");
  }
  cfg.client.api_key = *token;

  if (auto v = env("ASKLLM_HOST"); v && !v->empty()) cfg.server.host = *v;
  if (auto v = env("ASKLLM_PORT"); v && !v->empty()) {
    cfg.server.port = static_cast<unsigned short>(parse_long("ASKLLM_PORT", *v, 1, 65535));
  }
  if (auto v = env("ASKLLM_UPSTREAM_URL"); v && !v->empty()) cfg.client.endpoint = *v;
  if (auto v = env("ASKLLM_MODEL"); v && !v->empty()) cfg.client.model = *v;
  if (auto v = env("ASKLLM_TIMEOUT_MS"); v && !v->empty()) {
    cfg.client.timeout_ms = static_cast<int>(
        parse_long("ASKLLM_TIMEOUT_MS", *v, 1, std::numeric_limits<int>::max()));
  }
  if (auto v = env("ASKLLM_WORKERS"); v && !v->empty()) {
    cfg.server.workers = static_cast<unsigned>(parse_long("ASKLLM_WORKERS", *v, 0, 1024));
  }
  if (auto v = env("ASKLLM_LOG_LEVEL"); v && !v->empty()) {
    cfg.log_level = check_level("ASKLLM_LOG_LEVEL", *v);
  }

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];
    auto next = [&](const char* flag) -> std::string {
      if (i + 1 >= argc) throw std::runtime_error(std::string("missing value for ") + flag);
      return argv[++i];
    };
    if (arg == "--host") {
      cfg.server.host = next("--host");
    } else if (arg == "--port") {
      cfg.server.port = static_cast<unsigned short>(parse_long("--port", next("--port"), 1, 65535));
    } else if (arg == "--workers") {
      cfg.server.workers = static_cast<unsigned>(parse_long("--workers", next("--workers"), 0, 1024));
    } else if (arg == "--log-level") {
      cfg.log_level = check_level("--log-level", next("--log-level"));
    } else {
      throw std::runtime_error("unknown argument: " + std::string(arg));
    }
  }

  return cfg;
}

} // namespace askllm
