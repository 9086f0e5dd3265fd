#include "askllm/logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace askllm {

void init_logging(const std::string& level) {
  auto logger = spdlog::get("askllm");
  if (!logger) logger = spdlog::stdout_color_mt("askllm");
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  spdlog::set_level(spdlog::level::from_str(level));
  spdlog::flush_on(spdlog::level::info);
}

} // namespace askllm
