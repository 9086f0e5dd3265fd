#pragma once
#include <string>

namespace askllm {

// Configures the default spdlog logger: colour console sink, timestamped
// pattern, level by name ("trace" .. "off").
void init_logging(const std::string& level);

} // namespace askllm
