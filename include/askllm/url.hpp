#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace askllm {

// Decodes one form-urlencoded component ('+' is a space). Returns nullopt
// on a truncated or non-hex escape.
std::optional<std::string> url_decode(std::string_view in);

// Splits a request target into its path and raw query (without '?').
std::string_view target_path(std::string_view target);
std::string_view target_query(std::string_view target);

// First value of key in a raw query string. Pairs whose key or value fail
// to decode are skipped.
std::optional<std::string> query_param(std::string_view query, std::string_view key);

} // namespace askllm
