#pragma once
#include <string>
#include <vector>

namespace askllm {

struct HttpResp {
  long status = 0;
  std::string body;
  std::string err; // empty if the exchange completed
  bool timed_out = false;
};

void http_global_init();
void http_global_cleanup();

// POSTs json_body to url. extra_headers are raw "Name: value" lines added
// after Content-Type. A non-empty err means no complete response arrived.
HttpResp http_post_json(const std::string& url,
                        const std::string& json_body,
                        const std::vector<std::string>& extra_headers,
                        int timeout_ms,
                        int connect_timeout_ms = 10000);

} // namespace askllm
