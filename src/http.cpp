#include "askllm/http.hpp"
#include <curl/curl.h>
#include <stdexcept>

namespace {

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* s = static_cast<std::string*>(userdata);
  s->append(ptr, size * nmemb);
  return size * nmemb;
}

struct CurlHandles {
  CURL* curl = nullptr;
  curl_slist* headers = nullptr;

  ~CurlHandles() {
    if (headers) curl_slist_free_all(headers);
    if (curl) curl_easy_cleanup(curl);
  }
};

} // namespace

namespace askllm {

void http_global_init() {
  CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
  if (rc != CURLE_OK) {
    throw std::runtime_error(std::string("curl_global_init failed: ") + curl_easy_strerror(rc));
  }
}

void http_global_cleanup() {
  curl_global_cleanup();
}

HttpResp http_post_json(const std::string& url,
                        const std::string& json_body,
                        const std::vector<std::string>& extra_headers,
                        int timeout_ms,
                        int connect_timeout_ms) {
  CurlHandles h;
  h.curl = curl_easy_init();
  if (!h.curl) throw std::runtime_error("curl_easy_init failed");

  h.headers = curl_slist_append(h.headers, "Content-Type: application/json");
  h.headers = curl_slist_append(h.headers, "Expect:");
  for (const auto& line : extra_headers) {
    h.headers = curl_slist_append(h.headers, line.c_str());
  }

  HttpResp r;
  std::string out;
  curl_easy_setopt(h.curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(h.curl, CURLOPT_HTTPHEADER, h.headers);
  curl_easy_setopt(h.curl, CURLOPT_POST, 1L);
  curl_easy_setopt(h.curl, CURLOPT_POSTFIELDS, json_body.c_str());
  curl_easy_setopt(h.curl, CURLOPT_POSTFIELDSIZE, (long)json_body.size());

  curl_easy_setopt(h.curl, CURLOPT_CONNECTTIMEOUT_MS, (long)connect_timeout_ms);
  curl_easy_setopt(h.curl, CURLOPT_TIMEOUT_MS, (long)timeout_ms);
  // worker threads must not receive SIGALRM from the resolver
  curl_easy_setopt(h.curl, CURLOPT_NOSIGNAL, 1L);

  curl_easy_setopt(h.curl, CURLOPT_WRITEFUNCTION, write_cb);
  curl_easy_setopt(h.curl, CURLOPT_WRITEDATA, &out);

  CURLcode rc = curl_easy_perform(h.curl);

  long status = 0;
  curl_easy_getinfo(h.curl, CURLINFO_RESPONSE_CODE, &status);

  r.status = status;
  r.body = std::move(out);
  if (rc != CURLE_OK) {
    r.err = curl_easy_strerror(rc);
    r.timed_out = (rc == CURLE_OPERATION_TIMEDOUT);
  }
  return r;
}

} // namespace askllm
